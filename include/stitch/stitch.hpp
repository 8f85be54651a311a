// include/stitch/stitch.hpp
// Umbrella header.

#pragma once

#include "client.hpp"
#include "codec.hpp"
#include "config.hpp"
#include "error.hpp"
#include "message.hpp"
#include "transport.hpp"
#include "types.hpp"

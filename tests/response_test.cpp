// tests/response_test.cpp
// Gateway response parsing and the success predicate.

#include <gtest/gtest.h>
#include "response.hpp"

#include <string>

using namespace stitch;
using nlohmann::json;

namespace {

std::vector<uint8_t> body(const std::string& s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}

} // namespace

TEST(ResponseTest, ParsesJsonBody) {
    auto r = response::parse(200, "OK", body(R"({"status":"OK","message":"Batch accepted"})"));
    EXPECT_EQ(r.status, 200);
    EXPECT_EQ(r.reason, "OK");
    EXPECT_EQ(r.body["message"], "Batch accepted");
    EXPECT_TRUE(r.ok());
}

TEST(ResponseTest, EmptyBodyIsEmptyObject) {
    auto r = response::parse(204, "No Content", {});
    EXPECT_TRUE(r.body.is_object());
    EXPECT_TRUE(r.body.empty());
    EXPECT_TRUE(r.ok());

    auto ws = response::parse(200, "OK", body(" \r\n"));
    EXPECT_TRUE(ws.body.empty());
}

TEST(ResponseTest, NonSuccessStatusFails) {
    EXPECT_FALSE(response::parse(400, "Bad Request", body(R"({"error":"bad"})")).ok());
    EXPECT_FALSE(response::parse(500, "Server Error", {}).ok());
    EXPECT_FALSE(response::parse(302, "Found", {}).ok());
    EXPECT_FALSE(response::parse(199, "", {}).ok());
}

TEST(ResponseTest, EmbeddedErrorIndicatorsFail) {
    EXPECT_FALSE(response::parse(200, "OK", body(R"({"error":"partial failure"})")).ok());
    EXPECT_FALSE(response::parse(200, "OK", body(R"({"errors":[{"index":3}]})")).ok());
    EXPECT_FALSE(response::parse(200, "OK", body(R"({"status":"ERROR"})")).ok());
}

TEST(ResponseTest, HarmlessMembersPass) {
    EXPECT_TRUE(response::parse(200, "OK", body(R"({"error":null})")).ok());
    EXPECT_TRUE(response::parse(200, "OK", body(R"({"errors":[]})")).ok());
    EXPECT_TRUE(response::parse(200, "OK", body(R"({"status":"ok"})")).ok());
}

TEST(ResponseTest, NonObjectSuccessBodyIsTransportError) {
    for (const char* text : {"[]", "[1,2]", R"("rejected")", "42", "true", "null"}) {
        try {
            response::parse(200, "OK", body(text));
            FAIL() << "expected StitchError for " << text;
        } catch (const StitchError& e) {
            EXPECT_EQ(e.kind(), ErrorKind::Transport) << text;
        }
    }
}

TEST(ResponseTest, NonObjectErrorBodyKept) {
    auto r = response::parse(400, "Bad Request", body(R"(["bad key_names"])"));
    EXPECT_EQ(r.body, nlohmann::json::array({"bad key_names"}));
    EXPECT_FALSE(r.ok());
}

TEST(ResponseTest, MalformedSuccessBodyIsTransportError) {
    try {
        response::parse(200, "OK", body("<html>oops"));
        FAIL() << "expected StitchError";
    } catch (const StitchError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Transport);
        EXPECT_TRUE(e.retryable());
    }
}

TEST(ResponseTest, MalformedErrorBodyKeptAsText) {
    auto r = response::parse(502, "Bad Gateway", body("<html>upstream down</html>"));
    EXPECT_EQ(r.body, "<html>upstream down</html>");
    EXPECT_FALSE(r.ok());
}

TEST(ResponseTest, CheckThrowsRejectedWithDetail) {
    auto r = response::parse(400, "Bad Request",
                             body(R"({"status":"ERROR","message":"key_names missing"})"));
    try {
        response::check(r);
        FAIL() << "expected StitchError";
    } catch (const StitchError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Rejected);
        ASSERT_NE(e.response(), nullptr);
        EXPECT_EQ(e.response()->status, 400);
        EXPECT_EQ(e.response()->reason, "Bad Request");
        EXPECT_EQ(e.response()->body["message"], "key_names missing");
        EXPECT_NE(std::string(e.what()).find("400"), std::string::npos);
    }
}

TEST(ResponseTest, CheckPassesOk) {
    EXPECT_NO_THROW(response::check(response::parse(200, "OK", body(R"({"status":"OK"})"))));
}

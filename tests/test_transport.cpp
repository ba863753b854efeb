// ═══════════════════════════════════════════════════════════════════
//  test_transport.cpp — Tests for HttpResponse helpers
// ═══════════════════════════════════════════════════════════════════

#include <gtest/gtest.h>
#include <cypherpp/transport.h>

using namespace cypherpp;

TEST(HttpResponseTest, HeaderLookupIgnoresCase) {
    HttpResponse res;
    res.status = 201;
    res.headers["location"] = "http://localhost:7474/db/data/transaction/7";

    EXPECT_EQ(res.header("Location"), "http://localhost:7474/db/data/transaction/7");
    EXPECT_EQ(res.header("LOCATION"), "http://localhost:7474/db/data/transaction/7");
    EXPECT_EQ(res.header("etag"), "");
}

TEST(HttpResponseTest, HeaderLookupWithNonAsciiName) {
    HttpResponse res;
    res.headers["x-caf\xc3\xa9"] = "1";

    EXPECT_EQ(res.header("X-CAF\xc3\xa9"), "1");
    EXPECT_EQ(res.header("x-\xff"), "");
}

TEST(HttpResponseTest, SuccessRange) {
    HttpResponse res;
    EXPECT_FALSE(res.ok());
    res.status = 204;
    EXPECT_TRUE(res.ok());
    res.status = 404;
    EXPECT_FALSE(res.ok());
}

TEST(HttpResponseTest, UnexpectedResponseCarriesStatusAndBody) {
    HttpResponse res;
    res.status = 503;
    res.statusText = "Service Unavailable";
    res.body = "{}";

    auto err = unexpectedResponse("autocommit", res);
    EXPECT_EQ(err.status(), 503);
    EXPECT_EQ(err.body(), "{}");
    EXPECT_NE(std::string(err.what()).find("503"), std::string::npos);
}

TEST(HttpResponseTest, UnexpectedResponseWithoutServer) {
    HttpResponse res;
    res.statusText = "Connection refused";

    auto err = unexpectedResponse("begin transaction", res);
    EXPECT_EQ(err.status(), 0);
    EXPECT_NE(std::string(err.what()).find("Connection refused"), std::string::npos);
}

TEST(MethodTest, Names) {
    EXPECT_STREQ(toString(Method::Get), "GET");
    EXPECT_STREQ(toString(Method::Post), "POST");
    EXPECT_STREQ(toString(Method::Delete), "DELETE");
}

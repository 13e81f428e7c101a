#include <cairn/net/http_client.h>

#include <gtest/gtest.h>

using namespace cairn;
using namespace cairn::net;

TEST(CheckStatusTest, SuccessStatusesPass) {
    EXPECT_TRUE(checkStatus(HttpResponse{200, "{}"}, "test"));
    EXPECT_TRUE(checkStatus(HttpResponse{204, ""}, "test"));
}

TEST(CheckStatusTest, ErrorStatusCarriesMessage) {
    auto plain = checkStatus(HttpResponse{401, R"({"error":"invalid api key"})"}, "completion");
    ASSERT_FALSE(plain);
    EXPECT_EQ(plain.error().code, ErrorCode::ProviderError);
    EXPECT_NE(plain.error().message.find("401"), std::string::npos);
    EXPECT_NE(plain.error().message.find("invalid api key"), std::string::npos);

    auto nested =
        checkStatus(HttpResponse{429, R"({"error":{"message":"rate limited"}})"}, "completion");
    ASSERT_FALSE(nested);
    EXPECT_NE(nested.error().message.find("rate limited"), std::string::npos);

    auto html = checkStatus(HttpResponse{502, "<html>bad gateway</html>"}, "embedding");
    ASSERT_FALSE(html);
    EXPECT_EQ(html.error().code, ErrorCode::ProviderError);
}

TEST(CurlHttpClientTest, RefusedConnectionIsNetworkError) {
    CurlHttpClient client;
    HttpRequest req;
    req.url = "http://127.0.0.1:1/unreachable";
    req.body = "{}";
    req.timeout = std::chrono::milliseconds(2000);

    auto r = client.post(req);
    ASSERT_FALSE(r);
    EXPECT_TRUE(r.error().code == ErrorCode::NetworkError ||
                r.error().code == ErrorCode::Timeout)
        << r.error().message;
    EXPECT_TRUE(isProviderFailure(r.error().code));
}

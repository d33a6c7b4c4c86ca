#include "cors.hpp"

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <gtest/gtest.h>

using namespace wsgate;

namespace {

// Counts how often a network lookup is made and answers with a fixed value.
struct probe_counter {
    int calls = 0;
    std::optional<std::string> answer;

    cors::origin_supplier supplier() {
        return [this]() {
            ++calls;
            return answer;
        };
    }
};

class CorsTest : public ::testing::Test {
protected:
    cors::host_probes probes() {
        return cors::host_probes{internal.supplier(), external.supplier()};
    }

    bool allowed(std::string_view url) {
        return cors::is_url_from_allowed_origins(url, cfg, probes());
    }

    config::store cfg;
    probe_counter internal;
    probe_counter external;
};

} // namespace

TEST_F(CorsTest, LocalhostAliasesAreAllowed) {
    EXPECT_TRUE(allowed("http://localhost"));
    EXPECT_TRUE(allowed("http://localhost:8501/"));
    EXPECT_TRUE(allowed("http://0.0.0.0:8501"));
    EXPECT_TRUE(allowed("https://127.0.0.1/index.html"));
    EXPECT_TRUE(allowed("localhost:3000"));
    EXPECT_TRUE(allowed("http://LOCALHOST"));
    EXPECT_EQ(0, internal.calls);
    EXPECT_EQ(0, external.calls);
}

TEST_F(CorsTest, DisabledCorsAllowsEveryOrigin) {
    cfg.set_option("server.enableCORS", "false");
    EXPECT_TRUE(allowed("http://evil.example.com"));
    EXPECT_TRUE(allowed("not a url at all"));
    EXPECT_TRUE(allowed("http://localhost"));
    EXPECT_EQ(0, internal.calls);
    EXPECT_EQ(0, external.calls);
}

TEST_F(CorsTest, UnknownHostIsRejectedWhenNothingIsConfigured) {
    EXPECT_FALSE(allowed("http://random-host.test"));
    EXPECT_EQ(1, internal.calls);
    EXPECT_EQ(1, external.calls);
}

TEST_F(CorsTest, HostnameMustMatchExactly) {
    EXPECT_FALSE(allowed("http://localhost.evil.com"));
    EXPECT_FALSE(allowed("http://evil.com/localhost"));
    EXPECT_FALSE(allowed("http://127.0.0.10"));
    EXPECT_FALSE(allowed("random-host.test/?next=http://localhost"));
    EXPECT_FALSE(allowed("evil.example.com/x#http://127.0.0.1"));
}

TEST_F(CorsTest, ManuallySetServerAddressIsAllowedWithoutNetworkLookups) {
    cfg.set_option("browser.serverAddress", "my-host");
    EXPECT_TRUE(allowed("http://my-host/path"));
    EXPECT_EQ(0, internal.calls);
    EXPECT_EQ(0, external.calls);
}

TEST_F(CorsTest, ServerAddressGivenAsUrlIsReducedToItsHost) {
    cfg.set_option("browser.serverAddress", "https://Dashboard.Example.com:8443/app");
    EXPECT_TRUE(allowed("https://dashboard.example.com"));
}

TEST_F(CorsTest, DefaultServerAddressIsNotACandidate) {
    config::store custom(std::vector<config::option_spec>{
        {"server.enableCORS", "", "true"},
        {"browser.serverAddress", "", "intranet-host"},
        {"s3.url", "", std::nullopt},
        {"s3.bucket", "", std::nullopt}
    });
    EXPECT_FALSE(cors::is_url_from_allowed_origins("http://intranet-host", custom, probes()));
    custom.set_option("browser.serverAddress", "intranet-host");
    EXPECT_TRUE(cors::is_url_from_allowed_origins("http://intranet-host", custom, probes()));
}

TEST_F(CorsTest, ManuallySetS3UrlHostIsAllowed) {
    cfg.set_option("s3.url", "https://share.s3.amazonaws.com/apps/");
    EXPECT_TRUE(allowed("https://share.s3.amazonaws.com"));
    EXPECT_EQ(0, internal.calls);
}

TEST_F(CorsTest, InternalIpMatchSkipsExternalLookup) {
    internal.answer = "10.1.2.3";
    EXPECT_TRUE(allowed("http://10.1.2.3:8501"));
    EXPECT_EQ(1, internal.calls);
    EXPECT_EQ(0, external.calls);
}

TEST_F(CorsTest, ExternalIpIsCheckedAfterInternalIp) {
    internal.answer = "10.1.2.3";
    external.answer = "203.0.113.7";
    EXPECT_TRUE(allowed("http://203.0.113.7"));
    EXPECT_EQ(1, internal.calls);
    EXPECT_EQ(1, external.calls);
}

TEST_F(CorsTest, S3BucketIsTheLastCandidate) {
    cfg.set_option("s3.bucket", "apps.example.com");
    EXPECT_TRUE(allowed("https://apps.example.com"));
    EXPECT_EQ(1, internal.calls);
    EXPECT_EQ(1, external.calls);
}

TEST_F(CorsTest, FailingLookupIsTreatedAsAbsent) {
    external.answer = "203.0.113.7";
    const cors::host_probes failing{
        []() -> std::optional<std::string> { throw std::runtime_error("no route to host"); },
        external.supplier()
    };
    EXPECT_TRUE(cors::is_url_from_allowed_origins("http://203.0.113.7", cfg, failing));
    EXPECT_EQ(1, external.calls);
}

TEST_F(CorsTest, EmptyCandidatesNeverMatch) {
    internal.answer = "";
    cfg.set_option("s3.bucket", "");
    EXPECT_FALSE(allowed("http://:8501"));
    EXPECT_FALSE(allowed(""));
}

TEST_F(CorsTest, MalformedUrlIsRejectedWithoutLookups) {
    EXPECT_FALSE(allowed("http://[::1"));
    EXPECT_FALSE(allowed("://localhost"));
    EXPECT_EQ(0, internal.calls);
    EXPECT_EQ(0, external.calls);
}

TEST_F(CorsTest, InvalidEnableCorsValueThrows) {
    cfg.set_option("server.enableCORS", "sometimes");
    EXPECT_THROW(static_cast<void>(allowed("http://localhost")), config::error);
}

TEST_F(CorsTest, CandidatesAreOrderedCheapestFirst) {
    internal.answer = "10.1.2.3";
    external.answer = "203.0.113.7";
    cfg.set_option("browser.serverAddress", "my-host");
    cfg.set_option("s3.url", "https://share.s3.amazonaws.com");
    cfg.set_option("s3.bucket", "apps.example.com");

    const auto candidates = cors::allowed_origin_candidates(cfg, probes());
    ASSERT_EQ(8u, candidates.size());
    EXPECT_EQ("localhost", candidates[0]());
    EXPECT_EQ("0.0.0.0", candidates[1]());
    EXPECT_EQ("127.0.0.1", candidates[2]());
    EXPECT_EQ("my-host", candidates[3]());
    EXPECT_EQ("share.s3.amazonaws.com", candidates[4]());
    EXPECT_EQ(0, internal.calls);
    EXPECT_EQ("10.1.2.3", candidates[5]());
    EXPECT_EQ("203.0.113.7", candidates[6]());
    EXPECT_EQ("apps.example.com", candidates[7]());
}

TEST(CorsLiteralTest, LiteralResolvesToItsHost) {
    const auto supplier = cors::literal("example.org");
    EXPECT_EQ("example.org", supplier());
    EXPECT_EQ("example.org", supplier());
}

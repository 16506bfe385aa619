#include <gtest/gtest.h>

#include "downloader.hpp"
#include "test_support.hpp"

#include <thread>
#include <vector>

using namespace texharvest;
using namespace texharvest::test_support;
using namespace std::chrono_literals;

namespace {

constexpr const char* kBase = "https://example.org/e-print/";

class DownloaderTest : public ::testing::Test {
protected:
    FakeClock clock_;
    FakeTransport transport_;
    MetricsCollector metrics_;
    RateLimiter limiter_{100.0, clock_};
    Downloader downloader_{transport_, limiter_, metrics_, kBase, 5};
};

} // namespace

TEST_F(DownloaderTest, ReturnsBodyOnSuccess) {
    transport_.respond(std::string(kBase) + "2404.04895", 200, to_bytes("archive"));
    const auto outcome = downloader_.fetch("2404.04895", 1s);
    ASSERT_TRUE(is_ok(outcome));
    EXPECT_EQ(as_text(std::get<Bytes>(outcome)), "archive");
    EXPECT_EQ(metrics_.counter("downloads{status=success}"), 1);
    EXPECT_EQ(metrics_.counter("downloads{status=error}"), 0);
}

TEST_F(DownloaderTest, NonSuccessStatusIsDownloadError) {
    transport_.respond(std::string(kBase) + "2404.04895", 503, to_bytes("busy"));
    const auto outcome = downloader_.fetch("2404.04895", 1s);
    ASSERT_FALSE(is_ok(outcome));
    const auto& err = std::get<PipelineError>(outcome);
    EXPECT_EQ(err.kind, ErrorKind::Download);
    EXPECT_NE(err.message.find("HTTP 503"), std::string::npos);
    EXPECT_EQ(metrics_.counter("downloads{status=error}"), 1);
}

TEST_F(DownloaderTest, UnknownPaperIs404) {
    const auto outcome = downloader_.fetch("2404.00000", 1s);
    ASSERT_FALSE(is_ok(outcome));
    EXPECT_NE(std::get<PipelineError>(outcome).message.find("HTTP 404"), std::string::npos);
}

TEST_F(DownloaderTest, TransportFailureIsDownloadError) {
    transport_.respond_with(std::string(kBase) + "2404.04895", [](const std::string&) -> Outcome<HttpResponse> {
        return PipelineError::download("Connection refused");
    });
    const auto outcome = downloader_.fetch("2404.04895", 1s);
    ASSERT_FALSE(is_ok(outcome));
    EXPECT_EQ(std::get<PipelineError>(outcome).kind, ErrorKind::Download);
    EXPECT_NE(std::get<PipelineError>(outcome).message.find("Connection refused"), std::string::npos);
}

TEST_F(DownloaderTest, StoppedBeforeStartIsCancelled) {
    std::stop_source stop;
    stop.request_stop();
    const auto outcome = downloader_.fetch("2404.04895", 1s, stop.get_token());
    ASSERT_FALSE(is_ok(outcome));
    EXPECT_EQ(std::get<PipelineError>(outcome).kind, ErrorKind::Cancelled);
    EXPECT_EQ(transport_.calls(), 0u);
}

TEST_F(DownloaderTest, UrlIsBasePlusIdentifier) {
    EXPECT_EQ(downloader_.url_for("hep-th/9901001"), std::string(kBase) + "hep-th/9901001");
    transport_.respond(std::string(kBase) + "hep-th/9901001", 200, to_bytes("x"));
    ASSERT_TRUE(is_ok(downloader_.fetch("hep-th/9901001", 1s)));
    EXPECT_EQ(transport_.calls_for(std::string(kBase) + "hep-th/9901001"), 1u);
}

TEST(Downloader, BurstBoundsConcurrentFetches) {
    FakeTransport transport;
    transport.set_latency(30ms);
    MetricsCollector metrics;
    RateLimiter limiter(1000.0);
    Downloader downloader(transport, limiter, metrics, kBase, 2);

    {
        std::vector<std::jthread> threads;
        for (int i = 0; i < 8; ++i) {
            threads.emplace_back([&] { (void)downloader.fetch("2404.04895", 1s); });
        }
    }
    EXPECT_EQ(transport.calls(), 8u);
    EXPECT_LE(transport.max_in_flight(), 2u);
    EXPECT_EQ(downloader.burst().in_use(), 0u);
    EXPECT_EQ(metrics.counter("downloads{status=error}"), 8);
}

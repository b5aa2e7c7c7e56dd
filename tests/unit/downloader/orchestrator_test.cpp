#include <gtest/gtest.h>

#include <common/fake_http_client.h>
#include <common/test_helpers.h>
#include <mlget/core/async.h>
#include <mlget/downloader/checksum_engine.hpp>
#include <mlget/downloader/chunk_partitioner.hpp>
#include <mlget/downloader/orchestrator.hpp>
#include <mlget/downloader/plan_builder.hpp>
#include <mlget/downloader/worker_pool.hpp>
#include <mlget/manifest/manifest.h>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/experimental/awaitable_operators.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/use_future.hpp>

#include <algorithm>
#include <chrono>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

using namespace mlget;
using namespace mlget::downloader;
using mlget::manifest::FileDescriptor;
using mlget::manifest::PieceDescriptor;
using mlget::manifest::UrlCandidate;
using mlget::tests::FakeHttpClient;

namespace {

constexpr std::uint64_t kPiece = 1024;

std::string urlFor(const std::string& name) {
    return "https://files.example.org/" + name;
}

FileDescriptor pieced(const std::string& name, const std::string& payload) {
    FileDescriptor fd;
    fd.name = name;
    fd.size = payload.size();
    fd.urls = std::vector<UrlCandidate>{{urlFor(name), std::nullopt, std::nullopt}};
    std::vector<std::string> hashes;
    for (const auto& r : calculateRanges(payload.size(), kPiece)) {
        hashes.push_back(ChecksumEngine::digest(HashAlgo::Sha1,
                                                std::string_view(payload).substr(r.start, r.size()))
                             .value());
    }
    fd.pieces = PieceDescriptor{HashAlgo::Sha1, kPiece, std::move(hashes)};
    return fd;
}

FileDescriptor whole(const std::string& name, const std::string& payload) {
    FileDescriptor fd;
    fd.name = name;
    fd.size = payload.size();
    fd.urls = std::vector<UrlCandidate>{{urlFor(name), std::nullopt, std::nullopt}};
    fd.hashes = {Checksum{HashAlgo::Sha256, ChecksumEngine::digest(HashAlgo::Sha256, payload).value()}};
    return fd;
}

DownloaderConfig testConfig() {
    DownloaderConfig cfg;
    cfg.userAgent = "mlget-test";
    cfg.maxThreadsPerFile = 4;
    cfg.maxParallelFiles = 2;
    cfg.chunkRetryAttempts = 3;
    return cfg;
}

class OrchestratorTest : public ::testing::Test {
protected:
    Plan buildPlan(const std::vector<FileDescriptor>& descriptors) {
        auto plan = PlanBuilder(dir_.path()).build(descriptors);
        EXPECT_TRUE(plan) << (plan ? "" : plan.error().describe());
        return plan ? plan.value() : Plan{};
    }

    Result<void> execute(const Plan& plan, const DownloaderConfig& cfg,
                         ProgressCallback onProgress = {}) {
        Runtime runtime(2, FileOrchestrator::blockingThreadsFor(cfg));
        FileOrchestrator orchestrator(runtime, http_, cfg);
        return orchestrator.execute(plan, std::move(onProgress));
    }

    std::vector<std::uint64_t> rangeStarts(const std::string& url) const {
        std::vector<std::uint64_t> out;
        for (const auto& r : http_->rangeRequests())
            if (r.url == url)
                out.push_back(r.start);
        return out;
    }

    tests::TempDir dir_;
    std::shared_ptr<FakeHttpClient> http_ = std::make_shared<FakeHttpClient>();
};

} // namespace

TEST(WorkerPoolTest, WorkerCountLeavesRoomForWriter) {
    EXPECT_EQ(DownloadWorkerPool::workerCount(4, 10), 3u);
    EXPECT_EQ(DownloadWorkerPool::workerCount(4, 2), 2u);
    EXPECT_EQ(DownloadWorkerPool::workerCount(2, 10), 1u);
    EXPECT_EQ(DownloadWorkerPool::workerCount(1, 10), 1u);
    EXPECT_EQ(DownloadWorkerPool::workerCount(8, 0), 1u);
}

TEST_F(OrchestratorTest, ChunkedDownloadReassemblesOutOfOrderChunks) {
    auto payload = tests::random_payload(kPiece * 10 + 5);
    http_->serve(urlFor("model.bin"), payload);
    http_->setRandomDelay(std::chrono::milliseconds(5));

    auto plan = buildPlan({pieced("model.bin", payload)});
    auto result = execute(plan, testConfig());
    ASSERT_TRUE(result) << result.error().describe();

    EXPECT_EQ(tests::read_file(dir_ / "model.bin"), payload);
    auto starts = rangeStarts(urlFor("model.bin"));
    EXPECT_EQ(starts.size(), 11u);
    EXPECT_EQ(std::set<std::uint64_t>(starts.begin(), starts.end()).size(), 11u);
}

TEST_F(OrchestratorTest, ResumeFetchesOnlyInvalidChunks) {
    auto payload = tests::random_payload(kPiece * 6);
    http_->serve(urlFor("resume.bin"), payload);

    auto onDisk = payload;
    onDisk[3 * kPiece + 17] = static_cast<char>(~onDisk[3 * kPiece + 17]);
    tests::write_file(dir_ / "resume.bin", onDisk);

    PlanBuilder builder(dir_.path());
    auto minimized = builder.minimize(buildPlan({pieced("resume.bin", payload)}));
    ASSERT_TRUE(minimized);
    ASSERT_EQ(minimized.value().files.size(), 1u);

    auto result = execute(minimized.value(), testConfig());
    ASSERT_TRUE(result) << result.error().describe();

    EXPECT_EQ(rangeStarts(urlFor("resume.bin")), (std::vector<std::uint64_t>{3 * kPiece}));
    EXPECT_EQ(tests::read_file(dir_ / "resume.bin"), payload);
}

TEST_F(OrchestratorTest, CorruptChunkIsRefetched) {
    auto payload = tests::random_payload(kPiece * 4);
    http_->serve(urlFor("flaky.bin"), payload);
    http_->corruptRangeAtTimes(urlFor("flaky.bin"), kPiece, 2);

    auto result = execute(buildPlan({pieced("flaky.bin", payload)}), testConfig());
    ASSERT_TRUE(result) << result.error().describe();

    auto starts = rangeStarts(urlFor("flaky.bin"));
    EXPECT_EQ(std::count(starts.begin(), starts.end(), kPiece), 3);
    EXPECT_EQ(tests::read_file(dir_ / "flaky.bin"), payload);
}

TEST_F(OrchestratorTest, PersistentChecksumFailureStopsTheFile) {
    auto payload = tests::random_payload(kPiece * 6);
    http_->serve(urlFor("bad.bin"), payload);
    http_->corruptRangeAt(urlFor("bad.bin"), 2 * kPiece);

    auto cfg = testConfig();
    cfg.maxThreadsPerFile = 2; // a single worker keeps the request order deterministic
    auto result = execute(buildPlan({pieced("bad.bin", payload)}), cfg);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::ChecksumMismatch);
    ASSERT_TRUE(result.error().offset.has_value());
    EXPECT_EQ(*result.error().offset, 2 * kPiece);
    ASSERT_TRUE(result.error().path.has_value());

    auto starts = rangeStarts(urlFor("bad.bin"));
    EXPECT_EQ(std::count(starts.begin(), starts.end(), 2 * kPiece), 3);
    EXPECT_TRUE(std::none_of(starts.begin(), starts.end(),
                             [](std::uint64_t s) { return s > 2 * kPiece; }));
}

TEST_F(OrchestratorTest, UnverifiedChunksAreNotRetried) {
    auto payload = tests::random_payload(kPiece * 3);
    http_->serve(urlFor("plain.bin"), payload);

    auto plan = PlanBuilder(dir_.path()).planForUrl(urlFor("plain.bin"), payload.size(), kPiece, kPiece);
    ASSERT_TRUE(plan);
    ASSERT_TRUE(plan.value().files[0].chunks.has_value());

    auto result = execute(plan.value(), testConfig());
    ASSERT_TRUE(result) << result.error().describe();
    EXPECT_EQ(rangeStarts(urlFor("plain.bin")).size(), 3u);
    EXPECT_EQ(tests::read_file(dir_ / "plain.bin"), payload);
}

TEST_F(OrchestratorTest, ReportsFinalProgress) {
    auto chunked = tests::random_payload(kPiece * 5 + 3, 1);
    auto single = tests::random_payload(700, 2);
    http_->serve(urlFor("a.bin"), chunked);
    http_->serve(urlFor("b.bin"), single);

    std::mutex mutex;
    std::vector<ProgressEvent> events;
    auto plan = buildPlan({pieced("a.bin", chunked), whole("b.bin", single)});
    auto result = execute(plan, testConfig(), [&](const ProgressEvent& e) {
        std::lock_guard lock(mutex);
        events.push_back(e);
    });
    ASSERT_TRUE(result) << result.error().describe();

    ASSERT_FALSE(events.empty());
    const auto& last = events.back();
    EXPECT_TRUE(last.finished);
    EXPECT_EQ(last.totalBytes, chunked.size() + single.size());
    EXPECT_EQ(last.downloadedBytes, chunked.size() + single.size());
    ASSERT_TRUE(last.percentage.has_value());
    EXPECT_FLOAT_EQ(*last.percentage, 100.0f);
    EXPECT_EQ(std::count_if(events.begin(), events.end(),
                            [](const ProgressEvent& e) { return e.finished; }),
              1);
    for (std::size_t i = 1; i < events.size(); ++i)
        EXPECT_GE(events[i].downloadedBytes, events[i - 1].downloadedBytes);
}

TEST_F(OrchestratorTest, SingleShotVerifiesWholeFileDigest) {
    auto payload = tests::random_payload(900);
    http_->serve(urlFor("w.bin"), payload);

    auto result = execute(buildPlan({whole("w.bin", payload)}), testConfig());
    ASSERT_TRUE(result) << result.error().describe();
    EXPECT_EQ(tests::read_file(dir_ / "w.bin"), payload);
    EXPECT_TRUE(http_->rangeRequests().empty());
}

TEST_F(OrchestratorTest, SingleShotDigestMismatchFails) {
    auto payload = tests::random_payload(900);
    auto served = payload;
    served[10] = static_cast<char>(~served[10]);
    http_->serve(urlFor("w.bin"), served);

    auto result = execute(buildPlan({whole("w.bin", payload)}), testConfig());
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::ChecksumMismatch);
}

TEST_F(OrchestratorTest, SingleShotSizeMismatchFails) {
    auto payload = tests::random_payload(900);
    http_->serve(urlFor("sized.bin"), payload);

    FileDescriptor fd;
    fd.name = "sized.bin";
    fd.size = payload.size() + 10;
    fd.urls = std::vector<UrlCandidate>{{urlFor("sized.bin"), std::nullopt, std::nullopt}};
    auto result = execute(buildPlan({fd}), testConfig());
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::InvalidData);
}

TEST_F(OrchestratorTest, UnknownSizeDownloadsWholeBody) {
    auto payload = tests::random_payload(3000);
    http_->serve(urlFor("stream"), payload);

    auto plan = PlanBuilder(dir_.path()).planForUrl(urlFor("stream"), std::nullopt);
    ASSERT_TRUE(plan);
    auto result = execute(plan.value(), testConfig());
    ASSERT_TRUE(result) << result.error().describe();
    EXPECT_EQ(tests::read_file(dir_ / "stream"), payload);
}

TEST_F(OrchestratorTest, CancelFileLetsSiblingsComplete) {
    auto bad = tests::random_payload(kPiece * 4, 1);
    auto good = tests::random_payload(kPiece * 4, 2);
    auto other = tests::random_payload(500, 3);
    http_->serve(urlFor("bad.bin"), bad);
    http_->corruptRangeAt(urlFor("bad.bin"), 0);
    http_->serve(urlFor("good.bin"), good);
    // missing.bin is never served and answers 404

    auto cfg = testConfig();
    cfg.failurePolicy = FailurePolicy::CancelFile;
    auto plan = buildPlan({pieced("bad.bin", bad), pieced("good.bin", good),
                           whole("missing.bin", other)});
    auto result = execute(plan, cfg);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().message.rfind("2 of 3 file(s) failed", 0), 0u)
        << result.error().message;
    EXPECT_EQ(tests::read_file(dir_ / "good.bin"), good);
}

TEST_F(OrchestratorTest, CancelFileWithSingleFailureReturnsIt) {
    auto bad = tests::random_payload(kPiece * 2, 1);
    auto good = tests::random_payload(kPiece * 2, 2);
    http_->serve(urlFor("bad.bin"), bad);
    http_->corruptRangeAt(urlFor("bad.bin"), kPiece);
    http_->serve(urlFor("good.bin"), good);

    auto cfg = testConfig();
    cfg.failurePolicy = FailurePolicy::CancelFile;
    auto result = execute(buildPlan({pieced("bad.bin", bad), pieced("good.bin", good)}), cfg);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::ChecksumMismatch);
    EXPECT_EQ(tests::read_file(dir_ / "good.bin"), good);
}

TEST_F(OrchestratorTest, CancelRunReturnsFirstFailure) {
    auto bad = tests::random_payload(kPiece * 3, 1);
    http_->serve(urlFor("bad.bin"), bad);
    http_->corruptRangeAt(urlFor("bad.bin"), 0);
    std::vector<FileDescriptor> files{pieced("bad.bin", bad)};
    for (int i = 0; i < 4; ++i) {
        auto name = "next" + std::to_string(i) + ".bin";
        auto payload = tests::random_payload(kPiece * 3, 10 + i);
        http_->serve(urlFor(name), payload);
        files.push_back(pieced(name, payload));
    }

    auto cfg = testConfig();
    cfg.maxParallelFiles = 1; // files run in plan order
    auto result = execute(buildPlan(files), cfg);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::ChecksumMismatch);
    // Nothing after the failing file was started
    for (int i = 0; i < 4; ++i)
        EXPECT_TRUE(rangeStarts(urlFor("next" + std::to_string(i) + ".bin")).empty());
}

TEST_F(OrchestratorTest, EmptyPlanSucceeds) {
    bool finished = false;
    auto result = execute(Plan{}, testConfig(), [&](const ProgressEvent& e) {
        if (e.finished)
            finished = true;
    });
    EXPECT_TRUE(result);
    EXPECT_TRUE(finished);
}

TEST_F(OrchestratorTest, UnsupportedWholeFileDigestFailsBeforeTransfer) {
    auto payload = tests::random_payload(900);
    http_->serve(urlFor("shake.bin"), payload);

    auto fd = whole("shake.bin", payload);
    fd.hashes.push_back(Checksum{HashAlgo::Shake256, "00"});
    auto plan = buildPlan({fd});
    ASSERT_EQ(plan.files.size(), 1u);
    ASSERT_TRUE(plan.files[0].wholeFileChecksum.has_value());
    ASSERT_EQ(plan.files[0].wholeFileChecksum->algo, HashAlgo::Shake256);

    auto result = execute(plan, testConfig());
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::UnsupportedAlgorithm);
    ASSERT_TRUE(result.error().url.has_value());
    EXPECT_EQ(*result.error().url, urlFor("shake.bin"));
    EXPECT_TRUE(http_->requests().empty());
    EXPECT_FALSE(std::filesystem::exists(dir_ / "shake.bin"));
}

TEST_F(OrchestratorTest, UnsupportedChunkDigestFailsBeforeTransfer) {
    auto payload = tests::random_payload(kPiece * 3);
    http_->serve(urlFor("pieces.bin"), payload);

    FileDescriptor fd;
    fd.name = "pieces.bin";
    fd.size = payload.size();
    fd.urls = std::vector<UrlCandidate>{{urlFor("pieces.bin"), std::nullopt, std::nullopt}};
    fd.pieces = PieceDescriptor{HashAlgo::Shake256, kPiece, {"00", "11", "22"}};

    auto result = execute(buildPlan({fd}), testConfig());
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::UnsupportedAlgorithm);
    EXPECT_TRUE(http_->rangeRequests().empty());
}

TEST_F(OrchestratorTest, CancelRunWithParallelLanesReportsOnlyTheFatalError) {
    constexpr std::uint64_t kSlowChunks = 60;
    auto bad = tests::random_payload(kPiece * 2, 1);
    auto slow = tests::random_payload(kPiece * kSlowChunks, 2);
    http_->serve(urlFor("bad.bin"), bad);
    http_->corruptRangeAt(urlFor("bad.bin"), 0);
    http_->serve(urlFor("slow.bin"), slow);
    http_->setRandomDelay(std::chrono::milliseconds(20));

    auto cfg = testConfig();
    cfg.maxParallelFiles = 2;
    cfg.maxThreadsPerFile = 2; // one worker per file
    auto result = execute(buildPlan({pieced("bad.bin", bad), pieced("slow.bin", slow)}), cfg);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::ChecksumMismatch);
    EXPECT_EQ(result.error().message.find("file(s) failed"), std::string::npos)
        << result.error().message;
    ASSERT_TRUE(result.error().path.has_value());
    EXPECT_EQ(result.error().path->filename().string(), "bad.bin");

    // The sibling lane was cancelled part way and started no chunk afterwards
    const auto siblingRequests = rangeStarts(urlFor("slow.bin")).size();
    EXPECT_GT(siblingRequests, 0u);
    EXPECT_LT(siblingRequests, kSlowChunks);
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    EXPECT_EQ(rangeStarts(urlFor("slow.bin")).size(), siblingRequests);
}

TEST_F(OrchestratorTest, WorkerPoolOutlivesOuterCancellation) {
    using namespace boost::asio::experimental::awaitable_operators;

    constexpr std::uint64_t kChunks = 20;
    auto payload = tests::random_payload(kPiece * kChunks);
    http_->serve(urlFor("raced.bin"), payload);
    http_->setRandomDelay(std::chrono::milliseconds(20));

    auto plan = buildPlan({pieced("raced.bin", payload)});
    ASSERT_EQ(plan.files.size(), 1u);
    const auto& file = plan.files[0];

    Runtime runtime(2, 4);
    auto cancel = CancellationSignal::create(runtime.scheduler());
    DownloadWorkerPool pool(runtime.scheduler(), runtime.blocking(), http_,
                            WorkerPoolOptions{3, true, 3}, cancel);
    WriterInbox inbox(runtime.scheduler(), kChunks + 1);

    auto yieldOnce = []() -> boost::asio::awaitable<void> {
        co_await boost::asio::post(co_await boost::asio::this_coro::executor,
                                   boost::asio::use_awaitable);
    };
    auto winner = boost::asio::co_spawn(
        runtime.scheduler(),
        [&]() -> boost::asio::awaitable<std::size_t> {
            auto outcome = co_await (pool.run(file, inbox) || yieldOnce());
            co_return outcome.index();
        },
        boost::asio::use_future);

    // The race only completes once every pool coroutine has left
    EXPECT_EQ(winner.get(), 1u);
    EXPECT_TRUE(cancel->requested());
    const auto issued = http_->rangeRequests().size();
    EXPECT_LT(issued, kChunks);
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    EXPECT_EQ(http_->rangeRequests().size(), issued);
}


#include <gtest/gtest.h>

#include <common/test_helpers.h>
#include <mlget/downloader/checksum_engine.hpp>
#include <mlget/downloader/chunk_partitioner.hpp>
#include <mlget/downloader/plan_builder.hpp>
#include <mlget/manifest/manifest.h>

#include <string>
#include <vector>

using namespace mlget;
using namespace mlget::downloader;
using mlget::manifest::FileDescriptor;
using mlget::manifest::PieceDescriptor;
using mlget::manifest::UrlCandidate;

namespace {

constexpr std::uint64_t kPiece = 1024;

std::vector<std::string> pieceHashes(const std::string& payload, std::uint64_t pieceLength) {
    std::vector<std::string> out;
    for (const auto& r : calculateRanges(payload.size(), pieceLength)) {
        auto d = ChecksumEngine::digest(HashAlgo::Sha1,
                                        std::string_view(payload).substr(r.start, r.size()));
        out.push_back(d.value());
    }
    return out;
}

FileDescriptor pieced(const std::string& name, const std::string& payload) {
    FileDescriptor fd;
    fd.name = name;
    fd.size = payload.size();
    fd.urls = std::vector<UrlCandidate>{{"https://example.org/" + name, 1, std::nullopt}};
    fd.pieces = PieceDescriptor{HashAlgo::Sha1, kPiece, pieceHashes(payload, kPiece)};
    return fd;
}

FileDescriptor hashedWhole(const std::string& name, const std::string& payload) {
    FileDescriptor fd;
    fd.name = name;
    fd.size = payload.size();
    fd.urls = std::vector<UrlCandidate>{{"https://example.org/" + name, std::nullopt, std::nullopt}};
    fd.hashes = {Checksum{HashAlgo::Md5, ChecksumEngine::digest(HashAlgo::Md5, payload).value()},
                 Checksum{HashAlgo::Sha256,
                          ChecksumEngine::digest(HashAlgo::Sha256, payload).value()}};
    return fd;
}

} // namespace

TEST(PlanBuilderTest, BuildsChunkedPlanFromPieces) {
    tests::TempDir dir;
    auto payload = tests::random_payload(kPiece * 3 + 100);
    PlanBuilder builder(dir.path());

    auto plan = builder.build({pieced("data/a.bin", payload)});
    ASSERT_TRUE(plan) << plan.error().describe();
    ASSERT_EQ(plan.value().files.size(), 1u);
    const auto& file = plan.value().files[0];
    EXPECT_EQ(file.targetPath, dir.path() / "data/a.bin");
    EXPECT_EQ(file.sourceUrl, "https://example.org/data/a.bin");
    ASSERT_TRUE(file.chunks.has_value());
    EXPECT_EQ(file.chunks->size(), 4u);
    EXPECT_EQ(file.chunks->back().end, payload.size() - 1);
    EXPECT_FALSE(file.wholeFileChecksum.has_value());
    EXPECT_EQ(plan.value().totalSize, payload.size());
}

TEST(PlanBuilderTest, PicksStrongestWholeFileDigest) {
    tests::TempDir dir;
    auto payload = tests::random_payload(500);
    auto plan = PlanBuilder(dir.path()).build({hashedWhole("w.bin", payload)});
    ASSERT_TRUE(plan);
    const auto& file = plan.value().files[0];
    EXPECT_FALSE(file.chunks.has_value());
    ASSERT_TRUE(file.wholeFileChecksum.has_value());
    EXPECT_EQ(file.wholeFileChecksum->algo, HashAlgo::Sha256);
    EXPECT_EQ(plan.value().totalSize, 500u);
}

TEST(PlanBuilderTest, StrongestChecksumOrdering) {
    EXPECT_FALSE(strongestChecksum({}).has_value());
    auto best = strongestChecksum({{HashAlgo::Sha1, "a"}, {HashAlgo::Sha512, "b"},
                                   {HashAlgo::Md5, "c"}, {HashAlgo::Sha224, "d"}});
    ASSERT_TRUE(best.has_value());
    EXPECT_EQ(best->hex, "b");
}

TEST(PlanBuilderTest, PiecesWithoutSizeFail) {
    tests::TempDir dir;
    auto fd = pieced("a.bin", tests::random_payload(kPiece * 2));
    fd.size.reset();
    auto r = PlanBuilder(dir.path()).buildFile(fd);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::MissingSizeForPieces);
}

TEST(PlanBuilderTest, PieceCountMustMatchRanges) {
    tests::TempDir dir;
    auto fd = pieced("a.bin", tests::random_payload(kPiece * 2));
    fd.pieces->hashes.pop_back();
    auto r = PlanBuilder(dir.path()).buildFile(fd);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::ChunkCountMismatch);
}

TEST(PlanBuilderTest, UrlListRequired) {
    tests::TempDir dir;
    FileDescriptor fd;
    fd.name = "a.bin";
    auto missing = PlanBuilder(dir.path()).buildFile(fd);
    ASSERT_FALSE(missing);
    EXPECT_EQ(missing.error().code, ErrorCode::NoLocationSpecified);

    fd.urls = std::vector<UrlCandidate>{};
    auto empty = PlanBuilder(dir.path()).buildFile(fd);
    ASSERT_FALSE(empty);
    EXPECT_EQ(empty.error().code, ErrorCode::NoUrlsAvailable);
}

TEST(PlanBuilderTest, NamesMustStayInsideBaseDirectory) {
    tests::TempDir dir;
    PlanBuilder builder(dir.path());
    for (const char* name : {"/etc/passwd", "../escape.bin", "a/../../b.bin"}) {
        auto fd = hashedWhole(name, "x");
        auto r = builder.buildFile(fd);
        ASSERT_FALSE(r) << name;
        EXPECT_EQ(r.error().code, ErrorCode::ManifestInvalid) << name;
    }
}

TEST(PlanBuilderTest, MinimizeKeepsMissingFiles) {
    tests::TempDir dir;
    PlanBuilder builder(dir.path());
    auto plan = builder.build({pieced("a.bin", tests::random_payload(kPiece * 2))});
    ASSERT_TRUE(plan);
    auto minimized = builder.minimize(plan.value());
    ASSERT_TRUE(minimized);
    ASSERT_EQ(minimized.value().files.size(), 1u);
    EXPECT_EQ(minimized.value().files[0].chunks->size(), 2u);
    EXPECT_EQ(minimized.value().totalSize, plan.value().totalSize);
}

TEST(PlanBuilderTest, MinimizeKeepsOnlyInvalidChunks) {
    tests::TempDir dir;
    PlanBuilder builder(dir.path());
    auto payload = tests::random_payload(kPiece * 4 + 10);
    auto plan = builder.build({pieced("a.bin", payload)});
    ASSERT_TRUE(plan);

    // Corrupt the second piece on disk
    auto onDisk = payload;
    onDisk[kPiece + 5] = static_cast<char>(~onDisk[kPiece + 5]);
    tests::write_file(dir / "a.bin", onDisk);

    auto minimized = builder.minimize(plan.value());
    ASSERT_TRUE(minimized) << minimized.error().describe();
    ASSERT_EQ(minimized.value().files.size(), 1u);
    const auto& chunks = *minimized.value().files[0].chunks;
    ASSERT_EQ(chunks.size(), 1u);
    EXPECT_EQ(chunks[0].start, kPiece);
    EXPECT_EQ(minimized.value().totalSize, kPiece);
}

TEST(PlanBuilderTest, MinimizeKeepsChunksBeyondShortFile) {
    tests::TempDir dir;
    PlanBuilder builder(dir.path());
    auto payload = tests::random_payload(kPiece * 3);
    auto plan = builder.build({pieced("a.bin", payload)});
    ASSERT_TRUE(plan);

    tests::write_file(dir / "a.bin", payload.substr(0, kPiece + 10));
    auto minimized = builder.minimize(plan.value());
    ASSERT_TRUE(minimized);
    const auto& chunks = *minimized.value().files[0].chunks;
    ASSERT_EQ(chunks.size(), 2u);
    EXPECT_EQ(chunks[0].start, kPiece);
    EXPECT_EQ(chunks[1].start, 2 * kPiece);
}

TEST(PlanBuilderTest, MinimizeDropsCompleteFilesAndIsIdempotent) {
    tests::TempDir dir;
    PlanBuilder builder(dir.path());
    auto chunked = tests::random_payload(kPiece * 2 + 1, 1);
    auto whole = tests::random_payload(700, 2);
    auto plan = builder.build({pieced("c.bin", chunked), hashedWhole("w.bin", whole)});
    ASSERT_TRUE(plan);

    tests::write_file(dir / "c.bin", chunked);
    tests::write_file(dir / "w.bin", whole);

    auto once = builder.minimize(plan.value());
    ASSERT_TRUE(once);
    EXPECT_TRUE(once.value().files.empty());
    EXPECT_EQ(once.value().totalSize, 0u);

    auto twice = builder.minimize(once.value());
    ASSERT_TRUE(twice);
    EXPECT_TRUE(twice.value().files.empty());
}

TEST(PlanBuilderTest, MinimizeKeepsWholeFileWithWrongContent) {
    tests::TempDir dir;
    PlanBuilder builder(dir.path());
    auto whole = tests::random_payload(700);
    auto plan = builder.build({hashedWhole("w.bin", whole)});
    ASSERT_TRUE(plan);

    auto tampered = whole;
    tampered[0] = static_cast<char>(~tampered[0]);
    tests::write_file(dir / "w.bin", tampered);
    auto minimized = builder.minimize(plan.value());
    ASSERT_TRUE(minimized);
    EXPECT_EQ(minimized.value().files.size(), 1u);

    tests::write_file(dir / "w.bin", whole.substr(0, 10));
    minimized = builder.minimize(plan.value());
    ASSERT_TRUE(minimized);
    EXPECT_EQ(minimized.value().files.size(), 1u);
}

TEST(PlanBuilderTest, MinimizeKeepsFilesWithoutDigest) {
    tests::TempDir dir;
    PlanBuilder builder(dir.path());
    FileDescriptor fd;
    fd.name = "plain.txt";
    fd.urls = std::vector<UrlCandidate>{{"https://example.org/plain.txt", std::nullopt, std::nullopt}};
    auto plan = builder.build({fd});
    ASSERT_TRUE(plan);

    tests::write_file(dir / "plain.txt", "already here");
    auto minimized = builder.minimize(plan.value());
    ASSERT_TRUE(minimized);
    EXPECT_EQ(minimized.value().files.size(), 1u);
}

TEST(PlanBuilderTest, PlanForUrlChunksOnlyAboveThreshold) {
    tests::TempDir dir;
    PlanBuilder builder(dir.path());

    auto large = builder.planForUrl("https://example.org/files/model.bin?token=1", 5000, 1024, 1024);
    ASSERT_TRUE(large);
    const auto& file = large.value().files[0];
    EXPECT_EQ(file.targetPath, dir.path() / "model.bin");
    ASSERT_TRUE(file.chunks.has_value());
    EXPECT_EQ(file.chunks->size(), 5u);
    EXPECT_FALSE(file.chunks->front().checksum.has_value());

    auto small = builder.planForUrl("https://example.org/files/small.bin", 1024, 1024, 1024);
    ASSERT_TRUE(small);
    EXPECT_FALSE(small.value().files[0].chunks.has_value());

    auto unknown = builder.planForUrl("https://example.org/files/stream", std::nullopt);
    ASSERT_TRUE(unknown);
    EXPECT_FALSE(unknown.value().files[0].chunks.has_value());
    EXPECT_EQ(unknown.value().totalSize, 0u);

    auto nameless = builder.planForUrl("https://example.org/", 10);
    ASSERT_FALSE(nameless);
    EXPECT_EQ(nameless.error().code, ErrorCode::InvalidArgument);
}

TEST(PlanBuilderTest, FileNameFromUrl) {
    EXPECT_EQ(fileNameFromUrl("https://host/a/b/c.tar.gz"), "c.tar.gz");
    EXPECT_EQ(fileNameFromUrl("https://host/a/b/?x=1#frag"), "b");
    EXPECT_EQ(fileNameFromUrl("https://host/file#section"), "file");
    EXPECT_EQ(fileNameFromUrl("https://host"), "");
    EXPECT_EQ(fileNameFromUrl("https://host/"), "");
}

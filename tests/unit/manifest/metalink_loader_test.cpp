#include <gtest/gtest.h>

#include <common/test_helpers.h>
#include <mlget/downloader/plan_builder.hpp>
#include <mlget/manifest/manifest.h>

#include <filesystem>
#include <string>

using namespace mlget;
using namespace mlget::manifest;
using mlget::downloader::HashAlgo;

namespace {

const std::filesystem::path kFixture = std::filesystem::path(MLGET_TEST_DATA_DIR) / "models.meta4";

std::string metalink(const std::string& files) {
    return R"(<?xml version="1.0" encoding="UTF-8"?>
<metalink xmlns="urn:ietf:params:xml:ns:metalink">)" +
           files + "</metalink>";
}

} // namespace

TEST(MetalinkLoaderTest, LoadsFixtureFile) {
    auto loaded = loadManifest(kFixture);
    ASSERT_TRUE(loaded) << loaded.error().describe();
    const auto& files = loaded.value();
    ASSERT_EQ(files.size(), 2u);

    const auto& weights = files[0];
    EXPECT_EQ(weights.name, "models/weights.bin");
    ASSERT_TRUE(weights.size.has_value());
    EXPECT_EQ(*weights.size, 3145728u);

    ASSERT_EQ(weights.hashes.size(), 2u);
    EXPECT_EQ(weights.hashes[0].algo, HashAlgo::Sha256);
    EXPECT_EQ(weights.hashes[0].hex, "abcdef0123");
    EXPECT_EQ(weights.hashes[1].algo, HashAlgo::Md5);

    ASSERT_TRUE(weights.pieces.has_value());
    EXPECT_EQ(weights.pieces->algo, HashAlgo::Sha1);
    EXPECT_EQ(weights.pieces->length, 1048576u);
    EXPECT_EQ(weights.pieces->hashes, (std::vector<std::string>{"aa", "bb", "cc"}));

    ASSERT_TRUE(weights.urls.has_value());
    const auto& urls = *weights.urls;
    ASSERT_EQ(urls.size(), 3u);
    EXPECT_EQ(urls[0].url, "https://mirror-a.example.org/weights.bin");
    EXPECT_EQ(urls[1].url, "https://mirror-b.example.org/weights.bin");
    ASSERT_TRUE(urls[1].location.has_value());
    EXPECT_EQ(*urls[1].location, "de");
    EXPECT_EQ(urls[2].url, "https://fallback.example.org/weights.bin");
    EXPECT_FALSE(urls[2].priority.has_value());

    const auto& readme = files[1];
    EXPECT_EQ(readme.name, "README.txt");
    EXPECT_FALSE(readme.size.has_value());
    EXPECT_TRUE(readme.hashes.empty());
    EXPECT_FALSE(readme.pieces.has_value());
}

TEST(MetalinkLoaderTest, FixtureBuildsAChunkedPlan) {
    auto loaded = loadManifest(kFixture);
    ASSERT_TRUE(loaded);

    tests::TempDir dir;
    auto plan = downloader::PlanBuilder(dir.path()).build(loaded.value());
    ASSERT_TRUE(plan) << plan.error().describe();
    ASSERT_EQ(plan.value().files.size(), 2u);

    const auto& weights = plan.value().files[0];
    EXPECT_EQ(weights.sourceUrl, "https://mirror-a.example.org/weights.bin");
    ASSERT_TRUE(weights.chunks.has_value());
    ASSERT_EQ(weights.chunks->size(), 3u);
    EXPECT_EQ((*weights.chunks)[2].start, 2u * 1048576u);
    ASSERT_TRUE((*weights.chunks)[2].checksum.has_value());
    EXPECT_EQ((*weights.chunks)[2].checksum->hex, "cc");
    ASSERT_TRUE(weights.wholeFileChecksum.has_value());
    EXPECT_EQ(weights.wholeFileChecksum->algo, HashAlgo::Sha256);
}

TEST(MetalinkLoaderTest, AcceptsUnqualifiedElements) {
    auto parsed = parseMetalink(R"(<metalink><file name="a.bin"><size>10</size>
        <url>https://example.org/a.bin</url></file></metalink>)");
    ASSERT_TRUE(parsed) << parsed.error().describe();
    ASSERT_EQ(parsed.value().size(), 1u);
    EXPECT_EQ(*parsed.value()[0].size, 10u);
}

TEST(MetalinkLoaderTest, IgnoresForeignNamespaceElements) {
    auto parsed = parseMetalink(metalink(R"(<file name="a.bin" xmlns:x="urn:example:other">
        <x:size>99</x:size><size>10</size><url>https://example.org/a.bin</url></file>)"));
    ASSERT_TRUE(parsed) << parsed.error().describe();
    EXPECT_EQ(*parsed.value()[0].size, 10u);
}

TEST(MetalinkLoaderTest, FileWithoutUrlsHasNoCandidates) {
    auto parsed = parseMetalink(metalink(R"(<file name="a.bin"><size>10</size></file>)"));
    ASSERT_TRUE(parsed);
    EXPECT_FALSE(parsed.value()[0].urls.has_value());
}

TEST(MetalinkLoaderTest, UnknownPieceTypeIsInvalid) {
    auto parsed = parseMetalink(metalink(R"(<file name="a"><size>10</size>
        <pieces type="tiger" length="4"><hash>aa</hash></pieces></file>)"));
    ASSERT_FALSE(parsed);
    EXPECT_EQ(parsed.error().code, ErrorCode::ManifestInvalid);
    EXPECT_NE(parsed.error().message.find("tiger"), std::string::npos);
}

TEST(MetalinkLoaderTest, RejectsMalformedDocuments) {
    for (const std::string doc :
         {std::string("<metalink><file name=\"a\">"), std::string("not xml at all"),
          std::string(R"(<metalink xmlns="http://www.metalinker.org/"><files/></metalink>)"),
          metalink(""), metalink(R"(<file><size>1</size></file>)"),
          metalink(R"(<file name="a"><size>-1</size></file>)"),
          metalink(R"(<file name="a"><size>12kb</size></file>)"),
          metalink(R"(<file name="a"><url priority="high">https://e.org/a</url></file>)"),
          metalink(R"(<file name="a"><pieces type="sha-1" length="0"/></file>)")}) {
        auto parsed = parseMetalink(doc);
        ASSERT_FALSE(parsed) << doc;
        EXPECT_EQ(parsed.error().code, ErrorCode::ManifestInvalid) << doc;
    }
}

TEST(MetalinkLoaderTest, DetectsFormatByExtensionThenContent) {
    EXPECT_EQ(detectManifestFormat("run.meta4", "{}"), ManifestFormat::Metalink);
    EXPECT_EQ(detectManifestFormat("run.METALINK", ""), ManifestFormat::Metalink);
    EXPECT_EQ(detectManifestFormat("run.json", "<metalink/>"), ManifestFormat::Json);
    EXPECT_EQ(detectManifestFormat("manifest", "\n  <?xml version=\"1.0\"?>"),
              ManifestFormat::Metalink);
    EXPECT_EQ(detectManifestFormat("manifest", "\xEF\xBB\xBF<metalink/>"),
              ManifestFormat::Metalink);
    EXPECT_EQ(detectManifestFormat("manifest", R"({"files": []})"), ManifestFormat::Json);
}

TEST(MetalinkLoaderTest, LoadManifestSniffsXmlWithoutExtension) {
    tests::TempDir dir;
    auto path = tests::write_file(
        dir / "manifest", metalink(R"(<file name="x.bin"><url>https://e.org/x.bin</url></file>)"));
    auto loaded = loadManifest(path);
    ASSERT_TRUE(loaded) << loaded.error().describe();
    ASSERT_EQ(loaded.value().size(), 1u);
    EXPECT_EQ(loaded.value()[0].name, "x.bin");

    auto broken = tests::write_file(dir / "broken.meta4", "<metalink>");
    auto failed = loadManifest(broken);
    ASSERT_FALSE(failed);
    EXPECT_EQ(failed.error().code, ErrorCode::ManifestInvalid);
    ASSERT_TRUE(failed.error().path.has_value());
}

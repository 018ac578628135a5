#include "chunked/server/status_resolver.hpp"

#include "support/temp_dir.hpp"

#include <gtest/gtest.h>

using namespace chunked;
using chunked::server::StatusResolver;
using chunked::test_support::TempDir;

namespace {

void stage(storage::StagingArea& staging, const std::string& fp, std::uint32_t index) {
    auto writer = staging.open_writer(fp, index);
    ASSERT_TRUE(writer.is_ok());
    const std::uint8_t byte = 7;
    ASSERT_TRUE(writer.value()->append(&byte, 1).is_ok());
    ASSERT_TRUE(writer.value()->commit().is_ok());
}

} // namespace

class StatusResolverTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(staging.initialize().is_ok());
        ASSERT_TRUE(catalog.load().is_ok());
    }

    TempDir dir;
    storage::StagingArea staging{dir / "chunks"};
    storage::ArtifactCatalog catalog{dir / "artifacts"};
    StatusResolver resolver{staging, catalog};
};

TEST_F(StatusResolverTest, UnknownContentHasNothingStored) {
    auto status = resolver.resolve("fresh", "a.bin");
    ASSERT_TRUE(status.is_ok());
    EXPECT_FALSE(status.value().exists);
    EXPECT_TRUE(status.value().stored_indices.empty());
}

TEST_F(StatusResolverTest, ReportsStoredIndicesInOrder) {
    stage(staging, "partial", 3);
    stage(staging, "partial", 0);
    stage(staging, "partial", 1);

    auto status = resolver.resolve("partial", "a.bin");
    ASSERT_TRUE(status.is_ok());
    EXPECT_FALSE(status.value().exists);
    EXPECT_EQ(status.value().stored_indices, (std::vector<std::uint32_t>{0, 1, 3}));
}

TEST_F(StatusResolverTest, AssembledContentIsFoundUnderAnyName) {
    test_support::write_file(catalog.artifact_path("original.bin"), std::string("data"));
    ASSERT_TRUE(catalog.record(storage::CatalogEntry{"done", "original.bin", 4, 0}).is_ok());

    auto status = resolver.resolve("done", "renamed.bin");
    ASSERT_TRUE(status.is_ok());
    EXPECT_TRUE(status.value().exists);
    EXPECT_EQ(status.value().location, "/uploads/original.bin");
}

TEST_F(StatusResolverTest, ValidatesIdentifiers) {
    auto no_fp = resolver.resolve("", "a.bin");
    ASSERT_TRUE(no_fp.is_error());
    EXPECT_EQ(no_fp.error().code, ErrorCode::MissingIdentifier);

    auto no_name = resolver.resolve("abc", "");
    ASSERT_TRUE(no_name.is_error());
    EXPECT_EQ(no_name.error().code, ErrorCode::MissingIdentifier);

    auto bad_name = resolver.resolve("abc", "../passwd");
    ASSERT_TRUE(bad_name.is_error());
    EXPECT_EQ(bad_name.error().code, ErrorCode::InvalidArgument);
}

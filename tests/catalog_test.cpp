#include <gtest/gtest.h>
#include "catalog.hpp"
#include "test_support.hpp"

#include <set>

namespace fs = std::filesystem;

TEST(CatalogTest, PathHashIsDeterministic)
{
    EXPECT_EQ(catalog::hash_path("/srv/share/a.txt"), catalog::hash_path("/srv/share/a.txt"));
    EXPECT_EQ(catalog::file_id("/srv/share/a.txt"), catalog::file_id("/srv/share/a.txt"));
}

TEST(CatalogTest, IdsMatchPublishedValues)
{
    EXPECT_EQ(catalog::format_id(catalog::file_id("")), "30406ea5-23c5-3def-0000-000000000000");
    EXPECT_EQ(catalog::format_id(catalog::file_id("a")), "719b50b9-a4f0-e9f3-0000-000000000000");
    EXPECT_EQ(catalog::format_id(catalog::file_id("/tmp/x/alpha.txt")),
              "41149fb3-5cd0-d470-0000-000000000000");
    EXPECT_EQ(catalog::format_id(catalog::file_id("/home/user/some/longer/path/file_name.bin")),
              "78f90f87-77ef-e063-0000-000000000000");
}

TEST(CatalogTest, DistinctPathsGetDistinctIds)
{
    std::set<std::string> ids;
    for (int i = 0; i < 500; ++i) {
        ids.insert(catalog::format_id(catalog::file_id("/srv/share/file" + std::to_string(i) + ".bin")));
    }
    EXPECT_EQ(ids.size(), 500u);

    EXPECT_NE(catalog::hash_path("a"), catalog::hash_path("b"));
    EXPECT_NE(catalog::hash_path(""), catalog::hash_path("a"));
}

TEST(CatalogTest, IdCarriesHashInHighHalfOnly)
{
    const uint64_t hash = catalog::hash_path("/tmp/report.pdf");
    const catalog::FileId id = catalog::file_id("/tmp/report.pdf");

    for (int i = 0; i < 8; ++i) {
        EXPECT_EQ(id[i], static_cast<uint8_t>(hash >> (56 - 8 * i))) << "byte " << i;
    }
    for (int i = 8; i < 16; ++i) {
        EXPECT_EQ(id[i], 0) << "byte " << i;
    }

    const std::string text = catalog::format_id(id);
    ASSERT_EQ(text.size(), 36u);
    EXPECT_EQ(text[8], '-');
    EXPECT_EQ(text[13], '-');
    EXPECT_EQ(text[18], '-');
    EXPECT_EQ(text[23], '-');
    EXPECT_EQ(text.substr(19), "0000-000000000000");
}

TEST(CatalogTest, FormatIdIsLowerCaseHex)
{
    catalog::FileId id{};
    id[0] = 0xAB;
    id[1] = 0xCD;
    id[15] = 0x0F;
    EXPECT_EQ(catalog::format_id(id), "abcd0000-0000-0000-0000-00000000000f");
}

TEST(CatalogTest, FormatSizeUsesBinaryUnits)
{
    EXPECT_EQ(catalog::format_size(0), "0 B");
    EXPECT_EQ(catalog::format_size(100), "100 B");
    EXPECT_EQ(catalog::format_size(1023), "1023 B");
    EXPECT_EQ(catalog::format_size(1024), "1 KiB");
    EXPECT_EQ(catalog::format_size(1536), "1.50 KiB");
    EXPECT_EQ(catalog::format_size(1024 * 1024), "1 MiB");
    EXPECT_EQ(catalog::format_size(5ULL * 1024 * 1024 * 1024), "5 GiB");
}

TEST(CatalogTest, MimeTypeFromExtension)
{
    EXPECT_EQ(catalog::mime_type_for("notes.txt"), "text/plain");
    EXPECT_EQ(catalog::mime_type_for("PHOTO.JPG"), "image/jpeg");
    EXPECT_EQ(catalog::mime_type_for("image.png"), "image/png");
    EXPECT_EQ(catalog::mime_type_for("data.json"), "application/json");
    EXPECT_EQ(catalog::mime_type_for("backup.tar.gz"), "application/gzip");
    EXPECT_EQ(catalog::mime_type_for("Makefile"), "application/octet-stream");
    EXPECT_EQ(catalog::mime_type_for("blob.qqq"), "application/octet-stream");
}

TEST(CatalogTest, ListIsSortedByName)
{
    TempDir dir("catalog_sorted");
    dir.write("zebra.txt", "z");
    dir.write("alpha.txt", "a");
    dir.write("beta.txt", "b");

    auto files = catalog::list(dir.path());
    ASSERT_EQ(files.size(), 3u);
    EXPECT_EQ(files[0].name, "alpha.txt");
    EXPECT_EQ(files[1].name, "beta.txt");
    EXPECT_EQ(files[2].name, "zebra.txt");
    for (const auto& file : files) {
        EXPECT_EQ(file.size, 1u);
        EXPECT_EQ(file.size_human, "1 B");
        EXPECT_EQ(file.mime_type, "text/plain");
    }
}

TEST(CatalogTest, ListSkipsDirectoriesAndSymlinks)
{
    TempDir dir("catalog_exclusion");
    auto target = dir.write("real.bin", "1234");
    fs::create_directory(dir.path() / "nested");
    std::ofstream(dir.path() / "nested" / "inner.txt") << "hidden";
    fs::create_symlink(target, dir.path() / "link.bin");

    auto files = catalog::list(dir.path());
    ASSERT_EQ(files.size(), 1u);
    EXPECT_EQ(files[0].name, "real.bin");
    EXPECT_EQ(files[0].size, 4u);
    EXPECT_EQ(files[0].path, (dir.path() / "real.bin").string());
}

TEST(CatalogTest, ListedIdMatchesPathHash)
{
    TempDir dir("catalog_ids");
    auto file = dir.write("doc.md", "# title");

    auto files = catalog::list(dir.path());
    ASSERT_EQ(files.size(), 1u);
    EXPECT_EQ(files[0].id, catalog::format_id(catalog::file_id(file.string())));
    EXPECT_EQ(files[0].mime_type, "text/markdown");
}

TEST(CatalogTest, MissingDirectoryListsEmpty)
{
    TempDir dir("catalog_missing");
    EXPECT_TRUE(catalog::list(dir.path() / "does-not-exist").empty());
}

TEST(CatalogTest, EmptyDirectoryListsEmpty)
{
    TempDir dir("catalog_empty");
    EXPECT_TRUE(catalog::list(dir.path()).empty());
}

TEST(CatalogTest, DescribeRejectsMissingAndNonRegular)
{
    TempDir dir("catalog_describe");
    EXPECT_THROW(catalog::describe(dir.path() / "nope.txt"), catalog::NotFound);
    EXPECT_THROW(catalog::describe(dir.path()), catalog::NotFound);

    auto file = dir.write("here.txt", "hello");
    auto record = catalog::describe(file);
    EXPECT_EQ(record.name, "here.txt");
    EXPECT_EQ(record.size, 5u);
}

TEST(CatalogTest, TimestampIsRfc3339Utc)
{
    using namespace std::chrono;
    using tp = system_clock::time_point;

    EXPECT_EQ(protocol::format_timestamp(tp(seconds(0))), "1970-01-01T00:00:00Z");
    EXPECT_EQ(protocol::format_timestamp(tp(seconds(1700000000))), "2023-11-14T22:13:20Z");
    EXPECT_EQ(protocol::format_timestamp(tp(duration_cast<system_clock::duration>(milliseconds(1500)))),
              "1970-01-01T00:00:01.500Z");
    EXPECT_EQ(protocol::format_timestamp(tp(duration_cast<system_clock::duration>(microseconds(1000001)))),
              "1970-01-01T00:00:01.000001Z");
}

TEST(CatalogTest, RecordSerializesAllFields)
{
    TempDir dir("catalog_json");
    auto file = dir.write("a.json", "{}");

    nlohmann::json j = catalog::describe(file);
    for (const char* key : {"id", "name", "path", "size", "size_human", "modified", "mime_type"}) {
        EXPECT_TRUE(j.contains(key)) << key;
    }
    EXPECT_EQ(j["size"], 2);
    EXPECT_EQ(j["mime_type"], "application/json");
    EXPECT_EQ(j["modified"].get<std::string>().back(), 'Z');
}

#include <cstdio>
#include <filesystem>
#include <string>

#include "gtest/gtest.h"
#include "test_support.hpp"
#include "../libmetawipe/include/file_utils.hpp"
#include "../libmetawipe/include/logger.hpp"

namespace metawipe {
namespace {

namespace fs = std::filesystem;
using test::TempDir;
using test::list_dir;
using test::read_file;
using test::write_file;

TEST(SiblingTempPathTest, StaysBesideOriginalAndKeepsExtension) {
    const fs::path original = "/data/photos/IMG_1.jpg";
    const fs::path temp = make_sibling_temp_path(original, "img");
    EXPECT_EQ(temp.parent_path(), original.parent_path());
    EXPECT_EQ(temp.extension(), ".jpg");
    EXPECT_EQ(temp.filename().string().rfind(".IMG_1.metawipe-img-", 0), 0u);
    EXPECT_NE(make_sibling_temp_path(original, "img"), temp);
}

TEST(ReplaceFileTest, SwapsContentAndConsumesTemp) {
    TempDir dir;
    write_file(dir / "doc.pdf", "old");
    write_file(dir / ".doc.tmp.pdf", "new");

    Logger logger;
    ASSERT_TRUE(replace_file(dir / ".doc.tmp.pdf", dir / "doc.pdf", logger, "test"));
    EXPECT_EQ(read_file(dir / "doc.pdf"), "new");
    EXPECT_FALSE(fs::exists(dir / ".doc.tmp.pdf"));
}

TEST(ReplaceFileTest, MissingTempLeavesOriginal) {
    TempDir dir;
    write_file(dir / "doc.pdf", "old");

    Logger logger;
    EXPECT_FALSE(replace_file(dir / ".absent.pdf", dir / "doc.pdf", logger, "test"));
    EXPECT_EQ(read_file(dir / "doc.pdf"), "old");
}

TEST(ReplaceFileTest, KeepsOriginalPermissions) {
    TempDir dir;
    write_file(dir / "private.jpg", "old");
    write_file(dir / ".private.tmp.jpg", "new");
    fs::permissions(dir / "private.jpg", fs::perms::owner_read | fs::perms::owner_write,
                    fs::perm_options::replace);
    fs::permissions(dir / ".private.tmp.jpg",
                    fs::perms::owner_read | fs::perms::owner_write | fs::perms::group_read | fs::perms::others_read,
                    fs::perm_options::replace);

    Logger logger;
    ASSERT_TRUE(replace_file(dir / ".private.tmp.jpg", dir / "private.jpg", logger, "test"));
    EXPECT_EQ(read_file(dir / "private.jpg"), "new");
    EXPECT_EQ(fs::status(dir / "private.jpg").permissions() & fs::perms::all,
              fs::perms::owner_read | fs::perms::owner_write);
}

TEST(TempFileTest, AbandonedWriteLeavesOriginalUntouched) {
    TempDir dir;
    const fs::path original = dir / "clip.mp4";
    write_file(original, "original video");

    Logger logger;
    {
        TempFile temp(original, "clean", logger);
        // partial output, then the writer gives up before committing
        write_file(temp.path(), "half of a vid");
        EXPECT_TRUE(temp.written());
    }
    EXPECT_EQ(read_file(original), "original video");
    const auto entries = list_dir(dir.path());
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].filename(), "clip.mp4");
}

TEST(TempFileTest, CommitReplacesOriginal) {
    TempDir dir;
    const fs::path original = dir / "a.png";
    write_file(original, "with metadata");

    Logger logger;
    TempFile temp(original, "img", logger);
    write_file(temp.path(), "clean");
    ASSERT_TRUE(temp.commit());
    EXPECT_TRUE(temp.commit());
    EXPECT_EQ(read_file(original), "clean");
    EXPECT_EQ(list_dir(dir.path()).size(), 1u);
}

TEST(TempFileTest, EmptyOutputIsNotCommitted) {
    TempDir dir;
    const fs::path original = dir / "a.png";
    write_file(original, "keep me");

    Logger logger;
    {
        TempFile temp(original, "img", logger);
        write_file(temp.path(), "");
        EXPECT_FALSE(temp.written());
        EXPECT_FALSE(temp.commit());
    }
    EXPECT_EQ(read_file(original), "keep me");
    EXPECT_EQ(list_dir(dir.path()).size(), 1u);
}

TEST(OpenFileTest, ReadsWhatWasWritten) {
    TempDir dir;
    write_file(dir / "x.bin", "abc");
    FILE* f = open_file(dir / "x.bin", "rb");
    ASSERT_NE(f, nullptr);
    char buf[4] = {};
    EXPECT_EQ(std::fread(buf, 1, 3, f), 3u);
    std::fclose(f);
    EXPECT_EQ(std::string(buf), "abc");
    EXPECT_EQ(open_file(dir / "missing.bin", "rb"), nullptr);
}

TEST(TimestampForFilenameTest, HasDateUnderscoreTimeShape) {
    const std::string ts = timestamp_for_filename();
    ASSERT_EQ(ts.size(), 15u);
    EXPECT_EQ(ts[8], '_');
    for (std::size_t i = 0; i < ts.size(); ++i) {
        if (i != 8) EXPECT_TRUE(ts[i] >= '0' && ts[i] <= '9') << ts;
    }
}

} // namespace
} // namespace metawipe

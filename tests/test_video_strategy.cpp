#include <algorithm>
#include <atomic>
#include <csignal>
#include <filesystem>

#include "gtest/gtest.h"
#include "test_support.hpp"
#include "../libmetawipe/include/logger.hpp"
#include "../libmetawipe/include/video_strategy.hpp"

namespace metawipe {
namespace {

namespace fs = std::filesystem;
using test::FakeProcessRunner;
using test::TempDir;
using test::list_dir;
using test::read_file;
using test::write_file;

bool contains(const std::vector<std::string>& args, const std::string& value) {
    return std::find(args.begin(), args.end(), value) != args.end();
}

TEST(VideoStrategyArgumentsTest, CopyPassStripsMetadataWithoutTranscoding) {
    const auto args = VideoStrategy::build_arguments(VideoStrategy::Pass::Copy, "ffmpeg", "in.mp4", "out.mp4");
    EXPECT_EQ(args.front(), "ffmpeg");
    EXPECT_EQ(args.back(), "out.mp4");
    EXPECT_TRUE(contains(args, "copy"));
    EXPECT_TRUE(contains(args, "-map_metadata"));
    EXPECT_FALSE(contains(args, "libx264"));
}

TEST(VideoStrategyArgumentsTest, ReencodePassUsesH264AndAac) {
    const auto args = VideoStrategy::build_arguments(VideoStrategy::Pass::Reencode, "ffmpeg", "in.mov", "out.mov");
    EXPECT_TRUE(contains(args, "libx264"));
    EXPECT_TRUE(contains(args, "23"));
    EXPECT_TRUE(contains(args, "aac"));
    EXPECT_TRUE(contains(args, "192k"));
    EXPECT_FALSE(contains(args, "copy"));
    EXPECT_EQ(args.back(), "out.mov");
}

TEST(VideoStrategyTest, CopyPassSuccessReplacesOriginal) {
    TempDir dir;
    const fs::path clip = dir / "clip.mp4";
    write_file(clip, "original");

    FakeProcessRunner runner;
    runner.push(0, "stream-copied");
    Logger logger;
    VideoStrategy strategy(runner, "ffmpeg", logger);

    EXPECT_TRUE(strategy.attempt(clip, {}));
    ASSERT_EQ(runner.calls.size(), 1u);
    EXPECT_EQ(read_file(clip), "stream-copied");
    EXPECT_EQ(list_dir(dir.path()).size(), 1u);
}

TEST(VideoStrategyTest, EscalatesToReencodeOnce) {
    TempDir dir;
    const fs::path clip = dir / "clip.mp4";
    write_file(clip, "original");

    FakeProcessRunner runner;
    runner.push(1);
    runner.push(0, "re-encoded");
    Logger logger;
    VideoStrategy strategy(runner, "ffmpeg", logger);

    EXPECT_TRUE(strategy.attempt(clip, {}));
    ASSERT_EQ(runner.calls.size(), 2u);
    EXPECT_TRUE(contains(runner.calls[0], "copy"));
    EXPECT_TRUE(contains(runner.calls[1], "libx264"));
    EXPECT_EQ(read_file(clip), "re-encoded");

    const auto entries = list_dir(dir.path());
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].filename(), "clip.mp4");
}

TEST(VideoStrategyTest, EmptyCopyOutputEscalates) {
    TempDir dir;
    const fs::path clip = dir / "clip.mkv";
    write_file(clip, "original");

    FakeProcessRunner runner;
    runner.push(0);
    runner.push(0, "re-encoded");
    Logger logger;
    VideoStrategy strategy(runner, "ffmpeg", logger);

    EXPECT_TRUE(strategy.attempt(clip, {}));
    EXPECT_EQ(runner.calls.size(), 2u);
    EXPECT_EQ(read_file(clip), "re-encoded");
}

TEST(VideoStrategyTest, BothPassesFailingLeavesOriginal) {
    TempDir dir;
    const fs::path clip = dir / "clip.avi";
    write_file(clip, "original");

    FakeProcessRunner runner;
    runner.push(1);
    runner.push_timeout();
    runner.push(0, "never reached");
    Logger logger;
    VideoStrategy strategy(runner, "ffmpeg", logger);

    EXPECT_FALSE(strategy.attempt(clip, {}));
    EXPECT_EQ(runner.calls.size(), 2u);
    EXPECT_EQ(read_file(clip), "original");
    EXPECT_EQ(list_dir(dir.path()).size(), 1u);
}

TEST(VideoStrategyTest, SignalledCopyPassDoesNotEscalate) {
    TempDir dir;
    const fs::path clip = dir / "clip.mp4";
    write_file(clip, "original");

    FakeProcessRunner runner;
    runner.push_signal(SIGINT);
    runner.push(0, "never reached");
    Logger logger;
    VideoStrategy strategy(runner, "ffmpeg", logger);

    EXPECT_FALSE(strategy.attempt(clip, {}));
    ASSERT_EQ(runner.calls.size(), 1u);
    EXPECT_TRUE(contains(runner.calls[0], "copy"));
    EXPECT_EQ(read_file(clip), "original");
    EXPECT_EQ(list_dir(dir.path()).size(), 1u);
}

TEST(VideoStrategyTest, InterruptDuringCopyPassDoesNotEscalate) {
    TempDir dir;
    const fs::path clip = dir / "clip.mkv";
    write_file(clip, "original");

    std::atomic<bool> interrupted{false};
    FakeProcessRunner runner;
    runner.push(1);
    runner.push(0, "never reached");
    runner.on_run = [&interrupted] { interrupted = true; };
    Logger logger;
    VideoStrategy strategy(runner, "ffmpeg", logger);

    CleanOptions options;
    options.interrupted = &interrupted;
    EXPECT_FALSE(strategy.attempt(clip, options));
    EXPECT_EQ(runner.calls.size(), 1u);
    EXPECT_EQ(read_file(clip), "original");
}

TEST(VideoStrategyTest, ReencodeOptionSkipsCopyPass) {
    TempDir dir;
    const fs::path clip = dir / "clip.mov";
    write_file(clip, "original");

    FakeProcessRunner runner;
    runner.push(0, "re-encoded");
    Logger logger;
    VideoStrategy strategy(runner, "ffmpeg", logger);

    CleanOptions options;
    options.reencode_videos = true;
    EXPECT_TRUE(strategy.attempt(clip, options));
    ASSERT_EQ(runner.calls.size(), 1u);
    EXPECT_TRUE(contains(runner.calls[0], "libx264"));
}

TEST(VideoStrategyTest, OutputIsSiblingTempFile) {
    TempDir dir;
    const fs::path clip = dir / "clip.webm";
    write_file(clip, "original");

    FakeProcessRunner runner;
    runner.push(1);
    runner.push(1);
    Logger logger;
    VideoStrategy strategy(runner, "ffmpeg", logger);
    EXPECT_FALSE(strategy.attempt(clip, {}));

    ASSERT_EQ(runner.calls.size(), 2u);
    for (const auto& call : runner.calls) {
        const fs::path out = call.back();
        EXPECT_EQ(out.parent_path(), clip.parent_path());
        EXPECT_NE(out, clip);
        EXPECT_EQ(out.extension(), ".webm");
    }
    EXPECT_NE(runner.calls[0].back(), runner.calls[1].back());
}

} // namespace
} // namespace metawipe

#ifndef METAWIPE_VIDEO_STRATEGY_HPP
#define METAWIPE_VIDEO_STRATEGY_HPP

#include "strategy.hpp"
#include "process_runner.hpp"
#include <array>
#include <chrono>
#include <string>
#include <vector>

namespace metawipe {

class Logger;

/**
 * @brief Re-muxes (or re-encodes) a video through ffmpeg with all metadata dropped.
 *
 * Runs as a bounded two-step state machine: TryCopy -> TryReencode -> Done.
 * The stream-copy pass is fast and lossless. If it fails (non-zero exit or
 * no output), one full re-encode pass follows and nothing is retried after
 * it. With CleanOptions::reencode_videos the copy pass is skipped. A copy
 * pass killed by a signal, or an interrupt raised meanwhile, ends the
 * attempt without escalating.
 */
class VideoStrategy final : public ICleaningStrategy {
public:
    static constexpr std::chrono::seconds kTimeout{600};

    enum class Pass { Copy, Reencode };

    VideoStrategy(IProcessRunner& runner, std::string command, Logger& logger)
        : runner_(runner), command_(std::move(command)), logger_(logger) {}

    [[nodiscard]] std::string_view get_name() const noexcept override { return "ffmpeg"; }

    [[nodiscard]] CleanMethod method() const noexcept override { return CleanMethod::ExternalTool; }

    [[nodiscard]] std::span<const FileCategory> get_supported_categories() const noexcept override {
        static constexpr std::array<FileCategory, 1> kCategories = {FileCategory::Video};
        return {kCategories.data(), kCategories.size()};
    }

    bool attempt(const std::filesystem::path& path, const CleanOptions& options) override;

    /// @return Full ffmpeg command line for one pass.
    [[nodiscard]] static std::vector<std::string> build_arguments(Pass pass,
                                                                  const std::string& command,
                                                                  const std::filesystem::path& input,
                                                                  const std::filesystem::path& output);

private:
    enum class PassResult { Cleaned, Failed, Aborted };

    PassResult run_pass(Pass pass, const std::filesystem::path& input, const std::filesystem::path& output);

    IProcessRunner& runner_;
    std::string command_;
    Logger& logger_;
};

} // namespace metawipe

#endif // METAWIPE_VIDEO_STRATEGY_HPP

#ifndef METAWIPE_AUDIO_TAG_STRATEGY_HPP
#define METAWIPE_AUDIO_TAG_STRATEGY_HPP

#include "strategy.hpp"
#include <array>

namespace metawipe {

class Logger;

/**
 * @brief Removes every tag from an audio container through TagLib.
 *
 * Per-format handling: ID3v1/ID3v2/APE for MPEG, Xiph comments and
 * pictures for FLAC/Vorbis/Opus, all atoms for MP4, RIFF INFO and ID3 for
 * WAV, ID3 for AIFF. Anything else TagLib can open falls back to clearing
 * its generic property map.
 *
 * TagLib saves in place, so the work happens on a sibling copy that is
 * then swapped in.
 */
class AudioTagStrategy final : public ICleaningStrategy {
public:
    explicit AudioTagStrategy(Logger& logger) : logger_(logger) {}

    [[nodiscard]] std::string_view get_name() const noexcept override { return "audio-lib"; }

    [[nodiscard]] CleanMethod method() const noexcept override { return CleanMethod::Library; }

    [[nodiscard]] std::span<const FileCategory> get_supported_categories() const noexcept override {
        static constexpr std::array<FileCategory, 1> kCategories = {FileCategory::Audio};
        return {kCategories.data(), kCategories.size()};
    }

    bool attempt(const std::filesystem::path& path, const CleanOptions& options) override;

private:
    Logger& logger_;
};

} // namespace metawipe

#endif // METAWIPE_AUDIO_TAG_STRATEGY_HPP

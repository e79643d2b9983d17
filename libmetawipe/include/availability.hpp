#ifndef METAWIPE_AVAILABILITY_HPP
#define METAWIPE_AVAILABILITY_HPP

#include <filesystem>
#include <map>
#include <string>
#include <string_view>

namespace metawipe {

/// Collaborator names used as availability keys.
namespace deps {
    inline constexpr std::string_view kExiftool   = "exiftool";
    inline constexpr std::string_view kFfmpeg     = "ffmpeg";
    inline constexpr std::string_view kImageLib   = "image-lib";
    inline constexpr std::string_view kPdfLib     = "pdf-lib";
    inline constexpr std::string_view kOfficeLib  = "office-lib";
    inline constexpr std::string_view kAudioLib   = "audio-lib";
}

/**
 * @brief Snapshot of which collaborators can be used for this run.
 *
 * Taken once at Init and read-only afterwards. The dispatch policy is built
 * from it; a collaborator appearing or disappearing mid-run is not noticed.
 */
class DependencyAvailability {
public:
    /**
     * @brief Probe the machine.
     *
     * External binaries are looked up in PATH (or at the given explicit
     * location). Linked libraries are always available.
     */
    static DependencyAvailability probe(const std::string& exiftool_command,
                                        const std::string& ffmpeg_command);

    /// Build an empty snapshot (everything unavailable). Used by tests.
    DependencyAvailability() = default;

    void set(std::string_view name, bool available, std::filesystem::path location = {});

    [[nodiscard]] bool has(std::string_view name) const;

    /// @return Resolved binary location, or the bare name if none was recorded.
    [[nodiscard]] std::string command_for(std::string_view name) const;

    [[nodiscard]] const std::map<std::string, bool, std::less<>>& entries() const noexcept { return available_; }

    /// @return Install hint for a missing collaborator, empty if none is known.
    [[nodiscard]] static std::string_view install_hint(std::string_view name) noexcept;

private:
    std::map<std::string, bool, std::less<>> available_;
    std::map<std::string, std::filesystem::path, std::less<>> locations_;
};

} // namespace metawipe

#endif // METAWIPE_AVAILABILITY_HPP

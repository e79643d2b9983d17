#include "../../include/availability.hpp"
#include "../../include/process_runner.hpp"

namespace metawipe {

DependencyAvailability DependencyAvailability::probe(const std::string& exiftool_command,
                                                     const std::string& ffmpeg_command) {
    DependencyAvailability availability;

    const auto exiftool = find_executable(exiftool_command);
    availability.set(deps::kExiftool, exiftool.has_value(), exiftool.value_or(std::filesystem::path{}));

    const auto ffmpeg = find_executable(ffmpeg_command);
    availability.set(deps::kFfmpeg, ffmpeg.has_value(), ffmpeg.value_or(std::filesystem::path{}));

    // linked in at build time
    availability.set(deps::kImageLib, true);
    availability.set(deps::kPdfLib, true);
    availability.set(deps::kOfficeLib, true);
    availability.set(deps::kAudioLib, true);

    return availability;
}

void DependencyAvailability::set(const std::string_view name, const bool available, std::filesystem::path location) {
    available_[std::string(name)] = available;
    if (!location.empty()) {
        locations_[std::string(name)] = std::move(location);
    }
}

bool DependencyAvailability::has(const std::string_view name) const {
    const auto it = available_.find(name);
    return it != available_.end() && it->second;
}

std::string DependencyAvailability::command_for(const std::string_view name) const {
    if (const auto it = locations_.find(name); it != locations_.end()) {
        return it->second.string();
    }
    return std::string(name);
}

std::string_view DependencyAvailability::install_hint(const std::string_view name) noexcept {
    if (name == deps::kExiftool) {
        return "apt install libimage-exiftool-perl | brew install exiftool | https://exiftool.org";
    }
    if (name == deps::kFfmpeg) {
        return "apt install ffmpeg | brew install ffmpeg | https://ffmpeg.org";
    }
    return {};
}

} // namespace metawipe

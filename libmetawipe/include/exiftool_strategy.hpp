#ifndef METAWIPE_EXIFTOOL_STRATEGY_HPP
#define METAWIPE_EXIFTOOL_STRATEGY_HPP

#include "strategy.hpp"
#include "process_runner.hpp"
#include <array>
#include <chrono>
#include <string>

namespace metawipe {

class Logger;

/**
 * @brief General-purpose external stripper ("exiftool -all= -overwrite_original").
 *
 * Accepts every category. The tool rewrites the file itself; any
 * "<name>_original" artifact it leaves beside the file is deleted.
 */
class ExiftoolStrategy final : public ICleaningStrategy {
public:
    static constexpr std::chrono::seconds kTimeout{300};

    ExiftoolStrategy(IProcessRunner& runner, std::string command, Logger& logger)
        : runner_(runner), command_(std::move(command)), logger_(logger) {}

    [[nodiscard]] std::string_view get_name() const noexcept override { return "exiftool"; }

    [[nodiscard]] CleanMethod method() const noexcept override { return CleanMethod::ExternalTool; }

    [[nodiscard]] std::span<const FileCategory> get_supported_categories() const noexcept override {
        return {kAllCategories.data(), kAllCategories.size()};
    }

    bool attempt(const std::filesystem::path& path, const CleanOptions& options) override;

private:
    IProcessRunner& runner_;
    std::string command_;
    Logger& logger_;
};

} // namespace metawipe

#endif // METAWIPE_EXIFTOOL_STRATEGY_HPP

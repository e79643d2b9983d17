#include "../../include/exiftool_strategy.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"

namespace metawipe {

namespace fs = std::filesystem;

static const char* strategy_tag() {
    return "exiftool";
}

bool ExiftoolStrategy::attempt(const fs::path& path, const CleanOptions& /*options*/) {
    const std::vector<std::string> argv = {command_, "-all=", "-overwrite_original", path.string()};

    logger_.debug("Running exiftool on " + path.string(), strategy_tag());
    const ProcessResult result = runner_.run(argv, kTimeout);

    // exiftool may leave "<file>_original" even with -overwrite_original
    fs::path artifact = path;
    artifact += "_original";
    remove_if_exists(artifact, logger_, strategy_tag());

    if (result.launch_failed) {
        logger_.error("Cannot launch " + command_ + " for " + path.string(), strategy_tag());
        return false;
    }
    if (result.timed_out) {
        logger_.error("exiftool timed out after " + std::to_string(kTimeout.count()) + "s: " + path.string(),
                      strategy_tag());
        return false;
    }
    if (result.signaled) {
        logger_.warning("exiftool killed by signal " + std::to_string(result.term_signal) + ": " + path.string(),
                        strategy_tag());
        return false;
    }
    if (!result.stderr_output.empty()) {
        logger_.debug("exiftool stderr: " + result.stderr_output, strategy_tag());
    }
    if (result.exit_code != 0) {
        logger_.warning("exiftool exited with " + std::to_string(result.exit_code) + " for " + path.string(),
                        strategy_tag());
        return false;
    }
    return true;
}

} // namespace metawipe

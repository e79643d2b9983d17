#include "../../include/video_strategy.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"

namespace metawipe {

namespace fs = std::filesystem;

static const char* strategy_tag() {
    return "video";
}

static const char* pass_name(const VideoStrategy::Pass pass) {
    return pass == VideoStrategy::Pass::Copy ? "stream-copy" : "re-encode";
}

std::vector<std::string> VideoStrategy::build_arguments(const Pass pass,
                                                        const std::string& command,
                                                        const fs::path& input,
                                                        const fs::path& output) {
    std::vector<std::string> args = {command, "-hide_banner", "-loglevel", "error", "-i", input.string()};
    if (pass == Pass::Copy) {
        args.insert(args.end(), {"-map", "0", "-c", "copy", "-map_metadata", "-1"});
    } else {
        args.insert(args.end(), {"-map_metadata", "-1",
                                 "-c:v", "libx264", "-crf", "23",
                                 "-c:a", "aac", "-b:a", "192k"});
    }
    args.insert(args.end(), {"-movflags", "+faststart", "-y", output.string()});
    return args;
}

VideoStrategy::PassResult VideoStrategy::run_pass(const Pass pass, const fs::path& input, const fs::path& output) {
    logger_.debug(std::string("ffmpeg ") + pass_name(pass) + " pass: " + input.string(), strategy_tag());

    const ProcessResult result = runner_.run(build_arguments(pass, command_, input, output), kTimeout);

    if (result.launch_failed) {
        logger_.error("Cannot launch " + command_, strategy_tag());
        return PassResult::Failed;
    }
    if (result.timed_out) {
        logger_.warning(std::string("ffmpeg ") + pass_name(pass) + " pass timed out after " +
                        std::to_string(kTimeout.count()) + "s: " + input.string(), strategy_tag());
        return PassResult::Failed;
    }
    if (result.signaled) {
        logger_.warning(std::string("ffmpeg ") + pass_name(pass) + " pass killed by signal " +
                        std::to_string(result.term_signal) + ": " + input.string(), strategy_tag());
        return PassResult::Aborted;
    }
    if (!result.stderr_output.empty()) {
        logger_.debug("ffmpeg stderr: " + result.stderr_output, strategy_tag());
    }
    if (result.exit_code != 0) {
        logger_.warning(std::string("ffmpeg ") + pass_name(pass) + " pass exited with " +
                        std::to_string(result.exit_code) + ": " + input.string(), strategy_tag());
        return PassResult::Failed;
    }

    std::error_code ec;
    if (!fs::exists(output, ec) || fs::file_size(output, ec) == 0 || ec) {
        logger_.warning(std::string("ffmpeg ") + pass_name(pass) + " pass produced no output: " +
                        input.string(), strategy_tag());
        return PassResult::Failed;
    }
    return PassResult::Cleaned;
}

bool VideoStrategy::attempt(const fs::path& path, const CleanOptions& options) {
    enum class State { TryCopy, TryReencode, Done };

    State state = options.reencode_videos ? State::TryReencode : State::TryCopy;
    bool cleaned = false;

    while (state != State::Done) {
        const Pass pass = (state == State::TryCopy) ? Pass::Copy : Pass::Reencode;

        // a fresh temp per pass; the guard removes it whatever happens
        TempFile temp(path, "clean", logger_);
        const PassResult result = run_pass(pass, path, temp.path());
        if (result == PassResult::Cleaned) {
            cleaned = temp.commit();
            state = State::Done;
        } else if (state == State::TryCopy && result == PassResult::Failed && !options.interrupt_requested()) {
            logger_.info("Stream copy failed, escalating to re-encode: " + path.string(), strategy_tag());
            state = State::TryReencode;
        } else {
            if (state == State::TryCopy) {
                logger_.info("Not escalating to re-encode after an interrupted pass: " + path.string(),
                             strategy_tag());
            }
            state = State::Done;
        }
    }
    return cleaned;
}

} // namespace metawipe

#include "../../include/dispatch_policy.hpp"
#include "../../include/audio_tag_strategy.hpp"
#include "../../include/exiftool_strategy.hpp"
#include "../../include/image_library_strategy.hpp"
#include "../../include/logger.hpp"
#include "../../include/ooxml_strategy.hpp"
#include "../../include/pdf_strategy.hpp"
#include "../../include/timestamp_normalizer.hpp"
#include "../../include/video_strategy.hpp"
#include <algorithm>

namespace metawipe {

namespace fs = std::filesystem;

static const char* dispatch_tag() {
    return "dispatch";
}

static bool supports(const ICleaningStrategy& strategy, const FileCategory category) {
    const auto cats = strategy.get_supported_categories();
    return std::find(cats.begin(), cats.end(), category) != cats.end();
}

DispatchPolicy DispatchPolicy::build_default(const DependencyAvailability& availability,
                                             IProcessRunner& runner,
                                             Logger& logger) {
    DispatchPolicy policy(logger);

    if (availability.has(deps::kExiftool)) {
        policy.set_general(std::make_unique<ExiftoolStrategy>(runner, availability.command_for(deps::kExiftool), logger));
    }
    if (availability.has(deps::kImageLib)) {
        policy.add_rule(std::make_unique<ImageLibraryStrategy>(logger), RuleMode::FallbackOnly);
    }
    if (availability.has(deps::kFfmpeg)) {
        policy.add_rule(std::make_unique<VideoStrategy>(runner, availability.command_for(deps::kFfmpeg), logger),
                        RuleMode::Always);
    }
    if (availability.has(deps::kPdfLib)) {
        policy.add_rule(std::make_unique<PdfStrategy>(logger), RuleMode::FallbackOnly);
    }
    if (availability.has(deps::kOfficeLib)) {
        policy.add_rule(std::make_unique<OoxmlStrategy>(logger), RuleMode::FallbackOnly);
    }
    if (availability.has(deps::kAudioLib)) {
        policy.add_rule(std::make_unique<AudioTagStrategy>(logger), RuleMode::FallbackOnly);
    }
    return policy;
}

void DispatchPolicy::add_rule(std::unique_ptr<ICleaningStrategy> strategy, const RuleMode mode) {
    if (strategy) {
        rules_.push_back(DispatchRule{std::move(strategy), mode});
    }
}

bool DispatchPolicy::run_strategy(ICleaningStrategy& strategy, const fs::path& path, const CleanOptions& options) {
    try {
        const bool ok = strategy.attempt(path, options);
        logger_.debug(std::string(strategy.get_name()) + (ok ? " succeeded on " : " failed on ") + path.string(),
                      dispatch_tag());
        return ok;
    } catch (const std::exception& e) {
        logger_.error(std::string(strategy.get_name()) + " threw on " + path.string() + ": " + e.what(),
                      dispatch_tag());
        return false;
    }
}

CleanOutcome DispatchPolicy::dispatch(const fs::path& path, const CleanOptions& options, const bool normalize_time) {
    CleanOutcome outcome;
    outcome.category = classify(path);
    bool attempted = false;

    auto mark_success = [&outcome](const ICleaningStrategy& s) {
        outcome.success = true;
        outcome.method = s.method();
        outcome.strategy = std::string(s.get_name());
    };

    bool stopped = false;
    auto stop_requested = [&]() {
        if (!stopped && options.interrupt_requested()) {
            logger_.info("Interrupted, no further strategies for " + path.string(), dispatch_tag());
            stopped = true;
        }
        return stopped;
    };

    if (general_ && supports(*general_, outcome.category) && !stop_requested()) {
        attempted = true;
        if (run_strategy(*general_, path, options)) {
            mark_success(*general_);
        }
    }

    for (const auto& rule : rules_) {
        if (!supports(*rule.strategy, outcome.category)) continue;
        if (rule.mode == RuleMode::FallbackOnly && outcome.success) continue;
        if (stop_requested()) break;

        attempted = true;
        if (run_strategy(*rule.strategy, path, options)) {
            mark_success(*rule.strategy);
        }
    }

    if (!outcome.success) {
        outcome.method = attempted ? CleanMethod::None : CleanMethod::NoneAvailable;
        outcome.strategy.clear();
        if (stopped) {
            return outcome;
        }
        if (!attempted) {
            logger_.info("No strategy for " + std::string(category_to_string(outcome.category)) + " file: " +
                         path.string(), dispatch_tag());
        } else {
            logger_.warning("All strategies failed for " + path.string(), dispatch_tag());
        }
        return outcome;
    }

    if (normalize_time && !stopped && !normalize_timestamps(path, logger_)) {
        logger_.info("Timestamps kept for " + path.string() + ", file still counted as cleaned", dispatch_tag());
    }
    return outcome;
}

} // namespace metawipe

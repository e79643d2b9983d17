/**
 * @file dispatch_policy.hpp
 * @brief Defines the ordered strategy table that decides how each file is cleaned.
 */

#ifndef METAWIPE_DISPATCH_POLICY_HPP
#define METAWIPE_DISPATCH_POLICY_HPP

#include "availability.hpp"
#include "clean_outcome.hpp"
#include "process_runner.hpp"
#include "strategy.hpp"
#include <filesystem>
#include <memory>
#include <string_view>
#include <vector>

namespace metawipe {

class Logger;

/**
 * @brief When a category strategy runs relative to earlier successes.
 */
enum class RuleMode {
    FallbackOnly, ///< Only if nothing before it succeeded
    Always        ///< Regardless of earlier outcomes (video)
};

/**
 * @brief One entry of the dispatch table.
 */
struct DispatchRule {
    std::unique_ptr<ICleaningStrategy> strategy;
    RuleMode mode = RuleMode::FallbackOnly;
};

/**
 * @brief Selects and sequences cleaning strategies for a file.
 *
 * @details The table is built once from a DependencyAvailability snapshot
 * and never re-checked. For each file:
 *  1. the general-purpose strategy (if any) runs first, whatever the category;
 *  2. each rule whose strategy supports the file's category runs in table
 *     order; FallbackOnly rules are skipped once something succeeded,
 *     Always rules run anyway and, when they succeed, are the recorded method;
 *  3. no success: method None if something was attempted, NoneAvailable if
 *     nothing applied at all;
 *  4. on success with normalization requested, timestamps are reset to the
 *     epoch; a failure there is logged and does not change the outcome.
 *
 * An interrupt raised in CleanOptions stops the sequence before the next
 * strategy; the outcome then reflects only what already ran.
 *
 * The policy owns its strategies.
 */
class DispatchPolicy {
public:
    explicit DispatchPolicy(Logger& logger) : logger_(logger) {}

    /**
     * @brief Build the standard table from what is available.
     *
     * exiftool is the general strategy. Then image (fallback), video
     * (always), PDF, OOXML and audio (fallback), each only if its
     * collaborator is present.
     */
    static DispatchPolicy build_default(const DependencyAvailability& availability,
                                        IProcessRunner& runner,
                                        Logger& logger);

    void set_general(std::unique_ptr<ICleaningStrategy> strategy) { general_ = std::move(strategy); }

    void add_rule(std::unique_ptr<ICleaningStrategy> strategy, RuleMode mode);

    /**
     * @brief Clean one file.
     * @param path File to clean.
     * @param options Options forwarded to strategies.
     * @param normalize_time Reset timestamps after a successful clean.
     */
    CleanOutcome dispatch(const std::filesystem::path& path, const CleanOptions& options, bool normalize_time);

    [[nodiscard]] const ICleaningStrategy* general() const noexcept { return general_.get(); }

    [[nodiscard]] const std::vector<DispatchRule>& rules() const noexcept { return rules_; }

private:
    bool run_strategy(ICleaningStrategy& strategy, const std::filesystem::path& path, const CleanOptions& options);

    Logger& logger_;
    std::unique_ptr<ICleaningStrategy> general_;
    std::vector<DispatchRule> rules_;
};

} // namespace metawipe

#endif // METAWIPE_DISPATCH_POLICY_HPP

#include "../../include/batch_statistics.hpp"

namespace metawipe {

void BatchStatistics::record(const CleanOutcome& outcome) {
    ++by_category[outcome.category];
    ++by_method_kind[outcome.method];
    if (outcome.success) {
        ++cleaned;
        ++by_method[outcome.strategy.empty() ? std::string(method_to_string(outcome.method)) : outcome.strategy];
    } else {
        ++failed;
    }
}

void BatchStatistics::mark_remaining_skipped() {
    const std::size_t accounted = cleaned + failed + skipped;
    if (total_files > accounted) {
        skipped += total_files - accounted;
    }
}

} // namespace metawipe

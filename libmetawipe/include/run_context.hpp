#ifndef METAWIPE_RUN_CONTEXT_HPP
#define METAWIPE_RUN_CONTEXT_HPP

#include "event_bus.hpp"
#include "logger.hpp"

namespace metawipe {

/**
 * @brief Per-run services shared by every component.
 *
 * Built once when a run starts and passed by reference to the walker, the
 * backup manager, the strategies and the orchestrator. It owns the logger
 * (with whatever sinks the front end installed) and the event bus used for
 * progress reporting. Components keep a reference, so the context must
 * outlive them.
 */
struct RunContext {
    Logger logger;
    EventBus events;

    RunContext() = default;
    RunContext(const RunContext&) = delete;
    RunContext& operator=(const RunContext&) = delete;
};

} // namespace metawipe

#endif // METAWIPE_RUN_CONTEXT_HPP

#ifndef METAWIPE_PROCESS_RUNNER_HPP
#define METAWIPE_PROCESS_RUNNER_HPP

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace metawipe {

/**
 * @brief Outcome of one external process invocation.
 */
struct ProcessResult {
    int exit_code = -1;         ///< Child exit status, -1 if it never exited normally
    bool timed_out = false;     ///< True if the child was killed after the timeout
    bool launch_failed = false; ///< True if the binary could not be started
    bool signaled = false;      ///< True if the child was terminated by a signal it did not handle
    int term_signal = 0;        ///< Terminating signal when signaled is set
    std::string stderr_output;  ///< Captured standard error (truncated)

    [[nodiscard]] bool ok() const noexcept {
        return !launch_failed && !timed_out && exit_code == 0;
    }
};

/**
 * @brief Runs an external collaborator binary and waits for it.
 *
 * Implementations never throw on collaborator failure; every failure mode
 * (missing binary, non-zero exit, timeout, death by signal) is reported in
 * ProcessResult.
 */
class IProcessRunner {
public:
    virtual ~IProcessRunner() = default;

    /**
     * @brief Run argv[0] with the given arguments, blocking for at most @p timeout.
     * @param argv Program followed by its arguments. Not passed through a shell.
     * @param timeout Upper bound after which the child is killed.
     */
    virtual ProcessResult run(const std::vector<std::string>& argv,
                              std::chrono::seconds timeout) = 0;
};

/**
 * @brief fork/exec based runner. stdout is discarded, stderr is captured.
 */
class PosixProcessRunner final : public IProcessRunner {
public:
    ProcessResult run(const std::vector<std::string>& argv,
                      std::chrono::seconds timeout) override;
};

/**
 * @brief Looks @p name up in PATH.
 *
 * A name containing a directory separator is checked as given.
 * @return Absolute path of the first executable match, or std::nullopt.
 */
std::optional<std::filesystem::path> find_executable(std::string_view name);

} // namespace metawipe

#endif // METAWIPE_PROCESS_RUNNER_HPP

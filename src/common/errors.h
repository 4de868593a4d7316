#ifndef DYNAMICNEST_SRC_COMMON_ERRORS_H_
#define DYNAMICNEST_SRC_COMMON_ERRORS_H_

#include <stdexcept>
#include <string>

namespace DynamicNest {

/**
 * Base class of every error raised by the dynamic nested sampling pipeline.
 * Callers that only need to know "the run failed" catch this.
 */
class DynamicNestError : public std::runtime_error {
public:
    explicit DynamicNestError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * Invalid user input (goal outside [0,1], non-positive live point counts,
 * incompatible settings). Always raised before the first sampler call.
 */
class ConfigurationError : public DynamicNestError {
public:
    explicit ConfigurationError(const std::string& what) : DynamicNestError(what) {}
};

/**
 * A sampler invocation exited abnormally, timed out or produced no output.
 * thread_index is -1 for the initial exploratory run.
 */
class ExternalRunFailure : public DynamicNestError {
public:
    ExternalRunFailure(const std::string& stage, int thread_index, int exit_status,
                       const std::string& detail)
        : DynamicNestError(Format(stage, thread_index, exit_status, detail)),
          stage_(stage),
          thread_index_(thread_index),
          exit_status_(exit_status) {}

    const std::string& stage() const { return stage_; }
    int thread_index() const { return thread_index_; }
    int exit_status() const { return exit_status_; }

private:
    static std::string Format(const std::string& stage, int thread_index, int exit_status,
                              const std::string& detail) {
        std::string msg = "[" + stage + "] ";
        if (thread_index >= 0) {
            msg += "thread " + std::to_string(thread_index) + ": ";
        } else {
            msg += "initial run: ";
        }
        msg += detail;
        if (exit_status != 0) {
            msg += " (exit status " + std::to_string(exit_status) + ")";
        }
        return msg;
    }

    std::string stage_;
    int thread_index_;
    int exit_status_;
};

/**
 * Sampler output that violates the run invariants (likelihood order, live
 * point counts, dimensionality, degenerate duplicates).
 */
class MalformedOutputError : public DynamicNestError {
public:
    MalformedOutputError(int thread_index, const std::string& what)
        : DynamicNestError(thread_index >= 0
              ? "thread " + std::to_string(thread_index) + ": " + what
              : what),
          thread_index_(thread_index) {}

    int thread_index() const { return thread_index_; }

private:
    int thread_index_;
};

/**
 * The caller cancelled the dynamic run before every thread finished.
 */
class CancelledError : public DynamicNestError {
public:
    explicit CancelledError(const std::string& what) : DynamicNestError(what) {}
};

} // namespace DynamicNest

#endif // DYNAMICNEST_SRC_COMMON_ERRORS_H_

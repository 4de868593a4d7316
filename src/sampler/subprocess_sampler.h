#ifndef DYNAMICNEST_SRC_SAMPLER_SUBPROCESS_SAMPLER_H_
#define DYNAMICNEST_SRC_SAMPLER_SUBPROCESS_SAMPLER_H_

#include <cstdint>
#include <string>
#include <vector>

#include "sampler.h"

namespace DynamicNest {

struct SubprocessSamplerOptions {
    // Compiled sampler; invoked as `<mpi_prefix...> <executable> <ini file>`.
    std::string executable;
    // e.g. "mpirun -np 4"; split on whitespace. Empty runs the executable directly.
    std::string mpi_prefix;
    // 0 disables the timeout.
    int timeout_seconds = 0;
    int poll_interval_ms = 50;
};

/**
 * Runs an external nested sampler executable once per invocation.
 *
 * Each call writes "<base_dir>/<file_root>.ini", runs the executable with
 * stdout/stderr captured in "<base_dir>/<file_root>.log" and parses
 * "<base_dir>/<file_root>_dead-birth.txt". The thread thresholds travel as
 * the `logl_start` / `logl_stop` ini keys.
 */
class SubprocessSampler : public ISampler {
public:
    // Throws ConfigurationError if the executable does not exist.
    explicit SubprocessSampler(SubprocessSamplerOptions options);

    RunRecord Run(const SamplerConfig& config, const CancellationToken* cancel) override;

    // PolyChord ini rendering of the invocation settings.
    std::string IniString(const SamplerConfig& config) const;

    std::vector<std::string> CommandLine(const std::string& ini_path) const;

private:
    // Returns the child's exit status; throws on timeout or cancellation.
    int WaitForChild(int pid, const SamplerConfig& config, const CancellationToken* cancel) const;

    SubprocessSamplerOptions options_;
};

std::string FormatSetting(bool value);
std::string FormatSetting(int value);
std::string FormatSetting(int64_t value);
std::string FormatSetting(double value);
std::string FormatSetting(const char* value);
std::string FormatSetting(const std::string& value);
std::string FormatSetting(const std::vector<double>& values);

} // namespace DynamicNest

#endif // DYNAMICNEST_SRC_SAMPLER_SUBPROCESS_SAMPLER_H_

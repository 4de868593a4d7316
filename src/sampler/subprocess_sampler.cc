#include "subprocess_sampler.h"

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>
#include <utility>

#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <glog/logging.h>
#include "absl/strings/str_format.h"
#include "absl/strings/str_join.h"
#include "absl/strings/str_split.h"

#include "common/errors.h"
#include "common/scoped_fd.h"
#include "run/run_io.h"

namespace DynamicNest {

namespace fs = std::filesystem;

namespace {

constexpr int kTerminateGraceMs = 2000;

int DecodeStatus(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

// SIGTERM, then SIGKILL if the child ignores it. Always reaps.
void TerminateChild(int pid) {
    ::kill(pid, SIGTERM);
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(kTerminateGraceMs);
    int status = 0;
    while (std::chrono::steady_clock::now() < deadline) {
        if (::waitpid(pid, &status, WNOHANG) == pid) {
            return;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    ::kill(pid, SIGKILL);
    ::waitpid(pid, &status, 0);
}

} // namespace

std::string FormatSetting(bool value) { return value ? "T" : "F"; }
std::string FormatSetting(int value) { return std::to_string(value); }
std::string FormatSetting(int64_t value) { return std::to_string(value); }
std::string FormatSetting(double value) { return absl::StrFormat("%.17g", value); }
std::string FormatSetting(const char* value) { return std::string(value); }
std::string FormatSetting(const std::string& value) { return value; }

std::string FormatSetting(const std::vector<double>& values) {
    return absl::StrJoin(values, " ", [](std::string* out, double v) {
        out->append(FormatSetting(v));
    });
}

SubprocessSampler::SubprocessSampler(SubprocessSamplerOptions options)
    : options_(std::move(options)) {
    if (options_.executable.empty() || !fs::exists(options_.executable)) {
        throw ConfigurationError("Sampler executable not found: '" + options_.executable + "'");
    }
    if (options_.poll_interval_ms <= 0) {
        options_.poll_interval_ms = 50;
    }
}

std::string SubprocessSampler::IniString(const SamplerConfig& config) const {
    std::ostringstream ini;
    ini << "nlive = " << FormatSetting(config.nlive) << '\n'
        << "num_repeats = " << FormatSetting(config.num_repeats) << '\n'
        << "seed = " << FormatSetting(config.seed) << '\n'
        << "base_dir = " << FormatSetting(config.base_dir) << '\n'
        << "file_root = " << FormatSetting(config.file_root) << '\n'
        << "max_ndead = " << FormatSetting(config.max_ndead) << '\n'
        << "precision_criterion = " << FormatSetting(config.precision_criterion) << '\n'
        << "write_dead = " << FormatSetting(config.write_dead) << '\n'
        << "read_resume = " << FormatSetting(config.read_resume) << '\n'
        << "write_resume = " << FormatSetting(false) << '\n'
        << "equals = " << FormatSetting(config.equals) << '\n'
        << "posteriors = " << FormatSetting(config.posteriors) << '\n'
        << "feedback = " << FormatSetting(-1) << '\n';
    if (config.start_threshold) {
        ini << "logl_start = " << FormatSetting(*config.start_threshold) << '\n';
    }
    if (config.stop_threshold) {
        ini << "logl_stop = " << FormatSetting(*config.stop_threshold) << '\n';
    }
    if (!config.prior_block.empty()) {
        ini << config.prior_block;
        if (config.prior_block.back() != '\n') ini << '\n';
    }
    if (!config.derived_block.empty()) {
        ini << config.derived_block;
        if (config.derived_block.back() != '\n') ini << '\n';
    }
    return ini.str();
}

std::vector<std::string> SubprocessSampler::CommandLine(const std::string& ini_path) const {
    std::vector<std::string> argv = absl::StrSplit(options_.mpi_prefix, absl::ByAnyChar(" \t"),
                                                   absl::SkipEmpty());
    argv.push_back(options_.executable);
    argv.push_back(ini_path);
    return argv;
}

int SubprocessSampler::WaitForChild(int pid, const SamplerConfig& config,
                                    const CancellationToken* cancel) const {
    const int index = ThreadIndex(config.thread_id);
    auto started = std::chrono::steady_clock::now();
    while (true) {
        int status = 0;
        pid_t done = ::waitpid(pid, &status, WNOHANG);
        if (done == pid) {
            return DecodeStatus(status);
        }
        if (done < 0 && errno != EINTR) {
            throw ExternalRunFailure("subprocess", index, -1,
                std::string("waitpid failed: ") + strerror(errno));
        }
        if (cancel != nullptr && cancel->IsCancelled()) {
            TerminateChild(pid);
            throw CancelledError("sampler process for " + config.file_root + " cancelled");
        }
        if (options_.timeout_seconds > 0 &&
            std::chrono::steady_clock::now() - started > std::chrono::seconds(options_.timeout_seconds)) {
            TerminateChild(pid);
            throw ExternalRunFailure("subprocess", index, -1,
                "timed out after " + std::to_string(options_.timeout_seconds) + "s");
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(options_.poll_interval_ms));
    }
}

RunRecord SubprocessSampler::Run(const SamplerConfig& config, const CancellationToken* cancel) {
    const int index = ThreadIndex(config.thread_id);
    const fs::path base(config.base_dir);
    std::error_code ec;
    fs::create_directories(base, ec);
    if (ec) {
        throw ExternalRunFailure("subprocess", index, 0,
            "cannot create " + config.base_dir + ": " + ec.message());
    }

    const std::string ini_path = (base / (config.file_root + ".ini")).string();
    const std::string log_path = (base / (config.file_root + ".log")).string();
    const std::string output_path = DeadBirthPath(config.base_dir, config.file_root);
    {
        std::ofstream ini(ini_path, std::ios::trunc);
        ini << IniString(config);
        if (!ini) {
            throw ExternalRunFailure("subprocess", index, 0, "cannot write " + ini_path);
        }
    }
    // A stale output file from an earlier run must not be mistaken for this one.
    fs::remove(output_path, ec);

    std::vector<std::string> args = CommandLine(ini_path);
    std::vector<char*> argv;
    for (std::string& arg : args) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    ScopedFd log_fd = ScopedFd::OpenForWrite(log_path);
    if (!log_fd.valid()) {
        throw ExternalRunFailure("subprocess", index, 0,
            "cannot open " + log_path + ": " + strerror(errno));
    }

    VLOG(1) << "Launching " << absl::StrJoin(args, " ") << " (thread " << config.thread_id << ")";
    pid_t pid = ::fork();
    if (pid < 0) {
        throw ExternalRunFailure("subprocess", index, -1,
            std::string("fork failed: ") + strerror(errno));
    }
    if (pid == 0) {
        if (!log_fd.RedirectTo(STDOUT_FILENO) || !log_fd.RedirectTo(STDERR_FILENO)) {
            _exit(126);
        }
        ::execvp(argv[0], argv.data());
        _exit(127);
    }

    int exit_status = WaitForChild(pid, config, cancel);
    if (exit_status != 0) {
        throw ExternalRunFailure("subprocess", index, exit_status,
            "sampler exited abnormally, see " + log_path);
    }
    if (!fs::exists(output_path)) {
        throw ExternalRunFailure("subprocess", index, 0, "no output written to " + output_path);
    }

    RunRecord run = ReadDeadBirthFile(output_path, config.thread_id,
                                      config.start_threshold.value_or(kLogZero));
    VLOG(2) << "Thread " << config.thread_id << ": read " << run.size() << " dead points";
    return run;
}

} // namespace DynamicNest

#include "run_io.h"

#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <vector>

#include <glog/logging.h>

#include "common/errors.h"

namespace DynamicNest {

namespace fs = std::filesystem;

namespace {

void EnsureParentDirectory(const std::string& path) {
    fs::path parent = fs::path(path).parent_path();
    if (parent.empty()) {
        return;
    }
    std::error_code ec;
    fs::create_directories(parent, ec);
    if (ec) {
        throw std::runtime_error("Failed to create directory " + parent.string() + ": " + ec.message());
    }
}

} // namespace

std::string DeadBirthPath(const std::string& base_dir, const std::string& file_root) {
    return (fs::path(base_dir) / (file_root + "_dead-birth.txt")).string();
}

RunRecord ReadDeadBirthFile(const std::string& path, int thread_id, double thread_min_logl) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw std::runtime_error("Failed to open " + path + ": " + strerror(errno));
    }

    std::vector<DeadPoint> points;
    size_t ncols = 0;
    std::string line;
    size_t line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        if (line.find_first_not_of(" \t\r") == std::string::npos) {
            continue;
        }

        std::vector<double> row;
        const char* cursor = line.c_str();
        while (true) {
            char* end = nullptr;
            double value = std::strtod(cursor, &end);
            if (end == cursor) {
                break;
            }
            row.push_back(value);
            cursor = end;
        }
        if (cursor[std::strspn(cursor, " \t\r")] != '\0') {
            throw MalformedOutputError(ThreadIndex(thread_id),
                path + ":" + std::to_string(line_no) + ": unparseable value");
        }
        if (row.size() < 3) {
            throw MalformedOutputError(ThreadIndex(thread_id),
                path + ":" + std::to_string(line_no) + ": expected parameters, logl and birth logl");
        }
        if (ncols == 0) {
            ncols = row.size();
        } else if (row.size() != ncols) {
            throw MalformedOutputError(ThreadIndex(thread_id),
                path + ":" + std::to_string(line_no) + ": " + std::to_string(row.size()) +
                " columns, expected " + std::to_string(ncols));
        }

        DeadPoint point;
        point.theta.assign(row.begin(), row.end() - 2);
        point.logl = row[ncols - 2];
        point.logl_birth = row[ncols - 1] <= kSamplerLogZero ? kLogZero : row[ncols - 1];
        point.thread_min_logl = thread_min_logl;
        point.thread_id = thread_id;
        points.push_back(std::move(point));
    }
    if (in.bad()) {
        throw std::runtime_error("Failed reading " + path);
    }

    VLOG(3) << "Read " << points.size() << " dead points from " << path;
    return RunRecord::FromBirthContours(std::move(points), thread_id, thread_min_logl);
}

void WriteDeadBirthFile(const RunRecord& run, const std::string& path) {
    EnsureParentDirectory(path);
    std::ofstream out(path, std::ios::trunc);
    if (!out.is_open()) {
        throw std::runtime_error("Failed to create " + path + ": " + strerror(errno));
    }
    out << std::setprecision(std::numeric_limits<double>::max_digits10);
    for (const DeadPoint& p : run.points()) {
        for (double x : p.theta) {
            out << x << ' ';
        }
        double birth = p.logl_birth == kLogZero ? kSamplerLogZero : p.logl_birth;
        out << p.logl << ' ' << birth << '\n';
    }
    out.flush();
    if (!out) {
        throw std::runtime_error("Failed writing " + path);
    }
}

std::string PosteriorsPath(const std::string& base_dir, const std::string& file_root) {
    return (fs::path(base_dir) / (file_root + ".txt")).string();
}

void WritePosteriorsFile(const RunRecord& run, const std::string& path) {
    EnsureParentDirectory(path);
    std::ofstream out(path, std::ios::trunc);
    if (!out.is_open()) {
        throw std::runtime_error("Failed to create " + path + ": " + strerror(errno));
    }
    if (!run.empty()) {
        std::vector<double> logw = run.LogWeights();
        double max_logw = *std::max_element(logw.begin(), logw.end());
        out << std::setprecision(std::numeric_limits<double>::max_digits10);
        for (size_t i = 0; i < run.size(); ++i) {
            const DeadPoint& p = run.points()[i];
            out << std::exp(logw[i] - max_logw) << ' ' << -2.0 * p.logl;
            for (double x : p.theta) {
                out << ' ' << x;
            }
            out << '\n';
        }
    }
    out.flush();
    if (!out) {
        throw std::runtime_error("Failed writing " + path);
    }
}

void SummariseRun(const RunRecord& run, RunSummary& summary) {
    summary.ndead = run.size();
    summary.log_evidence = LogEvidence(run);
    summary.param_means.clear();
    summary.param_sigmas.clear();
    for (size_t d = 0; d < run.ndim(); ++d) {
        summary.param_means.push_back(ParamMean(run, d));
        summary.param_sigmas.push_back(ParamSigma(run, d));
    }
}

void WriteStatsFile(const RunSummary& summary, const std::string& path) {
    EnsureParentDirectory(path);
    std::ofstream out(path, std::ios::trunc);
    if (!out.is_open()) {
        throw std::runtime_error("Failed to create " + path + ": " + strerror(errno));
    }
    out << std::setprecision(12)
        << "dynamic_goal " << summary.dynamic_goal << '\n'
        << "ndead " << summary.ndead << '\n'
        << "nthreads " << summary.nthreads << '\n'
        << "log_evidence " << summary.log_evidence << '\n'
        << "planned_cost " << summary.planned_cost << '\n'
        << "budget_scaled " << (summary.budget_scaled ? 1 : 0) << '\n';
    // One row per parameter: index (from 1), mean, sigma.
    for (size_t d = 0; d < summary.param_means.size(); ++d) {
        out << "param " << d + 1 << ' ' << summary.param_means[d] << ' '
            << (d < summary.param_sigmas.size() ? summary.param_sigmas[d] : 0.0) << '\n';
    }
    out.flush();
    if (!out) {
        throw std::runtime_error("Failed writing " + path);
    }
}

} // namespace DynamicNest

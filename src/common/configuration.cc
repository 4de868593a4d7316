#include "configuration.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <glog/logging.h>
#include <yaml-cpp/yaml.h>

namespace DynamicNest {

// Template specializations for environment variable parsing
template<>
std::optional<int> ConfigValue<int>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        try {
            return std::stoi(env_val);
        } catch (const std::exception& e) {
            LOG(WARNING) << "Failed to parse env var " << env_var_ << ": " << e.what();
        }
    }
    return std::nullopt;
}

template<>
std::optional<int64_t> ConfigValue<int64_t>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        try {
            return static_cast<int64_t>(std::stoll(env_val));
        } catch (const std::exception& e) {
            LOG(WARNING) << "Failed to parse env var " << env_var_ << ": " << e.what();
        }
    }
    return std::nullopt;
}

template<>
std::optional<size_t> ConfigValue<size_t>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        try {
            return std::stoull(env_val);
        } catch (const std::exception& e) {
            LOG(WARNING) << "Failed to parse env var " << env_var_ << ": " << e.what();
        }
    }
    return std::nullopt;
}

template<>
std::optional<double> ConfigValue<double>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        try {
            return std::stod(env_val);
        } catch (const std::exception& e) {
            LOG(WARNING) << "Failed to parse env var " << env_var_ << ": " << e.what();
        }
    }
    return std::nullopt;
}

template<>
std::optional<std::string> ConfigValue<std::string>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        return std::string(env_val);
    }
    return std::nullopt;
}

template<>
std::optional<bool> ConfigValue<bool>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        std::string val(env_val);
        std::transform(val.begin(), val.end(), val.begin(), ::tolower);
        if (val == "true" || val == "1" || val == "yes" || val == "on") {
            return true;
        } else if (val == "false" || val == "0" || val == "no" || val == "off") {
            return false;
        }
        LOG(WARNING) << "Invalid boolean value for env var " << env_var_ << ": " << env_val;
    }
    return std::nullopt;
}

Configuration& Configuration::getInstance() {
    static Configuration instance;
    return instance;
}

void Configuration::parseYAML(const YAML::Node& yaml) {
    if (!yaml["dynamicnest"]) {
        LOG(WARNING) << "Configuration has no 'dynamicnest' section; using defaults";
        return;
    }
    auto root = yaml["dynamicnest"];

    // Run
    if (root["run"]) {
        auto run = root["run"];
        if (run["file_root"]) config_.run.file_root.set(run["file_root"].as<std::string>());
        if (run["base_dir"]) config_.run.base_dir.set(run["base_dir"].as<std::string>());
        if (run["seed"]) config_.run.seed.set(run["seed"].as<int64_t>());
        if (run["ninit"]) config_.run.ninit.set(run["ninit"].as<int>());
        if (run["nlive_const"]) config_.run.nlive_const.set(run["nlive_const"].as<int>());
        if (run["dynamic_goal"]) config_.run.dynamic_goal.set(run["dynamic_goal"].as<double>());
        if (run["num_repeats"]) config_.run.num_repeats.set(run["num_repeats"].as<int>());
        if (run["keep_thread_files"]) config_.run.keep_thread_files.set(run["keep_thread_files"].as<bool>());
        if (run["write_dead"]) config_.run.write_dead.set(run["write_dead"].as<bool>());
        if (run["read_resume"]) config_.run.read_resume.set(run["read_resume"].as<bool>());
        if (run["equals"]) config_.run.equals.set(run["equals"].as<bool>());
        if (run["posteriors"]) config_.run.posteriors.set(run["posteriors"].as<bool>());
    }

    // Sampler
    if (root["sampler"]) {
        auto sampler = root["sampler"];
        if (sampler["kind"]) config_.sampler.kind.set(sampler["kind"].as<std::string>());
        if (sampler["executable"]) config_.sampler.executable.set(sampler["executable"].as<std::string>());
        if (sampler["mpi_prefix"]) config_.sampler.mpi_prefix.set(sampler["mpi_prefix"].as<std::string>());
        if (sampler["timeout_seconds"]) config_.sampler.timeout_seconds.set(sampler["timeout_seconds"].as<int>());
        if (sampler["precision_criterion"]) config_.sampler.precision_criterion.set(sampler["precision_criterion"].as<double>());
        if (sampler["max_ndead"]) config_.sampler.max_ndead.set(sampler["max_ndead"].as<int>());
        if (sampler["prior_block"]) config_.sampler.prior_block.set(sampler["prior_block"].as<std::string>());
        if (sampler["derived_block"]) config_.sampler.derived_block.set(sampler["derived_block"].as<std::string>());
    }

    // Gaussian reference problem
    if (root["gaussian"]) {
        auto gaussian = root["gaussian"];
        if (gaussian["ndim"]) config_.gaussian.ndim.set(gaussian["ndim"].as<int>());
        if (gaussian["sigma"]) config_.gaussian.sigma.set(gaussian["sigma"].as<double>());
        if (gaussian["prior_scale"]) config_.gaussian.prior_scale.set(gaussian["prior_scale"].as<double>());
    }

    // Allocation
    if (root["allocation"]) {
        auto allocation = root["allocation"];
        if (allocation["smoothing_window"]) config_.allocation.smoothing_window.set(allocation["smoothing_window"].as<int>());
        if (allocation["nlive_quantum"]) config_.allocation.nlive_quantum.set(allocation["nlive_quantum"].as<int>());
        if (allocation["duplicate_tolerance"]) config_.allocation.duplicate_tolerance.set(allocation["duplicate_tolerance"].as<size_t>());
        if (allocation["logl_tolerance"]) config_.allocation.logl_tolerance.set(allocation["logl_tolerance"].as<double>());
    }

    // Dispatch
    if (root["dispatch"]) {
        auto dispatch = root["dispatch"];
        if (dispatch["num_workers"]) config_.dispatch.num_workers.set(dispatch["num_workers"].as<int>());
        if (dispatch["queue_capacity"]) config_.dispatch.queue_capacity.set(dispatch["queue_capacity"].as<size_t>());
    }
}

bool Configuration::loadFromFile(const std::string& filename) {
    try {
        parseYAML(YAML::LoadFile(filename));
        return validate();
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration file " << filename << ": " << e.what();
        return false;
    }
}

bool Configuration::loadFromString(const std::string& yaml_content) {
    try {
        parseYAML(YAML::Load(yaml_content));
        return validate();
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration string: " << e.what();
        return false;
    }
}

DriverSettings Configuration::ToDriverSettings() const {
    DriverSettings settings;
    settings.file_root = config_.run.file_root.get();
    settings.base_dir = config_.run.base_dir.get();
    settings.seed = config_.run.seed.get();
    settings.num_repeats = config_.run.num_repeats.get();
    settings.max_ndead = config_.sampler.max_ndead.get();
    settings.precision_criterion = config_.sampler.precision_criterion.get();
    settings.keep_thread_files = config_.run.keep_thread_files.get();
    settings.write_dead = config_.run.write_dead.get();
    settings.read_resume = config_.run.read_resume.get();
    settings.equals = config_.run.equals.get();
    settings.posteriors = config_.run.posteriors.get();
    settings.prior_block = config_.sampler.prior_block.get();
    settings.derived_block = config_.sampler.derived_block.get();
    return settings;
}

DriverOptions Configuration::ToDriverOptions() const {
    DriverOptions options;
    options.runner.num_workers = config_.dispatch.num_workers.get();
    options.runner.queue_capacity = config_.dispatch.queue_capacity.get();
    options.planner.smoothing_window = config_.allocation.smoothing_window.get();
    options.planner.nlive_quantum = config_.allocation.nlive_quantum.get();
    options.merger.duplicate_tolerance = config_.allocation.duplicate_tolerance.get();
    options.merger.logl_tolerance = config_.allocation.logl_tolerance.get();
    return options;
}

GaussianProblem Configuration::ToGaussianProblem() const {
    GaussianProblem problem;
    problem.ndim = config_.gaussian.ndim.get();
    problem.sigma = config_.gaussian.sigma.get();
    problem.prior_scale = config_.gaussian.prior_scale.get();
    return problem;
}

SubprocessSamplerOptions Configuration::ToSubprocessOptions() const {
    SubprocessSamplerOptions options;
    options.executable = config_.sampler.executable.get();
    options.mpi_prefix = config_.sampler.mpi_prefix.get();
    options.timeout_seconds = config_.sampler.timeout_seconds.get();
    return options;
}

bool Configuration::validate() const {
    validation_errors_.clear();

    // Run sizes
    const int ninit = config_.run.ninit.get();
    const int nlive_const = config_.run.nlive_const.get();
    if (ninit < 1) {
        validation_errors_.push_back("ninit must be at least 1");
    }
    if (nlive_const < ninit) {
        validation_errors_.push_back("nlive_const must be at least ninit");
    }
    const double goal = config_.run.dynamic_goal.get();
    if (!(goal >= 0.0 && goal <= 1.0)) {
        validation_errors_.push_back("dynamic_goal must be between 0 and 1");
    }
    if (config_.run.file_root.get().empty()) {
        validation_errors_.push_back("file_root must not be empty");
    }
    if (config_.run.base_dir.get().empty()) {
        validation_errors_.push_back("base_dir must not be empty");
    }

    // Sampler
    const std::string kind = config_.sampler.kind.get();
    if (kind != "gaussian" && kind != "subprocess") {
        validation_errors_.push_back("sampler kind must be 'gaussian' or 'subprocess'");
    }
    if (kind == "subprocess" && config_.sampler.executable.get().empty()) {
        validation_errors_.push_back("subprocess sampler needs an executable");
    }
    if (!(config_.sampler.precision_criterion.get() > 0.0)) {
        validation_errors_.push_back("precision_criterion must be positive");
    }
    if (config_.sampler.timeout_seconds.get() < 0) {
        validation_errors_.push_back("timeout_seconds cannot be negative");
    }

    // Gaussian problem
    if (config_.gaussian.ndim.get() < 1) {
        validation_errors_.push_back("gaussian ndim must be at least 1");
    }
    if (!(config_.gaussian.sigma.get() > 0.0) || !(config_.gaussian.prior_scale.get() > 0.0)) {
        validation_errors_.push_back("gaussian sigma and prior_scale must be positive");
    }

    // Allocation
    if (config_.allocation.smoothing_window.get() < 0) {
        validation_errors_.push_back("smoothing_window cannot be negative");
    }
    if (config_.allocation.nlive_quantum.get() < 1) {
        validation_errors_.push_back("nlive_quantum must be at least 1");
    }
    if (config_.allocation.logl_tolerance.get() < 0.0) {
        validation_errors_.push_back("logl_tolerance cannot be negative");
    }

    // Dispatch
    if (config_.dispatch.num_workers.get() < 1) {
        validation_errors_.push_back("num_workers must be at least 1");
    }
    if (config_.dispatch.queue_capacity.get() < 1) {
        validation_errors_.push_back("queue_capacity must be at least 1");
    }

    return validation_errors_.empty();
}

std::vector<std::string> Configuration::getValidationErrors() const {
    return validation_errors_;
}

} // namespace DynamicNest

#ifndef DYNAMICNEST_SRC_COMMON_CONFIGURATION_H_
#define DYNAMICNEST_SRC_COMMON_CONFIGURATION_H_

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "dynamic/driver.h"
#include "sampler/gaussian_sampler.h"
#include "sampler/subprocess_sampler.h"

namespace YAML {
class Node;
}

namespace DynamicNest {

/**
 * Configuration value that can be overridden by environment variables
 */
template<typename T>
class ConfigValue {
public:
    ConfigValue() = default;
    ConfigValue(T default_value, const std::string& env_var = "")
        : value_(default_value), env_var_(env_var) {}

    T get() const {
        if (!env_var_.empty()) {
            auto env_value = getEnvValue();
            if (env_value.has_value()) {
                return env_value.value();
            }
        }
        return value_;
    }

    void set(T value) { value_ = value; }
    const std::string& env_var() const { return env_var_; }

private:
    T value_;
    std::string env_var_;

    std::optional<T> getEnvValue() const;
};

/**
 * Main configuration structure
 */
struct DynamicNestConfig {
    // Dynamic run
    struct Run {
        ConfigValue<std::string> file_root{"gaussian", "DYNAMICNEST_FILE_ROOT"};
        ConfigValue<std::string> base_dir{"chains", "DYNAMICNEST_BASE_DIR"};
        // Negative leaves the sampler unseeded.
        ConfigValue<int64_t> seed{-1, "DYNAMICNEST_SEED"};
        ConfigValue<int> ninit{100, "DYNAMICNEST_NINIT"};
        ConfigValue<int> nlive_const{500, "DYNAMICNEST_NLIVE_CONST"};
        // 0 optimises evidence, 1 parameter estimation.
        ConfigValue<double> dynamic_goal{1.0, "DYNAMICNEST_DYNAMIC_GOAL"};
        ConfigValue<int> num_repeats{50, "DYNAMICNEST_NUM_REPEATS"};
        ConfigValue<bool> keep_thread_files{false, "DYNAMICNEST_KEEP_THREAD_FILES"};
        ConfigValue<bool> write_dead{true, "DYNAMICNEST_WRITE_DEAD"};
        ConfigValue<bool> read_resume{false, "DYNAMICNEST_READ_RESUME"};
        ConfigValue<bool> equals{false, "DYNAMICNEST_EQUALS"};
        ConfigValue<bool> posteriors{false, "DYNAMICNEST_POSTERIORS"};
    } run;

    // Sampler invocation
    struct Sampler {
        // "gaussian" (built-in reference problem) or "subprocess"
        ConfigValue<std::string> kind{"gaussian", "DYNAMICNEST_SAMPLER_KIND"};
        ConfigValue<std::string> executable{"", "DYNAMICNEST_SAMPLER_EXECUTABLE"};
        ConfigValue<std::string> mpi_prefix{"", "DYNAMICNEST_MPI_PREFIX"};
        ConfigValue<int> timeout_seconds{0, "DYNAMICNEST_SAMPLER_TIMEOUT"};
        ConfigValue<double> precision_criterion{0.001, "DYNAMICNEST_PRECISION_CRITERION"};
        ConfigValue<int> max_ndead{-1, "DYNAMICNEST_MAX_NDEAD"};
        ConfigValue<std::string> prior_block{"", "DYNAMICNEST_PRIOR_BLOCK"};
        ConfigValue<std::string> derived_block{"", "DYNAMICNEST_DERIVED_BLOCK"};
    } sampler;

    // Reference problem for kind: gaussian
    struct Gaussian {
        ConfigValue<int> ndim{10, "DYNAMICNEST_GAUSSIAN_NDIM"};
        ConfigValue<double> sigma{1.0, "DYNAMICNEST_GAUSSIAN_SIGMA"};
        ConfigValue<double> prior_scale{10.0, "DYNAMICNEST_GAUSSIAN_PRIOR_SCALE"};
    } gaussian;

    struct Allocation {
        // In initial-run points; about 2% of a 100-live-point run.
        ConfigValue<int> smoothing_window{60, "DYNAMICNEST_SMOOTHING_WINDOW"};
        ConfigValue<int> nlive_quantum{5, "DYNAMICNEST_NLIVE_QUANTUM"};
        ConfigValue<size_t> duplicate_tolerance{0, "DYNAMICNEST_DUPLICATE_TOLERANCE"};
        ConfigValue<double> logl_tolerance{0.0, "DYNAMICNEST_LOGL_TOLERANCE"};
    } allocation;

    struct Dispatch {
        ConfigValue<int> num_workers{1, "DYNAMICNEST_NUM_WORKERS"};
        ConfigValue<size_t> queue_capacity{64, "DYNAMICNEST_QUEUE_CAPACITY"};
    } dispatch;
};

/**
 * Configuration manager singleton
 */
class Configuration {
public:
    static Configuration& getInstance();

    Configuration() = default;

    // Load configuration from file
    bool loadFromFile(const std::string& filename);

    // Load configuration from YAML string
    bool loadFromString(const std::string& yaml_content);

    // Get the configuration
    const DynamicNestConfig& config() const { return config_; }
    DynamicNestConfig& config() { return config_; }

    // Per-run settings built from the current values
    DriverSettings ToDriverSettings() const;
    DriverOptions ToDriverOptions() const;
    GaussianProblem ToGaussianProblem() const;
    SubprocessSamplerOptions ToSubprocessOptions() const;

    // Validation
    bool validate() const;
    std::vector<std::string> getValidationErrors() const;

private:
    Configuration(const Configuration&) = delete;
    Configuration& operator=(const Configuration&) = delete;

    DynamicNestConfig config_;
    mutable std::vector<std::string> validation_errors_;

    void parseYAML(const YAML::Node& yaml);
};

// Template specializations for getEnvValue
template<>
std::optional<int> ConfigValue<int>::getEnvValue() const;

template<>
std::optional<int64_t> ConfigValue<int64_t>::getEnvValue() const;

template<>
std::optional<size_t> ConfigValue<size_t>::getEnvValue() const;

template<>
std::optional<double> ConfigValue<double>::getEnvValue() const;

template<>
std::optional<std::string> ConfigValue<std::string>::getEnvValue() const;

template<>
std::optional<bool> ConfigValue<bool>::getEnvValue() const;

} // namespace DynamicNest

#endif // DYNAMICNEST_SRC_COMMON_CONFIGURATION_H_

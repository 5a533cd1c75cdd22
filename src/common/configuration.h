#ifndef PRSYNC_CONFIGURATION_H_
#define PRSYNC_CONFIGURATION_H_

#include <string>
#include <optional>
#include <vector>
#include <cstdint>
#include <cstddef>

namespace YAML {
class Node;
}

namespace Prsync {

/**
 * Configuration value with three layers, lowest to highest precedence:
 * the built-in default (or a value loaded from the YAML file), the environment
 * variable, and an explicit command-line override.
 */
template<typename T>
class ConfigValue {
public:
    ConfigValue() = default;
    ConfigValue(T default_value, const std::string& env_var = "")
        : value_(default_value), env_var_(env_var) {}

    T get() const {
        if (overridden_) {
            return value_;
        }
        if (!env_var_.empty()) {
            auto env_value = getEnvValue();
            if (env_value.has_value()) {
                return env_value.value();
            }
        }
        return value_;
    }

    // File-level value; an environment variable still wins over it.
    void set(T value) { value_ = value; }

    // Command-line value; wins over everything.
    void setFromCommandLine(T value) {
        value_ = value;
        overridden_ = true;
    }

    const std::string& env_var() const { return env_var_; }

private:
    T value_;
    std::string env_var_;
    bool overridden_ = false;

    std::optional<T> getEnvValue() const;
};

/**
 * Main configuration structure
 */
struct PrsyncConfig {
    struct Transfer {
        ConfigValue<int> jobs{4, "PRSYNC_JOBS"};
        ConfigValue<size_t> bucket_size_bytes{1000000000UL, "PRSYNC_BUCKET_SIZE"};
        // Passed to every rsync invocation verbatim, split on whitespace.
        ConfigValue<std::string> extra_flags{"-avz --progress", "PRSYNC_RSYNC_ARGS"};
        ConfigValue<std::string> rsync_binary{"rsync", "PRSYNC_RSYNC_BINARY"};
        ConfigValue<bool> skip_existing{false, "PRSYNC_SKIP_EXISTING"};
        // Where per-bucket --files-from lists are written. Empty means the current directory.
        ConfigValue<std::string> work_dir{"", "PRSYNC_WORK_DIR"};
    } transfer;

    struct Session {
        ConfigValue<std::string> ssh_binary{"ssh", "PRSYNC_SSH_BINARY"};
    } session;

    struct Scheduler {
        ConfigValue<int> kill_grace_ms{5000, "PRSYNC_KILL_GRACE_MS"};
        ConfigValue<int> poll_interval_ms{200, "PRSYNC_POLL_INTERVAL_MS"};
    } scheduler;

    struct Report {
        ConfigValue<std::string> path{"", "PRSYNC_REPORT"};
    } report;
};

// Megabytes of 10^6 bytes to bytes; std::nullopt if the result does not fit in size_t.
std::optional<size_t> MegabytesToBytes(size_t megabytes);

/**
 * Configuration manager singleton
 */
class Configuration {
public:
    static Configuration& getInstance();

    // Load configuration from file
    bool loadFromFile(const std::string& filename);

    // Load configuration from YAML string
    bool loadFromString(const std::string& yaml_content);

    const PrsyncConfig& config() const { return config_; }
    PrsyncConfig& config() { return config_; }

    int getJobs() const { return config_.transfer.jobs.get(); }
    size_t getBucketSizeBytes() const { return config_.transfer.bucket_size_bytes.get(); }
    std::string getExtraFlags() const { return config_.transfer.extra_flags.get(); }

    // Drops every loaded and overridden value.
    void reset() { config_ = PrsyncConfig{}; }

    // Validation
    bool validate() const;
    std::vector<std::string> getValidationErrors() const;

private:
    Configuration() = default;
    Configuration(const Configuration&) = delete;
    Configuration& operator=(const Configuration&) = delete;

    PrsyncConfig config_;
    mutable std::vector<std::string> validation_errors_;

    void applyYAML(const YAML::Node& yaml);
};

// Template specializations for getEnvValue
template<>
std::optional<int> ConfigValue<int>::getEnvValue() const;

template<>
std::optional<size_t> ConfigValue<size_t>::getEnvValue() const;

template<>
std::optional<std::string> ConfigValue<std::string>::getEnvValue() const;

template<>
std::optional<bool> ConfigValue<bool>::getEnvValue() const;

} // namespace Prsync

#endif // PRSYNC_CONFIGURATION_H_

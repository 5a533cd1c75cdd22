#include "configuration.h"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <limits>
#include <glog/logging.h>
#include <yaml-cpp/yaml.h>

namespace Prsync {

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
std::optional<size_t> ConfigValue<size_t>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        // stoull accepts "-1" and wraps it around
        const char* digits = env_val;
        while (std::isspace(static_cast<unsigned char>(*digits))) ++digits;
        if (*digits == '-') {
            LOG(WARNING) << "Negative value for env var " << env_var_ << ": " << env_val;
            return std::nullopt;
        }
        try {
            return std::stoull(env_val);
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
        std::transform(val.begin(), val.end(), val.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (val == "true" || val == "1" || val == "yes" || val == "on") {
            return true;
        } else if (val == "false" || val == "0" || val == "no" || val == "off") {
            return false;
        }
        LOG(WARNING) << "Invalid boolean value for env var " << env_var_ << ": " << env_val;
    }
    return std::nullopt;
}

std::optional<size_t> MegabytesToBytes(size_t megabytes) {
    constexpr size_t kBytesPerMegabyte = 1000UL * 1000UL;
    if (megabytes > std::numeric_limits<size_t>::max() / kBytesPerMegabyte) {
        return std::nullopt;
    }
    return megabytes * kBytesPerMegabyte;
}

Configuration& Configuration::getInstance() {
    static Configuration instance;
    return instance;
}

bool Configuration::loadFromFile(const std::string& filename) {
    try {
        applyYAML(YAML::LoadFile(filename));
        return validate();
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration file " << filename << ": " << e.what();
        return false;
    }
}

bool Configuration::loadFromString(const std::string& yaml_content) {
    try {
        applyYAML(YAML::Load(yaml_content));
        return validate();
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration string: " << e.what();
        return false;
    }
}

void Configuration::applyYAML(const YAML::Node& yaml) {
    if (!yaml["prsync"]) {
        LOG(WARNING) << "Configuration has no 'prsync' section, nothing loaded";
        return;
    }
    auto root = yaml["prsync"];

    // Transfer
    if (root["transfer"]) {
        auto transfer = root["transfer"];
        if (transfer["jobs"]) config_.transfer.jobs.set(transfer["jobs"].as<int>());
        if (transfer["bucket_size_bytes"]) config_.transfer.bucket_size_bytes.set(transfer["bucket_size_bytes"].as<size_t>());
        if (transfer["bucket_size_mb"]) {
            std::optional<size_t> bytes = MegabytesToBytes(transfer["bucket_size_mb"].as<size_t>());
            if (!bytes) {
                throw YAML::Exception(transfer["bucket_size_mb"].Mark(), "bucket_size_mb is too large");
            }
            config_.transfer.bucket_size_bytes.set(*bytes);
        }
        if (transfer["extra_flags"]) config_.transfer.extra_flags.set(transfer["extra_flags"].as<std::string>());
        if (transfer["rsync_binary"]) config_.transfer.rsync_binary.set(transfer["rsync_binary"].as<std::string>());
        if (transfer["skip_existing"]) config_.transfer.skip_existing.set(transfer["skip_existing"].as<bool>());
        if (transfer["work_dir"]) config_.transfer.work_dir.set(transfer["work_dir"].as<std::string>());
    }

    // Session
    if (root["session"]) {
        auto session = root["session"];
        if (session["ssh_binary"]) config_.session.ssh_binary.set(session["ssh_binary"].as<std::string>());
    }

    // Scheduler
    if (root["scheduler"]) {
        auto scheduler = root["scheduler"];
        if (scheduler["kill_grace_ms"]) config_.scheduler.kill_grace_ms.set(scheduler["kill_grace_ms"].as<int>());
        if (scheduler["poll_interval_ms"]) config_.scheduler.poll_interval_ms.set(scheduler["poll_interval_ms"].as<int>());
    }

    // Report
    if (root["report"]) {
        auto report = root["report"];
        if (report["path"]) config_.report.path.set(report["path"].as<std::string>());
    }
}

bool Configuration::validate() const {
    validation_errors_.clear();

    if (config_.transfer.jobs.get() < 1) {
        validation_errors_.push_back("jobs must be at least 1");
    }

    if (config_.transfer.bucket_size_bytes.get() == 0) {
        validation_errors_.push_back("bucket size must be greater than 0");
    }

    if (config_.transfer.rsync_binary.get().empty()) {
        validation_errors_.push_back("rsync binary must not be empty");
    }

    if (config_.session.ssh_binary.get().empty()) {
        validation_errors_.push_back("ssh binary must not be empty");
    }

    if (config_.scheduler.kill_grace_ms.get() < 0) {
        validation_errors_.push_back("kill grace period cannot be negative");
    }

    if (config_.scheduler.poll_interval_ms.get() < 1) {
        validation_errors_.push_back("poll interval must be at least 1 ms");
    }

    return validation_errors_.empty();
}

std::vector<std::string> Configuration::getValidationErrors() const {
    return validation_errors_;
}

} // namespace Prsync

#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include <cxxopts.hpp>
#include <glog/logging.h>

#include "common/cancellation.h"
#include "common/configuration.h"
#include "common/errors.h"
#include "parallel_sync.h"
#include "signal_watcher.h"
#include "transfer/process_runner.h"

using Prsync::Configuration;

namespace {

// Command-line values only win when they were actually given. Returns false on an unusable value.
bool ApplyCommandLine(const cxxopts::ParseResult& result, Configuration& config) {
    auto& c = config.config();
    if (result.count("jobs")) {
        c.transfer.jobs.setFromCommandLine(result["jobs"].as<int>());
    }
    if (result.count("bucket-size")) {
        std::optional<size_t> bytes = Prsync::MegabytesToBytes(result["bucket-size"].as<size_t>());
        if (!bytes) {
            LOG(ERROR) << "--bucket-size " << result["bucket-size"].as<size_t>() << " is too large";
            return false;
        }
        c.transfer.bucket_size_bytes.setFromCommandLine(*bytes);
    }
    if (result.count("rsync-args")) {
        c.transfer.extra_flags.setFromCommandLine(result["rsync-args"].as<std::string>());
    }
    if (result.count("skip-existing")) {
        c.transfer.skip_existing.setFromCommandLine(true);
    }
    if (result.count("report")) {
        c.report.path.setFromCommandLine(result["report"].as<std::string>());
    }
    return true;
}

} // namespace

int main(int argc, char* argv[]) {
    // Initialize logging
    google::InitGoogleLogging(argv[0]);
    google::InstallFailureSignalHandler();
    FLAGS_logtostderr = 1; // log only to console, no files.

    // Setup command line options
    cxxopts::Options options("prsync", "Parallel rsync over size-balanced buckets");

    options.add_options()
        ("j,jobs", "Number of concurrent transfers (default 4)", cxxopts::value<int>())
        ("s,bucket-size", "Target bucket size in MB of 10^6 bytes (default 1000)",
            cxxopts::value<size_t>())
        ("rsync-args", "Flags passed to every rsync invocation (default \"-avz --progress\")",
            cxxopts::value<std::string>())
        ("config", "YAML configuration file", cxxopts::value<std::string>())
        ("skip-existing", "Skip files already present at the destination")
        ("only-buckets", "Comma-separated bucket ids to transfer, e.g. from a previous report",
            cxxopts::value<std::vector<int>>())
        ("report", "Write the final report to this YAML file", cxxopts::value<std::string>())
        ("l,log_level", "Log level", cxxopts::value<int>()->default_value("0"))
        ("h,help", "Print usage")
        ("source", "Local source directory", cxxopts::value<std::string>())
        ("target", "Destination directory or [user@]host:path", cxxopts::value<std::string>());
    options.parse_positional({"source", "target"});
    options.positional_help("<source> <target>");

    cxxopts::ParseResult result;
    try {
        result = options.parse(argc, argv);
    } catch (const cxxopts::exceptions::exception& e) {
        std::cerr << "prsync: " << e.what() << "\n" << options.help() << std::endl;
        return Prsync::kFatalExitStatus;
    }

    if (result.count("help")) {
        std::cout << options.help() << std::endl;
        return 0;
    }
    FLAGS_v = result["log_level"].as<int>();

    if (!result.count("source") || !result.count("target")) {
        std::cerr << "prsync: both <source> and <target> are required\n"
                  << options.help() << std::endl;
        return Prsync::kFatalExitStatus;
    }

    // Defaults < config file < environment < command line
    Configuration& config = Configuration::getInstance();
    if (result.count("config")) {
        const std::string path = result["config"].as<std::string>();
        if (!config.loadFromFile(path)) {
            LOG(ERROR) << "Invalid configuration file " << path;
            for (const auto& error : config.getValidationErrors()) {
                LOG(ERROR) << "  " << error;
            }
            return Prsync::kFatalExitStatus;
        }
        LOG(INFO) << "Loaded configuration from " << path;
    }
    if (!ApplyCommandLine(result, config)) {
        return Prsync::kFatalExitStatus;
    }
    if (!config.validate()) {
        for (const auto& error : config.getValidationErrors()) {
            LOG(ERROR) << "Configuration error: " << error;
        }
        return Prsync::kFatalExitStatus;
    }

    Prsync::SyncOptions sync_options = Prsync::SyncOptions::FromConfiguration(config);
    sync_options.source = result["source"].as<std::string>();
    sync_options.target = result["target"].as<std::string>();
    if (result.count("only-buckets")) {
        sync_options.only_buckets = result["only-buckets"].as<std::vector<int>>();
    }

    LOG(INFO) << "Syncing " << sync_options.source << " -> " << sync_options.target
              << " with " << sync_options.jobs << " jobs";

    // Must exist before any other thread so that every thread inherits the signal mask.
    Prsync::CancellationToken cancel;
    Prsync::SignalWatcher signals(cancel);

    Prsync::ProcessRunner runner(sync_options.kill_grace_ms, sync_options.poll_interval_ms);
    Prsync::ParallelSync sync(std::move(sync_options), runner);

    try {
        Prsync::TransferReport report = sync.Run(cancel);
        return Prsync::ExitStatusFor(report);
    } catch (const Prsync::ConfigError& e) {
        LOG(ERROR) << "Configuration error: " << e.what();
    } catch (const Prsync::AuthError& e) {
        LOG(ERROR) << "Authentication failed: " << e.what();
    } catch (const Prsync::ConnectError& e) {
        LOG(ERROR) << "Connection failed: " << e.what();
    }
    return Prsync::kFatalExitStatus;
}

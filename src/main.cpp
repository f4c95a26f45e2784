/**
 * @file main.cpp
 * @brief Entry point for the multicam_ingest command
 *
 * @details Commands:
 *
 *          - process <manifest> [--ceiling N]: run a batch, exit code is the
 *            number of failed jobs, capped at 255
 *
 *          - check: verify credentials and container
 *
 *          - resources: print the measured resources and ceiling
 *
 *          - download <key> <path>: fetch an object, resuming partial files
 *
 *          - url <key>: print a short-lived access URL
 *
 * @note Credentials and tunables come from the environment; see
 *       config/multicam.env.
 */

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <exception>
#include <string>
#include <vector>

#include <fmt/core.h>

#include "multicam/config.hpp"
#include "multicam/ffmpeg_tools.hpp"
#include "multicam/job_coordinator.hpp"
#include "multicam/logging.hpp"
#include "multicam/manifest.hpp"
#include "multicam/progress.hpp"
#include "multicam/resolution_probe.hpp"
#include "multicam/resource_probe.hpp"
#include "multicam/transfer_client.hpp"

using namespace multicam;

namespace {

/// Renders every progress event as one log line
class LogProgressSink : public ProgressSink {
public:
  void notify(const ProgressEvent &event) override {
    LOG_INFO("[progress] {}", to_string(event));
  }
};

void print_usage() {
  LOG_WARN("Usage: multicam_ingest <command> [args]\n"
           "  process <manifest> [--ceiling N]\n"
           "  check\n"
           "  resources\n"
           "  download <key> <path>\n"
           "  url <key>");
}

int cmd_process(const std::vector<std::string> &args) {
  if (args.empty()) {
    print_usage();
    return 1;
  }

  int ceiling = Config::max_concurrent();
  for (size_t i = 1; i < args.size(); ++i) {
    if (args[i] == "--ceiling" && i + 1 < args.size()) {
      ceiling = std::stoi(args[++i]);
    } else {
      LOG_WARN("Ignoring argument: {}", args[i]);
    }
  }

  std::vector<JobDescriptor> jobs;
  Status s = load_manifest(args[0], jobs);
  if (!s.ok()) {
    LOG_ERROR("{}", s.message);
    return 1;
  }
  if (jobs.empty()) {
    LOG_WARN("No jobs in {}", args[0]);
    return 0;
  }
  LOG_INFO("Loaded {} jobs from {}", jobs.size(), args[0]);

  TransferClient transfer(StorageConfig::from_env());
  FfmpegSegmentExtractor extractor(Config::ffmpeg_bin());
  FfmpegTranscoder transcoder(Config::ffmpeg_bin());
  AvResolutionProbe prober{std::chrono::seconds(Config::probe_timeout_sec())};
  ResourceProbe probe;

  MediaTools tools;
  tools.extractor = &extractor;
  tools.prober = &prober;
  tools.transcoder = &transcoder;

  LogProgressSink progress;
  JobCoordinator coordinator(transfer, tools, probe, &progress);
  s = coordinator.process_batch(jobs, ceiling);
  coordinator.flush_progress();

  if (coordinator.progress_dropped() > 0) {
    LOG_WARN("{} progress events dropped", coordinator.progress_dropped());
  }
  if (!s.ok()) {
    LOG_ERROR("Batch not started: {}", s.message);
    return 1;
  }
  return batch_exit_code(coordinator.status());
}

int cmd_check() {
  StorageConfig config = StorageConfig::from_env();
  Status s = config.validate();
  if (!s.ok()) {
    LOG_ERROR("{}", s.message);
    return 1;
  }
  TransferClient transfer(config);
  s = transfer.test_connection();
  if (!s.ok()) {
    LOG_ERROR("Connection check failed ({})", to_string(s.fault));
    return 1;
  }
  return 0;
}

int cmd_resources() {
  ResourceProbe probe;
  ResourceSnapshot snap = probe.snapshot();
  fmt::print("{:<25} {:>10}\n", "CPUs:", snap.cpu_count);
  fmt::print("{:<25} {:>8.1f}GB\n", "Available memory:", snap.available_memory_gb);
  fmt::print("{:<25} {:>10}\n", "Accelerator:",
             snap.accelerator_present ? "yes" : "no");
  fmt::print("{:<25} {:>10}\n", "Concurrency ceiling:", snap.computed_ceiling);
  return 0;
}

int cmd_download(const std::vector<std::string> &args) {
  if (args.size() < 2) {
    print_usage();
    return 1;
  }
  StorageConfig config = StorageConfig::from_env();
  Status s = config.validate();
  if (!s.ok()) {
    LOG_ERROR("{}", s.message);
    return 1;
  }
  TransferClient transfer(config);
  s = transfer.download(args[0], args[1]);
  if (!s.ok()) {
    LOG_ERROR("Download failed: {}", s.message);
    return 1;
  }
  return 0;
}

int cmd_url(const std::vector<std::string> &args) {
  if (args.empty()) {
    print_usage();
    return 1;
  }
  StorageConfig config = StorageConfig::from_env();
  Status s = config.validate();
  if (!s.ok()) {
    LOG_ERROR("{}", s.message);
    return 1;
  }
  TransferClient transfer(config);
  fmt::print("{}\n", transfer.presigned_url(
                         args[0], std::chrono::seconds(
                                      Config::presign_expires_sec())));
  return 0;
}

} // anonymous namespace

// **---- MAIN ----**

int main(int argc, char *argv[]) {
  /// Disable stdout buffering for real-time log visibility
  std::setvbuf(stdout, nullptr, _IONBF, 0);

  if (argc < 2) {
    print_usage();
    return 1;
  }

  std::string command = argv[1];
  std::vector<std::string> args(argv + 2, argv + argc);

  try {
    if (command == "process")
      return cmd_process(args);
    if (command == "check")
      return cmd_check();
    if (command == "resources")
      return cmd_resources();
    if (command == "download")
      return cmd_download(args);
    if (command == "url")
      return cmd_url(args);
  } catch (const std::exception &e) {
    /// Malformed numeric environment values or arguments
    LOG_ERROR("{}", e.what());
    return 1;
  }

  print_usage();
  return 1;
}

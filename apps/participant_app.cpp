#include "participant/participant_config.hpp"
#include "participant/record_source.hpp"
#include "participant/ring_participant.hpp"
#include "ring/ring_directory.hpp"
#include "transport/sync_dir_transport.hpp"
#include "utils/logging.hpp"
#include <cstdlib>
#include <iostream>
#include <memory>
#include <stdexcept>

// One invocation advances this participant's round as far as possible and
// exits. Run it repeatedly (cron, a sync client hook) until it reports
// "aggregate complete".
//
// Usage: ringsum_participant [config.json]
// The config path falls back to $RINGSUM_CONFIG_PATH, then participant.json.
int main(int argc, char *argv[]) {
  std::string config_path = "participant.json";
  if (const char *env = std::getenv("RINGSUM_CONFIG_PATH")) {
    config_path = env;
  }
  if (argc >= 2) config_path = argv[1];

  std::unique_ptr<ParticipantConfig> config;
  try {
    config = std::make_unique<ParticipantConfig>(config_path);
  } catch (const std::exception &e) {
    LOG_AND_EXIT(e.what(), 2);
  }

  if (!config->log_file.empty() && !ringsum::logging::openLogFile(config->log_file)) {
    std::cerr << "[WARN] Could not open log file " << config->log_file << std::endl;
  }

  LOG("-----------------------------");
  LOG("Participant: " << config->participant_id);
  DEBUG_INFO("Sync root: " << config->sync_root);
  DEBUG_INFO("Ring source: " << config->ring_source);
  DEBUG_INFO("Aggregate mode: " << aggregationModeName(config->aggregate_mode));

  int exit_code = 0;
  try {
    SyncDirTransport storage(config->sync_root);

    std::unique_ptr<RingDirectory> ring_directory;
    if (isHttpUrl(config->ring_source)) {
      ring_directory = std::make_unique<HttpRingDirectory>(config->ring_source,
                                                           config->http_timeout_seconds);
    } else {
      ring_directory = std::make_unique<FileRingDirectory>(config->ring_source);
    }

    RingParticipant participant(*config, storage, *ring_directory,
                                std::make_unique<RandomRecordSource>());

    auto report = participant.runOnce();
    if (report) {
      LOG("Stage " << stageName(report.value().stage) << ": " << report.value().status);
    } else {
      LOG("Invocation failed: " << ringsum::describeError(report));
      // Configuration problems need an operator; everything else is retried
      // by the next invocation
      exit_code = ringsum::getErrorCategory(report.error()) ==
                          ringsum::ErrorCategory::Configuration
                      ? 2
                      : 1;
    }
  } catch (const std::invalid_argument &e) {
    // Rejected ring_source
    LOG("Configuration error: " << e.what());
    exit_code = 2;
  } catch (const std::exception &e) {
    LOG("Exception during invocation: " << e.what());
    exit_code = 1;
  }

  LOG("-----------------------------");
  ringsum::logging::closeLogFile();
  return exit_code;
}

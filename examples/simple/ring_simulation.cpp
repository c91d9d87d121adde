#include "participant/participant_config.hpp"
#include "participant/record_source.hpp"
#include "participant/ring_participant.hpp"
#include "protocol/parser.hpp"
#include "ring/ring_directory.hpp"
#include "transport/sync_dir_transport.hpp"
#include "utils/logging.hpp"
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <random>
#include <string>
#include <vector>

// Runs a whole ring on one machine. All participants share a single sync
// directory, each is invoked in a random order and sometimes skipped, until
// every one of them has its aggregate.
//
// Usage: ringsum_simulation [participants] [sync_root]
int main(int argc, char *argv[]) {
  int participant_count = 4;
  std::filesystem::path sync_root =
      std::filesystem::temp_directory_path() /
      ("ringsum-sim-" + std::to_string(std::chrono::system_clock::now()
                                           .time_since_epoch()
                                           .count()));

  if (argc >= 2) participant_count = std::stoi(argv[1]);
  if (argc >= 3) sync_root = argv[2];

  if (participant_count < static_cast<int>(kMinRingSize)) {
    LOG_AND_EXIT("Need at least " << kMinRingSize << " participants", 2);
  }

  std::vector<std::string> ring;
  for (int i = 0; i < participant_count; ++i) {
    ring.push_back("participant" + std::to_string(i + 1) + "@ringsum.local");
  }

  LOG("Simulating " << participant_count << " participants in " << sync_root.string());

  SyncDirTransport storage(sync_root);
  StaticRingDirectory ring_directory(ring);

  std::vector<std::unique_ptr<RingParticipant>> participants;
  for (int i = 0; i < participant_count; ++i) {
    nlohmann::json config_json = {{"participant_id", ring[i]},
                                  {"sync_root", sync_root.string()},
                                  {"aggregate_mode", "mean"},
                                  {"log_file", ""}};
    ParticipantConfig config(config_json);
    participants.push_back(std::make_unique<RingParticipant>(
        config, storage, ring_directory,
        std::make_unique<RandomRecordSource>(static_cast<unsigned int>(i + 1))));
  }

  std::mt19937 gen(std::random_device{}());
  std::bernoulli_distribution skip(0.3);
  std::vector<size_t> order(participants.size());
  for (size_t i = 0; i < order.size(); ++i) order[i] = i;

  const int max_rounds = 50;
  int round = 0;
  size_t done = 0;
  while (done < participants.size() && round < max_rounds) {
    ++round;
    std::shuffle(order.begin(), order.end(), gen);

    done = 0;
    for (size_t index : order) {
      auto &participant = participants[index];
      if (skip(gen)) {
        continue;
      }

      auto report = participant->runOnce();
      if (!report) {
        LOG(participant->getParticipantId() << ": " << ringsum::describeError(report));
        continue;
      }
      DEBUG_INFO(participant->getParticipantId()
                 << ": " << stageName(report.value().stage) << " ("
                 << report.value().status << ")");
    }

    for (auto &participant : participants) {
      if (storage.exists(participant->layout().aggregateResult(participant->getParticipantId()))) {
        ++done;
      }
    }
    LOG("Round " << round << ": " << done << "/" << participants.size() << " aggregated");
  }

  if (done < participants.size()) {
    LOG("Ring did not converge within " << max_rounds << " rounds");
    return 1;
  }

  // The simulation can peek at everyone's private record; a real participant
  // never could
  FieldValues true_sums;
  for (const auto &member : ring) {
    auto body = storage.readText(participants.front()->layout().privateRecord(member));
    if (!body) {
      LOG("Missing private record for " << member);
      return 1;
    }
    auto record = parsePrivateRecord(body.value());
    if (!record) {
      LOG("Unreadable private record for " << member);
      return 1;
    }
    for (const auto &[field, value] : record->fields) {
      true_sums[field] += value;
    }
  }

  for (const auto &[field, total] : true_sums) {
    LOG(field << ": true sum " << total << ", true mean "
              << static_cast<double>(total) / participant_count);
  }

  const auto &first = participants.front();
  auto aggregate = storage.readText(first->layout().aggregateResult(first->getParticipantId()));
  if (aggregate) {
    LOG(first->getParticipantId() << " computed " << aggregate.value());
  }
  return 0;
}

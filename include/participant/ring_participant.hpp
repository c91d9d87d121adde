#pragma once
#include "mpc/key_exchange.hpp"
#include "participant/participant_config.hpp"
#include "participant/record_source.hpp"
#include "participant/stage_orchestrator.hpp"
#include "protocol/artifact_layout.hpp"
#include "ring/ring_directory.hpp"
#include "transport/storage_transport.hpp"
#include "utils/error_codes.hpp"
#include <memory>
#include <string>
#include <vector>

struct InvocationReport {
  RoundStage stage = RoundStage::NoRecord;
  std::string status;
  std::vector<StageAction> performed;
};

// One participant of the ring. Each runOnce() is a single synchronous pass:
// it advances the round as far as the currently visible artifacts allow and
// returns. Waiting on other participants means returning and being invoked
// again later.
class RingParticipant {
public:
  RingParticipant(const ParticipantConfig &config, StorageTransport &storage,
                  RingDirectory &ring_directory,
                  std::unique_ptr<RecordSource> record_source,
                  SecretKeyGenerator key_generator = nullptr);

  ringsum::Result<InvocationReport> runOnce();

  const std::string &getParticipantId() const { return self_id_; }
  const ArtifactLayout &layout() const { return layout_; }

private:
  static constexpr int kMaxStepsPerInvocation = 8;

  std::string self_id_;
  ArtifactLayout layout_;
  AggregationMode aggregate_mode_;
  bool auto_generate_record_;

  StorageTransport &storage_;
  RingDirectory &ring_directory_;
  std::unique_ptr<RecordSource> record_source_;
  SecretKeyGenerator key_generator_;

  ArtifactObservation observe(const NeighborPair &neighbors);

  ringsum::Result<void> generateRecord();
  ringsum::Result<void> publishMaskedRecord(KeyExchange &exchange,
                                            const std::vector<std::string> &ring);
  ringsum::Result<PrivateRecord> loadRecord();
};

#include "participant/ring_participant.hpp"
#include "crypto/mask_generator.hpp"
#include "mpc/secure_sum.hpp"
#include "mpc/sum_computation.hpp"
#include "protocol/parser.hpp"
#include "utils/logging.hpp"
#include <nlohmann/json.hpp>
#include <utility>

namespace {

template <typename T>
ringsum::Result<InvocationReport> abortInvocation(const ringsum::Result<T> &failure,
                                                  const char *during) {
  DEBUG_ERROR("Invocation aborted during " << during << ": "
                                           << ringsum::describeError(failure));
  return ringsum::Result<InvocationReport>(failure.error(), failure.message());
}

} // namespace

RingParticipant::RingParticipant(const ParticipantConfig &config,
                                 StorageTransport &storage,
                                 RingDirectory &ring_directory,
                                 std::unique_ptr<RecordSource> record_source,
                                 SecretKeyGenerator key_generator)
    : self_id_(config.participant_id), layout_(config.app_name),
      aggregate_mode_(config.aggregate_mode),
      auto_generate_record_(config.auto_generate_record), storage_(storage),
      ring_directory_(ring_directory), record_source_(std::move(record_source)),
      key_generator_(std::move(key_generator)) {}

ArtifactObservation RingParticipant::observe(const NeighborPair &neighbors) {
  ArtifactObservation obs;
  obs.has_record = storage_.exists(layout_.privateRecord(self_id_));
  obs.has_first_key = storage_.exists(layout_.firstKey(self_id_));
  obs.has_second_key = storage_.exists(layout_.secondKey(self_id_));
  obs.has_outbound_key = storage_.exists(layout_.firstKey(neighbors.next_id));
  obs.has_masked_record = storage_.exists(layout_.maskedRecord(self_id_));
  obs.has_aggregate = storage_.exists(layout_.aggregateResult(self_id_));
  return obs;
}

ringsum::Result<InvocationReport> RingParticipant::runOnce() {
  auto crypto = MaskGenerator::initialize();
  if (!crypto) {
    return abortInvocation(crypto, "crypto initialization");
  }

  // Membership can change between invocations, so nothing ring-derived is
  // kept across calls
  auto ring_result = ring_directory_.fetchRing();
  if (!ring_result) {
    return abortInvocation(ring_result, "ring fetch");
  }
  const std::vector<std::string> &ring = ring_result.value();

  auto valid = validateRing(ring, self_id_);
  if (!valid) {
    return abortInvocation(valid, "ring validation");
  }

  auto neighbors = resolveNeighbors(ring, self_id_);
  if (!neighbors) {
    return abortInvocation(neighbors, "neighbor resolution");
  }

  KeyExchange exchange(storage_, layout_, self_id_, neighbors.value(), key_generator_);
  SumComputation aggregator(storage_, layout_, aggregate_mode_);

  InvocationReport report;
  for (int step = 0; step < kMaxStepsPerInvocation; ++step) {
    StagePlan plan = planStage(observe(neighbors.value()), auto_generate_record_);
    report.stage = plan.stage;

    if (!plan.next_action) {
      report.status = plan.status;
      if (plan.stage == RoundStage::KeysPending) {
        report.status += " from " + neighbors.value().prev_id;
      }
      DEBUG_INFO("Stopping at stage " << stageName(plan.stage) << ": " << report.status);
      return report;
    }

    StageAction action = *plan.next_action;
    DEBUG_INFO("Stage " << stageName(plan.stage) << " -> " << actionName(action));

    switch (action) {
    case StageAction::GenerateRecord: {
      auto generated = generateRecord();
      if (!generated) {
        return abortInvocation(generated, actionName(action));
      }
      break;
    }

    case StageAction::ExchangeKeys: {
      auto exchanged = exchange.advance();
      if (!exchanged) {
        return abortInvocation(exchanged, actionName(action));
      }
      DEBUG_INFO("Key exchange state: " << keyExchangeStateName(exchanged.value()));
      break;
    }

    case StageAction::PublishMaskedRecord: {
      auto published = publishMaskedRecord(exchange, ring);
      if (!published) {
        return abortInvocation(published, actionName(action));
      }
      break;
    }

    case StageAction::AttemptAggregation: {
      auto aggregated = aggregator.aggregate(ring);
      if (!aggregated) {
        return abortInvocation(aggregated, actionName(action));
      }
      if (!aggregated.value()) {
        report.performed.push_back(action);
        report.status = "waiting for all participants to complete encryption";
        DEBUG_INFO("Stopping at stage " << stageName(plan.stage) << ": " << report.status);
        return report;
      }

      auto persisted = aggregator.persist(self_id_, *aggregated.value());
      if (!persisted) {
        return abortInvocation(persisted, actionName(action));
      }
      break;
    }
    }

    report.performed.push_back(action);
  }

  DEBUG_ERROR("Step limit reached without settling");
  return ringsum::Result<InvocationReport>(ringsum::ErrorCode::SystemStepLimitExceeded,
                                           stageName(report.stage));
}

ringsum::Result<void> RingParticipant::generateRecord() {
  if (!record_source_) {
    return {ringsum::ErrorCode::ConfigInvalidConfiguration,
            "no record source to generate the private record"};
  }

  PrivateRecord record = record_source_->collectRecord();

  auto restricted = storage_.setPermissions(layout_.privateDir(self_id_), {self_id_},
                                            {self_id_});
  if (!restricted) {
    return restricted;
  }

  nlohmann::json j = record;
  std::string location = layout_.privateRecord(self_id_);
  auto written = storage_.writeText(location, j.dump());
  if (written) {
    LOG("Generated 'my_data.json' at " << location << " with random values.");
  }
  return written;
}

ringsum::Result<PrivateRecord> RingParticipant::loadRecord() {
  std::string location = layout_.privateRecord(self_id_);
  auto body = storage_.readText(location);
  if (!body) {
    return ringsum::Result<PrivateRecord>(body.error(), body.message());
  }

  auto record = parsePrivateRecord(body.value());
  if (!record) {
    return ringsum::Result<PrivateRecord>(ringsum::ErrorCode::ProtocolMalformedArtifact,
                                          "bad private record at " + location);
  }
  return std::move(*record);
}

ringsum::Result<void>
RingParticipant::publishMaskedRecord(KeyExchange &exchange,
                                     const std::vector<std::string> &ring) {
  DEBUG_INFO("Attempting encryption of data");

  auto record = loadRecord();
  if (!record) {
    return {record.error(), record.message()};
  }

  auto keys = exchange.loadKeys();
  if (!keys) {
    return {keys.error(), keys.message()};
  }

  auto masked = SecureSumModule::maskRecord(record.value(), keys.value());
  if (!masked) {
    return {masked.error(), masked.message()};
  }

  SecureSumModule module(storage_, layout_, self_id_);
  return module.publish(masked.value(), ring);
}

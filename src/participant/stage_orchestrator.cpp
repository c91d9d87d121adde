#include "participant/stage_orchestrator.hpp"
#include <utility>

namespace {

bool keyExchangeNeedsWork(const ArtifactObservation &obs) {
  return !obs.has_second_key || !obs.has_outbound_key;
}

StagePlan makePlan(RoundStage stage, StageAction action) {
  return StagePlan{stage, action, ""};
}

StagePlan makeIdle(RoundStage stage, std::string status) {
  return StagePlan{stage, std::nullopt, std::move(status)};
}

} // namespace

RoundStage classifyStage(const ArtifactObservation &obs) {
  if (obs.has_aggregate) {
    return RoundStage::Aggregated;
  }
  if (obs.has_masked_record) {
    return RoundStage::Masked;
  }
  if (!obs.has_record) {
    return RoundStage::NoRecord;
  }
  if (obs.has_first_key && obs.has_second_key && obs.has_outbound_key) {
    return RoundStage::KeysReady;
  }
  return RoundStage::KeysPending;
}

StagePlan planStage(const ArtifactObservation &obs, bool auto_generate_record) {
  RoundStage stage = classifyStage(obs);

  switch (stage) {
  case RoundStage::Aggregated:
    return makeIdle(stage, "aggregate complete");

  case RoundStage::Masked:
    return makePlan(stage, StageAction::AttemptAggregation);

  case RoundStage::KeysReady:
    return makePlan(stage, StageAction::PublishMaskedRecord);

  case RoundStage::KeysPending:
    if (keyExchangeNeedsWork(obs)) {
      return makePlan(stage, StageAction::ExchangeKeys);
    }
    return makeIdle(stage, "waiting on keys");

  case RoundStage::NoRecord:
    if (auto_generate_record) {
      return makePlan(stage, StageAction::GenerateRecord);
    }
    // Neighbors depend on our key even while we have nothing to contribute
    if (keyExchangeNeedsWork(obs)) {
      return makePlan(stage, StageAction::ExchangeKeys);
    }
    return makeIdle(stage, "waiting for private record");
  }
  return makeIdle(stage, "unknown stage");
}

const char *stageName(RoundStage stage) {
  switch (stage) {
  case RoundStage::NoRecord:
    return "NoRecord";
  case RoundStage::KeysPending:
    return "KeysPending";
  case RoundStage::KeysReady:
    return "KeysReady";
  case RoundStage::Masked:
    return "Masked";
  case RoundStage::Aggregated:
    return "Aggregated";
  }
  return "Unknown";
}

const char *actionName(StageAction action) {
  switch (action) {
  case StageAction::GenerateRecord:
    return "GenerateRecord";
  case StageAction::ExchangeKeys:
    return "ExchangeKeys";
  case StageAction::PublishMaskedRecord:
    return "PublishMaskedRecord";
  case StageAction::AttemptAggregation:
    return "AttemptAggregation";
  }
  return "Unknown";
}

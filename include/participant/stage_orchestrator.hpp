#pragma once
#include <optional>
#include <string>

// Round progress as seen from one participant, derived purely from which
// artifacts are visible:
//   NoRecord     no private record yet
//   KeysPending  record present, key exchange not finished
//   KeysReady    both keys present and our key delivered downstream
//   Masked       masked record published, waiting for the rest of the ring
//   Aggregated   aggregate persisted; terminal for the round
enum class RoundStage { NoRecord = 0, KeysPending, KeysReady, Masked, Aggregated };

enum class StageAction {
  GenerateRecord = 0,
  ExchangeKeys,
  PublishMaskedRecord,
  AttemptAggregation
};

struct ArtifactObservation {
  bool has_record = false;
  bool has_first_key = false;
  bool has_second_key = false;
  bool has_outbound_key = false; // our second key at the next neighbor
  bool has_masked_record = false;
  bool has_aggregate = false;
};

struct StagePlan {
  RoundStage stage;
  std::optional<StageAction> next_action;
  std::string status; // why we stop when next_action is empty
};

RoundStage classifyStage(const ArtifactObservation &observation);

// Pure transition function: what to do next given what is visible. The
// runner executes the action, re-observes, and asks again.
StagePlan planStage(const ArtifactObservation &observation,
                    bool auto_generate_record);

const char *stageName(RoundStage stage);
const char *actionName(StageAction action);

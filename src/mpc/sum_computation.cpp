#include "mpc/sum_computation.hpp"
#include "protocol/parser.hpp"
#include "utils/logging.hpp"
#include <nlohmann/json.hpp>

SumComputation::SumComputation(StorageTransport &storage,
                               const ArtifactLayout &layout, AggregationMode mode)
    : storage_(storage), layout_(layout), mode_(mode) {}

ringsum::Result<std::optional<AggregateResult>>
SumComputation::aggregate(const std::vector<std::string> &ring) {
  using AggregateOutcome = ringsum::Result<std::optional<AggregateResult>>;

  DEBUG_DEBUG("=== COMPUTING SUM ===");
  DEBUG_DEBUG("Collecting masked records from " << ring.size() << " members");

  std::vector<MaskedRecord> records;
  records.reserve(ring.size());

  for (const auto &member : ring) {
    std::string location = layout_.maskedRecord(member);
    if (!storage_.exists(location)) {
      LOG("Waiting for " << location << " to be available.");
      return AggregateOutcome(std::optional<AggregateResult>{});
    }

    auto body = storage_.readText(location);
    if (!body) {
      // Visible a moment ago; treat a vanished file as not-yet-synced
      if (body.error() == ringsum::ErrorCode::TransportNotFound) {
        return AggregateOutcome(std::optional<AggregateResult>{});
      }
      return AggregateOutcome(body.error(), body.message());
    }

    auto record = parseMaskedRecord(body.value());
    if (!record) {
      return AggregateOutcome(ringsum::ErrorCode::ProtocolMalformedArtifact,
                              "bad masked record from " + member);
    }
    records.push_back(std::move(*record));
  }

  auto result = aggregateRecords(records, mode_);
  if (!result) {
    return AggregateOutcome(result.error(), result.message());
  }
  DEBUG_DEBUG("===================");
  return AggregateOutcome(std::optional<AggregateResult>(result.moveValue()));
}

ringsum::Result<AggregateResult>
SumComputation::aggregateRecords(const std::vector<MaskedRecord> &records,
                                 AggregationMode mode) {
  AggregateResult result;
  result.mode = mode;
  result.participant_count = records.size();

  if (records.empty()) {
    DEBUG_DEBUG("No masked records to aggregate");
    return result;
  }

  for (const auto &[field, value] : records.front().fields) {
    result.sums[field] = 0;
  }

  for (const auto &record : records) {
    if (record.fields.size() != result.sums.size()) {
      return ringsum::Result<AggregateResult>(ringsum::ErrorCode::ProtocolFieldMismatch,
                                              "records carry different field counts");
    }
    for (const auto &[field, value] : record.fields) {
      auto it = result.sums.find(field);
      if (it == result.sums.end()) {
        return ringsum::Result<AggregateResult>(ringsum::ErrorCode::ProtocolFieldMismatch,
                                                "unexpected field " + field);
      }
      if (__builtin_add_overflow(it->second, value, &it->second)) {
        return ringsum::Result<AggregateResult>(ringsum::ErrorCode::ProtocolMalformedArtifact,
                                                "sum of " + field + " overflows");
      }
    }
  }

  for (const auto &[field, total] : result.sums) {
    DEBUG_DEBUG("Final " << field << ": " << total);
  }
  return result;
}

ringsum::Result<void> SumComputation::persist(const std::string &self_id,
                                              const AggregateResult &result) {
  auto restricted = storage_.setPermissions(layout_.privateAppDir(self_id),
                                            {self_id}, {self_id});
  if (!restricted) {
    return restricted;
  }

  nlohmann::json j = result;
  std::string location = layout_.aggregateResult(self_id);
  auto written = storage_.writeText(location, j.dump());
  if (written) {
    LOG("Aggregate (" << aggregationModeName(result.mode) << ") data saved to "
                      << location);
  }
  return written;
}

bool SumComputation::isPersisted(const std::string &self_id) {
  return storage_.exists(layout_.aggregateResult(self_id));
}

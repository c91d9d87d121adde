#pragma once
#include "protocol/artifact_layout.hpp"
#include "protocol/artifacts.hpp"
#include "transport/storage_transport.hpp"
#include "utils/error_codes.hpp"
#include <optional>
#include <string>
#include <vector>

// Aggregation half of the secure sum: adds up every ring member's masked
// record. The pairwise masks cancel, so the totals are the true sums.
class SumComputation {
public:
  SumComputation(StorageTransport &storage, const ArtifactLayout &layout,
                 AggregationMode mode);

  // Empty while any member's masked record is not yet visible (pending, not
  // an error). The mean divides by the ring passed in here.
  ringsum::Result<std::optional<AggregateResult>>
  aggregate(const std::vector<std::string> &ring);

  // Field-by-field total; every record must carry the same fields
  static ringsum::Result<AggregateResult>
  aggregateRecords(const std::vector<MaskedRecord> &records, AggregationMode mode);

  // Private to `self_id`
  ringsum::Result<void> persist(const std::string &self_id,
                                const AggregateResult &result);

  bool isPersisted(const std::string &self_id);

private:
  StorageTransport &storage_;
  const ArtifactLayout &layout_;
  AggregationMode mode_;
};

#pragma once
#include <cstddef>
#include <cstdint>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

// Field name -> value. std::map keeps fields sorted by name, which is the
// canonical order every record is processed in.
using FieldValues = std::map<std::string, int64_t>;

// Private values lie in [-2^52, 2^52]. Masked values carry one mask
// difference (|d| < 2^30) on top, and sums over any ring short of 2^10
// members stay inside int64_t.
constexpr int64_t kMaxFieldMagnitude = int64_t{1} << 52;
constexpr int64_t kMaxMaskedMagnitude = kMaxFieldMagnitude + (int64_t{1} << 30);

inline bool fieldsWithin(const FieldValues &fields, int64_t bound) {
  for (const auto &[field, value] : fields) {
    if (value < -bound || value > bound) {
      return false;
    }
  }
  return true;
}

enum class AggregationMode { Sum = 0, Mean };

// Owned by exactly one participant; never rewritten once persisted
struct PrivateRecord {
  FieldValues fields;
};

// Public counterpart of a PrivateRecord: same fields, masked values
struct MaskedRecord {
  FieldValues fields;
};

struct MaskingKeys {
  std::optional<uint64_t> first_key;  // deposited by the previous neighbor
  std::optional<uint64_t> second_key; // generated locally, sent to the next neighbor

  bool ready() const { return first_key.has_value() && second_key.has_value(); }
};

struct AggregateResult {
  AggregationMode mode = AggregationMode::Mean;
  std::size_t participant_count = 0;
  FieldValues sums;

  double mean(const std::string &field) const {
    if (participant_count == 0) {
      return 0.0;
    }
    return static_cast<double>(sums.at(field)) /
           static_cast<double>(participant_count);
  }
};

struct RingDocument {
  std::vector<std::string> ring;
};

inline const char *aggregationModeName(AggregationMode mode) {
  return mode == AggregationMode::Sum ? "sum" : "mean";
}

inline std::optional<AggregationMode>
parseAggregationMode(const std::string &name) {
  if (name == "sum") {
    return AggregationMode::Sum;
  }
  if (name == "mean") {
    return AggregationMode::Mean;
  }
  return std::nullopt;
}

// JSON conversion functions for PrivateRecord (flat object of integers)
inline void to_json(nlohmann::json &j, const PrivateRecord &r) {
  j = nlohmann::json(r.fields);
}

inline void from_json(const nlohmann::json &j, PrivateRecord &r) {
  j.get_to(r.fields);
}

// JSON conversion functions for MaskedRecord
inline void to_json(nlohmann::json &j, const MaskedRecord &r) {
  j = nlohmann::json(r.fields);
}

inline void from_json(const nlohmann::json &j, MaskedRecord &r) {
  r.fields.clear();
  for (const auto &[field, value] : j.items()) {
    // Older publishers encode each masked value as a decimal string
    if (value.is_string()) {
      const auto &text = value.get_ref<const std::string &>();
      size_t consumed = 0;
      r.fields[field] = std::stoll(text, &consumed);
      if (consumed != text.size()) {
        throw std::invalid_argument("trailing characters in masked value for " + field);
      }
    } else {
      r.fields[field] = value.get<int64_t>();
    }
  }
}

// JSON conversion for AggregateResult: sums in Sum mode, per-member means in
// Mean mode
inline void to_json(nlohmann::json &j, const AggregateResult &r) {
  j = nlohmann::json::object();
  for (const auto &[field, total] : r.sums) {
    if (r.mode == AggregationMode::Sum) {
      j[field] = total;
    } else {
      j[field] = r.mean(field);
    }
  }
}

// JSON conversion functions for RingDocument
inline void to_json(nlohmann::json &j, const RingDocument &d) {
  j = nlohmann::json{{"ring", d.ring}};
}

inline void from_json(const nlohmann::json &j, RingDocument &d) {
  j.at("ring").get_to(d.ring);
}

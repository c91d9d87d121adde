#include "protocol/parser.hpp"
#include "crypto/mask_generator.hpp"
#include "utils/logging.hpp"
#include <cctype>
#include <nlohmann/json.hpp>
#include <optional>

namespace {

// Checked before get<int64_t>(), which wraps unsigned values above INT64_MAX
bool integerWithin(const nlohmann::json &value, int64_t bound) {
  if (value.is_number_unsigned()) {
    return value.get<uint64_t>() <= static_cast<uint64_t>(bound);
  }
  if (value.is_number_integer()) {
    int64_t x = value.get<int64_t>();
    return x >= -bound && x <= bound;
  }
  return false;
}

} // namespace

std::optional<PrivateRecord> parsePrivateRecord(const std::string &body) {
  try {
    DEBUG_DEBUG("Parsing PrivateRecord");
    nlohmann::json j = nlohmann::json::parse(body);

    if (!j.is_object() || j.empty()) {
      DEBUG_DEBUG("Private record must be a non-empty object");
      return std::nullopt;
    }
    for (const auto &[field, value] : j.items()) {
      if (!value.is_number_integer()) {
        DEBUG_DEBUG("Private record field '" << field << "' is not an integer");
        return std::nullopt;
      }
      if (!integerWithin(value, kMaxFieldMagnitude)) {
        DEBUG_DEBUG("Private record field '" << field << "' is out of range");
        return std::nullopt;
      }
    }

    return j.get<PrivateRecord>();

  } catch (const nlohmann::json::exception &e) {
    DEBUG_ERROR("JSON parsing error: " << e.what());
    return std::nullopt;
  }
}

std::optional<MaskedRecord> parseMaskedRecord(const std::string &body) {
  try {
    DEBUG_DEBUG("Parsing MaskedRecord");
    nlohmann::json j = nlohmann::json::parse(body);

    if (!j.is_object() || j.empty()) {
      DEBUG_DEBUG("Masked record must be a non-empty object");
      return std::nullopt;
    }
    for (const auto &[field, value] : j.items()) {
      if (!value.is_number_integer() && !value.is_string()) {
        DEBUG_DEBUG("Masked record field '" << field << "' is not an integer");
        return std::nullopt;
      }
      if (value.is_number_integer() && !integerWithin(value, kMaxMaskedMagnitude)) {
        DEBUG_DEBUG("Masked record field '" << field << "' is out of range");
        return std::nullopt;
      }
    }

    auto record = j.get<MaskedRecord>();
    if (!fieldsWithin(record.fields, kMaxMaskedMagnitude)) {
      DEBUG_DEBUG("Masked record has a value out of range");
      return std::nullopt;
    }
    return record;

  } catch (const nlohmann::json::exception &e) {
    DEBUG_ERROR("JSON parsing error: " << e.what());
    return std::nullopt;
  } catch (const std::exception &e) {
    // std::stoll on a non-numeric string value
    DEBUG_ERROR("Masked record has a non-numeric value: " << e.what());
    return std::nullopt;
  }
}

std::optional<std::vector<std::string>>
parseRingDocument(const std::string &body) {
  try {
    DEBUG_DEBUG("Parsing RingDocument");
    nlohmann::json j = nlohmann::json::parse(body);

    if (!j.contains("ring") || !j["ring"].is_array()) {
      DEBUG_DEBUG("Missing 'ring' array in ring document");
      return std::nullopt;
    }

    return j.get<RingDocument>().ring;

  } catch (const nlohmann::json::exception &e) {
    DEBUG_ERROR("JSON parsing error: " << e.what());
    return std::nullopt;
  }
}

std::optional<uint64_t> parseSecretKey(const std::string &body) {
  size_t begin = 0;
  size_t end = body.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(body[begin]))) {
    ++begin;
  }
  while (end > begin && std::isspace(static_cast<unsigned char>(body[end - 1]))) {
    --end;
  }

  // 2^30 has 10 digits
  if (begin == end || end - begin > 10) {
    return std::nullopt;
  }

  uint64_t key = 0;
  for (size_t i = begin; i < end; ++i) {
    if (!std::isdigit(static_cast<unsigned char>(body[i]))) {
      return std::nullopt;
    }
    key = key * 10 + static_cast<uint64_t>(body[i] - '0');
  }

  if (!MaskGenerator::isValidKey(key)) {
    DEBUG_DEBUG("Secret key out of range: " << key);
    return std::nullopt;
  }
  return key;
}

std::string serializeSecretKey(uint64_t key) { return std::to_string(key); }

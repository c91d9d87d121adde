#include "mpc/secure_sum.hpp"
#include "crypto/mask_generator.hpp"
#include "utils/logging.hpp"
#include <nlohmann/json.hpp>
#include <utility>

SecureSumModule::SecureSumModule(StorageTransport &storage,
                                 const ArtifactLayout &layout, std::string self_id)
    : storage_(storage), layout_(layout), self_id_(std::move(self_id)) {}

ringsum::Result<MaskedRecord> SecureSumModule::maskRecord(const PrivateRecord &record,
                                                          const MaskingKeys &keys) {
  if (!keys.ready()) {
    return ringsum::Result<MaskedRecord>(
        ringsum::ErrorCode::ProtocolKeysNotReady,
        keys.first_key ? "second key missing" : "first key missing");
  }

  if (!fieldsWithin(record.fields, kMaxFieldMagnitude)) {
    return ringsum::Result<MaskedRecord>(ringsum::ErrorCode::ProtocolMalformedArtifact,
                                         "private value out of range");
  }

  DEBUG_DEBUG("=== MASKING RECORD ===");
  MaskedRecord masked;

  // record.fields is a std::map, so this walks the fields in name order
  for (const auto &[field, value] : record.fields) {
    int64_t diff =
        MaskGenerator::maskDifference(*keys.first_key, *keys.second_key, field);
    masked.fields[field] = value + diff;
    DEBUG_DEBUG("Masked field " << field);
  }

  DEBUG_DEBUG("Masked " << masked.fields.size() << " fields");
  DEBUG_DEBUG("======================");
  return masked;
}

ringsum::Result<void> SecureSumModule::publish(const MaskedRecord &masked,
                                               const std::vector<std::string> &ring) {
  auto opened = storage_.setPermissions(layout_.publicAppDir(self_id_), ring,
                                        {self_id_});
  if (!opened) {
    return opened;
  }

  nlohmann::json j = masked;
  std::string location = layout_.maskedRecord(self_id_);
  auto written = storage_.writeText(location, j.dump());
  if (written) {
    LOG("Encrypted data saved to " << location);
  }
  return written;
}

bool SecureSumModule::isPublished() {
  return storage_.exists(layout_.maskedRecord(self_id_));
}

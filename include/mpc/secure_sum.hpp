#pragma once
#include "protocol/artifact_layout.hpp"
#include "protocol/artifacts.hpp"
#include "transport/storage_transport.hpp"
#include "utils/error_codes.hpp"
#include <string>
#include <vector>

// Masking half of the secure sum. A participant's masked value for field f is
//
//   value[f] + mask(first_key, f) - mask(second_key, f)
//
// Every key is one participant's second key and its successor's first key, so
// summed over the whole ring the offsets cancel and only the true sum remains.
class SecureSumModule {
public:
  SecureSumModule(StorageTransport &storage, const ArtifactLayout &layout,
                  std::string self_id);

  // Pure; ProtocolKeysNotReady unless both keys are present
  static ringsum::Result<MaskedRecord> maskRecord(const PrivateRecord &record,
                                                  const MaskingKeys &keys);

  // Opens the public directory to the ring, then writes the masked record
  ringsum::Result<void> publish(const MaskedRecord &masked,
                                const std::vector<std::string> &ring);

  bool isPublished();

private:
  StorageTransport &storage_;
  const ArtifactLayout &layout_;
  std::string self_id_;
};

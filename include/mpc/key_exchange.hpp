#pragma once
#include "protocol/artifact_layout.hpp"
#include "protocol/artifacts.hpp"
#include "ring/ring_directory.hpp"
#include "transport/storage_transport.hpp"
#include "utils/error_codes.hpp"
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

enum class KeyExchangeState { NoKeys = 0, SecondKeyReady, KeysComplete };

const char *keyExchangeStateName(KeyExchangeState state);

using SecretKeyGenerator = std::function<uint64_t()>;

// Pairwise exchange with the ring neighbors. Each participant generates its
// "second" key, keeps it owner-only, and deposits the same value as the next
// neighbor's "first" key. The exchange completes once the previous neighbor
// has done the same for us.
class KeyExchange {
public:
  KeyExchange(StorageTransport &storage, const ArtifactLayout &layout,
              std::string self_id, NeighborPair neighbors,
              SecretKeyGenerator key_generator = nullptr);

  KeyExchangeState state();

  // Whether our second key is visible at the next neighbor's first-key
  // location
  bool outboundDeposited();

  // Runs as much of the exchange as is possible right now. Never regenerates
  // an existing second key; re-deposits it if the outbound copy is missing.
  ringsum::Result<KeyExchangeState> advance();

  // Whatever keys are present; unset members are still missing
  ringsum::Result<MaskingKeys> loadKeys();

private:
  StorageTransport &storage_;
  const ArtifactLayout &layout_;
  std::string self_id_;
  NeighborPair neighbors_;
  SecretKeyGenerator key_generator_;

  ringsum::Result<void> restrictKeyLocations();
  ringsum::Result<void> depositOutbound(uint64_t second_key);
  ringsum::Result<std::optional<uint64_t>> readKey(const std::string &location);
};

#include "mpc/key_exchange.hpp"
#include "crypto/mask_generator.hpp"
#include "protocol/parser.hpp"
#include "utils/logging.hpp"
#include <utility>

const char *keyExchangeStateName(KeyExchangeState state) {
  switch (state) {
  case KeyExchangeState::NoKeys:
    return "NO_KEYS";
  case KeyExchangeState::SecondKeyReady:
    return "SECOND_KEY_READY";
  case KeyExchangeState::KeysComplete:
    return "KEYS_COMPLETE";
  }
  return "UNKNOWN";
}

KeyExchange::KeyExchange(StorageTransport &storage, const ArtifactLayout &layout,
                         std::string self_id, NeighborPair neighbors,
                         SecretKeyGenerator key_generator)
    : storage_(storage), layout_(layout), self_id_(std::move(self_id)),
      neighbors_(std::move(neighbors)), key_generator_(std::move(key_generator)) {
  if (!key_generator_) {
    key_generator_ = &MaskGenerator::generateSecretKey;
  }
}

KeyExchangeState KeyExchange::state() {
  if (!storage_.exists(layout_.secondKey(self_id_))) {
    return KeyExchangeState::NoKeys;
  }
  if (!storage_.exists(layout_.firstKey(self_id_))) {
    return KeyExchangeState::SecondKeyReady;
  }
  return KeyExchangeState::KeysComplete;
}

bool KeyExchange::outboundDeposited() {
  return storage_.exists(layout_.firstKey(neighbors_.next_id));
}

ringsum::Result<void> KeyExchange::restrictKeyLocations() {
  // Only the next neighbor may read what we deposit for them
  auto outbound = storage_.setPermissions(layout_.firstKeyDir(neighbors_.next_id),
                                          {neighbors_.next_id}, {self_id_});
  if (!outbound) {
    return outbound;
  }

  auto own = storage_.setPermissions(layout_.secondKeyDir(self_id_), {self_id_},
                                     {self_id_});
  if (!own) {
    return own;
  }

  DEBUG_INFO("Folder permissions set up.");
  return {};
}

ringsum::Result<void> KeyExchange::depositOutbound(uint64_t second_key) {
  std::string location = layout_.firstKey(neighbors_.next_id);
  auto written = storage_.writeText(location, serializeSecretKey(second_key));
  if (written) {
    LOG("Sent secret value to " << location);
  }
  return written;
}

ringsum::Result<KeyExchangeState> KeyExchange::advance() {
  KeyExchangeState current = state();

  if (current == KeyExchangeState::NoKeys) {
    // Permissions go first so the secret is never visible to anyone else
    auto restricted = restrictKeyLocations();
    if (!restricted) {
      return ringsum::Result<KeyExchangeState>(restricted.error(), restricted.message());
    }

    DEBUG_INFO("Second key does not exist. Creating a new one.");
    uint64_t second_key = key_generator_();
    if (!MaskGenerator::isValidKey(second_key)) {
      return ringsum::Result<KeyExchangeState>(ringsum::ErrorCode::ProtocolMalformedArtifact,
                                               "generated key out of range");
    }

    std::string location = layout_.secondKey(self_id_);
    auto stored = storage_.writeText(location, serializeSecretKey(second_key));
    if (!stored) {
      return ringsum::Result<KeyExchangeState>(stored.error(), stored.message());
    }
    LOG("Created secret value in " << location);

    auto deposited = depositOutbound(second_key);
    if (!deposited) {
      return ringsum::Result<KeyExchangeState>(deposited.error(), deposited.message());
    }
  } else if (!outboundDeposited()) {
    // An earlier invocation stored the key but failed to hand it over
    DEBUG_WARN("Second key exists but was not delivered to " << neighbors_.next_id
                                                             << ", re-sending");
    auto restricted = restrictKeyLocations();
    if (!restricted) {
      return ringsum::Result<KeyExchangeState>(restricted.error(), restricted.message());
    }

    auto second_key = readKey(layout_.secondKey(self_id_));
    if (!second_key) {
      return ringsum::Result<KeyExchangeState>(second_key.error(), second_key.message());
    }
    if (!second_key.value()) {
      return ringsum::Result<KeyExchangeState>(ringsum::ErrorCode::TransportNotFound,
                                               layout_.secondKey(self_id_));
    }

    auto deposited = depositOutbound(*second_key.value());
    if (!deposited) {
      return ringsum::Result<KeyExchangeState>(deposited.error(), deposited.message());
    }
  }

  current = state();
  if (current == KeyExchangeState::KeysComplete) {
    DEBUG_INFO("Key exchange complete.");
  } else {
    DEBUG_INFO("Key exchange incomplete, waiting on " << neighbors_.prev_id);
  }
  return current;
}

ringsum::Result<std::optional<uint64_t>>
KeyExchange::readKey(const std::string &location) {
  using KeyResult = ringsum::Result<std::optional<uint64_t>>;

  if (!storage_.exists(location)) {
    return KeyResult(std::optional<uint64_t>{});
  }

  auto text = storage_.readText(location);
  if (!text) {
    return KeyResult(text.error(), text.message());
  }

  auto key = parseSecretKey(text.value());
  if (!key) {
    return KeyResult(ringsum::ErrorCode::ProtocolMalformedArtifact,
                     "bad key at " + location);
  }
  return KeyResult(key);
}

ringsum::Result<MaskingKeys> KeyExchange::loadKeys() {
  MaskingKeys keys;

  auto first = readKey(layout_.firstKey(self_id_));
  if (!first) {
    return ringsum::Result<MaskingKeys>(first.error(), first.message());
  }
  keys.first_key = first.value();

  auto second = readKey(layout_.secondKey(self_id_));
  if (!second) {
    return ringsum::Result<MaskingKeys>(second.error(), second.message());
  }
  keys.second_key = second.value();

  return keys;
}

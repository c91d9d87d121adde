#pragma once
#include "protocol/artifacts.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

std::optional<PrivateRecord> parsePrivateRecord(const std::string &body);
std::optional<MaskedRecord> parseMaskedRecord(const std::string &body);
std::optional<std::vector<std::string>> parseRingDocument(const std::string &body);

// Decimal key text, surrounding whitespace allowed; must lie in [1, 2^30]
std::optional<uint64_t> parseSecretKey(const std::string &body);
std::string serializeSecretKey(uint64_t key);

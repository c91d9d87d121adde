#include "crypto/mask_generator.hpp"
#include "utils/logging.hpp"
#include <array>
#include <sodium.h>
#include <stdexcept>
#include <vector>

namespace {

constexpr char kMaskDomain[] = "ringsum.mask.v1";
constexpr size_t kDigestBytes = 16;

} // namespace

ringsum::Result<void> MaskGenerator::initialize() {
    // Initialize libsodium if not already done
    if (sodium_init() < 0) {
        return {ringsum::ErrorCode::CryptoInitializationFailed, "sodium_init failed"};
    }
    return {};
}

void MaskGenerator::ensureInitialized() {
    if (!initialize()) {
        throw std::runtime_error("Failed to initialize libsodium");
    }
}

int64_t MaskGenerator::mask(uint64_t key, const std::string& field_name) {
    ensureInitialized();

    // Domain tag, separator, little-endian key, field name
    std::vector<unsigned char> message;
    message.reserve(sizeof(kMaskDomain) + 8 + field_name.size());
    message.insert(message.end(), kMaskDomain, kMaskDomain + sizeof(kMaskDomain) - 1);
    message.push_back(0x00);
    for (int i = 0; i < 8; ++i) {
        message.push_back(static_cast<unsigned char>((key >> (8 * i)) & 0xff));
    }
    message.insert(message.end(), field_name.begin(), field_name.end());

    std::array<unsigned char, kDigestBytes> digest{};
    if (crypto_generichash(digest.data(), digest.size(),
                           message.data(), message.size(),
                           nullptr, 0) != 0) {
        throw std::runtime_error("Failed to hash mask input");
    }

    uint64_t value = 0;
    for (int i = 0; i < 8; ++i) {
        value |= static_cast<uint64_t>(digest[i]) << (8 * i);
    }

    // 2^30 divides 2^64, so the reduction is unbiased
    return static_cast<int64_t>(1 + (value % kStatisticalSecurity));
}

int64_t MaskGenerator::maskDifference(uint64_t first_key, uint64_t second_key,
                                      const std::string& field_name) {
    return mask(first_key, field_name) - mask(second_key, field_name);
}

uint64_t MaskGenerator::generateSecretKey() {
    ensureInitialized();

    uint64_t key = 1 + static_cast<uint64_t>(
        randombytes_uniform(static_cast<uint32_t>(kStatisticalSecurity)));
    DEBUG_DEBUG("Generated new secret key");
    return key;
}

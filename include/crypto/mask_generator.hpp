#pragma once
#include "utils/error_codes.hpp"
#include <cstdint>
#include <string>

class MaskGenerator {
public:
    // Keys and masks both live in [1, kStatisticalSecurity]
    static constexpr uint64_t kStatisticalSecurity = uint64_t{1} << 30;

    // Deterministic keyed PRF: BLAKE2b over
    //   "ringsum.mask.v1" || 0x00 || u64le(key) || field_name
    // reduced to 1 + (digest mod 2^30).
    static int64_t mask(uint64_t key, const std::string& field_name);

    // mask(first_key, field) - mask(second_key, field)
    static int64_t maskDifference(uint64_t first_key, uint64_t second_key,
                                  const std::string& field_name);

    // Uniform secret in [1, kStatisticalSecurity] from the OS CSPRNG
    static uint64_t generateSecretKey();

    // CryptoInitializationFailed if libsodium cannot start
    static ringsum::Result<void> initialize();

    static bool isValidKey(uint64_t key) {
        return key >= 1 && key <= kStatisticalSecurity;
    }

private:
    static void ensureInitialized();
};

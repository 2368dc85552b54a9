#include "qkdsim/qkdsim.h"
#include "qkdsim/secure_cleanup.h"
#include "qkdsim/debug_log.h"
#include <sodium.h>
#include <algorithm>

namespace qkdsim::key_derivation {
    namespace {
        constexpr size_t kBitCountLength = sizeof(uint64_t);
    }

    Result pack_bits(const Bit *bits, const size_t bit_count, secure_bytes &packed) {
        if (!bits && bit_count > 0) [[unlikely]] {
            return Result::InvalidInput;
        }
        packed.assign((bit_count + 7) / 8, 0);
        for (size_t i = 0; i < bit_count; ++i) {
            if (bits[i] == Bit::One) {
                packed[i / 8] |= static_cast<uint8_t>(0x80u >> (i % 8));
            }
        }
        return Result::Success;
    }

    Result derive(const Bit *bits, const size_t bit_count, DerivedKey &key) {
        log::section("KDF: Derive cipher key");
        if (bit_count == 0) {
            return Result::InsufficientEntropy;
        }
        if (!bits) [[unlikely]] {
            return Result::InvalidInput;
        }
        if (!crypto::init()) {
            return Result::CryptoError;
        }
        log::count("input bit count", bit_count);

        secure_bytes ikm;
        auto cleanup_guard = make_cleanup([&] { secure_wipe(ikm); });
        QKDSIM_TRY(pack_bits(bits, bit_count, ikm));

        /* Bit count suffix keeps [1] and [1, 0] apart after zero padding. */
        const auto count = static_cast<uint64_t>(bit_count);
        for (size_t i = 0; i < kBitCountLength; ++i) {
            ikm.push_back(static_cast<uint8_t>(count >> (8 * (kBitCountLength - 1 - i))));
        }

        SecureLocal<PRK_LENGTH> prk;
        QKDSIM_TRY(crypto::key_derivation_extract(reinterpret_cast<const uint8_t *>(labels::kKdfSalt),
                                                  labels::kKdfSaltLength,
                                                  ikm.data(), ikm.size(), prk));

        key.material.resize(DERIVED_KEY_LENGTH);
        if (const Result result = crypto::key_derivation_expand(prk, prk.size(),
                                                                reinterpret_cast<const uint8_t *>(labels::kKdfInfo),
                                                                labels::kKdfInfoLength,
                                                                key.material.data(), key.material.size());
            result != Result::Success) {
            secure_clear(key.material);
            return result;
        }
        log::msg("derived key ready");
        return Result::Success;
    }

    Result derive(const BitString &bits, DerivedKey &key) {
        return derive(bits.data(), bits.size(), key);
    }
}

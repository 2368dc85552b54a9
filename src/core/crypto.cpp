#include "qkdsim/qkdsim.h"
#include "qkdsim/secure_cleanup.h"
#include <sodium.h>
#include <algorithm>
#include <mutex>

namespace qkdsim::crypto {
    namespace {
        constexpr size_t kChaChaBlockLength = 64;
        static_assert(RANDOM_POOL_LENGTH == kChaChaBlockLength,
                      "Seeded source refills exactly one ChaCha20 block");
        static_assert(SEED_KEY_LENGTH == crypto_stream_chacha20_KEYBYTES,
                      "Seed key must be a ChaCha20 key");
    }

    bool init() {
        static std::once_flag init_flag;
        static bool init_success = false;

        std::call_once(init_flag, [] {
            init_success = sodium_init() != -1;
        });

        return init_success;
    }

    Result random_bytes(uint8_t *buffer, size_t length) {
        if (!buffer || length == 0) [[unlikely]] {
            return Result::InvalidInput;
        }
        if (!init()) {
            return Result::CryptoError;
        }
        randombytes_buf(buffer, length);
        return Result::Success;
    }

    Result hmac(const uint8_t *key, const size_t key_length,
                const uint8_t *message, const size_t message_length,
                uint8_t *mac) {
        if (!key || key_length == 0 || !message || message_length == 0 || !mac) [[unlikely]] {
            return Result::InvalidInput;
        }
        if (!init()) {
            return Result::CryptoError;
        }
        crypto_auth_hmacsha512_state state;
        if (crypto_auth_hmacsha512_init(&state, key, key_length) != 0) [[unlikely]] {
            return Result::CryptoError;
        }
        if (crypto_auth_hmacsha512_update(&state, message, message_length) != 0) [[unlikely]] {
            return Result::CryptoError;
        }
        if (crypto_auth_hmacsha512_final(&state, mac) != 0) [[unlikely]] {
            return Result::CryptoError;
        }
        sodium_memzero(&state, sizeof(state));
        return Result::Success;
    }

    Result key_derivation_extract(const uint8_t *salt, size_t salt_length,
                                  const uint8_t *ikm, size_t ikm_length,
                                  uint8_t *prk) {
        if (!salt || salt_length == 0 || !ikm || ikm_length == 0 || !prk) [[unlikely]] {
            return Result::InvalidInput;
        }
        return hmac(salt, salt_length, ikm, ikm_length, prk);
    }

    Result key_derivation_expand(const uint8_t *prk, const size_t prk_length,
                                 const uint8_t *info, const size_t info_length,
                                 uint8_t *okm, const size_t okm_length) {
        if (!prk || prk_length == 0 || !okm || okm_length == 0) [[unlikely]] {
            return Result::InvalidInput;
        }
        if (info_length > 0 && !info) [[unlikely]] {
            return Result::InvalidInput;
        }
        constexpr size_t hash_length = crypto_auth_hmacsha512_BYTES;
        constexpr size_t kHkdfMaxBlocks = 255;
        const size_t n = (okm_length + hash_length - 1) / hash_length;
        if (n > kHkdfMaxBlocks) [[unlikely]] {
            return Result::InvalidInput;
        }
        secure_bytes t_prev(hash_length);
        secure_bytes t_current(hash_length);
        secure_bytes input;
        input.reserve(hash_length + info_length + 1);
        auto cleanup_guard = make_cleanup([&] {
            secure_wipe(t_prev);
            secure_wipe(t_current);
            secure_wipe(input);
        });
        for (size_t i = 1; i <= n; ++i) {
            input.clear();
            if (i > 1) [[likely]] {
                input.insert(input.end(), t_prev.begin(), t_prev.end());
            }
            if (info_length > 0) [[likely]] {
                input.insert(input.end(), info, info + info_length);
            }
            input.push_back(static_cast<uint8_t>(i));
            QKDSIM_TRY(hmac(prk, prk_length, input.data(), input.size(), t_current.data()));
            const size_t copy_length = std::min(hash_length, okm_length - (i - 1) * hash_length);
            std::copy_n(t_current.begin(), static_cast<std::ptrdiff_t>(copy_length),
                        okm + (i - 1) * hash_length);
            std::swap(t_prev, t_current);
        }
        return Result::Success;
    }

    Result derive_seed_key(const uint64_t seed, uint8_t *seed_key, const size_t seed_key_length) {
        if (!seed_key || seed_key_length != SEED_KEY_LENGTH) [[unlikely]] {
            return Result::InvalidInput;
        }
        if (!init()) {
            return Result::CryptoError;
        }
        uint8_t seed_le[sizeof(uint64_t)];
        for (size_t i = 0; i < sizeof(seed_le); ++i) {
            seed_le[i] = static_cast<uint8_t>(seed >> (8 * i));
        }
        crypto_generichash_state state;
        if (crypto_generichash_init(&state, nullptr, 0, seed_key_length) != 0) [[unlikely]] {
            return Result::CryptoError;
        }
        auto cleanup_guard = make_cleanup([&] {
            sodium_memzero(seed_le, sizeof(seed_le));
            sodium_memzero(&state, sizeof(state));
        });
        if (crypto_generichash_update(&state, reinterpret_cast<const uint8_t *>(labels::kSeedContext),
                                      labels::kSeedContextLength) != 0 ||
            crypto_generichash_update(&state, seed_le, sizeof(seed_le)) != 0) [[unlikely]] {
            return Result::CryptoError;
        }
        if (crypto_generichash_final(&state, seed_key, seed_key_length) != 0) [[unlikely]] {
            return Result::CryptoError;
        }
        return Result::Success;
    }

    Result keystream_block(const uint8_t *seed_key, const uint64_t block_counter,
                           uint8_t *out, const size_t out_length) {
        if (!seed_key || !out || out_length != kChaChaBlockLength) [[unlikely]] {
            return Result::InvalidInput;
        }
        if (!init()) {
            return Result::CryptoError;
        }
        static constexpr uint8_t kZeroNonce[crypto_stream_chacha20_NONCEBYTES] = {};
        std::fill_n(out, out_length, static_cast<uint8_t>(0));
        if (crypto_stream_chacha20_xor_ic(out, out, out_length, kZeroNonce,
                                          block_counter, seed_key) != 0) [[unlikely]] {
            return Result::CryptoError;
        }
        return Result::Success;
    }

    Result seal(const uint8_t *key, const size_t key_length,
                const uint8_t *plaintext, const size_t plaintext_length,
                const uint8_t *nonce,
                uint8_t *ciphertext, uint8_t *auth_tag) {
        if (!key || key_length == 0 || !plaintext || plaintext_length == 0 ||
            !nonce || !ciphertext || !auth_tag) [[unlikely]] {
            return Result::InvalidInput;
        }
        if (key_length != crypto_secretbox_KEYBYTES) [[unlikely]] {
            return Result::InvalidInput;
        }
        if (!init()) {
            return Result::CryptoError;
        }
        if (crypto_secretbox_detached(ciphertext, auth_tag, plaintext, plaintext_length, nonce, key) != 0) {
            return Result::CryptoError;
        }
        return Result::Success;
    }

    Result open(const uint8_t *key, size_t key_length,
                const uint8_t *ciphertext, size_t ciphertext_length,
                const uint8_t *nonce,
                const uint8_t *auth_tag,
                uint8_t *plaintext) {
        if (!key || key_length == 0 || !ciphertext || ciphertext_length == 0 ||
            !nonce || !auth_tag || !plaintext) [[unlikely]] {
            return Result::InvalidInput;
        }
        if (key_length != crypto_secretbox_KEYBYTES) [[unlikely]] {
            return Result::InvalidInput;
        }
        if (!init()) {
            return Result::CryptoError;
        }
        if (crypto_secretbox_open_detached(plaintext, ciphertext, auth_tag, ciphertext_length, nonce, key) != 0) [[unlikely]] {
            return Result::AuthenticationFailure;
        }
        return Result::Success;
    }
}

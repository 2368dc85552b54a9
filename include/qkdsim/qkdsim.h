#pragma once
#include <cstdint>
#include <cstddef>
#include <memory>
#include <optional>
#include <vector>
#include <concepts>
#include <type_traits>

namespace qkdsim {

    constexpr inline size_t DERIVED_KEY_LENGTH = 32;
    constexpr inline size_t NONCE_LENGTH = 24;
    constexpr inline size_t AUTH_TAG_LENGTH = 16;
    constexpr inline size_t PRK_LENGTH = 64;
    constexpr inline size_t RANDOM_POOL_LENGTH = 64;
    constexpr inline size_t SEED_KEY_LENGTH = 32;

    constexpr inline uint8_t ENVELOPE_VERSION = 0x01;
    constexpr inline size_t ENVELOPE_HEADER_LENGTH = 1 + NONCE_LENGTH + AUTH_TAG_LENGTH;

#ifndef QKDSIM_MAX_PHOTON_COUNT
    constexpr inline size_t MAX_PHOTON_COUNT = 1000000;
#else
    constexpr inline size_t MAX_PHOTON_COUNT = QKDSIM_MAX_PHOTON_COUNT;
#endif

    namespace labels {
        constexpr inline char kKdfSalt[] = "QKDSIM-BB84-v1/KDF-Salt";
        constexpr inline size_t kKdfSaltLength = sizeof(kKdfSalt) - 1;
        constexpr inline char kKdfInfo[] = "QKDSIM-BB84-v1/CipherKey";
        constexpr inline size_t kKdfInfoLength = sizeof(kKdfInfo) - 1;
        constexpr inline char kSeedContext[] = "QKDSIM-BB84-v1/SeededSource";
        constexpr inline size_t kSeedContextLength = sizeof(kSeedContext) - 1;
    }

    static_assert(NONCE_LENGTH == 24, "Nonce length must match crypto_secretbox nonce size");
    static_assert(AUTH_TAG_LENGTH == 16, "Poly1305 produces 16-byte tags");
    static_assert(DERIVED_KEY_LENGTH == 32, "crypto_secretbox requires 32-byte keys");
    static_assert(PRK_LENGTH == 64, "HMAC-SHA512 produces 64-byte pseudorandom keys");
    static_assert(ENVELOPE_HEADER_LENGTH == 41, "Envelope header: 1 + 24 + 16 = 41");

    enum class [[nodiscard]] Result {
        Success = 0,
        InvalidParameter = -1,
        InsufficientEntropy = -2,
        AuthenticationFailure = -3,
        InvalidInput = -4,
        CryptoError = -5,
        MemoryError = -6,
        StreamExhausted = -7
    };

    template<typename T>
    concept SecurelyAllocatable = std::is_trivially_copyable_v<T> && !std::is_const_v<T>;

    template<SecurelyAllocatable T>
    class SecureAllocator {
    public:
        using value_type = T;

        SecureAllocator() noexcept = default;

        template<SecurelyAllocatable U>
        SecureAllocator(const SecureAllocator<U> &) noexcept {}

        T *allocate(size_t n);

        void deallocate(T *p, size_t n);

        template<SecurelyAllocatable U>
        bool operator==(const SecureAllocator<U> &) const noexcept { return true; }

        template<SecurelyAllocatable U>
        bool operator!=(const SecureAllocator<U> &) const noexcept { return false; }
    };

    template<typename T>
    using secure_vector = std::vector<T, SecureAllocator<T> >;
    using secure_bytes = secure_vector<uint8_t>;

    enum class Basis : uint8_t {
        Rectilinear = 0,
        Diagonal = 1
    };

    enum class Bit : uint8_t {
        Zero = 0,
        One = 1
    };

    using BitString = std::vector<Bit>;

    struct Photon {
        Bit bit;
        Basis basis;
    };

    struct PhotonEvent {
        size_t index = 0;
        Bit alice_bit = Bit::Zero;
        Basis alice_basis = Basis::Rectilinear;
        bool eve_intercepted = false;
        std::optional<Basis> eve_basis;
        std::optional<Bit> eve_bit;
        Basis bob_basis = Basis::Rectilinear;
        Bit bob_bit = Bit::Zero;

        [[nodiscard]] bool bases_match() const noexcept { return alice_basis == bob_basis; }

        bool operator==(const PhotonEvent &) const = default;
    };

    using TraceRecord = std::vector<PhotonEvent>;

    struct SiftingResult {
        std::vector<size_t> matched_indices;
        BitString alice_key;
        BitString bob_key;
        BitString eve_key;

        bool operator==(const SiftingResult &) const = default;
    };

    struct DerivedKey {
        secure_bytes material;

        DerivedKey();

        ~DerivedKey();

        DerivedKey(const DerivedKey &) = delete;

        DerivedKey &operator=(const DerivedKey &) = delete;

        DerivedKey(DerivedKey &&) noexcept = default;

        DerivedKey &operator=(DerivedKey &&) noexcept = default;
    };

    struct CipherEnvelope {
        secure_bytes nonce;
        secure_bytes ciphertext;
        secure_bytes auth_tag;

        CipherEnvelope();
    };

    namespace util {
        [[nodiscard]] constexpr uint8_t to_int(Bit bit) noexcept {
            return static_cast<uint8_t>(bit);
        }

        [[nodiscard]] constexpr Bit to_bit(bool value) noexcept {
            return value ? Bit::One : Bit::Zero;
        }

        [[nodiscard]] constexpr Bit flip(Bit bit) noexcept {
            return bit == Bit::One ? Bit::Zero : Bit::One;
        }

        [[nodiscard]] constexpr const char *basis_symbol(Basis basis) noexcept {
            return basis == Basis::Rectilinear ? "+ (0°)" : "× (45°)";
        }

        [[nodiscard]] inline bool is_all_zero(const uint8_t *data, size_t length) noexcept {
            uint8_t accumulator = 0;
            for (size_t i = 0; i < length; ++i) {
                accumulator |= data[i];
            }
            return accumulator == 0;
        }
    }

    namespace crypto {
        [[nodiscard]] bool init();

        [[nodiscard]] Result random_bytes(uint8_t *buffer, size_t length);

        [[nodiscard]] Result hmac(const uint8_t *key, size_t key_length, const uint8_t *data, size_t data_length,
                                  uint8_t *mac);

        [[nodiscard]] Result key_derivation_extract(const uint8_t *salt, size_t salt_length, const uint8_t *ikm,
                                                    size_t ikm_length, uint8_t *prk);

        [[nodiscard]] Result key_derivation_expand(const uint8_t *prk, size_t prk_length, const uint8_t *info,
                                                   size_t info_length, uint8_t *okm, size_t okm_length);

        [[nodiscard]] Result derive_seed_key(uint64_t seed, uint8_t *seed_key, size_t seed_key_length);

        [[nodiscard]] Result keystream_block(const uint8_t *seed_key, uint64_t block_counter,
                                             uint8_t *out, size_t out_length);

        [[nodiscard]] Result seal(const uint8_t *key, size_t key_length, const uint8_t *plaintext,
                                  size_t plaintext_length, const uint8_t *nonce, uint8_t *ciphertext,
                                  uint8_t *auth_tag);

        [[nodiscard]] Result open(const uint8_t *key, size_t key_length, const uint8_t *ciphertext,
                                  size_t ciphertext_length, const uint8_t *nonce, const uint8_t *auth_tag,
                                  uint8_t *plaintext);
    }

    namespace key_derivation {
        [[nodiscard]] Result pack_bits(const Bit *bits, size_t bit_count, secure_bytes &packed);

        [[nodiscard]] Result derive(const Bit *bits, size_t bit_count, DerivedKey &key);

        [[nodiscard]] Result derive(const BitString &bits, DerivedKey &key);
    }

    namespace cipher {
        [[nodiscard]] Result encrypt(const uint8_t *message, size_t message_length, const DerivedKey &key,
                                     CipherEnvelope &envelope);

        [[nodiscard]] Result decrypt(const CipherEnvelope &envelope, const DerivedKey &key,
                                     secure_bytes &plaintext);
    }
}

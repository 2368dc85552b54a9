#pragma once
#include "qkdsim.h"
#include <array>

namespace qkdsim {

    /**
     * Source of the independent uniform choices a BB84 run consumes:
     * Alice's bits and bases, Eve's and Bob's bases, interception trials
     * and the coin flips of mismatched-basis measurements.
     *
     * Draws are served from a 64-byte pool that the concrete source refills.
     * One instance belongs to one run.
     */
    class BitBasisSource {
    public:
        BitBasisSource() = default;

        virtual ~BitBasisSource();

        BitBasisSource(const BitBasisSource &) = delete;

        BitBasisSource &operator=(const BitBasisSource &) = delete;

        [[nodiscard]] Bit next_bit();

        [[nodiscard]] Basis next_basis();

        /* Uniform on [0, 1) with 53 bits of resolution. */
        [[nodiscard]] double next_unit();

    protected:
        virtual void refill(uint8_t *block, size_t length) = 0;

    private:
        [[nodiscard]] bool next_raw_bit();

        [[nodiscard]] uint8_t next_byte();

        std::array<uint8_t, RANDOM_POOL_LENGTH> pool_{};
        size_t byte_offset_ = RANDOM_POOL_LENGTH;
        uint8_t bit_cache_ = 0;
        uint8_t bits_left_ = 0;
    };

    /* Operating-system CSPRNG via libsodium. */
    class SystemBitBasisSource final : public BitBasisSource {
    public:
        SystemBitBasisSource();

    protected:
        void refill(uint8_t *block, size_t length) override;
    };

    /* Reproducible ChaCha20 keystream keyed from a 64-bit seed. */
    class SeededBitBasisSource final : public BitBasisSource {
    public:
        explicit SeededBitBasisSource(uint64_t seed);

        ~SeededBitBasisSource() override;

    protected:
        void refill(uint8_t *block, size_t length) override;

    private:
        std::array<uint8_t, SEED_KEY_LENGTH> seed_key_{};
        uint64_t block_counter_ = 0;
    };
}

#include "qkdsim/randomness.h"
#include <sodium.h>
#include <stdexcept>

namespace qkdsim {
    namespace {
        constexpr double kTwoPow53Inverse = 1.0 / 9007199254740992.0;
    }

    BitBasisSource::~BitBasisSource() {
        sodium_memzero(pool_.data(), pool_.size());
        bit_cache_ = 0;
    }

    uint8_t BitBasisSource::next_byte() {
        if (byte_offset_ >= pool_.size()) {
            refill(pool_.data(), pool_.size());
            byte_offset_ = 0;
        }
        return pool_[byte_offset_++];
    }

    bool BitBasisSource::next_raw_bit() {
        if (bits_left_ == 0) {
            bit_cache_ = next_byte();
            bits_left_ = 8;
        }
        const bool bit = (bit_cache_ & 0x80) != 0;
        bit_cache_ = static_cast<uint8_t>(bit_cache_ << 1);
        --bits_left_;
        return bit;
    }

    Bit BitBasisSource::next_bit() {
        return util::to_bit(next_raw_bit());
    }

    Basis BitBasisSource::next_basis() {
        return next_raw_bit() ? Basis::Diagonal : Basis::Rectilinear;
    }

    double BitBasisSource::next_unit() {
        uint64_t value = 0;
        for (int i = 0; i < 8; ++i) {
            value = (value << 8) | next_byte();
        }
        return static_cast<double>(value >> 11) * kTwoPow53Inverse;
    }

    SystemBitBasisSource::SystemBitBasisSource() {
        if (!crypto::init()) {
            throw std::runtime_error("Failed to initialize cryptographic library");
        }
    }

    void SystemBitBasisSource::refill(uint8_t *block, const size_t length) {
        randombytes_buf(block, length);
    }

    SeededBitBasisSource::SeededBitBasisSource(const uint64_t seed) {
        if (crypto::derive_seed_key(seed, seed_key_.data(), seed_key_.size()) != Result::Success) {
            throw std::runtime_error("Failed to derive seeded source key");
        }
    }

    SeededBitBasisSource::~SeededBitBasisSource() {
        sodium_memzero(seed_key_.data(), seed_key_.size());
    }

    void SeededBitBasisSource::refill(uint8_t *block, const size_t length) {
        if (crypto::keystream_block(seed_key_.data(), block_counter_, block, length) != Result::Success) {
            throw std::runtime_error("Seeded keystream generation failed");
        }
        ++block_counter_;
    }
}

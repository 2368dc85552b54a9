/**
 * @file generate_test_vectors.cpp
 * @brief Generates deterministic test vectors for third-party verification.
 *
 * Uses a fixed seed for the reproducible photon source, producing a full
 * BB84 trace, the sifted keys, the packed key material and the derived
 * cipher key. Output is JSON.
 *
 * Only the seeded ChaCha20 source and the KDF are deterministic; the cipher
 * draws a fresh nonce per message, so the envelope section captures ONE
 * concrete encryption.
 *
 * Usage:
 *   ./generate_test_vectors > test_vectors.json
 */

#include "qkdsim/qkdsim.h"
#include "qkdsim/simulation.h"
#include "qkdsim/randomness.h"
#include "qkdsim/protocol.h"
#include <sodium.h>
#include <cstdio>
#include <cstring>
#include <string>

using namespace qkdsim;

namespace {

std::string hex(const uint8_t* data, size_t len) {
    std::string result;
    result.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        char buf[3];
        std::snprintf(buf, sizeof(buf), "%02x", data[i]);
        result += buf;
    }
    return result;
}

std::string hex(const secure_bytes& v) {
    return hex(v.data(), v.size());
}

std::string bits(const BitString& v) {
    std::string result;
    result.reserve(v.size());
    for (const Bit bit : v) {
        result += bit == Bit::One ? '1' : '0';
    }
    return result;
}

void json_field(const char* name, const std::string& value, bool last = false) {
    std::printf("    \"%s\": \"%s\"%s\n", name, value.c_str(), last ? "" : ",");
}

void json_field_int(const char* name, size_t value, bool last = false) {
    std::printf("    \"%s\": %zu%s\n", name, value, last ? "" : ",");
}

void json_field_double(const char* name, double value, bool last = false) {
    std::printf("    \"%s\": %.6f%s\n", name, value, last ? "" : ",");
}

} // anonymous namespace


int main() {
    if (!crypto::init()) {
        std::fprintf(stderr, "sodium_init failed\n");
        return 1;
    }

    constexpr uint64_t seed = 0x0001020304050607ULL;
    constexpr size_t photon_count = 32;
    constexpr double eve_intercept_probability = 0.3;
    const char* message = "test_vector_message_v1";

    uint8_t seed_key[SEED_KEY_LENGTH];
    if (crypto::derive_seed_key(seed, seed_key, sizeof(seed_key)) != Result::Success) {
        std::fprintf(stderr, "seed key derivation failed\n");
        return 1;
    }
    uint8_t first_block[RANDOM_POOL_LENGTH];
    if (crypto::keystream_block(seed_key, 0, first_block, sizeof(first_block)) != Result::Success) {
        std::fprintf(stderr, "keystream generation failed\n");
        return 1;
    }

    SeededBitBasisSource source(seed);
    TraceRecord trace;
    if (simulation::run(SimulationParameters{photon_count, eve_intercept_probability}, source, trace) !=
        Result::Success) {
        std::fprintf(stderr, "simulation run failed\n");
        return 1;
    }
    const SiftingResult sifted = sifting::sift(trace);
    if (sifted.bob_key.empty()) {
        std::fprintf(stderr, "seed produced an empty sifted key\n");
        return 1;
    }

    std::printf("{\n");
    std::printf("  \"protocol\": \"BB84\",\n");
    std::printf("  \"version\": \"QKDSIM-BB84-v1\",\n");
    std::printf("  \"source\": \"ChaCha20(BLAKE2b(label || seed_le64))\",\n");
    std::printf("  \"kdf\": \"HKDF-HMAC-SHA-512(pack_msb(bits) || u64be(bit_count))\",\n");
    std::printf("  \"aead\": \"XSalsa20-Poly1305\",\n");
    std::printf("\n");

    /* ---- Inputs ---- */
    std::printf("  \"inputs\": {\n");
    uint8_t seed_le[sizeof(seed)];
    for (size_t i = 0; i < sizeof(seed); ++i) {
        seed_le[i] = static_cast<uint8_t>(seed >> (8 * i));
    }
    json_field("seed_le64", hex(seed_le, sizeof(seed_le)));
    json_field("seed_label", labels::kSeedContext);
    json_field("seed_key", hex(seed_key, sizeof(seed_key)));
    json_field("keystream_block_0", hex(first_block, sizeof(first_block)));
    json_field_int("photon_count", photon_count);
    json_field_double("eve_intercept_probability", eve_intercept_probability, true);
    std::printf("  },\n\n");

    /* ---- Trace ---- */
    std::printf("  \"trace\": [\n");
    for (size_t i = 0; i < trace.size(); ++i) {
        const PhotonEvent& e = trace[i];
        std::printf("    {\"index\": %zu, \"alice_bit\": %u, \"alice_basis\": %u, \"eve_intercepted\": %s, "
                    "\"eve_basis\": ",
                    e.index, static_cast<unsigned>(util::to_int(e.alice_bit)), static_cast<unsigned>(e.alice_basis),
                    e.eve_intercepted ? "true" : "false");
        if (e.eve_basis) {
            std::printf("%u", static_cast<unsigned>(*e.eve_basis));
        } else {
            std::printf("null");
        }
        std::printf(", \"eve_bit\": ");
        if (e.eve_bit) {
            std::printf("%u", static_cast<unsigned>(util::to_int(*e.eve_bit)));
        } else {
            std::printf("null");
        }
        std::printf(", \"bob_basis\": %u, \"bob_bit\": %u}%s\n",
                    static_cast<unsigned>(e.bob_basis), static_cast<unsigned>(util::to_int(e.bob_bit)),
                    i + 1 == trace.size() ? "" : ",");
    }
    std::printf("  ],\n\n");

    /* ---- Sifting ---- */
    std::printf("  \"sifting\": {\n");
    json_field("alice_key", bits(sifted.alice_key));
    json_field("bob_key", bits(sifted.bob_key));
    json_field("eve_key", bits(sifted.eve_key));
    json_field_int("sifted_length", sifted.matched_indices.size());
    json_field_double("qber", sifting::estimate_qber(sifted), true);
    std::printf("  },\n\n");

    /* ---- Key derivation ---- */
    secure_bytes packed;
    if (key_derivation::pack_bits(sifted.bob_key.data(), sifted.bob_key.size(), packed) != Result::Success) {
        std::fprintf(stderr, "bit packing failed\n");
        return 1;
    }
    DerivedKey key;
    if (key_derivation::derive(sifted.bob_key, key) != Result::Success) {
        std::fprintf(stderr, "key derivation failed\n");
        return 1;
    }

    std::printf("  \"key_derivation\": {\n");
    json_field("salt", labels::kKdfSalt);
    json_field("info", labels::kKdfInfo);
    json_field("packed_bits", hex(packed));
    json_field_int("bit_count", sifted.bob_key.size());
    json_field("derived_key", hex(key.material), true);
    std::printf("  },\n\n");

    /* ---- Envelope ---- */
    CipherEnvelope envelope;
    if (cipher::encrypt(reinterpret_cast<const uint8_t*>(message), std::strlen(message), key, envelope) !=
        Result::Success) {
        std::fprintf(stderr, "encryption failed\n");
        return 1;
    }
    secure_bytes wire(protocol::envelope_length(envelope.ciphertext.size()));
    if (protocol::write_envelope(envelope, wire.data(), wire.size()) != Result::Success) {
        std::fprintf(stderr, "envelope packing failed\n");
        return 1;
    }
    secure_bytes opened;
    const bool round_trip = cipher::decrypt(envelope, key, opened) == Result::Success &&
                            opened.size() == std::strlen(message) &&
                            sodium_memcmp(opened.data(), message, opened.size()) == 0;

    std::printf("  \"envelope\": {\n");
    json_field("message", hex(reinterpret_cast<const uint8_t*>(message), std::strlen(message)));
    json_field("nonce", hex(envelope.nonce));
    json_field("auth_tag", hex(envelope.auth_tag));
    json_field("ciphertext", hex(envelope.ciphertext));
    json_field("wire", hex(wire));
    std::printf("    \"round_trip\": %s\n", round_trip ? "true" : "false");
    std::printf("  },\n\n");

    /* ---- Wire Sizes ---- */
    std::printf("  \"wire_sizes\": {\n");
    json_field_int("envelope_header", ENVELOPE_HEADER_LENGTH);
    json_field_int("nonce", NONCE_LENGTH);
    json_field_int("auth_tag", AUTH_TAG_LENGTH);
    json_field_int("derived_key", DERIVED_KEY_LENGTH, true);
    std::printf("  }\n");

    std::printf("}\n");

    return 0;
}

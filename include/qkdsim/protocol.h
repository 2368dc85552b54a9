#pragma once
#include "qkdsim.h"
#include <string>

namespace qkdsim::protocol {
    /*
     * Packed envelope:  version(1) || nonce(24) || auth_tag(16) || ciphertext(n), n >= 1
     */
    struct EnvelopeView {
        uint8_t version;
        const uint8_t *nonce;
        const uint8_t *auth_tag;
        const uint8_t *ciphertext;
        size_t ciphertext_length;
    };

    constexpr inline size_t kEnvelopeVersionOffset = 0;
    constexpr inline size_t kEnvelopeNonceOffset = 1;
    constexpr inline size_t kEnvelopeAuthTagOffset = kEnvelopeNonceOffset + NONCE_LENGTH;
    constexpr inline size_t kEnvelopeCiphertextOffset = kEnvelopeAuthTagOffset + AUTH_TAG_LENGTH;

    static_assert(kEnvelopeCiphertextOffset == ENVELOPE_HEADER_LENGTH, "Envelope header layout mismatch");

    [[nodiscard]] constexpr size_t envelope_length(const size_t message_length) noexcept {
        return ENVELOPE_HEADER_LENGTH + message_length;
    }

    [[nodiscard]] Result parse_envelope(const uint8_t *data, size_t length, EnvelopeView &view);

    [[nodiscard]] Result read_envelope(const uint8_t *data, size_t length, CipherEnvelope &envelope);

    [[nodiscard]] Result write_envelope(const CipherEnvelope &envelope, uint8_t *out, size_t out_length);

    [[nodiscard]] Result to_base64(const uint8_t *data, size_t length, std::string &encoded);

    [[nodiscard]] Result from_base64(const std::string &encoded, secure_bytes &decoded);
}

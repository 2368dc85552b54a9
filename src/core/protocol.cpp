#include "qkdsim/protocol.h"
#include <sodium.h>
#include <algorithm>

namespace qkdsim::protocol {
    namespace {
        constexpr int kBase64Variant = sodium_base64_VARIANT_ORIGINAL;
    }

    Result parse_envelope(const uint8_t *data, const size_t length, EnvelopeView &view) {
        if (!data || length <= ENVELOPE_HEADER_LENGTH) {
            return Result::InvalidInput;
        }
        if (data[kEnvelopeVersionOffset] != ENVELOPE_VERSION) {
            return Result::InvalidInput;
        }
        view.version = data[kEnvelopeVersionOffset];
        view.nonce = data + kEnvelopeNonceOffset;
        view.auth_tag = data + kEnvelopeAuthTagOffset;
        view.ciphertext = data + kEnvelopeCiphertextOffset;
        view.ciphertext_length = length - ENVELOPE_HEADER_LENGTH;
        return Result::Success;
    }

    Result read_envelope(const uint8_t *data, const size_t length, CipherEnvelope &envelope) {
        EnvelopeView view{};
        if (const Result result = parse_envelope(data, length, view); result != Result::Success) {
            return result;
        }
        envelope.nonce.assign(view.nonce, view.nonce + NONCE_LENGTH);
        envelope.auth_tag.assign(view.auth_tag, view.auth_tag + AUTH_TAG_LENGTH);
        envelope.ciphertext.assign(view.ciphertext, view.ciphertext + view.ciphertext_length);
        return Result::Success;
    }

    Result write_envelope(const CipherEnvelope &envelope, uint8_t *out, const size_t out_length) {
        if (!out) {
            return Result::InvalidInput;
        }
        if (envelope.nonce.size() != NONCE_LENGTH ||
            envelope.auth_tag.size() != AUTH_TAG_LENGTH ||
            envelope.ciphertext.empty()) {
            return Result::InvalidInput;
        }
        if (out_length != envelope_length(envelope.ciphertext.size())) {
            return Result::InvalidInput;
        }
        out[kEnvelopeVersionOffset] = ENVELOPE_VERSION;
        std::ranges::copy(envelope.nonce, out + kEnvelopeNonceOffset);
        std::ranges::copy(envelope.auth_tag, out + kEnvelopeAuthTagOffset);
        std::ranges::copy(envelope.ciphertext, out + kEnvelopeCiphertextOffset);
        return Result::Success;
    }

    Result to_base64(const uint8_t *data, const size_t length, std::string &encoded) {
        if (!data || length == 0) {
            return Result::InvalidInput;
        }
        const size_t encoded_capacity = sodium_base64_ENCODED_LEN(length, kBase64Variant);
        std::string buffer(encoded_capacity, '\0');
        sodium_bin2base64(buffer.data(), buffer.size(), data, length, kBase64Variant);
        buffer.resize(encoded_capacity - 1);
        encoded = std::move(buffer);
        return Result::Success;
    }

    Result from_base64(const std::string &encoded, secure_bytes &decoded) {
        if (encoded.empty()) {
            return Result::InvalidInput;
        }
        secure_bytes buffer(encoded.size() / 4 * 3 + 3);
        size_t decoded_length = 0;
        const char *end = nullptr;
        if (sodium_base642bin(buffer.data(), buffer.size(), encoded.data(), encoded.size(),
                              nullptr, &decoded_length, &end, kBase64Variant) != 0) {
            return Result::InvalidInput;
        }
        if (end != encoded.data() + encoded.size() || decoded_length == 0) {
            return Result::InvalidInput;
        }
        buffer.resize(decoded_length);
        decoded = std::move(buffer);
        return Result::Success;
    }
}

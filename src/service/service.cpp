#include "qkdsim/service.h"
#include "qkdsim/simulation.h"
#include "qkdsim/protocol.h"
#include "qkdsim/secure_cleanup.h"
#include <new>
#include <stdexcept>

namespace qkdsim::service {
    namespace {
        [[nodiscard]] Result decode_envelope(const EncodedEnvelope &encoded, CipherEnvelope &envelope) {
            QKDSIM_TRY(protocol::from_base64(encoded.nonce, envelope.nonce));
            QKDSIM_TRY(protocol::from_base64(encoded.tag, envelope.auth_tag));
            QKDSIM_TRY(protocol::from_base64(encoded.ciphertext, envelope.ciphertext));
            return Result::Success;
        }
    }

    const char *error_message(const Result result) noexcept {
        switch (result) {
            case Result::Success:
                return "success";
            case Result::InvalidParameter:
                return "invalid parameter: photon count must be a positive integer "
                       "and eavesdropper probability must lie in [0, 1]";
            case Result::InsufficientEntropy:
                return "insufficient entropy: key bit sequence is empty";
            case Result::AuthenticationFailure:
                return "authentication failure: message could not be verified with this key";
            case Result::InvalidInput:
                return "invalid input: malformed request";
            case Result::CryptoError:
                return "cryptographic backend failure";
            case Result::MemoryError:
                return "out of memory";
            case Result::StreamExhausted:
                return "photon stream exhausted";
        }
        return "unknown error";
    }

    Result make_source(const std::optional<uint64_t> &seed, std::unique_ptr<BitBasisSource> &source) {
        try {
            if (seed.has_value()) {
                source = std::make_unique<SeededBitBasisSource>(*seed);
            } else {
                source = std::make_unique<SystemBitBasisSource>();
            }
        } catch (const std::bad_alloc &) {
            return Result::MemoryError;
        } catch (const std::runtime_error &) {
            return Result::CryptoError;
        }
        return Result::Success;
    }

    PhotonRow to_row(const PhotonEvent &event) noexcept {
        PhotonRow row;
        row.alice_bit = event.alice_bit;
        row.alice_basis_symbol = util::basis_symbol(event.alice_basis);
        row.bob_basis_symbol = util::basis_symbol(event.bob_basis);
        row.bases_match = event.bases_match();
        row.eve_intercepted = event.eve_intercepted;
        row.eve_bit = event.eve_bit;
        row.bob_bit = event.bob_bit;
        return row;
    }

    Result run(const RunRequest &request, RunResponse &response) {
        if (request.photon_count <= 0) {
            return Result::InvalidParameter;
        }
        const SimulationParameters parameters{
            static_cast<size_t>(request.photon_count),
            request.eve_intercept_probability
        };
        QKDSIM_TRY(simulation::validate(parameters));

        std::unique_ptr<BitBasisSource> source;
        QKDSIM_TRY(make_source(request.seed, source));

        TraceRecord trace;
        QKDSIM_TRY(simulation::run(parameters, *source, trace));

        SiftingResult sifted = sifting::sift(trace);

        RunResponse built;
        built.rows.reserve(trace.size());
        for (const PhotonEvent &event : trace) {
            built.rows.push_back(to_row(event));
        }
        built.qber = sifting::estimate_qber(sifted);
        built.matched_indices = std::move(sifted.matched_indices);
        built.alice_key = std::move(sifted.alice_key);
        built.bob_key = std::move(sifted.bob_key);
        built.eve_key = std::move(sifted.eve_key);
        response = std::move(built);
        return Result::Success;
    }

    Result encrypt(const EncryptRequest &request, EncodedEnvelope &response) {
        DerivedKey key;
        QKDSIM_TRY(key_derivation::derive(request.key, key));
        if (request.message.empty()) {
            return Result::InvalidInput;
        }

        CipherEnvelope envelope;
        QKDSIM_TRY(cipher::encrypt(reinterpret_cast<const uint8_t *>(request.message.data()),
                                   request.message.size(), key, envelope));

        EncodedEnvelope encoded;
        QKDSIM_TRY(protocol::to_base64(envelope.ciphertext.data(), envelope.ciphertext.size(),
                                       encoded.ciphertext));
        QKDSIM_TRY(protocol::to_base64(envelope.nonce.data(), envelope.nonce.size(), encoded.nonce));
        QKDSIM_TRY(protocol::to_base64(envelope.auth_tag.data(), envelope.auth_tag.size(), encoded.tag));
        response = std::move(encoded);
        return Result::Success;
    }

    Result decrypt(const DecryptRequest &request, DecryptResponse &response) {
        DerivedKey key;
        QKDSIM_TRY(key_derivation::derive(request.key, key));

        CipherEnvelope envelope;
        QKDSIM_TRY(decode_envelope(request.envelope, envelope));

        secure_bytes plaintext;
        auto cleanup_guard = make_cleanup([&] { secure_clear(plaintext); });
        QKDSIM_TRY(cipher::decrypt(envelope, key, plaintext));

        response.decrypted.assign(plaintext.begin(), plaintext.end());
        return Result::Success;
    }
}

#include "qkdsim/qkdsim.h"
#include "qkdsim/secure_cleanup.h"
#include "qkdsim/debug_log.h"
#include <sodium.h>

namespace qkdsim::cipher {
    namespace {
        /* Only material written by key_derivation::derive is accepted. */
        [[nodiscard]] bool key_is_usable(const DerivedKey &key) {
            return key.material.size() == DERIVED_KEY_LENGTH &&
                   !util::is_all_zero(key.material.data(), key.material.size());
        }
    }

    Result encrypt(const uint8_t *message, const size_t message_length, const DerivedKey &key,
                   CipherEnvelope &envelope) {
        log::section("CIPHER: Encrypt");
        if (!message || message_length == 0 || !key_is_usable(key)) [[unlikely]] {
            return Result::InvalidInput;
        }
        if (!crypto::init()) {
            return Result::CryptoError;
        }
        envelope.nonce.resize(NONCE_LENGTH);
        envelope.auth_tag.resize(AUTH_TAG_LENGTH);
        envelope.ciphertext.resize(message_length);

        /* A fresh nonce per call; nothing is carried between calls. */
        QKDSIM_TRY(crypto::random_bytes(envelope.nonce.data(), envelope.nonce.size()));
        log::hex("envelope.nonce", envelope.nonce);

        QKDSIM_TRY(crypto::seal(key.material.data(), key.material.size(),
                                message, message_length,
                                envelope.nonce.data(),
                                envelope.ciphertext.data(), envelope.auth_tag.data()));
        log::hex("envelope.ciphertext", envelope.ciphertext);
        log::hex("envelope.auth_tag", envelope.auth_tag);
        return Result::Success;
    }

    Result decrypt(const CipherEnvelope &envelope, const DerivedKey &key, secure_bytes &plaintext) {
        log::section("CIPHER: Decrypt");
        if (!key_is_usable(key)) [[unlikely]] {
            return Result::InvalidInput;
        }
        if (envelope.nonce.size() != NONCE_LENGTH ||
            envelope.auth_tag.size() != AUTH_TAG_LENGTH ||
            envelope.ciphertext.empty()) {
            return Result::InvalidInput;
        }
        if (!crypto::init()) {
            return Result::CryptoError;
        }

        secure_bytes opened(envelope.ciphertext.size());
        auto failure_guard = make_cleanup([&] { secure_clear(opened); });

        /* Wrong key and tampered data both surface as AuthenticationFailure. */
        QKDSIM_TRY(crypto::open(key.material.data(), key.material.size(),
                                envelope.ciphertext.data(), envelope.ciphertext.size(),
                                envelope.nonce.data(), envelope.auth_tag.data(),
                                opened.data()));

        failure_guard.dismiss();
        secure_clear(plaintext);
        plaintext = std::move(opened);
        return Result::Success;
    }
}

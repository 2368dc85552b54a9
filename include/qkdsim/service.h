#pragma once
#include "qkdsim.h"
#include "randomness.h"
#include <optional>
#include <string>
#include <string_view>

/*
 * Request/response contract consumed by the presentation layer. Every
 * request is independent; nothing is kept between calls.
 */
namespace qkdsim::service {

    constexpr inline int64_t kDefaultPhotonCount = 10;
    constexpr inline double kDefaultEveInterceptProbability = 0.3;

    struct RunRequest {
        int64_t photon_count = kDefaultPhotonCount;
        double eve_intercept_probability = kDefaultEveInterceptProbability;
        std::optional<uint64_t> seed;
    };

    struct PhotonRow {
        Bit alice_bit = Bit::Zero;
        const char *alice_basis_symbol = "";
        const char *bob_basis_symbol = "";
        bool bases_match = false;
        bool eve_intercepted = false;
        std::optional<Bit> eve_bit;
        Bit bob_bit = Bit::Zero;
    };

    struct RunResponse {
        std::vector<PhotonRow> rows;
        std::vector<size_t> matched_indices;
        BitString alice_key;
        BitString bob_key;
        BitString eve_key;
        double qber = 0.0;
    };

    /* Base64 text form of a CipherEnvelope. */
    struct EncodedEnvelope {
        std::string ciphertext;
        std::string nonce;
        std::string tag;
    };

    struct EncryptRequest {
        std::string message;
        BitString key;
    };

    struct DecryptRequest {
        EncodedEnvelope envelope;
        BitString key;
    };

    struct DecryptResponse {
        std::string decrypted;
    };

    [[nodiscard]] const char *error_message(Result result) noexcept;

    [[nodiscard]] Result make_source(const std::optional<uint64_t> &seed,
                                     std::unique_ptr<BitBasisSource> &source);

    [[nodiscard]] PhotonRow to_row(const PhotonEvent &event) noexcept;

    [[nodiscard]] Result run(const RunRequest &request, RunResponse &response);

    [[nodiscard]] Result encrypt(const EncryptRequest &request, EncodedEnvelope &response);

    [[nodiscard]] Result decrypt(const DecryptRequest &request, DecryptResponse &response);

    namespace json {
        /*
         * Each handler takes a JSON request body and returns a JSON response
         * body: the result object, or {"error": message} on failure.
         */
        [[nodiscard]] std::string handle_run(std::string_view body);

        [[nodiscard]] std::string handle_encrypt(std::string_view body);

        [[nodiscard]] std::string handle_decrypt(std::string_view body);

        [[nodiscard]] std::string error_body(Result result);
    }
}

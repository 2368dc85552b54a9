#include "qkdsim/service.h"
#include <nlohmann/json.hpp>
#include <limits>
#include <new>

namespace qkdsim::service::json {
    namespace {
        using nlohmann::json;
        using nlohmann::ordered_json;

        namespace keys {
            constexpr char kPhotonCount[] = "n_bits";
            constexpr char kEveProbability[] = "eve_prob";
            constexpr char kSeed[] = "seed";
            constexpr char kMessage[] = "message";
            constexpr char kKey[] = "key";
            constexpr char kEncryptedData[] = "encrypted_data";
            constexpr char kCiphertext[] = "ciphertext";
            constexpr char kNonce[] = "nonce";
            constexpr char kTag[] = "tag";
            constexpr char kDecrypted[] = "decrypted";
            constexpr char kError[] = "error";
        }

        [[nodiscard]] std::string dump(const ordered_json &document) {
            return document.dump(-1, ' ', false, ordered_json::error_handler_t::replace);
        }

        [[nodiscard]] const char *yes_no(const bool value) noexcept {
            return value ? "Yes" : "No";
        }

        [[nodiscard]] ordered_json bits_to_json(const BitString &bits) {
            ordered_json array = ordered_json::array();
            for (const Bit bit : bits) {
                array.push_back(util::to_int(bit));
            }
            return array;
        }

        [[nodiscard]] Result parse_body(const std::string_view body, json &document) {
            document = json::parse(body.begin(), body.end(), nullptr, false);
            if (document.is_discarded() || !document.is_object()) {
                return Result::InvalidInput;
            }
            return Result::Success;
        }

        [[nodiscard]] Result parse_run_request(const json &document, RunRequest &request) {
            if (const auto it = document.find(keys::kPhotonCount); it != document.end()) {
                if (it->is_number_unsigned()) {
                    const auto value = it->get<uint64_t>();
                    if (value > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
                        return Result::InvalidParameter;
                    }
                    request.photon_count = static_cast<int64_t>(value);
                } else if (it->is_number_integer()) {
                    request.photon_count = it->get<int64_t>();
                } else {
                    return Result::InvalidParameter;
                }
            }
            if (const auto it = document.find(keys::kEveProbability); it != document.end()) {
                if (!it->is_number()) {
                    return Result::InvalidParameter;
                }
                request.eve_intercept_probability = it->get<double>();
            }
            if (const auto it = document.find(keys::kSeed); it != document.end() && !it->is_null()) {
                if (!it->is_number_unsigned()) {
                    return Result::InvalidParameter;
                }
                request.seed = it->get<uint64_t>();
            }
            return Result::Success;
        }

        [[nodiscard]] Result parse_key(const json &document, BitString &key) {
            key.clear();
            const auto it = document.find(keys::kKey);
            if (it == document.end()) {
                return Result::Success;
            }
            if (!it->is_array()) {
                return Result::InvalidInput;
            }
            key.reserve(it->size());
            for (const json &element : *it) {
                if (!element.is_number_integer()) {
                    return Result::InvalidInput;
                }
                const auto value = element.get<int64_t>();
                if (value != 0 && value != 1) {
                    return Result::InvalidInput;
                }
                key.push_back(util::to_bit(value == 1));
            }
            return Result::Success;
        }

        [[nodiscard]] Result parse_string(const json &document, const char *name, std::string &out) {
            const auto it = document.find(name);
            if (it == document.end()) {
                out.clear();
                return Result::Success;
            }
            if (!it->is_string()) {
                return Result::InvalidInput;
            }
            out = it->get<std::string>();
            return Result::Success;
        }

        [[nodiscard]] ordered_json run_response_to_json(const RunResponse &response) {
            ordered_json table = ordered_json::array();
            for (const PhotonRow &row : response.rows) {
                ordered_json entry;
                entry["Alice Bit"] = util::to_int(row.alice_bit);
                entry["Alice Basis"] = row.alice_basis_symbol;
                entry["Bob Basis"] = row.bob_basis_symbol;
                entry["Eve Intercepting"] = yes_no(row.eve_intercepted);
                if (row.eve_bit.has_value()) {
                    entry["Eve Bit"] = util::to_int(*row.eve_bit);
                } else {
                    entry["Eve Bit"] = "-";
                }
                entry["Bob Measured Bit"] = util::to_int(row.bob_bit);
                entry["Match"] = yes_no(row.bases_match);
                table.push_back(std::move(entry));
            }
            ordered_json document;
            document["table_data"] = std::move(table);
            document["alice_key"] = bits_to_json(response.alice_key);
            document["bob_key"] = bits_to_json(response.bob_key);
            document["qber"] = response.qber;
            document["eve_key"] = bits_to_json(response.eve_key);
            document["matched_indices"] = response.matched_indices;
            return document;
        }

        template<typename Handler>
        [[nodiscard]] std::string guarded(Handler &&handler) {
            try {
                return handler();
            } catch (const std::bad_alloc &) {
                return error_body(Result::MemoryError);
            } catch (const nlohmann::json::exception &) {
                return error_body(Result::InvalidInput);
            }
        }
    }

    std::string error_body(const Result result) {
        ordered_json document;
        document[keys::kError] = error_message(result);
        return dump(document);
    }

    std::string handle_run(const std::string_view body) {
        return guarded([&]() -> std::string {
            json document;
            if (const Result result = parse_body(body, document); result != Result::Success) {
                return error_body(result);
            }
            RunRequest request;
            if (const Result result = parse_run_request(document, request); result != Result::Success) {
                return error_body(result);
            }
            RunResponse response;
            if (const Result result = run(request, response); result != Result::Success) {
                return error_body(result);
            }
            return dump(run_response_to_json(response));
        });
    }

    std::string handle_encrypt(const std::string_view body) {
        return guarded([&]() -> std::string {
            json document;
            if (const Result result = parse_body(body, document); result != Result::Success) {
                return error_body(result);
            }
            EncryptRequest request;
            if (const Result result = parse_string(document, keys::kMessage, request.message);
                result != Result::Success) {
                return error_body(result);
            }
            if (const Result result = parse_key(document, request.key); result != Result::Success) {
                return error_body(result);
            }
            EncodedEnvelope response;
            if (const Result result = encrypt(request, response); result != Result::Success) {
                return error_body(result);
            }
            ordered_json out;
            out[keys::kCiphertext] = response.ciphertext;
            out[keys::kNonce] = response.nonce;
            out[keys::kTag] = response.tag;
            return dump(out);
        });
    }

    std::string handle_decrypt(const std::string_view body) {
        return guarded([&]() -> std::string {
            json document;
            if (const Result result = parse_body(body, document); result != Result::Success) {
                return error_body(result);
            }
            DecryptRequest request;
            if (const Result result = parse_key(document, request.key); result != Result::Success) {
                return error_body(result);
            }
            const auto envelope = document.find(keys::kEncryptedData);
            if (envelope == document.end() || !envelope->is_object()) {
                return error_body(Result::InvalidInput);
            }
            if (parse_string(*envelope, keys::kCiphertext, request.envelope.ciphertext) != Result::Success ||
                parse_string(*envelope, keys::kNonce, request.envelope.nonce) != Result::Success ||
                parse_string(*envelope, keys::kTag, request.envelope.tag) != Result::Success) {
                return error_body(Result::InvalidInput);
            }
            DecryptResponse response;
            if (const Result result = decrypt(request, response); result != Result::Success) {
                return error_body(result);
            }
            ordered_json out;
            out[keys::kDecrypted] = response.decrypted;
            return dump(out);
        });
    }
}

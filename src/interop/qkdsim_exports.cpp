#include "qkdsim/qkdsim.h"
#include "qkdsim/simulation.h"
#include "qkdsim/service.h"
#include "qkdsim/protocol.h"
#include "qkdsim/secure_cleanup.h"
#include "qkdsim/c_api.h"
#include "qkdsim/export.h"
#include <sodium.h>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <limits>
#include <memory>
#include <new>
#include <string>

#ifdef QKDSIM_INTEROP_LOGGING
#include <cstdio>
#warning "QKDSIM_INTEROP_LOGGING is enabled - DO NOT use in production builds!"

namespace {
constexpr char kInteropLogPrefix[] = "[QKDSIM-INTEROP] ";
}

#define QKDSIM_INTEROP_LOG(fmt, ...) fprintf(stderr, "%s" fmt "\n", kInteropLogPrefix __VA_OPT__(,) __VA_ARGS__)

#else

#define QKDSIM_INTEROP_LOG(fmt, ...) ((void)0)

#endif

using namespace qkdsim;

struct qkdsim_stream_handle_t {
    PhotonStream stream;
};

namespace {
    [[nodiscard]] Result bits_from_bytes(const uint8_t *key_bits, const size_t key_bit_count, BitString &bits) {
        if (key_bit_count == 0) {
            return Result::InsufficientEntropy;
        }
        if (!key_bits) {
            return Result::InvalidInput;
        }
        bits.clear();
        bits.reserve(key_bit_count);
        for (size_t i = 0; i < key_bit_count; ++i) {
            if (key_bits[i] > 1) {
                return Result::InvalidInput;
            }
            bits.push_back(util::to_bit(key_bits[i] == 1));
        }
        return Result::Success;
    }

    [[nodiscard]] Result derive_from_bytes(const uint8_t *key_bits, const size_t key_bit_count, DerivedKey &key) {
        BitString bits;
        QKDSIM_TRY(bits_from_bytes(key_bits, key_bit_count, bits));
        return key_derivation::derive(bits, key);
    }

    void to_c_event(const PhotonEvent &event, qkdsim_photon_event_t &out) {
        out.index = static_cast<uint64_t>(event.index);
        out.alice_bit = util::to_int(event.alice_bit);
        out.alice_basis = static_cast<uint8_t>(event.alice_basis);
        out.eve_intercepted = event.eve_intercepted ? 1 : 0;
        out.eve_basis = event.eve_basis ? static_cast<uint8_t>(*event.eve_basis) : QKDSIM_ABSENT;
        out.eve_bit = event.eve_bit ? util::to_int(*event.eve_bit) : QKDSIM_ABSENT;
        out.bob_basis = static_cast<uint8_t>(event.bob_basis);
        out.bob_bit = util::to_int(event.bob_bit);
        out.bases_match = event.bases_match() ? 1 : 0;
    }

    [[nodiscard]] int copy_out(const std::string &body, char **response_json) {
        auto *buffer = static_cast<char *>(std::malloc(body.size() + 1));
        if (!buffer) {
            return static_cast<int>(Result::MemoryError);
        }
        std::memcpy(buffer, body.c_str(), body.size() + 1);
        *response_json = buffer;
        return static_cast<int>(Result::Success);
    }

    template<typename Handler>
    [[nodiscard]] int json_call(const char *name, const char *request_json, char **response_json,
                                Handler &&handler) {
        QKDSIM_INTEROP_LOG("=== %s ===", name);
        if (!request_json || !response_json) {
            QKDSIM_INTEROP_LOG("ERROR: InvalidInput - null argument");
            return static_cast<int>(Result::InvalidInput);
        }
        *response_json = nullptr;
        try {
            const std::string body = handler(std::string_view(request_json));
            QKDSIM_INTEROP_LOG("response length=%zu", body.size());
            return copy_out(body, response_json);
        } catch (const std::bad_alloc &) {
            QKDSIM_INTEROP_LOG("ERROR: allocation failure");
            return static_cast<int>(Result::MemoryError);
        } catch (const std::exception &e) {
            QKDSIM_INTEROP_LOG("ERROR: Exception - %s", e.what());
            return static_cast<int>(Result::MemoryError);
        }
    }
}

extern "C" {
QKDSIM_C_EXPORT const char *qkdsim_version(void) {
    return GetVersionString();
}

QKDSIM_C_EXPORT int qkdsim_stream_open(const uint64_t photon_count, const double eve_intercept_probability,
                                       const uint64_t *seed, qkdsim_stream_handle_t **handle) {
    QKDSIM_INTEROP_LOG("=== qkdsim_stream_open ===");
    QKDSIM_INTEROP_LOG("photon_count=%llu, eve_intercept_probability=%f, seeded=%d",
                       static_cast<unsigned long long>(photon_count), eve_intercept_probability, seed ? 1 : 0);
    if (!handle) {
        return static_cast<int>(Result::InvalidInput);
    }
    *handle = nullptr;
    if (photon_count > static_cast<uint64_t>(std::numeric_limits<size_t>::max())) {
        return static_cast<int>(Result::InvalidParameter);
    }
    const SimulationParameters parameters{static_cast<size_t>(photon_count), eve_intercept_probability};
    if (const Result result = simulation::validate(parameters); result != Result::Success) {
        QKDSIM_INTEROP_LOG("ERROR: InvalidParameter");
        return static_cast<int>(result);
    }
    try {
        std::unique_ptr<BitBasisSource> source;
        const std::optional<uint64_t> seed_value = seed ? std::optional<uint64_t>(*seed) : std::nullopt;
        if (const Result result = service::make_source(seed_value, source); result != Result::Success) {
            return static_cast<int>(result);
        }
        auto owned = std::make_unique<qkdsim_stream_handle_t>();
        if (const Result result = simulation::open_stream(parameters, std::move(source), owned->stream);
            result != Result::Success) {
            return static_cast<int>(result);
        }
        *handle = owned.release();
        QKDSIM_INTEROP_LOG("SUCCESS: stream handle created at %p", static_cast<void *>(*handle));
        return static_cast<int>(Result::Success);
    } catch (const std::bad_alloc &) {
        QKDSIM_INTEROP_LOG("ERROR: allocation failure");
        return static_cast<int>(Result::MemoryError);
    } catch (const std::exception &e) {
        QKDSIM_INTEROP_LOG("ERROR: Exception - %s", e.what());
        return static_cast<int>(Result::MemoryError);
    }
}

QKDSIM_C_EXPORT int qkdsim_stream_next(qkdsim_stream_handle_t *handle, qkdsim_photon_event_t *event_out) {
    if (!handle || !event_out) {
        return static_cast<int>(Result::InvalidInput);
    }
    PhotonEvent event;
    if (const Result result = handle->stream.next(event); result != Result::Success) {
        return static_cast<int>(result);
    }
    to_c_event(event, *event_out);
    return static_cast<int>(Result::Success);
}

QKDSIM_C_EXPORT void qkdsim_stream_destroy(qkdsim_stream_handle_t *handle) {
    QKDSIM_INTEROP_LOG("=== qkdsim_stream_destroy === handle=%p", static_cast<void *>(handle));
    std::unique_ptr<qkdsim_stream_handle_t> owned(handle);
}

QKDSIM_C_EXPORT size_t qkdsim_envelope_length(const size_t message_length) {
    return protocol::envelope_length(message_length);
}

QKDSIM_C_EXPORT int qkdsim_encrypt(const uint8_t *key_bits, const size_t key_bit_count,
                                   const uint8_t *message, const size_t message_length,
                                   uint8_t *envelope_out, const size_t envelope_length) {
    QKDSIM_INTEROP_LOG("=== qkdsim_encrypt === key_bit_count=%zu, message_length=%zu",
                       key_bit_count, message_length);
    if (!message || message_length == 0 || !envelope_out ||
        envelope_length != protocol::envelope_length(message_length)) {
        return static_cast<int>(Result::InvalidInput);
    }
    try {
        DerivedKey key;
        if (const Result result = derive_from_bytes(key_bits, key_bit_count, key); result != Result::Success) {
            return static_cast<int>(result);
        }
        CipherEnvelope envelope;
        if (const Result result = cipher::encrypt(message, message_length, key, envelope);
            result != Result::Success) {
            return static_cast<int>(result);
        }
        return static_cast<int>(protocol::write_envelope(envelope, envelope_out, envelope_length));
    } catch (const std::bad_alloc &) {
        return static_cast<int>(Result::MemoryError);
    } catch (const std::exception &e) {
        QKDSIM_INTEROP_LOG("ERROR: Exception - %s", e.what());
        return static_cast<int>(Result::MemoryError);
    }
}

QKDSIM_C_EXPORT int qkdsim_decrypt(const uint8_t *key_bits, const size_t key_bit_count,
                                   const uint8_t *envelope, const size_t envelope_length,
                                   uint8_t *message_out, const size_t message_length) {
    QKDSIM_INTEROP_LOG("=== qkdsim_decrypt === key_bit_count=%zu, envelope_length=%zu",
                       key_bit_count, envelope_length);
    if (!envelope || !message_out || envelope_length <= ENVELOPE_HEADER_LENGTH ||
        message_length != envelope_length - ENVELOPE_HEADER_LENGTH) {
        return static_cast<int>(Result::InvalidInput);
    }
    try {
        DerivedKey key;
        if (const Result result = derive_from_bytes(key_bits, key_bit_count, key); result != Result::Success) {
            return static_cast<int>(result);
        }
        CipherEnvelope parsed;
        if (const Result result = protocol::read_envelope(envelope, envelope_length, parsed);
            result != Result::Success) {
            return static_cast<int>(result);
        }
        secure_bytes plaintext;
        auto cleanup_guard = make_cleanup([&] { secure_clear(plaintext); });
        if (const Result result = cipher::decrypt(parsed, key, plaintext); result != Result::Success) {
            QKDSIM_INTEROP_LOG("ERROR: decrypt failed (%d)", static_cast<int>(result));
            return static_cast<int>(result);
        }
        std::memcpy(message_out, plaintext.data(), plaintext.size());
        return static_cast<int>(Result::Success);
    } catch (const std::bad_alloc &) {
        return static_cast<int>(Result::MemoryError);
    } catch (const std::exception &e) {
        QKDSIM_INTEROP_LOG("ERROR: Exception - %s", e.what());
        return static_cast<int>(Result::MemoryError);
    }
}

QKDSIM_C_EXPORT int qkdsim_run_json(const char *request_json, char **response_json) {
    return json_call("qkdsim_run_json", request_json, response_json, service::json::handle_run);
}

QKDSIM_C_EXPORT int qkdsim_encrypt_json(const char *request_json, char **response_json) {
    return json_call("qkdsim_encrypt_json", request_json, response_json, service::json::handle_encrypt);
}

QKDSIM_C_EXPORT int qkdsim_decrypt_json(const char *request_json, char **response_json) {
    return json_call("qkdsim_decrypt_json", request_json, response_json, service::json::handle_decrypt);
}

QKDSIM_C_EXPORT void qkdsim_string_free(char *str) {
    if (str) {
        sodium_memzero(str, std::strlen(str));
        std::free(str);
    }
}
}

#pragma once
#include "export.h"
#include <stddef.h>
#include <stdint.h>

/*
 * C ABI for presentation layers written in other languages. All int returns
 * are qkdsim::Result codes (0 on success).
 */

#define QKDSIM_ABSENT 0xFFu

#ifdef __cplusplus
extern "C" {
#endif

typedef struct qkdsim_stream_handle_t qkdsim_stream_handle_t;

/* eve_basis and eve_bit hold QKDSIM_ABSENT when eve_intercepted is 0. */
typedef struct qkdsim_photon_event_t {
    uint64_t index;
    uint8_t alice_bit;
    uint8_t alice_basis;
    uint8_t eve_intercepted;
    uint8_t eve_basis;
    uint8_t eve_bit;
    uint8_t bob_basis;
    uint8_t bob_bit;
    uint8_t bases_match;
} qkdsim_photon_event_t;

QKDSIM_API const char *qkdsim_version(void);

QKDSIM_API int qkdsim_stream_open(uint64_t photon_count, double eve_intercept_probability,
                                  const uint64_t *seed, qkdsim_stream_handle_t **handle);

QKDSIM_API int qkdsim_stream_next(qkdsim_stream_handle_t *handle, qkdsim_photon_event_t *event_out);

QKDSIM_API void qkdsim_stream_destroy(qkdsim_stream_handle_t *handle);

QKDSIM_API size_t qkdsim_envelope_length(size_t message_length);

QKDSIM_API int qkdsim_encrypt(const uint8_t *key_bits, size_t key_bit_count,
                              const uint8_t *message, size_t message_length,
                              uint8_t *envelope_out, size_t envelope_length);

QKDSIM_API int qkdsim_decrypt(const uint8_t *key_bits, size_t key_bit_count,
                              const uint8_t *envelope, size_t envelope_length,
                              uint8_t *message_out, size_t message_length);

/*
 * JSON handlers return 0 once a response body is produced; request-level
 * failures are reported inside the body as {"error": message}. Release the
 * body with qkdsim_string_free.
 */
QKDSIM_API int qkdsim_run_json(const char *request_json, char **response_json);

QKDSIM_API int qkdsim_encrypt_json(const char *request_json, char **response_json);

QKDSIM_API int qkdsim_decrypt_json(const char *request_json, char **response_json);

QKDSIM_API void qkdsim_string_free(char *str);

#ifdef __cplusplus
}
#endif

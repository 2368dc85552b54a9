#pragma once

#include <cstdint>
#include <cstddef>

#ifdef QKDSIM_DEBUG_LOGGING
#include <cstdio>
#warning "QKDSIM_DEBUG_LOGGING is enabled - DO NOT use in production builds!"
#endif

/*
 * Debug tracing for protocol runs. Only public values (counts, rates,
 * nonces, ciphertext) go through here. Key bits and derived keys never do.
 */
namespace qkdsim {
namespace log {

#ifdef QKDSIM_DEBUG_LOGGING

    inline void hex(const char* label, const uint8_t* data, size_t length) {
        if (!data || length == 0) {
            fprintf(stdout, "[QKDSIM] %s: (null or empty)\n", label);
            fflush(stdout);
            return;
        }
        fprintf(stdout, "[QKDSIM] %s (%zu bytes): ", label, length);
        for (size_t i = 0; i < length; ++i) {
            fprintf(stdout, "%02x", data[i]);
        }
        fprintf(stdout, "\n");
        fflush(stdout);
    }

    template<typename Container>
    inline void hex(const char* label, const Container& container) {
        hex(label, container.data(), container.size());
    }

    inline void count(const char* label, size_t value) {
        fprintf(stdout, "[QKDSIM] %s: %zu\n", label, value);
        fflush(stdout);
    }

    inline void ratio(const char* label, double value) {
        fprintf(stdout, "[QKDSIM] %s: %.6f\n", label, value);
        fflush(stdout);
    }

    inline void msg(const char* message) {
        fprintf(stdout, "[QKDSIM] %s\n", message);
        fflush(stdout);
    }

    inline void section(const char* section_name) {
        fprintf(stdout, "\n[QKDSIM] ===== %s =====\n", section_name);
        fflush(stdout);
    }

#else

    inline void hex(const char*, const uint8_t*, size_t) {}

    template<typename Container>
    inline void hex(const char*, const Container&) {}

    inline void count(const char*, size_t) {}

    inline void ratio(const char*, double) {}

    inline void msg(const char*) {}

    inline void section(const char*) {}

#endif

}
}

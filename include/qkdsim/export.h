#pragma once

#ifdef _WIN32
#ifdef QKDSIM_EXPORTS
#define QKDSIM_API __declspec(dllexport)
#else
#define QKDSIM_API __declspec(dllimport)
#endif
#elif defined(__GNUC__) && __GNUC__ >= 4
#define QKDSIM_API __attribute__((visibility("default")))
#else
#define QKDSIM_API
#endif
#ifdef __cplusplus
#define QKDSIM_EXTERN_C extern "C"
#else
#define QKDSIM_EXTERN_C
#endif
#define QKDSIM_C_EXPORT QKDSIM_EXTERN_C QKDSIM_API

#ifdef __cplusplus
namespace qkdsim {
    constexpr const char *GetVersionString() noexcept {
        return "1.0.0";
    }
}
#endif

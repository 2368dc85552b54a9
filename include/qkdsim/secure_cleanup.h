#pragma once
/**
 * @file secure_cleanup.h
 * @brief RAII cleanup helpers for key material and intermediate buffers.
 *
 * Usage:
 *   SecureLocal<64> prk;                // stack buffer, zeroed on destruction
 *   auto guard = make_cleanup([&] { secure_wipe(packed); });
 *   QKDSIM_TRY(crypto::hmac(...));      // early return, cleanup runs via RAII
 */

#include <sodium.h>
#include <cstdint>
#include <cstddef>
#include <utility>
#include <type_traits>
#include "qkdsim/qkdsim.h"

namespace qkdsim {

/**
 * ScopeGuard: runs a callable on scope exit unless dismissed.
 */
template<typename F>
class ScopeGuard {
public:
    explicit ScopeGuard(F&& fn) noexcept
        : fn_(std::move(fn)), active_(true) {}

    ScopeGuard(ScopeGuard&& other) noexcept
        : fn_(std::move(other.fn_)), active_(other.active_) {
        other.active_ = false;
    }

    ~ScopeGuard() {
        if (active_) {
            fn_();
        }
    }

    void dismiss() noexcept { active_ = false; }

    ScopeGuard(const ScopeGuard&) = delete;
    ScopeGuard& operator=(const ScopeGuard&) = delete;
    ScopeGuard& operator=(ScopeGuard&&) = delete;

private:
    F fn_;
    bool active_;
};

template<typename F>
[[nodiscard]] ScopeGuard<std::decay_t<F>> make_cleanup(F&& fn) noexcept {
    return ScopeGuard<std::decay_t<F>>(std::forward<F>(fn));
}


/**
 * SecureLocal<N>: fixed-size stack buffer wiped with sodium_memzero
 * on construction and destruction.
 */
template<size_t N>
class SecureLocal {
    static_assert(N > 0 && N <= 8192, "SecureLocal size must be in [1, 8192]");
public:
    SecureLocal() noexcept {
        sodium_memzero(buf_, N);
    }

    ~SecureLocal() {
        sodium_memzero(buf_, N);
    }

    SecureLocal(const SecureLocal&) = delete;
    SecureLocal& operator=(const SecureLocal&) = delete;
    SecureLocal(SecureLocal&&) = delete;
    SecureLocal& operator=(SecureLocal&&) = delete;

    [[nodiscard]] uint8_t* data() noexcept { return buf_; }
    [[nodiscard]] constexpr size_t size() const noexcept { return N; }

    operator uint8_t*() noexcept { return buf_; }
    operator const uint8_t*() const noexcept { return buf_; }

private:
    uint8_t buf_[N];
};


/**
 * QKDSIM_TRY: return the Result of `expr` from the enclosing function
 * unless it is Success.
 */
#define QKDSIM_TRY(expr)                          \
    do {                                           \
        if (auto _r = (expr); _r != Result::Success) \
            return _r;                             \
    } while (0)


/* Zero the contents, keep the allocation. */
inline void secure_wipe(secure_bytes &buffer) noexcept {
    if (!buffer.empty()) {
        sodium_memzero(buffer.data(), buffer.size());
    }
}

/* Zero the contents and release them. */
inline void secure_clear(secure_bytes &buffer) noexcept {
    if (!buffer.empty()) {
        sodium_memzero(buffer.data(), buffer.size());
        buffer.clear();
    }
}

} // namespace qkdsim

#include "qkdsim/qkdsim.h"
#include <cstring>
#include <cstdint>
#include <sodium.h>
#include <new>
#include <cstdlib>
#include <sys/mman.h>
#include <unistd.h>

namespace qkdsim {
namespace {
    constexpr size_t kDefaultPageSize = 4096;

    size_t secure_page_size() {
        const long page_size = sysconf(_SC_PAGESIZE);
        if (page_size > 0) {
            return static_cast<size_t>(page_size);
        }
        return kDefaultPageSize;
    }

    size_t page_aligned(const size_t size, const size_t page_size) {
        return (size + page_size - 1) & ~(page_size - 1);
    }

    void *secure_malloc(const size_t size) {
        if (size == 0) return nullptr;
        const size_t page_size = secure_page_size();
        const size_t aligned_size = page_aligned(size, page_size);
        void *ptr = nullptr;
        if (posix_memalign(&ptr, page_size, aligned_size) != 0) {
            return nullptr;
        }
        /* Locking is best effort: RLIMIT_MEMLOCK may be tiny. */
        (void)mlock(ptr, aligned_size);
        std::memset(ptr, 0, aligned_size);
        return ptr;
    }

    void secure_free(void *ptr, const size_t size) {
        if (!ptr) return;
        const size_t aligned_size = page_aligned(size, secure_page_size());
        sodium_memzero(ptr, aligned_size);
        munlock(ptr, aligned_size);
        free(ptr);
    }
}

    template<SecurelyAllocatable T>
    T *SecureAllocator<T>::allocate(const size_t n) {
        if (n == 0) {
            return nullptr;
        }
        if (n > SIZE_MAX / sizeof(T)) [[unlikely]] {
            throw std::bad_alloc();
        }
        void *ptr = secure_malloc(n * sizeof(T));
        if (!ptr) [[unlikely]] {
            throw std::bad_alloc();
        }
        return static_cast<T *>(ptr);
    }

    template<SecurelyAllocatable T>
    void SecureAllocator<T>::deallocate(T *p, const size_t n) {
        if (p) [[likely]] {
            secure_free(p, n * sizeof(T));
        }
    }

    template class SecureAllocator<uint8_t>;

    DerivedKey::DerivedKey() = default;

    DerivedKey::~DerivedKey() {
        if (!material.empty()) {
            sodium_memzero(material.data(), material.size());
        }
    }

    CipherEnvelope::CipherEnvelope() : nonce(NONCE_LENGTH), auth_tag(AUTH_TAG_LENGTH) {
    }
}

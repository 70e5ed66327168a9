#pragma once

#include <cachematrix/detail/cachematrix.h>

#include <utility>

namespace cmat {
namespace detail {

template <typename T> struct Global {
    static cmat_Api const* api_;
};
template <typename T> cmat_Api const* Global<T>::api_{};

} // namespace detail

inline cmat_Api const& api() {
#ifndef CACHEMATRIX_LOAD_DYNAMIC
    if (!detail::Global<void>::api_) {
        detail::Global<void>::api_ = cmat_init();
    }
#endif
    return *detail::Global<void>::api_;
}

namespace detail {
inline void destroy(cmat_CacheMatrix h) { api().destroy_cache_matrix(h); }
} // namespace detail

// Sole owner of a library object. Moving transfers ownership, the moved-from handle is empty.
template <typename T> class Handle {
  public:
    Handle() noexcept = default;
    Handle(T* handle) noexcept : m_(handle) {}

    Handle(Handle const&) = delete;
    Handle& operator=(Handle const&) = delete;

    Handle(Handle&& other) noexcept : m_(std::exchange(other.m_, nullptr)) {}
    Handle& operator=(Handle&& other) noexcept {
        std::swap(m_, other.m_);
        return *this;
    }

    virtual ~Handle() {
        if (m_) {
            detail::destroy(m_);
        }
    }

    T* handle() const noexcept { return m_; }
    explicit operator bool() const noexcept { return m_ != nullptr; }

  protected:
    T*& emplace() noexcept { return m_; }

  private:
    T* m_ = nullptr;
};

} // namespace cmat

#pragma once

#include <atomic>
#include <cassert>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <utility>
#include "rci/config.hh"

///
// Count policies:
// - SingleDomain: a plain counter, only ever touched from one thread at a time.
// - CrossDomain: an atomic counter, so handles may be cloned and dropped from
//   any thread.
//

namespace rci {

    struct SingleDomain {
        using Counter = size_t;

        static size_t load(Counter const& counter) {
            return counter;
        }
        // returns the count before the increment
        static size_t retain(Counter& counter) {
            return counter++;
        }
        // returns true iff the last strong reference was just dropped
        static bool release(Counter& counter) {
            return --counter == 0;
        }
    };

    struct CrossDomain {
        using Counter = std::atomic<size_t>;

        static size_t load(Counter const& counter) {
            return counter.load(std::memory_order_acquire);
        }
        static size_t retain(Counter& counter) {
            return counter.fetch_add(1, std::memory_order_relaxed);
        }
        static bool release(Counter& counter) {
            if (counter.fetch_sub(1, std::memory_order_release) != 1) {
                return false;
            }
            // all other holders' writes must be visible before the value is destroyed
            std::atomic_thread_fence(std::memory_order_acquire);
            return true;
        }
    };

    constexpr size_t MAX_STRONG_COUNT = RCI_CONFIG_MAX_STRONG_COUNT;

    [[noreturn]] void refcount_overflow_error(size_t count, size_t limit);
    [[noreturn]] void null_box_error();

}   // namespace rci

///
// Shared<T, D>: a strong-only reference-counted handle to an immutable T.
// The count and the value share a single allocation.
//

namespace rci {

    namespace detail {

        template <typename T, typename D>
        struct SharedBox {
            typename D::Counter strong;
            T value;

            template <typename... TArgs>
            explicit SharedBox(TArgs&&... args)
            :   strong(1),
                value(std::forward<TArgs>(args)...)
            {}
        };

    }   // namespace detail

    template <typename T, typename D>
    class Shared {
    private:
        using Box = detail::SharedBox<T, D>;

    private:
        Box* m_box;

    private:
        explicit Shared(Box* box) noexcept
        :   m_box(box)
        {}

    public:
        Shared() noexcept
        :   m_box(nullptr)
        {}
        Shared(Shared const& other)
        :   m_box(other.m_box)
        {
            retain();
        }
        Shared(Shared&& other) noexcept
        :   m_box(std::exchange(other.m_box, nullptr))
        {}
        ~Shared() {
            release();
        }

        Shared& operator=(Shared const& other) {
            Shared copy{other};
            swap(copy);
            return *this;
        }
        Shared& operator=(Shared&& other) noexcept {
            Shared moved{std::move(other)};
            swap(moved);
            return *this;
        }

    public:
        template <typename... TArgs>
        static Shared make(TArgs&&... args) {
            return Shared{new Box(std::forward<TArgs>(args)...)};
        }
        // Moves the boxed value into a fresh handle allocation, releasing the box.
        static Shared from_box(std::unique_ptr<T> box) {
            if (!box) {
                null_box_error();
            }
            return make(std::move(*box));
        }

    public:
        T const& operator*() const {
            assert(m_box != nullptr && "dereferenced an empty handle");
            return m_box->value;
        }
        T const* operator->() const {
            return &**this;
        }
        T const* get() const {
            return m_box != nullptr ? &m_box->value : nullptr;
        }
        explicit operator bool() const {
            return m_box != nullptr;
        }

        size_t strong_count() const {
            return m_box != nullptr ? D::load(m_box->strong) : 0;
        }
        bool ptr_eq(Shared const& other) const {
            return m_box == other.m_box;
        }

        void reset() {
            Shared{}.swap(*this);
        }
        void swap(Shared& other) noexcept {
            std::swap(m_box, other.m_box);
        }

    private:
        void retain() {
            if (m_box == nullptr) {
                return;
            }
            size_t old_count = D::retain(m_box->strong);
#if RCI_CONFIG_CHECK_REFCOUNT_OVERFLOW
            if (old_count >= MAX_STRONG_COUNT) {
                // the throwing copy is never destroyed, so take its reference back here.
                // `old_count` holders remain, so this cannot drop the last one.
                D::release(m_box->strong);
                refcount_overflow_error(old_count, MAX_STRONG_COUNT);
            }
#else
            (void)old_count;
#endif
        }
        void release() {
            if (m_box != nullptr && D::release(m_box->strong)) {
                delete m_box;
            }
        }
    };

    // handles compare by identity: for interned values this agrees with value equality
    template <typename T, typename D>
    inline bool operator==(Shared<T, D> const& lt, Shared<T, D> const& rt) {
        return lt.ptr_eq(rt);
    }

    template <typename T>
    using Rc = Shared<T, SingleDomain>;
    template <typename T>
    using Arc = Shared<T, CrossDomain>;

}   // namespace rci

namespace std {

    template <typename T, typename D>
    struct hash<rci::Shared<T, D>> {
        size_t operator()(rci::Shared<T, D> const& handle) const noexcept {
            return std::hash<T const*>{}(handle.get());
        }
    };

}   // namespace std

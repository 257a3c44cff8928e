#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <span>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include "rci/common.hh"
#include "rci/config.hh"
#include "rci/feedback.hh"
#include "rci/intern-key.hh"
#include "rci/shared.hh"

///
// BasicInterner<T, D>: deduplicates values of type T behind shared handles.
// - every distinct value (by `KeyTraits<T>::equal`) has at most one entry, and
//   the first value inserted stays canonical until it is purged.
// - the table holds one strong reference per entry; `compact()` drops every
//   entry whose only holder is the table itself.
// - the table has no internal locking, even with `D = CrossDomain`: callers
//   serialize `intern*` and `compact` themselves.
//

namespace rci {

    template <typename T, typename D>
    class BasicInterner {
    public:
        using Handle = Shared<T, D>;

    private:
        using EntrySet = UnstableHashSet<Handle, HandleHash<T, D>, HandleEqual<T, D>>;

    public:
        using const_iterator = typename EntrySet::const_iterator;

    private:
        EntrySet m_entries;

    public:
        BasicInterner() = default;
        BasicInterner(BasicInterner const&) = delete;
        BasicInterner(BasicInterner&&) = default;
        BasicInterner& operator=(BasicInterner const&) = delete;
        BasicInterner& operator=(BasicInterner&&) = default;

    public:
        // Lookup only: never allocates, never mutates the table.
        template <LookupKey<T> K>
        std::optional<Handle> try_intern(K const& value) const {
            auto it = m_entries.find(value);
            if (it != m_entries.end()) {
                return *it;
            } else {
                return std::nullopt;
            }
        }

        // On a hit, `value` is discarded.
        Handle intern(T value) {
            return intern_with(value, [&value]() {
                return Handle::make(std::move(value));
            });
        }
        // Copies `value` only on a miss.
        Handle intern_cloned(T const& value) {
            return intern_with(value, [&value]() {
                return Handle::make(value);
            });
        }
        // The box is released either way; on a miss its value is moved into
        // the new canonical allocation.
        Handle intern_owned_unsized(std::unique_ptr<T> box) {
            if (!box) {
                null_box_error();
            }
            T const& value = *box;
            return intern_with(value, [&box]() {
                return Handle::from_box(std::move(box));
            });
        }

        void compact() {
#if RCI_CONFIG_LOG_COMPACTION
            size_t const old_size = m_entries.size();
#endif
            for (auto it = m_entries.begin(); it != m_entries.end();) {
                if (it->strong_count() > 1) {
                    ++it;
                } else {
                    // `erase` returns the same slot if a later entry was shifted into it
                    it = m_entries.erase(it);
                }
            }
            m_entries.compact();
#if RCI_CONFIG_LOG_COMPACTION
            std::stringstream ss;
            ss << "compact: purged " << (old_size - m_entries.size()) << " of " << old_size << " entries, "
               << m_entries.size() << " remain";
            info(ss.str());
#endif
        }

    public:
        size_t size() const { return m_entries.size(); }
        bool empty() const { return m_entries.empty(); }
        const_iterator begin() const { return m_entries.begin(); }
        const_iterator end() const { return m_entries.end(); }

    protected:
        // Returns the canonical handle equal to `key`, calling `make_handle`
        // to create (and register) it only if there is none yet.
        template <LookupKey<T> K, typename F>
        Handle intern_with(K const& key, F&& make_handle) {
            auto it = m_entries.find(key);
            if (it != m_entries.end()) {
                return *it;
            }
            Handle handle = make_handle();
            m_entries.insert(handle);
            return handle;
        }
    };

}   // namespace rci

///
// Sequence and text wrappers: a borrowed view is copied only on a miss, and
// an owned buffer is moved in without copying its contents.
//

namespace rci {

    template <typename E, typename D>
    class BasicSliceInterner: public BasicInterner<std::vector<E>, D> {
    private:
        using Base = BasicInterner<std::vector<E>, D>;

    public:
        using typename Base::Handle;

    public:
        Handle intern_slice(std::span<E const> slice) {
            return this->intern_with(slice, [slice]() {
                return Handle::make(slice.begin(), slice.end());
            });
        }
        Handle intern_vec(std::vector<E> vec) {
            return this->intern(std::move(vec));
        }
    };

    template <typename D>
    class BasicStrInterner: public BasicInterner<std::string, D> {
    private:
        using Base = BasicInterner<std::string, D>;

    public:
        using typename Base::Handle;

    public:
        Handle intern_str(std::string_view text) {
            return this->intern_with(text, [text]() {
                return Handle::make(text);
            });
        }
        Handle intern_string(std::string text) {
            return this->intern(std::move(text));
        }
    };

    template <typename T>
    using RcInterner = BasicInterner<T, SingleDomain>;
    template <typename T>
    using ArcInterner = BasicInterner<T, CrossDomain>;

    template <typename E>
    using RcSliceInterner = BasicSliceInterner<E, SingleDomain>;
    template <typename E>
    using ArcSliceInterner = BasicSliceInterner<E, CrossDomain>;

    using RcStrInterner = BasicStrInterner<SingleDomain>;
    using ArcStrInterner = BasicStrInterner<CrossDomain>;

}   // namespace rci

#pragma once

#include <algorithm>
#include <concepts>
#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <vector>
#include "rci/common.hh"
#include "rci/shared.hh"

namespace rci {

    // KeyTraits<T>: how interned values of type T are hashed and compared, and
    // which borrowed view can stand in for a T during lookup (see `LookupKey`).
    // The hash of a view must equal the hash of the value it views.
    template <typename T>
    struct KeyTraits {
        using View = T;

        static size_t hash(T const& value) {
            return robin_hood::hash<T>{}(value);
        }
        static bool equal(T const& lt, T const& rt) {
            return lt == rt;
        }
    };

    // NOTE: `std::vector<bool>` is not contiguous, so it cannot be viewed as a span.
    template <typename E>
    struct KeyTraits<std::vector<E>> {
        using View = std::span<E const>;

        static size_t hash(std::span<E const> items) {
            robin_hood::hash<E> item_hasher;
            size_t h = robin_hood::hash_int(items.size());
            for (E const& item: items) {
                h ^= item_hasher(item) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
            }
            return h;
        }
        static bool equal(std::span<E const> lt, std::span<E const> rt) {
            return std::equal(lt.begin(), lt.end(), rt.begin(), rt.end());
        }
    };

    template <>
    struct KeyTraits<std::string> {
        using View = std::string_view;

        static size_t hash(std::string_view text) {
            return robin_hood::hash_bytes(text.data(), text.size());
        }
        static bool equal(std::string_view lt, std::string_view rt) {
            return lt == rt;
        }
    };

    // a lookup key for an interner of T is anything that converts to T's view
    template <typename K, typename T>
    concept LookupKey = std::convertible_to<K const&, typename KeyTraits<T>::View>;

    ///
    // Transparent functors: the table stores handles but is searched with values
    // or views, so both hash through the pointee.
    //

    template <typename T, typename D>
    struct HandleHash {
        using is_transparent = void;

        size_t operator()(Shared<T, D> const& handle) const {
            return KeyTraits<T>::hash(*handle);
        }
        template <typename K>
        size_t operator()(K const& key) const {
            return KeyTraits<T>::hash(key);
        }
    };

    template <typename T, typename D>
    struct HandleEqual {
        using is_transparent = void;

        bool operator()(Shared<T, D> const& lt, Shared<T, D> const& rt) const {
            return lt.ptr_eq(rt) || KeyTraits<T>::equal(*lt, *rt);
        }
        template <typename K>
        bool operator()(K const& key, Shared<T, D> const& handle) const {
            return KeyTraits<T>::equal(key, *handle);
        }
        template <typename K>
        bool operator()(Shared<T, D> const& handle, K const& key) const {
            return KeyTraits<T>::equal(*handle, key);
        }
    };

}   // namespace rci

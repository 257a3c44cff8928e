#pragma once

#include <ostream>
#include <string>
#include <string_view>
#include <vector>
#include "rci/shared.hh"
#include "rci/interner.hh"

namespace rci {

    // writes `text` quoted, with control characters and quotes escaped
    void print_text(std::string_view text, std::ostream& out);

    template <typename T>
    void print_value(T const& value, std::ostream& out) {
        out << value;
    }
    inline void print_value(std::string const& value, std::ostream& out) {
        print_text(value, out);
    }
    template <typename E>
    void print_value(std::vector<E> const& items, std::ostream& out) {
        out << '[';
        for (size_t i = 0; i < items.size(); i++) {
            if (i > 0) {
                out << ", ";
            }
            print_value(items[i], out);
        }
        out << ']';
    }

    template <typename T, typename D>
    std::ostream& operator<<(std::ostream& out, Shared<T, D> const& handle) {
        if (handle) {
            print_value(*handle, out);
        } else {
            out << "<empty>";
        }
        return out;
    }

    // NOTE: entries are listed in table order, which is unspecified.
    template <typename T, typename D>
    std::ostream& operator<<(std::ostream& out, BasicInterner<T, D> const& interner) {
        out << "Interner{";
        bool first = true;
        for (auto const& handle: interner) {
            if (!first) {
                out << ", ";
            }
            print_value(*handle, out);
            first = false;
        }
        out << '}';
        return out;
    }

}   // namespace rci

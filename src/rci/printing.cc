#include "rci/printing.hh"

#include <iomanip>

namespace rci {

    void print_text(std::string_view text, std::ostream& out) {
        out << '"';
        for (char const cc: text) {
            switch (cc) {
                case '\n': out << "\\n"; break;
                case '\r': out << "\\r"; break;
                case '\t': out << "\\t"; break;
                case '\0': out << "\\0"; break;
                case '"': out << "\\\""; break;
                case '\\': out << "\\\\"; break;
                default: {
                    auto byte = static_cast<unsigned char>(cc);
                    if (byte < 0x20 || byte == 0x7f) {
                        out << "\\x" << std::hex << std::setw(2) << std::setfill('0')
                            << static_cast<int>(byte) << std::dec << std::setfill(' ');
                    } else {
                        out << cc;
                    }
                } break;
            }
        }
        out << '"';
    }

}   // namespace rci

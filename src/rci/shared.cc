#include "rci/shared.hh"

#include <sstream>
#include "rci/feedback.hh"

namespace rci {

    void refcount_overflow_error(size_t count, size_t limit) {
        std::stringstream ss;
        ss << "Strong count overflow: a handle already has " << count << " holders "
           << "(limit is " << limit << ")";
        error(ss.str());
        throw RciError();
    }

    void null_box_error() {
        error("Cannot intern a null box: expected an owned value, got 'nullptr'.");
        throw RciError();
    }

}   // namespace rci

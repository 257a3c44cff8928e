#pragma once

#include <cstddef>
#include <functional>
#include "rci/config.hh"
#include "robin_hood.h"

namespace rci {

    template <
        typename T,
        typename Hash = robin_hood::hash<T>,
        typename KeyEqual = std::equal_to<T>
    >
    using UnstableHashSet = robin_hood::unordered_flat_set<T, Hash, KeyEqual>;

}   // namespace rci

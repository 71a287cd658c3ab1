#pragma once

#include <bytell_hash_map.hpp>
#include <functional>
#include <memory>
#include <utility>

namespace arbor {

template <typename K, typename V, typename H = std::hash<K>, typename E = std::equal_to<K>,
          typename A = std::allocator<std::pair<K, V> > >
using flat_hash_map = ska::bytell_hash_map<K, V, H, E, A>;

}  // namespace arbor

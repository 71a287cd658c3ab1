#pragma once

#include <amc/vector.hpp>

namespace arbor {

template <class T>
using vector = amc::vector<T>;

}  // namespace arbor

#pragma once

#include <amc/vector.hpp>

namespace bridgeway {

template <class T>
using vector = amc::vector<T>;

}  // namespace bridgeway

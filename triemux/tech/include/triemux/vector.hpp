#pragma once

#include <amc/vector.hpp>

namespace triemux {

template <class T>
using vector = amc::vector<T>;

}  // namespace triemux

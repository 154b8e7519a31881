#pragma once

#include <cstddef>

#include <amc/fixedcapacityvector.hpp>
#include <amc/smallvector.hpp>
#include <amc/vector.hpp>

namespace turbonet {

template <class T>
using vector = amc::vector<T>;

template <class T, std::size_t N>
using SmallVector = amc::SmallVector<T, N>;

template <class T, std::size_t N>
using FixedCapacityVector = amc::FixedCapacityVector<T, N>;

}  // namespace turbonet

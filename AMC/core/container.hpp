#ifndef AMC_CONTAINER_HPP
#define AMC_CONTAINER_HPP

#include <boost/container/flat_map.hpp>
#include <boost/container/flat_set.hpp>
#include <boost/container/small_vector.hpp>
#include <boost/container/static_vector.hpp>

#include <functional>
#include <vector>

namespace amc {

namespace container {

template <typename T>
using vector = std::vector<T>;
template <typename T, std::size_t N = 8>
using svector = boost::container::small_vector<T, N>;
/// fixed-capacity vector, used for the slots of the trivalent graph
template <typename T, std::size_t N>
using static_vector = boost::container::static_vector<T, N>;

template <typename Key, typename Compare = std::less<Key>>
using set = boost::container::flat_set<Key, Compare>;
template <typename Key, typename Value, typename Compare = std::less<Key>>
using map = boost::container::flat_map<Key, Value, Compare>;

}  // namespace container

}  // namespace amc

#endif  // AMC_CONTAINER_HPP

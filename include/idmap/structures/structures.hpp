#pragma once

/// @file structures.hpp
/// @brief Main include for idmap_structures module
///
/// This header includes all idmap_structures components:
/// - IdMap<T> / Id: Smallest-free-id value storage
/// - BitSet: Ordered integer set used as the occupancy record
///
/// @example Basic usage:
/// @code
/// #include <idmap/structures/structures.hpp>
///
/// using namespace idmap_structures;
///
/// IdMap<std::string> names;
/// Id alice = names.insert("alice");   // Id(0)
/// Id bob = names.insert("bob");       // Id(1)
/// names.remove(alice);
/// Id carol = names.insert("carol");   // Id(0) again
///
/// for (auto [id, name] : names) {
///     std::cout << id << " -> " << name << '\n';
/// }
/// @endcode

#include "fwd.hpp"
#include "bitset.hpp"
#include "id_map.hpp"
#include <idmap/core/config.hpp>

namespace idmap_structures {

/// Create a map with the slot reservation named by a configuration
template<typename T>
[[nodiscard]] IdMap<T> make_id_map(const idmap_core::Config& config) {
    return IdMap<T>(config.initial_capacity);
}

} // namespace idmap_structures

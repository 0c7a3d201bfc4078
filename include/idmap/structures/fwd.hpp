#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for idmap_structures types

#include <cstddef>

namespace idmap_structures {

// =============================================================================
// Forward Declarations
// =============================================================================

/// Identifier issued by an IdMap
struct Id;

/// Growable ordered set of non-negative integers
class BitSet;

/// Container assigning the smallest free id to every inserted value
template<typename T>
class IdMap;

/// Consuming traversal of an IdMap
template<typename T>
class IntoIter;

} // namespace idmap_structures

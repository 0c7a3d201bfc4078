/// @file id_map.cpp
/// @brief Out-of-line failure path for IdMap checked access

#include <idmap/structures/id_map.hpp>
#include <idmap/core/error.hpp>
#include <idmap/core/log.hpp>
#include <stdexcept>

namespace idmap_structures::detail {

void throw_missing_id(std::size_t id) {
    idmap_core::Error error = idmap_core::IdError::not_occupied(id);
    idmap_core::debug::record_error(error);
    idmap_core::structures_logger()->error("{}", idmap_core::build_error_chain(error));
    throw std::out_of_range(error.message());
}

} // namespace idmap_structures::detail

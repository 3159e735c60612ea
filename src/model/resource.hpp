/**
 * @file resource.hpp
 * @brief Resources that activities are scheduled on.
 */

#pragma once

#include "core/types.hpp"
#include "model/calendar.hpp"

#include <string>

namespace uras {

/**
 * @brief A machine, person, room or tool with an availability calendar.
 *
 * Resources sharing a category are substitutes for one another.
 */
struct Resource {
    ResourceId id;
    std::string name;
    ResourceKind kind = ResourceKind::Primary;
    std::string category;
    double efficiency{1.0};        ///< Effective processing = nominal / efficiency
    uint32_t capacity{1};          ///< Concurrent activities
    Calendar calendar;
};

}  // namespace uras

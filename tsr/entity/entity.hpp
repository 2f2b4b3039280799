#pragma once

#include <cstdint>

#include "handle.hpp"


namespace tsr::ecs {


// recycled index; pair it with its generation through EntityHandle when it must outlive a cycle
using Entity       = uint32_t;
using EntityHandle = Handle<Entity>;

inline constexpr Entity invalid_entity {k_null_index};

} // tsr::ecs

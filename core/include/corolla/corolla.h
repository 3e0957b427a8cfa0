#pragma once

// Corolla - Main header
// Everything a host needs to drive the petal ring animation

#include <corolla/context.h>
#include <corolla/operator.h>
#include <corolla/chain.h>
#include <corolla/color.h>
#include <corolla/param.h>
#include <corolla/segment_ring.h>
#include <corolla/orbit_driver.h>
#include <corolla/trail_field.h>
#include <corolla/scene_config.h>
#include <corolla/geometry/mesh.h>
#include <corolla/geometry/mesh_builder.h>
#include <corolla/geometry/raycaster.h>

namespace corolla {

constexpr const char* VERSION = "1.0.0";

} // namespace corolla

#include <corolla/geometry/mesh.h>

namespace corolla::geometry {

Bounds3D Mesh::bounds() const {
    Bounds3D b;
    for (const auto& v : vertices) {
        b.expand(v.position);
    }
    return b;
}

} // namespace corolla::geometry

// Corolla - Runtime Context

#include <corolla/context.h>

namespace corolla {

void Context::beginFrame(double dt) {
    // Host clocks may jitter backwards; time never runs in reverse
    m_dt = dt > 0.0 ? dt : 0.0;
    m_time += m_dt;
}

void Context::endFrame() {
    ++m_frame;
}

} // namespace corolla

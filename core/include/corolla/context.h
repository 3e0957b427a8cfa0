#pragma once

/**
 * @file context.h
 * @brief Runtime context passed to operators each frame
 *
 * The Context provides time information (elapsed time, delta time, frame
 * count) and a place to report errors. The host drives it explicitly:
 *
 * @code
 * Context ctx;
 * while (running) {
 *     ctx.beginFrame(1.0 / 60.0);
 *     chain.process(ctx);
 *     ctx.endFrame();
 * }
 * @endcode
 */

#include <string>
#include <cstdint>

namespace corolla {

class Context {
public:
    Context() = default;

    /**
     * @brief Start a new frame
     * @param dt Seconds elapsed since the previous frame (negative values are treated as 0)
     */
    void beginFrame(double dt);

    /// @brief Called each frame after the chain has been processed
    void endFrame();

    // -------------------------------------------------------------------------
    /// @name Time
    /// @{

    /**
     * @brief Get accumulated time
     * @return Elapsed time in seconds (sum of all frame deltas)
     */
    double time() const { return m_time; }

    /**
     * @brief Get time since last frame
     * @return Delta time in seconds
     */
    double dt() const { return m_dt; }

    /**
     * @brief Get current frame number
     * @return Frame count (0-indexed, incremented by endFrame())
     */
    uint64_t frame() const { return m_frame; }

    /// @}
    // -------------------------------------------------------------------------
    /// @name Errors
    /// @{

    void setError(const std::string& message) { m_error = message; }
    bool hasError() const { return !m_error.empty(); }
    const std::string& error() const { return m_error; }
    void clearError() { m_error.clear(); }

    /// @}

private:
    double m_time = 0.0;
    double m_dt = 0.0;
    uint64_t m_frame = 0;
    std::string m_error;
};

} // namespace corolla

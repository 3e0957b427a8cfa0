#pragma once

/**
 * @file param.h
 * @brief Parameter wrapper classes for operators
 *
 * These wrappers combine parameter values with metadata (name, range, default)
 * to reduce redundancy. Parameters automatically generate ParamDecl for
 * introspection.
 *
 * Every read goes through get(), so operators pick up new values (or bound
 * sources) on the next frame without caching anything:
 * @code
 * // Bind to normalized source (0-1) with output range
 * orbit.radius.bind([&]() { return slider.value(); }, 1.0f, 10.0f);
 *
 * // Bind direct (no range mapping)
 * orbit.speed.bindDirect([&]() { return 0.5f + ctx.time() * 0.01f; });
 * @endcode
 */

#include <corolla/operator.h>
#include <corolla/color.h>
#include <glm/glm.hpp>
#include <string>
#include <functional>

namespace corolla {

/**
 * @brief Type traits mapping C++ types to ParamType enum
 * @tparam T C++ type
 */
template<typename T> struct ParamTypeFor;
template<> struct ParamTypeFor<float> { static constexpr ParamType value = ParamType::Float; };
template<> struct ParamTypeFor<int>   { static constexpr ParamType value = ParamType::Int; };
template<> struct ParamTypeFor<bool>  { static constexpr ParamType value = ParamType::Bool; };

/**
 * @brief Scalar parameter wrapper (float, int, bool)
 * @tparam T Value type (float, int, or bool)
 *
 * Combines a value with metadata. Supports implicit conversion so it can
 * be used like a regular value. The range is informational: values outside
 * it are stored as given.
 *
 * @par Example
 * @code
 * class OrbitDriver : public Operator, public ParamRegistry {
 *     Param<float> radius{"radius", 1.6f, 1.0f, 10.0f};
 *
 *     OrbitDriver() { registerParam(radius); }
 * };
 * @endcode
 */
template<typename T>
class Param {
public:
    /**
     * @brief Construct a parameter
     * @param name Display name
     * @param defaultVal Default value
     * @param minVal Minimum suggested value
     * @param maxVal Maximum suggested value
     */
    Param(const char* name, T defaultVal, T minVal = T{}, T maxVal = T{1})
        : m_name(name), m_value(defaultVal), m_min(minVal), m_max(maxVal) {}

    /// @brief Implicit conversion to value type (evaluates binding if set)
    operator T() const { return get(); }

    /// @brief Get value explicitly (evaluates binding if set)
    T get() const {
        if (m_binding) {
            return m_binding();
        }
        return m_value;
    }

    /// @brief Assignment operator (clears any binding)
    Param& operator=(T v) {
        m_value = v;
        m_binding = nullptr;
        return *this;
    }

    // -------------------------------------------------------------------------
    /// @name Binding
    /// @{

    /**
     * @brief Bind to a normalized source (0-1) with output range
     * @param source Function returning 0-1 normalized value
     * @param outMin Output minimum (when source returns 0)
     * @param outMax Output maximum (when source returns 1)
     */
    void bind(std::function<float()> source, T outMin, T outMax) {
        m_binding = [source = std::move(source), outMin, outMax]() {
            float t = source();
            return static_cast<T>(outMin + t * (outMax - outMin));
        };
    }

    /**
     * @brief Bind directly to a source (no range mapping)
     * @param source Function returning the exact value
     */
    void bindDirect(std::function<T()> source) {
        m_binding = std::move(source);
    }

    /// @brief Clear any binding
    void unbind() {
        m_binding = nullptr;
    }

    /// @brief Check if parameter has a binding
    bool isBound() const { return m_binding != nullptr; }

    /// @}
    // -------------------------------------------------------------------------

    /// @brief Get parameter name
    const char* name() const { return m_name; }

    /// @brief Get minimum value
    T min() const { return m_min; }

    /// @brief Get maximum value
    T max() const { return m_max; }

    /**
     * @brief Generate ParamDecl for introspection
     * @return ParamDecl with name, type, range, and current value
     */
    ParamDecl decl() const {
        return {m_name, ParamTypeFor<T>::value,
                static_cast<float>(m_min), static_cast<float>(m_max),
                {static_cast<float>(get())}};
    }

private:
    const char* m_name;
    T m_value;
    T m_min, m_max;
    std::function<T()> m_binding;
};

/**
 * @brief 3D vector parameter wrapper with binding support
 *
 * @par Example
 * @code
 * Vec3Param basePosition{"basePosition", 0.0f, 0.75f, 0.0f, -10.0f, 10.0f};
 *
 * // Bob the orbit plane up and down
 * basePosition.bindDirect([&]() { return glm::vec3(0.0f, 0.75f + lfo.value(), 0.0f); });
 * @endcode
 */
class Vec3Param {
public:
    Vec3Param(const char* name, float x, float y, float z, float minVal = -1.0f, float maxVal = 1.0f)
        : m_name(name), m_value(x, y, z), m_min(minVal), m_max(maxVal) {}

    /// @brief Current value (evaluates binding if set)
    glm::vec3 get() const {
        if (m_binding) return m_binding();
        return m_value;
    }

    float x() const { return get().x; }
    float y() const { return get().y; }
    float z() const { return get().z; }

    /// @brief Set all components (clears binding)
    void set(float x, float y, float z) { set(glm::vec3(x, y, z)); }
    void set(const glm::vec3& v) {
        m_value = v;
        m_binding = nullptr;
    }

    /// @brief Bind to a source evaluated on every read
    void bindDirect(std::function<glm::vec3()> source) { m_binding = std::move(source); }
    void unbind() { m_binding = nullptr; }
    bool isBound() const { return m_binding != nullptr; }

    const char* name() const { return m_name; }

    ParamDecl decl() const {
        glm::vec3 v = get();
        return {m_name, ParamType::Vec3, m_min, m_max, {v.x, v.y, v.z}};
    }

private:
    const char* m_name;
    glm::vec3 m_value;
    float m_min, m_max;
    std::function<glm::vec3()> m_binding;
};

/**
 * @brief RGBA color parameter wrapper with binding support
 *
 * @par Example
 * @code
 * ColorParam activeColor{"activeColor", Color::DeepPurple};
 *
 * // Fade toward ivory over ten seconds
 * activeColor.bindDirect([&]() {
 *     return Color::DeepPurple.lerp(Color::Ivory, std::min(1.0f, float(ctx.time()) / 10.0f));
 * });
 * @endcode
 */
class ColorParam {
public:
    ColorParam(const char* name, const Color& c)
        : m_name(name), m_value(c) {}

    /// @brief Current value (evaluates binding if set)
    Color get() const {
        if (m_binding) return m_binding();
        return m_value;
    }
    operator Color() const { return get(); }

    float r() const { return get().r; }
    float g() const { return get().g; }
    float b() const { return get().b; }
    float a() const { return get().a; }

    /// @brief Set the color (clears binding)
    void set(float r, float g, float b, float a = 1.0f) { set(Color(r, g, b, a)); }
    void set(const Color& c) {
        m_value = c;
        m_binding = nullptr;
    }
    ColorParam& operator=(const Color& c) {
        set(c);
        return *this;
    }

    /// @brief Bind to a source evaluated on every read
    void bindDirect(std::function<Color()> source) { m_binding = std::move(source); }
    void unbind() { m_binding = nullptr; }
    bool isBound() const { return m_binding != nullptr; }

    const char* name() const { return m_name; }

    ParamDecl decl() const {
        Color c = get();
        return {m_name, ParamType::Color, 0.0f, 1.0f, {c.r, c.g, c.b, c.a}};
    }

private:
    const char* m_name;
    Color m_value;
    std::function<Color()> m_binding;
};

} // namespace corolla

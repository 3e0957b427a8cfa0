#pragma once

/**
 * @file operator.h
 * @brief Base class for per-frame operators (orbit driver, trail field, etc.)
 *
 * Operators are the building blocks of corolla chains. Each operator
 * reads its inputs once per frame and updates its own state.
 */

#include <string>
#include <vector>

namespace corolla {

class Context;

/**
 * @brief Parameter types for UI/serialization
 */
enum class ParamType {
    Float,    ///< Single float value
    Int,      ///< Integer value
    Bool,     ///< Boolean toggle
    Vec3,     ///< 3D vector (x, y, z)
    Color     ///< RGBA color (0-1 range)
};

/**
 * @brief Parameter declaration for introspection
 *
 * Contains metadata about a parameter including its name, type, and valid range.
 */
struct ParamDecl {
    std::string name;           ///< Display name
    ParamType type;             ///< Data type
    float minVal = 0.0f;        ///< Minimum value
    float maxVal = 1.0f;        ///< Maximum value
    float defaultVal[4] = {0, 0, 0, 0}; ///< Default value(s)
};

/**
 * @brief Abstract base class for all operators
 *
 * Operators follow a simple lifecycle:
 * 1. init() - Called once when the chain initializes
 * 2. process() - Called every frame to advance state
 * 3. cleanup() - Called when the operator is destroyed
 *
 * Inputs connected with setInput() are processed before this operator
 * by Chain::process().
 */
class Operator {
public:
    virtual ~Operator() = default;

    // -------------------------------------------------------------------------
    /// @name Lifecycle
    /// @{

    /**
     * @brief Initialize the operator
     * @param ctx Runtime context
     */
    virtual void init(Context& ctx) { m_initialized = true; }

    /**
     * @brief Process one frame
     * @param ctx Runtime context with time and delta time
     */
    virtual void process(Context& ctx) = 0;

    /**
     * @brief Clean up resources
     */
    virtual void cleanup() {}

    /**
     * @brief Check if operator has been initialized
     */
    bool isInitialized() const { return m_initialized; }

    /// @}
    // -------------------------------------------------------------------------
    /// @name Metadata
    /// @{

    /**
     * @brief Get the operator's display name
     * @return Human-readable name (e.g., "OrbitDriver")
     */
    virtual std::string name() const = 0;

    /**
     * @brief Get parameter declarations for introspection
     */
    virtual std::vector<ParamDecl> params() { return {}; }

    /**
     * @brief Get current parameter value
     * @param name Parameter name
     * @param out Array to receive value (up to 4 floats)
     * @return True if parameter exists
     */
    virtual bool getParam(const std::string& name, float out[4]) { return false; }

    /**
     * @brief Set parameter value
     * @param name Parameter name
     * @param value Array of values (1-4 floats depending on type)
     * @return True if parameter was set successfully
     */
    virtual bool setParam(const std::string& name, const float value[4]) { return false; }

    /// @}
    // -------------------------------------------------------------------------
    /// @name Input Connections
    /// @{

    /// @brief Add an input connection
    void setInput(Operator* op) { m_inputs.push_back(op); }

    /// @brief Set input at specific index
    void setInput(int index, Operator* op) {
        if (index >= static_cast<int>(m_inputs.size())) {
            m_inputs.resize(index + 1, nullptr);
        }
        m_inputs[index] = op;
    }

    /// @brief Get input operator, or nullptr if none
    Operator* getInput(int index = 0) const {
        return (index < static_cast<int>(m_inputs.size())) ? m_inputs[index] : nullptr;
    }

    /// @brief Get number of connected inputs
    size_t inputCount() const { return m_inputs.size(); }

    /// @}
    // -------------------------------------------------------------------------
    /// @name Bypass
    /// @{

    /// @brief Skip this operator in Chain::process()
    void setBypassed(bool bypassed) { m_bypassed = bypassed; }
    bool isBypassed() const { return m_bypassed; }

    /// @}

protected:
    std::vector<Operator*> m_inputs;
    bool m_initialized = false;
    bool m_bypassed = false;
};

} // namespace corolla

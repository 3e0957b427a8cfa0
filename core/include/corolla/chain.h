#pragma once

/**
 * @file chain.h
 * @brief Chain API for managing per-frame operator graphs
 *
 * Chain owns a collection of operators and processes them once per frame
 * in dependency order: an operator's inputs always run before it.
 */

#include <corolla/operator.h>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>
#include <stdexcept>
#include <utility>

namespace corolla {

class Context;

/**
 * @brief Manages an operator graph with dependency resolution
 *
 * @par Example
 * @code
 * Chain chain;
 * auto& orbit = chain.add<OrbitDriver>("orbit", ring);
 * auto& trail = chain.add<TrailField>("trail", ring);
 * trail.input(&orbit);
 *
 * // each frame
 * ctx.beginFrame(dt);
 * chain.process(ctx);
 * ctx.endFrame();
 * @endcode
 */
class Chain {
public:
    Chain() = default;
    ~Chain();

    Chain(const Chain&) = delete;
    Chain& operator=(const Chain&) = delete;
    Chain(Chain&&) = delete;
    Chain& operator=(Chain&&) = delete;

    /**
     * @brief Add an operator to the chain
     * @param name Unique name for this operator
     * @param op Operator to add (takes ownership)
     * @return Raw pointer to the added operator
     *
     * Use add<T>() instead which wraps this.
     */
    Operator* addOperator(const std::string& name, std::unique_ptr<Operator> op);

    /**
     * @brief Add an operator to the chain
     * @tparam T Operator type (e.g., OrbitDriver, TrailField)
     * @param name Unique name for this operator
     * @param args Constructor arguments forwarded to T
     * @return Reference to the new operator
     */
    template<typename T, typename... Args>
    T& add(const std::string& name, Args&&... args) {
        auto op = std::make_unique<T>(std::forward<Args>(args)...);
        T& ref = *op;
        addOperator(name, std::move(op));
        return ref;
    }

    /**
     * @brief Get an operator by name with type checking
     * @tparam T Expected operator type
     * @throw std::runtime_error if not found or type mismatch
     */
    template<typename T>
    T& get(const std::string& name) {
        auto it = m_operators.find(name);
        if (it == m_operators.end()) {
            throw std::runtime_error("Operator not found: " + name);
        }
        T* typed = dynamic_cast<T*>(it->second.get());
        if (!typed) {
            throw std::runtime_error("Operator type mismatch: " + name);
        }
        return *typed;
    }

    /// @brief Get operator by name, or nullptr if not found
    Operator* getByName(const std::string& name);

    /// @brief Get the name an operator was added under (empty if unknown)
    std::string getName(Operator* op) const;

    /// @brief Number of operators in the chain
    size_t size() const { return m_operators.size(); }

    /// @brief Names in the order operators were added
    const std::vector<std::string>& operatorNames() const { return m_orderedNames; }

    /// @brief Operators in the order process() runs them (valid after init())
    const std::vector<Operator*>& executionOrder() const { return m_executionOrder; }

    // -------------------------------------------------------------------------
    /// @name Lifecycle
    /// @{

    /// @brief Resolve execution order and initialize all operators
    void init(Context& ctx);

    /// @brief Process all operators in dependency order (initializes on first call)
    ///
    /// Input connections made after the first frame are picked up here: the
    /// order is recomputed before running if any operator's inputs changed.
    void process(Context& ctx);

    /// @brief Call cleanup() on every operator
    void cleanup();

    /// @}
    // -------------------------------------------------------------------------
    /// @name Error Handling
    /// @{

    /// @brief Check if an error has occurred
    bool hasError() const { return !m_error.empty(); }

    /// @brief Get the error message
    const std::string& error() const { return m_error; }

    /// @}
    // -------------------------------------------------------------------------
    /// @name Debug
    /// @{

    /// @brief Log the execution order on the first processed frame
    void setDebug(bool enabled) { m_debug = enabled; }
    bool isDebug() const { return m_debug; }

    /// @}

private:
    using Edge = std::pair<Operator*, Operator*>;  // (operator, input)

    void computeExecutionOrder();
    bool detectCycle();
    std::vector<Edge> collectEdges();
    void checkDebugEnvVar();

    std::unordered_map<std::string, std::unique_ptr<Operator>> m_operators;
    std::unordered_map<Operator*, std::string> m_operatorNames;
    std::vector<std::string> m_orderedNames;
    std::vector<Operator*> m_executionOrder;
    std::vector<Edge> m_sortedEdges;
    bool m_needsSort = true;
    bool m_initialized = false;
    bool m_debug = false;
    bool m_debugEnvChecked = false;
    bool m_debugFrameLogged = false;
    std::string m_error;
};

} // namespace corolla

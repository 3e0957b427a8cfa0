// Corolla - Chain Implementation

#include <corolla/chain.h>
#include <corolla/context.h>
#include <corolla/operator.h>
#include <queue>
#include <iostream>
#include <functional>
#include <cstdlib>

namespace corolla {

Chain::~Chain() {
    cleanup();
}

// Check environment variable for debug mode
void Chain::checkDebugEnvVar() {
    if (m_debugEnvChecked) return;
    m_debugEnvChecked = true;

    const char* envVal = std::getenv("COROLLA_DEBUG_CHAIN");
    if (envVal && (std::string(envVal) == "1" || std::string(envVal) == "true")) {
        m_debug = true;
        std::cout << "[Chain Debug] Debug mode enabled via COROLLA_DEBUG_CHAIN" << std::endl;
    }
}

Operator* Chain::addOperator(const std::string& name, std::unique_ptr<Operator> op) {
    Operator* raw = op.get();

    auto existing = m_operators.find(name);
    if (existing != m_operators.end()) {
        std::cerr << "[Chain Warning] Replacing operator '" << name << "'" << std::endl;
        m_operatorNames.erase(existing->second.get());
        existing->second = std::move(op);
    } else {
        m_operators[name] = std::move(op);
        m_orderedNames.push_back(name);
    }

    m_operatorNames[raw] = name;
    m_needsSort = true;
    return raw;
}

Operator* Chain::getByName(const std::string& name) {
    auto it = m_operators.find(name);
    if (it == m_operators.end()) {
        return nullptr;
    }
    return it->second.get();
}

std::string Chain::getName(Operator* op) const {
    auto it = m_operatorNames.find(op);
    if (it == m_operatorNames.end()) {
        return "";
    }
    return it->second;
}

bool Chain::detectCycle() {
    // Use DFS with three-color marking to detect cycles
    enum class Mark { White, Gray, Black };
    std::unordered_map<Operator*, Mark> marks;

    for (const auto& [name, op] : m_operators) {
        marks[op.get()] = Mark::White;
    }

    std::function<bool(Operator*)> hasCycle = [&](Operator* node) -> bool {
        marks[node] = Mark::Gray;

        for (size_t i = 0; i < node->inputCount(); ++i) {
            Operator* input = node->getInput(static_cast<int>(i));
            if (input && marks.count(input)) {
                if (marks[input] == Mark::Gray) {
                    // Found a back edge - cycle detected
                    return true;
                }
                if (marks[input] == Mark::White && hasCycle(input)) {
                    return true;
                }
            }
        }

        marks[node] = Mark::Black;
        return false;
    };

    for (const auto& name : m_orderedNames) {
        Operator* op = m_operators[name].get();
        if (marks[op] == Mark::White && hasCycle(op)) {
            return true;
        }
    }

    return false;
}

std::vector<Chain::Edge> Chain::collectEdges() {
    std::vector<Edge> edges;
    for (const auto& name : m_orderedNames) {
        Operator* op = m_operators[name].get();
        for (size_t i = 0; i < op->inputCount(); ++i) {
            edges.emplace_back(op, op->getInput(static_cast<int>(i)));
        }
    }
    return edges;
}

void Chain::computeExecutionOrder() {
    if (!m_needsSort) {
        return;
    }

    m_executionOrder.clear();
    m_error.clear();

    if (detectCycle()) {
        m_error = "Circular dependency detected in operator chain";
        return;
    }

    // Kahn's algorithm, seeded in insertion order so ties stay deterministic
    std::unordered_map<Operator*, int> inDegree;
    std::unordered_map<Operator*, std::vector<Operator*>> dependents;

    for (const auto& name : m_orderedNames) {
        inDegree[m_operators[name].get()] = 0;
    }

    for (const auto& name : m_orderedNames) {
        Operator* op = m_operators[name].get();
        for (size_t i = 0; i < op->inputCount(); ++i) {
            Operator* input = op->getInput(static_cast<int>(i));
            if (input && m_operatorNames.count(input)) {
                inDegree[op]++;
                dependents[input].push_back(op);
            }
        }
    }

    std::queue<Operator*> ready;
    for (const auto& name : m_orderedNames) {
        Operator* op = m_operators[name].get();
        if (inDegree[op] == 0) {
            ready.push(op);
        }
    }

    while (!ready.empty()) {
        Operator* current = ready.front();
        ready.pop();
        m_executionOrder.push_back(current);

        for (Operator* dependent : dependents[current]) {
            if (--inDegree[dependent] == 0) {
                ready.push(dependent);
            }
        }
    }

    if (m_executionOrder.size() != m_operators.size()) {
        m_error = "Could not resolve operator dependencies (possible cycle)";
        return;
    }

    m_sortedEdges = collectEdges();
    m_needsSort = false;
}

void Chain::init(Context& ctx) {
    checkDebugEnvVar();

    computeExecutionOrder();
    if (hasError()) {
        std::cerr << "[Chain] " << m_error << std::endl;
        ctx.setError(m_error);
        return;
    }

    for (Operator* op : m_executionOrder) {
        if (!op->isInitialized()) {
            op->init(ctx);
        }
    }

    m_initialized = true;
}

void Chain::process(Context& ctx) {
    if (!m_needsSort && collectEdges() != m_sortedEdges) {
        m_needsSort = true;
    }
    if (!m_initialized || m_needsSort) {
        init(ctx);
    }

    if (hasError()) {
        ctx.setError(m_error);
        return;
    }

    bool logFrame = m_debug && !m_debugFrameLogged;
    if (logFrame) {
        std::cout << "[Chain Debug] === Processing Chain ===" << std::endl;
    }

    for (Operator* op : m_executionOrder) {
        if (op->isBypassed()) {
            continue;
        }
        if (logFrame) {
            std::cout << "[Chain Debug] " << getName(op) << " (" << op->name() << ")" << std::endl;
        }
        op->process(ctx);
    }

    if (logFrame) {
        std::cout << "[Chain Debug] === End Processing ===" << std::endl;
        m_debugFrameLogged = true;
    }
}

void Chain::cleanup() {
    for (const auto& name : m_orderedNames) {
        auto it = m_operators.find(name);
        if (it != m_operators.end() && it->second) {
            it->second->cleanup();
        }
    }
}

} // namespace corolla

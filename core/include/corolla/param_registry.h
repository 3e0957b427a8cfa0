#pragma once

/**
 * @file param_registry.h
 * @brief Name-based access to an operator's Param members
 *
 * Operators register their public Param members once in the constructor.
 * The registry then answers params()/getParam()/setParam() so config files
 * and the CLI can address parameters by name.
 *
 * @par Example
 * @code
 * class TrailField : public Operator, public ParamRegistry {
 * public:
 *     Param<float> amplitude{"amplitude", 0.065f, 0.0f, 0.5f};
 *
 *     TrailField() { registerParam(amplitude); }
 *
 *     std::vector<ParamDecl> params() override { return registeredParams(); }
 *     bool getParam(const std::string& n, float out[4]) override {
 *         return getRegisteredParam(n, out);
 *     }
 * };
 * @endcode
 */

#include <corolla/param.h>
#include <string>
#include <vector>

namespace corolla {

class ParamRegistry {
public:
    ParamRegistry() = default;

    // Entries point at members of the owning object
    ParamRegistry(const ParamRegistry&) = delete;
    ParamRegistry& operator=(const ParamRegistry&) = delete;

    // -------------------------------------------------------------------------
    /// @name Registration
    /// @{

    void registerParam(Param<float>& p) { m_entries.push_back({p.name(), ParamType::Float, &p}); }
    void registerParam(Param<int>& p)   { m_entries.push_back({p.name(), ParamType::Int, &p}); }
    void registerParam(Param<bool>& p)  { m_entries.push_back({p.name(), ParamType::Bool, &p}); }
    void registerParam(Vec3Param& p)    { m_entries.push_back({p.name(), ParamType::Vec3, &p}); }
    void registerParam(ColorParam& p)   { m_entries.push_back({p.name(), ParamType::Color, &p}); }

    /// @}
    // -------------------------------------------------------------------------
    /// @name Access
    /// @{

    /// @brief Declarations for every registered parameter, in registration order
    std::vector<ParamDecl> registeredParams() const {
        std::vector<ParamDecl> decls;
        decls.reserve(m_entries.size());
        for (const auto& e : m_entries) {
            switch (e.type) {
                case ParamType::Float: decls.push_back(static_cast<Param<float>*>(e.ptr)->decl()); break;
                case ParamType::Int:   decls.push_back(static_cast<Param<int>*>(e.ptr)->decl()); break;
                case ParamType::Bool:  decls.push_back(static_cast<Param<bool>*>(e.ptr)->decl()); break;
                case ParamType::Vec3:  decls.push_back(static_cast<Vec3Param*>(e.ptr)->decl()); break;
                case ParamType::Color: decls.push_back(static_cast<ColorParam*>(e.ptr)->decl()); break;
            }
        }
        return decls;
    }

    /**
     * @brief Read a registered parameter's current value
     * @return False if no parameter has that name
     */
    bool getRegisteredParam(const std::string& name, float out[4]) const {
        const Entry* e = find(name);
        if (!e) return false;

        switch (e->type) {
            case ParamType::Float:
                out[0] = static_cast<Param<float>*>(e->ptr)->get();
                break;
            case ParamType::Int:
                out[0] = static_cast<float>(static_cast<Param<int>*>(e->ptr)->get());
                break;
            case ParamType::Bool:
                out[0] = static_cast<Param<bool>*>(e->ptr)->get() ? 1.0f : 0.0f;
                break;
            case ParamType::Vec3: {
                auto* p = static_cast<Vec3Param*>(e->ptr);
                out[0] = p->x(); out[1] = p->y(); out[2] = p->z();
                break;
            }
            case ParamType::Color: {
                auto* p = static_cast<ColorParam*>(e->ptr);
                out[0] = p->r(); out[1] = p->g(); out[2] = p->b(); out[3] = p->a();
                break;
            }
        }
        return true;
    }

    /**
     * @brief Overwrite a registered parameter (clears any binding)
     * @return False if no parameter has that name
     */
    bool setRegisteredParam(const std::string& name, const float value[4]) {
        Entry* e = find(name);
        if (!e) return false;

        switch (e->type) {
            case ParamType::Float:
                *static_cast<Param<float>*>(e->ptr) = value[0];
                break;
            case ParamType::Int:
                *static_cast<Param<int>*>(e->ptr) = static_cast<int>(value[0]);
                break;
            case ParamType::Bool:
                *static_cast<Param<bool>*>(e->ptr) = value[0] > 0.5f;
                break;
            case ParamType::Vec3:
                static_cast<Vec3Param*>(e->ptr)->set(value[0], value[1], value[2]);
                break;
            case ParamType::Color:
                static_cast<ColorParam*>(e->ptr)->set(value[0], value[1], value[2], value[3]);
                break;
        }
        return true;
    }

    /// @}

private:
    struct Entry {
        std::string name;
        ParamType type;
        void* ptr;
    };

    Entry* find(const std::string& name) {
        for (auto& e : m_entries) {
            if (e.name == name) return &e;
        }
        return nullptr;
    }

    const Entry* find(const std::string& name) const {
        for (const auto& e : m_entries) {
            if (e.name == name) return &e;
        }
        return nullptr;
    }

    std::vector<Entry> m_entries;
};

} // namespace corolla

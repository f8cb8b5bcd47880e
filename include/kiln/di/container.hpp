#pragma once

#include <memory>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

#include "kiln/di/definition.hpp"
#include "kiln/di/exceptions.hpp"
#include "kiln/di/resolution_context.hpp"
#include "kiln/di/type_registry.hpp"

namespace kiln::di {

/**
 * @brief Interpreted dependency injection container
 *
 * Resolves entries on demand by walking their definitions. Entries are
 * shared: the first get() of an identifier resolves it, later calls return
 * the same value. Identifiers without a definition are autowired when
 * autowiring is enabled and the type introspector knows an instantiable type
 * of that name.
 *
 * Not thread-safe.
 */
class Container {
public:
    Container(DefinitionMap definitions,
              std::shared_ptr<const TypeIntrospector> types,
              bool autowiring = true);
    virtual ~Container() = default;

    // Non-copyable, non-movable: factories hold references to the container
    Container(const Container&) = delete;
    Container& operator=(const Container&) = delete;

    /**
     * @brief Resolve a shared entry
     * @throws NotFoundError if the entry is neither defined nor autowirable
     * @throws DependencyError if the entry cannot be resolved
     */
    Value get(const std::string& id);

    /**
     * @brief Resolve an entry and convert it
     * @throws std::invalid_argument if the value has another type
     */
    template <typename T>
    T get_as(const std::string& id) {
        return value_cast<T>(get(id));
    }

    /**
     * @brief Resolve an entry without reusing or storing the shared value
     */
    Value make(const std::string& id);

    virtual bool has(const std::string& id) const;

    /**
     * @brief Define or replace an entry
     */
    virtual void set(const std::string& id, Definition definition);

    /**
     * @brief Store an already built value as the shared value of an entry
     */
    void set_value(const std::string& id, Value value);

    std::vector<std::string> defined_entries() const;

    const TypeIntrospector& types() const { return *types_; }
    bool autowiring_enabled() const { return autowiring_; }

protected:
    // Resolve without the shared-entry cache; called under a resolution guard
    virtual Value resolve(const std::string& id);

    Value resolve_definition(const Definition& definition,
                             const std::string& entry_id);

    const Definition* find_definition(const std::string& id) const;
    bool is_autowirable(const std::string& id) const;

    // Argument and type mismatches surface as std::invalid_argument from
    // type descriptors; report them against the entry being resolved
    template <typename Fn>
    static auto attribute_errors(const std::string& entry_id, Fn&& fn)
        -> decltype(fn()) {
        try {
            return fn();
        } catch (const std::invalid_argument& e) {
            throw DependencyError("Entry '" + entry_id +
                                  "' cannot be resolved: " + e.what());
        }
    }

private:
    Value resolve_class(const ClassDefinition& definition,
                        const std::string& entry_id);
    Value resolve_array(const ArrayDefinition& definition,
                        const std::string& entry_id);
    Value resolve_environment(const EnvironmentDefinition& definition,
                              const std::string& entry_id);
    Value resolve_string(const StringDefinition& definition,
                         const std::string& entry_id);

    DefinitionMap definitions_;
    std::shared_ptr<const TypeIntrospector> types_;
    bool autowiring_;
    std::unordered_map<std::string, Value> resolved_;
    ResolutionContext context_;
};

}  // namespace kiln::di

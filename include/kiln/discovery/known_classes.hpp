#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "kiln/di/definition.hpp"
#include "kiln/di/type_registry.hpp"

namespace kiln::discovery {

/**
 * @brief Class names to compile even though no entry defines them
 *
 * A generator is pulled lazily and only once; names it produced are
 * remembered so that later iterations replay them. Copies share that state.
 */
class KnownClasses {
public:
    // Returns the next class name, or nullopt when exhausted
    using Generator = std::function<std::optional<std::string>()>;

    KnownClasses() : KnownClasses(std::vector<std::string>{}) {}

    static KnownClasses from_list(std::vector<std::string> names);

    template <typename InputIt>
    static KnownClasses from_range(InputIt first, InputIt last) {
        return from_list(std::vector<std::string>(first, last));
    }

    static KnownClasses from_generator(Generator generator);

    void for_each(const std::function<void(const std::string&)>& fn) const;

private:
    struct State {
        Generator generator;
        std::vector<std::string> consumed;
    };

    explicit KnownClasses(std::vector<std::string> names);
    explicit KnownClasses(Generator generator);

    std::shared_ptr<State> state_;
};

/**
 * @brief Add an autowired entry for every known class without an entry
 *
 * Names that already are entries or that the introspector cannot
 * instantiate are skipped.
 *
 * @return number of entries added
 */
size_t add_known_classes(di::DefinitionMap& definitions,
                         const KnownClasses& known,
                         const di::TypeIntrospector& types);

}  // namespace kiln::discovery

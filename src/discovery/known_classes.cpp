#include "kiln/discovery/known_classes.hpp"

#include <utility>

#include "kiln/di/autowiring.hpp"
#include "kiln/log/logger.hpp"

namespace kiln::discovery {

KnownClasses::KnownClasses(std::vector<std::string> names)
    : state_(std::make_shared<State>()) {
    state_->consumed = std::move(names);
}

KnownClasses::KnownClasses(Generator generator)
    : state_(std::make_shared<State>()) {
    state_->generator = std::move(generator);
}

KnownClasses KnownClasses::from_list(std::vector<std::string> names) {
    return KnownClasses(std::move(names));
}

KnownClasses KnownClasses::from_generator(Generator generator) {
    return KnownClasses(std::move(generator));
}

void KnownClasses::for_each(
    const std::function<void(const std::string&)>& fn) const {
    // Index based: fn may trigger another iteration that extends consumed
    for (size_t i = 0; i < state_->consumed.size(); ++i) {
        fn(state_->consumed[i]);
    }

    while (state_->generator) {
        std::optional<std::string> name = state_->generator();
        if (!name) {
            state_->generator = nullptr;
            break;
        }
        state_->consumed.push_back(*name);
        fn(*name);
    }
}

size_t add_known_classes(di::DefinitionMap& definitions,
                         const KnownClasses& known,
                         const di::TypeIntrospector& types) {
    size_t added = 0;
    known.for_each([&](const std::string& name) {
        if (definitions.count(name)) {
            return;
        }
        const di::TypeDescriptor* type = types.find(name);
        if (!type || !type->instantiable()) {
            KILN_LOG_DEBUG << "Known class " << name
                           << " is skipped: no instantiable type registered";
            return;
        }
        definitions.insert_or_assign(name,
                                     di::Autowiring::definition_for(name));
        ++added;
    });
    return added;
}

}  // namespace kiln::discovery

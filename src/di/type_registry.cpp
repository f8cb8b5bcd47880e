#include "kiln/di/type_registry.hpp"

#include <array>

namespace kiln::di {

bool is_anonymous_type_name(const std::string& name) {
    static const std::array<const char*, 7> markers = {
        "(anonymous namespace)", "{anonymous}", "(anonymous",
        "(unnamed",              "{unnamed",    "{lambda",
        "(lambda"};

    if (name.empty()) {
        return true;
    }
    for (const char* marker : markers) {
        if (name.find(marker) != std::string::npos) {
            return true;
        }
    }
    return false;
}

const TypeDescriptor::Method* TypeDescriptor::find_method(
    const std::string& name) const {
    auto it = methods_.find(name);
    return it != methods_.end() ? &it->second : nullptr;
}

void TypeDescriptor::check_owner(const Object& object) const {
    if (object.type() != type_) {
        throw std::invalid_argument("object of type " + object.type_name() +
                                    " is not a " + name_);
    }
}

Value TypeDescriptor::instantiate(const std::vector<Value>& arguments) const {
    if (!constructor_) {
        throw std::invalid_argument("class " + name_ +
                                    " is not instantiable");
    }
    if (arguments.size() != parameters_.size()) {
        throw std::invalid_argument(
            "constructor of " + name_ + " expects " +
            std::to_string(parameters_.size()) + " arguments, " +
            std::to_string(arguments.size()) + " given");
    }

    auto self = shared_from_this();
    Object::Upcast upcast = [self](const std::shared_ptr<void>& instance,
                                   std::type_index target) {
        return self->upcast(instance, target);
    };
    return Value(Object(constructor_(arguments), type_, name_,
                        std::move(upcast)));
}

void TypeDescriptor::set_property(const Object& object,
                                  const std::string& name,
                                  const Value& value) const {
    check_owner(object);
    auto it = properties_.find(name);
    if (it == properties_.end()) {
        throw std::invalid_argument("class " + name_ +
                                    " has no injectable property '" + name +
                                    "'");
    }
    it->second(object.instance(), value);
}

void TypeDescriptor::call_method(const Object& object,
                                 const std::string& name,
                                 const std::vector<Value>& arguments) const {
    check_owner(object);
    const Method* method = find_method(name);
    if (!method) {
        throw std::invalid_argument("class " + name_ + " has no method '" +
                                    name + "'");
    }
    if (method->arity != arguments.size()) {
        throw std::invalid_argument(
            "method " + name_ + "::" + name + " expects " +
            std::to_string(method->arity) + " arguments, " +
            std::to_string(arguments.size()) + " given");
    }
    method->invoke(object.instance(), arguments);
}

std::shared_ptr<void> TypeDescriptor::upcast(
    const std::shared_ptr<void>& instance, std::type_index target) const {
    if (target == type_) {
        return instance;
    }
    auto it = bases_.find(target);
    if (it == bases_.end()) {
        return nullptr;
    }
    return it->second(instance);
}

const TypeDescriptor* TypeRegistry::find(const std::string& name) const {
    auto it = types_.find(name);
    return it != types_.end() ? it->second.get() : nullptr;
}

}  // namespace kiln::di

#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <typeindex>
#include <unordered_map>
#include <utility>
#include <vector>

#include "kiln/di/value.hpp"

namespace kiln::di {

/**
 * @brief Constructor parameter of a registered type
 */
struct ParameterInfo {
    std::string name;
    // Entry injected when the class is autowired; empty when not injectable
    std::string inject;
    std::optional<Value> default_value;
};

// Parameter filled with the entry `entry_id` when autowiring
inline ParameterInfo inject(std::string name, std::string entry_id) {
    return {std::move(name), std::move(entry_id), std::nullopt};
}

// Parameter that must be given explicitly
inline ParameterInfo parameter(std::string name) {
    return {std::move(name), "", std::nullopt};
}

// Parameter with a default used when nothing is given
inline ParameterInfo parameter(std::string name, Value default_value) {
    return {std::move(name), "", std::move(default_value)};
}

/**
 * @brief True for names that have no stable, addressable spelling:
 * anonymous namespaces, unnamed classes and lambdas
 */
bool is_anonymous_type_name(const std::string& name);

/**
 * @brief Everything the container needs to know about one type: how to
 * construct it, which properties and methods can be injected, and which
 * bases an instance can be viewed as
 */
class TypeDescriptor : public std::enable_shared_from_this<TypeDescriptor> {
public:
    using Constructor =
        std::function<std::shared_ptr<void>(const std::vector<Value>&)>;
    using PropertySetter =
        std::function<void(const std::shared_ptr<void>&, const Value&)>;
    using MethodInvoker = std::function<void(const std::shared_ptr<void>&,
                                             const std::vector<Value>&)>;
    using Caster =
        std::function<std::shared_ptr<void>(const std::shared_ptr<void>&)>;

    struct Method {
        size_t arity;
        MethodInvoker invoke;
    };

    TypeDescriptor(std::string name, std::type_index type)
        : name_(std::move(name)), type_(type) {}

    const std::string& name() const { return name_; }
    std::type_index type() const { return type_; }
    bool anonymous() const { return is_anonymous_type_name(name_); }
    bool instantiable() const { return static_cast<bool>(constructor_); }
    const std::vector<ParameterInfo>& parameters() const {
        return parameters_;
    }
    bool has_property(const std::string& name) const {
        return properties_.count(name) > 0;
    }
    const Method* find_method(const std::string& name) const;

    /**
     * @brief Construct an instance from already resolved arguments
     * @throws std::invalid_argument on arity or argument type mismatch
     */
    Value instantiate(const std::vector<Value>& arguments) const;

    void set_property(const Object& object, const std::string& name,
                      const Value& value) const;

    void call_method(const Object& object, const std::string& name,
                     const std::vector<Value>& arguments) const;

    // View of an instance of this type as one of its registered bases
    std::shared_ptr<void> upcast(const std::shared_ptr<void>& instance,
                                 std::type_index target) const;

private:
    template <typename T>
    friend class TypeBuilder;

    void check_owner(const Object& object) const;

    std::string name_;
    std::type_index type_;
    std::vector<ParameterInfo> parameters_;
    Constructor constructor_;
    std::map<std::string, PropertySetter> properties_;
    std::map<std::string, Method> methods_;
    std::unordered_map<std::type_index, Caster> bases_;
};

/**
 * @brief Type introspection capability used by autowiring and compilation
 */
class TypeIntrospector {
public:
    virtual ~TypeIntrospector() = default;

    // nullptr when the type is unknown
    virtual const TypeDescriptor* find(const std::string& name) const = 0;
};

template <typename T>
class TypeBuilder {
public:
    explicit TypeBuilder(std::shared_ptr<TypeDescriptor> descriptor)
        : descriptor_(std::move(descriptor)) {}

    /**
     * @brief Register the constructor T(Args...)
     *
     * Without parameter information, std::shared_ptr<U> parameters are
     * injected with the entry named after U and all other parameters must
     * be given explicitly.
     */
    template <typename... Args>
    TypeBuilder& constructor(std::vector<ParameterInfo> parameters = {}) {
        if (parameters.empty()) {
            parameters = {describe_parameter<Args>()...};
            for (size_t i = 0; i < parameters.size(); ++i) {
                if (parameters[i].name.empty()) {
                    parameters[i].name = "arg" + std::to_string(i);
                }
            }
        }
        if (parameters.size() != sizeof...(Args)) {
            throw std::invalid_argument(
                "constructor of " + descriptor_->name_ + " takes " +
                std::to_string(sizeof...(Args)) + " parameters but " +
                std::to_string(parameters.size()) + " were described");
        }

        descriptor_->parameters_ = std::move(parameters);
        descriptor_->constructor_ =
            [](const std::vector<Value>& arguments) -> std::shared_ptr<void> {
            return construct<Args...>(arguments,
                                      std::index_sequence_for<Args...>{});
        };
        return *this;
    }

    template <typename V>
    TypeBuilder& property(const std::string& name, V T::*member) {
        descriptor_->properties_[name] =
            [member](const std::shared_ptr<void>& instance,
                     const Value& value) {
                static_cast<T*>(instance.get())->*member =
                    value_cast<V>(value);
            };
        return *this;
    }

    template <typename R, typename... Args>
    TypeBuilder& method(const std::string& name, R (T::*fn)(Args...)) {
        descriptor_->methods_[name] = TypeDescriptor::Method{
            sizeof...(Args),
            [fn](const std::shared_ptr<void>& instance,
                 const std::vector<Value>& arguments) {
                invoke(static_cast<T*>(instance.get()), fn, arguments,
                       std::index_sequence_for<Args...>{});
            }};
        return *this;
    }

    template <typename R, typename... Args>
    TypeBuilder& method(const std::string& name, R (T::*fn)(Args...) const) {
        descriptor_->methods_[name] = TypeDescriptor::Method{
            sizeof...(Args),
            [fn](const std::shared_ptr<void>& instance,
                 const std::vector<Value>& arguments) {
                invoke_const(static_cast<const T*>(instance.get()), fn,
                             arguments, std::index_sequence_for<Args...>{});
            }};
        return *this;
    }

    // Instances may be injected where a std::shared_ptr<Base> is expected
    template <typename Base>
    TypeBuilder& implements() {
        static_assert(std::is_base_of_v<Base, T>,
                      "implements<Base>() requires T to derive from Base");
        descriptor_->bases_[std::type_index(typeid(Base))] =
            [](const std::shared_ptr<void>& instance) {
                std::shared_ptr<Base> base =
                    std::static_pointer_cast<T>(instance);
                return std::static_pointer_cast<void>(base);
            };
        return *this;
    }

private:
    template <typename A>
    static ParameterInfo describe_parameter() {
        using U = std::decay_t<A>;
        if constexpr (is_shared_ptr<U>::value) {
            return inject("", type_name_of<typename U::element_type>());
        } else {
            return parameter("");
        }
    }

    template <typename... Args, size_t... I>
    static std::shared_ptr<void> construct(
        [[maybe_unused]] const std::vector<Value>& arguments,
        std::index_sequence<I...>) {
        return std::static_pointer_cast<void>(std::make_shared<T>(
            value_cast<std::decay_t<Args>>(arguments.at(I))...));
    }

    template <typename R, typename... Args, size_t... I>
    static void invoke(T* target, R (T::*fn)(Args...),
                       [[maybe_unused]] const std::vector<Value>& arguments,
                       std::index_sequence<I...>) {
        (target->*fn)(value_cast<std::decay_t<Args>>(arguments.at(I))...);
    }

    template <typename R, typename... Args, size_t... I>
    static void invoke_const(
        const T* target, R (T::*fn)(Args...) const,
        [[maybe_unused]] const std::vector<Value>& arguments,
        std::index_sequence<I...>) {
        (target->*fn)(value_cast<std::decay_t<Args>>(arguments.at(I))...);
    }

    std::shared_ptr<TypeDescriptor> descriptor_;
};

/**
 * @brief Explicit registration of the types the container may construct
 *
 * registry.add<Mailer>("app::Mailer")
 *     .constructor<std::shared_ptr<Transport>, std::string>(
 *         {inject("transport", "app::Transport"), parameter("sender")})
 *     .property("port", &Mailer::port)
 *     .method("add_recipient", &Mailer::add_recipient);
 */
class TypeRegistry : public TypeIntrospector {
public:
    template <typename T>
    TypeBuilder<T> add(const std::string& name) {
        auto descriptor =
            std::make_shared<TypeDescriptor>(name, std::type_index(typeid(T)));
        types_[name] = descriptor;
        return TypeBuilder<T>(descriptor);
    }

    // Registered under its demangled C++ name
    template <typename T>
    TypeBuilder<T> add() {
        return add<T>(type_name_of<T>());
    }

    const TypeDescriptor* find(const std::string& name) const override;

    size_t size() const { return types_.size(); }

private:
    std::map<std::string, std::shared_ptr<TypeDescriptor>> types_;
};

}  // namespace kiln::di

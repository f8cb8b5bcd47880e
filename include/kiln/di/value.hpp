#pragma once

#include <boost/core/demangle.hpp>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <typeindex>
#include <utility>
#include <variant>
#include <vector>

namespace kiln::di {

class Value;

/**
 * @brief Demangled, fully qualified name of a C++ type
 */
template <typename T>
std::string type_name_of() {
    return boost::core::demangle(typeid(T).name());
}

using ArrayKey = std::variant<int64_t, std::string>;

std::string key_to_string(const ArrayKey& key);

/**
 * @brief Ordered key/value sequence. Keys are integers or strings;
 * push_back() assigns the next free integer key.
 */
class Array {
public:
    Array() = default;
    Array(std::initializer_list<Value> values);

    // Array::map({{"bar", 1}, {"baz", "x"}})
    static Array map(
        std::initializer_list<std::pair<std::string, Value>> entries);

    // @throws std::overflow_error once the largest integer key is taken
    void push_back(Value value);
    void set(ArrayKey key, Value value);

    size_t size() const { return keys_.size(); }
    bool empty() const { return keys_.empty(); }
    const ArrayKey& key_at(size_t index) const { return keys_.at(index); }
    const Value& at(size_t index) const;
    const Value* find(const ArrayKey& key) const;

    bool operator==(const Array& other) const;
    bool operator!=(const Array& other) const { return !(*this == other); }

private:
    void advance_past(int64_t index);

    std::vector<ArrayKey> keys_;
    std::vector<Value> values_;
    // Empty once the largest integer key is taken
    std::optional<int64_t> next_index_ = 0;
};

/**
 * @brief A live instance held by a Value. Never compilable.
 */
class Object {
public:
    // Returns the instance viewed as the requested type, or nullptr
    using Upcast = std::function<std::shared_ptr<void>(
        const std::shared_ptr<void>&, std::type_index)>;

    Object(std::shared_ptr<void> instance, std::type_index type,
           std::string type_name, Upcast upcast = {})
        : instance_(std::move(instance)),
          type_(type),
          type_name_(std::move(type_name)),
          upcast_(std::move(upcast)) {}

    template <typename T>
    static Object wrap(std::shared_ptr<T> instance) {
        return Object(std::static_pointer_cast<void>(std::move(instance)),
                      std::type_index(typeid(T)), type_name_of<T>());
    }

    template <typename T>
    std::shared_ptr<T> as() const {
        if (type_ == std::type_index(typeid(T))) {
            return std::static_pointer_cast<T>(instance_);
        }
        if (upcast_) {
            if (auto converted = upcast_(instance_, typeid(T))) {
                return std::static_pointer_cast<T>(converted);
            }
        }
        return nullptr;
    }

    const std::shared_ptr<void>& instance() const { return instance_; }
    std::type_index type() const { return type_; }
    const std::string& type_name() const { return type_name_; }

    bool operator==(const Object& other) const {
        return instance_ == other.instance_;
    }

private:
    std::shared_ptr<void> instance_;
    std::type_index type_;
    std::string type_name_;
    Upcast upcast_;
};

/**
 * @brief Tagged value: null, bool, integer, float, string, array or object
 */
class Value {
public:
    enum class Type { NIL, BOOL, INT, FLOAT, STRING, ARRAY, OBJECT };

    Value() = default;
    Value(std::nullptr_t) {}
    Value(bool value) : data_(value) {}
    template <typename T, std::enable_if_t<std::is_integral_v<T> &&
                                               !std::is_same_v<T, bool>,
                                           int> = 0>
    Value(T value) : data_(static_cast<int64_t>(value)) {}
    Value(double value) : data_(value) {}
    Value(const char* value) : data_(std::string(value)) {}
    Value(std::string value) : data_(std::move(value)) {}
    Value(Array value) : data_(std::move(value)) {}
    Value(Object value) : data_(std::move(value)) {}

    template <typename T>
    static Value object(std::shared_ptr<T> instance) {
        return Value(Object::wrap(std::move(instance)));
    }

    Type type() const { return static_cast<Type>(data_.index()); }
    bool is_null() const { return type() == Type::NIL; }
    bool is_bool() const { return type() == Type::BOOL; }
    bool is_int() const { return type() == Type::INT; }
    bool is_float() const { return type() == Type::FLOAT; }
    bool is_string() const { return type() == Type::STRING; }
    bool is_array() const { return type() == Type::ARRAY; }
    bool is_object() const { return type() == Type::OBJECT; }

    bool as_bool() const;
    int64_t as_int() const;
    double as_float() const;
    const std::string& as_string() const;
    const Array& as_array() const;
    const Object& as_object() const;

    // Scalar to string conversion used by string expressions
    std::string to_string() const;

    // Human readable rendering for logs and test failures
    std::string debug_string() const;

    bool operator==(const Value& other) const { return data_ == other.data_; }
    bool operator!=(const Value& other) const { return !(*this == other); }

    static const char* type_label(Type type);

private:
    std::variant<std::monostate, bool, int64_t, double, std::string, Array,
                 Object>
        data_;
};

std::ostream& operator<<(std::ostream& os, const Value& value);

template <typename T>
struct is_shared_ptr : std::false_type {};

template <typename T>
struct is_shared_ptr<std::shared_ptr<T>> : std::true_type {};

/**
 * @brief Convert a Value to a C++ argument type
 * @throws std::invalid_argument if the value does not hold a compatible type
 */
template <typename T>
T value_cast(const Value& value) {
    using U = std::decay_t<T>;
    if constexpr (std::is_same_v<U, Value>) {
        return value;
    } else if constexpr (std::is_same_v<U, bool>) {
        return value.as_bool();
    } else if constexpr (std::is_integral_v<U>) {
        return static_cast<U>(value.as_int());
    } else if constexpr (std::is_floating_point_v<U>) {
        return static_cast<U>(value.as_float());
    } else if constexpr (std::is_same_v<U, std::string>) {
        return value.as_string();
    } else if constexpr (std::is_same_v<U, Array>) {
        return value.as_array();
    } else if constexpr (is_shared_ptr<U>::value) {
        using Pointee = typename U::element_type;
        if (value.is_null()) {
            return nullptr;
        }
        auto converted = value.as_object().template as<Pointee>();
        if (!converted) {
            throw std::invalid_argument(
                "object of type " + value.as_object().type_name() +
                " is not a " + type_name_of<Pointee>());
        }
        return converted;
    } else {
        static_assert(std::is_same_v<U, Value>,
                      "value_cast: unsupported target type");
    }
}

}  // namespace kiln::di

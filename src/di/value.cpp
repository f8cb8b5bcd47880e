#include "kiln/di/value.hpp"

#include <iomanip>
#include <limits>
#include <ostream>
#include <sstream>

namespace kiln::di {

namespace {

[[noreturn]] void throw_type_mismatch(Value::Type expected,
                                      Value::Type actual) {
    throw std::invalid_argument(std::string("expected ") +
                                Value::type_label(expected) + " but got " +
                                Value::type_label(actual));
}

std::string format_float(double value) {
    std::ostringstream oss;
    oss << std::setprecision(17) << value;
    return oss.str();
}

}  // namespace

std::string key_to_string(const ArrayKey& key) {
    if (const auto* index = std::get_if<int64_t>(&key)) {
        return std::to_string(*index);
    }
    return std::get<std::string>(key);
}

Array::Array(std::initializer_list<Value> values) {
    for (const auto& value : values) {
        push_back(value);
    }
}

Array Array::map(
    std::initializer_list<std::pair<std::string, Value>> entries) {
    Array array;
    for (const auto& [key, value] : entries) {
        array.set(key, value);
    }
    return array;
}

void Array::push_back(Value value) {
    if (!next_index_) {
        throw std::overflow_error(
            "Cannot append to array: the next integer key is already in use");
    }
    const int64_t index = *next_index_;
    keys_.emplace_back(index);
    values_.push_back(std::move(value));
    advance_past(index);
}

void Array::set(ArrayKey key, Value value) {
    for (size_t i = 0; i < keys_.size(); ++i) {
        if (keys_[i] == key) {
            values_[i] = std::move(value);
            return;
        }
    }
    if (const auto* index = std::get_if<int64_t>(&key)) {
        advance_past(*index);
    }
    keys_.push_back(std::move(key));
    values_.push_back(std::move(value));
}

// No integer key follows the largest one
void Array::advance_past(int64_t index) {
    if (!next_index_ || index < *next_index_) {
        return;
    }
    if (index == std::numeric_limits<int64_t>::max()) {
        next_index_.reset();
    } else {
        next_index_ = index + 1;
    }
}

const Value& Array::at(size_t index) const { return values_.at(index); }

const Value* Array::find(const ArrayKey& key) const {
    for (size_t i = 0; i < keys_.size(); ++i) {
        if (keys_[i] == key) {
            return &values_[i];
        }
    }
    return nullptr;
}

bool Array::operator==(const Array& other) const {
    return keys_ == other.keys_ && values_ == other.values_;
}

const char* Value::type_label(Type type) {
    switch (type) {
        case Type::NIL:
            return "null";
        case Type::BOOL:
            return "bool";
        case Type::INT:
            return "int";
        case Type::FLOAT:
            return "float";
        case Type::STRING:
            return "string";
        case Type::ARRAY:
            return "array";
        case Type::OBJECT:
            return "object";
    }
    return "unknown";
}

bool Value::as_bool() const {
    if (!is_bool()) throw_type_mismatch(Type::BOOL, type());
    return std::get<bool>(data_);
}

int64_t Value::as_int() const {
    if (!is_int()) throw_type_mismatch(Type::INT, type());
    return std::get<int64_t>(data_);
}

double Value::as_float() const {
    if (is_int()) {
        return static_cast<double>(std::get<int64_t>(data_));
    }
    if (!is_float()) throw_type_mismatch(Type::FLOAT, type());
    return std::get<double>(data_);
}

const std::string& Value::as_string() const {
    if (!is_string()) throw_type_mismatch(Type::STRING, type());
    return std::get<std::string>(data_);
}

const Array& Value::as_array() const {
    if (!is_array()) throw_type_mismatch(Type::ARRAY, type());
    return std::get<Array>(data_);
}

const Object& Value::as_object() const {
    if (!is_object()) throw_type_mismatch(Type::OBJECT, type());
    return std::get<Object>(data_);
}

std::string Value::to_string() const {
    switch (type()) {
        case Type::NIL:
            return "";
        case Type::BOOL:
            return as_bool() ? "1" : "";
        case Type::INT:
            return std::to_string(as_int());
        case Type::FLOAT:
            return format_float(as_float());
        case Type::STRING:
            return as_string();
        case Type::ARRAY:
        case Type::OBJECT:
            break;
    }
    throw std::invalid_argument(std::string("cannot convert ") +
                                type_label(type()) + " to string");
}

std::string Value::debug_string() const {
    switch (type()) {
        case Type::NIL:
            return "null";
        case Type::BOOL:
            return as_bool() ? "true" : "false";
        case Type::INT:
            return std::to_string(as_int());
        case Type::FLOAT:
            return format_float(as_float());
        case Type::STRING:
            return "\"" + as_string() + "\"";
        case Type::ARRAY: {
            const auto& array = as_array();
            std::string out = "[";
            for (size_t i = 0; i < array.size(); ++i) {
                if (i > 0) out += ", ";
                out += key_to_string(array.key_at(i)) + ": " +
                       array.at(i).debug_string();
            }
            return out + "]";
        }
        case Type::OBJECT:
            return "object(" + as_object().type_name() + ")";
    }
    return "?";
}

std::ostream& operator<<(std::ostream& os, const Value& value) {
    return os << value.debug_string();
}

}  // namespace kiln::di

#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <initializer_list>
#include <map>
#include <vector>
#include <stdexcept>
#include <sstream>
#include <ostream>
#include <type_traits>

namespace sc {

// An untyped, already-decoded value: the input (and output) of schema
// validation. Objects are string-keyed records, arrays are ordered sequences.
// `Absent` is the "not provided" sentinel and is distinct from `Null`.
class Value {
  public:
    enum TYPE { Object, Array, String, Integer, Double, Boolean, Null, Absent };

  private:
    TYPE my_type = Object;
    bool m_bool = false;
    int64_t m_int = 0;
    double m_double = 0.0;
    std::string m_string;
    std::vector<Value> m_array;
    std::map<std::string, Value> m_object_map;

  public:
    Value() = default;

    Value(const std::string& s) : my_type(TYPE::String), m_string(s) {}
    Value(std::string&& s) : my_type(TYPE::String), m_string(std::move(s)) {}
    Value(const char* s) : my_type(TYPE::String), m_string(s) {}
    Value(int64_t n) : my_type(TYPE::Integer), m_int(n) {}
    Value(int n) : my_type(TYPE::Integer), m_int(n) {}
    Value(double x) : my_type(TYPE::Double), m_double(x) {}
    Value(bool b) : my_type(TYPE::Boolean), m_bool(b) {}
    Value(const std::vector<Value>& v) : my_type(TYPE::Array), m_array(v) {}
    Value(std::vector<Value>&& v) : my_type(TYPE::Array), m_array(std::move(v)) {}

    // Construct an object from initializer list of (key, value) pairs
    Value(std::initializer_list<std::pair<std::string, Value> > init) {
        my_type = TYPE::Object;
        for (auto const& p : init) m_object_map[p.first] = p.second;
    }

    // Construct an array from an initializer list of convertible scalars
    template <typename T,
              typename = std::enable_if_t<
                          !std::is_same<std::decay_t<T>, std::pair<std::string, Value> >::value &&
                          !std::is_same<std::decay_t<T>, Value>::value> >
    Value(std::initializer_list<T> init) {
        my_type = TYPE::Array;
        for (auto const& v : init) m_array.emplace_back(v);
    }

    static Value null() {
        Value v;
        v.my_type = TYPE::Null;
        return v;
    }

    static Value absent() {
        Value v;
        v.my_type = TYPE::Absent;
        return v;
    }

    static Value array(std::vector<Value> elements = {}) { return Value(std::move(elements)); }

    static Value object() { return Value(); }

    bool operator==(const Value& rhs) const {
        if (my_type != rhs.my_type) return false;
        switch (my_type) {
            case TYPE::Boolean:
                return m_bool == rhs.m_bool;
            case TYPE::Integer:
                return m_int == rhs.m_int;
            case TYPE::Double:
                return m_double == rhs.m_double;
            case TYPE::String:
                return m_string == rhs.m_string;
            case TYPE::Array:
                return m_array == rhs.m_array;
            case TYPE::Object:
                return m_object_map == rhs.m_object_map;
            case TYPE::Null:
            case TYPE::Absent:
                return true;
        }
        return false;
    }

    bool operator!=(const Value& rhs) const { return not(*this == rhs); }

    TYPE type() const noexcept { return my_type; }

    std::string typeString() const {
        switch (my_type) {
            case TYPE::Object:
                return "Object";
            case TYPE::Array:
                return "Array";
            case TYPE::String:
                return "String";
            case TYPE::Integer:
                return "Integer";
            case TYPE::Double:
                return "Double";
            case TYPE::Boolean:
                return "Boolean";
            case TYPE::Null:
                return "Null";
            case TYPE::Absent:
                return "Absent";
        }
        throw std::logic_error("Not a valid type");
    }

    bool isMappedObject() const noexcept { return my_type == TYPE::Object; }
    bool isArrayObject() const noexcept { return my_type == TYPE::Array; }
    bool isString() const noexcept { return my_type == TYPE::String; }
    bool isInt() const noexcept { return my_type == TYPE::Integer; }
    bool isDouble() const noexcept { return my_type == TYPE::Double; }
    bool isNumber() const noexcept { return isInt() || isDouble(); }
    bool isBool() const noexcept { return my_type == TYPE::Boolean; }
    bool isNull() const noexcept { return my_type == TYPE::Null; }
    bool isAbsent() const noexcept { return my_type == TYPE::Absent; }

    bool has(const std::string& key) const noexcept {
        return my_type == TYPE::Object && m_object_map.count(key) == 1;
    }
    bool contains(const std::string& k) const noexcept { return has(k); }

    int size() const noexcept {
        switch (my_type) {
            case TYPE::Array:
                return static_cast<int>(m_array.size());
            case TYPE::Object:
                return static_cast<int>(m_object_map.size());
            default:
                return 0;
        }
    }

    bool empty() const noexcept { return size() == 0; }

    // Lookup that never throws: a missing key (or a non-object receiver)
    // yields the absence sentinel.
    Value get(const std::string& key) const {
        if (my_type != TYPE::Object) return absent();
        auto it = m_object_map.find(key);
        if (it == m_object_map.end()) return absent();
        return it->second;
    }

    Value& operator[](const std::string& k) {
        if (my_type != TYPE::Object) {
            my_type = TYPE::Object;
            m_object_map.clear();
        }
        return m_object_map[k];
    }

    const Value& operator[](const std::string& k) const { return at(k); }

    const Value& operator[](int index) const { return at(index); }

    const Value& at(const std::string& k) const {
        auto it = m_object_map.find(k);
        if (my_type == TYPE::Object && it != m_object_map.end()) return it->second;

        // didn't find it, throw a decent error message
        std::ostringstream ss;
        ss << "Could not find key <" << k << "> available options are: ";
        bool first = true;
        for (auto const& p : m_object_map) {
            if (!first) ss << ",";
            first = false;
            ss << '"' << p.first << '"';
        }
        throw std::out_of_range(ss.str());
    }

    const Value& at(int index) const {
        if (my_type != TYPE::Array) throw std::logic_error("Not a list");
        if (index < 0 || index >= static_cast<int>(m_array.size()))
            throw std::out_of_range("index " + std::to_string(index) + " out of range");
        return m_array[static_cast<size_t>(index)];
    }

    Value& push_back(Value v) {
        if (my_type == TYPE::Object && m_object_map.empty()) my_type = TYPE::Array;
        if (my_type != TYPE::Array) throw std::logic_error("Not a list");
        m_array.push_back(std::move(v));
        return m_array.back();
    }

    std::vector<std::string> keys() const {
        if (my_type != TYPE::Object) return {};
        std::vector<std::string> out;
        out.reserve(m_object_map.size());
        for (auto const& p : m_object_map) out.push_back(p.first);
        return out;
    }

    const std::map<std::string, Value>& items() const {
        if (my_type != TYPE::Object) throw std::logic_error("Cannot get items of non-object type");
        return m_object_map;
    }

    const std::vector<Value>& asArray() const {
        if (my_type != TYPE::Array) throw std::logic_error("Not a list");
        return m_array;
    }

    const std::string& asString() const {
        if (my_type == TYPE::String) return m_string;
        throw std::runtime_error("not a string");
    }

    int64_t asInt() const {
        if (my_type == TYPE::Integer) return m_int;
        if (my_type == TYPE::Double) return static_cast<int64_t>(m_double);
        throw std::runtime_error("not an int");
    }

    double asDouble() const {
        if (my_type == TYPE::Double) return m_double;
        if (my_type == TYPE::Integer) return static_cast<double>(m_int);
        throw std::runtime_error("not a double");
    }

    bool asBool() const {
        if (my_type == TYPE::Boolean) return m_bool;
        throw std::runtime_error("not a bool");
    }

    std::string dump() const;
};

// Helper function to escape JSON strings
inline std::string escape_json_string(const std::string& s) {
    std::string result;
    result.reserve(s.size() + 2);
    result.push_back('"');
    for (char c : s) {
        switch (c) {
            case '"':
                result += "\\\"";
                break;
            case '\\':
                result += "\\\\";
                break;
            case '\n':
                result += "\\n";
                break;
            case '\r':
                result += "\\r";
                break;
            case '\t':
                result += "\\t";
                break;
            default:
                result.push_back(c);
                break;
        }
    }
    result.push_back('"');
    return result;
}

// Compact single-line rendering. Absent prints as `undefined` so it can be
// told apart from null in diagnostics.
inline std::string Value::dump() const {
    switch (my_type) {
        case TYPE::Null:
            return "null";
        case TYPE::Absent:
            return "undefined";
        case TYPE::Boolean:
            return m_bool ? "true" : "false";
        case TYPE::Integer:
            return std::to_string(m_int);
        case TYPE::Double: {
            std::ostringstream ss;
            ss << m_double;
            return ss.str();
        }
        case TYPE::String:
            return escape_json_string(m_string);
        case TYPE::Array: {
            std::ostringstream ss;
            ss << '[';
            bool first = true;
            for (auto const& el : m_array) {
                if (!first) ss << ",";
                first = false;
                ss << el.dump();
            }
            ss << ']';
            return ss.str();
        }
        case TYPE::Object: {
            std::ostringstream ss;
            ss << '{';
            bool first = true;
            for (auto const& p : m_object_map) {
                if (!first) ss << ",";
                first = false;
                ss << escape_json_string(p.first) << ':' << p.second.dump();
            }
            ss << '}';
            return ss.str();
        }
    }
    return std::string();
}

inline std::ostream& operator<<(std::ostream& os, const Value& v) {
    os << v.dump();
    return os;
}

}  // namespace sc

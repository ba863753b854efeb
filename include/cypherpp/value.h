#pragma once
// ═══════════════════════════════════════════════════════════════════
//  cypherpp/value.h — Statement parameter values
// ═══════════════════════════════════════════════════════════════════
//
//  ParamValue is a tagged variant over the values a Cypher parameter
//  may hold: null, boolean, integer, float, string, and (recursively)
//  arrays and string-keyed objects. Conversion from the supported C++
//  types is implicit and lossless; anything else does not compile.
//
//    ParamValue a = 42;
//    ParamValue b = std::vector<std::string>{"low", "high"};
//    ParamValue c = std::map<std::string, double>{{"score", 0.5}};
// ═══════════════════════════════════════════════════════════════════

#include <nlohmann/json.hpp>
#include <concepts>
#include <cstdint>
#include <initializer_list>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace cypherpp {

class ParamValue;

namespace detail {

template <typename T>
concept CharLike = std::same_as<T, char> || std::same_as<T, signed char> ||
                   std::same_as<T, unsigned char> || std::same_as<T, wchar_t> ||
                   std::same_as<T, char8_t> || std::same_as<T, char16_t> ||
                   std::same_as<T, char32_t>;

// Integers that fit an int64 without loss (uint64_t does not).
template <typename T>
concept LosslessInteger = std::integral<T> && !std::same_as<T, bool> && !CharLike<T> &&
                          (std::is_signed_v<T> || sizeof(T) < sizeof(std::int64_t));

// Floating types that fit a double without loss (long double does not).
template <typename T>
concept LosslessFloat = std::same_as<T, float> || std::same_as<T, double>;

} // namespace detail

class ParamValue {
public:
    using Array   = std::vector<ParamValue>;
    using Object  = std::map<std::string, ParamValue>;
    using Storage = std::variant<std::nullptr_t, bool, std::int64_t, double,
                                 std::string, Array, Object>;

    // Order matches the Storage alternatives
    enum class Kind { Null, Boolean, Integer, Float, String, Array, Object };

    ParamValue() = default;
    ParamValue(std::nullptr_t) {}
    // bool only; pointers and other arithmetic types do not decay to it
    template <std::same_as<bool> T>
    ParamValue(T value) : data_(value) {}

    template <detail::LosslessInteger T>
    ParamValue(T value) : data_(static_cast<std::int64_t>(value)) {}

    template <detail::LosslessFloat T>
    ParamValue(T value) : data_(static_cast<double>(value)) {}

    ParamValue(const char* value) {
        if (value) data_ = std::string(value);
    }
    ParamValue(std::string value) : data_(std::move(value)) {}
    ParamValue(std::string_view value) : data_(std::string(value)) {}

    ParamValue(Array value) : data_(std::move(value)) {}
    ParamValue(Object value) : data_(std::move(value)) {}

    template <typename T>
        requires std::constructible_from<ParamValue, const T&>
    ParamValue(const std::vector<T>& values) {
        Array arr;
        arr.reserve(values.size());
        for (const T& v : values) arr.emplace_back(v);
        data_ = std::move(arr);
    }

    template <typename T>
        requires std::constructible_from<ParamValue, const T&>
    ParamValue(const std::map<std::string, T>& values) {
        Object obj;
        for (auto& [k, v] : values) obj.emplace(k, ParamValue(v));
        data_ = std::move(obj);
    }

    template <typename T>
        requires std::constructible_from<ParamValue, const T&>
    ParamValue(const std::unordered_map<std::string, T>& values) {
        Object obj;
        for (auto& [k, v] : values) obj.emplace(k, ParamValue(v));
        data_ = std::move(obj);
    }

    template <typename T>
        requires std::constructible_from<ParamValue, const T&>
    ParamValue(const std::optional<T>& value) {
        if (value) *this = ParamValue(*value);
    }

    // ── Literal helpers: ParamValue::array({1, "two", 3.0}) ──
    static ParamValue array(std::initializer_list<ParamValue> items) {
        return ParamValue(Array(items));
    }

    static ParamValue object(std::initializer_list<std::pair<const std::string, ParamValue>> items) {
        return ParamValue(Object(items));
    }

    // ── Inspection ──
    Kind kind() const { return static_cast<Kind>(data_.index()); }
    bool isNull() const { return std::holds_alternative<std::nullptr_t>(data_); }

    template <typename T>
    bool is() const { return std::holds_alternative<T>(data_); }

    template <typename T>
    const T* getIf() const { return std::get_if<T>(&data_); }

    const Storage& storage() const { return data_; }

    // ── Wire conversion ──
    nlohmann::json toJson() const;
    static ParamValue fromJson(const nlohmann::json& j);

    bool operator==(const ParamValue&) const = default;

    friend void to_json(nlohmann::json& j, const ParamValue& v) { j = v.toJson(); }
    friend void from_json(const nlohmann::json& j, ParamValue& v) { v = ParamValue::fromJson(j); }

private:
    Storage data_;
};

using Params = std::map<std::string, ParamValue>;

const char* toString(ParamValue::Kind kind);

} // namespace cypherpp

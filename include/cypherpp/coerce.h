#pragma once
// ═══════════════════════════════════════════════════════════════════
//  cypherpp/coerce.h — Fallible conversion of opaque JSON cells
// ═══════════════════════════════════════════════════════════════════
//
//  coerce<T>(cell) succeeds only when the cell's shape matches T:
//    bool            ← boolean
//    integers        ← integer in range, or an integral float in range
//    floating point  ← any number
//    std::string     ← string
//    std::optional   ← null (empty) or the inner type
//    std::vector     ← array, element-wise
//    std::map / std::unordered_map<std::string, T> ← object
//    nlohmann::json  ← anything
//    ParamValue      ← anything
//    user structs    ← whatever their from_json accepts (CYPHER_SERIALIZE)
//
//  Every failure is reported as TypeCoercionError.
// ═══════════════════════════════════════════════════════════════════

#include "error.h"
#include "json_utils.h"
#include "value.h"

#include <cmath>
#include <cstdint>
#include <limits>
#include <map>
#include <optional>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <vector>

namespace cypherpp {

namespace detail {

template <typename T> struct IsOptional : std::false_type {};
template <typename T> struct IsOptional<std::optional<T>> : std::true_type {};

template <typename T> struct IsVector : std::false_type {};
template <typename T> struct IsVector<std::vector<T>> : std::true_type {};

template <typename T> struct IsStringMap : std::false_type {};
template <typename T> struct IsStringMap<std::map<std::string, T>> : std::true_type {};
template <typename T> struct IsStringMap<std::unordered_map<std::string, T>> : std::true_type {};

[[noreturn]] inline void coercionFailure(const nlohmann::json& cell, const char* target) {
    throw TypeCoercionError(std::string("Cannot convert ") + jsonKind(cell) +
                            " value " + cell.dump() + " to " + target);
}

template <typename T>
T coerceInteger(const nlohmann::json& cell) {
    using Limits = std::numeric_limits<T>;

    if (cell.is_number_unsigned()) {
        auto u = cell.get<std::uint64_t>();
        if (u > static_cast<std::uint64_t>(Limits::max())) coercionFailure(cell, "integer (out of range)");
        return static_cast<T>(u);
    }
    if (cell.is_number_integer()) {
        auto i = cell.get<std::int64_t>();
        if constexpr (std::is_unsigned_v<T>) {
            if (i < 0 || static_cast<std::uint64_t>(i) > static_cast<std::uint64_t>(Limits::max())) {
                coercionFailure(cell, "integer (out of range)");
            }
        } else {
            if (i < static_cast<std::int64_t>(Limits::min()) ||
                i > static_cast<std::int64_t>(Limits::max())) {
                coercionFailure(cell, "integer (out of range)");
            }
        }
        return static_cast<T>(i);
    }
    if (cell.is_number_float()) {
        double d = cell.get<double>();
        if (!std::isfinite(d) || std::trunc(d) != d) coercionFailure(cell, "integer (non-integral)");
        // 2^63 and 2^64 are exact doubles; compare against them rather than max()
        // which rounds up when converted.
        constexpr double upper = std::is_signed_v<T>
            ? -static_cast<double>(Limits::min())
            : static_cast<double>(Limits::max()) + 1.0;
        if (d < static_cast<double>(Limits::min()) || d >= upper) {
            coercionFailure(cell, "integer (out of range)");
        }
        return static_cast<T>(d);
    }
    coercionFailure(cell, "integer");
}

} // namespace detail

template <typename T>
T coerce(const nlohmann::json& cell) {
    if constexpr (std::is_same_v<T, nlohmann::json>) {
        return cell;
    } else if constexpr (std::is_same_v<T, ParamValue>) {
        return ParamValue::fromJson(cell);
    } else if constexpr (std::is_same_v<T, bool>) {
        if (!cell.is_boolean()) detail::coercionFailure(cell, "boolean");
        return cell.get<bool>();
    } else if constexpr (std::is_integral_v<T>) {
        return detail::coerceInteger<T>(cell);
    } else if constexpr (std::is_floating_point_v<T>) {
        if (!cell.is_number()) detail::coercionFailure(cell, "floating point");
        if constexpr (sizeof(T) < sizeof(double)) {
            double d = cell.get<double>();
            if (std::abs(d) > static_cast<double>(std::numeric_limits<T>::max())) {
                detail::coercionFailure(cell, "floating point (out of range)");
            }
        }
        return cell.get<T>();
    } else if constexpr (std::is_same_v<T, std::string>) {
        if (!cell.is_string()) detail::coercionFailure(cell, "string");
        return cell.get<std::string>();
    } else if constexpr (detail::IsOptional<T>::value) {
        if (cell.is_null()) return T{};
        return T{coerce<typename T::value_type>(cell)};
    } else if constexpr (detail::IsVector<T>::value) {
        if (!cell.is_array()) detail::coercionFailure(cell, "array");
        T out;
        out.reserve(cell.size());
        for (auto& item : cell) out.push_back(coerce<typename T::value_type>(item));
        return out;
    } else if constexpr (detail::IsStringMap<T>::value) {
        if (!cell.is_object()) detail::coercionFailure(cell, "object");
        T out;
        for (auto& [key, item] : cell.items()) {
            out.emplace(key, coerce<typename T::mapped_type>(item));
        }
        return out;
    } else {
        static_assert(JsonDeserializable<T>,
                      "Type cannot be extracted from a result cell; declare it with CYPHER_SERIALIZE");
        try {
            return cell.get<T>();
        } catch (const nlohmann::json::exception& e) {
            throw TypeCoercionError(std::string("Cannot convert ") + jsonKind(cell) +
                                    " value to the requested type: " + e.what());
        }
    }
}

} // namespace cypherpp

#pragma once
// ═══════════════════════════════════════════════════════════════════
//  cypherpp/json_utils.h — JSON concepts and struct serialization
// ═══════════════════════════════════════════════════════════════════
//  Uses nlohmann/json + C++20 Concepts so that user structs can be
//  bound as statement parameters and extracted from result rows.
// ═══════════════════════════════════════════════════════════════════

#include <nlohmann/json.hpp>
#include <concepts>
#include <string>

namespace cypherpp {

// ─────────────────────────────────────────────
//  Macro: CYPHER_SERIALIZE
//  Makes a struct usable as a parameter value and as a row cell
//  target (row.get<Language>("n")).
//
//  Usage:
//    struct Language {
//        std::string name;
//        bool safe;
//        CYPHER_SERIALIZE(Language, name, safe)
//    };
// ─────────────────────────────────────────────
#define CYPHER_SERIALIZE(Type, ...) \
    NLOHMANN_DEFINE_TYPE_INTRUSIVE(Type, __VA_ARGS__)

// ─────────────────────────────────────────────
//  Concept: JsonSerializable
//  Any type T that nlohmann::json can construct from.
// ─────────────────────────────────────────────
template <typename T>
concept JsonSerializable = requires(T t) {
    { nlohmann::json(t) } -> std::convertible_to<nlohmann::json>;
};

// ─────────────────────────────────────────────
//  Concept: JsonDeserializable
//  Any type T that nlohmann::json can convert to.
// ─────────────────────────────────────────────
template <typename T>
concept JsonDeserializable = requires(nlohmann::json j) {
    { j.get<T>() } -> std::same_as<T>;
};

// ── Human-readable name of a JSON value's shape, used in error messages ──
inline std::string jsonKind(const nlohmann::json& j) {
    switch (j.type()) {
        case nlohmann::json::value_t::null:            return "null";
        case nlohmann::json::value_t::boolean:         return "boolean";
        case nlohmann::json::value_t::number_integer:
        case nlohmann::json::value_t::number_unsigned: return "integer";
        case nlohmann::json::value_t::number_float:    return "float";
        case nlohmann::json::value_t::string:          return "string";
        case nlohmann::json::value_t::array:           return "array";
        case nlohmann::json::value_t::object:          return "object";
        default:                                       return "binary";
    }
}

} // namespace cypherpp

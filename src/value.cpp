// ═══════════════════════════════════════════════════════════════════
//  value.cpp — ParamValue <-> JSON conversion
// ═══════════════════════════════════════════════════════════════════

#include "cypherpp/value.h"

#include <limits>

namespace cypherpp {

namespace {

template <class... Ts>
struct Overloaded : Ts... { using Ts::operator()...; };
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

} // namespace

nlohmann::json ParamValue::toJson() const {
    return std::visit(Overloaded{
        [](std::nullptr_t) { return nlohmann::json(nullptr); },
        [](bool b) { return nlohmann::json(b); },
        [](std::int64_t i) { return nlohmann::json(i); },
        [](double d) { return nlohmann::json(d); },
        [](const std::string& s) { return nlohmann::json(s); },
        [](const Array& arr) {
            nlohmann::json out = nlohmann::json::array();
            for (auto& item : arr) out.push_back(item.toJson());
            return out;
        },
        [](const Object& obj) {
            nlohmann::json out = nlohmann::json::object();
            for (auto& [key, item] : obj) out[key] = item.toJson();
            return out;
        },
    }, data_);
}

ParamValue ParamValue::fromJson(const nlohmann::json& j) {
    switch (j.type()) {
        case nlohmann::json::value_t::boolean:
            return ParamValue(j.get<bool>());
        case nlohmann::json::value_t::number_integer:
            return ParamValue(j.get<std::int64_t>());
        case nlohmann::json::value_t::number_unsigned: {
            auto u = j.get<std::uint64_t>();
            if (u <= static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
                return ParamValue(static_cast<std::int64_t>(u));
            }
            return ParamValue(static_cast<double>(u));
        }
        case nlohmann::json::value_t::number_float:
            return ParamValue(j.get<double>());
        case nlohmann::json::value_t::string:
            return ParamValue(j.get<std::string>());
        case nlohmann::json::value_t::array: {
            Array arr;
            arr.reserve(j.size());
            for (auto& item : j) arr.push_back(fromJson(item));
            return ParamValue(std::move(arr));
        }
        case nlohmann::json::value_t::object: {
            Object obj;
            for (auto& [key, item] : j.items()) obj.emplace(key, fromJson(item));
            return ParamValue(std::move(obj));
        }
        default:
            return ParamValue();
    }
}

const char* toString(ParamValue::Kind kind) {
    switch (kind) {
        case ParamValue::Kind::Null:    return "null";
        case ParamValue::Kind::Boolean: return "boolean";
        case ParamValue::Kind::Integer: return "integer";
        case ParamValue::Kind::Float:   return "float";
        case ParamValue::Kind::String:  return "string";
        case ParamValue::Kind::Array:   return "array";
        case ParamValue::Kind::Object:  return "object";
    }
    return "unknown";
}

} // namespace cypherpp

#pragma once
// ═══════════════════════════════════════════════════════════════════
//  cypherpp/statement.h — Cypher statement with bound parameters
// ═══════════════════════════════════════════════════════════════════
//
//  Usage:
//    Statement s = "MATCH (n:LANG) RETURN n.name";
//    auto q = Statement("MATCH (n:LANG) WHERE n.safe = $safe RETURN n")
//                 .withParam("safe", true)
//                 .withParam("levels", std::vector<std::string>{"low"});
//
//  The statement text is opaque to the driver: parameter names are not
//  checked against it.
// ═══════════════════════════════════════════════════════════════════

#include "coerce.h"
#include "json_utils.h"
#include "value.h"

#include <optional>
#include <string>
#include <type_traits>
#include <utility>

namespace cypherpp {

class Statement {
public:
    Statement(std::string text) : text_(std::move(text)) {}
    Statement(const char* text) : text_(text ? text : "") {}
    Statement(std::string text, Params params)
        : text_(std::move(text)), params_(std::move(params)) {}

    // ── Bind a parameter, replacing any previous value of the same name ──
    template <typename T>
    Statement& withParam(const std::string& name, const T& value) & {
        params_.insert_or_assign(name, toParam(value));
        return *this;
    }

    template <typename T>
    Statement&& withParam(const std::string& name, const T& value) && {
        params_.insert_or_assign(name, toParam(value));
        return std::move(*this);
    }

    Statement& withParams(const Params& params) & {
        for (auto& [k, v] : params) params_.insert_or_assign(k, v);
        return *this;
    }

    Statement&& withParams(const Params& params) && {
        for (auto& [k, v] : params) params_.insert_or_assign(k, v);
        return std::move(*this);
    }

    // ── Read a bound parameter back; empty when the name is not bound ──
    template <typename T>
    std::optional<T> param(const std::string& name) const {
        auto it = params_.find(name);
        if (it == params_.end()) return std::nullopt;
        return coerce<T>(it->second.toJson());
    }

    bool hasParam(const std::string& name) const { return params_.count(name) > 0; }
    bool removeParam(const std::string& name) { return params_.erase(name) > 0; }

    const std::string& text() const { return text_; }
    const Params& params() const { return params_; }

    // {"statement": text, "parameters": {...}}
    nlohmann::json toJson() const;

    bool operator==(const Statement&) const = default;

private:
    template <typename T>
    static ParamValue toParam(const T& value) {
        if constexpr (std::is_constructible_v<ParamValue, const T&>) {
            return ParamValue(value);
        } else {
            static_assert(!std::is_arithmetic_v<T>,
                          "Parameter type does not convert to an int64 or double without loss");
            static_assert(JsonSerializable<T>,
                          "Parameter type must be a supported scalar/collection or use CYPHER_SERIALIZE");
            return ParamValue::fromJson(nlohmann::json(value));
        }
    }

    std::string text_;
    Params params_;
};

} // namespace cypherpp

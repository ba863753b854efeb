#pragma once
// ═══════════════════════════════════════════════════════════════════
//  cypherpp/codec.h — Wire format of the transactional endpoint
// ═══════════════════════════════════════════════════════════════════
//
//  Request:   {"statements": [{"statement": "...", "parameters": {...}}, ...]}
//  Response:  {"results": [{"columns": [...], "data": [{"row": [...]}, ...]}, ...],
//              "errors":  [{"code": "...", "message": "..."}, ...],
//              "commit":  "http://host/db/neo4j/tx/42/commit",
//              "transaction": {"expires": "Fri, 18 Oct 2026 12:00:00 +0000"}}
// ═══════════════════════════════════════════════════════════════════

#include "result.h"
#include "statement.h"

#include <nlohmann/json.hpp>
#include <chrono>
#include <string>
#include <vector>

namespace cypherpp::codec {

// ── One batch per request: every statement travels in the same body ──
nlohmann::json encode(const std::vector<Statement>& statements);

inline std::string encodeBody(const std::vector<Statement>& statements) {
    return encode(statements).dump();
}

// ── Decode a response body ──
// Tables are matched to statements by position; when the server stops
// early (first failing statement), the missing positions are filled with
// empty tables so that results.size() >= statementCount.
// Throws ProtocolError only when the body is not JSON.
QueryResponse decode(const std::string& body, std::size_t statementCount);

QueryResponse decode(const nlohmann::json& document, std::size_t statementCount);

// ── Parse "Fri, 18 Oct 2026 12:00:00 +0000" (zone: ±hhmm, GMT or UTC) ──
std::chrono::system_clock::time_point parseExpires(const std::string& text);

// ── Inverse of parseExpires, always in +0000 ──
std::string formatExpires(std::chrono::system_clock::time_point when);

} // namespace cypherpp::codec

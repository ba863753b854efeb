#pragma once
// ═══════════════════════════════════════════════════════════════════
//  cypherpp/error.h — Error taxonomy for the transactional endpoint
// ═══════════════════════════════════════════════════════════════════
//
//  GraphError
//   ├── TransportError           connection failure / unexpected HTTP status
//   ├── ProtocolError            response body is not what the endpoint promises
//   ├── EndpointError            non-empty "errors" list from the server
//   ├── InvalidTransactionState  operation on a finished transaction
//   ├── ExpiredTransaction       transaction no longer exists server-side
//   └── TypeCoercionError        cell value does not fit the requested type
// ═══════════════════════════════════════════════════════════════════

#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace cypherpp {

// ── One entry of the endpoint's "errors" array ──
struct ServerError {
    std::string code;
    std::string message;

    // The transaction referenced by the request is gone (unknown id,
    // already closed, or terminated by the server's idle timeout).
    bool isTransactionGone() const {
        return endsWith("Transaction.TransactionNotFound") ||
               endsWith("Transaction.UnknownId") ||
               endsWith("Transaction.TransactionTimedOut");
    }

    bool operator==(const ServerError&) const = default;

private:
    bool endsWith(std::string_view suffix) const {
        return code.size() >= suffix.size() &&
               code.compare(code.size() - suffix.size(), suffix.size(), suffix) == 0;
    }
};

inline void from_json(const nlohmann::json& j, ServerError& e) {
    e.code = j.is_object() ? j.value("code", std::string()) : std::string();
    e.message = j.is_object() ? j.value("message", std::string()) : std::string();
}

inline void to_json(nlohmann::json& j, const ServerError& e) {
    j = nlohmann::json{{"code", e.code}, {"message", e.message}};
}

// ── Client-side mirror of the server transaction's lifecycle ──
enum class TransactionState { Open, Committed, RolledBack, Expired };

inline const char* toString(TransactionState state) {
    switch (state) {
        case TransactionState::Open:       return "Open";
        case TransactionState::Committed:  return "Committed";
        case TransactionState::RolledBack: return "RolledBack";
        case TransactionState::Expired:    return "Expired";
    }
    return "Unknown";
}

// ═══════════════════════════════════════════
//  Exceptions
// ═══════════════════════════════════════════

class GraphError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class TransportError : public GraphError {
public:
    TransportError(const std::string& what, int status = 0, std::string body = {})
        : GraphError(what), status_(status), body_(std::move(body)) {}

    // 0 when no HTTP response was received at all
    int status() const { return status_; }
    const std::string& body() const { return body_; }

private:
    int status_;
    std::string body_;
};

class ProtocolError : public GraphError {
public:
    using GraphError::GraphError;
};

class EndpointError : public GraphError {
public:
    explicit EndpointError(std::vector<ServerError> errors)
        : GraphError(describe(errors)), errors_(std::move(errors)) {}

    const std::vector<ServerError>& errors() const { return errors_; }

private:
    static std::string describe(const std::vector<ServerError>& errors) {
        std::string out = "Endpoint returned " + std::to_string(errors.size()) + " error(s)";
        for (auto& e : errors) {
            out += "\n  " + e.code + ": " + e.message;
        }
        return out;
    }

    std::vector<ServerError> errors_;
};

class InvalidTransactionState : public GraphError {
public:
    InvalidTransactionState(const std::string& operation, TransactionState state)
        : GraphError("Cannot " + operation + " a transaction in state " + toString(state)),
          state_(state) {}

    TransactionState state() const { return state_; }

private:
    TransactionState state_;
};

class ExpiredTransaction : public GraphError {
public:
    using GraphError::GraphError;
};

class TypeCoercionError : public GraphError {
public:
    using GraphError::GraphError;
};

} // namespace cypherpp

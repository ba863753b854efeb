#pragma once
// ═══════════════════════════════════════════════════════════════════
//  cypherpp/transport.h — HTTP transport seam
// ═══════════════════════════════════════════════════════════════════
//
//  Transport is the single collaborator the driver core talks to:
//    send(method, url, body) -> HttpResponse
//
//  HttpTransport is the Boost.Beast implementation (http and https).
//  Tests substitute a scripted in-memory transport.
// ═══════════════════════════════════════════════════════════════════

#include "error.h"

#include <string>
#include <unordered_map>

namespace cypherpp {

enum class Method { Get, Post, Delete };

inline const char* toString(Method method) {
    switch (method) {
        case Method::Get:    return "GET";
        case Method::Post:   return "POST";
        case Method::Delete: return "DELETE";
    }
    return "GET";
}

// ── HTTP Response ──
struct HttpResponse {
    int status = 0;              // 0: no response (connect/timeout/TLS failure)
    std::string statusText;      // reason phrase, or the failure message when status == 0
    std::string body;
    std::unordered_map<std::string, std::string> headers;   // lowercase keys

    bool ok() const { return status >= 200 && status < 300; }

    std::string header(const std::string& name) const;
};

// ── TransportError for a response outside the operation's success codes ──
TransportError unexpectedResponse(const std::string& operation, const HttpResponse& response);

// ═══════════════════════════════════════════
//  Transport interface
// ═══════════════════════════════════════════
class Transport {
public:
    virtual ~Transport() = default;

    // Blocks until a response arrives or the request fails. Never throws
    // for network failures: those come back with status == 0.
    virtual HttpResponse send(Method method, const std::string& url, const std::string& body) = 0;
};

// ── Transport options ──
struct TransportOptions {
    std::unordered_map<std::string, std::string> headers;   // sent with every request
    int timeoutMs = 30000;
    std::string userAgent = "cypherpp/1.0";
    bool verifyPeer = true;      // https only
    std::string caFile;          // https only; empty = system default paths
};

// ═══════════════════════════════════════════
//  HttpTransport — Boost.Beast client
// ═══════════════════════════════════════════
class HttpTransport : public Transport {
public:
    explicit HttpTransport(TransportOptions options = {});

    HttpResponse send(Method method, const std::string& url, const std::string& body) override;

    const TransportOptions& options() const { return options_; }

private:
    TransportOptions options_;
};

} // namespace cypherpp

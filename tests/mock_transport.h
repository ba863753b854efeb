#pragma once
// ═══════════════════════════════════════════════════════════════════
//  mock_transport.h — Scripted in-memory Transport for tests
// ═══════════════════════════════════════════════════════════════════

#include "cypherpp/transport.h"

#include <nlohmann/json.hpp>
#include <deque>
#include <string>
#include <vector>

namespace cypherpp::testing {

struct RecordedCall {
    Method method;
    std::string url;
    std::string body;

    nlohmann::json json() const {
        return body.empty() ? nlohmann::json() : nlohmann::json::parse(body);
    }
};

class MockTransport : public Transport {
public:
    // ── Queue the next response ──
    MockTransport& reply(int status, const nlohmann::json& body,
                         std::unordered_map<std::string, std::string> headers = {}) {
        HttpResponse res;
        res.status = status;
        res.body = body.dump();
        res.headers = std::move(headers);
        responses_.push_back(std::move(res));
        return *this;
    }

    MockTransport& replyRaw(int status, const std::string& body) {
        HttpResponse res;
        res.status = status;
        res.body = body;
        responses_.push_back(std::move(res));
        return *this;
    }

    // status 0: the request never reached a server
    MockTransport& fail(const std::string& reason) {
        HttpResponse res;
        res.status = 0;
        res.statusText = reason;
        responses_.push_back(std::move(res));
        return *this;
    }

    HttpResponse send(Method method, const std::string& url, const std::string& body) override {
        calls.push_back({method, url, body});
        if (responses_.empty()) {
            HttpResponse res;
            res.statusText = "no scripted response";
            return res;
        }
        auto res = std::move(responses_.front());
        responses_.pop_front();
        return res;
    }

    std::size_t remaining() const { return responses_.size(); }

    std::vector<RecordedCall> calls;

private:
    std::deque<HttpResponse> responses_;
};

// ── Response bodies in the endpoint's shape ──

inline nlohmann::json table(const std::vector<std::string>& columns,
                            const std::vector<nlohmann::json>& rows = {}) {
    nlohmann::json data = nlohmann::json::array();
    for (auto& row : rows) data.push_back({{"row", row}, {"meta", nlohmann::json::array()}});
    return {{"columns", columns}, {"data", data}};
}

inline nlohmann::json body(const std::vector<nlohmann::json>& results,
                           const std::vector<nlohmann::json>& errors = {}) {
    return {{"results", results}, {"errors", errors}};
}

inline nlohmann::json txBody(const std::string& commitUrl, const std::string& expires,
                             const std::vector<nlohmann::json>& results,
                             const std::vector<nlohmann::json>& errors = {}) {
    auto b = body(results, errors);
    b["commit"] = commitUrl;
    b["transaction"] = {{"expires", expires}};
    return b;
}

inline nlohmann::json error(const std::string& code, const std::string& message) {
    return {{"code", code}, {"message", message}};
}

} // namespace cypherpp::testing

// ═══════════════════════════════════════════════════════════════════
//  client.cpp — GraphClient: endpoint resolution, autocommit, begin
// ═══════════════════════════════════════════════════════════════════

#include "cypherpp/client.h"
#include "cypherpp/codec.h"
#include "cypherpp/url.h"

#include <nlohmann/json.hpp>

namespace cypherpp {

namespace {

constexpr int kOk = 200;
const std::string kDatabasePlaceholder = "{databaseName}";

std::string substituteDatabase(std::string endpoint, const std::string& database) {
    for (auto pos = endpoint.find(kDatabasePlaceholder); pos != std::string::npos;
         pos = endpoint.find(kDatabasePlaceholder, pos + database.size())) {
        endpoint.replace(pos, kDatabasePlaceholder.size(), database);
    }
    return endpoint;
}

TransportOptions transportOptions(const ClientOptions& options) {
    TransportOptions opts;
    opts.timeoutMs = options.timeoutMs;
    opts.userAgent = options.userAgent;
    opts.verifyPeer = options.verifyPeer;
    opts.caFile = options.caFile;

    auto parsed = url::parse(options.url);
    if (!options.username.empty()) {
        opts.headers["Authorization"] = url::basicAuth(options.username, options.password);
    } else if (!parsed.user.empty()) {
        opts.headers["Authorization"] = url::basicAuth(parsed.user, parsed.password);
    }
    return opts;
}

} // namespace

// ═══════════════════════════════════════════
//  GraphClient
// ═══════════════════════════════════════════

GraphClient::GraphClient(ClientOptions options)
    : options_(std::move(options)),
      transport_(std::make_shared<HttpTransport>(transportOptions(options_))) {
    resolveEndpoint();
}

GraphClient::GraphClient(ClientOptions options, std::shared_ptr<Transport> transport)
    : options_(std::move(options)), transport_(std::move(transport)) {
    if (!transport_) {
        transport_ = std::make_shared<HttpTransport>(transportOptions(options_));
    }
    resolveEndpoint();
}

GraphClient GraphClient::connect(const std::string& address, std::optional<std::string> database) {
    ClientOptions options;
    options.url = address;
    options.discover = true;
    if (database) options.database = *database;
    return GraphClient(std::move(options));
}

void GraphClient::resolveEndpoint() {
    auto base = url::stripCredentials(options_.url);

    if (!options_.transactionEndpoint.empty()) {
        endpoint_ = url::stripCredentials(options_.transactionEndpoint);
    } else if (options_.discover) {
        auto http = transport_->send(Method::Get, base, "");
        if (http.status != kOk) {
            throw unexpectedResponse("read service root", http);
        }

        auto root = nlohmann::json::parse(http.body, nullptr, false);
        if (root.is_discarded() || !root.is_object()) {
            throw ProtocolError("Service root at " + base + " is not a JSON object");
        }

        auto errors = root.find("errors");
        if (errors != root.end() && errors->is_array() && !errors->empty()) {
            throw EndpointError(errors->get<std::vector<ServerError>>());
        }

        auto transaction = root.find("transaction");
        if (transaction == root.end() || !transaction->is_string()) {
            throw ProtocolError("Service root at " + base + " does not advertise a transaction endpoint");
        }
        endpoint_ = transaction->get<std::string>();

        auto version = root.find("neo4j_version");
        if (version != root.end() && version->is_string()) {
            serverVersion_ = version->get<std::string>();
        }
    } else {
        endpoint_ = url::join(base, "transaction");
    }

    endpoint_ = substituteDatabase(endpoint_, options_.database);
    console::debug("Transaction endpoint:", endpoint_,
                   serverVersion_ ? "(server " + *serverVersion_ + ")" : std::string());
}

QueryResponse GraphClient::run(const std::vector<Statement>& statements) const {
    auto http = transport_->send(Method::Post, url::join(endpoint_, "commit"),
                                 codec::encodeBody(statements));
    if (http.status != kOk) {
        throw unexpectedResponse("autocommit", http);
    }

    auto response = codec::decode(http.body, statements.size());
    if (!response.ok()) {
        console::debug("Autocommit batch returned", response.errors.size(), "error(s)");
    }
    return response;
}

ResultTable GraphClient::exec(const Statement& statement) const {
    auto response = run({statement});
    response.throwIfErrors();
    return std::move(response.results.front());
}

std::pair<Transaction, std::vector<ResultTable>>
GraphClient::begin(const std::vector<Statement>& statements) const {
    return Transaction::begin(transport_, endpoint_, statements, options_.clock);
}

// ═══════════════════════════════════════════
//  Builders
// ═══════════════════════════════════════════

QueryResponse Query::send() const {
    return client_->run(statements_);
}

std::pair<Transaction, std::vector<ResultTable>> TransactionBuilder::begin() const {
    return client_->begin(statements_);
}

} // namespace cypherpp

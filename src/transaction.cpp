// ═══════════════════════════════════════════════════════════════════
//  transaction.cpp — Transaction state machine
// ═══════════════════════════════════════════════════════════════════

#include "cypherpp/transaction.h"
#include "cypherpp/codec.h"
#include "cypherpp/console.h"
#include "cypherpp/url.h"

#include <algorithm>

namespace cypherpp {

namespace {

constexpr int kCreated = 201;
constexpr int kOk = 200;
constexpr int kNotFound = 404;

const std::string kCommitSuffix = "/commit";

std::string transactionUrlFromCommit(const std::string& commitUrl) {
    if (commitUrl.size() > kCommitSuffix.size() &&
        commitUrl.compare(commitUrl.size() - kCommitSuffix.size(), kCommitSuffix.size(),
                          kCommitSuffix) == 0) {
        return commitUrl.substr(0, commitUrl.size() - kCommitSuffix.size());
    }
    throw ProtocolError("Cannot derive transaction URL from commit URL '" + commitUrl + "'");
}

// Best effort: the caller sees the original error either way
void discard(Transport& transport, const std::string& transactionUrl, const std::string& reason) {
    console::warn("Rolling back unusable transaction", transactionUrl + ":", reason);
    auto http = transport.send(Method::Delete, transactionUrl, "");
    if (http.status != kOk && http.status != kNotFound) {
        console::warn("Rollback of", transactionUrl, "failed:", unexpectedResponse("roll back", http).what());
    }
}

} // namespace

Transaction::Transaction(std::shared_ptr<Transport> transport,
                         std::string transactionUrl,
                         std::string commitUrl,
                         TimePoint expires,
                         Clock clock)
    : transport_(std::move(transport)),
      id_(url::lastSegment(transactionUrl)),
      url_(std::move(transactionUrl)),
      commitUrl_(std::move(commitUrl)),
      expires_(expires),
      clock_(clock ? std::move(clock) : Clock(systemNow)) {}

std::pair<Transaction, std::vector<ResultTable>>
Transaction::begin(std::shared_ptr<Transport> transport,
                   const std::string& endpoint,
                   const std::vector<Statement>& statements,
                   Clock clock) {
    auto http = transport->send(Method::Post, endpoint, codec::encodeBody(statements));
    if (http.status != kCreated) {
        throw unexpectedResponse("begin transaction", http);
    }

    auto response = codec::decode(http.body, statements.size());
    if (!response.ok()) {
        throw EndpointError(std::move(response.errors));
    }

    // The server transaction exists from here on; roll it back if the reply is unusable
    auto transactionUrl = http.header("location");
    TimePoint expires = TimePoint::max();
    try {
        if (!response.commitUrl) {
            throw ProtocolError("Server did not return a commit URL for the new transaction");
        }
        if (transactionUrl.empty()) {
            transactionUrl = transactionUrlFromCommit(*response.commitUrl);
        }
        if (response.expires) {
            expires = codec::parseExpires(*response.expires);
        }
    } catch (const ProtocolError& e) {
        if (!transactionUrl.empty()) {
            discard(*transport, transactionUrl, e.what());
        }
        throw;
    }

    Transaction tx(std::move(transport), std::move(transactionUrl), *response.commitUrl,
                   expires, std::move(clock));
    console::debug("Transaction", tx.id(), "opened, expires",
                   response.expires.value_or("never"));

    return {std::move(tx), std::move(response.results)};
}

void Transaction::addStatement(Statement statement) {
    pending_.push_back(std::move(statement));
}

QueryResponse Transaction::exec() {
    return exec(std::vector<Statement>{});
}

QueryResponse Transaction::exec(Statement statement) {
    std::vector<Statement> batch;
    batch.push_back(std::move(statement));
    return exec(std::move(batch));
}

QueryResponse Transaction::exec(std::vector<Statement> statements) {
    ensureOpen("execute on", true);
    return run("execute on transaction", takePending(std::move(statements)));
}

void Transaction::resetTimeout() {
    ensureOpen("reset the timeout of", true);
    run("reset transaction timeout", {});
}

QueryResponse Transaction::commit(std::vector<Statement> statements) {
    ensureOpen("commit", true);
    auto batch = takePending(std::move(statements));

    auto http = transport_->send(Method::Post, commitUrl_, codec::encodeBody(batch));
    if (http.status == kNotFound) {
        expire("Transaction " + id_ + " no longer exists on the server (commit)");
    }
    if (http.status != kOk) {
        throw unexpectedResponse("commit transaction", http);
    }

    auto response = codec::decode(http.body, batch.size());
    if (reportsGone(response)) {
        expire("Transaction " + id_ + " no longer exists on the server (commit)");
    }

    state_ = TransactionState::Committed;
    console::debug("Transaction", id_, "committed with", response.errors.size(), "error(s)");
    return response;
}

void Transaction::rollback() {
    // No client-side expiry check: rolling back a transaction the server
    // already discarded is a success.
    ensureOpen("roll back", false);
    pending_.clear();

    auto http = transport_->send(Method::Delete, url_, "");
    if (http.status == kNotFound) {
        state_ = TransactionState::RolledBack;
        console::debug("Transaction", id_, "was already gone; marked rolled back");
        return;
    }
    if (http.status != kOk) {
        throw unexpectedResponse("roll back transaction", http);
    }

    auto response = codec::decode(http.body, 0);
    if (!response.ok() && !reportsGone(response)) {
        throw EndpointError(std::move(response.errors));
    }

    state_ = TransactionState::RolledBack;
    console::debug("Transaction", id_, "rolled back");
}

// ═══════════════════════════════════════════
//  Internals
// ═══════════════════════════════════════════

QueryResponse Transaction::run(const std::string& operation, std::vector<Statement> batch) {
    auto http = transport_->send(Method::Post, url_, codec::encodeBody(batch));
    if (http.status == kNotFound) {
        expire("Transaction " + id_ + " no longer exists on the server");
    }
    if (http.status != kOk) {
        throw unexpectedResponse(operation, http);
    }

    auto response = codec::decode(http.body, batch.size());
    if (reportsGone(response)) {
        expire("Transaction " + id_ + " no longer exists on the server");
    }

    refresh(response);
    if (!response.ok()) {
        console::debug("Transaction", id_, "batch returned", response.errors.size(), "error(s)");
    }
    return response;
}

void Transaction::ensureOpen(const std::string& operation, bool checkExpiry) {
    if (state_ != TransactionState::Open) {
        throw InvalidTransactionState(operation, state_);
    }
    if (checkExpiry && isExpired()) {
        expire("Transaction " + id_ + " expired at " + codec::formatExpires(expires_));
    }
}

std::vector<Statement> Transaction::takePending(std::vector<Statement> extra) {
    std::vector<Statement> batch = std::move(pending_);
    pending_.clear();
    batch.insert(batch.end(), std::make_move_iterator(extra.begin()),
                 std::make_move_iterator(extra.end()));
    return batch;
}

void Transaction::expire(const std::string& reason) {
    state_ = TransactionState::Expired;
    pending_.clear();
    console::warn(reason);
    throw ExpiredTransaction(reason);
}

void Transaction::refresh(const QueryResponse& response) {
    if (response.expires) {
        expires_ = codec::parseExpires(*response.expires);
    }
    if (response.commitUrl) {
        commitUrl_ = *response.commitUrl;
    }
}

bool Transaction::reportsGone(const QueryResponse& response) {
    return std::any_of(response.errors.begin(), response.errors.end(),
                       [](const ServerError& e) { return e.isTransactionGone(); });
}

} // namespace cypherpp

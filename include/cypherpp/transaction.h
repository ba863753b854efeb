#pragma once
// ═══════════════════════════════════════════════════════════════════
//  cypherpp/transaction.h — Explicit transactions
// ═══════════════════════════════════════════════════════════════════
//
//  Usage:
//    auto [tx, results] = graph.transaction()
//        .withStatement("CREATE (n:LANG {name: 'Rust'})")
//        .begin();
//    auto found = tx.exec(Statement("MATCH (n:LANG) WHERE n.safe = $safe RETURN n")
//                             .withParam("safe", true));
//    tx.commit();
//
//  State machine (client-side mirror of the server transaction):
//
//    Open ──commit──▶ Committed
//      │ ──rollback─▶ RolledBack
//      └ ──expiry───▶ Expired
//
//  Every terminal state is final: further calls throw
//  InvalidTransactionState without touching the network.
//
//  A Transaction is move-only and must not be used from several threads
//  at once; wrap it in LockedTransaction when it has to be shared.
// ═══════════════════════════════════════════════════════════════════

#include "error.h"
#include "result.h"
#include "statement.h"
#include "transport.h"

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace cypherpp {

using TimePoint = std::chrono::system_clock::time_point;
using Clock     = std::function<TimePoint()>;

inline TimePoint systemNow() { return std::chrono::system_clock::now(); }

class Transaction {
public:
    Transaction(std::shared_ptr<Transport> transport,
                std::string transactionUrl,
                std::string commitUrl,
                TimePoint expires,
                Clock clock = systemNow);

    // Non-copyable, movable
    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;
    Transaction(Transaction&&) noexcept = default;
    Transaction& operator=(Transaction&&) noexcept = default;

    // ── Open a transaction, executing the initial batch (may be empty) ──
    // POST {endpoint} → 201. Endpoint errors throw EndpointError and no
    // transaction is handed out.
    static std::pair<Transaction, std::vector<ResultTable>>
    begin(std::shared_ptr<Transport> transport,
          const std::string& endpoint,
          const std::vector<Statement>& statements = {},
          Clock clock = systemNow);

    // ── Queue a statement for the next exec() / commit() ──
    void addStatement(Statement statement);
    std::size_t pending() const { return pending_.size(); }

    // ── Run a batch inside the transaction (queued statements first) ──
    // Endpoint errors are returned in the response; the transaction stays Open.
    QueryResponse exec();
    QueryResponse exec(Statement statement);
    QueryResponse exec(std::vector<Statement> statements);

    // ── Commit, optionally running a final batch first ──
    QueryResponse commit(std::vector<Statement> statements = {});

    // ── Roll back; succeeds when the server already dropped the transaction ──
    void rollback();

    // ── Keep the transaction alive without running anything ──
    void resetTimeout();

    TransactionState state() const { return state_; }
    bool isOpen() const { return state_ == TransactionState::Open; }

    // Client-side clock check; does not change state
    bool isExpired() const { return clock_() >= expires_; }

    const std::string& id() const { return id_; }
    const std::string& url() const { return url_; }
    const std::string& commitUrl() const { return commitUrl_; }
    TimePoint expires() const { return expires_; }

private:
    QueryResponse run(const std::string& operation, std::vector<Statement> batch);
    void ensureOpen(const std::string& operation, bool checkExpiry);
    std::vector<Statement> takePending(std::vector<Statement> extra);
    [[noreturn]] void expire(const std::string& reason);
    void refresh(const QueryResponse& response);
    static bool reportsGone(const QueryResponse& response);

    std::shared_ptr<Transport> transport_;
    std::string id_;
    std::string url_;
    std::string commitUrl_;
    TimePoint expires_;
    TransactionState state_ = TransactionState::Open;
    Clock clock_;
    std::vector<Statement> pending_;
};

// ═══════════════════════════════════════════
//  LockedTransaction — one operation at a time
// ═══════════════════════════════════════════
class LockedTransaction {
public:
    explicit LockedTransaction(Transaction transaction) : tx_(std::move(transaction)) {}

    QueryResponse exec(std::vector<Statement> statements) {
        std::lock_guard<std::mutex> lock(mutex_);
        return tx_.exec(std::move(statements));
    }

    QueryResponse commit(std::vector<Statement> statements = {}) {
        std::lock_guard<std::mutex> lock(mutex_);
        return tx_.commit(std::move(statements));
    }

    void rollback() {
        std::lock_guard<std::mutex> lock(mutex_);
        tx_.rollback();
    }

    void resetTimeout() {
        std::lock_guard<std::mutex> lock(mutex_);
        tx_.resetTimeout();
    }

    TransactionState state() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return tx_.state();
    }

    // Run fn(Transaction&) under the lock
    template <typename Func>
    auto with(Func&& fn) -> decltype(fn(std::declval<Transaction&>())) {
        std::lock_guard<std::mutex> lock(mutex_);
        return fn(tx_);
    }

private:
    mutable std::mutex mutex_;
    Transaction tx_;
};

} // namespace cypherpp

#pragma once
// ═══════════════════════════════════════════════════════════════════
//  cypherpp/result.h — Result tables and typed row views
// ═══════════════════════════════════════════════════════════════════
//
//  Usage:
//    auto table = graph.exec("MATCH (n:LANG) RETURN n.name AS name, n.safe");
//    for (auto row : table.rows()) {
//        auto name = row.get<std::string>("name");
//        bool safe = row.get<bool>(1);
//    }
//
//  Cells stay opaque nlohmann::json values until they are extracted;
//  a shape mismatch surfaces as TypeCoercionError at that point only.
// ═══════════════════════════════════════════════════════════════════

#include "coerce.h"
#include "error.h"

#include <nlohmann/json.hpp>
#include <cstddef>
#include <iterator>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace cypherpp {

class ResultTable;

// ═══════════════════════════════════════════
//  Row — non-owning view over one result row
// ═══════════════════════════════════════════
class Row {
public:
    Row(const ResultTable& table, std::size_t index) : table_(&table), index_(index) {}

    // ── Raw cell access; unknown column / bad index throws TypeCoercionError ──
    const nlohmann::json& at(const std::string& column) const;
    const nlohmann::json& at(std::size_t column) const;

    template <typename T>
    T get(const std::string& column) const {
        try {
            return coerce<T>(at(column));
        } catch (const TypeCoercionError& e) {
            throw TypeCoercionError("Column '" + column + "': " + e.what());
        }
    }

    template <typename T>
    T get(std::size_t column) const {
        try {
            return coerce<T>(at(column));
        } catch (const TypeCoercionError& e) {
            throw TypeCoercionError("Column #" + std::to_string(column) + ": " + e.what());
        }
    }

    bool has(const std::string& column) const;
    std::size_t size() const;
    std::size_t index() const { return index_; }
    const std::vector<std::string>& columns() const;
    const std::vector<nlohmann::json>& cells() const;

    // {"column": value, ...}
    nlohmann::json toJson() const;

private:
    const ResultTable* table_;
    std::size_t index_;
};

// ═══════════════════════════════════════════
//  Rows — restartable range of Row views
// ═══════════════════════════════════════════
class Rows {
public:
    class iterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type        = Row;
        using difference_type   = std::ptrdiff_t;
        using pointer           = void;
        using reference         = Row;

        iterator() = default;
        iterator(const ResultTable* table, std::size_t index) : table_(table), index_(index) {}

        Row operator*() const { return Row(*table_, index_); }
        iterator& operator++() { ++index_; return *this; }
        iterator operator++(int) { auto copy = *this; ++index_; return copy; }

        bool operator==(const iterator& other) const {
            return table_ == other.table_ && index_ == other.index_;
        }
        bool operator!=(const iterator& other) const { return !(*this == other); }

    private:
        const ResultTable* table_ = nullptr;
        std::size_t index_ = 0;
    };

    explicit Rows(const ResultTable& table) : table_(&table) {}

    iterator begin() const { return iterator(table_, 0); }
    iterator end() const;
    std::size_t size() const;
    bool empty() const { return size() == 0; }

private:
    const ResultTable* table_;
};

// ═══════════════════════════════════════════
//  ResultTable — columns + rows of one statement
// ═══════════════════════════════════════════
class ResultTable {
public:
    using Cells = std::vector<nlohmann::json>;

    ResultTable() = default;
    ResultTable(std::vector<std::string> columns, std::vector<Cells> data);

    const std::vector<std::string>& columns() const { return columns_; }
    const std::vector<Cells>& data() const { return data_; }

    std::size_t size() const { return data_.size(); }
    bool empty() const { return data_.empty(); }

    // Views borrow the table; not available on temporaries
    Rows rows() const& { return Rows(*this); }
    Rows rows() const&& = delete;

    // Throws std::out_of_range past the last row
    Row row(std::size_t index) const&;
    Row row(std::size_t index) const&& = delete;
    Row first() const& { return row(0); }
    Row first() const&& = delete;

    std::optional<std::size_t> columnIndex(const std::string& column) const;

    // [{"column": value, ...}, ...]
    nlohmann::json toJson() const;

private:
    std::vector<std::string> columns_;
    std::vector<Cells> data_;
    std::unordered_map<std::string, std::size_t> index_;
};

// ═══════════════════════════════════════════
//  QueryResponse — decoded reply of one request
// ═══════════════════════════════════════════
struct QueryResponse {
    std::vector<ResultTable> results;    // one per submitted statement, in order
    std::vector<ServerError> errors;
    std::optional<std::string> commitUrl;
    std::optional<std::string> expires;  // RFC 1123, as sent by the server

    bool ok() const { return errors.empty(); }
    std::size_t size() const { return results.size(); }

    const ResultTable& operator[](std::size_t i) const { return results.at(i); }

    void throwIfErrors() const {
        if (!errors.empty()) throw EndpointError(errors);
    }
};

} // namespace cypherpp

// ═══════════════════════════════════════════════════════════════════
//  result.cpp — ResultTable / Row implementation
// ═══════════════════════════════════════════════════════════════════

#include "cypherpp/result.h"

#include <stdexcept>

namespace cypherpp {

// ═══════════════════════════════════════════
//  ResultTable
// ═══════════════════════════════════════════

ResultTable::ResultTable(std::vector<std::string> columns, std::vector<Cells> data)
    : columns_(std::move(columns)), data_(std::move(data)) {
    index_.reserve(columns_.size());
    for (std::size_t i = 0; i < columns_.size(); ++i) {
        // Duplicate names resolve to the first occurrence
        index_.emplace(columns_[i], i);
    }
}

Row ResultTable::row(std::size_t index) const& {
    if (index >= data_.size()) {
        throw std::out_of_range("Row " + std::to_string(index) + " out of range (" +
                                std::to_string(data_.size()) + " rows)");
    }
    return Row(*this, index);
}

std::optional<std::size_t> ResultTable::columnIndex(const std::string& column) const {
    auto it = index_.find(column);
    if (it == index_.end()) return std::nullopt;
    return it->second;
}

nlohmann::json ResultTable::toJson() const {
    nlohmann::json arr = nlohmann::json::array();
    for (auto row : rows()) {
        arr.push_back(row.toJson());
    }
    return arr;
}

// ═══════════════════════════════════════════
//  Rows
// ═══════════════════════════════════════════

Rows::iterator Rows::end() const { return iterator(table_, table_->size()); }

std::size_t Rows::size() const { return table_->size(); }

// ═══════════════════════════════════════════
//  Row
// ═══════════════════════════════════════════

const std::vector<std::string>& Row::columns() const { return table_->columns(); }

const std::vector<nlohmann::json>& Row::cells() const { return table_->data()[index_]; }

std::size_t Row::size() const { return cells().size(); }

bool Row::has(const std::string& column) const {
    auto idx = table_->columnIndex(column);
    return idx && *idx < size();
}

const nlohmann::json& Row::at(std::size_t column) const {
    auto& row = cells();
    if (column >= row.size()) {
        throw TypeCoercionError("Column index " + std::to_string(column) +
                                " out of range (" + std::to_string(row.size()) + " columns)");
    }
    return row[column];
}

const nlohmann::json& Row::at(const std::string& column) const {
    auto idx = table_->columnIndex(column);
    if (!idx) {
        throw TypeCoercionError("No such column '" + column + "'");
    }
    return at(*idx);
}

nlohmann::json Row::toJson() const {
    nlohmann::json obj = nlohmann::json::object();
    auto& names = columns();
    auto& row = cells();
    for (std::size_t i = 0; i < names.size() && i < row.size(); ++i) {
        obj[names[i]] = row[i];
    }
    return obj;
}

} // namespace cypherpp

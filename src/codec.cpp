// ═══════════════════════════════════════════════════════════════════
//  codec.cpp — Statement batch encoding, response decoding
// ═══════════════════════════════════════════════════════════════════

#include "cypherpp/codec.h"
#include "cypherpp/error.h"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <locale>
#include <sstream>

namespace cypherpp::codec {

nlohmann::json encode(const std::vector<Statement>& statements) {
    nlohmann::json list = nlohmann::json::array();
    for (auto& s : statements) {
        list.push_back(s.toJson());
    }
    return {{"statements", std::move(list)}};
}

namespace {

ResultTable decodeTable(const nlohmann::json& entry) {
    std::vector<std::string> columns;
    std::vector<ResultTable::Cells> data;

    if (!entry.is_object()) return ResultTable();

    auto cols = entry.find("columns");
    if (cols != entry.end() && cols->is_array()) {
        columns.reserve(cols->size());
        for (auto& c : *cols) {
            columns.push_back(c.is_string() ? c.get<std::string>() : c.dump());
        }
    }

    auto rows = entry.find("data");
    if (rows != entry.end() && rows->is_array()) {
        data.reserve(rows->size());
        for (auto& item : *rows) {
            ResultTable::Cells cells;
            if (item.is_object()) {
                auto row = item.find("row");
                if (row != item.end() && row->is_array()) {
                    cells.assign(row->begin(), row->end());
                }
            }
            data.push_back(std::move(cells));
        }
    }

    return ResultTable(std::move(columns), std::move(data));
}

} // namespace

QueryResponse decode(const nlohmann::json& document, std::size_t statementCount) {
    QueryResponse response;

    if (document.is_object()) {
        auto results = document.find("results");
        if (results != document.end() && results->is_array()) {
            response.results.reserve(std::max(results->size(), statementCount));
            for (auto& entry : *results) {
                response.results.push_back(decodeTable(entry));
            }
        }

        auto errors = document.find("errors");
        if (errors != document.end() && errors->is_array()) {
            for (auto& e : *errors) {
                response.errors.push_back(e.get<ServerError>());
            }
        }

        auto commit = document.find("commit");
        if (commit != document.end() && commit->is_string()) {
            response.commitUrl = commit->get<std::string>();
        }

        auto tx = document.find("transaction");
        if (tx != document.end() && tx->is_object()) {
            auto expires = tx->find("expires");
            if (expires != tx->end() && expires->is_string()) {
                response.expires = expires->get<std::string>();
            }
        }
    }

    while (response.results.size() < statementCount) {
        response.results.emplace_back();
    }
    return response;
}

QueryResponse decode(const std::string& body, std::size_t statementCount) {
    if (body.empty()) {
        return decode(nlohmann::json::object(), statementCount);
    }
    auto document = nlohmann::json::parse(body, nullptr, false);
    if (document.is_discarded()) {
        throw ProtocolError("Response body is not valid JSON: " + body.substr(0, 200));
    }
    return decode(document, statementCount);
}

// ═══════════════════════════════════════════
//  RFC 1123 timestamps
// ═══════════════════════════════════════════

std::chrono::system_clock::time_point parseExpires(const std::string& text) {
    std::istringstream in(text);
    in.imbue(std::locale::classic());

    std::tm tm{};
    in >> std::get_time(&tm, "%a, %d %b %Y %H:%M:%S");
    if (in.fail()) {
        throw ProtocolError("Malformed transaction expiry: '" + text + "'");
    }

    std::string zone;
    in >> zone;

    long offsetSeconds = 0;
    if (zone.empty() || zone == "GMT" || zone == "UTC" || zone == "Z") {
        offsetSeconds = 0;
    } else if (zone.size() == 5 && (zone[0] == '+' || zone[0] == '-') &&
               std::isdigit(static_cast<unsigned char>(zone[1])) &&
               std::isdigit(static_cast<unsigned char>(zone[2])) &&
               std::isdigit(static_cast<unsigned char>(zone[3])) &&
               std::isdigit(static_cast<unsigned char>(zone[4]))) {
        int hours = std::stoi(zone.substr(1, 2));
        int minutes = std::stoi(zone.substr(3, 2));
        offsetSeconds = (hours * 3600L + minutes * 60L) * (zone[0] == '-' ? -1 : 1);
    } else {
        throw ProtocolError("Unsupported time zone in transaction expiry: '" + text + "'");
    }

    std::time_t utc = timegm(&tm) - offsetSeconds;
    return std::chrono::system_clock::from_time_t(utc);
}

std::string formatExpires(std::chrono::system_clock::time_point when) {
    std::time_t t = std::chrono::system_clock::to_time_t(when);
    std::tm tm{};
    gmtime_r(&t, &tm);

    std::ostringstream out;
    out.imbue(std::locale::classic());
    out << std::put_time(&tm, "%a, %d %b %Y %H:%M:%S") << " +0000";
    return out.str();
}

} // namespace cypherpp::codec

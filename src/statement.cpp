// ═══════════════════════════════════════════════════════════════════
//  statement.cpp — Statement wire form
// ═══════════════════════════════════════════════════════════════════

#include "cypherpp/statement.h"

namespace cypherpp {

nlohmann::json Statement::toJson() const {
    nlohmann::json parameters = nlohmann::json::object();
    for (auto& [name, value] : params_) {
        parameters[name] = value.toJson();
    }
    return {{"statement", text_}, {"parameters", std::move(parameters)}};
}

} // namespace cypherpp

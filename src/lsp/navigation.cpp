#include "lsp/navigation.hpp"

#include <nlohmann/json.hpp>

#include "lsp/json_utils.hpp"

namespace lsp {

// Goto Definition Request
void to_json(nlohmann::json& j, const DefinitionParams& p) {
  to_json_required(j, "textDocument", p.textDocument);
  to_json_required(j, "position", p.position);
  to_json_optional(j, "workDoneToken", p.workDoneToken);
  to_json_optional(j, "partialResultToken", p.partialResultToken);
}

void from_json(const nlohmann::json& j, DefinitionParams& p) {
  from_json_required(j, "textDocument", p.textDocument);
  from_json_required(j, "position", p.position);
  from_json_optional(j, "workDoneToken", p.workDoneToken);
  from_json_optional(j, "partialResultToken", p.partialResultToken);
}

// Goto Type Definition Request
void to_json(nlohmann::json& j, const TypeDefinitionParams& p) {
  to_json_required(j, "textDocument", p.textDocument);
  to_json_required(j, "position", p.position);
  to_json_optional(j, "workDoneToken", p.workDoneToken);
  to_json_optional(j, "partialResultToken", p.partialResultToken);
}

void from_json(const nlohmann::json& j, TypeDefinitionParams& p) {
  from_json_required(j, "textDocument", p.textDocument);
  from_json_required(j, "position", p.position);
  from_json_optional(j, "workDoneToken", p.workDoneToken);
  from_json_optional(j, "partialResultToken", p.partialResultToken);
}

// Extension: textDocument/xdefinition
void to_json(nlohmann::json& j, const SymbolDescriptor& d) {
  to_json_required(j, "vendor", d.vendor);
  to_json_required(j, "package", d.package);
  to_json_required(j, "packageName", d.packageName);
  to_json_required(j, "recv", d.recv);
  to_json_required(j, "name", d.name);
  to_json_required(j, "id", d.id);
}

void from_json(const nlohmann::json& j, SymbolDescriptor& d) {
  from_json_required(j, "vendor", d.vendor);
  from_json_required(j, "package", d.package);
  from_json_required(j, "packageName", d.packageName);
  from_json_required(j, "recv", d.recv);
  from_json_required(j, "name", d.name);
  from_json_required(j, "id", d.id);
}

void to_json(nlohmann::json& j, const SymbolLocationInformation& s) {
  to_json_required(j, "location", s.location);
  to_json_optional(j, "typeLocation", s.typeLocation);
  to_json_optional(j, "symbol", s.symbol);
}

void from_json(const nlohmann::json& j, SymbolLocationInformation& s) {
  from_json_required(j, "location", s.location);
  from_json_optional(j, "typeLocation", s.typeLocation);
  from_json_optional(j, "symbol", s.symbol);
}

}  // namespace lsp

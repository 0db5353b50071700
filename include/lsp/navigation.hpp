#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "lsp/basic.hpp"

namespace lsp {

// Goto Definition Request
struct DefinitionParams : TextDocumentPositionParams,
                          WorkDoneProgressParams,
                          PartialResultParams {};

void to_json(nlohmann::json& j, const DefinitionParams& p);
void from_json(const nlohmann::json& j, DefinitionParams& p);

using DefinitionResult = std::vector<Location>;

// Goto Type Definition Request
struct TypeDefinitionParams : TextDocumentPositionParams,
                              WorkDoneProgressParams,
                              PartialResultParams {};

void to_json(nlohmann::json& j, const TypeDefinitionParams& p);
void from_json(const nlohmann::json& j, TypeDefinitionParams& p);

using TypeDefinitionResult = std::vector<Location>;

// Extension: textDocument/xdefinition
//
// Cross-reference identity of a declaration. Fields mirror the
// SymbolDescriptor of the LSP cross-reference extension.
struct SymbolDescriptor {
  bool vendor = false;
  std::string package;
  std::string packageName;
  std::string recv;
  std::string name;
  std::string id;
};

void to_json(nlohmann::json& j, const SymbolDescriptor& d);
void from_json(const nlohmann::json& j, SymbolDescriptor& d);

struct SymbolLocationInformation {
  Location location;
  std::optional<Location> typeLocation;
  std::optional<SymbolDescriptor> symbol;
};

void to_json(nlohmann::json& j, const SymbolLocationInformation& s);
void from_json(const nlohmann::json& j, SymbolLocationInformation& s);

using XDefinitionParams = TextDocumentPositionParams;
using XDefinitionResult = std::vector<SymbolLocationInformation>;

}  // namespace lsp

#include "defnav/analysis/slang_type_checker.hpp"

#include <algorithm>
#include <fstream>
#include <optional>
#include <sstream>
#include <unordered_map>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <slang/ast/Compilation.h>
#include <slang/ast/symbols/CompilationUnitSymbols.h>
#include <slang/ast/symbols/InstanceSymbols.h>
#include <slang/syntax/SyntaxTree.h>
#include <slang/text/SourceManager.h>

#include "defnav/analysis/index_visitor.hpp"
#include "defnav/analysis/syntax_converter.hpp"
#include "defnav/utils/path_utils.hpp"
#include "defnav/utils/scoped_timer.hpp"

namespace defnav::analysis {

namespace {

struct SourceDocument {
  std::string uri;
  std::string content;
};

auto IsOnToken(const std::vector<TokenSpan>& spans, Pos pos) -> bool {
  auto it = std::ranges::upper_bound(
      spans, pos, std::ranges::less{},
      [](const TokenSpan& span) { return span.first; });
  if (it == spans.begin()) {
    return false;
  }
  --it;
  return pos >= it->first && pos < it->second;
}

void RegisterPackages(
    slang::ast::Compilation& compilation, const LocationMapper& mapper,
    const Package& package, const std::vector<SourceDocument>& sources,
    navigation::PackageCache& cache) {
  std::unordered_map<std::string, std::vector<navigation::PackageInfo>> found;
  // Documents without packages still clear their stale entries
  for (const auto& source : sources) {
    found[source.uri];
  }

  auto add = [&](const slang::ast::Symbol& symbol, ObjectKind kind) {
    const auto* file = package.Sources().FileFor(mapper.ToPos(symbol.location));
    if (file == nullptr) {
      return;
    }
    found[file->Uri()].push_back(
        navigation::PackageInfo{
            .name = std::string(symbol.name),
            .kind = kind,
            .uri = file->Uri(),
        });
  };

  for (const auto* pkg : compilation.getPackages()) {
    add(*pkg, ObjectKind::kPackage);
  }
  for (const auto* def : compilation.getDefinitions()) {
    if (def->kind == slang::ast::SymbolKind::Definition) {
      add(*def, ObjectKind::kModule);
    }
  }

  for (auto& [uri, packages] : found) {
    cache.UpdateDocument(uri, std::move(packages));
  }
}

}  // namespace

SlangTypeChecker::SlangTypeChecker(
    std::shared_ptr<const services::DocumentStore> documents,
    std::shared_ptr<navigation::PackageCache> package_cache,
    AnalysisOptions options, std::shared_ptr<spdlog::logger> logger)
    : documents_(std::move(documents)),
      package_cache_(std::move(package_cache)),
      options_(std::move(options)),
      logger_(logger ? std::move(logger) : spdlog::default_logger()) {
}

auto SlangTypeChecker::ReadDocument(const std::string& uri) const
    -> std::expected<std::string, NavError> {
  if (auto state = documents_->Get(uri)) {
    return std::move(state->content);
  }

  auto path = UriToPath(uri);
  std::ifstream file(path);
  if (!file) {
    return NavError::Unexpected(
        NavErrorCode::kDocumentNotFound,
        fmt::format("document is neither open nor readable: {}", uri));
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  return buffer.str();
}

auto SlangTypeChecker::TypeCheck(
    const RequestContext& ctx, const lsp::TextDocumentPositionParams& params)
    -> std::expected<TypeCheckResult, NavError> {
  if (ctx.IsCancelled()) {
    return NavError::Unexpected(NavErrorCode::kCancelled);
  }

  const auto& uri = params.textDocument.uri;
  auto content = ReadDocument(uri);
  if (!content) {
    return std::unexpected(content.error());
  }

  utils::ScopedTimer timer(fmt::format("Type check {}", uri), logger_);

  // Requested document first, then everything else that is open
  std::vector<SourceDocument> sources;
  sources.push_back(SourceDocument{.uri = uri, .content = std::move(*content)});
  for (const auto& open_uri : documents_->GetAllUris()) {
    if (open_uri == uri) {
      continue;
    }
    if (auto state = documents_->Get(open_uri)) {
      sources.push_back(SourceDocument{
          .uri = open_uri, .content = std::move(state->content)});
    }
  }

  auto package = std::make_shared<Package>(uri);
  std::vector<TokenSpan> token_spans;

  try {
    slang::SourceManager source_manager;
    LocationMapper mapper(source_manager);
    auto options = CreateCompilationOptions(options_);
    slang::ast::Compilation compilation(options);

    for (const auto& source : sources) {
      auto& root = package->AddFile(source.uri, source.content);
      auto buffer = source_manager.assignText(
          UriToPath(source.uri).string(), source.content);
      mapper.RegisterBuffer(buffer.id, root.Start());

      auto tree = slang::syntax::SyntaxTree::fromBuffer(
          buffer, source_manager, options);
      SyntaxConverter converter(mapper);
      converter.Convert(tree->root(), root);
      if (source.uri == uri) {
        token_spans = converter.TakeTokenSpans();
      }
      compilation.addSyntaxTree(tree);
    }

    if (ctx.IsCancelled()) {
      return NavError::Unexpected(NavErrorCode::kCancelled);
    }

    IndexVisitor visitor(*package, mapper);
    {
      utils::ScopedTimer elab_timer("Elaboration and indexing", logger_);
      compilation.getRoot().visit(visitor);
    }
    RegisterPackages(compilation, mapper, *package, sources, *package_cache_);

    logger_->debug(
        "SlangTypeChecker indexed {} files: {} uses, {} defs, {} cached "
        "packages",
        sources.size(), package->Info().uses.size(),
        package->Info().defs.size(), package_cache_->Size());
  } catch (const std::exception& e) {
    return NavError::Unexpected(
        NavErrorCode::kTypeCheckFailed,
        fmt::format("failed to analyze {}: {}", uri, e.what()));
  }

  if (ctx.IsCancelled()) {
    return NavError::Unexpected(NavErrorCode::kCancelled);
  }

  const auto* file = package->Sources().FileFor(uri);
  std::optional<uint32_t> offset;
  if (file != nullptr) {
    offset = file->OffsetAt(params.position);
  }
  if (!offset) {
    return NavError::Unexpected(
        NavErrorCode::kInvalidParams,
        fmt::format(
            "position {}:{} is out of range for {}", params.position.line,
            params.position.character, uri));
  }

  auto pos = file->PosAt(*offset);
  if (!IsOnToken(token_spans, pos)) {
    return NavError::Unexpected(
        NavErrorCode::kInvalidNode,
        fmt::format(
            "position {}:{} is not on a token", params.position.line,
            params.position.character));
  }

  return TypeCheckResult{.package = std::move(package), .pos = pos};
}

}  // namespace defnav::analysis

#pragma once

#include <expected>
#include <memory>

#include "defnav/analysis/package.hpp"
#include "defnav/core/request_context.hpp"
#include "defnav/error/error.hpp"
#include "lsp/basic.hpp"

namespace defnav::analysis {

struct TypeCheckResult {
  std::shared_ptr<const Package> package;

  // Requested position translated into the package's source map
  Pos pos = kNoPos;
};

// Analysis backend seam: parses and type-checks the document named by the
// request and locates the cursor in the result.
class TypeChecker {
 public:
  TypeChecker() = default;
  TypeChecker(const TypeChecker&) = delete;
  TypeChecker(TypeChecker&&) = delete;
  auto operator=(const TypeChecker&) -> TypeChecker& = delete;
  auto operator=(TypeChecker&&) -> TypeChecker& = delete;
  virtual ~TypeChecker() = default;

  // Fails with kInvalidNode when the position does not land on a token the
  // resolution pipeline can use (comments, whitespace). Other failures are
  // hard errors for the caller.
  virtual auto TypeCheck(
      const RequestContext& ctx, const lsp::TextDocumentPositionParams& params)
      -> std::expected<TypeCheckResult, NavError> = 0;
};

}  // namespace defnav::analysis

#pragma once

#include <expected>
#include <string>
#include <utility>

namespace defnav {

/**
 * @brief Error codes produced by the definition resolution pipeline
 */
enum class NavErrorCode {
  // Request targets something outside the addressable workspace
  kInvalidParams,

  // Cursor is not on an identifier or type declaration
  kInvalidNode,

  // Identifier could not be matched in the use/definition indexes
  kNotFound,

  // Analysis backend failures
  kTypeCheckFailed,
  kDocumentNotFound,

  // Request was cancelled by a newer document state
  kCancelled,

  kInternalError,
};

/**
 * @brief Error value carried through std::expected in the core
 */
class NavError {
 public:
  explicit NavError(NavErrorCode code)
      : code_(code), message_(GetDefaultMessage(code)) {
  }

  NavError(NavErrorCode code, std::string message)
      : code_(code), message_(std::move(message)) {
  }

  [[nodiscard]] auto Code() const -> NavErrorCode {
    return code_;
  }

  [[nodiscard]] auto Message() const -> const std::string& {
    return message_;
  }

  [[nodiscard]] auto Is(NavErrorCode code) const -> bool {
    return code_ == code;
  }

  static auto GetDefaultMessage(NavErrorCode code) -> std::string {
    switch (code) {
      case NavErrorCode::kInvalidParams:
        return "Invalid params";
      case NavErrorCode::kInvalidNode:
        return "Invalid node";
      case NavErrorCode::kNotFound:
        return "definition not found";
      case NavErrorCode::kTypeCheckFailed:
        return "Type check failed";
      case NavErrorCode::kDocumentNotFound:
        return "Document not found";
      case NavErrorCode::kCancelled:
        return "Request cancelled";
      case NavErrorCode::kInternalError:
        return "Internal error";
    }
    return "Unknown error";
  }

  // Factory method for creating an error, details replace the default message
  static auto Make(NavErrorCode code, const std::string& details = "")
      -> NavError {
    if (details.empty()) {
      return NavError(code);
    }
    return NavError(code, details);
  }

  static auto Unexpected(NavErrorCode code, const std::string& details = "")
      -> std::unexpected<NavError> {
    return std::unexpected<NavError>(Make(code, details));
  }

 private:
  NavErrorCode code_;
  std::string message_;
};

}  // namespace defnav

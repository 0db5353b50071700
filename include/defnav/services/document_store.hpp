#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace defnav::services {

// Content of an open document as last reported by the client
struct DocumentState {
  std::string content;
  int version = 0;
};

// Open documents, shared between the protocol handlers that update them and
// the analysis threads that read them. Thread-safe with a mutex.
class DocumentStore {
 public:
  DocumentStore() = default;

  auto Update(const std::string& uri, std::string content, int version)
      -> void;

  auto Remove(const std::string& uri) -> void;

  auto Get(const std::string& uri) const -> std::optional<DocumentState>;

  auto Contains(const std::string& uri) const -> bool;

  auto GetAllUris() const -> std::vector<std::string>;

 private:
  mutable std::mutex mutex_;
  std::unordered_map<std::string, DocumentState> documents_;
};

}  // namespace defnav::services

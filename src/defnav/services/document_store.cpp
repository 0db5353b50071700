#include "defnav/services/document_store.hpp"

#include <algorithm>
#include <utility>

namespace defnav::services {

auto DocumentStore::Update(
    const std::string& uri, std::string content, int version) -> void {
  std::lock_guard<std::mutex> lock(mutex_);
  documents_[uri] = DocumentState{
      .content = std::move(content),
      .version = version,
  };
}

auto DocumentStore::Remove(const std::string& uri) -> void {
  std::lock_guard<std::mutex> lock(mutex_);
  documents_.erase(uri);
}

auto DocumentStore::Get(const std::string& uri) const
    -> std::optional<DocumentState> {
  std::lock_guard<std::mutex> lock(mutex_);
  if (auto it = documents_.find(uri); it != documents_.end()) {
    return it->second;
  }
  return std::nullopt;
}

auto DocumentStore::Contains(const std::string& uri) const -> bool {
  std::lock_guard<std::mutex> lock(mutex_);
  return documents_.contains(uri);
}

auto DocumentStore::GetAllUris() const -> std::vector<std::string> {
  std::vector<std::string> uris;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    uris.reserve(documents_.size());
    for (const auto& [uri, _] : documents_) {
      uris.push_back(uri);
    }
  }
  // Stable order keeps package positions reproducible between requests
  std::ranges::sort(uris);
  return uris;
}

}  // namespace defnav::services

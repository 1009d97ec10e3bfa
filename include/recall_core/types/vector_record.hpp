#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace recall_core {

using Metadata = std::map<std::string, std::string>;

enum class RecordKind { ConversationTurn, DocumentFragment };

enum class Visibility { Private, Shared };

inline std::string to_string(Visibility visibility) {
  switch (visibility) {
    case Visibility::Private:
      return "private";
    case Visibility::Shared:
      return "shared";
    default:
      return "unknown";
  }
}

inline Visibility visibility_from_string(const std::string &str) {
  if (str == "private")
    return Visibility::Private;
  if (str == "shared")
    return Visibility::Shared;
  throw std::invalid_argument("Unknown Visibility: " + str);
}

// Fields shared by every record kind. id, created_at and sequence are
// assigned by the store on insert when left empty.
struct VectorRecord {
  std::string id;
  std::string owner;
  std::vector<float> embedding;
  std::chrono::system_clock::time_point created_at{};
  std::int64_t sequence = 0;
};

struct ConversationTurn : public VectorRecord {
  std::string text;
};

struct DocumentFragment : public VectorRecord {
  std::string source;
  Visibility visibility = Visibility::Private;
  std::string text;
  Metadata metadata;
};

}  // namespace recall_core

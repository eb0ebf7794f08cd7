// Copyright (c) 2025 <Your Name>
#include "ddnsclient/result_classifier.hpp"

namespace ddnsclient {

const char* OutcomeKindName(Outcome::Kind kind) {
  switch (kind) {
    case Outcome::Kind::Unchanged:
      return "unchanged";
    case Outcome::Kind::Updated:
      return "updated";
    case Outcome::Kind::Failed:
      return "failed";
  }
  return "unknown";
}

std::ostream& operator<<(std::ostream& os, const Outcome& o) {
  os << OutcomeKindName(o.kind);
  if (o.IsFailed()) os << "(" << o.detail << ")";
  return os;
}

Outcome Classify(int status, const std::string& body) {
  if (status >= 300) {
    return Outcome::MakeFailed("http status " + std::to_string(status));
  }
  if (body.find("good") != std::string::npos) return Outcome::MakeUpdated();
  if (body.find("nochg") != std::string::npos) return Outcome::MakeUnchanged();
  return Outcome::MakeFailed(body);
}

}  // namespace ddnsclient

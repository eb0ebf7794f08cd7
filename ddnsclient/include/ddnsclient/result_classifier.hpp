// Copyright (c) 2025 <Your Name>
/**
 * @file result_classifier.hpp
 * @brief Maps a provider response to a semantic outcome.
 */
#pragma once

#include <ostream>
#include <string>
#include <utility>

namespace ddnsclient {

/** Outcome of one host update. */
struct Outcome {
  enum class Kind { Unchanged, Updated, Failed };

  Kind kind = Kind::Failed;
  std::string detail;  ///< Failure reason; empty unless kind == Failed

  static Outcome MakeUnchanged() { return Outcome{Kind::Unchanged, {}}; }
  static Outcome MakeUpdated() { return Outcome{Kind::Updated, {}}; }
  static Outcome MakeFailed(std::string d) {
    return Outcome{Kind::Failed, std::move(d)};
  }

  bool IsFailed() const { return kind == Kind::Failed; }

  bool operator==(const Outcome& o) const {
    return kind == o.kind && detail == o.detail;
  }
  bool operator!=(const Outcome& o) const { return !(*this == o); }

  friend std::ostream& operator<<(std::ostream& os, const Outcome& o);
};

/** "unchanged", "updated" or "failed". */
const char* OutcomeKindName(Outcome::Kind kind);

/**
 * @brief Classify a provider response. Pure, no I/O.
 *
 * - status >= 300: Failed("http status <status>"), body ignored.
 * - body contains "good": Updated.
 * - body contains "nochg": Unchanged.
 * - otherwise: Failed(<raw body>), e.g. "badauth", "nohost", "911".
 *
 * Matching is case-sensitive and "good" is checked first.
 */
Outcome Classify(int status, const std::string& body);

}  // namespace ddnsclient

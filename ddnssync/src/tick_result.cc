// Copyright (c) 2025 <Your Name>
#include "ddnssync/tick_result.hpp"

namespace ddnssync {
int TickResult::FailureCount() const {
  int n = 0;
  for (const auto& h : hosts) {
    if (h.outcome.IsFailed()) ++n;
  }
  return n;
}

std::ostream& operator<<(std::ostream& os, const TickResult& t) {
  os << "ip=" << (t.ip.empty() ? "-" : t.ip) << ", hosts=[";
  for (size_t i = 0; i < t.hosts.size(); ++i) {
    if (i) os << ", ";
    os << t.hosts[i].host.hostname << ":" << t.hosts[i].outcome;
  }
  os << "], err=" << t.error;
  return os;
}

}  // namespace ddnssync

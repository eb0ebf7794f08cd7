// Copyright (c) 2025 <Your Name>
/**
 * @file
 * @brief JSON configuration loading and validation (jsoncpp).
 */
#include "ddnssync/config.hpp"

#include <json/json.h>

#include <cctype>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <memory>
#include <sstream>
#include <string>
#include <utility>

namespace ddnssync {

namespace {
// Milliseconds per unit; longest suffix first so "ms" wins over "m".
struct Unit {
  const char* suffix;
  double ms;
};
constexpr Unit kUnits[] = {
    {"ms", 1.0}, {"h", 3600000.0}, {"m", 60000.0}, {"s", 1000.0}};

Error ConfigError(const std::string& msg) {
  return Error(ErrorCode::Config, msg);
}

// True when `ms` converts to an interval no longer than kMaxInterval.
bool WithinMaxInterval(double ms) {
  const double max_ms = static_cast<double>(
      std::chrono::duration_cast<std::chrono::milliseconds>(kMaxInterval)
          .count());
  return std::isfinite(ms) && std::fabs(ms) <= max_ms;
}

bool ReadString(const Json::Value& obj, const char* key, std::string* out) {
  if (!obj.isMember(key) || !obj[key].isString()) return false;
  *out = obj[key].asString();
  return true;
}
}  // namespace

bool ParseDuration(const std::string& text, std::chrono::milliseconds* out,
                   std::string* err) {
  if (text.empty()) {
    if (err) *err = "empty duration";
    return false;
  }
  double total_ms = 0.0;
  size_t pos = 0;
  while (pos < text.size()) {
    const size_t num_begin = pos;
    while (pos < text.size() &&
           (std::isdigit(static_cast<unsigned char>(text[pos])) ||
            text[pos] == '.')) {
      ++pos;
    }
    if (pos == num_begin) {
      if (err) *err = "invalid duration '" + text + "': expected a number";
      return false;
    }
    const std::string number = text.substr(num_begin, pos - num_begin);
    char* end = nullptr;
    const double value = std::strtod(number.c_str(), &end);
    if (end == nullptr || *end != '\0') {
      if (err) *err = "invalid duration '" + text + "': bad number";
      return false;
    }
    const Unit* unit = nullptr;
    for (const auto& u : kUnits) {
      if (text.compare(pos, std::char_traits<char>::length(u.suffix),
                       u.suffix) == 0) {
        unit = &u;
        break;
      }
    }
    if (!unit) {
      if (err) *err = "invalid duration '" + text + "': missing unit";
      return false;
    }
    pos += std::char_traits<char>::length(unit->suffix);
    total_ms += value * unit->ms;
    if (!WithinMaxInterval(total_ms)) {
      if (err) *err = "invalid duration '" + text + "': too large";
      return false;
    }
  }
  *out =
      std::chrono::milliseconds(static_cast<int64_t>(std::llround(total_ms)));
  return true;
}

bool ValidateConfig(const Config& config, Error* err) {
  if (config.interval.count() <= 0) {
    if (err) *err = ConfigError("interval must be greater than zero");
    return false;
  }
  if (config.interval > kMaxInterval) {
    if (err) *err = ConfigError("interval must not exceed 8760h");
    return false;
  }
  if (config.hosts.empty()) {
    if (err) *err = ConfigError("no hosts configured");
    return false;
  }
  for (size_t i = 0; i < config.hosts.size(); ++i) {
    const Host& h = config.hosts[i];
    const char* missing = nullptr;
    if (h.hostname.empty()) {
      missing = "host";
    } else if (h.user.empty()) {
      missing = "user";
    } else if (h.password.empty()) {
      missing = "password";
    }
    if (missing) {
      if (err) {
        std::ostringstream oss;
        oss << "hosts[" << i << "]: missing " << missing;
        *err = ConfigError(oss.str());
      }
      return false;
    }
  }
  return true;
}

bool ParseConfig(const std::string& text, Config* out, Error* err) {
  Json::CharReaderBuilder builder;
  std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
  Json::Value root;
  std::string perr;
  if (!reader->parse(text.data(), text.data() + text.size(), &root, &perr)) {
    if (err) *err = ddnsclient::Wrap(ErrorCode::Config,
                                     "failed to read config file", perr);
    return false;
  }
  if (!root.isObject()) {
    if (err) *err = ConfigError("config must be a JSON object");
    return false;
  }

  Config cfg;
  const Json::Value& interval = root["interval"];
  if (interval.isNumeric()) {
    const double ms = interval.asDouble() * 1000.0;
    if (!WithinMaxInterval(ms)) {
      if (err) *err = ConfigError("interval must not exceed 8760h");
      return false;
    }
    cfg.interval =
        std::chrono::milliseconds(static_cast<int64_t>(std::llround(ms)));
  } else if (interval.isString()) {
    std::string derr;
    if (!ParseDuration(interval.asString(), &cfg.interval, &derr)) {
      if (err) *err = ddnsclient::Wrap(ErrorCode::Config, "interval", derr);
      return false;
    }
  } else {
    if (err) *err = ConfigError("interval: missing or not a number/string");
    return false;
  }

  const Json::Value& hosts = root["hosts"];
  if (!hosts.isArray()) {
    if (err) *err = ConfigError("hosts: missing or not an array");
    return false;
  }
  for (Json::ArrayIndex i = 0; i < hosts.size(); ++i) {
    const Json::Value& h = hosts[i];
    Host host;
    if (!h.isObject() || !ReadString(h, "host", &host.hostname) ||
        !ReadString(h, "user", &host.user) ||
        !ReadString(h, "password", &host.password)) {
      if (err) {
        std::ostringstream oss;
        oss << "hosts[" << i << "]: expected an object with string "
            << "\"host\", \"user\" and \"password\"";
        *err = ConfigError(oss.str());
      }
      return false;
    }
    cfg.hosts.push_back(std::move(host));
  }

  if (!ValidateConfig(cfg, err)) return false;
  *out = std::move(cfg);
  return true;
}

bool LoadConfig(const std::string& path, Config* out, Error* err) {
  std::ifstream in(path);
  if (!in.is_open()) {
    if (err) *err = ConfigError("failed to open config file '" + path + "'");
    return false;
  }
  std::stringstream ss;
  ss << in.rdbuf();
  return ParseConfig(ss.str(), out, err);
}

std::ostream& operator<<(std::ostream& os, const Config& c) {
  os << "interval=" << c.interval.count() << "ms, hosts=[";
  for (size_t i = 0; i < c.hosts.size(); ++i) {
    if (i) os << ", ";
    os << c.hosts[i].hostname << " (user=" << c.hosts[i].user
       << ", password=***)";
  }
  os << "]";
  return os;
}

}  // namespace ddnssync

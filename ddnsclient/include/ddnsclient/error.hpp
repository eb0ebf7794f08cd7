// Copyright (c) 2025 <Your Name>
/**
 * @file error.hpp
 * @brief Error taxonomy shared by the DDNS client and the sync service.
 */
#pragma once

#include <ostream>
#include <string>
#include <utility>

namespace ddnsclient {

/**
 * @brief Error classes reported by the client and the sync loop.
 *
 * Config is fatal at startup. IpResolution aborts a single tick. HostUpdate
 * and ProtocolResponse are per host and never abort sibling updates.
 */
enum class ErrorCode {
  None,              ///< No error
  Config,            ///< Malformed or missing configuration
  IpResolution,      ///< External IP lookup failed
  HostUpdate,        ///< Transport or HTTP status failure for one host
  ProtocolResponse,  ///< Provider body outside the success vocabulary
  Cancelled,         ///< Context cancelled
};

/** Returns a short stable name ("config", "ip_resolution", ...). */
const char* ErrorCodeName(ErrorCode code);

/**
 * @brief Error value with a class and a human-readable message.
 *
 * A default-constructed Error means success.
 */
struct Error {
  ErrorCode code = ErrorCode::None;
  std::string message;

  Error() = default;
  Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}

  bool Failed() const { return code != ErrorCode::None; }

  /** True for HostUpdate and its ProtocolResponse subtype. */
  bool IsHostUpdate() const {
    return code == ErrorCode::HostUpdate ||
           code == ErrorCode::ProtocolResponse;
  }

  friend std::ostream& operator<<(std::ostream& os, const Error& e);
};

/**
 * @brief Build an error whose message is "<context>: <cause>".
 *
 * An empty cause yields just the context.
 */
Error Wrap(ErrorCode code, const std::string& context,
           const std::string& cause);

}  // namespace ddnsclient

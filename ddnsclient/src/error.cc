// Copyright (c) 2025 <Your Name>
#include "ddnsclient/error.hpp"

namespace ddnsclient {

const char* ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::None:
      return "none";
    case ErrorCode::Config:
      return "config";
    case ErrorCode::IpResolution:
      return "ip_resolution";
    case ErrorCode::HostUpdate:
      return "host_update";
    case ErrorCode::ProtocolResponse:
      return "protocol_response";
    case ErrorCode::Cancelled:
      return "cancelled";
  }
  return "unknown";
}

std::ostream& operator<<(std::ostream& os, const Error& e) {
  if (!e.Failed()) return os << "ok";
  return os << ErrorCodeName(e.code) << ": " << e.message;
}

Error Wrap(ErrorCode code, const std::string& context,
           const std::string& cause) {
  if (cause.empty()) return Error(code, context);
  return Error(code, context + ": " + cause);
}

}  // namespace ddnsclient

#include "hidock/io/io_status.h"

namespace hidock::io {

const char* to_string(IOStatus s)
{
    switch (s) {
    case IOStatus::Ok:               return "ok";
    case IOStatus::NotConnected:     return "not-connected";
    case IOStatus::ConnectionFailed: return "connection-failed";
    case IOStatus::Timeout:          return "timeout";
    case IOStatus::CommandTimeout:   return "command-timeout";
    case IOStatus::MalformedHeader:  return "malformed-header";
    case IOStatus::TransferFailed:   return "transfer-failed";
    case IOStatus::InvalidResponse:  return "invalid-response";
    case IOStatus::InvalidArgument:  return "invalid-argument";
    case IOStatus::Unsupported:      return "unsupported";
    case IOStatus::CommandFailed:    return "command-failed";
    case IOStatus::Blocked:          return "blocked";
    case IOStatus::Cancelled:        return "cancelled";
    case IOStatus::IOError:          return "io-error";
    }
    return "unknown";
}

} // namespace hidock::io

#include "domain/exchange/IKlinesSource.hpp"

namespace domain {

const char* to_string(FetchErrorKind kind) noexcept {
  switch (kind) {
    case FetchErrorKind::ConnectTimeout:
      return "connect-timeout";
    case FetchErrorKind::ReadTimeout:
      return "read-timeout";
    case FetchErrorKind::ConnectionReset:
      return "connection-reset";
    case FetchErrorKind::DnsFailure:
      return "dns-failure";
    case FetchErrorKind::HttpStatus:
      return "http-status";
    case FetchErrorKind::MalformedBody:
      return "malformed-body";
    case FetchErrorKind::Other:
      break;
  }
  return "other";
}

}  // namespace domain

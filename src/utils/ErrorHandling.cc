#include "dojo/utils/ErrorHandling.hh"
#include "dojo/core/Log.hh"

namespace dojo {

DojoException::DojoException(const std::string &message)
    : message(message) {}

const char *DojoException::what() const noexcept { return message.c_str(); }

void throwError(const std::string &message) {
  DOJO_LOG_ERROR("DojoException: {}", message);
  throw DojoException(message);
}

std::string_view errorCodeToString(ErrorCode code) {
  switch (code) {
  case ErrorCode::Ok:
    return "Ok";
  case ErrorCode::InvalidState:
    return "InvalidState";
  case ErrorCode::NotFound:
    return "NotFound";
  case ErrorCode::ParseError:
    return "ParseError";
  case ErrorCode::OutOfRange:
    return "OutOfRange";
  case ErrorCode::IoError:
    return "IoError";
  case ErrorCode::Internal:
    return "Internal";
  }
  return "Unknown";
}

} // namespace dojo

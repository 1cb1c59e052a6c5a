#include "chroma/utils/ErrorHandling.hh"
#include "chroma/core/Log.hh"

namespace chroma {

ChromaException::ChromaException(const std::string &message, ErrorCode code)
    : message(message), errorCode(code) {}

const char *ChromaException::what() const noexcept { return message.c_str(); }

ErrorCode ChromaException::code() const noexcept { return errorCode; }

void throwError(const std::string &message) {
  throwError(ErrorCode::Internal, message);
}

void throwError(ErrorCode code, const std::string &message) {
  CHROMA_LOG_ERROR("ChromaException [{}]: {}", errorCodeToString(code), message);
  throw ChromaException(message, code);
}

std::string_view errorCodeToString(ErrorCode code) {
  switch (code) {
  case ErrorCode::Ok:
    return "Ok";
  case ErrorCode::InvalidConfiguration:
    return "InvalidConfiguration";
  case ErrorCode::InvalidState:
    return "InvalidState";
  case ErrorCode::EmptyTree:
    return "EmptyTree";
  case ErrorCode::EmptyLeaf:
    return "EmptyLeaf";
  case ErrorCode::BufferOverrun:
    return "BufferOverrun";
  case ErrorCode::NotFound:
    return "NotFound";
  case ErrorCode::Internal:
    return "Internal";
  }
  return "Unknown";
}

} // namespace chroma

#pragma once

#include <expected>
#include <string>
#include <string_view>

namespace common {

enum class ErrorKind {
  Transient,    // queue / cache / store temporarily unreachable
  Malformed,    // payload cannot be decoded, never retried
  Probe,
  Transcode,
  Store,
  Persistence,  // metadata writes, best-effort inside the pipeline
  Timeout,
  Cancelled
};

constexpr std::string_view toString(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::Transient: return "transient";
    case ErrorKind::Malformed: return "malformed";
    case ErrorKind::Probe: return "probe";
    case ErrorKind::Transcode: return "transcode";
    case ErrorKind::Store: return "store";
    case ErrorKind::Persistence: return "persistence";
    case ErrorKind::Timeout: return "timeout";
    case ErrorKind::Cancelled: return "cancelled";
  }
  return "unknown";
}

struct Error {
  ErrorKind kind;
  std::string message;

  std::string describe() const {
    return std::string(toString(kind)) + ": " + message;
  }
};

inline std::unexpected<Error> fail(ErrorKind kind, std::string message) {
  return std::unexpected<Error>(Error{kind, std::move(message)});
}

template <typename T>
using Result = std::expected<T, Error>;

} // namespace common

#pragma once

#include <string_view>

enum class ErrorCode {
  OK,
  InvalidArgument,
  NotFound,
  NotNamespace,
  IOError,
};

enum class LogLevel {
  Debug,
  Info,
  Warn,
  Error,
};

enum class TraversalOrder {
  DepthFirst,
  BreadthFirst,
};

constexpr std::string_view ErrorCodeName(ErrorCode code) {
  switch (code) {
  case ErrorCode::OK:
    return "OK";
  case ErrorCode::InvalidArgument:
    return "InvalidArgument";
  case ErrorCode::NotFound:
    return "NotFound";
  case ErrorCode::NotNamespace:
    return "NotNamespace";
  case ErrorCode::IOError:
    return "IOError";
  }
  return "Unknown";
}

#include "csvpipe/errors.hpp"
#include <utility>

namespace cp {

const char* to_string(ErrorKind k) noexcept {
  switch (k) {
    case ErrorKind::None:           return "none";
    case ErrorKind::Io:             return "IO error";
    case ErrorKind::Parse:          return "CSV parsing error";
    case ErrorKind::Config:         return "Configuration error";
    case ErrorKind::FieldSelection: return "Field selection error";
    case ErrorKind::Threading:      return "Threading error";
  }
  return "unknown error";
}

std::string Error::describe() const {
  std::string s = to_string(kind);
  s += ": ";
  s += message;
  return s;
}

bool fail(Error* out, ErrorKind kind, std::string message) {
  if (out) {
    out->kind = kind;
    out->message = std::move(message);
  }
  return false;
}

}

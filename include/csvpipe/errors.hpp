#pragma once
#include <string>

namespace cp {

enum class ErrorKind { None, Io, Parse, Config, FieldSelection, Threading };

const char* to_string(ErrorKind k) noexcept;

struct Error {
  ErrorKind kind = ErrorKind::None;
  std::string message;

  explicit operator bool() const noexcept { return kind != ErrorKind::None; }

  // "IO error: <message>", "CSV parsing error: <message>", ...
  std::string describe() const;
};

// Fills *out (if non-null) and returns false, so callers can `return fail(...)`.
bool fail(Error* out, ErrorKind kind, std::string message);

}

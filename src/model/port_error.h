#pragma once

#include <QString>

enum class PortErrorKind {
  None = 0,
  InvalidInput,
  NotFound,
  FormatError,
  ReferenceError,
  IntegrityViolation,
  IoError,
};

struct PortError {
  PortErrorKind kind = PortErrorKind::None;
  QString message;

  void clear() {
    kind = PortErrorKind::None;
    message.clear();
  }
  [[nodiscard]] bool is_set() const { return kind != PortErrorKind::None; }
};

[[nodiscard]] inline QString port_error_kind_name(PortErrorKind kind) {
  switch (kind) {
    case PortErrorKind::None:
      return "none";
    case PortErrorKind::InvalidInput:
      return "invalid-input";
    case PortErrorKind::NotFound:
      return "not-found";
    case PortErrorKind::FormatError:
      return "format-error";
    case PortErrorKind::ReferenceError:
      return "reference-error";
    case PortErrorKind::IntegrityViolation:
      return "integrity-violation";
    case PortErrorKind::IoError:
      return "io-error";
  }
  return "unknown";
}

// Fills |error| when the caller asked for one. Always returns false so call sites can
// `return fail(error, ...)`.
inline bool fail(PortError* error, PortErrorKind kind, const QString& message) {
  if (error) {
    error->kind = kind;
    error->message = message;
  }
  return false;
}

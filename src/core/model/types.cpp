#include "core/model/types.hpp"

namespace seal {

const char* error_kind_name(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::None:
      return "None";
    case ErrorKind::MalformedInput:
      return "MalformedInput";
    case ErrorKind::ValidationError:
      return "ValidationError";
    case ErrorKind::CollisionError:
      return "CollisionError";
    case ErrorKind::LockContention:
      return "LockContention";
    case ErrorKind::HashFailure:
      return "HashFailure";
  }
  return "Unknown";
}

}  // namespace seal

#include "synmem/common/result.hpp"

namespace synmem::common {

std::string_view error_code_name(const ErrorCode code) {
  switch (code) {
  case ErrorCode::None:
    return "none";
  case ErrorCode::NotFound:
    return "not_found";
  case ErrorCode::Precondition:
    return "precondition";
  case ErrorCode::InvalidArgument:
    return "invalid_argument";
  case ErrorCode::Integrity:
    return "integrity";
  case ErrorCode::Storage:
    return "storage";
  }
  return "storage";
}

} // namespace synmem::common

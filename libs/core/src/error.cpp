#include "peaktrade/core/error.h"

namespace peaktrade::core {

kj::StringPtr to_string(ErrorCode code) {
  switch (code) {
  case ErrorCode::Parse:
    return "Parse Error"_kj;
  case ErrorCode::Validation:
    return "Validation Error"_kj;
  case ErrorCode::Resource:
    return "Resource Error"_kj;
  case ErrorCode::Configuration:
    return "Configuration Error"_kj;
  case ErrorCode::Unknown:
    break;
  }
  return "Error"_kj;
}

kj::String PeakTradeException::describe() const {
  return kj::str(to_string(code()), ": ", message_);
}

} // namespace peaktrade::core

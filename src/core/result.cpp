#include "sulid/core/result.h"

namespace sulid::core {

std::string to_string(const DecodeError error) {
  switch (error) {
    case DecodeError::kInvalidLength:
      return "invalid length";
    case DecodeError::kInvalidChar:
      return "invalid character";
  }
  return "unknown decode error";
}

std::string to_string(const EncodeError error) {
  switch (error) {
    case EncodeError::kBufferTooSmall:
      return "buffer too small";
  }
  return "unknown encode error";
}

}  // namespace sulid::core

#include <pubflow/core/error.hpp>

namespace pubflow::core {

const char* to_string(PublishError error) noexcept {
  switch (error) {
    case PublishError::None:
      return "None";
    case PublishError::InvalidArgument:
      return "InvalidArgument";
    case PublishError::DuplicateRegistration:
      return "DuplicateRegistration";
    case PublishError::NotEnabled:
      return "NotEnabled";
    case PublishError::InvalidConfig:
      return "InvalidConfig";
    case PublishError::ValidationFailed:
      return "ValidationFailed";
    case PublishError::PublishFailed:
      return "PublishFailed";
    case PublishError::FinalizeFailed:
      return "FinalizeFailed";
    default:
      return "Unknown";
  }
}

}  // namespace pubflow::core

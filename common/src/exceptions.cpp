#include <solo/common/exceptions.hpp>

namespace solo::common {

  std::string_view error_kind_to_string(ErrorKind kind)
  {
    switch (kind) {
    case ErrorKind::MISSING_ENVIRONMENT:
      return "MissingEnvironment";
    case ErrorKind::SPAWN_FAILED:
      return "SpawnFailed";
    case ErrorKind::UNKNOWN_READY:
      return "UnknownReady";
    case ErrorKind::UNKNOWN_OK:
      return "UnknownOk";
    case ErrorKind::MALFORMED_PAYLOAD:
      return "MalformedPayload";
    case ErrorKind::MESSAGE_TOO_LARGE:
      return "MessageTooLarge";
    case ErrorKind::CHANNEL_IO:
      return "ChannelIo";
    case ErrorKind::TIMEOUT:
      return "Timeout";
    case ErrorKind::INVALID_CONFIGURATION:
      return "InvalidConfiguration";
    }
    return "Unknown";
  }

} // namespace solo::common

#ifndef SOLO_COMMON_EXCEPTIONS_HPP
#define SOLO_COMMON_EXCEPTIONS_HPP

#include <stdexcept>
#include <string>
#include <string_view>

namespace solo::common {

  enum class ErrorKind {
    MISSING_ENVIRONMENT,
    SPAWN_FAILED,
    UNKNOWN_READY,
    UNKNOWN_OK,
    MALFORMED_PAYLOAD,
    MESSAGE_TOO_LARGE,
    CHANNEL_IO,
    TIMEOUT,
    INVALID_CONFIGURATION
  };

  std::string_view error_kind_to_string(ErrorKind kind);

  struct SoloException : std::runtime_error {

    SoloException(ErrorKind kind, const std::string& msg) : std::runtime_error(msg), _kind(kind) {}

    ErrorKind kind() const
    {
      return _kind;
    }

  private:
    ErrorKind _kind;
  };

  struct MissingEnvironment : SoloException {

    MissingEnvironment(const std::string& msg) : SoloException(ErrorKind::MISSING_ENVIRONMENT, msg)
    {
    }
  };

  struct SpawnFailed : SoloException {

    SpawnFailed(const std::string& msg) : SoloException(ErrorKind::SPAWN_FAILED, msg) {}
  };

  struct UnknownReady : SoloException {

    UnknownReady(const std::string& msg) : SoloException(ErrorKind::UNKNOWN_READY, msg) {}
  };

  struct UnknownOk : SoloException {

    UnknownOk(const std::string& msg) : SoloException(ErrorKind::UNKNOWN_OK, msg) {}
  };

  struct MalformedPayload : SoloException {

    MalformedPayload(const std::string& msg) : SoloException(ErrorKind::MALFORMED_PAYLOAD, msg) {}
  };

  struct MessageTooLarge : SoloException {

    MessageTooLarge(const std::string& msg) : SoloException(ErrorKind::MESSAGE_TOO_LARGE, msg) {}
  };

  struct ChannelIOError : SoloException {

    ChannelIOError(const std::string& msg) : SoloException(ErrorKind::CHANNEL_IO, msg) {}
  };

  struct Timeout : SoloException {

    Timeout(const std::string& msg) : SoloException(ErrorKind::TIMEOUT, msg) {}
  };

  struct InvalidConfigurationError : SoloException {

    InvalidConfigurationError(const std::string& msg)
        : SoloException(ErrorKind::INVALID_CONFIGURATION, msg)
    {
    }
  };

} // namespace solo::common

#endif

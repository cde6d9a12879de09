#ifndef SOLO_LAUNCHER_HANDSHAKE_HPP
#define SOLO_LAUNCHER_HANDSHAKE_HPP

#include <solo/common/exceptions.hpp>
#include <solo/ipc/channel.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace solo::launcher {

  struct HandshakeFailure {
    common::ErrorKind kind;
    std::string reason;
  };

  // Client side of the HELLO / READY / ARGS / OK exchange.
  //
  // START -> HELLO_SENT -> AWAITING_READY -> READY_OK -> ARGS_SENT -> AWAITING_OK -> OK_OK -> DONE
  //                                       \-> READY_MISMATCH -> FAILED
  //                                                                            \-> OK_MISMATCH -> FAILED
  //
  // DONE and FAILED are terminal. Nothing is ever retried.
  struct HandshakeClient {

    enum class State {
      START,
      HELLO_SENT,
      AWAITING_READY,
      READY_OK,
      READY_MISMATCH,
      ARGS_SENT,
      AWAITING_OK,
      OK_OK,
      OK_MISMATCH,
      DONE,
      FAILED
    };

    HandshakeClient(ipc::Channel& channel, const std::vector<std::string>& arguments)
        : _channel(channel), _arguments(arguments)
    {
    }

    // Performs a single transition; a no-op in a terminal state.
    State step();

    // Drives the exchange to DONE or FAILED.
    State run();

    State state() const
    {
      return _state;
    }

    bool terminal() const
    {
      return _state == State::DONE || _state == State::FAILED;
    }

    const std::optional<HandshakeFailure>& failure() const
    {
      return _failure;
    }

    static std::string_view state_to_string(State state);

  private:
    void _fail(common::ErrorKind kind, std::string reason);

    // Stores the next line, or the reason why none could be read.
    // Timeouts propagate.
    void _receive_reply();

    void _match_reply(std::string_view literal, State matched, State mismatched);

    ipc::Channel& _channel;

    const std::vector<std::string>& _arguments;

    State _state = State::START;

    std::optional<std::string> _reply;

    std::string _reply_problem;

    std::optional<HandshakeFailure> _failure;
  };

} // namespace solo::launcher

#endif

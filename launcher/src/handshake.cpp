#include <solo/launcher/handshake.hpp>

#include <solo/ipc/messages.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace solo::launcher {

  namespace {

    constexpr std::size_t PREVIEW_LENGTH = 64;

    std::string preview(const std::string& line)
    {
      if (line.length() <= PREVIEW_LENGTH) {
        return line;
      }
      return fmt::format("{}... ({} bytes)", line.substr(0, PREVIEW_LENGTH), line.length());
    }

  } // namespace

  std::string_view HandshakeClient::state_to_string(State state)
  {
    switch (state) {
    case State::START:
      return "START";
    case State::HELLO_SENT:
      return "HELLO_SENT";
    case State::AWAITING_READY:
      return "AWAITING_READY";
    case State::READY_OK:
      return "READY_OK";
    case State::READY_MISMATCH:
      return "READY_MISMATCH";
    case State::ARGS_SENT:
      return "ARGS_SENT";
    case State::AWAITING_OK:
      return "AWAITING_OK";
    case State::OK_OK:
      return "OK_OK";
    case State::OK_MISMATCH:
      return "OK_MISMATCH";
    case State::DONE:
      return "DONE";
    case State::FAILED:
      return "FAILED";
    }
    return "";
  }

  void HandshakeClient::_fail(common::ErrorKind kind, std::string reason)
  {
    spdlog::error(
        "Handshake failed in state {} with {}: {}", state_to_string(_state),
        common::error_kind_to_string(kind), reason
    );
    _failure = HandshakeFailure{kind, std::move(reason)};
    _state = State::FAILED;
  }

  void HandshakeClient::_receive_reply()
  {
    _reply.reset();
    _reply_problem.clear();

    try {
      _reply = _channel.read_line();
      if (!_reply.has_value()) {
        _reply_problem = "peer closed the connection without a reply";
      }
    } catch (common::ChannelIOError& exc) {
      _reply_problem = exc.what();
    } catch (common::MessageTooLarge& exc) {
      _reply_problem = exc.what();
    }
  }

  void HandshakeClient::_match_reply(std::string_view literal, State matched, State mismatched)
  {
    if (_reply.has_value() && _reply.value() == literal) {
      _state = matched;
      return;
    }

    if (_reply.has_value()) {
      _reply_problem = fmt::format("expected {}, received {}", literal, preview(_reply.value()));
    }
    _state = mismatched;
  }

  HandshakeClient::State HandshakeClient::step()
  {
    try {
      switch (_state) {
      case State::START:
        _channel.send(ipc::Hello{});
        _state = State::HELLO_SENT;
        SPDLOG_DEBUG("Sent HELLO, waiting for READY");
        break;
      case State::HELLO_SENT:
        _receive_reply();
        _state = State::AWAITING_READY;
        break;
      case State::AWAITING_READY:
        _match_reply(ipc::Ready::LITERAL, State::READY_OK, State::READY_MISMATCH);
        break;
      case State::READY_MISMATCH:
        _fail(common::ErrorKind::UNKNOWN_READY, _reply_problem);
        break;
      case State::READY_OK:
        SPDLOG_DEBUG("Received READY, sending {} arguments", _arguments.size());
        _channel.send(ipc::Args{_arguments});
        _state = State::ARGS_SENT;
        break;
      case State::ARGS_SENT:
        _receive_reply();
        _state = State::AWAITING_OK;
        break;
      case State::AWAITING_OK:
        _match_reply(ipc::Ok::LITERAL, State::OK_OK, State::OK_MISMATCH);
        break;
      case State::OK_MISMATCH:
        _fail(common::ErrorKind::UNKNOWN_OK, _reply_problem);
        break;
      case State::OK_OK:
        SPDLOG_DEBUG("Instance accepted the arguments");
        _state = State::DONE;
        break;
      case State::DONE:
      case State::FAILED:
        break;
      }
    } catch (common::SoloException& exc) {
      // Write failures, oversized arguments and read deadlines.
      _fail(exc.kind(), exc.what());
    }

    return _state;
  }

  HandshakeClient::State HandshakeClient::run()
  {
    while (!terminal()) {
      step();
    }
    return _state;
  }

} // namespace solo::launcher

#include <solo/ipc/channel.hpp>

#include <solo/common/exceptions.hpp>

#include <cerrno>

#include <spdlog/spdlog.h>

#include <sys/un.h>

namespace solo::ipc {

  Channel::~Channel() {}

  void Channel::send(const Message& msg)
  {
    std::string line = encode(msg);
    SPDLOG_DEBUG("Sending {} message of {} bytes", message_name(msg), line.length());
    write(line);
  }

  UnixSocketChannel::UnixSocketChannel(
      sockpp::unix_socket&& socket, std::chrono::milliseconds read_timeout
  )
      : _socket(std::move(socket)), _read_timeout(read_timeout)
  {
    if (_read_timeout.count() > 0) {
      _set_read_timeout(_read_timeout);
    }
  }

  void UnixSocketChannel::_set_read_timeout(std::chrono::microseconds timeout)
  {
    if (!_socket.read_timeout(timeout)) {
      throw common::ChannelIOError{
          fmt::format("Could not set read timeout, reason {}", _socket.last_error_str())};
    }
  }

  UnixSocketChannel::~UnixSocketChannel()
  {
    close();
  }

  void UnixSocketChannel::close()
  {
    if (!_socket.is_open()) {
      return;
    }

    if (!_socket.close()) {
      spdlog::warn("Closing channel failed, reason {}", _socket.last_error_str());
    }
  }

  void UnixSocketChannel::write(std::string_view data)
  {
    ssize_t written = _socket.write_n(data.data(), data.length());
    if (written < 0 || static_cast<size_t>(written) != data.length()) {
      throw common::ChannelIOError{fmt::format(
          "Failed writing {} bytes, wrote {}, reason {}", data.length(), written,
          _socket.last_error_str()
      )};
    }
  }

  std::optional<std::string> UnixSocketChannel::read_line()
  {
    // The deadline covers the whole line, not each read.
    const bool bounded = _read_timeout.count() > 0;
    const auto deadline = std::chrono::steady_clock::now() + _read_timeout;

    while (true) {

      // A previous read might have delivered more than one line.
      auto line = _buffer.next_line();
      if (line.has_value()) {
        SPDLOG_DEBUG("Received line of {} bytes", line->length());
        return line;
      }

      if (bounded) {
        auto remaining = std::chrono::ceil<std::chrono::microseconds>(
            deadline - std::chrono::steady_clock::now()
        );
        if (remaining.count() <= 0) {
          throw common::Timeout{"Peer did not send a complete line before the read deadline"};
        }
        _set_read_timeout(remaining);
      }

      ssize_t read_bytes = _socket.read(_chunk.data(), _chunk.size());

      if (read_bytes < 0) {

        int err = _socket.last_error();
        if (err == EINTR) {
          continue;
        }
        if (err == EAGAIN || err == EWOULDBLOCK) {
          throw common::Timeout{"Peer did not send a complete line before the read deadline"};
        }
        throw common::ChannelIOError{
            fmt::format("Failed receiving, reason {}", _socket.last_error_str())};
      }

      if (read_bytes == 0) {
        if (!_buffer.empty()) {
          spdlog::debug(
              "Peer closed the connection, discarding {} bytes of unterminated data",
              _buffer.size()
          );
        }
        return std::nullopt;
      }

      _buffer.append(_chunk.data(), read_bytes);
    }
  }

  std::unique_ptr<Channel> UnixSocketConnector::connect(const std::string& address)
  {
    if (address.length() >= sizeof(sockaddr_un::sun_path)) {
      spdlog::debug(
          "Channel address {} exceeds the limit of {} bytes", address,
          sizeof(sockaddr_un::sun_path) - 1
      );
      return nullptr;
    }

    sockpp::unix_connector connector;
    if (!connector.connect(sockpp::unix_address{address})) {
      spdlog::debug("Could not connect to {}, reason {}", address, connector.last_error_str());
      return nullptr;
    }
    SPDLOG_DEBUG("Connected to {}", address);

    return std::make_unique<UnixSocketChannel>(
        sockpp::unix_socket{connector.release()}, _read_timeout
    );
  }

} // namespace solo::ipc

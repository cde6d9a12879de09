#ifndef SOLO_IPC_CHANNEL_HPP
#define SOLO_IPC_CHANNEL_HPP

#include <solo/ipc/messages.hpp>

#include <array>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <sockpp/unix_connector.h>
#include <sockpp/unix_stream_socket.h>

namespace solo::ipc {

  struct Channel {

    virtual ~Channel() = 0;

    // Writes all bytes; throws ChannelIOError.
    virtual void write(std::string_view data) = 0;

    // Blocks until one terminated line arrives.
    // Returns nullopt when the peer closed the connection.
    // Throws ChannelIOError, Timeout or MessageTooLarge.
    virtual std::optional<std::string> read_line() = 0;

    virtual void close() = 0;

    void send(const Message& msg);
  };

  struct UnixSocketChannel : public Channel {

    static constexpr int READ_CHUNK_SIZE = 4096;

    UnixSocketChannel(sockpp::unix_socket&& socket, std::chrono::milliseconds read_timeout);
    ~UnixSocketChannel() override;

    UnixSocketChannel(const UnixSocketChannel&) = delete;
    UnixSocketChannel& operator=(const UnixSocketChannel&) = delete;

    void write(std::string_view data) override;

    std::optional<std::string> read_line() override;

    void close() override;

    bool is_open() const
    {
      return _socket.is_open();
    }

  private:
    void _set_read_timeout(std::chrono::microseconds timeout);

    sockpp::unix_socket _socket;

    // Zero disables the deadline.
    std::chrono::milliseconds _read_timeout;

    LineBuffer _buffer;

    std::array<char, READ_CHUNK_SIZE> _chunk{};
  };

  struct Connector {

    virtual ~Connector() = default;

    // Returns nullptr when no connection could be established.
    virtual std::unique_ptr<Channel> connect(const std::string& address) = 0;
  };

  struct UnixSocketConnector : public Connector {

    UnixSocketConnector(std::chrono::milliseconds read_timeout) : _read_timeout(read_timeout) {}

    std::unique_ptr<Channel> connect(const std::string& address) override;

  private:
    std::chrono::milliseconds _read_timeout;
  };

} // namespace solo::ipc

#endif

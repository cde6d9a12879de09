#ifndef SOLO_IPC_MESSAGES_HPP
#define SOLO_IPC_MESSAGES_HPP

#include <solo/common/exceptions.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace solo::ipc {

  template <class... Ts>
  struct overloaded : Ts... {
    using Ts::operator()...;
  };
  template <class... Ts>
  overloaded(Ts...) -> overloaded<Ts...>;

  // Every message is one line: payload followed by a single LF.
  //
  // client -> instance   {"msg":"HELLO"}
  // instance -> client   {"msg":"READY"}
  // client -> instance   {"args":[...]}
  // instance -> client   {"msg":"OK"}
  //
  // A line, terminator included, never exceeds MAX_LINE_LENGTH bytes.

  struct MessageConfig {
    static constexpr std::size_t MAX_LINE_LENGTH = 65536;
    static constexpr std::size_t MAX_PAYLOAD_LENGTH = MAX_LINE_LENGTH - 1;
    static constexpr char TERMINATOR = '\n';
    static constexpr char ARGS_FIELD[] = "args";
  };

  struct Hello {
    static constexpr std::string_view LITERAL = R"({"msg":"HELLO"})";
  };

  struct Ready {
    static constexpr std::string_view LITERAL = R"({"msg":"READY"})";
  };

  struct Ok {
    static constexpr std::string_view LITERAL = R"({"msg":"OK"})";
  };

  struct Args {
    std::vector<std::string> arguments;
  };

  using Message = std::variant<Hello, Ready, Args, Ok>;

  // Payload only, without the terminator.
  std::string encode_payload(const Message& msg);

  // Payload with the terminator; throws MessageTooLarge.
  std::string encode(const Message& msg);

  // Throws MalformedPayload.
  Args decode_args(std::string_view line);

  Message decode(std::string_view line);

  std::string_view message_name(const Message& msg);

  struct LineBuffer {

    void append(const char* data, std::size_t len);

    // Returns the next complete line without its terminator.
    // Throws MessageTooLarge when the pending line cannot fit.
    std::optional<std::string> next_line();

    std::size_t size() const
    {
      return _data.size();
    }

    bool empty() const
    {
      return _data.empty();
    }

  private:
    std::string _data;
  };

} // namespace solo::ipc

#endif

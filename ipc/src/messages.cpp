#include <solo/ipc/messages.hpp>

#include <solo/common/exceptions.hpp>

#include <cereal/external/rapidjson/document.h>
#include <cereal/external/rapidjson/stringbuffer.h>
#include <cereal/external/rapidjson/writer.h>

#include <fmt/format.h>

namespace solo::ipc {

  namespace {

    std::string encode_args(const Args& msg)
    {
      rapidjson::StringBuffer buffer;
      rapidjson::Writer<rapidjson::StringBuffer> writer{buffer};

      writer.StartObject();
      writer.Key(MessageConfig::ARGS_FIELD);
      writer.StartArray();
      for (const auto& arg : msg.arguments) {
        writer.String(arg.data(), static_cast<rapidjson::SizeType>(arg.length()));
      }
      writer.EndArray();
      writer.EndObject();

      return std::string{buffer.GetString(), buffer.GetSize()};
    }

  } // namespace

  std::string encode_payload(const Message& msg)
  {
    return std::visit(
        overloaded{
            [](const Hello&) { return std::string{Hello::LITERAL}; },
            [](const Ready&) { return std::string{Ready::LITERAL}; },
            [](const Ok&) { return std::string{Ok::LITERAL}; },
            [](const Args& args) { return encode_args(args); }},
        msg
    );
  }

  std::string encode(const Message& msg)
  {
    std::string line = encode_payload(msg);
    if (line.length() > MessageConfig::MAX_PAYLOAD_LENGTH) {
      throw common::MessageTooLarge{fmt::format(
          "Encoded {} message has {} bytes, limit is {}", message_name(msg), line.length(),
          MessageConfig::MAX_PAYLOAD_LENGTH
      )};
    }
    line.push_back(MessageConfig::TERMINATOR);
    return line;
  }

  Args decode_args(std::string_view line)
  {
    rapidjson::Document doc;
    doc.Parse(line.data(), line.length());

    if (doc.HasParseError()) {
      throw common::MalformedPayload{
          fmt::format("Arguments payload is not valid JSON, error at offset {}", doc.GetErrorOffset())};
    }

    if (!doc.IsObject() || doc.MemberCount() != 1) {
      throw common::MalformedPayload{"Arguments payload must be an object with a single field"};
    }

    auto it = doc.FindMember(MessageConfig::ARGS_FIELD);
    if (it == doc.MemberEnd() || !it->value.IsArray()) {
      throw common::MalformedPayload{"Arguments payload does not contain an array of arguments"};
    }

    Args args;
    args.arguments.reserve(it->value.Size());
    for (const auto& value : it->value.GetArray()) {
      if (!value.IsString()) {
        throw common::MalformedPayload{
            fmt::format("Argument {} is not a string", args.arguments.size())};
      }
      args.arguments.emplace_back(value.GetString(), value.GetStringLength());
    }

    return args;
  }

  Message decode(std::string_view line)
  {
    if (line == Hello::LITERAL) {
      return Hello{};
    }
    if (line == Ready::LITERAL) {
      return Ready{};
    }
    if (line == Ok::LITERAL) {
      return Ok{};
    }
    return decode_args(line);
  }

  std::string_view message_name(const Message& msg)
  {
    return std::visit(
        overloaded{
            [](const Hello&) { return std::string_view{"HELLO"}; },
            [](const Ready&) { return std::string_view{"READY"}; },
            [](const Ok&) { return std::string_view{"OK"}; },
            [](const Args&) { return std::string_view{"ARGS"}; }},
        msg
    );
  }

  void LineBuffer::append(const char* data, std::size_t len)
  {
    _data.append(data, len);
  }

  std::optional<std::string> LineBuffer::next_line()
  {
    auto pos = _data.find(MessageConfig::TERMINATOR);

    if (pos == std::string::npos) {
      // Not terminated yet - fail as soon as the terminator can no longer fit.
      if (_data.length() >= MessageConfig::MAX_LINE_LENGTH) {
        throw common::MessageTooLarge{fmt::format(
            "Received {} bytes without a line terminator, limit is {}", _data.length(),
            MessageConfig::MAX_LINE_LENGTH
        )};
      }
      return std::nullopt;
    }

    if (pos + 1 > MessageConfig::MAX_LINE_LENGTH) {
      throw common::MessageTooLarge{fmt::format(
          "Received line of {} bytes, limit is {}", pos + 1, MessageConfig::MAX_LINE_LENGTH
      )};
    }

    std::string line = _data.substr(0, pos);
    _data.erase(0, pos + 1);
    return line;
  }

} // namespace solo::ipc

#include <solo/launcher/config.hpp>

#include <solo/common/exceptions.hpp>
#include <solo/common/util.hpp>

#include <charconv>
#include <cstdlib>
#include <fstream>
#include <string_view>
#include <system_error>

#include <cereal/archives/json.hpp>
#include <cereal/details/helpers.hpp>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace solo::launcher::config {

  namespace {

    bool parse_flag(const char* name, std::string_view value)
    {
      if (value == "1" || value == "true" || value == "yes") {
        return true;
      }
      if (value == "0" || value == "false" || value == "no") {
        return false;
      }
      throw common::InvalidConfigurationError{
          fmt::format("Could not parse {}={} as a boolean flag", name, value)};
    }

    int parse_timeout(const char* name, std::string_view value)
    {
      int result = 0;
      auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.length(), result);
      if (ec != std::errc{} || ptr != value.data() + value.length() || result < 0) {
        throw common::InvalidConfigurationError{
            fmt::format("Could not parse {}={} as a non-negative number of milliseconds", name, value)};
      }
      return result;
    }

  } // namespace

  void Launcher::load(cereal::JSONInputArchive& archive)
  {
    // All arguments are optional
    common::util::cereal_load_optional(archive, "verbose", verbose);
    common::util::cereal_load_optional(archive, "application-name", application_name);
    common::util::cereal_load_optional(archive, "socket-name", socket_name);
    common::util::cereal_load_optional(archive, "instance-name", instance_name);
    common::util::cereal_load_optional(archive, "read-timeout-ms", read_timeout_ms);

    std::string address;
    if (common::util::cereal_load_optional(archive, "channel-address", address)) {
      channel_address = std::move(address);
    }

    if (read_timeout_ms < 0) {
      throw common::InvalidConfigurationError{
          fmt::format("Read timeout must not be negative, got {}", read_timeout_ms)};
    }
    if (application_name.empty() || socket_name.empty() || instance_name.empty()) {
      throw common::InvalidConfigurationError{
          "Application, socket and instance names must not be empty"};
    }
  }

  void Launcher::load_env()
  {
    if (const char* val = std::getenv(ENV_VERBOSE); val && *val) {
      verbose = parse_flag(ENV_VERBOSE, val);
    }

    if (const char* val = std::getenv(ENV_READ_TIMEOUT); val && *val) {
      read_timeout_ms = parse_timeout(ENV_READ_TIMEOUT, val);
    }
  }

  void Launcher::set_defaults()
  {
    verbose = false;
    application_name = DEFAULT_APPLICATION_NAME;
    socket_name = DEFAULT_SOCKET_NAME;
    instance_name = DEFAULT_INSTANCE_NAME;
    read_timeout_ms = DEFAULT_READ_TIMEOUT_MS;
    channel_address = std::nullopt;
  }

  Launcher Launcher::deserialize(std::istream& json_config)
  {
    Launcher cfg;
    try {
      cereal::JSONInputArchive archive_in(json_config);
      cfg.load(archive_in);
    } catch (cereal::Exception& exc) {
      throw common::InvalidConfigurationError{
          fmt::format("Could not parse launcher configuration, reason: {}", exc.what())};
    }
    return cfg;
  }

  Launcher Launcher::locate(const std::filesystem::path& self_exe)
  {
    std::filesystem::path config_file;

    if (const char* val = std::getenv(ENV_CONFIG); val && *val) {
      config_file = val;
    } else {
      std::error_code ec;
      auto candidate = self_exe.parent_path() / CONFIG_FILE_NAME;
      if (std::filesystem::exists(candidate, ec)) {
        config_file = candidate;
      }
    }

    Launcher cfg;
    if (!config_file.empty()) {
      std::ifstream in_stream{config_file};
      if (!in_stream.is_open()) {
        throw common::InvalidConfigurationError{
            fmt::format("Could not open config file {}", config_file.string())};
      }
      cfg = deserialize(in_stream);
      SPDLOG_DEBUG("Loaded configuration from {}", config_file.string());
    }

    cfg.load_env();
    return cfg;
  }

} // namespace solo::launcher::config

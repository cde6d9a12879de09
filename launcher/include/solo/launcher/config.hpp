#ifndef SOLO_LAUNCHER_CONFIG_HPP
#define SOLO_LAUNCHER_CONFIG_HPP

#include <chrono>
#include <filesystem>
#include <istream>
#include <optional>
#include <string>

namespace cereal {
  class JSONInputArchive;
} // namespace cereal

namespace solo::launcher::config {

  struct Launcher {

    static constexpr char DEFAULT_APPLICATION_NAME[] = "solo";
    static constexpr char DEFAULT_SOCKET_NAME[] = "instance.lock";
    static constexpr char DEFAULT_INSTANCE_NAME[] = "target-executable";
    static constexpr int DEFAULT_READ_TIMEOUT_MS = 10000;

    static constexpr char CONFIG_FILE_NAME[] = "solo.json";

    static constexpr char ENV_CONFIG[] = "SOLO_CONFIG";
    static constexpr char ENV_VERBOSE[] = "SOLO_VERBOSE";
    static constexpr char ENV_READ_TIMEOUT[] = "SOLO_READ_TIMEOUT_MS";

    Launcher()
    {
      set_defaults();
    }

    bool verbose;
    std::string application_name;
    std::string socket_name;
    std::string instance_name;
    // Zero disables the deadline.
    int read_timeout_ms;
    std::optional<std::string> channel_address;

    std::chrono::milliseconds read_timeout() const
    {
      return std::chrono::milliseconds{read_timeout_ms};
    }

    void load(cereal::JSONInputArchive& archive);
    void load_env();
    void set_defaults();

    static Launcher deserialize(std::istream&);

    // $SOLO_CONFIG, then solo.json next to the launcher, then defaults.
    // Environment overrides are applied last.
    static Launcher locate(const std::filesystem::path& self_exe);
  };

} // namespace solo::launcher::config

#endif

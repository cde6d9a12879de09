#include <solo/launcher/environment.hpp>

#include <solo/common/exceptions.hpp>

#include <cstdlib>
#include <system_error>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace solo::launcher::environment {

  namespace {

    std::filesystem::path required_directory(const char* variable)
    {
      const char* val = std::getenv(variable);
      if (!val || !*val) {
        throw common::MissingEnvironment{
            fmt::format("Environment variable {} is not set, cannot locate the channel", variable)};
      }
      return std::filesystem::path{val};
    }

  } // namespace

  std::filesystem::path self_executable()
  {
    std::error_code ec;
    auto path = std::filesystem::canonical("/proc/self/exe", ec);
    if (ec) {
      throw common::MissingEnvironment{
          fmt::format("Unable to locate the launcher executable, reason {}", ec.message())};
    }
    return path;
  }

  std::filesystem::path user_cache_directory()
  {
#if defined(_WIN32)
    return required_directory("LOCALAPPDATA");
#elif defined(__APPLE__)
    return required_directory(HOME_VARIABLE) / "Library" / "Caches";
#else
    // XDG base directory specification: relative paths are ignored.
    if (const char* xdg = std::getenv(XDG_CACHE_VARIABLE); xdg && *xdg) {
      std::filesystem::path xdg_path{xdg};
      if (xdg_path.is_absolute()) {
        return xdg_path;
      }
    }
    return required_directory(HOME_VARIABLE) / ".cache";
#endif
  }

  std::string channel_address(const config::Launcher& cfg)
  {
    if (cfg.channel_address.has_value()) {
      return cfg.channel_address.value();
    }
    return (user_cache_directory() / cfg.application_name / cfg.socket_name).string();
  }

  std::string instance_path(const std::filesystem::path& self_exe, const config::Launcher& cfg)
  {
    // The instance lives next to the directory holding the launcher.
    auto base = self_exe.parent_path().parent_path();
    return (base / (cfg.instance_name + EXECUTABLE_SUFFIX)).string();
  }

  std::vector<std::string> arguments(int argc, const char* const* argv)
  {
    std::vector<std::string> args;
    if (argc > 1) {
      args.reserve(argc - 1);
      for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
      }
    }
    return args;
  }

  InvocationContext resolve(
      const std::filesystem::path& self_exe, int argc, const char* const* argv,
      const config::Launcher& cfg
  )
  {
    InvocationContext ctx{
        channel_address(cfg), instance_path(self_exe, cfg), arguments(argc, argv)};

    spdlog::debug("Channel at {}", ctx.channel_address);
    spdlog::debug("Instance executable at {}", ctx.instance_path);
    spdlog::debug("Forwarding {} arguments", ctx.arguments.size());

    return ctx;
  }

} // namespace solo::launcher::environment

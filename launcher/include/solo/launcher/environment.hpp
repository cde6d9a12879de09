#ifndef SOLO_LAUNCHER_ENVIRONMENT_HPP
#define SOLO_LAUNCHER_ENVIRONMENT_HPP

#include <solo/launcher/config.hpp>

#include <filesystem>
#include <string>
#include <vector>

namespace solo::launcher {

  struct InvocationContext {

    const std::string channel_address;

    const std::string instance_path;

    const std::vector<std::string> arguments;
  };

  namespace environment {

#if defined(_WIN32)
    static constexpr char EXECUTABLE_SUFFIX[] = ".exe";
#else
    static constexpr char EXECUTABLE_SUFFIX[] = "";
#endif

    static constexpr char HOME_VARIABLE[] = "HOME";
    static constexpr char XDG_CACHE_VARIABLE[] = "XDG_CACHE_HOME";

    // Linux specific - resolved through /proc/self/exe.
    std::filesystem::path self_executable();

    // Throws MissingEnvironment when the home directory is not known.
    std::filesystem::path user_cache_directory();

    std::string channel_address(const config::Launcher& cfg);

    std::string instance_path(const std::filesystem::path& self_exe, const config::Launcher& cfg);

    std::vector<std::string> arguments(int argc, const char* const* argv);

    InvocationContext resolve(
        const std::filesystem::path& self_exe, int argc, const char* const* argv,
        const config::Launcher& cfg
    );

  } // namespace environment

} // namespace solo::launcher

#endif

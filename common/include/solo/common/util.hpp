#ifndef SOLO_COMMON_UTIL_HPP
#define SOLO_COMMON_UTIL_HPP

#include <solo/common/exceptions.hpp>

#include <cerrno>
#include <cstring>
#include <memory>
#include <string>
#include <string_view>

#include <execinfo.h>

#include <cereal/archives/json.hpp>
#include <spdlog/spdlog.h>

namespace solo::common::util {

  void traceback();

  std::shared_ptr<spdlog::logger> create_logger(std::string_view name);

  std::string errno_message(int err);

  template <typename U>
  bool expect_zero(U&& u)
  {
    if (u) {
      spdlog::error("Expected zero, found: {}, errno {}, message {}", u, errno, strerror(errno));
      traceback();
      return false;
    }
    return true;
  }

  template <typename U>
  bool expect_other(U&& u, int val)
  {
    if (u == val) {
      spdlog::error(
          "Expected value other than {}, found: {}, errno {}, message {}", val, u, errno,
          strerror(errno)
      );
      traceback();
      return false;
    }
    return true;
  }

  // Loads an optional value; a missing key leaves obj untouched.
  template <typename T>
  bool cereal_load_optional(cereal::JSONInputArchive& archive, const std::string& name, T& obj)
  {
    // Cereal does not allow to skip non-existing objects easily.
    // There is also no separate exception type for this.
    try {
      archive(cereal::make_nvp(name, obj));
    } catch (cereal::Exception& exc) {

      // Catch non existing object
      if (std::string_view{exc.what()}.find(fmt::format("({}) not found", name)) !=
          std::string::npos) {

        archive.setNextName(nullptr);
        return false;

      } else {
        throw common::InvalidConfigurationError(
            fmt::format("Could not parse configuration key {}, reason: {}", name, exc.what())
        );
      }
    }
    return true;
  }

} // namespace solo::common::util

#endif

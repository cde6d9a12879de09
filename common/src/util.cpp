#include <solo/common/util.hpp>

#include <cstdlib>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace solo::common::util {

  void traceback()
  {
    void* array[10];
    int size = backtrace(array, 10);
    char** trace = backtrace_symbols(array, size);
    if (!trace) {
      return;
    }
    for (int i = 0; i < size; ++i)
      spdlog::debug("Traceback {}: {}", i, trace[i]);
    free(trace);
  }

  std::shared_ptr<spdlog::logger> create_logger(std::string_view name)
  {
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_st>();
    auto logger = std::make_shared<spdlog::logger>(std::string{name}, sink);
    logger->set_pattern("[%H:%M:%S:%f] [P %P] [T %t] [%l] %v ");
    return logger;
  }

  std::string errno_message(int err)
  {
    return fmt::format("errno {}, message {}", err, strerror(err));
  }

} // namespace solo::common::util

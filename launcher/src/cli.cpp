#include <solo/common/exceptions.hpp>
#include <solo/common/util.hpp>
#include <solo/ipc/channel.hpp>
#include <solo/launcher/config.hpp>
#include <solo/launcher/coordinator.hpp>
#include <solo/launcher/environment.hpp>
#include <solo/launcher/spawner.hpp>

#include <csignal>

#include <spdlog/spdlog.h>

int main(int argc, char** argv)
{
  using namespace solo::launcher;

  spdlog::set_default_logger(solo::common::util::create_logger("solo"));
  spdlog::set_level(spdlog::level::info);

  // A peer closing mid-handshake must be reported, not kill the launcher.
  struct sigaction ignore_pipe {};
  ignore_pipe.sa_handler = SIG_IGN;
  sigemptyset(&ignore_pipe.sa_mask);
  ignore_pipe.sa_flags = 0;
  solo::common::util::expect_zero(sigaction(SIGPIPE, &ignore_pipe, nullptr));

  Outcome outcome;
  try {

    auto self_exe = environment::self_executable();
    auto cfg = config::Launcher::locate(self_exe);
    if (cfg.verbose) {
      spdlog::set_level(spdlog::level::debug);
    }

    const InvocationContext ctx = environment::resolve(self_exe, argc, argv, cfg);

    solo::ipc::UnixSocketConnector connector{cfg.read_timeout()};
    ProcessSpawner spawner;
    outcome = Coordinator{connector, spawner}.coordinate(ctx);

  } catch (solo::common::SoloException& exc) {
    outcome = Outcome::failed(exc);
  }

  if (!outcome.success()) {
    spdlog::error(
        "{}: {}", solo::common::error_kind_to_string(outcome.error.value()), outcome.reason
    );
  }

  return outcome.exit_code();
}

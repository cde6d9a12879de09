#ifndef SOLO_LAUNCHER_COORDINATOR_HPP
#define SOLO_LAUNCHER_COORDINATOR_HPP

#include <solo/common/exceptions.hpp>
#include <solo/ipc/channel.hpp>
#include <solo/launcher/environment.hpp>
#include <solo/launcher/spawner.hpp>

#include <optional>
#include <string>

namespace solo::launcher {

  struct Outcome {

    enum class Action { NONE, SPAWNED, FORWARDED };

    static constexpr int EXIT_SUCCESS_CODE = 0;
    static constexpr int EXIT_FAILURE_CODE = 1;

    Action action = Action::NONE;

    std::optional<common::ErrorKind> error;

    std::string reason;

    static Outcome spawned()
    {
      return Outcome{Action::SPAWNED, std::nullopt, ""};
    }

    static Outcome forwarded()
    {
      return Outcome{Action::FORWARDED, std::nullopt, ""};
    }

    static Outcome failed(common::ErrorKind kind, std::string reason)
    {
      return Outcome{Action::NONE, kind, std::move(reason)};
    }

    static Outcome failed(const common::SoloException& exc)
    {
      return failed(exc.kind(), exc.what());
    }

    bool success() const
    {
      return !error.has_value();
    }

    int exit_code() const
    {
      return success() ? EXIT_SUCCESS_CODE : EXIT_FAILURE_CODE;
    }
  };

  // Connect-or-spawn: any failure to connect means no instance is running.
  // Concurrent launchers that both fail to connect will both spawn - exclusion
  // relies on the instance binding the channel exclusively.
  struct Coordinator {

    Coordinator(ipc::Connector& connector, Spawner& spawner)
        : _connector(connector), _spawner(spawner)
    {
    }

    Outcome coordinate(const InvocationContext& ctx);

  private:
    Outcome _spawn(const InvocationContext& ctx);

    Outcome _forward(ipc::Channel& channel, const InvocationContext& ctx);

    ipc::Connector& _connector;

    Spawner& _spawner;
  };

} // namespace solo::launcher

#endif

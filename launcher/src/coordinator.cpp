#include <solo/launcher/coordinator.hpp>

#include <solo/launcher/handshake.hpp>

#include <spdlog/spdlog.h>

namespace solo::launcher {

  Outcome Coordinator::coordinate(const InvocationContext& ctx)
  {
    std::unique_ptr<ipc::Channel> channel;
    try {
      channel = _connector.connect(ctx.channel_address);
    } catch (common::SoloException& exc) {
      // The peer accepted us, but the connection could not be set up.
      spdlog::error("Could not prepare the channel {}, reason {}", ctx.channel_address, exc.what());
      return Outcome::failed(exc);
    }

    if (!channel) {
      spdlog::debug("Can't connect to {}, starting the instance", ctx.channel_address);
      return _spawn(ctx);
    }

    spdlog::debug("Connected to the running instance at {}", ctx.channel_address);
    Outcome outcome = _forward(*channel, ctx);
    channel->close();

    return outcome;
  }

  Outcome Coordinator::_spawn(const InvocationContext& ctx)
  {
    try {
      _spawner.spawn(ctx.instance_path, ctx.arguments);
    } catch (common::SoloException& exc) {
      spdlog::error("Could not start the instance {}, reason {}", ctx.instance_path, exc.what());
      return Outcome::failed(exc);
    }
    return Outcome::spawned();
  }

  Outcome Coordinator::_forward(ipc::Channel& channel, const InvocationContext& ctx)
  {
    HandshakeClient client{channel, ctx.arguments};

    if (client.run() == HandshakeClient::State::DONE) {
      spdlog::info("Forwarded {} arguments to the running instance", ctx.arguments.size());
      return Outcome::forwarded();
    }

    const auto& failure = client.failure().value();
    return Outcome::failed(failure.kind, failure.reason);
  }

} // namespace solo::launcher

#ifndef SOLO_LAUNCHER_TESTS_UTILS_HPP
#define SOLO_LAUNCHER_TESTS_UTILS_HPP

#include <solo/common/exceptions.hpp>
#include <solo/ipc/channel.hpp>
#include <solo/ipc/messages.hpp>

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <future>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <sockpp/unix_acceptor.h>
#include <spdlog/spdlog.h>

#include <csignal>
#include <sys/wait.h>

namespace solo::tests {

  inline void ignore_sigpipe()
  {
    struct sigaction ignore_pipe {};
    ignore_pipe.sa_handler = SIG_IGN;
    sigemptyset(&ignore_pipe.sa_mask);
    sigaction(SIGPIPE, &ignore_pipe, nullptr);
  }

  struct TemporaryDirectory {

    TemporaryDirectory()
    {
      // Short prefix - socket addresses are limited to 108 bytes.
      std::string pattern = "/tmp/solo-XXXXXX";
      if (!mkdtemp(pattern.data())) {
        throw std::runtime_error{"Could not create a temporary directory"};
      }
      path = pattern;
    }

    ~TemporaryDirectory()
    {
      std::error_code ec;
      std::filesystem::remove_all(path, ec);
    }

    TemporaryDirectory(const TemporaryDirectory&) = delete;
    TemporaryDirectory& operator=(const TemporaryDirectory&) = delete;

    std::filesystem::path path;
  };

  // Instance stand-in: records its argv (one per line) and where stdout points.
  inline std::filesystem::path write_instance_script(
      const std::filesystem::path& location, const std::string& extra_commands = ""
  )
  {
    std::filesystem::create_directories(location.parent_path());
    {
      std::ofstream out{location};
      out << "#!/bin/sh\n"
          << "dir=\"$(dirname \"$0\")\"\n"
          << ": > \"$dir/argv.tmp\"\n"
          << "for arg in \"$0\" \"$@\"; do printf '%s\\n' \"$arg\" >> \"$dir/argv.tmp\"; done\n"
          << "readlink /proc/$$/fd/1 > \"$dir/stdout.txt\"\n"
          << "mv \"$dir/argv.tmp\" \"$dir/argv.txt\"\n"
          << extra_commands;
    }
    std::filesystem::permissions(
        location, std::filesystem::perms::owner_all, std::filesystem::perm_options::replace
    );
    return location;
  }

  inline std::vector<std::string> read_lines(const std::filesystem::path& path)
  {
    std::vector<std::string> lines;
    std::ifstream in{path};
    for (std::string line; std::getline(in, line);) {
      lines.push_back(line);
    }
    return lines;
  }

  inline int wait_for_exit(pid_t pid)
  {
    int status = 0;
    if (waitpid(pid, &status, 0) == -1) {
      return -1;
    }
    return WIFEXITED(status) ? WEXITSTATUS(status) : -1;
  }

  // Listener honoring the instance side of the handshake. Replies can be
  // replaced to violate the protocol; nullopt means never replying.
  //
  // The listening socket is bound in the constructor, so clients can connect
  // as soon as the object exists. Lines received from the client are
  // published once the client disconnects.
  struct FakeInstance {

    struct Replies {
      std::optional<std::string> ready = std::string{ipc::Ready::LITERAL};
      std::optional<std::string> ok = std::string{ipc::Ok::LITERAL};
    };

    FakeInstance(std::filesystem::path address, Replies replies)
        : address(std::move(address)), _replies(std::move(replies))
    {
      _lines_future = _lines.get_future();
      if (!_acceptor.open(sockpp::unix_address{this->address.string()})) {
        throw std::runtime_error{"Could not listen on " + this->address.string()};
      }
      _thread = std::thread{&FakeInstance::_serve, this};
    }

    FakeInstance(std::filesystem::path address) : FakeInstance(std::move(address), Replies{}) {}

    ~FakeInstance()
    {
      // Wakes up accept() if no client ever arrived.
      _acceptor.shutdown();
      if (_thread.joinable()) {
        _thread.join();
      }
      _acceptor.close();
      std::error_code ec;
      std::filesystem::remove(address, ec);
    }

    FakeInstance(const FakeInstance&) = delete;
    FakeInstance& operator=(const FakeInstance&) = delete;

    std::optional<std::vector<std::string>> received(std::chrono::milliseconds timeout)
    {
      if (_lines_future.wait_for(timeout) != std::future_status::ready) {
        return std::nullopt;
      }
      return _lines_future.get();
    }

    const std::filesystem::path address;

  private:
    void _reply(ipc::UnixSocketChannel& channel, const std::optional<std::string>& reply)
    {
      if (reply.has_value()) {
        channel.write(reply.value() + ipc::MessageConfig::TERMINATOR);
      }
    }

    void _serve()
    {
      std::vector<std::string> lines;

      sockpp::unix_socket socket = _acceptor.accept();
      if (!socket.is_open()) {
        _lines.set_value(lines);
        return;
      }

      ipc::UnixSocketChannel channel{std::move(socket), std::chrono::seconds{10}};
      try {
        auto hello = channel.read_line();
        if (hello.has_value()) {
          lines.push_back(hello.value());

          if (hello.value() == ipc::Hello::LITERAL) {
            _reply(channel, _replies.ready);

            auto args = channel.read_line();
            if (args.has_value()) {
              lines.push_back(args.value());
              _reply(channel, _replies.ok);
            }

            // The client must not send anything else.
            while (auto extra = channel.read_line()) {
              lines.push_back(extra.value());
            }
          }
        }
      } catch (common::SoloException& exc) {
        spdlog::error("Fake instance failed: {}", exc.what());
      }

      _lines.set_value(lines);
    }

    Replies _replies;

    sockpp::unix_acceptor _acceptor;

    std::promise<std::vector<std::string>> _lines;

    std::future<std::vector<std::string>> _lines_future;

    std::thread _thread;
  };

} // namespace solo::tests

#endif

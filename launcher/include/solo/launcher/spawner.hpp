#ifndef SOLO_LAUNCHER_SPAWNER_HPP
#define SOLO_LAUNCHER_SPAWNER_HPP

#include <string>
#include <vector>

#include <sys/types.h>

namespace solo::launcher {

  struct Spawner {

    virtual ~Spawner() = default;

    // Starts argv = [path] ++ arguments and returns its PID once exec succeeded.
    // Throws SpawnFailed.
    virtual pid_t spawn(const std::string& path, const std::vector<std::string>& arguments) = 0;
  };

  // The child gets a new session and /dev/null for stdin, stdout and stderr.
  // We never wait for it to finish.
  struct ProcessSpawner : Spawner {

    pid_t spawn(const std::string& path, const std::vector<std::string>& arguments) override;

    // Waits on the close-on-exec status pipe of a forked child and takes ownership of status_fd.
    // A child that did not report a clean exec is reaped before SpawnFailed is thrown.
    static pid_t await_exec(pid_t pid, int status_fd, const std::string& path);
  };

} // namespace solo::launcher

#endif

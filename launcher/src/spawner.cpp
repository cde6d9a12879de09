#include <solo/launcher/spawner.hpp>

#include <solo/common/exceptions.hpp>
#include <solo/common/util.hpp>

#include <cerrno>
#include <csignal>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace solo::launcher {

  namespace {

    // Runs in the forked child - only async-signal-safe calls.
    [[noreturn]] void report_and_exit(int status_fd, int err)
    {
      ssize_t written = write(status_fd, &err, sizeof(err));
      _exit(written == static_cast<ssize_t>(sizeof(err)) ? 127 : 126);
    }

    [[noreturn]] void exec_child(int status_fd, std::vector<char*>& argv)
    {
      if (setsid() == -1) {
        report_and_exit(status_fd, errno);
      }

      // Ignored dispositions survive exec; the launcher ignores SIGPIPE.
      if (signal(SIGPIPE, SIG_DFL) == SIG_ERR) {
        report_and_exit(status_fd, errno);
      }

      int null_fd = open("/dev/null", O_RDWR);
      if (null_fd == -1) {
        report_and_exit(status_fd, errno);
      }
      if (dup2(null_fd, STDIN_FILENO) == -1 || dup2(null_fd, STDOUT_FILENO) == -1 ||
          dup2(null_fd, STDERR_FILENO) == -1) {
        report_and_exit(status_fd, errno);
      }
      if (null_fd > STDERR_FILENO) {
        close(null_fd);
      }

      // On success, the status pipe is closed by exec.
      execv(argv[0], argv.data());
      report_and_exit(status_fd, errno);
    }

  } // namespace

  pid_t ProcessSpawner::spawn(const std::string& path, const std::vector<std::string>& arguments)
  {
    // Prepared before fork - the child does not allocate.
    std::vector<char*> argv;
    argv.reserve(arguments.size() + 2);
    argv.push_back(const_cast<char*>(path.c_str()));
    for (const auto& arg : arguments) {
      argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    int status_pipe[2];
    if (pipe2(status_pipe, O_CLOEXEC) == -1) {
      throw common::SpawnFailed{fmt::format(
          "Could not create the exec status pipe, {}", common::util::errno_message(errno)
      )};
    }

    pid_t pid = fork();
    if (pid < 0) {
      int err = errno;
      common::util::expect_zero(close(status_pipe[0]));
      common::util::expect_zero(close(status_pipe[1]));
      throw common::SpawnFailed{
          fmt::format("Fork failed, {}", common::util::errno_message(err))};
    }

    if (pid == 0) {
      close(status_pipe[0]);
      exec_child(status_pipe[1], argv);
    }

    common::util::expect_zero(close(status_pipe[1]));

    return await_exec(pid, status_pipe[0], path);
  }

  pid_t ProcessSpawner::await_exec(pid_t pid, int status_fd, const std::string& path)
  {
    // EOF means exec succeeded; otherwise the child sends its errno.
    int child_errno = 0;
    ssize_t read_bytes = 0;
    do {
      read_bytes = read(status_fd, &child_errno, sizeof(child_errno));
    } while (read_bytes == -1 && errno == EINTR);
    int read_errno = errno;
    common::util::expect_zero(close(status_fd));

    if (read_bytes == 0) {
      spdlog::info("Started instance {} with PID {}", path, pid);
      return pid;
    }

    if (read_bytes == static_cast<ssize_t>(sizeof(child_errno))) {
      int status = 0;
      common::util::expect_other(waitpid(pid, &status, 0), -1);
      throw common::SpawnFailed{fmt::format(
          "Could not execute {}, {}", path, common::util::errno_message(child_errno)
      )};
    }

    // The child might still exec - do not leave it behind.
    common::util::expect_zero(kill(pid, SIGKILL));
    int status = 0;
    common::util::expect_other(waitpid(pid, &status, 0), -1);

    throw common::SpawnFailed{fmt::format(
        "Could not confirm that {} started (PID {}), read {} bytes, {}", path, pid, read_bytes,
        common::util::errno_message(read_errno)
    )};
  }

} // namespace solo::launcher

#include <solo/common/exceptions.hpp>
#include <solo/launcher/spawner.hpp>

#include "../utils.hpp"

#include <chrono>
#include <cstring>
#include <filesystem>
#include <string>

#include <gtest/gtest.h>

#include <cerrno>
#include <csignal>
#include <sys/wait.h>
#include <unistd.h>

using namespace solo::launcher;

TEST(Spawner, SpawnWithArguments)
{
  solo::tests::TemporaryDirectory dir;
  auto instance = solo::tests::write_instance_script(dir.path / "instance");

  std::vector<std::string> args{"foo", "", "with space", "quote\"d", "back\\slash"};

  ProcessSpawner spawner;
  pid_t pid = spawner.spawn(instance.string(), args);
  ASSERT_GT(pid, 0);
  EXPECT_EQ(solo::tests::wait_for_exit(pid), 0);

  std::vector<std::string> expected{instance.string()};
  expected.insert(expected.end(), args.begin(), args.end());
  EXPECT_EQ(solo::tests::read_lines(dir.path / "argv.txt"), expected);
}

TEST(Spawner, SpawnDetachesStreams)
{
  solo::tests::TemporaryDirectory dir;
  auto instance = solo::tests::write_instance_script(dir.path / "instance");

  ProcessSpawner spawner;
  pid_t pid = spawner.spawn(instance.string(), {});
  EXPECT_EQ(solo::tests::wait_for_exit(pid), 0);

  EXPECT_EQ(solo::tests::read_lines(dir.path / "argv.txt"), std::vector<std::string>{instance.string()});
  EXPECT_EQ(solo::tests::read_lines(dir.path / "stdout.txt"), std::vector<std::string>{"/dev/null"});
}

TEST(Spawner, DoesNotWaitForInstance)
{
  solo::tests::TemporaryDirectory dir;
  auto instance = solo::tests::write_instance_script(dir.path / "instance", "exec sleep 30\n");

  ProcessSpawner spawner;
  auto begin = std::chrono::steady_clock::now();
  pid_t pid = spawner.spawn(instance.string(), {"foo"});
  auto elapsed = std::chrono::steady_clock::now() - begin;

  EXPECT_LT(elapsed, std::chrono::seconds{10});

  kill(pid, SIGKILL);
  solo::tests::wait_for_exit(pid);
}

TEST(Spawner, MissingExecutable)
{
  solo::tests::TemporaryDirectory dir;

  ProcessSpawner spawner;
  try {
    spawner.spawn((dir.path / "missing").string(), {"foo"});
    FAIL() << "Expected SpawnFailed";
  } catch (solo::common::SoloException& exc) {
    EXPECT_EQ(exc.kind(), solo::common::ErrorKind::SPAWN_FAILED);
    EXPECT_NE(std::string{exc.what()}.find(strerror(ENOENT)), std::string::npos);
  }
}

TEST(Spawner, NotExecutable)
{
  solo::tests::TemporaryDirectory dir;
  auto instance = solo::tests::write_instance_script(dir.path / "instance");
  std::filesystem::permissions(
      instance, std::filesystem::perms::owner_read | std::filesystem::perms::owner_write,
      std::filesystem::perm_options::replace
  );

  ProcessSpawner spawner;
  EXPECT_THROW(spawner.spawn(instance.string(), {}), solo::common::SpawnFailed);
  EXPECT_FALSE(std::filesystem::exists(dir.path / "argv.txt"));
}

TEST(Spawner, RestoresDefaultSigpipe)
{
  solo::tests::TemporaryDirectory dir;
  auto instance = solo::tests::write_instance_script(
      dir.path / "instance", "grep SigIgn /proc/$$/status | cut -f2 > \"$dir/sigign.txt\"\n"
  );

  // Same disposition as the launcher's main.
  solo::tests::ignore_sigpipe();

  ProcessSpawner spawner;
  pid_t pid = spawner.spawn(instance.string(), {});
  EXPECT_EQ(solo::tests::wait_for_exit(pid), 0);

  auto lines = solo::tests::read_lines(dir.path / "sigign.txt");
  ASSERT_EQ(lines.size(), 1u);
  unsigned long long ignored = std::stoull(lines[0], nullptr, 16);
  EXPECT_EQ(ignored & (1ull << (SIGPIPE - 1)), 0u) << "SigIgn " << lines[0];
}

TEST(Spawner, IncompleteExecStatusReapsChild)
{
  int status_pipe[2];
  ASSERT_EQ(pipe(status_pipe), 0);

  pid_t pid = fork();
  ASSERT_NE(pid, -1);
  if (pid == 0) {
    close(status_pipe[0]);
    char partial = 1;
    ssize_t ret = write(status_pipe[1], &partial, sizeof(partial));
    // Only a signal ends this child.
    pause();
    _exit(ret == 1 ? 0 : 1);
  }
  close(status_pipe[1]);

  EXPECT_THROW(
      ProcessSpawner::await_exec(pid, status_pipe[0], "instance"), solo::common::SpawnFailed
  );

  // Killed and reaped before the exception left await_exec.
  errno = 0;
  EXPECT_EQ(waitpid(pid, nullptr, WNOHANG), -1);
  EXPECT_EQ(errno, ECHILD);
}

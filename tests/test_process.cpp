#include <gtest/gtest.h>

#include <chrono>
#include <csignal>
#include <string>
#include <system_error>
#include <thread>

#include "ffstream/process.hpp"
#include "test_helpers.hpp"

using namespace ffstream;
using namespace ffstream::test;

namespace {

std::string read_all(FileHandle &handle) {
  std::string out;
  uint8_t buf[256];
  while (size_t n = handle.read_some(buf, sizeof(buf)))
    out.append(reinterpret_cast<const char *>(buf), n);
  return out;
}

} // anonymous namespace

TEST(ChildProcessTest, PipesAndExitStatus) {
  auto child = ChildProcess::spawn(
      {"/bin/sh", "-c", "echo hello; echo oops >&2; exit 3"});
  FileHandle out = child.take_stdout();
  FileHandle err = child.take_stderr();
  EXPECT_EQ(read_all(out), "hello\n");
  EXPECT_EQ(read_all(err), "oops\n");
  EXPECT_EQ(child.wait(), 3);
  EXPECT_EQ(child.wait(), 3);
}

TEST(ChildProcessTest, ExecFailureThrows) {
  try {
    ChildProcess::spawn({"/nonexistent/ffstream-test-binary"});
    FAIL() << "expected std::system_error";
  } catch (const std::system_error &e) {
    EXPECT_EQ(e.code().value(), ENOENT);
  }
}

TEST(ChildProcessTest, EmptyCommandLineThrows) {
  EXPECT_THROW(ChildProcess::spawn({}), std::invalid_argument);
}

TEST(ChildProcessTest, KillAndTryWait) {
  auto child = ChildProcess::spawn({"/bin/sh", "-c", "exec sleep 30"});
  EXPECT_FALSE(child.try_wait().has_value());
  EXPECT_TRUE(child.kill());
  EXPECT_EQ(child.wait(), 128 + SIGKILL);
  ASSERT_TRUE(child.try_wait().has_value());
  EXPECT_FALSE(child.kill());
}

TEST(ChildProcessTest, KillDuringBlockingWait) {
  auto child = ChildProcess::spawn({"/bin/sh", "-c", "exec sleep 30"});

  int first = -1;
  int second = -1;
  std::thread waiter_a([&] { first = child.wait(); });
  std::thread waiter_b([&] { second = child.wait(); });
  std::this_thread::sleep_for(std::chrono::milliseconds(50));

  EXPECT_TRUE(child.kill());
  waiter_a.join();
  waiter_b.join();

  EXPECT_EQ(first, 128 + SIGKILL);
  EXPECT_EQ(second, 128 + SIGKILL);
  EXPECT_FALSE(child.kill());
}

TEST(ChildProcessTest, QuitWritesToStdin) {
  auto child =
      ChildProcess::spawn({"/bin/sh", "-c", "read line; echo got:$line"});
  EXPECT_TRUE(child.quit());
  FileHandle out = child.take_stdout();
  EXPECT_EQ(read_all(out), "got:q\n");
  EXPECT_EQ(child.wait(), 0);
}

TEST(ChildProcessTest, EventsReadStderr) {
  auto child = ChildProcess::spawn(
      {"/bin/sh", "-c",
       "printf '[info] ffmpeg version 9.9 Copyright\\n[warning] hmm\\n' >&2"});
  {
    EventStream stream = child.events();
    auto events = drain(stream);
    ASSERT_EQ(events.size(), 3u);
    EXPECT_EQ(std::get<VersionEvent>(events[0]).version, "9.9");
    EXPECT_EQ(std::get<LogEvent>(events[1]).level, LogLevel::Warning);
    EXPECT_TRUE(std::holds_alternative<LogEofEvent>(events[2]));
  }
  EXPECT_EQ(child.wait(), 0);
  EXPECT_THROW(child.events(), std::logic_error);
}

TEST(ChildProcessTest, StreamTerminateKillsChild) {
  auto child = ChildProcess::spawn({"/bin/sh", "-c", "exec sleep 30"});
  {
    EventStream stream = child.events();
    stream.terminate();
    auto events = drain(stream);
    ASSERT_EQ(events.size(), 1u);
    EXPECT_TRUE(std::holds_alternative<LogEofEvent>(events[0]));
  }
  EXPECT_EQ(child.wait(), 128 + SIGKILL);
}

TEST(ChildProcessTest, DestructorReapsRunningChild) {
  pid_t pid;
  {
    auto child = ChildProcess::spawn({"/bin/sh", "-c", "exec sleep 30"});
    pid = child.pid();
  }
  /// Reaped: no longer our child
  EXPECT_EQ(::kill(pid, 0), -1);
}

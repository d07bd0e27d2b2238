/**
 * @file process.cpp
 * @brief fork/exec with piped stdio and an exec status pipe
 *
 * @details Exec failure in the child is reported by writing errno to a
 *          close-on-exec pipe. A successful exec closes it, so the parent
 *          reading end of file means the program is running.
 */

#include "ffstream/process.hpp"

#include <cerrno>
#include <csignal>
#include <stdexcept>
#include <system_error>

#include <sys/wait.h>
#include <unistd.h>

#include <fmt/core.h>

#include "ffstream/logging.hpp"

namespace ffstream {

namespace {

int decode_status(int raw) {
  if (WIFEXITED(raw))
    return WEXITSTATUS(raw);
  if (WIFSIGNALED(raw))
    return 128 + WTERMSIG(raw);
  return raw;
}

} // anonymous namespace

// **---- Spawn ----**

ChildProcess ChildProcess::spawn(const std::vector<std::string> &argv) {
  if (argv.empty()) {
    throw std::invalid_argument("Cannot spawn an empty command line");
  }

  /// Built before fork: the child may only call async-signal-safe functions
  std::vector<char *> c_argv;
  c_argv.reserve(argv.size() + 1);
  for (const auto &arg : argv)
    c_argv.push_back(const_cast<char *>(arg.c_str()));
  c_argv.push_back(nullptr);

  auto [in_r, in_w] = FileHandle::make_pipe();
  auto [out_r, out_w] = FileHandle::make_pipe();
  auto [err_r, err_w] = FileHandle::make_pipe();
  auto [status_r, status_w] = FileHandle::make_pipe();

  pid_t pid = ::fork();
  if (pid == -1) {
    throw std::system_error(errno, std::generic_category(), "fork");
  }

  if (pid == 0) {
    /// dup2 clears close-on-exec on the target descriptor
    if (::dup2(in_r.get(), STDIN_FILENO) == -1 ||
        ::dup2(out_w.get(), STDOUT_FILENO) == -1 ||
        ::dup2(err_w.get(), STDERR_FILENO) == -1) {
      int err = errno;
      (void)!::write(status_w.get(), &err, sizeof(err));
      ::_exit(127);
    }
    ::signal(SIGPIPE, SIG_DFL);
    ::execvp(c_argv[0], c_argv.data());
    int err = errno;
    (void)!::write(status_w.get(), &err, sizeof(err));
    ::_exit(127);
  }

  /// Parent: drop the child's ends so EOF propagates
  in_r.reset();
  out_w.reset();
  err_w.reset();
  status_w.reset();

  int child_errno = 0;
  bool exec_failed = status_r.read_exact(
      reinterpret_cast<uint8_t *>(&child_errno), sizeof(child_errno));

  auto state = std::make_shared<State>();
  state->pid = pid;
  ChildProcess child(state, std::move(in_w), std::move(out_r),
                     std::move(err_r));

  if (exec_failed) {
    child.wait();
    throw std::system_error(child_errno, std::generic_category(),
                            fmt::format("exec {}", argv[0]));
  }

  LOG_DEBUG("Spawned {} (pid {})", argv[0], pid);
  return child;
}

ChildProcess::ChildProcess(std::shared_ptr<State> state, FileHandle in,
                           FileHandle out, FileHandle err)
    : state_(std::move(state)), stdin_(std::move(in)),
      stdout_(std::move(out)), stderr_(std::move(err)) {}

ChildProcess::~ChildProcess() {
  if (!state_)
    return;
  stdin_.reset();
  {
    std::lock_guard<std::mutex> lock(state_->mutex);
    if (state_->reaped)
      return;
  }
  kill_state(*state_);
  try {
    wait();
  } catch (const std::system_error &e) {
    LOG_WARN("Failed to reap child {}: {}", state_->pid, e.what());
  }
}

pid_t ChildProcess::pid() const { return state_->pid; }

EventStream ChildProcess::events() {
  if (!stderr_) {
    throw std::logic_error("stderr of the child was already taken");
  }
  std::weak_ptr<State> weak = state_;
  return EventStream(take_stderr(), take_stdout(), take_stdin(), [weak] {
    if (auto state = weak.lock())
      kill_state(*state);
  });
}

// **---- Lifecycle ----**

bool ChildProcess::kill_state(State &state) {
  std::lock_guard<std::mutex> lock(state.mutex);
  if (state.reaped)
    return false;
  /// ESRCH: exited but not reaped yet, nothing to do
  return ::kill(state.pid, SIGKILL) == 0;
}

bool ChildProcess::kill() { return kill_state(*state_); }

bool ChildProcess::quit() {
  if (!stdin_)
    return false;
  try {
    stdin_.write_all("q\n", 2);
  } catch (const std::system_error &e) {
    LOG_WARN("Failed to send quit command: {}", e.what());
    return false;
  }
  return true;
}

int ChildProcess::wait() {
  pid_t pid;
  {
    std::lock_guard<std::mutex> lock(state_->mutex);
    if (state_->reaped)
      return state_->status;
    pid = state_->pid;
  }

  /// Block until exit without reaping; the pid stays a zombie, so a
  /// concurrent kill_state cannot hit a recycled pid
  siginfo_t info{};
  int r;
  do {
    r = ::waitid(P_PID, static_cast<id_t>(pid), &info, WEXITED | WNOWAIT);
  } while (r == -1 && errno == EINTR);
  int wait_errno = (r == -1) ? errno : 0;

  std::lock_guard<std::mutex> lock(state_->mutex);
  /// ECHILD: another waiter reaped it first
  if (state_->reaped)
    return state_->status;
  if (wait_errno != 0) {
    throw std::system_error(wait_errno, std::generic_category(), "waitid");
  }

  int raw = 0;
  pid_t reaped;
  do {
    reaped = ::waitpid(pid, &raw, 0);
  } while (reaped == -1 && errno == EINTR);
  if (reaped == -1) {
    throw std::system_error(errno, std::generic_category(), "waitpid");
  }
  state_->reaped = true;
  state_->status = decode_status(raw);
  return state_->status;
}

std::optional<int> ChildProcess::try_wait() {
  std::lock_guard<std::mutex> lock(state_->mutex);
  if (state_->reaped)
    return state_->status;

  int raw = 0;
  pid_t r = ::waitpid(state_->pid, &raw, WNOHANG);
  if (r == -1) {
    throw std::system_error(errno, std::generic_category(), "waitpid");
  }
  if (r == 0)
    return std::nullopt;

  state_->reaped = true;
  state_->status = decode_status(raw);
  return state_->status;
}

} // namespace ffstream

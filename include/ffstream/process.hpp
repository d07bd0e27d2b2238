/**
 * @file process.hpp
 * @brief Minimal POSIX child process with three piped standard streams
 *
 * @details ChildProcess::spawn forks and execs a program with stdin, stdout
 *          and stderr connected to pipes owned by the parent. The handles
 *          can be taken individually, or all at once by events(), which
 *          wires them into an EventStream.
 *
 * @note Linux/POSIX only (fork, execvp, pipe2, waitpid).
 */

#ifndef FFSTREAM_PROCESS_HPP
#define FFSTREAM_PROCESS_HPP

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <sys/types.h>

#include "event_stream.hpp"
#include "file_handle.hpp"

namespace ffstream {

/**
 * @class ChildProcess
 * @brief Owns a running child; kills and reaps it on destruction.
 */
class ChildProcess {
public:
  /**
   * @brief Start argv[0] (resolved through PATH) with argv.
   * @throws std::system_error if pipes, fork or exec fail
   * @throws std::invalid_argument if argv is empty
   */
  static ChildProcess spawn(const std::vector<std::string> &argv);

  ~ChildProcess();

  /// Disable copy
  ChildProcess(const ChildProcess &) = delete;
  ChildProcess &operator=(const ChildProcess &) = delete;

  /// Enable move construction
  ChildProcess(ChildProcess &&other) noexcept = default;
  ChildProcess &operator=(ChildProcess &&other) = delete;

  pid_t pid() const;

  // **---- Handles (ownership transfer) ----**

  FileHandle take_stdin() { return std::move(stdin_); }
  FileHandle take_stdout() { return std::move(stdout_); }
  FileHandle take_stderr() { return std::move(stderr_); }

  /**
   * @brief Move all three handles into an event stream.
   * @note The stream's terminate callback kills this child, and does
   *       nothing once this object is gone.
   * @throws std::logic_error if stderr was already taken
   */
  EventStream events();

  // **---- Lifecycle ----**

  /// Send SIGKILL. @return false if already reaped
  bool kill();

  /**
   * @brief Ask ffmpeg to quit by writing "q\n" to its stdin.
   * @return false if stdin was taken or the write failed
   */
  bool quit();

  /**
   * @brief Block until the child exits.
   * @return Exit code, or 128 + signal number if it was killed
   * @throws std::system_error if waitpid fails
   */
  int wait();

  /// Non-blocking wait; nullopt while the child is running
  std::optional<int> try_wait();

private:
  struct State {
    std::mutex mutex;
    pid_t pid = -1;
    bool reaped = false;
    int status = 0;
  };

  ChildProcess(std::shared_ptr<State> state, FileHandle in, FileHandle out,
               FileHandle err);

  static bool kill_state(State &state);

  std::shared_ptr<State> state_;
  FileHandle stdin_;
  FileHandle stdout_;
  FileHandle stderr_;
};

} // namespace ffstream

#endif // FFSTREAM_PROCESS_HPP

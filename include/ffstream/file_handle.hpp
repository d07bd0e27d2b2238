/**
 * @file file_handle.hpp
 * @brief RAII wrapper around a POSIX file descriptor
 *
 * @details FileHandle owns one descriptor (usually a pipe end connected to
 *          the ffmpeg child) and closes it on destruction. Ownership moves
 *          between the child process, the orchestrator and the workers;
 *          a handle is never shared.
 */

#ifndef FFSTREAM_FILE_HANDLE_HPP
#define FFSTREAM_FILE_HANDLE_HPP

#include <cstddef>
#include <cstdint>
#include <utility>

namespace ffstream {

/**
 * @class FileHandle
 * @brief Move-only owner of a file descriptor.
 *
 * @note Read/write helpers retry on EINTR and throw std::system_error for
 *       any other failure. End of file is never an error.
 */
class FileHandle {
public:
  FileHandle() = default;
  explicit FileHandle(int fd) : fd_(fd) {}
  ~FileHandle();

  /// Disable copy
  FileHandle(const FileHandle &) = delete;
  FileHandle &operator=(const FileHandle &) = delete;

  /// Enable move
  FileHandle(FileHandle &&other) noexcept;
  FileHandle &operator=(FileHandle &&other) noexcept;

  int get() const { return fd_; }
  bool is_valid() const { return fd_ != -1; }
  explicit operator bool() const { return is_valid(); }

  /// Give up ownership without closing
  int release();

  /// Close the current descriptor (if any) and adopt fd
  void reset(int fd = -1);

  /**
   * @brief Read at most len bytes.
   * @return Bytes read, 0 at end of file
   */
  size_t read_some(uint8_t *buf, size_t len);

  /**
   * @brief Fill buf completely.
   * @return false if end of file came first (partial data is discarded)
   */
  bool read_exact(uint8_t *buf, size_t len);

  /**
   * @brief Write all of data.
   * @note SIGPIPE is ignored process-wide on first use so that writing to
   *       an exited child surfaces as EPIPE instead of killing the caller.
   */
  void write_all(const void *data, size_t len);

  /// Create a close-on-exec pipe: {read end, write end}
  static std::pair<FileHandle, FileHandle> make_pipe();

private:
  int fd_ = -1;
};

} // namespace ffstream

#endif // FFSTREAM_FILE_HANDLE_HPP

/**
 * @file file_handle.cpp
 * @brief FileHandle implementation
 */

#include "ffstream/file_handle.hpp"

#include <cerrno>
#include <csignal>
#include <mutex>
#include <system_error>

#include <fcntl.h>
#include <unistd.h>

namespace ffstream {

namespace {

void ignore_sigpipe() {
  static std::once_flag once;
  std::call_once(once, [] { std::signal(SIGPIPE, SIG_IGN); });
}

} // anonymous namespace

// **---- Lifetime ----**

FileHandle::~FileHandle() { reset(); }

FileHandle::FileHandle(FileHandle &&other) noexcept : fd_(other.fd_) {
  other.fd_ = -1;
}

FileHandle &FileHandle::operator=(FileHandle &&other) noexcept {
  if (this != &other) {
    reset(other.fd_);
    other.fd_ = -1;
  }
  return *this;
}

int FileHandle::release() {
  int fd = fd_;
  fd_ = -1;
  return fd;
}

void FileHandle::reset(int fd) {
  if (fd_ != -1) {
    ::close(fd_);
  }
  fd_ = fd;
}

// **---- I/O ----**

size_t FileHandle::read_some(uint8_t *buf, size_t len) {
  for (;;) {
    ssize_t n = ::read(fd_, buf, len);
    if (n >= 0)
      return static_cast<size_t>(n);
    if (errno == EINTR)
      continue;
    throw std::system_error(errno, std::generic_category(), "read");
  }
}

bool FileHandle::read_exact(uint8_t *buf, size_t len) {
  size_t filled = 0;
  while (filled < len) {
    size_t n = read_some(buf + filled, len - filled);
    if (n == 0)
      return false;
    filled += n;
  }
  return true;
}

void FileHandle::write_all(const void *data, size_t len) {
  ignore_sigpipe();

  const auto *p = static_cast<const uint8_t *>(data);
  while (len > 0) {
    ssize_t n = ::write(fd_, p, len);
    if (n < 0) {
      if (errno == EINTR)
        continue;
      throw std::system_error(errno, std::generic_category(), "write");
    }
    p += n;
    len -= static_cast<size_t>(n);
  }
}

std::pair<FileHandle, FileHandle> FileHandle::make_pipe() {
  int fds[2];
  if (::pipe2(fds, O_CLOEXEC) == -1) {
    throw std::system_error(errno, std::generic_category(), "pipe2");
  }
  return {FileHandle(fds[0]), FileHandle(fds[1])};
}

} // namespace ffstream

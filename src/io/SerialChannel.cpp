/* @file SerialChannel.cpp
 * @brief raw termios line transport to the device-side machine - fd ownership, CRLF framing,
 *        poll-based timeouts - POSIX compliant
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstring> // for strerror
#include <iostream>
#include <utility>

// Linux headers
#include <errno.h> // Error integer and strerror() function
#include <fcntl.h> // Contains file controls like O_RDWR
#include <poll.h>
#include <unistd.h> // write(), read(), close()

// cloneflow headers
#include "io/SerialChannel.hpp"

using namespace cloneflow::io;

SerialChannel::~SerialChannel() { close(); }

SerialChannel::SerialChannel(SerialChannel&& other) noexcept
    : fd_(std::exchange(other.fd_, -1)),
      hungUp_(other.hungUp_.exchange(false)),
      rx_buffer_(std::move(other.rx_buffer_)) {}

SerialChannel& SerialChannel::operator=(SerialChannel&& other) noexcept {
  if (this != &other) {
    close();
    fd_ = std::exchange(other.fd_, -1);
    hungUp_ = other.hungUp_.exchange(false);
    rx_buffer_ = std::move(other.rx_buffer_);
  }
  return *this;
}

bool SerialChannel::open(const std::string& dev, speed_t baud) {
  close();
  rx_buffer_.clear();
  hungUp_ = false;

  // open non-blocking, dont become ctrl-TTY
  fd_ = ::open(dev.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
  if (fd_ < 0) {
    std::cerr << "[SerialChannel] open " << dev << ": " << strerror(errno) << '\n';
    return false;
  }

  struct termios tty;
  if (tcgetattr(fd_, &tty) != 0) {
    std::cerr << "[SerialChannel] tcgetattr: " << strerror(errno) << '\n';
    close();
    return false;
  }

  cfmakeraw(&tty);
  tty.c_cflag &= ~CSIZE;
  tty.c_cflag |= CS8 | CLOCAL | CREAD;
  tty.c_cflag &= ~CRTSCTS;
  tty.c_iflag &= ~(IXON | IXOFF | IXANY);

  cfsetispeed(&tty, baud);
  cfsetospeed(&tty, baud);

  if (tcsetattr(fd_, TCSANOW, &tty) != 0) {
    std::cerr << "[SerialChannel] tcsetattr: " << strerror(errno) << '\n';
    close();
    return false;
  }
  tcflush(fd_, TCIOFLUSH); // stale bytes from a previous session
  return true;
}

bool SerialChannel::writeLine(const std::string& line) {
  std::lock_guard<std::mutex> lock(writeMtx_);
  if (fd_ < 0 || hungUp_)
    return false;

  std::string out = line;
  if (!out.ends_with("\r\n"))
    out += "\r\n";

  std::size_t total = 0;
  while (total < out.size()) {
    ssize_t written = ::write(fd_, out.data() + total, out.size() - total);
    if (written > 0) {
      total += static_cast<std::size_t>(written);
    } else if (written == -1 && errno == EINTR) {
      continue;
    } else if (written == -1 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
      if (!waitWritable(1000)) {
        std::cerr << "[SerialChannel] write stalled, giving up\n";
        return false;
      }
    } else {
      std::cerr << "[SerialChannel] write: " << strerror(errno) << '\n';
      return false;
    }
  }
  return true;
}

// -------------------------------------------------------------------
// SerialChannel::readLine
// A line already sitting in rx_buffer_ is returned without touching the fd.
// -------------------------------------------------------------------
std::optional<std::string> SerialChannel::readLine(std::chrono::milliseconds timeout) {
  if (auto buffered = takeLine())
    return buffered;
  if (fd_ < 0 || hungUp_)
    return std::nullopt;

  char temp[512];
  pollfd pfd{ fd_, POLLIN, 0 };

  const auto deadline = std::chrono::steady_clock::now() + timeout;

  while (std::chrono::steady_clock::now() < deadline) {
    auto ms_left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    int rc = ::poll(&pfd, 1, static_cast<int>(ms_left.count()));
    if (rc == -1) {
      if (errno == EINTR)
        continue;
      std::cerr << "[SerialChannel] poll: " << strerror(errno) << '\n';
      return std::nullopt;
    }
    if (rc == 0)
      break; // timeout

    if (pfd.revents & (POLLHUP | POLLERR | POLLNVAL)) {
      if (!(pfd.revents & POLLIN)) { // hung up with nothing left to drain
        hungUp_ = true;
        return std::nullopt;
      }
    }

    if (pfd.revents & POLLIN) {
      ssize_t n = ::read(fd_, temp, sizeof(temp));
      if (n > 0) {
        rx_buffer_.append(temp, static_cast<std::size_t>(n));
      } else if (n == 0) { // EOF / disconnect
        hungUp_ = true;
        return takeLine();
      } else if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
        continue;
      } else {
        std::cerr << "[SerialChannel] read: " << strerror(errno) << '\n';
        hungUp_ = true;
        return std::nullopt;
      }

      if (auto line = takeLine())
        return line;

      if (rx_buffer_.size() > kMaxBuffered) {
        std::cerr << "[SerialChannel] " << rx_buffer_.size() << " bytes without CRLF, discarding\n";
        rx_buffer_.clear();
      }
    }
  }
  return std::nullopt; // timeout/partial
}

void SerialChannel::close() {
  std::lock_guard<std::mutex> lock(writeMtx_);
  if (fd_ >= 0)
    ::close(fd_);
  fd_ = -1;
}

std::optional<std::string> SerialChannel::takeLine() {
  auto pos = rx_buffer_.find("\r\n");
  if (pos == std::string::npos)
    return std::nullopt;
  std::string line = rx_buffer_.substr(0, pos);
  rx_buffer_.erase(0, pos + 2); // remove line + CRLF
  return line;
}

bool SerialChannel::waitWritable(int ms) {
  pollfd pfd{ fd_, POLLOUT, 0 };
  int rc;
  do {
    rc = ::poll(&pfd, 1, ms);
  } while (rc == -1 && errno == EINTR);
  return rc > 0 && (pfd.revents & POLLOUT);
}

namespace cloneflow::io {

  std::optional<speed_t> baudFromInt(int baud) {
    switch (baud) {
    case 9600:
      return B9600;
    case 19200:
      return B19200;
    case 38400:
      return B38400;
    case 57600:
      return B57600;
    case 115200:
      return B115200;
    case 230400:
      return B230400;
    case 460800:
      return B460800;
    case 921600:
      return B921600;
    default:
      return std::nullopt;
    }
  }

} // namespace cloneflow::io

/* @file SerialChannel.cpp
 * @brief IO abstraction layer that wraps ttyUSBx - handles file descriptor, framing, line io and RAII - POSIX compliant
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstddef>
#include <cstring> // for strerror

// Linux headers
#include <errno.h> // Error integer and strerror() function
#include <fcntl.h> // Contains file controls like O_RDWR
#include <poll.h>
#include <unistd.h> // write(), read(), close()

// tvlink headers
#include "io/SerialChannel.hpp"

using namespace tvlink::io;

std::optional<speed_t> tvlink::io::toSpeed(int baud) {
  switch (baud) {
  case 1200:
    return B1200;
  case 2400:
    return B2400;
  case 4800:
    return B4800;
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
  default:
    return std::nullopt;
  }
}

SerialChannel::~SerialChannel() { close(); }

bool SerialChannel::open(const std::string& dev, int baud, const FrameConfig& frame) {
  close();
  setError({});
  rx_buffer_.clear();
  hungUp_ = false;

  const auto speed = toSpeed(baud);
  if (!speed) {
    setError("unsupported baud rate " + std::to_string(baud));
    return false;
  }

  // open non-blocking, dont become ctrl-TTY
  fd_ = ::open(dev.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
  if (fd_ < 0) {
    fail("open");
    return false;
  }

  // fetch current attrs
  struct termios tty;
  if (tcgetattr(fd_, &tty) != 0) {
    fail("tcgetattr");
    close();
    return false;
  }

  cfmakeraw(&tty);
  tty.c_cflag |= (CLOCAL | CREAD);

  tty.c_cflag &= ~CSIZE;
  switch (frame.dataBits) {
  case 5:
    tty.c_cflag |= CS5;
    break;
  case 6:
    tty.c_cflag |= CS6;
    break;
  case 7:
    tty.c_cflag |= CS7;
    break;
  default:
    tty.c_cflag |= CS8;
    break;
  }

  tty.c_cflag &= ~(PARENB | PARODD);
  if (frame.parity == Parity::Even)
    tty.c_cflag |= PARENB;
  else if (frame.parity == Parity::Odd)
    tty.c_cflag |= (PARENB | PARODD);

  if (frame.stopBits == 2)
    tty.c_cflag |= CSTOPB;
  else
    tty.c_cflag &= ~CSTOPB;

  if (frame.hardwareFlowControl)
    tty.c_cflag |= CRTSCTS;
  else
    tty.c_cflag &= ~CRTSCTS;
  tty.c_iflag &= ~(IXON | IXOFF | IXANY);

  tty.c_cc[VMIN] = 0;
  tty.c_cc[VTIME] = 0;

  cfsetispeed(&tty, *speed);
  cfsetospeed(&tty, *speed);

  if (tcsetattr(fd_, TCSANOW, &tty) != 0) {
    fail("tcsetattr");
    close();
    return false;
  }

  delimiter_ = frame.delimiter;
  writeStall_ = frame.writeStallTimeout;
  return true;
}

bool SerialChannel::write(const std::string& bytes) {

  if (!isOpen()) {
    setError("write on closed channel");
    return false;
  }

  // Good Pattern for POSIX write loop (required if the tty blocks for instance)
  // every accepted byte re-arms the stall deadline
  std::size_t total = 0;
  auto stallDeadline = std::chrono::steady_clock::now() + writeStall_;
  while (total < bytes.size()) {
    ssize_t written = ::write(fd_, bytes.data() + total, bytes.size() - total);
    if (written > 0) {
      total += static_cast<std::size_t>(written);
      stallDeadline = std::chrono::steady_clock::now() + writeStall_;
    } else if (written == -1 && errno == EINTR) {
      continue; // try again
    } else if (written == -1 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
      const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
          stallDeadline - std::chrono::steady_clock::now());
      if (left.count() <= 0) {
        setError("write stalled: " + std::to_string(total) + " of " +
                 std::to_string(bytes.size()) + " bytes sent");
        return false;
      }
      pollfd pfd{ fd_, POLLOUT, 0 };
      int rc = ::poll(&pfd, 1, static_cast<int>(left.count()));
      if (rc == -1 && errno != EINTR) {
        fail("poll");
        return false;
      }
      if (rc > 0 && (pfd.revents & (POLLERR | POLLHUP | POLLNVAL))) {
        setError("link hung up during write");
        return false;
      }
    } else {
      fail("write");
      return false;
    }
  }

  return true;
}

// -------------------------------------------------------------------
// SerialChannel::readLine
// Non-blocking line reader with timeout and internal buffer.
// Returns std::nullopt on timeout, disconnect, or error.
// -------------------------------------------------------------------
std::optional<std::string> SerialChannel::readLine(std::chrono::milliseconds timeout) {
  if (!isOpen())
    return std::nullopt;

  // a previous read may already hold more than one line
  if (auto line = takeLine())
    return line;

  char temp[256];
  pollfd pfd{ fd_, POLLIN, 0 };

  const auto deadline = std::chrono::steady_clock::now() + timeout;

  while (std::chrono::steady_clock::now() < deadline) {

    auto ms_left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    int ms = static_cast<int>(ms_left.count());

    int rc = ::poll(&pfd, 1, ms);
    if (rc == -1) {
      if (errno == EINTR)
        continue; // interrupted → retry
      fail("poll");
      return std::nullopt;
    }
    if (rc == 0)
      break; // timeout

    if (pfd.revents & POLLIN) {
      ssize_t n = ::read(fd_, temp, sizeof(temp));
      if (n > 0) {
        rx_buffer_.append(temp, static_cast<std::size_t>(n));
      } else if (n == 0) { // EOF / disconnect
        setError("end of stream");
        hungUp_ = true;
        return std::nullopt;
      } else if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
        continue; // transient → retry
      } else {
        fail("read");
        hungUp_ = true;
        return std::nullopt;
      }

      if (auto line = takeLine())
        return line;
    } else if (pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) {
      setError("link hung up");
      hungUp_ = true;
      return std::nullopt;
    }
  }
  return std::nullopt; // timeout/partial
}

void SerialChannel::close() {
  if (fd_ >= 0)
    ::close(fd_);
  fd_ = -1;
}

std::optional<std::string> SerialChannel::takeLine() {
  auto pos = rx_buffer_.find(delimiter_);
  if (pos == std::string::npos)
    return std::nullopt;

  std::string line = rx_buffer_.substr(0, pos);
  rx_buffer_.erase(0, pos + 1); // remove line + delimiter
  return line;
}

std::string SerialChannel::lastError() const {
  std::lock_guard<std::mutex> lock(errMtx_);
  return lastError_;
}

void SerialChannel::fail(const char* what) {
  setError(std::string(what) + ": " + std::strerror(errno));
}

void SerialChannel::setError(std::string text) {
  std::lock_guard<std::mutex> lock(errMtx_);
  lastError_ = std::move(text);
}

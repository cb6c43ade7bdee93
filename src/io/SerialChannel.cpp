/* @file SerialChannel.cpp
 * @brief IO abstraction layer that wraps ttyUSBx - handles file descriptor, framing, line io and RAII - POSIX compliant
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstddef>
#include <cstring> // for strerror
#include <iostream>
#include <utility>

// Linux headers
#include <errno.h> // Error integer and strerror() function
#include <fcntl.h> // Contains file controls like O_RDWR
#include <poll.h>
#include <sys/file.h>  // flock()
#include <sys/ioctl.h> // TIOCEXCL
#include <unistd.h>    // write(), read(), close()

// FlowCal headers
#include "io/SerialChannel.hpp"

using namespace flowcal::io;

namespace {

  int msLeft(std::chrono::steady_clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    return left.count() > 0 ? static_cast<int>(left.count()) : 0;
  }

} // namespace

const char* flowcal::io::toString(ChannelError e) {
  switch (e) {
  case ChannelError::None:
    return "none";
  case ChannelError::PortUnavailable:
    return "port unavailable";
  case ChannelError::Timeout:
    return "timeout";
  case ChannelError::Disconnected:
    return "disconnected";
  case ChannelError::Io:
    return "i/o error";
  }
  return "unknown";
}

std::optional<speed_t> flowcal::io::toSpeed(int baudRate) {
  switch (baudRate) {
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
  default:
    return std::nullopt;
  }
}

SerialChannel::~SerialChannel() { close(); }

SerialChannel::SerialChannel(SerialChannel&& other) noexcept
    : fd_(std::exchange(other.fd_, -1)), rx_buffer_(std::move(other.rx_buffer_)),
      terminator_(std::move(other.terminator_)), writeTimeout_(other.writeTimeout_),
      lastError_(other.lastError_) {}

SerialChannel& SerialChannel::operator=(SerialChannel&& other) noexcept {
  if (this != &other) {
    close();
    fd_ = std::exchange(other.fd_, -1);
    rx_buffer_ = std::move(other.rx_buffer_);
    terminator_ = std::move(other.terminator_);
    writeTimeout_ = other.writeTimeout_;
    lastError_ = other.lastError_;
  }
  return *this;
}

bool SerialChannel::open(const SerialSettings& settings) {
  close();
  rx_buffer_.clear();

  // open non-blocking, dont become ctrl-TTY
  fd_ = ::open(settings.port.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
  if (fd_ < 0) {
    std::cerr << "[SerialChannel] error " << errno << " from open(" << settings.port
              << "): " << strerror(errno) << "\n";
    lastError_ = ChannelError::PortUnavailable;
    return false;
  }

  // claim the port: refuse further opens and detect another process holding it
  if (::flock(fd_, LOCK_EX | LOCK_NB) != 0) {
    std::cerr << "[SerialChannel] " << settings.port << " is in use: " << strerror(errno) << "\n";
    close();
    lastError_ = ChannelError::PortUnavailable;
    return false;
  }
  ::ioctl(fd_, TIOCEXCL);

  if (!configure(settings)) {
    close();
    lastError_ = ChannelError::PortUnavailable;
    return false;
  }

  terminator_ = settings.lineTerminator.empty() ? std::string("\n") : settings.lineTerminator;
  writeTimeout_ = settings.writeTimeout;
  lastError_ = ChannelError::None;
  return true;
}

bool SerialChannel::configure(const SerialSettings& settings) {
  auto speed = toSpeed(settings.baudRate);
  if (!speed) {
    std::cerr << "[SerialChannel] no termios speed for baud " << settings.baudRate << "\n";
    return false;
  }

  // fetch current attrs
  struct termios tty;
  if (tcgetattr(fd_, &tty) != 0) {
    std::cerr << "[SerialChannel] error " << errno << " from tcgetattr: " << strerror(errno)
              << "\n";
    return false;
  }

  cfmakeraw(&tty);
  tty.c_cflag |= (CLOCAL | CREAD);
  tty.c_cflag &= ~CSIZE;
  switch (settings.dataBits) {
  case 5:
    tty.c_cflag |= CS5;
    break;
  case 6:
    tty.c_cflag |= CS6;
    break;
  case 7:
    tty.c_cflag |= CS7;
    break;
  case 8:
    tty.c_cflag |= CS8;
    break;
  default:
    std::cerr << "[SerialChannel] unsupported data bits " << settings.dataBits << "\n";
    return false;
  }

  switch (settings.parity) {
  case Parity::None:
    tty.c_cflag &= ~PARENB;
    break;
  case Parity::Even:
    tty.c_cflag |= PARENB;
    tty.c_cflag &= ~PARODD;
    break;
  case Parity::Odd:
    tty.c_cflag |= (PARENB | PARODD);
    break;
  }

  if (settings.stopBits == StopBits::Two)
    tty.c_cflag |= CSTOPB;
  else
    tty.c_cflag &= ~CSTOPB;

  tty.c_cflag &= ~CRTSCTS;
  tty.c_iflag &= ~(IXON | IXOFF | IXANY);

  cfsetispeed(&tty, *speed);
  cfsetospeed(&tty, *speed);

  if (tcsetattr(fd_, TCSANOW, &tty) != 0) {
    std::cerr << "[SerialChannel] error " << errno << " from tcsetattr: " << strerror(errno)
              << "\n";
    return false;
  }
  return true;
}

bool SerialChannel::writeLine(const std::string& line) {

  if (fd_ < 0) {
    lastError_ = ChannelError::Disconnected;
    return false;
  }

  std::string out = line;
  if (!out.ends_with(terminator_)) {
    out += terminator_;
  }

  const auto deadline = std::chrono::steady_clock::now() + writeTimeout_;
  pollfd pfd{ fd_, POLLOUT, 0 };

  std::size_t total = 0;
  while (total < out.size()) {
    ssize_t written = ::write(fd_, out.data() + total, out.size() - total);
    if (written > 0) {
      total += static_cast<std::size_t>(written);
      continue;
    }
    if (written == -1 && errno == EINTR) {
      continue; // try again
    }
    if (written == -1 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
      // tx queue full: wait until the driver drains it or the write window closes
      int rc = ::poll(&pfd, 1, msLeft(deadline));
      if (rc == 0) {
        lastError_ = ChannelError::Timeout;
        return false;
      }
      if (rc == -1 && errno != EINTR) {
        std::cerr << "[SerialChannel] poll: " << strerror(errno) << "\n";
        lastError_ = ChannelError::Io;
        return false;
      }
      continue;
    }
    std::cerr << "[SerialChannel] error " << errno << " from write: " << strerror(errno) << "\n";
    lastError_ = ChannelError::Io;
    return false;
  }

  lastError_ = ChannelError::None;
  return true;
}

// -------------------------------------------------------------------
// SerialChannel::readLine
// Non-blocking line reader with timeout and internal buffer.
// Returns std::nullopt on timeout, disconnect, or error (see lastError()).
// -------------------------------------------------------------------
std::optional<std::string> SerialChannel::readLine(std::chrono::milliseconds timeout) {
  if (fd_ < 0) {
    lastError_ = ChannelError::Disconnected;
    return std::nullopt;
  }

  auto takeLine = [this]() -> std::optional<std::string> {
    if (auto pos = rx_buffer_.find(terminator_); pos != std::string::npos) {
      std::string line = rx_buffer_.substr(0, pos);
      rx_buffer_.erase(0, pos + terminator_.size()); // remove line + terminator
      return line;
    }
    return std::nullopt;
  };

  // a previous read may already hold a complete line
  if (auto line = takeLine()) {
    lastError_ = ChannelError::None;
    return line;
  }

  char temp[256];
  pollfd pfd{ fd_, POLLIN, 0 };

  const auto deadline = std::chrono::steady_clock::now() + timeout;

  while (std::chrono::steady_clock::now() < deadline) {

    int rc = ::poll(&pfd, 1, msLeft(deadline));
    if (rc == -1) {
      if (errno == EINTR)
        continue; // interrupted → retry
      std::cerr << "[SerialChannel] poll: " << strerror(errno) << '\n';
      lastError_ = ChannelError::Io;
      return std::nullopt;
    }
    if (rc == 0)
      break; // timeout

    if (pfd.revents & POLLIN) {
      ssize_t n = ::read(fd_, temp, sizeof(temp));
      if (n > 0) {
        rx_buffer_.append(temp, static_cast<std::size_t>(n));
      } else if (n == 0) { // EOF / disconnect
        close();
        lastError_ = ChannelError::Disconnected;
        return std::nullopt;
      } else if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
        continue; // transient → retry
      } else {
        std::cerr << "[SerialChannel] read: " << strerror(errno) << '\n';
        lastError_ = ChannelError::Io;
        return std::nullopt;
      }

      if (auto line = takeLine()) {
        lastError_ = ChannelError::None;
        return line;
      }
    } else if (pfd.revents & (POLLHUP | POLLERR)) {
      close();
      lastError_ = ChannelError::Disconnected;
      return std::nullopt;
    }
  }
  lastError_ = ChannelError::Timeout;
  return std::nullopt; // timeout/partial
}

void SerialChannel::close() {
  if (fd_ >= 0) {
    ::flock(fd_, LOCK_UN);
    ::close(fd_);
  }
  fd_ = -1;
}

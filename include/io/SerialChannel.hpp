#pragma once
/** @file  SerialChannel.hpp
 *  @brief Exclusive UART line I/O wrapper (uses poll/termios under the hood).
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

// Linux header
#include <termios.h> // for speed_t types e.g., B19200

namespace flowcal {
  namespace io {

    enum class Parity : std::uint8_t { None, Even, Odd };
    enum class StopBits : std::uint8_t { One, Two };

    /// Everything needed to claim and frame one serial link.
    struct SerialSettings {
      std::string port{};
      int baudRate{ 9600 };
      int dataBits{ 8 };
      Parity parity{ Parity::None };
      StopBits stopBits{ StopBits::One };
      std::chrono::milliseconds readTimeout{ 500 };
      std::chrono::milliseconds writeTimeout{ 500 };
      std::string lineTerminator{ "\n" };
    };

    /// Why the last operation failed (ChannelError::None after a success).
    enum class ChannelError : std::uint8_t { None, PortUnavailable, Timeout, Disconnected, Io };

    const char* toString(ChannelError e);

    /// Maps a numeric baud rate onto its termios constant; nullopt if termios has none.
    std::optional<speed_t> toSpeed(int baudRate);

    /**
 * @class SerialChannel
 * @brief RAII wrapper around a single /dev/tty* file descriptor.
 *
 *  * Frames I/O as ASCII lines using the configured terminator.
 *  * Claims the port exclusively (TIOCEXCL + flock) so two runs cannot share a link.
 *  * *Non-copyable*, but move-constructible.
 */
    class SerialChannel {

    public:
      //---ctr / dtr--------------------------------------------
      SerialChannel() = default;
      virtual ~SerialChannel(); // close the /dev/tty fd at destruction

      //---public API-------------------------------------------
      virtual bool open(const SerialSettings& settings);
      virtual bool writeLine(const std::string& line); // false on timeout or EIO
      virtual std::optional<std::string> readLine(std::chrono::milliseconds timeout);
      virtual void close();
      virtual bool isOpen() const { return fd_ >= 0; }

      ChannelError lastError() const { return lastError_; }

      //---non-copyable-----------------------------------------
      SerialChannel(const SerialChannel&) = delete;
      SerialChannel& operator=(const SerialChannel&) = delete;

      //---mv and mv assign-------------------------------------
      SerialChannel(SerialChannel&& other) noexcept;
      SerialChannel& operator=(SerialChannel&& other) noexcept;

    protected:
      void setLastError(ChannelError e) { lastError_ = e; }

    private:
      bool configure(const SerialSettings& settings);

      int fd_{ -1 };            ///< POSIX fd (-1==closed)
      std::string rx_buffer_{}; ///< bytes received past the last complete line
      std::string terminator_{ "\n" };
      std::chrono::milliseconds writeTimeout_{ 500 };
      ChannelError lastError_{ ChannelError::None };
    };
  } // namespace io
} // namespace flowcal

#pragma once
/** @file  Errors.hpp
 *  @brief Structured error taxonomy shared by transport, codecs, drivers and the coordinator.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <stdexcept>
#include <string>

namespace flowcal {
  namespace core {

    enum class ErrorKind {
      PortUnavailable,
      Timeout,
      UnexpectedResponse,
      CommunicationError,
      UnsupportedSetting,
      OutOfRange,
      ConfigurationNotFound
    };

    inline const char* toString(ErrorKind kind) {
      switch (kind) {
      case ErrorKind::PortUnavailable:
        return "PortUnavailable";
      case ErrorKind::Timeout:
        return "Timeout";
      case ErrorKind::UnexpectedResponse:
        return "UnexpectedResponse";
      case ErrorKind::CommunicationError:
        return "CommunicationError";
      case ErrorKind::UnsupportedSetting:
        return "UnsupportedSetting";
      case ErrorKind::OutOfRange:
        return "OutOfRange";
      case ErrorKind::ConfigurationNotFound:
        return "ConfigurationNotFound";
      }
      return "Unknown";
    }

    /**
 * @class DeviceError
 * @brief Base of every error the core raises; `kind()` makes it inspectable
 *        without a chain of catch blocks.
 */
    class DeviceError : public std::runtime_error {
    public:
      DeviceError(ErrorKind kind, const std::string& what)
          : std::runtime_error(what), kind_(kind) {}

      ErrorKind kind() const noexcept { return kind_; }

    private:
      ErrorKind kind_;
    };

    class PortUnavailableError : public DeviceError {
    public:
      explicit PortUnavailableError(const std::string& what)
          : DeviceError(ErrorKind::PortUnavailable, what) {}
    };

    /// Any I/O or protocol failure while talking to an instrument.
    class CommunicationError : public DeviceError {
    public:
      explicit CommunicationError(const std::string& what)
          : DeviceError(ErrorKind::CommunicationError, what) {}

    protected:
      CommunicationError(ErrorKind kind, const std::string& what) : DeviceError(kind, what) {}
    };

    class TimeoutError : public CommunicationError {
    public:
      explicit TimeoutError(const std::string& what)
          : CommunicationError(ErrorKind::Timeout, what) {}
    };

    /// Wrong address, wrong token count, unparsable value. Never retried.
    class UnexpectedResponseError : public CommunicationError {
    public:
      explicit UnexpectedResponseError(const std::string& what)
          : CommunicationError(ErrorKind::UnexpectedResponse, what) {}
    };

    class UnsupportedSettingError : public DeviceError {
    public:
      explicit UnsupportedSettingError(const std::string& what)
          : DeviceError(ErrorKind::UnsupportedSetting, what) {}
    };

    class OutOfRangeError : public DeviceError {
    public:
      explicit OutOfRangeError(const std::string& what)
          : DeviceError(ErrorKind::OutOfRange, what) {}
    };

    /// A label, model or role referenced by the configuration does not exist.
    class ConfigurationError : public DeviceError {
    public:
      explicit ConfigurationError(const std::string& what)
          : DeviceError(ErrorKind::ConfigurationNotFound, what) {}
    };

    /// True for failures a caller may retry with backoff (the core itself never does).
    inline bool isTransient(const DeviceError& e) noexcept {
      return e.kind() == ErrorKind::PortUnavailable || e.kind() == ErrorKind::Timeout;
    }

  } // namespace core
} // namespace flowcal

#pragma once
/** @file  Logger.hpp
 *  @brief Asynchronous CSV run logger (runs its own worker thread).
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <thread>

namespace flowcal {
  namespace io {
    class FileLogger;
  } // namespace io

  namespace core {

    /// One DUT comparison at one setpoint.
    struct LogEvent {
      std::chrono::system_clock::time_point timestamp{};
      unsigned dutIndex{ 0 };
      std::string serialNumber;
      double setpoint{ 0.0 };
      double reference{ 0.0 };
      double measured{ 0.0 };
      std::string result;
    };

    template <typename T> class RingBuffer; // forward decl to avoid heavy include

    class Logger {

    public:
      static constexpr std::size_t kQueueDepth = 1024;

      Logger();
      ~Logger(); ///< finishRun() if the caller forgot

      // --- public API ---
      bool startNewRun(const std::string& path); ///< open file + launch worker thread
      bool log(const LogEvent& event);           ///< enqueue event (non-blocking, false if full)
      void finishRun();                          ///< drain + flush + join worker thread

      bool running() const { return running_; }

      static std::string toCsv(const LogEvent& event);

      Logger(const Logger&) = delete;
      Logger& operator=(const Logger&) = delete;

    private:
      void drain();

      std::unique_ptr<io::FileLogger> csvFile_;
      std::unique_ptr<RingBuffer<LogEvent>> buffer_;
      std::thread worker_;
      std::atomic<bool> running_{ false };
    };

  } // namespace core
} // namespace flowcal

#pragma once
/** @file  Logger.hpp
 *  @brief Diagnostic-logging facility that engines log into (sinks + spdlog forwarding).
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "core/LogRecord.hpp"

namespace spdlog {
  class logger;
} // namespace spdlog

namespace labsim {
  namespace core {

    /** Receives every record at or above the severity it registered with. */
    class LogSink {
    public:
      virtual ~LogSink() = default;
      virtual void receive(const LogRecord& record) = 0;
    };

    /**
 * @class Logger
 * @brief Severity-gated fan-out of unformatted LogRecords to registered sinks.
 *
 *  * Sinks run on the emitting thread, outside our lock, so a sink (or the
 *    code it triggers) may log again without deadlocking.
 *  * With `propagate` on, accepted records are also rendered and handed to the
 *    shared spdlog logger (see `diagnostics()`).
 */
    class Logger {

    public:
      using SinkId = std::uint64_t;

      Logger() = default;
      ~Logger() = default;

      // --- public API ---
      void setLevel(Severity level);
      Severity level() const;

      void setPropagate(bool propagate);
      bool propagate() const;

      /// Register \p sink for records >= \p minimum. Returns a handle for removeSink().
      SinkId addSink(std::shared_ptr<LogSink> sink, Severity minimum);

      /// Remove a sink; returns false if \p id is not (or no longer) registered.
      bool removeSink(SinkId id);

      std::size_t sinkCount() const;

      void log(LogRecord record);

      template <typename... Args>
      void log(Severity severity, std::string moduleName, std::string message, Args&&... args) {
        LogRecord record{ severity, std::move(moduleName), std::move(message), {} };
        record.args.reserve(sizeof...(Args));
        (record.args.emplace_back(std::forward<Args>(args)), ...);
        log(std::move(record));
      }

      //---non-copyable-----------------------------------------
      Logger(const Logger&) = delete;
      Logger& operator=(const Logger&) = delete;

    private:
      struct Registration {
        SinkId id;
        Severity minimum;
        std::shared_ptr<LogSink> sink;
      };

      void forward(const LogRecord& record) const;

      mutable std::mutex mtx_;
      std::vector<Registration> sinks_;
      SinkId nextId_{ 1 };
      Severity level_{ Severity::Debug };
      bool propagate_{ false };
    };

    /// Process-wide spdlog logger ("labsim") used for the library's own diagnostics.
    std::shared_ptr<spdlog::logger> diagnostics();

  } // namespace core
} // namespace labsim

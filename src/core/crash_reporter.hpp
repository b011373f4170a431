#pragma once

#include <exception>
#include <string>

/// Last line of defense for failure reporting. Every failure branch in the
/// application routes through here instead of printing on its own.
///
/// Nothing in this class throws or blocks on an unbounded wait. If the
/// diagnostics file cannot be written the report is dropped and the call
/// still returns normally. Output never goes to stdout/stderr because a
/// packaged binary may not have usable console streams.
class CrashReporter {
public:
    /// Point diagnostics at <data_dir>/diagnostics/waypoint-<run>-<pid>.log.
    /// Until configured, reports only reach the application logger.
    static void configure(const std::string& data_dir) noexcept;

    /// Forget the configured directory and close the signal fd.
    static void reset() noexcept;

    static void report(const std::string& context, const std::exception& error) noexcept;
    static void report(const std::string& context, std::exception_ptr error) noexcept;
    static void report(const std::string& context, const std::string& message) noexcept;

    /// Report the exception currently being handled. Only valid inside a catch block.
    static void report_current(const std::string& context) noexcept;

    /// Path of this run's diagnostics file, empty when not configured.
    static std::string log_path() noexcept;

    /// Number of reports that could not be written. Diagnostic only.
    static unsigned dropped_count() noexcept;

    /// Dump a backtrace to the diagnostics file on fatal signals, then
    /// re-raise with the default action.
    static void install_fatal_signal_handlers() noexcept;

    /// Build the report text. May throw (allocation); report() guards it.
    static std::string format(const std::string& context,
                              const std::string& error_type,
                              const std::string& message,
                              bool with_backtrace);

private:
    static void write_report(const std::string& context,
                             const std::string& error_type,
                             const std::string& message) noexcept;
    static bool append_to_file(const std::string& path, const std::string& text) noexcept;
    static void fatal_signal_handler(int sig);
};

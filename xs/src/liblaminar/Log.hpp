#ifndef laminar_LOG_HPP
#define laminar_LOG_HPP

#include <string>
#include <vector>
#include <sstream>
#include <iostream>
#include <memory>
#include <set>
#include <cstdint>


namespace Laminar {

/// All available logging levels.
enum class log_t : uint8_t { FERR = 0, ERR = 4, WARN = 8, INFO = 16, DEBUG = 32, ALL = 255 };

inline bool operator>(const log_t lhs, const log_t rhs) { return static_cast<uint8_t>(lhs) > static_cast<uint8_t>(rhs); }
inline bool operator<(const log_t lhs, const log_t rhs) { return static_cast<uint8_t>(lhs) < static_cast<uint8_t>(rhs); }
inline bool operator>=(const log_t lhs, const log_t rhs) { return static_cast<uint8_t>(lhs) > static_cast<uint8_t>(rhs) || lhs == rhs; }
inline bool operator<=(const log_t lhs, const log_t rhs) { return static_cast<uint8_t>(lhs) < static_cast<uint8_t>(rhs) || lhs == rhs; }

/// Parse "error", "warn", "info", "debug" or "all" (case-insensitive).
/// Returns false if the name is not a level.
bool log_level_from_string(const std::string& name, log_t& level);

/// Logger shared by the slicing core and the command line tool.
/// Each line is prefixed with its topic and level; anything filtered out
/// by level or topic is written to a null stream.
class _Log {
public:
    static std::unique_ptr<_Log> make_log() {
        std::unique_ptr<_Log> tmp {new _Log()};
        tmp->_inclusive_levels = true;
        tmp->set_level(log_t::WARN);
        return tmp;
    }
    static std::unique_ptr<_Log> make_log(std::ostream& out) {
        std::unique_ptr<_Log> tmp {new _Log(out)};
        tmp->_inclusive_levels = true;
        tmp->set_level(log_t::WARN);
        return tmp;
    }
    void fatal_error(const std::string& topic, const std::string& message);
    void fatal_error(const std::string& topic, const std::wstring& message);
    std::ostream& fatal_error(const std::string& topic, bool multiline = false);

    void error(const std::string& topic, const std::string& message);
    void error(const std::string& topic, const std::wstring& message);
    std::ostream& error(const std::string& topic, bool multiline = false);

    void warn(const std::string& topic, const std::string& message);
    void warn(const std::string& topic, const std::wstring& message);
    std::ostream& warn(const std::string& topic, bool multiline = false);

    void info(const std::string& topic, const std::string& message);
    void info(const std::string& topic, const std::wstring& message);
    std::ostream& info(const std::string& topic, bool multiline = false);

    void debug(const std::string& topic, const std::string& message);
    void debug(const std::string& topic, const std::wstring& message);
    std::ostream& debug(const std::string& topic, bool multiline = false);

    void raw(const std::string& message);
    void raw(const std::wstring& message);
    std::ostream& raw();

    void set_level(log_t level);
    void clear_level(log_t level);
    void set_inclusive(bool v) { this->_inclusive_levels = v; }
    void add_topic(const std::string& topic) { this->_topics.insert(topic); }
    void clear_topic(const std::string& topic);

private:
    std::ostream& _out;
    _Log();
    _Log(std::ostream& out);
    bool _inclusive_levels { true };
    std::set<log_t> _log_level { };
    std::set<std::string> _topics { };

    bool _has_log_level(log_t lvl) const;
    bool _has_topic(const std::string& topic) const;

    /// Writes the "<topic> <LEVEL>: " prefix if the message passes the filters.
    std::ostream& _header(const std::string& topic, log_t lvl, const char* name, bool multiline);
};

/// Global log reference; initialized in Log.cpp
extern std::unique_ptr<_Log> laminar_log;

/// Static facade over laminar_log.
class Log {
public:

    /// Logs a fatal error.
    /// \param topic [in] subsystem or heading for the error
    /// \param message [in] text of the logged error message
    static void fatal_error(std::string topic, std::string message) {
        laminar_log->fatal_error(topic, message);
    }
    static void fatal_error(std::string topic, std::wstring message) {
        laminar_log->fatal_error(topic, message);
    }

    /// Logs a regular error.
    /// \param topic [in] subsystem or heading for the error
    /// \param message [in] text of the logged error message
    static void error(std::string topic, std::string message) {
        laminar_log->error(topic, message);
    }
    static void error(std::string topic, std::wstring message) {
        laminar_log->error(topic, message);
    }

    /// Logs a warning message.
    static void warn(std::string topic, std::string message) {
        laminar_log->warn(topic, message);
    }
    static void warn(std::string topic, std::wstring message) {
        laminar_log->warn(topic, message);
    }

    /// Logs an informational message.
    static void info(std::string topic, std::string message) {
        laminar_log->info(topic, message);
    }
    static void info(std::string topic, std::wstring message) {
        laminar_log->info(topic, message);
    }

    /// Logs a debugging message.
    static void debug(std::string topic, std::string message) {
        laminar_log->debug(topic, message);
    }
    static void debug(std::string topic, std::wstring message) {
        laminar_log->debug(topic, message);
    }

    /// Stream variants.
    /// \param topic [in] subsystem or heading for the message
    /// \param multiline [in] Is this a following part of a multiline output (default False)
    /// \return reference to output ostream for << chaining.
    /// \note Developer is expected to add newlines.
    static std::ostream& fatal_error(std::string topic, bool multiline = false) {
        return laminar_log->fatal_error(topic, multiline);
    }
    static std::ostream& error(std::string topic, bool multiline = false) {
        return laminar_log->error(topic, multiline);
    }
    static std::ostream& warn(std::string topic, bool multiline = false) {
        return laminar_log->warn(topic, multiline);
    }
    static std::ostream& info(std::string topic, bool multiline = false) {
        return laminar_log->info(topic, multiline);
    }
    static std::ostream& debug(std::string topic, bool multiline = false) {
        return laminar_log->debug(topic, multiline);
    }

    /// Unadorned ostream output for multiline constructions.
    static std::ostream& raw() {
        return laminar_log->raw();
    }

    /// Sets the most verbose level that is still printed.
    static void set_level(log_t level) {
        laminar_log->set_level(level);
    }

    /// Adds a topic to filter on. Only registered topics are shown
    /// once at least one is registered.
    static void add_topic(const std::string& topic) {
        laminar_log->add_topic(topic);
    }

    /// Removes a topic from the filter list.
    /// \note Default option removes all filters.
    static void clear_topic(const std::string& topic = "") {
        laminar_log->clear_topic(topic);
    }
};

}

#endif // laminar_LOG_HPP

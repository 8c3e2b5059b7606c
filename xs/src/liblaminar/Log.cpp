#include <sstream>
#include <iostream>
#include <string>
#include <iomanip>
#include <algorithm>

// Boost
#include <boost/locale.hpp>
#include <boost/algorithm/string/case_conv.hpp>

#include "Log.hpp"

/// Local class to suppress output
class NullStream : public std::streambuf
{
public:
    int overflow(int c) { return c; }
};

namespace Laminar {

static NullStream log_null;
static std::ostream null_log(&log_null);

std::unique_ptr<_Log> laminar_log {_Log::make_log()};

bool
log_level_from_string(const std::string& name, log_t& level)
{
    const std::string n = boost::algorithm::to_lower_copy(name);
    if (n == "fatal")                      level = log_t::FERR;
    else if (n == "error" || n == "err")   level = log_t::ERR;
    else if (n == "warn" || n == "warning") level = log_t::WARN;
    else if (n == "info")                  level = log_t::INFO;
    else if (n == "debug")                 level = log_t::DEBUG;
    else if (n == "all")                   level = log_t::ALL;
    else return false;
    return true;
}

_Log::_Log() : _out(std::clog) {
}

_Log::_Log(std::ostream& out) : _out(out) {
}

bool _Log::_has_log_level(log_t lvl) const {
    if (this->_log_level.empty()) return false;
    if (this->_inclusive_levels)
        return *(std::max_element(this->_log_level.cbegin(), this->_log_level.cend())) >= lvl;
    return this->_log_level.find(lvl) != this->_log_level.end();
}

bool _Log::_has_topic(const std::string& topic) const {
    return this->_topics.size() == 0 || this->_topics.find(topic) != this->_topics.end();
}

std::ostream& _Log::_header(const std::string& topic, log_t lvl, const char* name, bool multiline) {
    if (!this->_has_log_level(lvl) || !this->_has_topic(topic))
        return null_log;
    if (!multiline)
        _out << topic << std::setfill(' ') << std::setw(6) << name << ": ";
    return _out;
}

void _Log::fatal_error(const std::string& topic, const std::wstring& message) { this->fatal_error(topic, boost::locale::conv::utf_to_utf<char>(message)); }
void _Log::error(const std::string& topic, const std::wstring& message) { this->error(topic, boost::locale::conv::utf_to_utf<char>(message)); }
void _Log::warn(const std::string& topic, const std::wstring& message) { this->warn(topic, boost::locale::conv::utf_to_utf<char>(message)); }
void _Log::info(const std::string& topic, const std::wstring& message) { this->info(topic, boost::locale::conv::utf_to_utf<char>(message)); }
void _Log::debug(const std::string& topic, const std::wstring& message) { this->debug(topic, boost::locale::conv::utf_to_utf<char>(message)); }

void _Log::fatal_error(const std::string& topic, const std::string& message) {
    this->fatal_error(topic) << message << std::endl;
}
std::ostream& _Log::fatal_error(const std::string& topic, bool multiline) {
    return this->_header(topic, log_t::FERR, "FERR", multiline);
}

void _Log::error(const std::string& topic, const std::string& message) {
    this->error(topic) << message << std::endl;
}
std::ostream& _Log::error(const std::string& topic, bool multiline) {
    return this->_header(topic, log_t::ERR, "ERR", multiline);
}

void _Log::warn(const std::string& topic, const std::string& message) {
    this->warn(topic) << message << std::endl;
}
std::ostream& _Log::warn(const std::string& topic, bool multiline) {
    return this->_header(topic, log_t::WARN, "WARN", multiline);
}

void _Log::info(const std::string& topic, const std::string& message) {
    this->info(topic) << message << std::endl;
}
std::ostream& _Log::info(const std::string& topic, bool multiline) {
    return this->_header(topic, log_t::INFO, "INFO", multiline);
}

void _Log::debug(const std::string& topic, const std::string& message) {
    this->debug(topic) << message << std::endl;
}
std::ostream& _Log::debug(const std::string& topic, bool multiline) {
    return this->_header(topic, log_t::DEBUG, "DEBUG", multiline);
}

void _Log::raw(const std::string& message) {
    this->raw() << message << std::endl;
}
void _Log::raw(const std::wstring& message) { this->raw(boost::locale::conv::utf_to_utf<char>(message)); }

std::ostream& _Log::raw() {
    return _out;
}

void _Log::set_level(log_t level) {
    if (this->_inclusive_levels) {
        this->_log_level.clear();
        this->_log_level.insert(level);
    } else if (level == log_t::ALL) {
        for (auto lvl : { log_t::FERR, log_t::ERR, log_t::WARN, log_t::INFO, log_t::DEBUG })
            this->_log_level.insert(lvl);
    } else {
        this->_log_level.insert(level);
    }
}

void _Log::clear_level(log_t level) {
    if (level == log_t::ALL) {
        this->_log_level.clear();
    } else {
        this->_log_level.erase(level);
    }
}

void _Log::clear_topic(const std::string& topic) {
    if (topic == "") {
        this->_topics.clear();
    } else {
        this->_topics.erase(topic);
    }
}

} // Laminar

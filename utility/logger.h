// Copyright 2018 The Beam Team
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//    http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#pragma once
#include <iostream>
#include <memory>
#include <string>
#include <string.h>
#include <stdio.h>
#include <assert.h>

#ifndef LOG_VERBOSE_ENABLED
    #define LOG_VERBOSE_ENABLED 0
#endif

#ifndef LOG_DEBUG_ENABLED
    #ifndef NDEBUG
        #define LOG_DEBUG_ENABLED 1
    #else
        #define LOG_DEBUG_ENABLED 0
    #endif
#endif

// API

#define LOG_LEVEL_CRITICAL 6
#define LOG_LEVEL_ERROR    5
#define LOG_LEVEL_WARNING  4
#define LOG_LEVEL_INFO     3
#define LOG_LEVEL_DEBUG    2
#define LOG_LEVEL_VERBOSE  1

#define LOG_SINK_DISABLED  0

// This stub will be optimized out;
struct LogMessageStub {
    LogMessageStub() {}
    template <typename T> LogMessageStub& operator<<(const T&) { return *this; }
};

#define LOG_MESSAGE(LEVEL) if (mimble::Logger::will_log(LEVEL)) mimble::LogMessage(LEVEL)

#define LOG_CRITICAL() LOG_MESSAGE(LOG_LEVEL_CRITICAL)
#define LOG_ERROR() LOG_MESSAGE(LOG_LEVEL_ERROR)
#define LOG_WARNING() LOG_MESSAGE(LOG_LEVEL_WARNING)
#define LOG_INFO() LOG_MESSAGE(LOG_LEVEL_INFO)
#define LOG_UNHANDLED_EXCEPTION() LOG_ERROR() << "["<< __FILE__ << "] [" << __LINE__ << "] [" << __FUNCTION__ << "] unhandled exception. "

#if LOG_DEBUG_ENABLED
    #define LOG_DEBUG() LOG_MESSAGE(LOG_LEVEL_DEBUG)
#else
    #define LOG_DEBUG() LogMessageStub()
#endif

#if LOG_VERBOSE_ENABLED
    #define LOG_VERBOSE() LOG_MESSAGE(LOG_LEVEL_VERBOSE)
#else
    #define LOG_VERBOSE() LogMessageStub()
#endif

#define TRACE(var) " " #var "=" << var

namespace mimble {

struct LogMessageHeader {
    uint64_t timestamp;
    int level;

    explicit LogMessageHeader(int _level);
};

/// Returns char corresponding to log level
inline char loglevel_tag(int level) {
    static const char logTags[] = "~VDIWEC";
    if (level < 0 || level >= int(sizeof(logTags))) level = 0;
    return logTags[level];
}

/// Logger interface
class Logger {
public:
    /// RAII
    static std::shared_ptr<Logger> create(
        // flushes sinks if level >= flushLevel
        int flushLevel=LOG_LEVEL_WARNING,

        // default console minimal level, use LOG_SINK_DISABLED to disable console log
        int consoleLevel=LOG_LEVEL_DEBUG,

        // default file logger minimal level, use LOG_SINK_DISABLED to disable file log
        int fileLevel=LOG_SINK_DISABLED,

        // filename prefix, needed if file log enabled
        const std::string& fileNamePrefix = std::string(),

        // directory for log files, created if missing
        const std::string& dstPath = std::string()
    );

    virtual ~Logger() {}

    /// Sets custom timestamp formatter as for strftime(), default is "%Y-%m-%d.%T" and milliseconds are printed
    virtual void set_time_format(const char* format, bool printMilliseconds) = 0;

    /// Returns current log file name, empty for console-only logger
    virtual const std::string& get_current_file_name() = 0;

    static bool will_log(int level) {
        return g_logger && g_logger->level_accepted(level);
    }

protected:
    friend class LogMessage;

    virtual bool level_accepted(int level) = 0;

    /// Called from LogMessage dtor on message completed
    virtual void write_message(const LogMessageHeader& header, const char* buf, size_t size) = 0;

    static Logger* g_logger;
};

// Log message, supports operator<< and writes itself in destructor
class LogMessage {
public:
    LogMessageHeader header;

    explicit LogMessage(int _level);

    template <class T> LogMessage& operator<<(const T& x) {
        *_formatter << x;
        return *this;
    }

    ~LogMessage();
private:
    std::ostream* _formatter=0;
};

} //namespace

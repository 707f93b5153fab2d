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

#include "logger.h"
#include "helpers.h"
#include <boost/filesystem.hpp>
#include <boost/iostreams/device/back_inserter.hpp>
#include <boost/iostreams/filtering_stream.hpp>
#include <stdexcept>
#include <mutex>
#include <algorithm>

namespace mimble {

using namespace std;

Logger* Logger::g_logger = 0;

class LoggerImpl : public Logger {
protected:
    mutex _mutex;
    static const size_t MAX_HEADER_SIZE = 128;
    static const size_t MAX_TIMESTAMP_SIZE = 80;

    FILE* _sink;
    int _minLevel;
    int _flushLevel;
    std::string _timeFormat;
    bool _printMilliseconds;

    LoggerImpl(FILE* sink, int minLevel, int flushLevel) :
        _sink(sink),
        _minLevel(minLevel),
        _flushLevel(flushLevel),
        _timeFormat("%Y-%m-%d.%T"),
        _printMilliseconds(true)
    {
        if (minLevel <= 0) throw runtime_error("logger: minimal level out of range");
    }

    ~LoggerImpl() override {
        if (this == g_logger) {
            g_logger = 0;
        }
    }

    void set_time_format(const char* format, bool printMilliseconds) override {
        if (format) {
            _timeFormat = format;
            _printMilliseconds = printMilliseconds;
        } else {
            _timeFormat.clear();
            _printMilliseconds = false;
        }
    }

    size_t format_header(char* buf, const LogMessageHeader& header) {
        char timestampFormatted[MAX_TIMESTAMP_SIZE];
        if (!_timeFormat.empty()) {
            format_timestamp(timestampFormatted, MAX_TIMESTAMP_SIZE, _timeFormat.c_str(), header.timestamp, _printMilliseconds);
        } else {
            timestampFormatted[0] = 0;
        }
        int n = snprintf(buf, MAX_HEADER_SIZE, "%c %s ", loglevel_tag(header.level), timestampFormatted);
        return (n > 0) ? std::min(size_t(n), MAX_HEADER_SIZE - 1) : 0;
    }

    void write_message(const LogMessageHeader& header, const char* buf, size_t size) override {
        char headerFormatted[MAX_HEADER_SIZE];
        size_t headerSize = format_header(headerFormatted, header);
        write_impl(header.level, headerFormatted, headerSize, buf, size);
    }

    const std::string& get_current_file_name() override {
        static const std::string emptyName;
        return emptyName;
    }

public:
    bool level_accepted(int level) override {
        return level >= _minLevel;
    }

    void write_impl(int level, const char* header, size_t headerSize, const char* msg, size_t size) {
        if (!_sink) return;
        lock_guard<mutex> lock(_mutex);
        fwrite(header, 1, headerSize, _sink);
        fwrite(msg, 1, size, _sink);
        if (level >= _flushLevel) fflush(_sink);
    }
};

class ConsoleLogger : public LoggerImpl {
public:
    ConsoleLogger(int flushLevel, int consoleLevel) :
        LoggerImpl(stdout, consoleLevel, flushLevel)
    {}
};

class FileLogger : public LoggerImpl {
public:
    FileLogger(int flushLevel, int minLevel, const string& fileNamePrefix, const string& dstPath) :
        LoggerImpl(0, minLevel, flushLevel)
    {
        string fileName(fileNamePrefix);
        fileName += format_timestamp("%y_%m_%d_%H_%M_%S", local_timestamp_msec(), false);
        fileName += ".log";

        if (!dstPath.empty())
        {
            boost::filesystem::path path{ dstPath.c_str() };
            if (!boost::filesystem::exists(path))
                boost::filesystem::create_directories(path);

            path /= fileName;
            _fullPath = path.string();
        }
        else
            _fullPath = fileName;

        _sink = fopen(_fullPath.c_str(), "ab");
        if (!_sink) throw runtime_error(string("cannot open file ") + _fullPath);
    }

    ~FileLogger() override {
        fclose(_sink);
    }

    const std::string& get_current_file_name() override {
        return _fullPath;
    }

private:
    std::string _fullPath;
};

class CombinedLogger : public LoggerImpl {
    FileLogger _fileSink;
    ConsoleLogger _consoleSink;

public:
    CombinedLogger(int flushLevel, int consoleLevel, int fileLevel, const std::string& fileNamePrefix, const string& dstPath) :
        LoggerImpl(0, min(fileLevel, consoleLevel), flushLevel),
        _fileSink(flushLevel, fileLevel, fileNamePrefix, dstPath),
        _consoleSink(flushLevel, consoleLevel)
    {}

    void write_message(const LogMessageHeader& header, const char* buf, size_t size) override {
        char headerFormatted[MAX_HEADER_SIZE];
        size_t headerSize = format_header(headerFormatted, header);
        if (_consoleSink.level_accepted(header.level)) {
            _consoleSink.write_impl(header.level, headerFormatted, headerSize, buf, size);
        }
        if (_fileSink.level_accepted(header.level)) {
            _fileSink.write_impl(header.level, headerFormatted, headerSize, buf, size);
        }
    }

    const std::string& get_current_file_name() override {
        return _fileSink.get_current_file_name();
    }
};

std::shared_ptr<Logger> Logger::create(
    int flushLevel,
    int consoleLevel,
    int fileLevel,
    const std::string& fileNamePrefix,
    const std::string& dstPath
) {
    if (g_logger) {
        throw runtime_error("logger already initialized");
    }

    std::shared_ptr<Logger> logger;

    int what = 0;

    if (consoleLevel > 0) what += 1;
    if (fileLevel > 0) what += 2;

    switch (what) {
        case 3:
            logger.reset(new CombinedLogger(flushLevel, consoleLevel, fileLevel, fileNamePrefix, dstPath));
            break;
        case 2:
            logger.reset(new FileLogger(flushLevel, fileLevel, fileNamePrefix, dstPath));
            break;
        case 1:
            logger.reset(new ConsoleLogger(flushLevel, consoleLevel));
            break;
        default:
            throw runtime_error("no logger sink configured");
    }

    g_logger = logger.get();
    return logger;
}

namespace {

static constexpr size_t MAX_MSG_SIZE = 10000;

// Per-thread message buffer, the formatter appends into msgBuffer
struct LogThreadContext {
    using Formatter = boost::iostreams::filtering_ostream;

    std::string msgBuffer;
    std::unique_ptr<Formatter> formatter;

    LogThreadContext() :
        formatter(std::make_unique<Formatter>(boost::iostreams::back_inserter(msgBuffer)))
    {}

    void reset() {
        msgBuffer = std::string();
        formatter = std::make_unique<Formatter>(boost::iostreams::back_inserter(msgBuffer));
    }
};

LogThreadContext* get_context() {
    static thread_local LogThreadContext ctx;
    return &ctx;
}

} //namespace

LogMessageHeader::LogMessageHeader(int _level) :
    timestamp(local_timestamp_msec()),
    level(_level)
{
}

LogMessage::LogMessage(int _level) :
    header(_level)
{
    LogThreadContext* ctx = get_context();
    if (ctx->msgBuffer.capacity() < MAX_MSG_SIZE) {
        ctx->msgBuffer.reserve(MAX_MSG_SIZE);
    }

    _formatter = ctx->formatter.get();
}

LogMessage::~LogMessage() {
    if (Logger::g_logger && _formatter) {
        *_formatter << '\n';
        _formatter->flush();
        std::string& buffer = get_context()->msgBuffer;
        Logger::g_logger->write_message(header, buffer.data(), buffer.size());
        if (buffer.size() > MAX_MSG_SIZE) {
            get_context()->reset();
        }
        else {
            buffer.clear();
        }
    }
}

} //namespace

/************************************************************************
Copyright 2024 FlowAgg Contributors

Licensed under the Apache License, Version 2.0 (the "License");
you may not use this file except in compliance with the License.
You may obtain a copy of the License at

    https://www.apache.org/licenses/LICENSE-2.0

Unless required by applicable law or agreed to in writing, software
distributed under the License is distributed on an "AS IS" BASIS,
WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
See the License for the specific language governing permissions and
limitations under the License.
**************************************************************************/

/**
 * FlowAgg Logging
 *
 * Each source file declares one tag per component and streams messages
 * through it. All output goes through a single sink that serializes lines
 * on stderr.
 *
 *   FLOWAGG_LOG_TAG(FlowRunObserver);
 *   FLOWAGG_LOG_INFO(FlowRunObserver) << "Compactionrequest= " << request;
 *
 * Streams are only live when FLOWAGG_ENABLE_DEBUG_LOGGING is defined, and
 * then only at or above FLOWAGG_MIN_LOG_LEVEL (1=DEBUG .. 4=ERROR). Stream
 * operands are still evaluated when a level is compiled out.
 */

#pragma once

#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

#ifndef FLOWAGG_MIN_LOG_LEVEL
#define FLOWAGG_MIN_LOG_LEVEL 2
#endif

namespace flowagg {
namespace logging {

enum class LogLevel : int {
    DEBUG = 1,
    INFO  = 2,
    WARN  = 3,
    ERROR = 4,
};

constexpr LogLevel kMinLogLevel = static_cast<LogLevel>(FLOWAGG_MIN_LOG_LEVEL);

/**
 * Component name printed with every line of that component.
 */
struct LogTag {
    const char* name;

    constexpr explicit LogTag(const char* n) : name(n) {}
};

/**
 * Process-wide line sink.
 */
class LogSink {
public:
    static LogSink& Instance() {
        static LogSink sink;
        return sink;
    }

    void Write(const LogTag& tag, LogLevel level, const std::string& line) {
        std::lock_guard<std::mutex> lock(mutex_);
        std::cerr << "[" << LevelName(level) << "] [" << tag.name << "] " << line << "\n";
    }

private:
    LogSink() = default;

    static const char* LevelName(LogLevel level) {
        switch (level) {
            case LogLevel::DEBUG: return "DEBUG";
            case LogLevel::INFO:  return "INFO ";
            case LogLevel::WARN:  return "WARN ";
            case LogLevel::ERROR: return "ERROR";
        }
        return "?????";
    }

    std::mutex mutex_;
};

/**
 * Collects one line and hands it to the sink when it goes out of scope.
 */
template<LogLevel Level>
class LogStream {
public:
#ifdef FLOWAGG_ENABLE_DEBUG_LOGGING
    static constexpr bool kActive = Level >= kMinLogLevel;
#else
    static constexpr bool kActive = false;
#endif

    explicit LogStream(const LogTag& tag) : tag_(tag) {}

    ~LogStream() {
        if constexpr (kActive) {
            LogSink::Instance().Write(tag_, Level, line_.str());
        }
    }

    template<typename T>
    LogStream& operator<<(const T& value) {
        if constexpr (kActive) {
            line_ << value;
        }
        return *this;
    }

private:
    const LogTag& tag_;
    std::ostringstream line_;
};

} // namespace logging
} // namespace flowagg

#define FLOWAGG_LOG_TAG(name) \
    static constexpr ::flowagg::logging::LogTag name##Tag(#name)

#define FLOWAGG_LOG_DEBUG(component) \
    ::flowagg::logging::LogStream<::flowagg::logging::LogLevel::DEBUG>(component##Tag)

#define FLOWAGG_LOG_INFO(component) \
    ::flowagg::logging::LogStream<::flowagg::logging::LogLevel::INFO>(component##Tag)

#define FLOWAGG_LOG_WARN(component) \
    ::flowagg::logging::LogStream<::flowagg::logging::LogLevel::WARN>(component##Tag)

#define FLOWAGG_LOG_ERROR(component) \
    ::flowagg::logging::LogStream<::flowagg::logging::LogLevel::ERROR>(component##Tag)

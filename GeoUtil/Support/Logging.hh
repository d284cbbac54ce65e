//
// Logging.hh
//
// Copyright 2016-Present Couchbase, Inc.
//
// Use of this software is governed by the Business Source License included
// in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
// in that file, in accordance with the Business Source License, use of this
// software will be governed by the Apache License, Version 2.0, included in
// the file licenses/APL2.txt.
//

#pragma once
#include "geoutil/geoCompat.h"
#include <atomic>
#include <cstdarg>
#include <cstdint>
#include <cinttypes>  //for stdint.h fmt specifiers
#include <string>

/*
    This is a configurable console-logging facility that lets logging be turned on and off independently for various subsystems or areas of the code. It's used similarly to printf:
        Log("the value of foo is %d", foo);

    You can associate a log message with a particular subsystem or tag by defining a logging domain. In one source file, define the domain:
        LogDomain FooLog("Foo");
    If you need to use the same domain in other source files, declare it:
        extern LogDomain FooLog;
    Now you can use the Foo domain for logging:
        LogTo(FooLog, "the value of foo is %d", foo);

    Messages go to a callback, which by default writes them to stderr. A domain's level can be lowered from the environment: setting GeoUtilLogFoo=verbose makes the Foo domain log verbose messages; the plain GeoUtilLog variable sets the initial callback level.

    You can use LogVerbose() and LogDebug() for messages that add more detail but shouldn't be seen by default when the domain is enabled. LogDebug() is compiled out of non-DEBUG builds.

    Warn() is a related function that logs to the default domain at Warning level.
        Warn("Reactor coolant system has failed");
*/

namespace geoutil {

    enum class LogLevel : int8_t { Uninitialized = -1, Debug, Verbose, Info, Warning, Error, None };

    static constexpr size_t kNumLogLevels = 5;  ///< Number of active levels, Debug...Error

    class LogDomain {
      public:
        explicit LogDomain(const char* name, LogLevel level = LogLevel::Info);

        static LogDomain* named(const char* name);

        const char* name() const { return _name; }

        void     setLevel(LogLevel lvl) noexcept;
        LogLevel level() const noexcept;

        /// The first domain in the linked list (in arbitrary order.)
        static LogDomain* first() noexcept { return sFirstDomain; }

        /// The next domain in the linked list (in arbitrary order), or nullptr at the end.
        LogDomain* next() const noexcept { return _next; }

        /** The level at which this domain will actually have an effect. This is based on the level(),
            but raised to take into account the level at which the callback will trigger.
            In other words, any log() calls below this level will produce no output. */
        LogLevel effectiveLevel() {
            refreshLevel();
            return _effectiveLevel;
        }

        bool willLog(LogLevel lv) const { return _effectiveLevel <= lv; }

        void log(LogLevel level, const char* fmt, ...) __printflike(3, 4);
        void vlog(LogLevel level, const char* fmt, va_list) __printflike(3, 0);

        using Callback_t = void (*)(const LogDomain&, LogLevel, const char* format, va_list);

        static void defaultCallback(const LogDomain&, LogLevel, const char* format, va_list) __printflike(3, 0);

        static Callback_t currentCallback();

        /** Registers (or unregisters) a callback to be passed log messages.
            @param callback  The callback function, or NULL to unregister.
            @param preformatted  If true, callback will be passed already-formatted log messages to be
                displayed verbatim (and the `va_list` parameter will be empty.) */
        static void setCallback(Callback_t callback, bool preformatted);

        static LogLevel callbackLogLevel() noexcept;
        static void     setCallbackLogLevel(LogLevel) noexcept;

        static const char* nameOfLevel(LogLevel) noexcept;

      private:
        static LogLevel lockedCallbackLevel() noexcept;
        static void     resetEffectiveLevels() noexcept;
        LogLevel        refreshLevel() noexcept;
        static LogLevel levelFromEnvironment(const char* varName) noexcept;

        std::atomic<LogLevel> _effectiveLevel{LogLevel::Uninitialized};
        std::atomic<LogLevel> _level;
        const char* const     _name;
        LogDomain* const      _next;

        static LogDomain* sFirstDomain;
        static LogLevel   sCallbackMinLevel;
    };

    extern LogDomain kGeoUtil_DefaultLog;
    extern LogDomain GeohashLog;


#define LogToAt(DOMAIN, LEVEL, FMT, ...)                                                                               \
    do {                                                                                                               \
        if ( _usuallyFalse((DOMAIN).willLog(geoutil::LogLevel::LEVEL)) )                                               \
            (DOMAIN).log(geoutil::LogLevel::LEVEL, FMT, ##__VA_ARGS__);                                                \
    } while ( 0 )

#define LogTo(DOMAIN, FMT, ...)      LogToAt(DOMAIN, Info, FMT, ##__VA_ARGS__)
#define LogVerbose(DOMAIN, FMT, ...) LogToAt(DOMAIN, Verbose, FMT, ##__VA_ARGS__)
#define LogWarn(DOMAIN, FMT, ...)    LogToAt(DOMAIN, Warning, FMT, ##__VA_ARGS__)
#define LogError(DOMAIN, FMT, ...)   LogToAt(DOMAIN, Error, FMT, ##__VA_ARGS__)

#define Log(FMT, ...)       LogToAt(geoutil::kGeoUtil_DefaultLog, Info, FMT, ##__VA_ARGS__)
#define Warn(FMT, ...)      LogToAt(geoutil::kGeoUtil_DefaultLog, Warning, FMT, ##__VA_ARGS__)
#define WarnError(FMT, ...) LogToAt(geoutil::kGeoUtil_DefaultLog, Error, FMT, ##__VA_ARGS__)

#ifdef DEBUG
#    define LogDebug(DOMAIN, FMT, ...) LogToAt(DOMAIN, Debug, FMT, ##__VA_ARGS__)
#else
#    define LogDebug(DOMAIN, FMT, ...)
#endif

}  // namespace geoutil

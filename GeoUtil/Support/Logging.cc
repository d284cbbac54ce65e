//
// Logging.cc
//
// Copyright 2016-Present Couchbase, Inc.
//
// Use of this software is governed by the Business Source License included
// in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
// in that file, in accordance with the Business Source License, use of this
// software will be governed by the Apache License, Version 2.0, included in
// the file licenses/APL2.txt.
//

#include "Logging.hh"
#include "StringUtil.hh"
#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <mutex>
#include <strings.h>  // strcasecmp

using namespace std;

namespace geoutil {

    LogDomain* LogDomain::sFirstDomain = nullptr;
    LogLevel   LogDomain::sCallbackMinLevel = LogLevel::Uninitialized;

    LogDomain kGeoUtil_DefaultLog("Default", LogLevel::Info);
    LogDomain GeohashLog("Geohash", LogLevel::Info);

    // Indexed by LogLevel. Also the (case-insensitive) values of the GeoUtilLog env vars.
    static const char* const kLevelNames[] = {"Debug", "Verbose", "Info", "WARNING", "ERROR", "None"};

    // Guards the callback state below, and the domains' levels.
    static mutex sLogMutex;

    static LogDomain::Callback_t sCallback             = LogDomain::defaultCallback;
    static bool                  sCallbackPreformatted = false;
    static char                  sFormatBuffer[2048];


#pragma mark - LEVELS:


    LogDomain::LogDomain(const char* name, LogLevel level) : _level(level), _name(name), _next(sFirstDomain) {
        sFirstDomain = this;
    }

    const char* LogDomain::nameOfLevel(LogLevel level) noexcept {
        if ( level < LogLevel::Debug || level > LogLevel::Error ) return "";
        return kLevelNames[int(level)];
    }

    // Reads a level name from an environment variable. Returns Uninitialized if it's not set;
    // any unrecognized value counts as Info.
    LogLevel LogDomain::levelFromEnvironment(const char* varName) noexcept {
        const char* value = getenv(varName);
        if ( !value ) return LogLevel::Uninitialized;
        for ( int i = int(LogLevel::Debug); i <= int(LogLevel::None); ++i ) {
            if ( strcasecmp(value, kLevelNames[i]) == 0 ) return LogLevel(i);
        }
        return LogLevel::Info;
    }

    void LogDomain::setLevel(LogLevel level) noexcept {
        lock_guard<mutex> lock(sLogMutex);

        // "GeoUtilLog<Name>" in the environment can lower the level, but never raise it:
        char varName[64];
        snprintf(varName, sizeof(varName), "GeoUtilLog%s", _name);
        LogLevel forced = levelFromEnvironment(varName);
        if ( forced != LogLevel::Uninitialized ) level = min(level, forced);

        _level          = level;
        _effectiveLevel = max(level, lockedCallbackLevel());
    }

    LogLevel LogDomain::refreshLevel() noexcept {
        if ( _effectiveLevel == LogLevel::Uninitialized ) setLevel(_level);
        return _level;
    }

    LogLevel LogDomain::level() const noexcept { return const_cast<LogDomain*>(this)->refreshLevel(); }

    LogDomain* LogDomain::named(const char* name) {
        if ( !name ) return nullptr;
        lock_guard<mutex> lock(sLogMutex);
        for ( LogDomain* domain = sFirstDomain; domain; domain = domain->_next ) {
            if ( strcmp(domain->_name, name) == 0 ) return domain;
        }
        return nullptr;
    }


#pragma mark - CALLBACK:


    // Caller must hold sLogMutex.
    void LogDomain::resetEffectiveLevels() noexcept {
        for ( LogDomain* domain = sFirstDomain; domain; domain = domain->_next )
            domain->_effectiveLevel = LogLevel::Uninitialized;
    }

    // Caller must hold sLogMutex.
    LogLevel LogDomain::lockedCallbackLevel() noexcept {
        if ( sCallbackMinLevel == LogLevel::Uninitialized ) {
            // The plain "GeoUtilLog" env var sets the initial level:
            LogLevel envLevel = levelFromEnvironment("GeoUtilLog");
            sCallbackMinLevel = (envLevel == LogLevel::Uninitialized) ? LogLevel::Info : envLevel;
        }
        return sCallbackMinLevel;
    }

    LogLevel LogDomain::callbackLogLevel() noexcept {
        lock_guard<mutex> lock(sLogMutex);
        return lockedCallbackLevel();
    }

    void LogDomain::setCallbackLogLevel(LogLevel level) noexcept {
        lock_guard<mutex> lock(sLogMutex);
        LogLevel envLevel = levelFromEnvironment("GeoUtilLog");
        if ( envLevel != LogLevel::Uninitialized ) level = min(level, envLevel);
        if ( level == sCallbackMinLevel ) return;
        sCallbackMinLevel = level;
        resetEffectiveLevels();
    }

    LogDomain::Callback_t LogDomain::currentCallback() {
        lock_guard<mutex> lock(sLogMutex);
        return sCallback;
    }

    void LogDomain::setCallback(Callback_t callback, bool preformatted) {
        lock_guard<mutex> lock(sLogMutex);
        sCallback             = callback;
        sCallbackPreformatted = preformatted;
        if ( !callback ) sCallbackMinLevel = LogLevel::None;
        resetEffectiveLevels();
    }

    void LogDomain::defaultCallback(const LogDomain& domain, LogLevel level, const char* fmt, va_list args) {
        string message = sCallbackPreformatted ? string(fmt) : vformat(fmt, args);
        fprintf(stderr, "%s %s: %s\n", domain.name(), nameOfLevel(level), message.c_str());
    }


#pragma mark - LOGGING:


    void LogDomain::vlog(LogLevel level, const char* fmt, va_list args) {
        if ( _effectiveLevel == LogLevel::Uninitialized ) refreshLevel();
        if ( !willLog(level) ) return;

        lock_guard<mutex> lock(sLogMutex);
        if ( !sCallback || level < lockedCallbackLevel() ) return;

        va_list argsCopy;
        va_copy(argsCopy, args);
        if ( sCallbackPreformatted ) {
            // The message goes to the callback as its format string, with no arguments:
            vsnprintf(sFormatBuffer, sizeof(sFormatBuffer), fmt, argsCopy);
            va_list noArgs{};
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wformat-nonliteral"
#pragma GCC diagnostic ignored "-Wformat-security"
            sCallback(*this, level, sFormatBuffer, noArgs);
#pragma GCC diagnostic pop
        } else {
            sCallback(*this, level, fmt, argsCopy);
        }
        va_end(argsCopy);
    }

    void LogDomain::log(LogLevel level, const char* fmt, ...) {
        va_list args;
        va_start(args, fmt);
        vlog(level, fmt, args);
        va_end(args);
    }

}  // namespace geoutil

//
// Error.cc
//
// Copyright 2016-Present Couchbase, Inc.
//
// Use of this software is governed by the Business Source License included
// in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
// in that file, in accordance with the Business Source License, use of this
// software will be governed by the Apache License, Version 2.0, included in
// the file licenses/APL2.txt.
//

#include "Error.hh"
#include "Logging.hh"
#include "StringUtil.hh"
#include <cctype>
#include <cstdio>
#include <new>
#include <string>
#include <typeinfo>

namespace geoutil {

    using namespace std;


#pragma mark ERROR CODES, NAMES, etc.


    static const char* geoutil_errstr(int code) noexcept {
        static const char* kGeoUtilMessages[] = {
                // These must match up with the codes in the declaration of GeoUtilError
                "no error",  // 0
                "assertion failed",
                "invalid parameter",
                "invalid geohash precision",
                "invalid character in geohash",
                "empty geohash",
                "no neighboring cell in that direction",
                "unexpected exception",
        };
        static_assert(sizeof(kGeoUtilMessages) / sizeof(kGeoUtilMessages[0]) == error::NumGeoUtilErrorsPlus1,
                      "Incomplete error message table");
        const char* str = nullptr;
        if ( code >= 0 && size_t(code) < sizeof(kGeoUtilMessages) / sizeof(char*) ) str = kGeoUtilMessages[code];
        if ( !str ) str = "(unknown GeoUtilError)";
        return str;
    }

    const char* error::_what(int code) noexcept { return geoutil_errstr(code); }


#pragma mark - ERROR CLASS:


    bool error::sWarnOnError = false;

    error::error(GeoUtilError c) : error(c, _what(c)) {}

    error::error(GeoUtilError c, const std::string& what) : runtime_error(what), code(c) {
        DebugAssert(code != 0);
    }

    error& error::operator=(const error& e) {
        // This has to be hacked, since `code` is marked `const`.
        this->~error();
        new (this) error(e);
        return *this;
    }

    static error unexpectedException(const std::exception& x) {
        // Get the actual exception class name using RTTI.
        // Unmangle it by skipping class name prefix like "St12" (may be compiler dependent)
        const char* name = typeid(x).name();
        while ( isalpha(*name) ) ++name;
        while ( isdigit(*name) ) ++name;
        Warn("Caught unexpected C++ %s(\"%s\")", name, x.what());
        return error(error::UnexpectedError, x.what());
    }

    error error::convertRuntimeError(const std::runtime_error& re) {
        if ( auto e = dynamic_cast<const error*>(&re); e ) return *e;
        return unexpectedException(re);
    }

    error error::convertException(const std::exception& x) {
        if ( auto re = dynamic_cast<const std::runtime_error*>(&x); re ) return convertRuntimeError(*re);
        if ( auto le = dynamic_cast<const std::logic_error*>(&x); le ) {
            GeoUtilError code = AssertionFailed;
            if ( dynamic_cast<const std::invalid_argument*>(le) != nullptr
                 || dynamic_cast<const std::domain_error*>(le) != nullptr )
                code = InvalidParameter;
            return error(code, le->what());
        }
        return unexpectedException(x);
    }


    static std::function<void()> sNotableExceptionHook;

    void error::setNotableExceptionHook(function<void()> hook) { sNotableExceptionHook = std::move(hook); }

    void error::_throw() {
        if ( sWarnOnError ) {
            if ( sNotableExceptionHook ) sNotableExceptionHook();
            WarnError("GeoUtil throwing error %d: %s", code, what());
        }
        throw *this;
    }

    void error::_throw(error::GeoUtilError err) { error{err}._throw(); }

    void error::_throw(error::GeoUtilError code, const char* fmt, ...) {
        va_list args;
        va_start(args, fmt);
        std::string message = vformat(fmt, args);
        va_end(args);
        error{code, message}._throw();
    }

    void error::assertionFailed(const char* fn, const char* file, unsigned line, const char* expr,
                                const char* message, ...) {
        string messageStr = "Assertion failed: ";
        if ( message ) {
            va_list args;
            va_start(args, message);
            messageStr += vformat(message, args);
            va_end(args);
        } else {
            messageStr += expr;
        }
        if ( sNotableExceptionHook ) sNotableExceptionHook();
        if ( !kGeoUtil_DefaultLog.willLog(LogLevel::Error) )
            fprintf(stderr, "%s (%s:%u, in %s)\n", messageStr.c_str(), file, line, fn);
        WarnError("%s (%s:%u, in %s)", messageStr.c_str(), file, line, fn);
        throw error(AssertionFailed, messageStr);
    }

}  // namespace geoutil

//
// Error.hh
//
// Copyright 2014-Present Couchbase, Inc.
//
// Use of this software is governed by the Business Source License included
// in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
// in that file, in accordance with the Business Source License, use of this
// software will be governed by the Apache License, Version 2.0, included in
// the file licenses/APL2.txt.
//

#pragma once

#include "geoutil/geoCompat.h"
#include <stdexcept>
#include <functional>
#include <string>

#undef check

namespace geoutil {

    /** Most API calls can throw this. */
    struct error : public std::runtime_error {
        // Error codes:
        enum GeoUtilError {
            AssertionFailed = 1,
            InvalidParameter,
            InvalidPrecision,
            InvalidHashCharacter,
            EmptyHash,
            NoNeighbor,
            UnexpectedError,

            // Add new codes here. You MUST add messages to kGeoUtilMessages!

            NumGeoUtilErrorsPlus1
        };

        //---- Data members:
        int const code;

        explicit error(GeoUtilError code);
        error(GeoUtilError code, const std::string& what);

        error(const error&) = default;
        error& operator=(const error& e);

        [[noreturn]] void _throw();

        /** Returns the error equivalent to a given exception. Uses RTTI to discover if the
            exception is already an `error` instance; otherwise maps standard exception types. */
        static error convertException(const std::exception&);
        static error convertRuntimeError(const std::runtime_error&);

        /** Static version of the standard `what` method. */
        static const char* _what(int code) noexcept;

        /** Constructs and throws an error. */
        [[noreturn]] static void _throw(GeoUtilError);
        [[noreturn]] static void _throw(GeoUtilError, const char* msg, ...) __printflike(2, 3);

        /** Throws an assertion failure exception. Called by the Assert() macro. */
        [[noreturn]] static void assertionFailed(const char* func, const char* file, unsigned line, const char* expr,
                                                 const char* message = nullptr, ...) __printflike(5, 6);

        static void setNotableExceptionHook(std::function<void()> hook);

        /** If true, every thrown error is also logged as a warning. */
        static bool sWarnOnError;
    };

    static inline bool operator==(const error& a, const error& b) noexcept { return a.code == b.code; }

    static inline bool operator==(const error& a, error::GeoUtilError code) noexcept { return a.code == code; }

// Like C assert() but throws an exception instead of aborting
#define Assert(e, ...)                                                                                                 \
    (_usuallyFalse(!(e)) ? geoutil::error::assertionFailed(__func__, __FILE__, __LINE__, #e, ##__VA_ARGS__) : (void)0)

// DebugAssert is removed from release builds; use when 'e' test is too expensive
#ifndef DEBUG
#    define DebugAssert(e, ...)                                                                                        \
        do {                                                                                                           \
        } while ( 0 )
#else
#    define DebugAssert(e, ...) Assert(e, ##__VA_ARGS__)
#endif

}  // namespace geoutil

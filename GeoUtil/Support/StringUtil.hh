//
// StringUtil.hh
//
// Copyright 2017-Present Couchbase, Inc.
//
// Use of this software is governed by the Business Source License included
// in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
// in that file, in accordance with the Business Source License, use of this
// software will be governed by the Apache License, Version 2.0, included in
// the file licenses/APL2.txt.
//

#pragma once
#include "fleece/function_ref.hh"
#include "fleece/slice.hh"
#include <cstdarg>
#include <cstring>
#include <sstream>
#include <string>
#include <string_view>
#include "geoutil/geoCompat.h"

namespace geoutil {

    // Adds EXPR to a stringstream and returns the resulting string.
    // Example: CONCAT("2+2=" << 4 << "!") --> "2+2=4!"
#ifndef _LIBCPP_VERSION
#    define CONCAT(EXPR) (static_cast<const std::stringstream&>(std::stringstream() << EXPR)).str()
#else
#    define CONCAT(EXPR) (std::stringstream() << EXPR).str()
#endif

    /** Like sprintf(), but returns a std::string */
    std::string format(const char* fmt NONNULL, ...) __printflike(1, 2);

    /** Like vsprintf(), but returns a std::string */
    std::string vformat(const char* fmt NONNULL, va_list) __printflike(1, 0);

    /** Calls `callback` with each run of characters in `str` that are not separators,
        i.e. for which `isSeparator` returns false. Empty runs are skipped. */
    void splitOn(std::string_view str, fleece::function_ref<bool(char)> isSeparator,
                 fleece::function_ref<void(std::string_view)> callback);

    /** Returns `str` without leading and trailing ASCII whitespace. */
    std::string_view trimWhitespace(std::string_view str) noexcept;

    /** Returns true if `str` begins with the string `prefix`. */
    bool hasPrefix(std::string_view str, std::string_view prefix) noexcept;

    /** Returns true if `str` ends with the string `suffix`, ignoring ASCII case. */
    bool hasSuffixIgnoringCase(std::string_view str, std::string_view suffix) noexcept;

    /** Returns a copy of the slice's bytes as a std::string_view (no copy is made.) */
    static inline std::string_view asStringView(fleece::slice s) noexcept {
        return {(const char*)s.buf, s.size};
    }

}  // namespace geoutil

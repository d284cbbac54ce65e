//
// StringUtil.cc
//
// Copyright 2017-Present Couchbase, Inc.
//
// Use of this software is governed by the Business Source License included
// in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
// in that file, in accordance with the Business Source License, use of this
// software will be governed by the Apache License, Version 2.0, included in
// the file licenses/APL2.txt.
//

#include "StringUtil.hh"
#include <cctype>
#include <cstdio>
#include <cstdlib>

namespace geoutil {

    using namespace std;
    using namespace fleece;


    std::string format(const char* fmt, ...) {
        va_list args;
        va_start(args, fmt);
        std::string result = vformat(fmt, args);
        va_end(args);
        return result;
    }

    std::string vformat(const char* fmt, va_list args) {
        char   buf[256];
        va_list args2;
        va_copy(args2, args);
        int len = vsnprintf(buf, sizeof(buf), fmt, args);
        std::string result;
        if ( len < 0 ) {
            // formatting error; return empty string
        } else if ( size_t(len) < sizeof(buf) ) {
            result.assign(buf, size_t(len));
        } else {
            result.resize(size_t(len));
            vsnprintf(result.data(), size_t(len) + 1, fmt, args2);
        }
        va_end(args2);
        return result;
    }

    void splitOn(std::string_view str, function_ref<bool(char)> isSeparator, function_ref<void(std::string_view)> callback) {
        size_t start = 0;
        for ( size_t i = 0; i <= str.size(); ++i ) {
            if ( i == str.size() || isSeparator(str[i]) ) {
                if ( i > start ) callback(str.substr(start, i - start));
                start = i + 1;
            }
        }
    }

    std::string_view trimWhitespace(std::string_view str) noexcept {
        while ( !str.empty() && isspace((unsigned char)str.front()) ) str.remove_prefix(1);
        while ( !str.empty() && isspace((unsigned char)str.back()) ) str.remove_suffix(1);
        return str;
    }

    bool hasPrefix(std::string_view str, std::string_view prefix) noexcept {
        return str.size() >= prefix.size() && memcmp(str.data(), prefix.data(), prefix.size()) == 0;
    }

    bool hasSuffixIgnoringCase(std::string_view str, std::string_view suffix) noexcept {
        if ( str.size() < suffix.size() ) return false;
        auto tail = str.substr(str.size() - suffix.size());
        for ( size_t i = 0; i < suffix.size(); ++i ) {
            if ( tolower((unsigned char)tail[i]) != tolower((unsigned char)suffix[i]) ) return false;
        }
        return true;
    }

}  // namespace geoutil

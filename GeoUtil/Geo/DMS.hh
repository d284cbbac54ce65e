//
// DMS.hh
//
// Copyright 2020-Present Couchbase, Inc.
//
// Use of this software is governed by the Business Source License included
// in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
// in that file, in accordance with the Business Source License, use of this
// software will be governed by the Apache License, Version 2.0, included in
// the file licenses/APL2.txt.
//

#pragma once
#include "fleece/slice.hh"
#include <string>

/*
    Parsing and formatting of angles as degrees / minutes / seconds, e.g. 51° 28′ 40.37″ N.
    Output uses the Unicode degree (U+00B0), prime (U+2032) and double prime (U+2033) signs,
    encoded as UTF-8.
*/

namespace geoutil::dms {

    enum Format {
        Degrees,               ///< "38.8979°"
        DegreesMinutes,        ///< "38° 53.87′"
        DegreesMinutesSeconds  ///< "38° 53′ 52″"
    };

    /** Separator placed between degrees, minutes, seconds and compass direction by default:
        U+202F, narrow no-break space. */
    extern const char* const kDefaultSeparator;

    struct FormatOptions {
        Format      format        = Degrees;
        int         decimalPlaces = -1;  ///< -1 means 4 for Degrees, 2 for DegreesMinutes, 0 for DMS
        std::string separator     = kDefaultSeparator;
    };

    /** Parses a string as numeric degrees. Accepts signed decimal degrees, or deg-min-sec
        optionally suffixed by a compass direction (NSEW).
        Examples: "-3.62", "3 37 12W", "3°37′12″W", "38°53'52.3\"N".
        Throws InvalidParameter if it can't be parsed. */
    double parse(fleece::slice dms);

    /** Formats decimal degrees as deg/min/sec. The sign is discarded and no compass direction is
        added. Throws InvalidParameter if `deg` is NaN or infinite. */
    std::string toDMS(double deg, const FormatOptions& = {});

    /** Formats degrees as a latitude, suffixed with N or S. */
    std::string toLatitude(double deg, const FormatOptions& = {});

    /** Formats degrees as a longitude, suffixed with E or W. */
    std::string toLongitude(double deg, const FormatOptions& = {});

    /** Formats degrees as a bearing in 0°..360°. */
    std::string toBearing(double deg, const FormatOptions& = {});

    /** Returns the compass point for a bearing, to a given precision:
        1 for cardinal ("N"), 2 for intercardinal ("NE"), 3 for secondary-intercardinal ("NNE").
        Throws InvalidParameter for any other precision. */
    std::string compassPoint(double bearing, int precision = 3);

    /** Constrains degrees to 0..360 (e.g. for bearings); -1 => 359, 361 => 1. */
    double wrap360(double degrees);

    /** Constrains degrees to -180..+180 (e.g. for longitude); -181 => 179, 181 => -179. */
    double wrap180(double degrees);

    /** Constrains degrees to -90..+90 (e.g. for latitude); -91 => -89, 91 => 89. */
    double wrap90(double degrees);

}  // namespace geoutil::dms

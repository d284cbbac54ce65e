//
// DMS.cc
//
// Copyright 2020-Present Couchbase, Inc.
//
// Use of this software is governed by the Business Source License included
// in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
// in that file, in accordance with the Business Source License, use of this
// software will be governed by the Apache License, Version 2.0, included in
// the file licenses/APL2.txt.
//

/* NOTE: The formatting rules here follow Chris Veness's geodesy library
   (www.movable-type.co.uk/scripts/latlong.html, MIT licence). */

#include "DMS.hh"
#include "Error.hh"
#include "StringUtil.hh"
#include <cctype>
#include <cmath>
#include <cstdlib>

namespace geoutil::dms {

    using namespace std;

    const char* const kDefaultSeparator = "\u202F";

    static const char* const kDegreeSign      = "°";
    static const char* const kPrimeSign       = "′";
    static const char* const kDoublePrimeSign = "″";


    // Positive remainder of x / m.
    static inline double pmod(double x, double m) { return fmod(fmod(x, m) + m, m); }

    // Rounds to the given number of decimal places, the way "%.*f" would display it.
    static inline double roundTo(double x, int decimalPlaces) {
        double scale = pow(10.0, decimalPlaces);
        return round(x * scale) / scale;
    }

    static int defaultDecimalPlaces(Format format) {
        switch ( format ) {
            case DegreesMinutes:
                return 2;
            case DegreesMinutesSeconds:
                return 0;
            case Degrees:
            default:
                return 4;
        }
    }

    // Parses an entire string as a decimal number, or returns false.
    static bool parseNumber(string_view str, double& outNumber) {
        if ( str.empty() ) return false;
        string s(str);
        char*  end = nullptr;
        double n   = strtod(s.c_str(), &end);
        if ( end != s.c_str() + s.size() || !isfinite(n) ) return false;
        outNumber = n;
        return true;
    }


#pragma mark - PARSING:


    double parse(fleece::slice dmsSlice) {
        string_view text = trimWhitespace(asStringView(dmsSlice));
        if ( text.empty() ) error::_throw(error::InvalidParameter, "Empty degrees string");

        // Signed decimal degrees without NSEW:
        double deg;
        if ( parseNumber(text, deg) ) return deg;

        // Strip off any sign or compass direction, and split out separate d/m/s:
        bool        negative = (text.front() == '-' || hasSuffixIgnoringCase(text, "S")
                         || hasSuffixIgnoringCase(text, "W"));
        string_view body     = text;
        if ( body.front() == '-' ) body.remove_prefix(1);
        if ( !body.empty() && strchr("NSEWnsew", body.back()) ) body.remove_suffix(1);

        double parts[3];
        size_t nParts = 0;
        bool   valid  = true;
        splitOn(
                body, [](char c) { return !(isdigit((unsigned char)c) || c == '.' || c == ','); },
                [&](string_view part) {
                    if ( nParts >= 3 || !parseNumber(part, parts[nParts]) ) valid = false;
                    ++nParts;
                });
        if ( !valid || nParts == 0 || nParts > 3 )
            error::_throw(error::InvalidParameter, "Can't parse \"%.*s\" as degrees", int(text.size()), text.data());

        switch ( nParts ) {
            case 3:  // interpret 3-part result as d/m/s
                deg = parts[0] + parts[1] / 60 + parts[2] / 3600;
                break;
            case 2:  // interpret 2-part result as d/m
                deg = parts[0] + parts[1] / 60;
                break;
            default:  // just d (possibly decimal)
                deg = parts[0];
                break;
        }
        return negative ? -deg : deg;
    }


#pragma mark - FORMATTING:


    string toDMS(double deg, const FormatOptions& options) {
        if ( !isfinite(deg) ) error::_throw(error::InvalidParameter, "Can't format non-finite degrees");

        const int     dp      = options.decimalPlaces >= 0 ? options.decimalPlaces
                                                           : defaultDecimalPlaces(options.format);
        const double  degrees = fabs(deg);  // unsigned result ready for appending compass direction
        const string& sep     = options.separator;

        switch ( options.format ) {
            case DegreesMinutes:
                {
                    double d = floor(degrees);
                    double m = roundTo(fmod(degrees * 60, 60), dp);
                    if ( m >= 60 ) {  // check for rounding up
                        m = 0;
                        d++;
                    }
                    return format("%.0f%s%s%.*f%s", d, kDegreeSign, sep.c_str(), dp, m, kPrimeSign);
                }
            case DegreesMinutesSeconds:
                {
                    double d = floor(degrees);
                    double m = fmod(floor(degrees * 3600 / 60), 60);
                    double s = roundTo(fmod(degrees * 3600, 60), dp);
                    if ( s >= 60 ) {  // check for rounding up
                        s = 0;
                        m++;
                    }
                    if ( m >= 60 ) {
                        m = 0;
                        d++;
                    }
                    return format("%.0f%s%s%.0f%s%s%.*f%s", d, kDegreeSign, sep.c_str(), m, kPrimeSign, sep.c_str(), dp,
                                  s, kDoublePrimeSign);
                }
            case Degrees:
            default:
                return format("%.*f%s", dp, degrees, kDegreeSign);
        }
    }

    string toLatitude(double deg, const FormatOptions& options) {
        return toDMS(wrap90(deg), options) + options.separator + (deg < 0 ? "S" : "N");
    }

    string toLongitude(double deg, const FormatOptions& options) {
        return toDMS(wrap180(deg), options) + options.separator + (deg < 0 ? "W" : "E");
    }

    string toBearing(double deg, const FormatOptions& options) {
        string brng = toDMS(wrap360(deg), options);
        if ( hasPrefix(brng, "360") ) brng.replace(0, 3, "0");  // in case rounding took us up to 360°
        return brng;
    }

    string compassPoint(double bearing, int precision) {
        if ( precision < 1 || precision > 3 )
            error::_throw(error::InvalidParameter, "Invalid compass point precision %d", precision);
        if ( !isfinite(bearing) )
            error::_throw(error::InvalidParameter, "Can't find compass point of non-finite bearing");
        // (precision could be extended to 4 for quarter-winds, e.g. NbNW, but they are little used)

        static const char* const kCardinals[16] = {"N", "NNE", "NE", "ENE", "E", "ESE", "SE", "SSE",
                                                   "S", "SSW", "SW", "WSW", "W", "WNW", "NW", "NNW"};

        bearing = wrap360(bearing);
        int n   = 4 << (precision - 1);  // number of compass points at this precision: 4, 8 or 16
        int i   = int(round(bearing * n / 360)) % n * 16 / n;
        return kCardinals[i];
    }


#pragma mark - WRAPPING:


    double wrap360(double degrees) {
        if ( 0 <= degrees && degrees < 360 ) return degrees;  // avoid rounding if already within range
        return pmod(degrees, 360);                            // sawtooth wave p:360, a:360
    }

    double wrap180(double degrees) {
        if ( -180 < degrees && degrees <= 180 ) return degrees;
        return pmod(degrees + 540, 360) - 180;  // sawtooth wave p:180, a:±180
    }

    double wrap90(double degrees) {
        if ( -90 <= degrees && degrees <= 90 ) return degrees;
        return fabs(pmod(degrees + 270, 360) - 180) - 90;  // triangle wave p:360, a:±90
    }

}  // namespace geoutil::dms

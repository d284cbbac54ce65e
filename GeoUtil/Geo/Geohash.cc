//
// Geohash.cc
//
// Copyright 2014-Present Couchbase, Inc.
//
// Use of this software is governed by the Business Source License included
// in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
// in that file, in accordance with the Business Source License, use of this
// software will be governed by the Apache License, Version 2.0, included in
// the file licenses/APL2.txt.
//

/* NOTE: Portions of this code derive from Lyo Kato's geohash.c:
   https://github.com/lyokato/objc-geohash/blob/master/Classes/ARC/cgeohash.m as of 3-Nov-2014
   That code comes with the following license:

The MIT License

Copyright (c) 2011 lyo.kato@gmail.com

Permission is hereby granted, free of charge, to any person obtaining a copy
of this software and associated documentation files (the "Software"), to deal
in the Software without restriction, including without limitation the rights
to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
copies of the Software, and to permit persons to whom the Software is
furnished to do so, subject to the following conditions:

The above copyright notice and this permission notice shall be included in
all copies or substantial portions of the Software.

THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
THE SOFTWARE.
*/

#include "Geohash.hh"
#include "Error.hh"
#include "Logging.hh"
#include "StringUtil.hh"
#include <algorithm>
#include <cstdint>
#include <cstring>
#include <ostream>
#include <sstream>


namespace geoutil::geohash {

    static const char BASE32_ENCODE_TABLE[33] = "0123456789bcdefghjkmnpqrstuvwxyz";

    // Values of the lowercase letters; digits are their own values.
    static const int8_t BASE32_LETTER_TABLE[26] = {
            /* a */ -1, /* b */ 10, /* c */ 11, /* d */ 12, /* e */ 13, /* f */ 14, /* g */ 15,
            /* h */ 16, /* i */ -1, /* j */ 17, /* k */ 18, /* l */ -1, /* m */ 19, /* n */ 20,
            /* o */ -1, /* p */ 21, /* q */ 22, /* r */ 23, /* s */ 24, /* t */ 25, /* u */ 26,
            /* v */ 27, /* w */ 28, /* x */ 29, /* y */ 30, /* z */ 31};

    // Returns the 5-bit value of a GeoHash character, or -1 if it isn't one.
    static inline int decodeChar(char c) {
        if ( c >= '0' && c <= '9' ) return c - '0';
        if ( c >= 'a' && c <= 'z' ) return BASE32_LETTER_TABLE[c - 'a'];
        return -1;
    }

    [[noreturn]] static void throwInvalidChar(char c, const char* str, size_t len) {
        error::_throw(error::InvalidHashCharacter, "Invalid character '%c' in geohash \"%.*s\"", c, int(len), str);
    }

    static void checkChars(const char* str, size_t len) {
        for ( size_t i = 0; i < len; ++i ) {
            if ( decodeChar(str[i]) < 0 ) throwInvalidChar(str[i], str, len);
        }
    }


#pragma mark - RANGE:


    void range::shrink(bool side) {
        double m = mid();
        if ( side ) {
            min = m;
        } else {
            max = m;
        }
    }

    bool range::shrink(double value) {
        bool side = value > mid();
        shrink(side);
        return side;
    }


#pragma mark - AREA:


    std::string area::dump() const {
        std::stringstream out;
        out.precision(10);
        out << "(" << latitude.min << ", " << longitude.min << ")...(" << latitude.max << ", " << longitude.max
            << ")";
        return out.str();
    }


#pragma mark - DIRECTION:


    static const struct {
        const char* name;
        direction   dir;
    } kDirectionNames[kNumDirections] = {{"n", North},      {"e", East},       {"w", West},       {"s", South},
                                         {"ne", NorthEast}, {"nw", NorthWest}, {"se", SouthEast}, {"sw", SouthWest}};

    direction directionNamed(fleece::slice name) {
        std::string_view str = asStringView(name);
        for ( auto& entry : kDirectionNames ) {
            if ( str == entry.name ) return entry.dir;
        }
        error::_throw(error::InvalidParameter, "Unknown direction \"%.*s\"", int(str.size()), str.data());
    }

    const char* nameOfDirection(direction dir) {
        for ( auto& entry : kDirectionNames ) {
            if ( entry.dir == dir ) return entry.name;
        }
        return "?";
    }


#pragma mark - HASH:


    hash::hash(fleece::slice bytes) {
        if ( bytes.size == 0 ) error::_throw(error::EmptyHash);
        auto str = (const char*)bytes.buf;
        checkChars(str, bytes.size);
        string.assign(str, bytes.size);
    }

    hash::hash(const char* str) : hash(fleece::slice(str)) {}

    bool hash::isValid(fleece::slice str) noexcept {
        if ( str.size == 0 ) return false;
        auto chars = (const char*)str.buf;
        return std::all_of(chars, chars + str.size, [](char c) { return decodeChar(c) >= 0; });
    }

    // The Interval Refiner: narrows `r` to the half selected by bit `offset` of `bits`.
    static inline void refineRange(range& r, int bits, int offset) { r.shrink((bits & (0x1 << offset)) != 0); }

    area hash::decode() const {
        size_t len = length();
        if ( len == 0 ) error::_throw(error::EmptyHash);

        area   result(range(-90, 90), range(-180, 180));
        range* range1 = &result.longitude;
        range* range2 = &result.latitude;

        for ( char c : string ) {
            int bits = decodeChar(c);
            if ( bits < 0 ) throwInvalidChar(c, string.data(), len);

            refineRange(*range1, bits, 4);
            refineRange(*range2, bits, 3);
            refineRange(*range1, bits, 2);
            refineRange(*range2, bits, 1);
            refineRange(*range1, bits, 0);

            // An odd number of bits per char means the next char starts with the other axis:
            std::swap(range1, range2);
        }
        return result;
    }

    static inline void setBit(unsigned char& bits, range& r, double value, int offset) {
        if ( r.shrink(value) ) bits |= (0x1 << offset);
    }

    hash::hash(coord c, int len) {
        if ( len < 1 ) error::_throw(error::InvalidPrecision, "Geohash precision must be positive, not %d", len);

        range  lat_range(-90, 90);
        range  lon_range(-180, 180);
        range* range1 = &lon_range;
        range* range2 = &lat_range;
        double val1   = c.longitude;
        double val2   = c.latitude;

        string.resize(size_t(len));
        for ( int i = 0; i < len; i++ ) {
            unsigned char bits = 0;
            setBit(bits, *range1, val1, 4);
            setBit(bits, *range2, val2, 3);
            setBit(bits, *range1, val1, 2);
            setBit(bits, *range2, val2, 1);
            setBit(bits, *range1, val1, 0);
            string[i] = BASE32_ENCODE_TABLE[bits];

            std::swap(val1, val2);
            std::swap(range1, range2);
        }
    }

    std::ostream& operator<<(std::ostream& out, const hash& h) { return out << h.string; }


#pragma mark - ADJACENCY:


    // Rows are indexed by direction * 2 + (length % 2): an even-length hash uses the EVEN row.
    static const char NEIGHBORS_TABLE[8][33] = {
            "p0r21436x8zb9dcf5h7kjnmqesgutwvy", /* NORTH EVEN */
            "bc01fg45238967deuvhjyznpkmstqrwx", /* NORTH ODD  */
            "bc01fg45238967deuvhjyznpkmstqrwx", /* EAST EVEN  */
            "p0r21436x8zb9dcf5h7kjnmqesgutwvy", /* EAST ODD   */
            "238967debc01fg45kmstqrwxuvhjyznp", /* WEST EVEN  */
            "14365h7k9dcfesgujnmqp0r2twvyx8zb", /* WEST ODD   */
            "14365h7k9dcfesgujnmqp0r2twvyx8zb", /* SOUTH EVEN */
            "238967debc01fg45kmstqrwxuvhjyznp"  /* SOUTH ODD  */
    };

    // Characters whose cell lies on the parent cell's edge in each direction.
    static const char BORDERS_TABLE[8][9] = {
            "prxz",     /* NORTH EVEN */
            "bcfguvyz", /* NORTH ODD  */
            "bcfguvyz", /* EAST  EVEN */
            "prxz",     /* EAST  ODD  */
            "0145hjnp", /* WEST  EVEN */
            "028b",     /* WEST  ODD  */
            "028b",     /* SOUTH EVEN */
            "0145hjnp"  /* SOUTH ODD  */
    };

    // Replaces the first `len` characters of `h` with their neighbor in direction `dir` (a cardinal
    // direction). Returns false if the neighbor would lie across a pole.
    static bool get_adjacent(std::string& h, size_t len, direction dir) {
        if ( len == 0 ) {
            // Carried past the first character. Longitude wraps around, latitude doesn't:
            return dir == East || dir == West;
        }

        char   last = h[len - 1];
        size_t idx  = size_t(dir) * 2 + (len % 2);

        if ( strchr(BORDERS_TABLE[idx], last) != nullptr ) {
            // Crossing the parent cell's edge, so the parent moves too:
            if ( !get_adjacent(h, len - 1, dir) ) return false;
        }

        const char* neighbor_table = NEIGHBORS_TABLE[idx];
        const char* ptr            = strchr(neighbor_table, last);
        DebugAssert(ptr != nullptr && last != '\0');
        h[len - 1] = BASE32_ENCODE_TABLE[ptr - neighbor_table];
        return true;
    }

    bool tryAdjacent(const hash& h, direction dir, hash& result) {
        size_t len = h.length();
        if ( len == 0 ) error::_throw(error::EmptyHash);
        checkChars(h.string.data(), len);

        switch ( dir ) {
            case North:
            case East:
            case West:
            case South:
                {
                    std::string adj = h.string;
                    if ( !get_adjacent(adj, len, dir) ) {
                        LogVerbose(GeohashLog, "No %s neighbor of %s", nameOfDirection(dir), h.c_str());
                        return false;
                    }
                    result.string = std::move(adj);
                    return true;
                }
            default:
                {
                    // Diagonals are a vertical step followed by a horizontal one:
                    direction vertical   = (dir == NorthEast || dir == NorthWest) ? North : South;
                    direction horizontal = (dir == NorthEast || dir == SouthEast) ? East : West;
                    hash      step;
                    return tryAdjacent(h, vertical, step) && tryAdjacent(step, horizontal, result);
                }
        }
    }

    hash hash::adjacent(direction dir) const {
        hash result;
        if ( !tryAdjacent(*this, dir, result) )
            error::_throw(error::NoNeighbor, "Geohash %s has no %s neighbor; it's at the pole", c_str(),
                          nameOfDirection(dir));
        return result;
    }

    std::array<hash, 8> hash::neighbors() const {
        static constexpr direction kClockwise[8] = {NorthWest, North, NorthEast, East,
                                                    SouthEast, South, SouthWest, West};
        std::array<hash, 8> result;
        for ( size_t i = 0; i < 8; ++i ) result[i] = adjacent(kClockwise[i]);
        return result;
    }

}  // namespace geoutil::geohash

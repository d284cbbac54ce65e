//
// Geohash.hh
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
#include "Coord.hh"
#include "fleece/slice.hh"
#include <array>
#include <iosfwd>
#include <string>

namespace geoutil::geohash {

    struct hash;

    /** A range of a single coordinate. */
    struct range {
        double min;
        double max;

        range() : min(0), max(0) {}

        range(double _min, double _max) : min(_min), max(_max) {}

        bool isValid() const { return max > min; }

        /** Inclusive of both ends: encoding puts a value equal to a midpoint in the lower half. */
        bool contains(double n) const { return min <= n && n <= max; }

        bool isEmpty() const { return min == max; }

        double size() const { return max - min; }

        double mid() const { return (min + max) / 2.0; }

        /** Narrows the range to its upper half if `side` is true, else to its lower half. */
        void shrink(bool side);

        /** Narrows the range to the half containing `value` (a value equal to the midpoint goes
            to the lower half), and returns true if that was the upper half. */
        bool shrink(double value);
    };

    /** The rectangular cell described by a GeoHash, defined by ranges of latitude and longitude. */
    struct area {
        range latitude;
        range longitude;

        area() = default;

        area(range lat, range lon) : latitude(lat), longitude(lon) {}

        bool isValid() const { return latitude.isValid() && longitude.isValid(); }

        bool contains(coord c) const { return latitude.contains(c.latitude) && longitude.contains(c.longitude); }

        coord northWest() const { return {latitude.max, longitude.min}; }

        coord northEast() const { return {latitude.max, longitude.max}; }

        coord southEast() const { return {latitude.min, longitude.max}; }

        coord southWest() const { return {latitude.min, longitude.min}; }

        coord centroid() const { return {latitude.mid(), longitude.mid()}; }

        /** The five representative points of the cell: NW, NE, SE, SW corners and the centroid. */
        std::array<coord, 5> corners() const {
            return {northWest(), northEast(), southEast(), southWest(), centroid()};
        }

        std::string dump() const;
    };

    enum direction { North = 0, East, West, South, NorthEast, NorthWest, SouthEast, SouthWest };

    static constexpr unsigned kNumDirections = 8;

    /** Parses a short direction name: "n", "s", "e", "w", "ne", "nw", "se", "sw".
        Throws InvalidParameter for anything else. */
    direction directionNamed(fleece::slice name);

    const char* nameOfDirection(direction);

    /** A GeoHash string. Always consists of characters from the GeoHash base-32 alphabet;
        only a default-constructed hash is empty. There's no upper limit on its length, but past
        about 22 characters the cells are below the resolution of a double. */
    struct hash {
        std::string string;

        hash() = default;

        /** Parses a GeoHash string. Throws EmptyHash or InvalidHashCharacter if it's empty or has
            a character outside the alphabet. */
        explicit hash(fleece::slice);
        explicit hash(const char* str);

        /** Geohash of the given coord with `nChars` characters.
            Throws InvalidPrecision if nChars < 1. */
        hash(coord, int nChars);

        /** Returns true if `str` is a nonempty GeoHash. */
        static bool isValid(fleece::slice str) noexcept;

        operator const char*() const { return string.c_str(); }

        const char* c_str() const { return string.c_str(); }

        std::string asString() const { return string; }

        size_t length() const { return string.size(); }

        bool isEmpty() const { return string.empty(); }

        /** Decodes to the cell's bounding box. Throws EmptyHash if empty. */
        area decode() const;

        /** The adjacent hash of the same length in the given direction.
            Throws NoNeighbor if that would cross a pole, EmptyHash if empty. */
        hash adjacent(direction) const;

        /** The 8 surrounding hashes, clockwise from the northwest: nw, n, ne, e, se, s, sw, w. */
        std::array<hash, 8> neighbors() const;

        bool operator==(const hash& h) const { return string == h.string; }

        bool operator!=(const hash& h) const { return !(*this == h); }

        bool operator<(const hash& h) const { return string < h.string; }
    };

    std::ostream& operator<<(std::ostream&, const hash&);


    //---- Function-style API:

    /** Returns the GeoHash of `c` with `precision` characters. */
    static inline hash encode(coord c, int precision = 8) { return hash(c, precision); }

    /** Returns the bounding box (and derived corners and centroid) of a GeoHash. */
    static inline area decode(const hash& h) { return h.decode(); }

    /** Returns the GeoHash of the same length adjacent to `h` in direction `dir`. */
    static inline hash neighbor(const hash& h, direction dir) { return h.adjacent(dir); }

    /** Returns the 8 hashes surrounding `h`, clockwise from the northwest. */
    static inline std::array<hash, 8> allNeighbors(const hash& h) { return h.neighbors(); }

    /** Non-throwing form of `hash::adjacent`: stores the adjacent hash in `result` and returns
        true, or returns false if there's no neighbor because it would lie beyond a pole. */
    bool tryAdjacent(const hash&, direction, hash& result);

}  // namespace geoutil::geohash

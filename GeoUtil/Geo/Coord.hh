//
// Coord.hh
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
#include "DMS.hh"
#include <iosfwd>
#include <string>

namespace geoutil {

    namespace geohash {
        struct hash;
    }

    /** A 2D geographic coordinate: (latitude, longitude), in degrees. */
    struct coord {
        double latitude;
        double longitude;

        coord() : latitude(0), longitude(0) {}

        coord(double lat, double lon) : latitude(lat), longitude(lon) {}

        /** True if latitude is within [-90, 90] and longitude within [-180, 180]. */
        bool isValid() const;

        double latitudeRadians() const;

        /** Great-circle distance in km between two coords, by the spherical law of cosines.
            Identical coords are exactly 0 apart. */
        double distanceTo(coord) const;

        /** Compute the GeoHash of the given length containing this point. */
        geohash::hash encode(int nChars = 8) const;

        /** Returns e.g. "Lat: 38.897872 Long: -77.036510". */
        std::string toString() const;

        /** Returns e.g. "Lat: 38° 53′ 52″ N Long: 77° 2′ 11″ W". */
        std::string toDMSString(const dms::FormatOptions& = {dms::DegreesMinutesSeconds}) const;

        bool operator==(const coord& c) const { return latitude == c.latitude && longitude == c.longitude; }

        bool operator!=(const coord& c) const { return !(*this == c); }
    };

    std::ostream& operator<<(std::ostream&, const coord&);

}  // namespace geoutil

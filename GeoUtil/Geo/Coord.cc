//
// Coord.cc
//
// Copyright 2014-Present Couchbase, Inc.
//
// Use of this software is governed by the Business Source License included
// in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
// in that file, in accordance with the Business Source License, use of this
// software will be governed by the Apache License, Version 2.0, included in
// the file licenses/APL2.txt.
//

#include "Coord.hh"
#include "Geohash.hh"
#include "StringUtil.hh"
#include <algorithm>
#include <cmath>
#include <ostream>

namespace geoutil {

    using namespace std;

    static constexpr double kDegreesToRadians = M_PI / 180.0;
    static constexpr double kRadiansToDegrees = 180.0 / M_PI;

    // Great-circle arc of one degree is 60 nautical miles; these convert that to kilometers.
    static constexpr double kStatuteMilesPerNauticalMile = 1.1515;
    static constexpr double kKmPerStatuteMile            = 1.609344;

    bool coord::isValid() const {
        return latitude >= -90.0 && latitude <= 90.0 && longitude >= -180.0 && longitude <= 180.0;
    }

    double coord::latitudeRadians() const { return latitude * kDegreesToRadians; }

    double coord::distanceTo(coord c) const {
        if ( *this == c ) return 0.0;
        double lat1 = latitudeRadians(), lat2 = c.latitudeRadians();
        double dLon = (longitude - c.longitude) * kDegreesToRadians;
        double d    = sin(lat1) * sin(lat2) + cos(lat1) * cos(lat2) * cos(dLon);
        d           = clamp(d, -1.0, 1.0);  // rounding can push it just past +/-1, which acos rejects
        return acos(d) * kRadiansToDegrees * 60 * kStatuteMilesPerNauticalMile * kKmPerStatuteMile;
    }

    geohash::hash coord::encode(int nChars) const { return geohash::hash(*this, nChars); }

    string coord::toString() const { return format("Lat: %.6f Long: %.6f", latitude, longitude); }

    string coord::toDMSString(const dms::FormatOptions& options) const {
        return "Lat: " + dms::toLatitude(latitude, options) + " Long: " + dms::toLongitude(longitude, options);
    }

    ostream& operator<<(ostream& out, const coord& c) { return out << c.toString(); }

}  // namespace geoutil

//
// RadiusSearch.cc
//
// Copyright 2014-Present Couchbase, Inc.
//
// Use of this software is governed by the Business Source License included
// in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
// in that file, in accordance with the Business Source License, use of this
// software will be governed by the Apache License, Version 2.0, included in
// the file licenses/APL2.txt.
//

#include "RadiusSearch.hh"
#include "Error.hh"
#include "Logging.hh"
#include <cmath>

namespace geoutil::geohash {

    static constexpr unsigned kNumRepresentativePoints = 5;

    RadiusSearch::RadiusSearch(const hash& center, const Options& options) : _center(center), _options(options) {
        if ( std::isnan(options.distanceKm) || options.distanceKm < 0 )
            error::_throw(error::InvalidParameter, "Search distance must be a non-negative number of km");
        if ( options.minPointsInRange < 1 || options.minPointsInRange > kNumRepresentativePoints )
            error::_throw(error::InvalidParameter, "minPointsInRange must be from 1 to %u, not %u",
                          kNumRepresentativePoints, options.minPointsInRange);

        _centroid    = center.decode().centroid();
        _northExtent = countSteps(North);
        _southExtent = countSteps(South);
        _westExtent  = countSteps(West);
        LogVerbose(GeohashLog, "Radius search of %g km around %s: %u rows north, %u south, %u columns each side",
                   options.distanceKm, center.c_str(), _northExtent, _southExtent, _westExtent);
    }

    unsigned RadiusSearch::pointsInRange(const hash& h) const {
        unsigned n = 0;
        for ( coord c : h.decode().corners() ) {
            if ( _centroid.distanceTo(c) <= _options.distanceKm ) ++n;
        }
        return n;
    }

    // Steps outward from the center until a cell falls out of range. The count includes that last
    // step. Stops early at a pole, or if longitude has wrapped all the way around.
    unsigned RadiusSearch::countSteps(direction dir) const {
        unsigned count = 0;
        hash     cell  = _center;
        do {
            ++count;
            if ( !tryAdjacent(cell, dir, cell) || cell == _center ) break;
        } while ( pointsInRange(cell) >= _options.minPointsInRange );
        return count;
    }

    void RadiusSearch::eachCellInRow(hash rowCell, fleece::function_ref<void(const hash&)> callback) const {
        callback(rowCell);
        hash cell = rowCell;
        for ( unsigned i = 0; i < _westExtent; ++i ) {
            if ( !tryAdjacent(cell, West, cell) ) break;
            callback(cell);
        }
        cell = rowCell;
        for ( unsigned i = 0; i < _westExtent; ++i ) {
            if ( !tryAdjacent(cell, East, cell) ) break;
            callback(cell);
        }
    }

    void RadiusSearch::eachCandidate(fleece::function_ref<void(const hash&)> callback) const {
        hash row = _center;
        for ( unsigned i = 0; i < _northExtent; ++i ) {
            eachCellInRow(row, callback);
            if ( !tryAdjacent(row, North, row) ) break;
        }

        if ( !tryAdjacent(_center, South, row) ) return;
        for ( unsigned i = 0; i < _southExtent; ++i ) {
            eachCellInRow(row, callback);
            if ( !tryAdjacent(row, South, row) ) break;
        }
    }

    std::set<hash> RadiusSearch::cells() const {
        std::set<hash> result;
        unsigned       nCandidates = 0;
        eachCandidate([&](const hash& cell) {
            ++nCandidates;
            unsigned points = pointsInRange(cell);
            LogDebug(GeohashLog, "    %s has %u points in range", cell.c_str(), points);
            if ( points >= _options.minPointsInRange ) result.insert(cell);
        });
        result.insert(_center);
        LogVerbose(GeohashLog, "Radius search around %s kept %zu of %u cells", _center.c_str(), result.size(),
                   nCandidates);
        return result;
    }

    std::set<hash> cellsWithinRadius(const hash& center, double distanceKm, unsigned minPointsInRange) {
        return RadiusSearch(center, {distanceKm, minPointsInRange}).cells();
    }

}  // namespace geoutil::geohash

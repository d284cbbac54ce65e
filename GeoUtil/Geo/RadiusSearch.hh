//
// RadiusSearch.hh
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
#include "Geohash.hh"
#include "fleece/function_ref.hh"
#include <set>

namespace geoutil::geohash {

    /** Finds the GeoHash cells, of the same length as a center cell, that lie approximately within
        a distance of the center cell's centroid. A cell qualifies if enough of its five
        representative points (its corners and centroid) are within range.

        The search walks outward from the center to find how many cells the radius spans to the
        north, south and west (east is taken to be the same as west), then tests every cell of
        that grid. Cells beyond a pole don't exist, so the grid is cut off there. */
    class RadiusSearch {
      public:
        struct Options {
            double   distanceKm       = 0.0;  ///< Radius, in kilometers
            unsigned minPointsInRange = 1;    ///< How many of a cell's 5 points must be in range (1..5)
        };

        /** Throws InvalidParameter if the options are out of range, EmptyHash if `center` is empty. */
        RadiusSearch(const hash& center, const Options&);

        const hash& center() const { return _center; }

        const Options& options() const { return _options; }

        /** Number of rows from the center row northward, including the center row. */
        unsigned northExtent() const { return _northExtent; }

        /** Number of rows south of the center row. */
        unsigned southExtent() const { return _southExtent; }

        /** Number of columns on each side of the center column. */
        unsigned westExtent() const { return _westExtent; }

        /** Calls `callback` for every candidate cell in the search grid, row by row. */
        void eachCandidate(fleece::function_ref<void(const hash&)> callback) const;

        /** Returns the number of the cell's 5 representative points within range of the center. */
        unsigned pointsInRange(const hash&) const;

        /** Runs the search, returning the matching cells. Always includes the center. */
        std::set<hash> cells() const;

      private:
        unsigned countSteps(direction) const;
        void     eachCellInRow(hash rowCell, fleece::function_ref<void(const hash&)> callback) const;

        hash     _center;
        Options  _options;
        coord    _centroid;
        unsigned _northExtent, _southExtent, _westExtent;
    };

    /** Returns the cells of the same length as `center` whose representative points are within
        `distanceKm` of its centroid, requiring at least `minPointsInRange` (1..5) of the 5 points. */
    std::set<hash> cellsWithinRadius(const hash& center, double distanceKm, unsigned minPointsInRange = 1);

}  // namespace geoutil::geohash

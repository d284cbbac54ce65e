//
// RadiusSearchTest.cc
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

#include "GeoUtilTest.hh"
#include <cmath>

using namespace geoutil::geohash;


static std::set<hash> hashSet(std::initializer_list<const char*> strs) {
    std::set<hash> result;
    for ( auto str : strs ) result.insert(hash(str));
    return result;
}

TEST_CASE_METHOD(TestFixture, "Radius Search", "[geohash][radius]") {
    hash center("dqcjqcps");

    SECTION("Any Point In Range") {
        auto cells = cellsWithinRadius(center, 0.03);
        CHECK(cells
              == hashSet({"dqcjqcp7", "dqcjqcpe", "dqcjqcpg", "dqcjqcpk", "dqcjqcpm", "dqcjqcps", "dqcjqcpt",
                          "dqcjqcpu", "dqcjqcpv"}));
        CHECK(cells.count(hash("dqcjqcph")) == 0);
    }
    SECTION("Three Points In Range") {
        auto cells = cellsWithinRadius(center, 0.03, 3);
        CHECK(cells == hashSet({"dqcjqcpe", "dqcjqcpk", "dqcjqcps", "dqcjqcpt", "dqcjqcpu"}));
        CHECK(cells.count(hash("dqcjqcpm")) == 0);
    }
    SECTION("Zero Distance") {
        CHECK(cellsWithinRadius(center, 0.0) == hashSet({"dqcjqcps"}));
        CHECK(cellsWithinRadius(center, 0.0, 5) == hashSet({"dqcjqcps"}));
    }
    CHECK(warningsLogged() == 0);
}

TEST_CASE("Radius Search Containment", "[geohash][radius]") {
    hash center = encode(coord(51.5001524, -0.1262362), 6);
    for ( unsigned minPoints = 1; minPoints <= 5; ++minPoints ) {
        INFO("minPointsInRange = " << minPoints);
        RadiusSearch search(center, {5.0, minPoints});
        auto         cells = search.cells();
        CHECK(cells.count(center) == 1);
        for ( const hash& cell : cells ) {
            CHECK(cell.length() == center.length());
            if ( cell != center ) CHECK(search.pointsInRange(cell) >= minPoints);
        }

        // Every candidate that qualifies is in the result:
        unsigned nCandidates = 0;
        search.eachCandidate([&](const hash& cell) {
            ++nCandidates;
            CHECK((search.pointsInRange(cell) >= minPoints) == (cells.count(cell) == 1 || cell == center));
        });
        CHECK(nCandidates >= cells.size());
    }
}

TEST_CASE("Radius Search Extents", "[geohash][radius]") {
    RadiusSearch search(hash("dqcjqcps"), {0.0, 1});
    CHECK(search.northExtent() == 1);
    CHECK(search.southExtent() == 1);
    CHECK(search.westExtent() == 1);
    CHECK(search.options().distanceKm == 0.0);
    CHECK(search.center() == hash("dqcjqcps"));

    // Rows are the center's and the one south of it, each 3 cells wide:
    std::set<hash> candidates;
    search.eachCandidate([&](const hash& cell) { candidates.insert(cell); });
    CHECK(candidates
          == hashSet({"dqcjqcpk", "dqcjqcps", "dqcjqcpu", "dqcjqcp7", "dqcjqcpe", "dqcjqcpg"}));

    // A wider search spans more rows and columns:
    RadiusSearch wide(hash("dqcjqcps"), {0.2, 1});
    CHECK(wide.northExtent() > 1);
    CHECK(wide.southExtent() > 1);
    CHECK(wide.westExtent() > 1);
}

TEST_CASE("Radius Search Whole World", "[geohash][radius]") {
    // Stops at the poles, and at the center after longitude wraps around:
    RadiusSearch search(hash("s"), {20000.0, 1});
    CHECK(search.northExtent() == 2);
    CHECK(search.southExtent() == 3);
    CHECK(search.westExtent() == 8);
    CHECK(search.cells().size() == 32);
}

TEST_CASE("Radius Search Antipodal Cells", "[geohash][radius]") {
    // Cells on the far side of the globe are measured as half the circumference away, not NaN:
    // The centroid of "248" is exactly antipodal to the centroid of another 3-character cell.
    auto cells = cellsWithinRadius(hash("248"), 25000.0, 5);
    CHECK(cells.size() == 32 * 32 * 32);
}

TEST_CASE("Radius Search Near Pole", "[geohash][radius]") {
    hash center = encode(coord(89.99, 0.0), 4);
    auto cells  = cellsWithinRadius(center, 100.0);
    CHECK(cells.count(center) == 1);
    for ( const hash& cell : cells ) CHECK(cell.length() == 4);
}

TEST_CASE("Radius Search Errors", "[geohash][radius][errors]") {
    hash center("dqcjqcps");
    ExpectException(error::InvalidParameter, [&] { cellsWithinRadius(center, 1.0, 0); });
    ExpectException(error::InvalidParameter, [&] { cellsWithinRadius(center, 1.0, 6); });
    ExpectException(error::InvalidParameter, [&] { cellsWithinRadius(center, -1.0); });
    ExpectException(error::InvalidParameter, [&] { cellsWithinRadius(center, std::nan("")); });
    ExpectException(error::EmptyHash, [&] { cellsWithinRadius(hash(), 1.0); });
}

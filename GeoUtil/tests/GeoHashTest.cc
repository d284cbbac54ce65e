//
// GeoHashTest.cc
//
// Copyright 2014-Present Couchbase, Inc.
//
// Use of this software is governed by the Business Source License included
// in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
// in that file, in accordance with the Business Source License, use of this
// software will be governed by the Apache License, Version 2.0, included in
// the file licenses/APL2.txt.
//

#include "Geohash.hh"

#include "GeoUtilTest.hh"
#include <sstream>

using namespace geoutil::geohash;


static const coord kWhiteHouse(38.897872, -77.036510);


static void verify_hash(double lat, double lon, int len, const char* expected) {
    hash result(coord(lat, lon), len);
    REQUIRE(std::string(result.string) == std::string(expected));
}

TEST_CASE("Geohash Encode", "[geohash]") {
    verify_hash(45.37, -121.7, 6, "c216ne");
    verify_hash(47.6062095, -122.3320708, 13, "c23nb62w20sth");
    verify_hash(35.6894875, 139.6917064, 13, "xn774c06kdtve");
    verify_hash(-33.8671390, 151.2071140, 13, "r3gx2f9tt5sne");
    verify_hash(51.5001524, -0.1262362, 13, "gcpuvpk44kprq");

    CHECK(encode(kWhiteHouse) == hash("dqcjqcps"));
    CHECK(encode(kWhiteHouse, 7) == hash("dqcjqcp"));
    CHECK(kWhiteHouse.encode(1) == hash("d"));
    CHECK(encode(kWhiteHouse, 22).length() == 22);
}

TEST_CASE("Geohash Long Hashes", "[geohash]") {
    // Precision has no upper limit, even past the resolution of a double:
    hash h22 = encode(kWhiteHouse, 22);
    hash h30 = encode(kWhiteHouse, 30);
    CHECK(h30.length() == 30);
    CHECK(h30.asString().substr(0, 22) == h22.asString());
    CHECK(decode(h30).contains(kWhiteHouse));

    hash longer("dqcjqcpsdqcjqcpsdqcjqcps");
    CHECK(longer.length() == 24);
    CHECK(hash::isValid("0123456789bcdefghjkmnpq"));
    area outer = decode(hash("dqcjqcpsdqcjqcpsdqcjqc"));
    area inner = decode(longer);
    CHECK(inner.latitude.min >= outer.latitude.min);
    CHECK(inner.latitude.max <= outer.latitude.max);
    CHECK(inner.longitude.min >= outer.longitude.min);
    CHECK(inner.longitude.max <= outer.longitude.max);

    hash east = neighbor(longer, East);
    CHECK(east.length() == 24);
    CHECK(east.asString().substr(0, 23) == longer.asString().substr(0, 23));
    CHECK(east != longer);
}

TEST_CASE("Geohash Encode Midpoint", "[geohash]") {
    // A value exactly on a dividing line goes to the lower half:
    CHECK(encode(coord(0, 0), 1) == hash("7"));
    CHECK(encode(coord(0, 0), 2) == hash("7z"));
    CHECK(encode(coord(90, 180), 1) == hash("z"));
    CHECK(encode(coord(-90, -180), 1) == hash("0"));
}

TEST_CASE("Geohash Encode Prefixes", "[geohash]") {
    // Every shorter hash of a point is a prefix of the longer ones:
    std::string full = encode(kWhiteHouse, 12).asString();
    for ( int len = 1; len <= 12; ++len ) {
        INFO("len = " << len);
        CHECK(encode(kWhiteHouse, len).asString() == full.substr(0, len));
    }
}

static void verify_area(const char* str, double lat_min, double lon_min, double lat_max, double lon_max) {
    area a = hash(str).decode();
    REQUIRE(a.latitude.max == Approx(lat_max));
    REQUIRE(a.latitude.min == Approx(lat_min));
    REQUIRE(a.longitude.max == Approx(lon_max));
    REQUIRE(a.longitude.min == Approx(lon_min));
}

TEST_CASE("Geohash Decode", "[geohash]") {
    verify_area("c216ne", 45.3680419921875, -121.70654296875, 45.37353515625, -121.695556640625);
    verify_area("dqcw4", 39.0234375, -76.552734375, 39.0673828125, -76.5087890625);

    area a = decode(hash("dqcjqcps"));
    CHECK(a.northWest().latitude == Approx(38.897953033447266));
    CHECK(a.northWest().longitude == Approx(-77.03681945800781));
    CHECK(a.southEast().latitude == Approx(38.89778137207031));
    CHECK(a.southEast().longitude == Approx(-77.0364761352539));
    CHECK(a.northEast() == coord(a.latitude.max, a.longitude.max));
    CHECK(a.southWest() == coord(a.latitude.min, a.longitude.min));
    CHECK(a.centroid().latitude == Approx((a.latitude.min + a.latitude.max) / 2));
    CHECK(a.centroid().longitude == Approx((a.longitude.min + a.longitude.max) / 2));

    auto corners = a.corners();
    CHECK(corners[0] == a.northWest());
    CHECK(corners[1] == a.northEast());
    CHECK(corners[2] == a.southEast());
    CHECK(corners[3] == a.southWest());
    CHECK(corners[4] == a.centroid());
}

TEST_CASE("Geohash Decode Whole World", "[geohash]") {
    // Each pair of characters halves both axes 5 times between them:
    area a = hash("s").decode();
    CHECK(a.latitude.min == 0.0);
    CHECK(a.latitude.max == 45.0);
    CHECK(a.longitude.min == 0.0);
    CHECK(a.longitude.max == 45.0);
    CHECK(a.dump() == "(0, 0)...(45, 45)");
}

TEST_CASE("Geohash Round Trip", "[geohash]") {
    const coord points[] = {kWhiteHouse, {45.37, -121.7}, {-33.8671390, 151.2071140},
                            {51.5001524, -0.1262362}, {0, 0}, {89.9, 179.9}, {-89.9, -179.9}};
    for ( coord c : points ) {
        for ( int len = 1; len <= 12; ++len ) {
            INFO("coord " << c << ", len " << len);
            hash h = encode(c, len);
            CHECK(h.length() == size_t(len));
            area a = decode(h);
            CHECK(a.isValid());
            CHECK(a.contains(c));
            CHECK(a.northWest().latitude >= a.southEast().latitude);
            CHECK(a.northWest().longitude <= a.southEast().longitude);
            CHECK(encode(a.centroid(), len) == h);
        }
    }
}

TEST_CASE("Geohash Verification", "[geohash]") {
    CHECK(hash::isValid("dqcw5"));
    CHECK(hash::isValid("dqcw7"));
    CHECK_FALSE(hash::isValid("abcwd"));
    CHECK_FALSE(hash::isValid("dqcw5@"));
    CHECK_FALSE(hash::isValid("DQCW5"));
    CHECK_FALSE(hash::isValid(""));
    CHECK(hash::isValid("0123456789bcdefghjkmnp"));
    CHECK(hash::isValid("0123456789bcdefghjkmnpqrstuvwxyz"));
}

TEST_CASE("Geohash Errors", "[geohash][errors]") {
    SECTION("Precision") {
        ExpectException(error::InvalidPrecision, [] { encode(kWhiteHouse, 0); });
        ExpectException(error::InvalidPrecision, [] { encode(kWhiteHouse, -1); });
        ExpectException(error::InvalidPrecision, "Geohash precision must be positive, not -5",
                        [] { encode(kWhiteHouse, -5); });
    }
    SECTION("Empty") {
        ExpectException(error::EmptyHash, [] { hash(""); });
        ExpectException(error::EmptyHash, [] { decode(hash()); });
        ExpectException(error::EmptyHash, [] { neighbor(hash(), North); });
        ExpectException(error::EmptyHash, [] { allNeighbors(hash()); });
    }
    SECTION("Bad Characters") {
        for ( const char* str : {"dqcja", "dqcji", "dqcjl", "dqcjo", "DQCJQ", "dqcw5@", "dq cj"} ) {
            INFO("hash " << str);
            ExpectException(error::InvalidHashCharacter, [=] { (void)hash(str); });
        }
        ExpectException(error::InvalidHashCharacter, "Invalid character 'a' in geohash \"abcwd\"",
                        [] { hash("abcwd"); });
    }
    SECTION("Corrupted Hash") {
        // The string member is writeable, so operations re-check it:
        hash h("dqcw5");
        h.string[2] = 'A';
        ExpectException(error::InvalidHashCharacter, [&] { h.decode(); });
        ExpectException(error::InvalidHashCharacter, [&] { h.adjacent(East); });
    }
}

TEST_CASE("Geohash Comparison", "[geohash]") {
    CHECK(hash("dqcw5") == hash("dqcw5"));
    CHECK(hash("dqcw5") != hash("dqcw7"));
    CHECK(hash("dqcw5") < hash("dqcw7"));
    CHECK_FALSE(hash("dqcw") == hash("dqcw5"));
    CHECK(hash().isEmpty());
    CHECK(hash("dqcw5").asString() == "dqcw5");

    std::stringstream out;
    out << hash("dqcw5");
    CHECK(out.str() == "dqcw5");
}

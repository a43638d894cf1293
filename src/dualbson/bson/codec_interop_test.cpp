/**
 *    Copyright (C) 2018-present MongoDB, Inc.
 *
 *    This program is free software: you can redistribute it and/or modify
 *    it under the terms of the Server Side Public License, version 1,
 *    as published by MongoDB, Inc.
 *
 *    This program is distributed in the hope that it will be useful,
 *    but WITHOUT ANY WARRANTY; without even the implied warranty of
 *    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *    Server Side Public License for more details.
 *
 *    You should have received a copy of the Server Side Public License
 *    along with this program. If not, see
 *    <http://www.mongodb.com/licensing/server-side-public-license>.
 *
 *    As a special exception, the copyright holders give permission to link the
 *    code of portions of this program with the OpenSSL library under certain
 *    conditions as described in each individual source file and distribute
 *    linked combinations including the program with the OpenSSL library. You
 *    must comply with the Server Side Public License in all respects for
 *    all of the code used other than as permitted herein. If you modify file(s)
 *    with this exception, you may extend this exception to your version of the
 *    file(s), but you are not obligated to do so. If you do not wish to do so,
 *    delete this exception statement from your version. If you delete this
 *    exception statement from all source files in the program, then also delete
 *    it in the license file.
 */

#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <vector>

#include "dualbson/bson/codec.h"
#include "dualbson/unittest/unittest.h"

namespace dualbson {
namespace {

struct CurrentIdHolder {
    current::ObjectID id;

    bool operator==(const CurrentIdHolder& other) const {
        return id == other.id;
    }
};

struct CurrentOptionals {
    std::optional<current::ObjectID> id;
    std::optional<current::Regex> regex;

    bool operator==(const CurrentOptionals& other) const {
        return id == other.id && regex == other.regex;
    }
};

struct LegacyIdHolder {
    legacy::ObjectId id;

    bool operator==(const LegacyIdHolder& other) const {
        return id == other.id;
    }
};

struct LegacyOptionals {
    std::optional<legacy::ObjectId> id;
    std::optional<legacy::RegEx> regex;

    bool operator==(const LegacyOptionals& other) const {
        return id == other.id && regex == other.regex;
    }
};

struct NullableCurrentId {
    std::optional<current::ObjectID> id;
};

struct RequiredLegacyId {
    legacy::ObjectId id = legacy::NewObjectId();
};

struct RequiredCurrentId {
    current::ObjectID id;
};

struct Timed {
    Date_t time;
};

}  // namespace

template <>
struct BSONStructFields<CurrentIdHolder> {
    static constexpr auto fields =
        std::make_tuple(bsonField("_id", &CurrentIdHolder::id, FieldOptions::kOmitEmpty));
};

template <>
struct BSONStructFields<CurrentOptionals> {
    static constexpr auto fields =
        std::make_tuple(bsonField("_id", &CurrentOptionals::id, FieldOptions::kOmitEmpty),
                        bsonField("regex", &CurrentOptionals::regex, FieldOptions::kOmitEmpty));
};

template <>
struct BSONStructFields<LegacyIdHolder> {
    static constexpr auto fields =
        std::make_tuple(bsonField("_id", &LegacyIdHolder::id, FieldOptions::kOmitEmpty));
};

template <>
struct BSONStructFields<LegacyOptionals> {
    static constexpr auto fields =
        std::make_tuple(bsonField("_id", &LegacyOptionals::id, FieldOptions::kOmitEmpty),
                        bsonField("regex", &LegacyOptionals::regex, FieldOptions::kOmitEmpty));
};

template <>
struct BSONStructFields<NullableCurrentId> {
    static constexpr auto fields = std::make_tuple(bsonField("_id", &NullableCurrentId::id));
};

template <>
struct BSONStructFields<RequiredLegacyId> {
    static constexpr auto fields = std::make_tuple(bsonField("_id", &RequiredLegacyId::id));
};

template <>
struct BSONStructFields<RequiredCurrentId> {
    static constexpr auto fields = std::make_tuple(bsonField("_id", &RequiredCurrentId::id));
};

template <>
struct BSONStructFields<Timed> {
    static constexpr auto fields = std::make_tuple(bsonField("time", &Timed::time));
};

namespace {

// Both front-ends must produce the same bytes for `c` and its legacy counterpart `l`. The bytes
// are stored in `out` when it is given.
template <typename C, typename L>
void assertSameBytes(const C& c, const L& l, std::vector<char>* out = nullptr) {
    auto legacyOfC = legacy::marshal(c);
    auto legacyOfL = legacy::marshal(l);
    auto currentOfC = current::marshal(c);
    auto currentOfL = current::marshal(l);
    ASSERT_OK(legacyOfC);
    ASSERT_OK(legacyOfL);
    ASSERT_OK(currentOfC);
    ASSERT_OK(currentOfL);

    ASSERT_EQUALS(legacyOfC.getValue(), legacyOfL.getValue());
    ASSERT_EQUALS(currentOfC.getValue(), currentOfL.getValue());
    ASSERT_EQUALS(legacyOfC.getValue(), currentOfC.getValue());
    if (out)
        *out = currentOfC.getValue();
}

// Additionally decodes the bytes through both front-ends into fresh values of both types.
template <typename C, typename L>
void assertRoundTrips(const C& c, const L& l) {
    std::vector<char> bytes;
    assertSameBytes(c, l, &bytes);
    ASSERT_FALSE(bytes.empty());

    C cViaLegacy;
    ASSERT_OK(legacy::unmarshal(bytes, &cViaLegacy));
    ASSERT_TRUE(cViaLegacy == c);

    C cViaCurrent;
    ASSERT_OK(current::unmarshal(bytes, &cViaCurrent));
    ASSERT_TRUE(cViaCurrent == c);

    L lViaLegacy;
    ASSERT_OK(legacy::unmarshal(bytes, &lViaLegacy));
    ASSERT_TRUE(lViaLegacy == l);

    L lViaCurrent;
    ASSERT_OK(current::unmarshal(bytes, &lViaCurrent));
    ASSERT_TRUE(lViaCurrent == l);
}

TEST(InteropObjectIdTest, RealId) {
    auto id = current::NewObjectID();
    assertRoundTrips(CurrentIdHolder{id}, LegacyIdHolder{legacy::ObjectIdHex(id.hex())});
}

TEST(InteropObjectIdTest, ZeroIdIsOmitted) {
    std::vector<char> bytes;
    assertSameBytes(CurrentIdHolder{}, LegacyIdHolder{}, &bytes);
    ASSERT_EQUALS(bytes.size(), 5u);
    assertRoundTrips(CurrentIdHolder{}, LegacyIdHolder{});
}

TEST(InteropObjectIdTest, SetOptionalId) {
    auto id = current::NewObjectID();
    CurrentOptionals c;
    c.id = id;
    LegacyOptionals l;
    l.id = legacy::ObjectIdHex(id.hex());
    assertRoundTrips(c, l);
}

TEST(InteropObjectIdTest, UnsetOptionalId) {
    assertRoundTrips(CurrentOptionals{}, LegacyOptionals{});
}

TEST(InteropObjectIdTest, NullIdIntoLegacyIdGivesEmptyId) {
    auto bytes = current::marshal(NullableCurrentId{});
    ASSERT_OK(bytes);

    RequiredLegacyId viaLegacy;
    ASSERT_OK(legacy::unmarshal(bytes.getValue(), &viaLegacy));
    ASSERT_EQUALS(viaLegacy.id, legacy::ObjectId());

    RequiredLegacyId viaCurrent;
    ASSERT_OK(current::unmarshal(bytes.getValue(), &viaCurrent));
    ASSERT_EQUALS(viaCurrent.id, legacy::ObjectId());
}

TEST(InteropObjectIdTest, NullIdIntoCurrentIdFails) {
    auto bytes = legacy::marshal(NullableCurrentId{});
    ASSERT_OK(bytes);

    RequiredCurrentId viaLegacy;
    ASSERT_STATUS_CODE(ErrorCodes::TypeMismatch, legacy::unmarshal(bytes.getValue(), &viaLegacy));

    RequiredCurrentId viaCurrent;
    ASSERT_STATUS_CODE(ErrorCodes::TypeMismatch,
                       current::unmarshal(bytes.getValue(), &viaCurrent));
}

TEST(InteropObjectIdTest, HexStringIntoIdOfEitherFamily) {
    auto bytes = current::marshal(current::M{{"_id", "507f1f77bcf86cd799439011"}});
    ASSERT_OK(bytes);

    CurrentIdHolder c;
    ASSERT_OK(current::unmarshal(bytes.getValue(), &c));
    LegacyIdHolder l;
    ASSERT_OK(legacy::unmarshal(bytes.getValue(), &l));
    ASSERT_EQUALS(c.id.hex(), "507f1f77bcf86cd799439011");
    ASSERT_EQUALS(l.id.hex(), c.id.hex());
}

TEST(InteropRegexTest, SetOptionalRegex) {
    CurrentOptionals c;
    c.regex = current::Regex{".*", "i"};
    LegacyOptionals l;
    l.regex = legacy::RegEx{".*", "i"};
    assertSameBytes(c, l);
}

TEST(InteropRegexTest, UnsetOptionalRegex) {
    assertSameBytes(CurrentOptionals{}, LegacyOptionals{});
}

TEST(InteropTimeTest, SameBytesAndSameInstant) {
    auto now = Date_t::now();
    std::vector<char> bytes;
    assertSameBytes(current::M{{"time", now}}, legacy::M{{"time", now}}, &bytes);

    Timed viaLegacy;
    ASSERT_OK(legacy::unmarshal(bytes, &viaLegacy));
    Timed viaCurrent;
    ASSERT_OK(current::unmarshal(bytes, &viaCurrent));
    ASSERT_EQUALS(viaLegacy.time, viaCurrent.time);
    ASSERT_EQUALS(viaLegacy.time, now);
}

TEST(InteropMTest, BasicKeyValue) {
    assertSameBytes(current::M{{"name", "abc"}}, legacy::M{{"name", "abc"}});
}

TEST(InteropMTest, WithCurrentId) {
    auto id = current::NewObjectID();
    assertSameBytes(current::M{{"_id", id}}, legacy::M{{"_id", id}});
}

TEST(InteropMTest, WithLegacyId) {
    auto id = legacy::NewObjectId();
    assertSameBytes(current::M{{"_id", id}}, legacy::M{{"_id", id}});
}

TEST(InteropDTest, BasicKeyValue) {
    assertRoundTrips(current::D{{"name", "abc"}}, legacy::D{{"name", "abc"}});
}

class InteropArrayTest : public ::testing::Test {
protected:
    current::ObjectID pid = current::NewObjectID();
    legacy::ObjectId bid = legacy::NewObjectId();

    current::M currentDoc() const {
        return current::M{{"array",
                           current::A{pid,
                                      bid,
                                      "asdf",
                                      current::M{{"name", Value::int32(123)}},
                                      legacy::M{{"name", Value::int32(123)}}}}};
    }

    legacy::M legacyDoc() const {
        return legacy::M{{"array",
                          legacy::Array{pid,
                                        bid,
                                        "asdf",
                                        current::M{{"name", Value::int32(123)}},
                                        legacy::M{{"name", Value::int32(123)}}}}};
    }

    std::vector<char> bytes() const {
        auto sw = current::marshal(currentDoc());
        return uassertStatusOK(sw);
    }

    legacy::ObjectId pidAsLegacy() const {
        return legacy::ObjectIdHex(pid.hex());
    }

    current::ObjectID bidAsCurrent() const {
        return uassertStatusOK(current::ObjectIDFromHex(bid.hex()));
    }
};

TEST_F(InteropArrayTest, Marshal) {
    assertSameBytes(currentDoc(), legacyDoc());
}

TEST_F(InteropArrayTest, LegacyFrontEndIntoLegacyTypes) {
    legacy::M m;
    ASSERT_OK(legacy::unmarshal(bytes(), &m));
    legacy::M expected{{"array",
                        legacy::Array{pidAsLegacy(),
                                      bid,
                                      "asdf",
                                      legacy::M{{"name", 123}},
                                      legacy::M{{"name", 123}}}}};
    ASSERT_EQUALS(m, expected);
}

TEST_F(InteropArrayTest, LegacyFrontEndIntoCurrentTypes) {
    // The destination map type is used for every nested document, while sequences, ids and
    // integers follow the legacy front-end.
    current::M m;
    ASSERT_OK(legacy::unmarshal(bytes(), &m));
    current::M expected{{"array",
                         legacy::Array{pidAsLegacy(),
                                       bid,
                                       "asdf",
                                       current::M{{"name", 123}},
                                       current::M{{"name", 123}}}}};
    ASSERT_EQUALS(m, expected);
}

TEST_F(InteropArrayTest, CurrentFrontEndIntoLegacyTypes) {
    legacy::M m;
    ASSERT_OK(current::unmarshal(bytes(), &m));
    legacy::M expected{{"array",
                        current::A{pid,
                                   bidAsCurrent(),
                                   "asdf",
                                   legacy::M{{"name", Value::int32(123)}},
                                   legacy::M{{"name", Value::int32(123)}}}}};
    ASSERT_EQUALS(m, expected);
}

TEST_F(InteropArrayTest, CurrentFrontEndIntoCurrentTypes) {
    current::M m;
    ASSERT_OK(current::unmarshal(bytes(), &m));
    current::M expected{{"array",
                         current::A{pid,
                                    bidAsCurrent(),
                                    "asdf",
                                    current::M{{"name", Value::int32(123)}},
                                    current::M{{"name", Value::int32(123)}}}}};
    ASSERT_EQUALS(m, expected);
}

// Rebuilds `v` with every family specific kind swapped for its counterpart in the other family.
Value mirror(const Value& v) {
    switch (v.type()) {
        case Value::Type::kLegacyObjectId:
            return current::ObjectID(v.getLegacyObjectId().oid());
        case Value::Type::kObjectID:
            return legacy::ObjectId(v.getObjectID().oid());
        case Value::Type::kLegacyRegEx:
            return current::Regex{v.getLegacyRegEx().pattern, v.getLegacyRegEx().options};
        case Value::Type::kRegex:
            return legacy::RegEx{v.getRegex().pattern, v.getRegex().options};
        case Value::Type::kLegacyM: {
            current::M m;
            for (const auto& [key, value] : v.getLegacyM())
                m.emplace(key, mirror(value));
            return m;
        }
        case Value::Type::kM: {
            legacy::M m;
            for (const auto& [key, value] : v.getM())
                m.emplace(key, mirror(value));
            return m;
        }
        case Value::Type::kLegacyD: {
            current::D d;
            for (const auto& elem : v.getLegacyD())
                d.push_back({elem.name, mirror(elem.value)});
            return d;
        }
        case Value::Type::kD: {
            legacy::D d;
            for (const auto& elem : v.getD())
                d.push_back({elem.name, mirror(elem.value)});
            return d;
        }
        case Value::Type::kLegacyArray: {
            current::A a;
            for (const auto& value : v.getLegacyArray())
                a.push_back(mirror(value));
            return a;
        }
        case Value::Type::kA: {
            legacy::Array a;
            for (const auto& value : v.getA())
                a.push_back(mirror(value));
            return a;
        }
        default:
            return v;
    }
}

class RandomTreeGenerator {
public:
    explicit RandomTreeGenerator(uint32_t seed) : _rng(seed) {}

    Value document(int depth) {
        const int n = pick(0, 4);
        switch (pick(0, 3)) {
            case 0: {
                legacy::M m;
                for (int i = 0; i < n; ++i)
                    m.emplace(key(), value(depth));
                return m;
            }
            case 1: {
                current::M m;
                for (int i = 0; i < n; ++i)
                    m.emplace(key(), value(depth));
                return m;
            }
            case 2: {
                legacy::D d;
                for (int i = 0; i < n; ++i)
                    d.push_back({key(), value(depth)});
                return d;
            }
            default: {
                current::D d;
                for (int i = 0; i < n; ++i)
                    d.push_back({key(), value(depth)});
                return d;
            }
        }
    }

private:
    int pick(int lo, int hi) {
        return std::uniform_int_distribution<int>(lo, hi)(_rng);
    }

    std::string key() {
        return std::string(1, static_cast<char>('a' + pick(0, 25))) + std::to_string(pick(0, 9));
    }

    Value sequence(int depth) {
        const int n = pick(0, 4);
        if (pick(0, 1) == 0) {
            legacy::Array a;
            for (int i = 0; i < n; ++i)
                a.push_back(value(depth));
            return a;
        }
        current::A a;
        for (int i = 0; i < n; ++i)
            a.push_back(value(depth));
        return a;
    }

    Value value(int depth) {
        const int maxKind = depth > 0 ? 13 : 11;
        switch (pick(0, maxKind)) {
            case 0:
                return Value();
            case 1:
                return Value(pick(0, 1) == 1);
            case 2:
                return Value(pick(-1000000, 1000000));
            case 3:
                return Value::int32(pick(-1000, 1000));
            case 4:
                return Value::int64(int64_t{pick(0, 1000)} << 33);
            case 5:
                return Value(pick(-1000, 1000) / 8.0);
            case 6:
                return Value(key());
            case 7:
                return Value(Date_t::fromMillisSinceEpoch(int64_t{pick(0, 1000000)} * 1000003));
            case 8:
                return Value(legacy::NewObjectId());
            case 9:
                return Value(current::NewObjectID());
            case 10:
                return Value(legacy::RegEx{key(), pick(0, 1) ? "mi" : ""});
            case 11:
                return Value(current::Regex{key(), pick(0, 1) ? "xs" : ""});
            case 12:
                return document(depth - 1);
            default:
                return sequence(depth - 1);
        }
    }

    std::mt19937 _rng;
};

TEST(InteropRandomTest, MirroredTreesEncodeIdentically) {
    RandomTreeGenerator gen(20240611);
    for (int i = 0; i < 200; ++i) {
        Value tree = gen.document(4);
        Value mirrored = mirror(tree);
        ASSERT_NOT_EQUALS(tree.family(), mirrored.family());

        auto original = encode(tree);
        auto counterpart = encode(mirrored);
        ASSERT_OK(original);
        ASSERT_OK(counterpart);
        ASSERT_EQUALS(original.getValue(), counterpart.getValue()) << tree;
    }
}

template <typename Ordered>
void assertDecodesLosslessly(const std::vector<char>& bytes, const DecodeOptions& options) {
    Ordered decoded;
    ASSERT_OK(decode(bytes, &decoded, options));
    auto reencoded = encode(decoded);
    ASSERT_OK(reencoded);
    ASSERT_EQUALS(reencoded.getValue(), bytes);
}

TEST(InteropRandomTest, OrderedDestinationsDecodeLosslessly) {
    RandomTreeGenerator gen(7);
    for (int i = 0; i < 200; ++i) {
        auto sw = encode(gen.document(4));
        ASSERT_OK(sw);
        const auto& bytes = sw.getValue();

        assertDecodesLosslessly<legacy::D>(bytes, DecodeOptions::legacy());
        assertDecodesLosslessly<legacy::D>(bytes, DecodeOptions::current());
        assertDecodesLosslessly<current::D>(bytes, DecodeOptions::legacy());
        assertDecodesLosslessly<current::D>(bytes, DecodeOptions::current());
    }
}

}  // namespace
}  // namespace dualbson

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
#include <string>
#include <vector>

#include "dualbson/bson/codec.h"
#include "dualbson/unittest/unittest.h"

namespace dualbson {
namespace {

struct Address {
    std::string city;
    int32_t zip = 0;
};

struct Person {
    legacy::ObjectId id;
    std::string name;
    int32_t age = 0;
    int64_t visits = 0;
    double score = 0;
    bool active = false;
    Date_t joined;
    std::optional<std::string> nickname;
    Address address;
    current::A tags;
    Value extra;
};

struct Sparse {
    current::ObjectID id;
    legacy::RegEx pattern;
    std::string name;
    int32_t count = 0;
    bool flag = false;
    Date_t when;
    legacy::M attrs;
    std::optional<int32_t> maybe;
    Value any;
    Address address;
};

}  // namespace

template <>
struct BSONStructFields<Address> {
    static constexpr auto fields =
        std::make_tuple(bsonField("city", &Address::city), bsonField("zip", &Address::zip));
};

template <>
struct BSONStructFields<Person> {
    static constexpr auto fields =
        std::make_tuple(bsonField("_id", &Person::id, FieldOptions::kOmitEmpty),
                        bsonField("name", &Person::name),
                        bsonField("age", &Person::age),
                        bsonField("visits", &Person::visits),
                        bsonField("score", &Person::score),
                        bsonField("active", &Person::active),
                        bsonField("joined", &Person::joined),
                        bsonField("nickname", &Person::nickname),
                        bsonField("address", &Person::address),
                        bsonField("tags", &Person::tags),
                        bsonField("extra", &Person::extra));
};

template <>
struct BSONStructFields<Sparse> {
    static constexpr auto fields =
        std::make_tuple(bsonField("id", &Sparse::id, FieldOptions::kOmitEmpty),
                        bsonField("pattern", &Sparse::pattern, FieldOptions::kOmitEmpty),
                        bsonField("name", &Sparse::name, FieldOptions::kOmitEmpty),
                        bsonField("count", &Sparse::count, FieldOptions::kOmitEmpty),
                        bsonField("flag", &Sparse::flag, FieldOptions::kOmitEmpty),
                        bsonField("when", &Sparse::when, FieldOptions::kOmitEmpty),
                        bsonField("attrs", &Sparse::attrs, FieldOptions::kOmitEmpty),
                        bsonField("maybe", &Sparse::maybe, FieldOptions::kOmitEmpty),
                        bsonField("any", &Sparse::any, FieldOptions::kOmitEmpty),
                        bsonField("address", &Sparse::address, FieldOptions::kOmitEmpty));
};

namespace {

static_assert(isBSONStruct<Person>);
static_assert(!isBSONStruct<legacy::M>);

std::vector<char> encodeOK(const auto& value) {
    return uassertStatusOK(encode(value));
}

Person samplePerson() {
    Person p;
    p.id = legacy::ObjectIdHex("507f1f77bcf86cd799439011");
    p.name = "ada";
    p.age = 36;
    p.visits = int64_t{1} << 40;
    p.score = 99.5;
    p.active = true;
    p.joined = Date_t::fromMillisSinceEpoch(1600000000123LL);
    p.nickname = "countess";
    p.address = Address{"london", 12345};
    p.tags = current::A{"math", Value::int32(1)};
    p.extra = current::D{{"k", "v"}};
    return p;
}

void assertSamePerson(const Person& a, const Person& b) {
    ASSERT_EQUALS(a.id, b.id);
    ASSERT_EQUALS(a.name, b.name);
    ASSERT_EQUALS(a.age, b.age);
    ASSERT_EQUALS(a.visits, b.visits);
    ASSERT_EQUALS(a.score, b.score);
    ASSERT_EQUALS(a.active, b.active);
    ASSERT_EQUALS(a.joined, b.joined);
    ASSERT(a.nickname == b.nickname);
    ASSERT_EQUALS(a.address.city, b.address.city);
    ASSERT_EQUALS(a.address.zip, b.address.zip);
    ASSERT_EQUALS(a.tags, b.tags);
    ASSERT_EQUALS(a.extra, b.extra);
}

TEST(StructCodecTest, FieldsAreWrittenInDeclarationOrder) {
    Address a{"paris", 75001};
    auto bytes = encodeOK(a);

    current::D d;
    ASSERT_OK(current::unmarshal(bytes, &d));
    ASSERT_EQUALS(d, (current::D{{"city", "paris"}, {"zip", Value::int32(75001)}}));
}

TEST(StructCodecTest, RoundTripThroughBothFrontEnds) {
    Person original = samplePerson();
    auto bytes = encodeOK(original);

    Person viaCurrent;
    ASSERT_OK(current::unmarshal(bytes, &viaCurrent));
    assertSamePerson(original, viaCurrent);

    Person viaLegacy;
    ASSERT_OK(legacy::unmarshal(bytes, &viaLegacy));
    ASSERT_EQUALS(viaLegacy.id, original.id);
    ASSERT_EQUALS(viaLegacy.name, original.name);
    // The legacy front-end reads int32 elements of generic values as native ints.
    ASSERT_EQUALS(viaLegacy.tags, (current::A{"math", 1}));
    // Generic members follow the entry family.
    ASSERT_EQUALS(viaLegacy.extra, Value(legacy::M{{"k", "v"}}));
}

TEST(StructCodecTest, MatchesEquivalentGenericDocument) {
    Person p = samplePerson();
    current::D d{{"_id", p.id},
                 {"name", "ada"},
                 {"age", Value::int32(36)},
                 {"visits", Value::int64(int64_t{1} << 40)},
                 {"score", 99.5},
                 {"active", true},
                 {"joined", p.joined},
                 {"nickname", "countess"},
                 {"address", current::D{{"city", "london"}, {"zip", 12345}}},
                 {"tags", p.tags},
                 {"extra", p.extra}};
    ASSERT_EQUALS(encodeOK(p), encodeOK(d));
}

TEST(StructCodecTest, OmitEmptySkipsZeroValues) {
    Sparse s;
    current::D d;
    ASSERT_OK(current::unmarshal(encodeOK(s), &d));
    // Nested structs are never treated as empty.
    ASSERT_EQUALS(d, (current::D{{"address", current::D{{"city", ""}, {"zip", Value::int32(0)}}}}));
}

TEST(StructCodecTest, OmitEmptyKeepsSetValues) {
    Sparse s;
    s.id = current::NewObjectID();
    s.pattern = legacy::RegEx{"", "i"};
    s.name = "n";
    s.count = -1;
    s.flag = true;
    s.when = Date_t::fromMillisSinceEpoch(-1);
    s.attrs = legacy::M{{"a", 1}};
    s.maybe = 0;
    s.any = Value(false);

    current::D d;
    ASSERT_OK(current::unmarshal(encodeOK(s), &d));
    ASSERT_EQUALS(d.size(), 10u);
}

TEST(StructCodecTest, UnsetOptionalWithoutOmitEmptyIsNull) {
    Person p = samplePerson();
    p.nickname.reset();
    current::M m;
    ASSERT_OK(current::unmarshal(encodeOK(p), &m));
    ASSERT(m.at("nickname").isNull());
}

TEST(StructCodecTest, NullResetsOptionalMember) {
    Person p;
    p.nickname = "stale";
    ASSERT_OK(current::unmarshal(encodeOK(current::D{{"nickname", nullptr}}), &p));
    ASSERT_FALSE(p.nickname.has_value());
}

TEST(StructCodecTest, AbsentFieldsKeepTheirValue) {
    Person p = samplePerson();
    ASSERT_OK(current::unmarshal(encodeOK(current::D{{"name", "grace"}}), &p));
    ASSERT_EQUALS(p.name, "grace");
    ASSERT_EQUALS(p.age, 36);
    ASSERT_EQUALS(p.address.city, "london");
}

TEST(StructCodecTest, ContainersAndValuesAreReplaced) {
    Person p = samplePerson();
    ASSERT_OK(current::unmarshal(
        encodeOK(current::D{{"tags", current::A{"only"}}, {"extra", 5}}), &p));
    ASSERT_EQUALS(p.tags, (current::A{"only"}));
    ASSERT_EQUALS(p.extra, Value::int32(5));
}

TEST(StructCodecTest, UnknownFieldsAreSkipped) {
    Address a;
    ASSERT_OK(current::unmarshal(
        encodeOK(current::D{{"city", "rome"}, {"planet", "earth"}, {"zip", 100}}), &a));
    ASSERT_EQUALS(a.city, "rome");
    ASSERT_EQUALS(a.zip, 100);
}

TEST(StructCodecTest, FailedDecodeLeavesDestinationUntouched) {
    Person p = samplePerson();
    auto bytes = encodeOK(current::D{{"name", "changed"}, {"age", "not a number"}});
    ASSERT_STATUS_CODE(ErrorCodes::TypeMismatch, current::unmarshal(bytes, &p));
    ASSERT_EQUALS(p.name, "ada");
}

TEST(StructCodecTest, NestedStructFromNull) {
    Person p = samplePerson();
    ASSERT_OK(current::unmarshal(encodeOK(current::D{{"address", nullptr}}), &p));
    ASSERT_EQUALS(p.address.city, "");
    ASSERT_EQUALS(p.address.zip, 0);
}

TEST(StructCodecTest, NestedStructKindMismatch) {
    Person p;
    ASSERT_STATUS_CODE(ErrorCodes::TypeMismatch,
                       current::unmarshal(encodeOK(current::D{{"address", 3}}), &p));
}

TEST(StructCodecTest, NumericConversionsIntoMembers) {
    Person p;
    ASSERT_OK(current::unmarshal(
        encodeOK(current::D{{"age", 30.0}, {"visits", Value::int32(7)}, {"score", 2}}), &p));
    ASSERT_EQUALS(p.age, 30);
    ASSERT_EQUALS(p.visits, 7);
    ASSERT_EQUALS(p.score, 2.0);

    ASSERT_STATUS_CODE(ErrorCodes::Overflow,
                       current::unmarshal(encodeOK(current::D{{"age", Value::int64(1LL << 33)}}),
                                          &p));
}

TEST(StructCodecTest, HexStringIntoIdMember) {
    Person p;
    ASSERT_OK(legacy::unmarshal(encodeOK(current::D{{"_id", "507f1f77bcf86cd799439011"}}), &p));
    ASSERT_EQUALS(p.id.hex(), "507f1f77bcf86cd799439011");

    ASSERT_STATUS_CODE(ErrorCodes::FailedToParse,
                       legacy::unmarshal(encodeOK(current::D{{"_id", "xyz"}}), &p));
}

TEST(StructCodecTest, TrailingBytesAreInvalid) {
    auto bytes = encodeOK(Address{"x", 1});
    bytes.push_back('\0');
    Address a;
    ASSERT_STATUS_CODE(ErrorCodes::InvalidBSON, current::unmarshal(bytes, &a));
}

TEST(StructCodecTest, TruncatedInputIsInvalid) {
    auto bytes = encodeOK(Address{"x", 1});
    bytes.resize(bytes.size() - 1);
    Address a;
    ASSERT_STATUS_CODE(ErrorCodes::InvalidBSON, current::unmarshal(bytes, &a));
}

TEST(CodecTest, EncodeRejectsNonDocuments) {
    ASSERT_STATUS_CODE(ErrorCodes::UnsupportedBSONMapping, encode(Value(5)));
    ASSERT_STATUS_CODE(ErrorCodes::UnsupportedBSONMapping, encode(Value("doc")));
    ASSERT_STATUS_CODE(ErrorCodes::UnsupportedBSONMapping, encode(42));
}

TEST(CodecTest, EncodeReportsNestedFailures) {
    auto sw = encode(current::D{{"u", Value::uint64(~uint64_t{0})}});
    ASSERT_STATUS_CODE(ErrorCodes::UnrepresentableValue, sw);
    ASSERT(sw.getStatus().isA<ErrorCategory::EncodeError>());
}

TEST(CodecTest, DecodeRejectsUnsupportedDestination) {
    int i = 0;
    ASSERT_STATUS_CODE(ErrorCodes::TypeMismatch,
                       decode(encodeOK(current::D{}), &i, DecodeOptions::current()));
}

TEST(CodecTest, DecodeErrorsAreDecodeErrors) {
    Address a;
    Status status = current::unmarshal(encodeOK(current::D{{"zip", "x"}}), &a);
    ASSERT(status.isA<ErrorCategory::DecodeError>());
    ASSERT_STRING_CONTAINS(status.reason(), "zip");
}

}  // namespace
}  // namespace dualbson

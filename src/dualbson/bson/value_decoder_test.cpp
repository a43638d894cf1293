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
#include <limits>
#include <string>
#include <vector>

#include "dualbson/bson/codec.h"
#include "dualbson/bson/value_decoder.h"
#include "dualbson/unittest/unittest.h"

namespace dualbson {
namespace {

std::vector<char> encodeDoc(const Value& doc) {
    return uassertStatusOK(encode(doc));
}

// Holds an encoded single element document so the element stays valid.
class OneElement {
public:
    explicit OneElement(const Value& v) : _bytes(encodeDoc(current::D{{"v", v}})) {}

    BSONElement element() const {
        return BSONObjIterator(BSONObj(_bytes)).next();
    }

private:
    std::vector<char> _bytes;
};

const DecodeContext kCurrentCtx = DecodeContext::root(DecodeOptions::current());
const DecodeContext kLegacyCtx = DecodeContext::root(DecodeOptions::legacy());

template <typename T>
T decodeAs(const Value& v, const DecodeContext& ctx = kCurrentCtx) {
    OneElement one(v);
    T out{};
    decodeElement(one.element(), out, ctx);
    return out;
}

Value decodeValue(const std::vector<char>& bytes, const DecodeOptions& options) {
    Value out;
    uassertStatusOK(decode(bytes, &out, options));
    return out;
}

TEST(DecodeContextTest, DefaultShapes) {
    ASSERT_EQUALS(kLegacyCtx.documentShape(), DocumentShape::kLegacyM);
    ASSERT_EQUALS(kCurrentCtx.documentShape(), DocumentShape::kCurrentD);
    ASSERT_EQUALS(kLegacyCtx.lockedTo(DocumentShape::kCurrentM).documentShape(),
                  DocumentShape::kCurrentM);
    ASSERT_EQUALS(kLegacyCtx.genericTarget(), TargetKind::kGenericLegacy);
    ASSERT_EQUALS(kCurrentCtx.genericTarget(), TargetKind::kGenericCurrent);
}

TEST(DecodeContextTest, NestedTracksDepth) {
    DecodeOptions options;
    options.maxDepth = 3;
    auto ctx = DecodeContext::root(options);
    auto second = ctx.nested().nested();
    ASSERT_EQUALS(second.depth, 2);
    ASSERT_THROWS_CODE(second.nested(), DBException, ErrorCodes::Overflow);
}

TEST(GenericDecodeTest, LegacyEntryProducesLegacyKinds) {
    auto oid = OID::gen();
    auto bytes = encodeDoc(current::D{{"doc", current::D{{"i", Value::int32(1)}}},
                                      {"arr", current::A{Value::int32(2)}},
                                      {"id", current::ObjectID(oid)},
                                      {"re", current::Regex{"a", "i"}},
                                      {"i32", Value::int32(3)},
                                      {"i64", Value::int64(4)},
                                      {"dbl", 5.5},
                                      {"str", "s"},
                                      {"b", true},
                                      {"n", nullptr},
                                      {"d", Date_t::fromMillisSinceEpoch(6)}});

    Value decoded = decodeValue(bytes, DecodeOptions::legacy());
    legacy::M expected{{"doc", legacy::M{{"i", 1}}},
                       {"arr", legacy::Array{2}},
                       {"id", legacy::ObjectId(oid)},
                       {"re", legacy::RegEx{"a", "i"}},
                       {"i32", 3},
                       {"i64", Value::int64(4)},
                       {"dbl", 5.5},
                       {"str", "s"},
                       {"b", true},
                       {"n", nullptr},
                       {"d", Date_t::fromMillisSinceEpoch(6)}};
    ASSERT_EQUALS(decoded, Value(expected));
}

TEST(GenericDecodeTest, CurrentEntryProducesCurrentKinds) {
    auto oid = OID::gen();
    auto bytes = encodeDoc(legacy::D{{"doc", legacy::D{{"i", 1}}},
                                     {"arr", legacy::Array{2}},
                                     {"id", legacy::ObjectId(oid)},
                                     {"re", legacy::RegEx{"a", "i"}},
                                     {"i", 3}});

    Value decoded = decodeValue(bytes, DecodeOptions::current());
    current::D expected{{"doc", current::D{{"i", Value::int32(1)}}},
                        {"arr", current::A{Value::int32(2)}},
                        {"id", current::ObjectID(oid)},
                        {"re", current::Regex{"a", "i"}},
                        {"i", Value::int32(3)}};
    ASSERT_EQUALS(decoded, Value(expected));
}

TEST(GenericDecodeTest, DocumentDestinationLocksNestedShapes) {
    auto bytes = encodeDoc(current::D{
        {"a", current::D{{"b", current::D{{"c", 1}}}}},
        {"arr", current::A{current::D{{"x", 1}}, current::A{current::D{{"y", 2}}}}}});

    legacy::D lockedLegacyD;
    ASSERT_OK(decode(bytes, &lockedLegacyD, DecodeOptions::current()));
    legacy::D expected{
        {"a", legacy::D{{"b", legacy::D{{"c", Value::int32(1)}}}}},
        {"arr",
         current::A{legacy::D{{"x", Value::int32(1)}},
                    current::A{legacy::D{{"y", Value::int32(2)}}}}}};
    ASSERT_EQUALS(lockedLegacyD, expected);

    current::M lockedCurrentM;
    ASSERT_OK(decode(bytes, &lockedCurrentM, DecodeOptions::legacy()));
    current::M expectedM{
        {"a", current::M{{"b", current::M{{"c", 1}}}}},
        {"arr", legacy::Array{current::M{{"x", 1}}, legacy::Array{current::M{{"y", 2}}}}}};
    ASSERT_EQUALS(lockedCurrentM, expectedM);
}

TEST(GenericDecodeTest, TopLevelSequenceDoesNotLock) {
    auto bytes = encodeDoc(current::A{current::D{{"x", 1}}});

    legacy::Array legacyArray;
    ASSERT_OK(decode(bytes, &legacyArray, DecodeOptions::legacy()));
    ASSERT_EQUALS(legacyArray, (legacy::Array{legacy::M{{"x", 1}}}));

    current::A currentArray;
    ASSERT_OK(decode(bytes, &currentArray, DecodeOptions::current()));
    ASSERT_EQUALS(currentArray, (current::A{current::D{{"x", Value::int32(1)}}}));
}

TEST(GenericDecodeTest, RepeatedKeys) {
    auto bytes = encodeDoc(current::D{{"k", 1}, {"k", 2}});

    current::M m;
    ASSERT_OK(decode(bytes, &m, DecodeOptions::current()));
    ASSERT_EQUALS(m.size(), 1u);
    ASSERT_EQUALS(m.at("k"), Value::int32(2));

    current::D d;
    ASSERT_OK(decode(bytes, &d, DecodeOptions::current()));
    ASSERT_EQUALS(d.size(), 2u);
}

TEST(GenericDecodeTest, UnsupportedWireTypeIsTypeMismatch) {
    // {"b": BinData(0, "\x01")}
    const char raw[] = "\x0e\x00\x00\x00\x05" "b\x00\x01\x00\x00\x00\x00\x01\x00";
    std::vector<char> bytes(raw, raw + sizeof(raw) - 1);
    Value out;
    ASSERT_STATUS_CODE(ErrorCodes::TypeMismatch, decode(bytes, &out, DecodeOptions::current()));
    ASSERT_STATUS_CODE(ErrorCodes::TypeMismatch, decode(bytes, &out, DecodeOptions::legacy()));
}

TEST(GenericDecodeTest, DepthLimit) {
    Value v = current::D{};
    for (int i = 0; i < 3; ++i) {
        v = current::D{{"a", v}};
    }
    auto bytes = encodeDoc(v);

    DecodeOptions options;
    options.maxDepth = 4;
    Value out;
    ASSERT_OK(decode(bytes, &out, options));
    options.maxDepth = 3;
    ASSERT_STATUS_CODE(ErrorCodes::Overflow, decode(bytes, &out, options));
}

TEST(Utf8DecodeTest, CurrentFrontEndValidates) {
    auto bytes = encodeDoc(current::D{{"s", std::string("\xff")}});
    Value out;
    ASSERT_STATUS_CODE(ErrorCodes::InvalidUTF8, decode(bytes, &out, DecodeOptions::current()));
}

TEST(Utf8DecodeTest, LegacyFrontEndPassesBytesThrough) {
    auto bytes = encodeDoc(current::D{{"s", std::string("\xff")}});
    Value out = decodeValue(bytes, DecodeOptions::legacy());
    ASSERT_EQUALS(out.getLegacyM().at("s"), Value(std::string("\xff")));
}

TEST(Utf8DecodeTest, FieldNamesAndRegexesAreValidated) {
    Value out;
    auto badName = encodeDoc(current::D{{std::string("\xc3"), 1}});
    ASSERT_STATUS_CODE(ErrorCodes::InvalidUTF8, decode(badName, &out, DecodeOptions::current()));
    ASSERT_OK(decode(badName, &out, DecodeOptions::legacy()));

    auto badRegex = encodeDoc(current::D{{"r", current::Regex{"\xe2\x82", ""}}});
    ASSERT_STATUS_CODE(ErrorCodes::InvalidUTF8,
                       decode(badRegex, &out, DecodeOptions::current()));
}

TEST(ScalarDecodeTest, Int32Sources) {
    ASSERT_EQUALS(decodeAs<int32_t>(Value::int32(-5)), -5);
    ASSERT_EQUALS(decodeAs<int32_t>(Value::int64(123)), 123);
    ASSERT_EQUALS(decodeAs<int32_t>(Value(42.0)), 42);
    ASSERT_EQUALS(decodeAs<int32_t>(Value()), 0);
    ASSERT_EQUALS(decodeAs<int32_t>(Value::int64(std::numeric_limits<int32_t>::min())),
                  std::numeric_limits<int32_t>::min());

    ASSERT_THROWS_CODE(decodeAs<int32_t>(Value::int64(int64_t{1} << 31)),
                       DBException,
                       ErrorCodes::Overflow);
    ASSERT_THROWS_CODE(decodeAs<int32_t>(Value(2.5)), DBException, ErrorCodes::TypeMismatch);
    ASSERT_THROWS_CODE(decodeAs<int32_t>(Value(1e10)), DBException, ErrorCodes::Overflow);
    ASSERT_THROWS_CODE(decodeAs<int32_t>(Value("1")), DBException, ErrorCodes::TypeMismatch);
    ASSERT_THROWS_CODE(decodeAs<int32_t>(Value(true)), DBException, ErrorCodes::TypeMismatch);
}

TEST(ScalarDecodeTest, Int64Sources) {
    ASSERT_EQUALS(decodeAs<int64_t>(Value::int32(-5)), -5);
    ASSERT_EQUALS(decodeAs<int64_t>(Value::int64(int64_t{1} << 40)), int64_t{1} << 40);
    ASSERT_EQUALS(decodeAs<int64_t>(Value(-9007199254740992.0)), -9007199254740992LL);
    ASSERT_EQUALS(decodeAs<int64_t>(Value(Date_t::fromMillisSinceEpoch(77))), 77);

    ASSERT_THROWS_CODE(decodeAs<int64_t>(Value(9223372036854775808.0)),
                       DBException,
                       ErrorCodes::Overflow);
    ASSERT_THROWS_CODE(decodeAs<int64_t>(Value(std::numeric_limits<double>::infinity())),
                       DBException,
                       ErrorCodes::TypeMismatch);
}

TEST(ScalarDecodeTest, DoubleSources) {
    ASSERT_EQUALS(decodeAs<double>(Value(0.25)), 0.25);
    ASSERT_EQUALS(decodeAs<double>(Value::int32(3)), 3.0);
    ASSERT_EQUALS(decodeAs<double>(Value::int64(int64_t{1} << 53)), 9007199254740992.0);
    ASSERT_THROWS_CODE(decodeAs<double>(Value::int64((int64_t{1} << 53) + 1)),
                       DBException,
                       ErrorCodes::Overflow);
    ASSERT_THROWS_CODE(
        decodeAs<double>(Value(Date_t())), DBException, ErrorCodes::TypeMismatch);
}

TEST(ScalarDecodeTest, OtherScalars) {
    ASSERT_EQUALS(decodeAs<std::string>(Value("abc")), "abc");
    ASSERT_EQUALS(decodeAs<std::string>(Value()), "");
    ASSERT_EQUALS(decodeAs<bool>(Value(true)), true);
    ASSERT_EQUALS(decodeAs<Date_t>(Value(Date_t::fromMillisSinceEpoch(9))),
                  Date_t::fromMillisSinceEpoch(9));
    ASSERT_THROWS_CODE(decodeAs<std::string>(Value(1)), DBException, ErrorCodes::TypeMismatch);
    ASSERT_THROWS_CODE(decodeAs<Date_t>(Value::int64(1)), DBException, ErrorCodes::TypeMismatch);
}

TEST(IdentifierDecodeTest, FromObjectIdOfEitherFamily) {
    auto oid = OID::gen();
    ASSERT_EQUALS(decodeAs<legacy::ObjectId>(Value(current::ObjectID(oid))).oid(), oid);
    ASSERT_EQUALS(decodeAs<current::ObjectID>(Value(legacy::ObjectId(oid))).oid(), oid);
}

TEST(IdentifierDecodeTest, FromHexString) {
    const std::string hex = "507f1f77bcf86cd799439011";
    ASSERT_EQUALS(decodeAs<legacy::ObjectId>(Value(hex)).hex(), hex);
    ASSERT_EQUALS(decodeAs<current::ObjectID>(Value(hex)).hex(), hex);

    ASSERT_THROWS_CODE(
        decodeAs<legacy::ObjectId>(Value("not hex")), DBException, ErrorCodes::FailedToParse);
    ASSERT_THROWS_CODE(decodeAs<current::ObjectID>(Value("507f1f77bcf86cd79943901z")),
                       DBException,
                       ErrorCodes::FailedToParse);
}

TEST(IdentifierDecodeTest, FromNull) {
    auto legacyId = decodeAs<legacy::ObjectId>(Value());
    ASSERT_FALSE(legacyId.valid());
    ASSERT_EQUALS(legacyId, legacy::ObjectId());

    ASSERT_THROWS_CODE(
        decodeAs<current::ObjectID>(Value()), DBException, ErrorCodes::TypeMismatch);
}

TEST(RegexDecodeTest, BothFamilies) {
    ASSERT_EQUALS(decodeAs<legacy::RegEx>(Value(current::Regex{"^x", "i"})),
                  (legacy::RegEx{"^x", "i"}));
    ASSERT_EQUALS(decodeAs<current::Regex>(Value(legacy::RegEx{"^x", "mi"})),
                  (current::Regex{"^x", "im"}));
    ASSERT_EQUALS(decodeAs<legacy::RegEx>(Value()), legacy::RegEx{});
    ASSERT_THROWS_CODE(decodeAs<current::Regex>(Value()), DBException, ErrorCodes::TypeMismatch);
    ASSERT_THROWS_CODE(decodeAs<legacy::RegEx>(Value("^x")), DBException, ErrorCodes::TypeMismatch);
}

TEST(ContainerDecodeTest, NullGivesEmptyContainer) {
    ASSERT(decodeAs<legacy::M>(Value()).empty());
    ASSERT(decodeAs<current::D>(Value()).empty());
    ASSERT(decodeAs<current::A>(Value()).empty());
}

TEST(ContainerDecodeTest, KindMismatch) {
    ASSERT_THROWS_CODE(
        decodeAs<current::A>(Value(current::D{})), DBException, ErrorCodes::TypeMismatch);
    ASSERT_THROWS_CODE(
        decodeAs<legacy::M>(Value(legacy::Array{})), DBException, ErrorCodes::TypeMismatch);
}

}  // namespace
}  // namespace dualbson

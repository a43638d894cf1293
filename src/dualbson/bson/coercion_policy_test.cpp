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

#include <sstream>

#include "dualbson/bson/coercion_policy.h"
#include "dualbson/unittest/unittest.h"

namespace dualbson {
namespace {

constexpr auto kFail = CoercionAction::kFail;
constexpr auto kAssign = CoercionAction::kAssign;
constexpr auto kConvert = CoercionAction::kConvert;

WireKind wireAt(int i) {
    return static_cast<WireKind>(i);
}

TargetKind targetAt(int i) {
    return static_cast<TargetKind>(i);
}

const int kWireKinds = static_cast<int>(WireKind::kNumWireKinds);
const int kTargetKinds = static_cast<int>(TargetKind::kNumTargetKinds);

TEST(CoercionPolicyTest, WireKindOf) {
    ASSERT_EQUALS(wireKindOf(BSONType::numberDouble), WireKind::kDouble);
    ASSERT_EQUALS(wireKindOf(BSONType::string), WireKind::kString);
    ASSERT_EQUALS(wireKindOf(BSONType::object), WireKind::kObject);
    ASSERT_EQUALS(wireKindOf(BSONType::array), WireKind::kArray);
    ASSERT_EQUALS(wireKindOf(BSONType::oid), WireKind::kObjectId);
    ASSERT_EQUALS(wireKindOf(BSONType::boolean), WireKind::kBool);
    ASSERT_EQUALS(wireKindOf(BSONType::date), WireKind::kDate);
    ASSERT_EQUALS(wireKindOf(BSONType::null), WireKind::kNull);
    ASSERT_EQUALS(wireKindOf(BSONType::regEx), WireKind::kRegex);
    ASSERT_EQUALS(wireKindOf(BSONType::numberInt), WireKind::kInt32);
    ASSERT_EQUALS(wireKindOf(BSONType::numberLong), WireKind::kInt64);

    ASSERT_EQUALS(wireKindOf(BSONType::binData), WireKind::kOther);
    ASSERT_EQUALS(wireKindOf(BSONType::timestamp), WireKind::kOther);
    ASSERT_EQUALS(wireKindOf(BSONType::numberDecimal), WireKind::kOther);
    ASSERT_EQUALS(wireKindOf(BSONType::minKey), WireKind::kOther);
    ASSERT_EQUALS(wireKindOf(BSONType::maxKey), WireKind::kOther);
}

TEST(CoercionPolicyTest, GenericTargetsAcceptEverySupportedKind) {
    for (int w = 0; w < kWireKinds; ++w) {
        auto expected = wireAt(w) == WireKind::kOther ? kFail : kAssign;
        ASSERT_EQUALS(coercionFor(wireAt(w), TargetKind::kGenericLegacy), expected) << wireAt(w);
        ASSERT_EQUALS(coercionFor(wireAt(w), TargetKind::kGenericCurrent), expected) << wireAt(w);
    }
}

TEST(CoercionPolicyTest, OtherKindsAreAlwaysRejected) {
    for (int t = 0; t < kTargetKinds; ++t) {
        ASSERT_EQUALS(coercionFor(WireKind::kOther, targetAt(t)), kFail) << targetAt(t);
    }
}

TEST(CoercionPolicyTest, NullConvertsToZeroValueExceptCurrentIdAndRegex) {
    for (int t = 0; t < kTargetKinds; ++t) {
        auto target = targetAt(t);
        CoercionAction expected = kConvert;
        if (target == TargetKind::kCurrentObjectID || target == TargetKind::kCurrentRegex) {
            expected = kFail;
        } else if (target == TargetKind::kGenericLegacy || target == TargetKind::kGenericCurrent) {
            expected = kAssign;
        }
        ASSERT_EQUALS(coercionFor(WireKind::kNull, target), expected) << target;
    }
}

TEST(CoercionPolicyTest, IdentifiersOfBothFamilies) {
    for (auto target : {TargetKind::kLegacyObjectId, TargetKind::kCurrentObjectID}) {
        ASSERT_EQUALS(coercionFor(WireKind::kObjectId, target), kAssign);
        ASSERT_EQUALS(coercionFor(WireKind::kString, target), kConvert);
        ASSERT_EQUALS(coercionFor(WireKind::kInt32, target), kFail);
        ASSERT_EQUALS(coercionFor(WireKind::kObject, target), kFail);
    }
}

TEST(CoercionPolicyTest, RegexOnlyFromRegex) {
    for (auto target : {TargetKind::kLegacyRegEx, TargetKind::kCurrentRegex}) {
        ASSERT_EQUALS(coercionFor(WireKind::kRegex, target), kAssign);
        ASSERT_EQUALS(coercionFor(WireKind::kString, target), kFail);
    }
}

TEST(CoercionPolicyTest, DocumentsAndSequences) {
    for (auto target : {TargetKind::kLegacyM,
                        TargetKind::kCurrentM,
                        TargetKind::kLegacyD,
                        TargetKind::kCurrentD,
                        TargetKind::kStruct}) {
        ASSERT_EQUALS(coercionFor(WireKind::kObject, target), kAssign) << target;
        ASSERT_EQUALS(coercionFor(WireKind::kArray, target), kFail) << target;
    }
    for (auto target : {TargetKind::kLegacyArray, TargetKind::kCurrentA}) {
        ASSERT_EQUALS(coercionFor(WireKind::kArray, target), kAssign) << target;
        ASSERT_EQUALS(coercionFor(WireKind::kObject, target), kFail) << target;
    }
}

TEST(CoercionPolicyTest, Numbers) {
    ASSERT_EQUALS(coercionFor(WireKind::kInt32, TargetKind::kInt32), kAssign);
    ASSERT_EQUALS(coercionFor(WireKind::kInt32, TargetKind::kInt64), kConvert);
    ASSERT_EQUALS(coercionFor(WireKind::kInt32, TargetKind::kDouble), kConvert);

    ASSERT_EQUALS(coercionFor(WireKind::kInt64, TargetKind::kInt64), kAssign);
    ASSERT_EQUALS(coercionFor(WireKind::kInt64, TargetKind::kInt32), kConvert);
    ASSERT_EQUALS(coercionFor(WireKind::kInt64, TargetKind::kDouble), kConvert);

    ASSERT_EQUALS(coercionFor(WireKind::kDouble, TargetKind::kDouble), kAssign);
    ASSERT_EQUALS(coercionFor(WireKind::kDouble, TargetKind::kInt32), kConvert);
    ASSERT_EQUALS(coercionFor(WireKind::kDouble, TargetKind::kInt64), kConvert);

    ASSERT_EQUALS(coercionFor(WireKind::kDate, TargetKind::kInt64), kConvert);
    ASSERT_EQUALS(coercionFor(WireKind::kDate, TargetKind::kInt32), kFail);
    ASSERT_EQUALS(coercionFor(WireKind::kBool, TargetKind::kInt32), kFail);
    ASSERT_EQUALS(coercionFor(WireKind::kString, TargetKind::kInt64), kFail);
}

TEST(CoercionPolicyTest, ScalarsOnlyFromTheirOwnKind) {
    ASSERT_EQUALS(coercionFor(WireKind::kString, TargetKind::kString), kAssign);
    ASSERT_EQUALS(coercionFor(WireKind::kBool, TargetKind::kBool), kAssign);
    ASSERT_EQUALS(coercionFor(WireKind::kDate, TargetKind::kDate), kAssign);

    for (int w = 0; w < kWireKinds; ++w) {
        auto wire = wireAt(w);
        if (wire != WireKind::kString && wire != WireKind::kNull) {
            ASSERT_EQUALS(coercionFor(wire, TargetKind::kString), kFail) << wire;
        }
        if (wire != WireKind::kBool && wire != WireKind::kNull) {
            ASSERT_EQUALS(coercionFor(wire, TargetKind::kBool), kFail) << wire;
        }
        if (wire != WireKind::kDate && wire != WireKind::kNull) {
            ASSERT_EQUALS(coercionFor(wire, TargetKind::kDate), kFail) << wire;
        }
    }
}

TEST(CoercionPolicyTest, EncodeTypes) {
    ASSERT_EQUALS(encodeTypeFor(Value::Type::kNull), BSONType::null);
    ASSERT_EQUALS(encodeTypeFor(Value::Type::kInt), BSONType::numberInt);
    ASSERT_EQUALS(encodeTypeFor(Value::Type::kInt32), BSONType::numberInt);
    ASSERT_EQUALS(encodeTypeFor(Value::Type::kInt64), BSONType::numberLong);
    ASSERT_EQUALS(encodeTypeFor(Value::Type::kUInt64), BSONType::numberLong);
    ASSERT_EQUALS(encodeTypeFor(Value::Type::kLegacyObjectId), BSONType::oid);
    ASSERT_EQUALS(encodeTypeFor(Value::Type::kObjectID), BSONType::oid);
    ASSERT_EQUALS(encodeTypeFor(Value::Type::kLegacyRegEx), BSONType::regEx);
    ASSERT_EQUALS(encodeTypeFor(Value::Type::kRegex), BSONType::regEx);
    ASSERT_EQUALS(encodeTypeFor(Value::Type::kLegacyM), BSONType::object);
    ASSERT_EQUALS(encodeTypeFor(Value::Type::kD), BSONType::object);
    ASSERT_EQUALS(encodeTypeFor(Value::Type::kLegacyArray), BSONType::array);
    ASSERT_EQUALS(encodeTypeFor(Value::Type::kA), BSONType::array);
}

TEST(CoercionPolicyTest, Names) {
    std::ostringstream os;
    os << WireKind::kObjectId << " " << TargetKind::kCurrentA << " " << CoercionAction::kConvert;
    ASSERT_EQUALS(os.str(), "objectId current::A convert");
    ASSERT_EQUALS(genericTargetFor(Family::kLegacy), TargetKind::kGenericLegacy);
    ASSERT_EQUALS(genericTargetFor(Family::kCurrent), TargetKind::kGenericCurrent);
}

}  // namespace
}  // namespace dualbson

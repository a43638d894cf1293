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

#include "dualbson/bson/coercion_policy.h"

#include <cstddef>
#include <ostream>

namespace dualbson {

namespace {

constexpr auto F = CoercionAction::kFail;
constexpr auto A = CoercionAction::kAssign;
constexpr auto C = CoercionAction::kConvert;

constexpr auto kNumWireKinds = static_cast<std::size_t>(WireKind::kNumWireKinds);
constexpr auto kNumTargetKinds = static_cast<std::size_t>(TargetKind::kNumTargetKinds);

// Rows are WireKind, columns are TargetKind, both in declaration order.
//
// Identifiers of either family take the 12 raw bytes of an ObjectId element, or parse a 24 digit
// hex string. A null element leaves the zero value in every target except the current family's
// identifier and regex, which reject it. Generic targets accept every supported element.
// clang-format off
constexpr CoercionAction kCoercionTable[kNumWireKinds][kNumTargetKinds] = {
    //             LOid CId  LRe  CRe  LM   CM   LD   CD   LArr CA   Strc Str  I32  I64  Dbl  Bool Date GenL GenC
    /* double   */ {F,  F,   F,   F,   F,   F,   F,   F,   F,   F,   F,   F,   C,   C,   A,   F,   F,   A,   A},
    /* string   */ {C,  C,   F,   F,   F,   F,   F,   F,   F,   F,   F,   A,   F,   F,   F,   F,   F,   A,   A},
    /* object   */ {F,  F,   F,   F,   A,   A,   A,   A,   F,   F,   A,   F,   F,   F,   F,   F,   F,   A,   A},
    /* array    */ {F,  F,   F,   F,   F,   F,   F,   F,   A,   A,   F,   F,   F,   F,   F,   F,   F,   A,   A},
    /* objectId */ {A,  A,   F,   F,   F,   F,   F,   F,   F,   F,   F,   F,   F,   F,   F,   F,   F,   A,   A},
    /* bool     */ {F,  F,   F,   F,   F,   F,   F,   F,   F,   F,   F,   F,   F,   F,   F,   A,   F,   A,   A},
    /* date     */ {F,  F,   F,   F,   F,   F,   F,   F,   F,   F,   F,   F,   F,   C,   F,   F,   A,   A,   A},
    /* null     */ {C,  F,   C,   F,   C,   C,   C,   C,   C,   C,   C,   C,   C,   C,   C,   C,   C,   A,   A},
    /* regex    */ {F,  F,   A,   A,   F,   F,   F,   F,   F,   F,   F,   F,   F,   F,   F,   F,   F,   A,   A},
    /* int32    */ {F,  F,   F,   F,   F,   F,   F,   F,   F,   F,   F,   F,   A,   C,   C,   F,   F,   A,   A},
    /* int64    */ {F,  F,   F,   F,   F,   F,   F,   F,   F,   F,   F,   F,   C,   A,   C,   F,   F,   A,   A},
    /* other    */ {F,  F,   F,   F,   F,   F,   F,   F,   F,   F,   F,   F,   F,   F,   F,   F,   F,   F,   F},
};

constexpr BSONType kEncodeTable[static_cast<std::size_t>(Value::Type::kNumTypes)] = {
    BSONType::null,          // kNull
    BSONType::boolean,       // kBool
    BSONType::numberInt,     // kInt, widened when it does not fit
    BSONType::numberInt,     // kInt32
    BSONType::numberLong,    // kInt64
    BSONType::numberLong,    // kUInt64, rejected above INT64_MAX
    BSONType::numberDouble,  // kDouble
    BSONType::string,        // kString
    BSONType::date,          // kDate
    BSONType::oid,           // kLegacyObjectId
    BSONType::oid,           // kObjectID
    BSONType::regEx,         // kLegacyRegEx
    BSONType::regEx,         // kRegex
    BSONType::object,        // kLegacyM
    BSONType::object,        // kLegacyD
    BSONType::array,         // kLegacyArray
    BSONType::object,        // kM
    BSONType::object,        // kD
    BSONType::array,         // kA
};
// clang-format on

}  // namespace

WireKind wireKindOf(BSONType type) {
    switch (type) {
        case BSONType::numberDouble:
            return WireKind::kDouble;
        case BSONType::string:
            return WireKind::kString;
        case BSONType::object:
            return WireKind::kObject;
        case BSONType::array:
            return WireKind::kArray;
        case BSONType::oid:
            return WireKind::kObjectId;
        case BSONType::boolean:
            return WireKind::kBool;
        case BSONType::date:
            return WireKind::kDate;
        case BSONType::null:
            return WireKind::kNull;
        case BSONType::regEx:
            return WireKind::kRegex;
        case BSONType::numberInt:
            return WireKind::kInt32;
        case BSONType::numberLong:
            return WireKind::kInt64;
        default:
            return WireKind::kOther;
    }
}

CoercionAction coercionFor(WireKind wire, TargetKind target) {
    return kCoercionTable[static_cast<std::size_t>(wire)][static_cast<std::size_t>(target)];
}

BSONType encodeTypeFor(Value::Type type) {
    return kEncodeTable[static_cast<std::size_t>(type)];
}

StringData toStringData(WireKind kind) {
    switch (kind) {
        case WireKind::kDouble:
            return "double";
        case WireKind::kString:
            return "string";
        case WireKind::kObject:
            return "object";
        case WireKind::kArray:
            return "array";
        case WireKind::kObjectId:
            return "objectId";
        case WireKind::kBool:
            return "bool";
        case WireKind::kDate:
            return "date";
        case WireKind::kNull:
            return "null";
        case WireKind::kRegex:
            return "regex";
        case WireKind::kInt32:
            return "int32";
        case WireKind::kInt64:
            return "int64";
        case WireKind::kOther:
            return "other";
        case WireKind::kNumWireKinds:
            break;
    }
    return "invalid";
}

StringData toStringData(TargetKind kind) {
    switch (kind) {
        case TargetKind::kLegacyObjectId:
            return "legacy::ObjectId";
        case TargetKind::kCurrentObjectID:
            return "current::ObjectID";
        case TargetKind::kLegacyRegEx:
            return "legacy::RegEx";
        case TargetKind::kCurrentRegex:
            return "current::Regex";
        case TargetKind::kLegacyM:
            return "legacy::M";
        case TargetKind::kCurrentM:
            return "current::M";
        case TargetKind::kLegacyD:
            return "legacy::D";
        case TargetKind::kCurrentD:
            return "current::D";
        case TargetKind::kLegacyArray:
            return "legacy::Array";
        case TargetKind::kCurrentA:
            return "current::A";
        case TargetKind::kStruct:
            return "struct";
        case TargetKind::kString:
            return "string";
        case TargetKind::kInt32:
            return "int32";
        case TargetKind::kInt64:
            return "int64";
        case TargetKind::kDouble:
            return "double";
        case TargetKind::kBool:
            return "bool";
        case TargetKind::kDate:
            return "date";
        case TargetKind::kGenericLegacy:
            return "generic (legacy)";
        case TargetKind::kGenericCurrent:
            return "generic (current)";
        case TargetKind::kNumTargetKinds:
            break;
    }
    return "invalid";
}

StringData toStringData(CoercionAction action) {
    switch (action) {
        case CoercionAction::kFail:
            return "fail";
        case CoercionAction::kAssign:
            return "assign";
        case CoercionAction::kConvert:
            return "convert";
    }
    return "invalid";
}

std::ostream& operator<<(std::ostream& os, WireKind kind) {
    return os << toStringData(kind);
}

std::ostream& operator<<(std::ostream& os, TargetKind kind) {
    return os << toStringData(kind);
}

std::ostream& operator<<(std::ostream& os, CoercionAction action) {
    return os << toStringData(action);
}

}  // namespace dualbson

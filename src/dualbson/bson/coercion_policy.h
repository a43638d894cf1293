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

#pragma once

#include <cstdint>
#include <iosfwd>

#include "dualbson/base/string_data.h"
#include "dualbson/bson/bsontypes.h"
#include "dualbson/bson/value.h"

namespace dualbson {

/**
 * The kinds of wire element the decoder distinguishes. Every BSON type outside this list is
 * kOther and decodes into nothing.
 */
enum class WireKind : uint8_t {
    kDouble,
    kString,
    kObject,
    kArray,
    kObjectId,
    kBool,
    kDate,
    kNull,
    kRegex,
    kInt32,
    kInt64,
    kOther,
    kNumWireKinds,
};

/**
 * The kinds of destination a wire element may decode into.
 */
enum class TargetKind : uint8_t {
    kLegacyObjectId,
    kCurrentObjectID,
    kLegacyRegEx,
    kCurrentRegex,
    kLegacyM,
    kCurrentM,
    kLegacyD,
    kCurrentD,
    kLegacyArray,
    kCurrentA,
    kStruct,
    kString,
    kInt32,
    kInt64,
    kDouble,
    kBool,
    kDate,
    kGenericLegacy,
    kGenericCurrent,
    kNumTargetKinds,
};

/**
 * What the decoder does with a (wire kind, target kind) pair.
 *
 * kAssign: the wire value is the target's own representation.
 * kConvert: the wire value is transformed, and the transformation may still fail on the
 *           particular value (a hex string that does not parse, an int64 that does not fit).
 * kFail: always a TypeMismatch.
 */
enum class CoercionAction : uint8_t {
    kFail,
    kAssign,
    kConvert,
};

WireKind wireKindOf(BSONType type);

CoercionAction coercionFor(WireKind wire, TargetKind target);

/**
 * The element type a generic value of the given kind encodes to. Native int resolves to
 * numberInt here and is widened to numberLong by the encoder when it does not fit.
 */
BSONType encodeTypeFor(Value::Type type);

/** The generic target of a decode entry point. */
inline TargetKind genericTargetFor(Family family) {
    return family == Family::kLegacy ? TargetKind::kGenericLegacy : TargetKind::kGenericCurrent;
}

StringData toStringData(WireKind kind);
StringData toStringData(TargetKind kind);
StringData toStringData(CoercionAction action);

std::ostream& operator<<(std::ostream& os, WireKind kind);
std::ostream& operator<<(std::ostream& os, TargetKind kind);
std::ostream& operator<<(std::ostream& os, CoercionAction action);

}  // namespace dualbson

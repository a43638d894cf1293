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

#define DUALBSON_LOGV2_DEFAULT_COMPONENT ::dualbson::logv2::LogComponent::kBson

#include "dualbson/bson/value_encoder.h"

#include <algorithm>
#include <limits>

#include <fmt/format.h>

#include "dualbson/bson/coercion_policy.h"
#include "dualbson/logv2/log.h"
#include "dualbson/util/assert_util.h"

namespace dualbson {

ValueEncoder::ValueEncoder(const EncodeOptions& options) : _options(options) {}

void ValueEncoder::beginDocument() {
    invariant(_docStarts.empty() && _b.len() == 0);
    _docStarts.push_back(_b.skip(sizeof(int32_t)));
}

void ValueEncoder::beginSubDocument(StringData name, BSONType type) {
    invariant(type == BSONType::object || type == BSONType::array);
    uassert(ErrorCodes::UnrepresentableValue,
            fmt::format("Document nesting exceeds the maximum depth of {}", _options.maxDepth),
            depth() < _options.maxDepth);
    appendElementHeader(type, name);
    _docStarts.push_back(_b.skip(sizeof(int32_t)));
}

void ValueEncoder::endDocument() {
    invariant(!_docStarts.empty());
    _b.appendChar(static_cast<char>(BSONType::eoo));
    std::size_t start = _docStarts.back();
    _docStarts.pop_back();
    _b.setInt32At(start, static_cast<int32_t>(_b.len() - start));
}

std::vector<char> ValueEncoder::release() {
    invariant(_docStarts.empty());
    uassert(ErrorCodes::BSONObjectTooLarge,
            fmt::format("BSON document of {} bytes exceeds the maximum size of {} bytes",
                        _b.len(),
                        _options.maxObjectSize),
            _b.len() <= _options.maxObjectSize);
    return _b.release();
}

void ValueEncoder::appendElementHeader(BSONType type, StringData name) {
    invariant(!_docStarts.empty());
    uassert(ErrorCodes::UnrepresentableValue,
            fmt::format("Field name '{}' contains a NUL byte", name.substr(0, name.find('\0'))),
            !containsNul(name));
    _b.appendNum(static_cast<char>(type));
    _b.appendStr(name);
}

void ValueEncoder::appendNull(StringData name) {
    appendElementHeader(BSONType::null, name);
}

void ValueEncoder::appendBool(StringData name, bool b) {
    appendElementHeader(BSONType::boolean, name);
    _b.appendNum(b);
}

void ValueEncoder::appendInt32(StringData name, int32_t i) {
    appendElementHeader(BSONType::numberInt, name);
    _b.appendNum(i);
}

void ValueEncoder::appendInt64(StringData name, int64_t i) {
    appendElementHeader(BSONType::numberLong, name);
    _b.appendNum(i);
}

void ValueEncoder::appendUInt64(StringData name, uint64_t u) {
    uassert(ErrorCodes::UnrepresentableValue,
            fmt::format("Field '{}': unsigned value {} does not fit in a BSON int64", name, u),
            u <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max()));
    appendInt64(name, static_cast<int64_t>(u));
}

void ValueEncoder::appendNativeInt(StringData name, int64_t i) {
    if (i >= std::numeric_limits<int32_t>::min() && i <= std::numeric_limits<int32_t>::max()) {
        appendInt32(name, static_cast<int32_t>(i));
    } else {
        appendInt64(name, i);
    }
}

void ValueEncoder::appendDouble(StringData name, double d) {
    appendElementHeader(BSONType::numberDouble, name);
    _b.appendNum(d);
}

void ValueEncoder::appendString(StringData name, StringData s) {
    appendElementHeader(BSONType::string, name);
    _b.appendNum(static_cast<int32_t>(s.size() + 1));
    _b.appendStr(s);
}

void ValueEncoder::appendDate(StringData name, Date_t date) {
    appendElementHeader(BSONType::date, name);
    _b.appendNum(static_cast<int64_t>(date.toMillisSinceEpoch()));
}

void ValueEncoder::appendOID(StringData name, const OID& oid) {
    appendElementHeader(BSONType::oid, name);
    _b.appendBuf(oid.view().view(), OID::kOIDSize);
}

void ValueEncoder::appendRegex(StringData name, StringData pattern, StringData options) {
    uassert(ErrorCodes::UnrepresentableValue,
            fmt::format("Field '{}': regex pattern contains a NUL byte", name),
            !containsNul(pattern));
    uassert(ErrorCodes::UnrepresentableValue,
            fmt::format("Field '{}': regex options contain a NUL byte", name),
            !containsNul(options));

    std::string sortedOptions{options};
    std::sort(sortedOptions.begin(), sortedOptions.end());

    appendElementHeader(BSONType::regEx, name);
    _b.appendStr(pattern);
    _b.appendStr(sortedOptions);
}

void ValueEncoder::appendValue(StringData name, const Value& value) {
    const Value::Type kind = value.type();
    const BSONType bsonType = encodeTypeFor(kind);
    LOGV2_DEBUG(5100100,
                4,
                "Encoding generic value",
                "field"_attr = name,
                "kind"_attr = kind,
                "bsonType"_attr = bsonType);

    // The kind only selects the accessor. A native int is the one kind whose width is decided by
    // its value: it is widened to int64 when it does not fit in the int32 the table names.
    switch (bsonType) {
        case BSONType::null:
            appendNull(name);
            return;
        case BSONType::boolean:
            appendBool(name, value.getBool());
            return;
        case BSONType::numberInt:
            if (kind == Value::Type::kInt) {
                appendNativeInt(name, value.getInt());
            } else {
                appendInt32(name, value.getInt32());
            }
            return;
        case BSONType::numberLong:
            if (kind == Value::Type::kUInt64) {
                appendUInt64(name, value.getUInt64());
            } else if (kind == Value::Type::kInt) {
                appendInt64(name, value.getInt());
            } else {
                appendInt64(name, value.getInt64());
            }
            return;
        case BSONType::numberDouble:
            appendDouble(name, value.getDouble());
            return;
        case BSONType::string:
            appendString(name, value.getString());
            return;
        case BSONType::date:
            appendDate(name, value.getDate());
            return;
        case BSONType::oid:
            appendOID(name,
                      kind == Value::Type::kLegacyObjectId ? value.getLegacyObjectId().oid()
                                                           : value.getObjectID().oid());
            return;
        case BSONType::regEx:
            if (kind == Value::Type::kLegacyRegEx) {
                appendRegex(name, value.getLegacyRegEx().pattern, value.getLegacyRegEx().options);
            } else {
                appendRegex(name, value.getRegex().pattern, value.getRegex().options);
            }
            return;
        case BSONType::object:
        case BSONType::array:
            beginSubDocument(name, bsonType);
            appendFieldsOf(value);
            endDocument();
            return;
        default:
            break;
    }
    uasserted(ErrorCodes::UnsupportedBSONMapping,
              fmt::format("Field '{}': no BSON encoding for a generic value of kind {}",
                          name,
                          typeName(kind)));
}

void ValueEncoder::appendFieldsOf(const Value& value) {
    switch (value.type()) {
        case Value::Type::kLegacyM:
            appendFields(value.getLegacyM());
            return;
        case Value::Type::kLegacyD:
            appendFields(value.getLegacyD());
            return;
        case Value::Type::kLegacyArray:
            appendFields(value.getLegacyArray());
            return;
        case Value::Type::kM:
            appendFields(value.getM());
            return;
        case Value::Type::kD:
            appendFields(value.getD());
            return;
        case Value::Type::kA:
            appendFields(value.getA());
            return;
        default:
            uasserted(ErrorCodes::UnsupportedBSONMapping,
                      fmt::format("A generic value of kind {} cannot be encoded as a top level "
                                  "document",
                                  typeName(value.type())));
    }
}

}  // namespace dualbson

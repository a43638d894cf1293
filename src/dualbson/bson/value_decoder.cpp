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

#include "dualbson/bson/value_decoder.h"

#include <cmath>
#include <limits>

#include <fmt/format.h>

#include "dualbson/logv2/log.h"
#include "dualbson/util/assert_util.h"
#include "dualbson/util/str.h"

namespace dualbson {

namespace {

// Largest magnitude below which every integer is exactly representable as a double.
constexpr int64_t kMaxExactDoubleInteger = int64_t{1} << 53;

template <typename Int>
Int doubleToInt(const BSONElement& e, double d) {
    uassert(ErrorCodes::TypeMismatch,
            fmt::format("Field '{}': double {} is not an integer", e.fieldNameStringData(), d),
            std::isfinite(d) && std::trunc(d) == d);
    // The upper bound is exclusive: the max of Int is not exactly representable as a double for
    // 64 bit types, but 2^(bits-1) is.
    uassert(ErrorCodes::Overflow,
            fmt::format("Field '{}': double {} is out of range", e.fieldNameStringData(), d),
            d >= static_cast<double>(std::numeric_limits<Int>::min()) &&
                d < -static_cast<double>(std::numeric_limits<Int>::min()));
    return static_cast<Int>(d);
}

double int64ToDouble(const BSONElement& e, int64_t i) {
    uassert(ErrorCodes::Overflow,
            fmt::format("Field '{}': int64 {} cannot be represented exactly as a double",
                        e.fieldNameStringData(),
                        i),
            i >= -kMaxExactDoubleInteger && i <= kMaxExactDoubleInteger);
    return static_cast<double>(i);
}

OID oidFromHexElement(const BSONElement& e, const DecodeContext& ctx) {
    StringData s = e.valueStringData();
    checkUTF8(s, "string", ctx);
    auto swOid = OID::parse(s);
    uassertStatusOK(swOid.getStatus().withContext(
        fmt::format("Field '{}' is not a valid ObjectId hex string", e.fieldNameStringData())));
    return swOid.getValue();
}

template <Family F>
RegexValue<F> readRegex(const BSONElement& e, const DecodeContext& ctx) {
    RegexValue<F> re{std::string{e.regex()}, std::string{e.regexFlags()}};
    checkUTF8(re.pattern, "regex pattern", ctx);
    checkUTF8(re.options, "regex options", ctx);
    return re;
}

template <typename Container>
void decodeContainerElement(const BSONElement& e, Container& out, const DecodeContext& ctx) {
    if (checkCoercion(e, TargetKindOf<Container>::value) == CoercionAction::kConvert) {
        // null
        out = Container{};
        return;
    }
    Container decoded;
    decodeDocument(e.embeddedObject(), decoded, ctx.nested());
    out = std::move(decoded);
}

// Fills an unordered document. The last of repeated keys wins.
template <Family F>
void fillUnordered(const BSONObj& obj, UnorderedDocument<F>& out, const DecodeContext& ctx) {
    UnorderedDocument<F> result;
    BSONObjIterator it(obj);
    while (it.more()) {
        BSONElement e = it.next();
        checkUTF8(e.fieldNameStringData(), "field name", ctx);
        result[std::string{e.fieldNameStringData()}] = decodeGeneric(e, ctx);
    }
    out = std::move(result);
}

template <Family F>
void fillOrdered(const BSONObj& obj, OrderedDocument<F>& out, const DecodeContext& ctx) {
    OrderedDocument<F> result;
    BSONObjIterator it(obj);
    while (it.more()) {
        BSONElement e = it.next();
        checkUTF8(e.fieldNameStringData(), "field name", ctx);
        result.push_back({std::string{e.fieldNameStringData()}, decodeGeneric(e, ctx)});
    }
    out = std::move(result);
}

template <Family F>
void fillSequence(const BSONObj& obj, Sequence<F>& out, const DecodeContext& ctx) {
    Sequence<F> result;
    BSONObjIterator it(obj);
    while (it.more()) {
        result.push_back(decodeGeneric(it.next(), ctx));
    }
    out = std::move(result);
}

Value genericDocument(const BSONObj& obj, const DecodeContext& ctx) {
    switch (ctx.documentShape()) {
        case DocumentShape::kLegacyM: {
            legacy::M m;
            fillUnordered(obj, m, ctx);
            return Value(std::move(m));
        }
        case DocumentShape::kLegacyD: {
            legacy::D d;
            fillOrdered(obj, d, ctx);
            return Value(std::move(d));
        }
        case DocumentShape::kCurrentM: {
            current::M m;
            fillUnordered(obj, m, ctx);
            return Value(std::move(m));
        }
        case DocumentShape::kCurrentD: {
            current::D d;
            fillOrdered(obj, d, ctx);
            return Value(std::move(d));
        }
    }
    DUALBSON_UNREACHABLE;
}

Value genericArray(const BSONObj& obj, const DecodeContext& ctx) {
    if (ctx.entryFamily == Family::kLegacy) {
        legacy::Array a;
        fillSequence(obj, a, ctx);
        return Value(std::move(a));
    }
    current::A a;
    fillSequence(obj, a, ctx);
    return Value(std::move(a));
}

}  // namespace

DecodeContext DecodeContext::nested() const {
    uassert(ErrorCodes::Overflow,
            fmt::format("BSON nesting exceeds the maximum depth of {}", options.maxDepth),
            depth + 1 < options.maxDepth);
    DecodeContext ctx = *this;
    ctx.depth = depth + 1;
    return ctx;
}

CoercionAction checkCoercion(const BSONElement& e, TargetKind target) {
    WireKind wire = wireKindOf(e.type());
    CoercionAction action = coercionFor(wire, target);
    if (action == CoercionAction::kFail) {
        LOGV2_DEBUG(5100200,
                    2,
                    "Rejected coercion",
                    "field"_attr = e.fieldNameStringData(),
                    "wire"_attr = wire,
                    "target"_attr = target);
        uasserted(ErrorCodes::TypeMismatch,
                  fmt::format("Cannot decode BSON {} field '{}' into {}",
                              typeName(e.type()),
                              e.fieldNameStringData(),
                              toStringData(target)));
    }
    if (action == CoercionAction::kConvert) {
        LOGV2_DEBUG(5100201,
                    3,
                    "Converting element",
                    "field"_attr = e.fieldNameStringData(),
                    "wire"_attr = wire,
                    "target"_attr = target);
    }
    return action;
}

void noteSkippedField(const BSONElement& e, StringData structName) {
    LOGV2_DEBUG(5100202,
                2,
                "Skipping field with no destination member",
                "field"_attr = e.fieldNameStringData(),
                "struct"_attr = structName);
}

void checkUTF8(StringData s, StringData what, const DecodeContext& ctx) {
    if (!ctx.options.validateUTF8)
        return;
    uassert(ErrorCodes::InvalidUTF8,
            fmt::format("BSON {} is not valid UTF-8", what),
            str::validUTF8(s));
}

void decodeElement(const BSONElement& e, legacy::ObjectId& out, const DecodeContext& ctx) {
    checkCoercion(e, TargetKind::kLegacyObjectId);
    switch (e.type()) {
        case BSONType::oid:
            out = legacy::ObjectId(e.__oid());
            return;
        case BSONType::string:
            out = legacy::ObjectId(oidFromHexElement(e, ctx));
            return;
        default:
            // null: the empty id
            out = legacy::ObjectId();
            return;
    }
}

void decodeElement(const BSONElement& e, current::ObjectID& out, const DecodeContext& ctx) {
    checkCoercion(e, TargetKind::kCurrentObjectID);
    if (e.type() == BSONType::string) {
        out = current::ObjectID(oidFromHexElement(e, ctx));
        return;
    }
    out = current::ObjectID(e.__oid());
}

void decodeElement(const BSONElement& e, legacy::RegEx& out, const DecodeContext& ctx) {
    if (checkCoercion(e, TargetKind::kLegacyRegEx) == CoercionAction::kConvert) {
        out = legacy::RegEx{};
        return;
    }
    out = readRegex<Family::kLegacy>(e, ctx);
}

void decodeElement(const BSONElement& e, current::Regex& out, const DecodeContext& ctx) {
    checkCoercion(e, TargetKind::kCurrentRegex);
    out = readRegex<Family::kCurrent>(e, ctx);
}

void decodeElement(const BSONElement& e, legacy::M& out, const DecodeContext& ctx) {
    decodeContainerElement(e, out, ctx);
}
void decodeElement(const BSONElement& e, legacy::D& out, const DecodeContext& ctx) {
    decodeContainerElement(e, out, ctx);
}
void decodeElement(const BSONElement& e, legacy::Array& out, const DecodeContext& ctx) {
    decodeContainerElement(e, out, ctx);
}
void decodeElement(const BSONElement& e, current::M& out, const DecodeContext& ctx) {
    decodeContainerElement(e, out, ctx);
}
void decodeElement(const BSONElement& e, current::D& out, const DecodeContext& ctx) {
    decodeContainerElement(e, out, ctx);
}
void decodeElement(const BSONElement& e, current::A& out, const DecodeContext& ctx) {
    decodeContainerElement(e, out, ctx);
}

void decodeElement(const BSONElement& e, std::string& out, const DecodeContext& ctx) {
    if (checkCoercion(e, TargetKind::kString) == CoercionAction::kConvert) {
        out.clear();
        return;
    }
    StringData s = e.valueStringData();
    checkUTF8(s, "string", ctx);
    out = std::string{s};
}

void decodeElement(const BSONElement& e, int32_t& out, const DecodeContext& ctx) {
    checkCoercion(e, TargetKind::kInt32);
    switch (e.type()) {
        case BSONType::numberInt:
            out = e._numberInt();
            return;
        case BSONType::numberLong: {
            int64_t l = e._numberLong();
            uassert(ErrorCodes::Overflow,
                    fmt::format("Field '{}': int64 {} does not fit in an int32",
                                e.fieldNameStringData(),
                                l),
                    l >= std::numeric_limits<int32_t>::min() &&
                        l <= std::numeric_limits<int32_t>::max());
            out = static_cast<int32_t>(l);
            return;
        }
        case BSONType::numberDouble:
            out = doubleToInt<int32_t>(e, e._numberDouble());
            return;
        default:
            out = 0;
            return;
    }
}

void decodeElement(const BSONElement& e, int64_t& out, const DecodeContext& ctx) {
    checkCoercion(e, TargetKind::kInt64);
    switch (e.type()) {
        case BSONType::numberLong:
            out = e._numberLong();
            return;
        case BSONType::numberInt:
            out = e._numberInt();
            return;
        case BSONType::numberDouble:
            out = doubleToInt<int64_t>(e, e._numberDouble());
            return;
        case BSONType::date:
            out = e.date().toMillisSinceEpoch();
            return;
        default:
            out = 0;
            return;
    }
}

void decodeElement(const BSONElement& e, double& out, const DecodeContext& ctx) {
    checkCoercion(e, TargetKind::kDouble);
    switch (e.type()) {
        case BSONType::numberDouble:
            out = e._numberDouble();
            return;
        case BSONType::numberInt:
            out = e._numberInt();
            return;
        case BSONType::numberLong:
            out = int64ToDouble(e, e._numberLong());
            return;
        default:
            out = 0;
            return;
    }
}

void decodeElement(const BSONElement& e, bool& out, const DecodeContext& ctx) {
    if (checkCoercion(e, TargetKind::kBool) == CoercionAction::kConvert) {
        out = false;
        return;
    }
    out = e.boolean();
}

void decodeElement(const BSONElement& e, Date_t& out, const DecodeContext& ctx) {
    if (checkCoercion(e, TargetKind::kDate) == CoercionAction::kConvert) {
        out = Date_t();
        return;
    }
    out = e.date();
}

void decodeElement(const BSONElement& e, Value& out, const DecodeContext& ctx) {
    out = decodeGeneric(e, ctx);
}

Value decodeGeneric(const BSONElement& e, const DecodeContext& ctx) {
    checkCoercion(e, ctx.genericTarget());

    const bool legacyEntry = ctx.entryFamily == Family::kLegacy;
    switch (e.type()) {
        case BSONType::numberDouble:
            return Value(e._numberDouble());
        case BSONType::string: {
            StringData s = e.valueStringData();
            checkUTF8(s, "string", ctx);
            return Value(std::string{s});
        }
        case BSONType::object:
            return genericDocument(e.embeddedObject(), ctx.nested());
        case BSONType::array:
            return genericArray(e.embeddedObject(), ctx.nested());
        case BSONType::oid:
            if (legacyEntry)
                return Value(legacy::ObjectId(e.__oid()));
            return Value(current::ObjectID(e.__oid()));
        case BSONType::boolean:
            return Value(e.boolean());
        case BSONType::date:
            return Value(e.date());
        case BSONType::null:
            return Value();
        case BSONType::regEx:
            if (legacyEntry)
                return Value(readRegex<Family::kLegacy>(e, ctx));
            return Value(readRegex<Family::kCurrent>(e, ctx));
        case BSONType::numberInt:
            if (legacyEntry)
                return Value::nativeInt(e._numberInt());
            return Value::int32(e._numberInt());
        case BSONType::numberLong:
            return Value::int64(e._numberLong());
        default:
            break;
    }
    DUALBSON_UNREACHABLE;
}

void decodeDocument(const BSONObj& obj, legacy::M& out, const DecodeContext& ctx) {
    fillUnordered(obj, out, ctx.lockedTo(DocumentShape::kLegacyM));
}

void decodeDocument(const BSONObj& obj, legacy::D& out, const DecodeContext& ctx) {
    fillOrdered(obj, out, ctx.lockedTo(DocumentShape::kLegacyD));
}

void decodeDocument(const BSONObj& obj, current::M& out, const DecodeContext& ctx) {
    fillUnordered(obj, out, ctx.lockedTo(DocumentShape::kCurrentM));
}

void decodeDocument(const BSONObj& obj, current::D& out, const DecodeContext& ctx) {
    fillOrdered(obj, out, ctx.lockedTo(DocumentShape::kCurrentD));
}

void decodeDocument(const BSONObj& obj, legacy::Array& out, const DecodeContext& ctx) {
    fillSequence(obj, out, ctx);
}

void decodeDocument(const BSONObj& obj, current::A& out, const DecodeContext& ctx) {
    fillSequence(obj, out, ctx);
}

void decodeDocument(const BSONObj& obj, Value& out, const DecodeContext& ctx) {
    out = genericDocument(obj, ctx);
}

}  // namespace dualbson

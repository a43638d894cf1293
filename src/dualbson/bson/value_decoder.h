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
#include <string>
#include <type_traits>

#include <boost/optional.hpp>

#include "dualbson/base/string_data.h"
#include "dualbson/bson/bsonelement.h"
#include "dualbson/bson/bsonobj.h"
#include "dualbson/bson/codec_options.h"
#include "dualbson/bson/coercion_policy.h"
#include "dualbson/bson/document.h"
#include "dualbson/bson/family.h"
#include "dualbson/bson/object_id.h"
#include "dualbson/bson/regex.h"
#include "dualbson/bson/value.h"
#include "dualbson/util/time_support.h"

namespace dualbson {

/**
 * State carried down the decode recursion.
 *
 * entryFamily decides the family of generic identifiers, regexes and arrays, and whether int32
 * becomes a native int. lockedShape, once set by an M or D destination, decides the container of
 * every generic document below it, arrays included. Without a lock generic documents take the
 * entry family's default shape.
 */
struct DecodeContext {
    Family entryFamily;
    boost::optional<DocumentShape> lockedShape;
    DecodeOptions options;
    int32_t depth = 0;

    static DecodeContext root(const DecodeOptions& options) {
        return DecodeContext{options.family, boost::none, options, 0};
    }

    /** The context of a document nested one level below this one. Throws past maxDepth. */
    DecodeContext nested() const;

    /** A copy whose generic documents all take `shape`. */
    DecodeContext lockedTo(DocumentShape shape) const {
        DecodeContext ctx = *this;
        ctx.lockedShape = shape;
        return ctx;
    }

    /** The shape of a generic document decoded in this context. */
    DocumentShape documentShape() const {
        return lockedShape ? *lockedShape : defaultDocumentShape(entryFamily);
    }

    TargetKind genericTarget() const {
        return genericTargetFor(entryFamily);
    }
};

/**
 * Looks up the coercion for decoding `e` into `target`, throwing TypeMismatch when the table
 * says kFail.
 */
CoercionAction checkCoercion(const BSONElement& e, TargetKind target);

/** Records at debug level that a struct destination had no field named like `e`. */
void noteSkippedField(const BSONElement& e, StringData structName);

/** Checks UTF-8 of a string, field name or regex part when the context asks for it. */
void checkUTF8(StringData s, StringData what, const DecodeContext& ctx);

/**
 * Element decoders for every structural destination. `out` is only assigned once the element
 * was read in full.
 */
void decodeElement(const BSONElement& e, legacy::ObjectId& out, const DecodeContext& ctx);
void decodeElement(const BSONElement& e, current::ObjectID& out, const DecodeContext& ctx);
void decodeElement(const BSONElement& e, legacy::RegEx& out, const DecodeContext& ctx);
void decodeElement(const BSONElement& e, current::Regex& out, const DecodeContext& ctx);
void decodeElement(const BSONElement& e, legacy::M& out, const DecodeContext& ctx);
void decodeElement(const BSONElement& e, legacy::D& out, const DecodeContext& ctx);
void decodeElement(const BSONElement& e, legacy::Array& out, const DecodeContext& ctx);
void decodeElement(const BSONElement& e, current::M& out, const DecodeContext& ctx);
void decodeElement(const BSONElement& e, current::D& out, const DecodeContext& ctx);
void decodeElement(const BSONElement& e, current::A& out, const DecodeContext& ctx);
void decodeElement(const BSONElement& e, std::string& out, const DecodeContext& ctx);
void decodeElement(const BSONElement& e, int32_t& out, const DecodeContext& ctx);
void decodeElement(const BSONElement& e, int64_t& out, const DecodeContext& ctx);
void decodeElement(const BSONElement& e, double& out, const DecodeContext& ctx);
void decodeElement(const BSONElement& e, bool& out, const DecodeContext& ctx);
void decodeElement(const BSONElement& e, Date_t& out, const DecodeContext& ctx);
void decodeElement(const BSONElement& e, Value& out, const DecodeContext& ctx);

/**
 * Generic decode of one element, following the context's family and document lock.
 */
Value decodeGeneric(const BSONElement& e, const DecodeContext& ctx);

/**
 * Decodes the fields of `obj` into a container destination, replacing its contents. M and D
 * destinations lock the document shape for everything below them.
 */
void decodeDocument(const BSONObj& obj, legacy::M& out, const DecodeContext& ctx);
void decodeDocument(const BSONObj& obj, legacy::D& out, const DecodeContext& ctx);
void decodeDocument(const BSONObj& obj, current::M& out, const DecodeContext& ctx);
void decodeDocument(const BSONObj& obj, current::D& out, const DecodeContext& ctx);

/**
 * Decodes the values of `obj`, ignoring field names, into a sequence destination. Used for BSON
 * arrays and for top level documents keyed "0", "1", ...
 */
void decodeDocument(const BSONObj& obj, legacy::Array& out, const DecodeContext& ctx);
void decodeDocument(const BSONObj& obj, current::A& out, const DecodeContext& ctx);

/** Decodes a whole document into a generic value of the context's document shape. */
void decodeDocument(const BSONObj& obj, Value& out, const DecodeContext& ctx);

/** The TargetKind of each structural destination type. */
template <typename T>
struct TargetKindOf;

template <>
struct TargetKindOf<legacy::ObjectId> : std::integral_constant<TargetKind, TargetKind::kLegacyObjectId> {};
template <>
struct TargetKindOf<current::ObjectID> : std::integral_constant<TargetKind, TargetKind::kCurrentObjectID> {};
template <>
struct TargetKindOf<legacy::RegEx> : std::integral_constant<TargetKind, TargetKind::kLegacyRegEx> {};
template <>
struct TargetKindOf<current::Regex> : std::integral_constant<TargetKind, TargetKind::kCurrentRegex> {};
template <>
struct TargetKindOf<legacy::M> : std::integral_constant<TargetKind, TargetKind::kLegacyM> {};
template <>
struct TargetKindOf<current::M> : std::integral_constant<TargetKind, TargetKind::kCurrentM> {};
template <>
struct TargetKindOf<legacy::D> : std::integral_constant<TargetKind, TargetKind::kLegacyD> {};
template <>
struct TargetKindOf<current::D> : std::integral_constant<TargetKind, TargetKind::kCurrentD> {};
template <>
struct TargetKindOf<legacy::Array> : std::integral_constant<TargetKind, TargetKind::kLegacyArray> {};
template <>
struct TargetKindOf<current::A> : std::integral_constant<TargetKind, TargetKind::kCurrentA> {};
template <>
struct TargetKindOf<std::string> : std::integral_constant<TargetKind, TargetKind::kString> {};
template <>
struct TargetKindOf<int32_t> : std::integral_constant<TargetKind, TargetKind::kInt32> {};
template <>
struct TargetKindOf<int64_t> : std::integral_constant<TargetKind, TargetKind::kInt64> {};
template <>
struct TargetKindOf<double> : std::integral_constant<TargetKind, TargetKind::kDouble> {};
template <>
struct TargetKindOf<bool> : std::integral_constant<TargetKind, TargetKind::kBool> {};
template <>
struct TargetKindOf<Date_t> : std::integral_constant<TargetKind, TargetKind::kDate> {};

}  // namespace dualbson

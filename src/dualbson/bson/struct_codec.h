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

#include <optional>
#include <tuple>
#include <type_traits>
#include <typeinfo>
#include <utility>

#include "dualbson/base/string_data.h"
#include "dualbson/bson/bsonobj.h"
#include "dualbson/bson/document.h"
#include "dualbson/bson/object_id.h"
#include "dualbson/bson/regex.h"
#include "dualbson/bson/value.h"
#include "dualbson/bson/value_decoder.h"
#include "dualbson/bson/value_encoder.h"
#include "dualbson/util/time_support.h"

namespace dualbson {

/**
 * Per field encoding options of a structural record.
 */
enum class FieldOptions : unsigned {
    kNone = 0,
    // Skip the field when it holds its type's empty value: an unset optional, a zero identifier,
    // an empty string or container, zero, false or the epoch.
    kOmitEmpty = 1,
};

/**
 * Binds a BSON field name to a data member of T.
 */
template <typename T, typename Member>
struct BSONFieldDescriptor {
    using struct_type = T;
    using member_type = Member;

    const char* name;
    Member T::*member;
    bool omitEmpty;
};

template <typename T, typename Member>
constexpr BSONFieldDescriptor<T, Member> bsonField(const char* name,
                                                  Member T::*member,
                                                  FieldOptions options = FieldOptions::kNone) {
    return {name, member, options == FieldOptions::kOmitEmpty};
}

/**
 * Structural records opt in to the codec by specializing this template with a `fields` tuple of
 * bsonField() descriptors, listed in encoding order:
 *
 *   struct Person {
 *       legacy::ObjectId id;
 *       std::string name;
 *       std::optional<current::Regex> pattern;
 *   };
 *
 *   template <>
 *   struct BSONStructFields<Person> {
 *       static constexpr auto fields =
 *           std::make_tuple(bsonField("_id", &Person::id, FieldOptions::kOmitEmpty),
 *                           bsonField("name", &Person::name),
 *                           bsonField("pattern", &Person::pattern, FieldOptions::kOmitEmpty));
 *   };
 *
 * An optional member stands for a field that may be unset: unset encodes as BSON null, or is
 * omitted with kOmitEmpty, and a null element resets it.
 */
template <typename T>
struct BSONStructFields {};

template <typename T, typename = void>
struct IsBSONStruct : std::false_type {};

template <typename T>
struct IsBSONStruct<T, std::void_t<decltype(BSONStructFields<T>::fields)>> : std::true_type {};

template <typename T>
inline constexpr bool isBSONStruct = IsBSONStruct<T>::value;

template <typename T>
struct IsOptional : std::false_type {};
template <typename T>
struct IsOptional<std::optional<T>> : std::true_type {};

template <typename T>
struct IsFamilyContainer : std::false_type {};
template <Family F>
struct IsFamilyContainer<UnorderedDocument<F>> : std::true_type {};
template <Family F>
struct IsFamilyContainer<OrderedDocument<F>> : std::true_type {};
template <Family F>
struct IsFamilyContainer<Sequence<F>> : std::true_type {};

template <typename T>
inline constexpr bool isFamilyContainer = IsFamilyContainer<T>::value;

template <typename T>
struct IsRegexValue : std::false_type {};
template <Family F>
struct IsRegexValue<RegexValue<F>> : std::true_type {};

template <typename T>
void appendStructFields(ValueEncoder& enc, const T& record);

template <typename T>
void decodeStruct(const BSONObj& obj, T& out, const DecodeContext& ctx);

/** True if `v` is what kOmitEmpty skips. */
template <typename T>
bool isEmptyValue(const T& v) {
    if constexpr (IsOptional<T>::value) {
        return !v.has_value();
    } else if constexpr (std::is_same_v<T, legacy::ObjectId>) {
        return !v.valid();
    } else if constexpr (std::is_same_v<T, current::ObjectID>) {
        return v.isZero();
    } else if constexpr (IsRegexValue<T>::value) {
        return v.pattern.empty() && v.options.empty();
    } else if constexpr (isFamilyContainer<T> || std::is_same_v<T, std::string>) {
        return v.empty();
    } else if constexpr (std::is_arithmetic_v<T>) {
        return v == T{};
    } else if constexpr (std::is_same_v<T, Date_t>) {
        return v == Date_t();
    } else if constexpr (std::is_same_v<T, Value>) {
        return v.isNull();
    } else {
        return false;
    }
}

/** Appends `v` as element `name`, choosing the BSON type from the C++ type. */
template <typename T>
void appendField(ValueEncoder& enc, StringData name, const T& v) {
    if constexpr (IsOptional<T>::value) {
        if (!v) {
            enc.appendNull(name);
        } else {
            appendField(enc, name, *v);
        }
    } else if constexpr (std::is_same_v<T, legacy::ObjectId> ||
                         std::is_same_v<T, current::ObjectID>) {
        enc.appendOID(name, v.oid());
    } else if constexpr (IsRegexValue<T>::value) {
        enc.appendRegex(name, v.pattern, v.options);
    } else if constexpr (std::is_same_v<T, legacy::Array> || std::is_same_v<T, current::A>) {
        enc.appendArray(name, v);
    } else if constexpr (isFamilyContainer<T>) {
        enc.appendDocument(name, v);
    } else if constexpr (std::is_same_v<T, std::string>) {
        enc.appendString(name, v);
    } else if constexpr (std::is_same_v<T, bool>) {
        enc.appendBool(name, v);
    } else if constexpr (std::is_same_v<T, int32_t>) {
        enc.appendInt32(name, v);
    } else if constexpr (std::is_same_v<T, int64_t>) {
        enc.appendInt64(name, v);
    } else if constexpr (std::is_same_v<T, double>) {
        enc.appendDouble(name, v);
    } else if constexpr (std::is_same_v<T, Date_t>) {
        enc.appendDate(name, v);
    } else if constexpr (std::is_same_v<T, Value>) {
        enc.appendValue(name, v);
    } else if constexpr (isBSONStruct<T>) {
        enc.beginSubDocument(name, BSONType::object);
        appendStructFields(enc, v);
        enc.endDocument();
    } else {
        static_assert(sizeof(T) == 0, "type has no BSON mapping; specialize BSONStructFields");
    }
}

/** Appends every field of a structural record to the current document, in declared order. */
template <typename T>
void appendStructFields(ValueEncoder& enc, const T& record) {
    std::apply(
        [&](const auto&... fields) {
            auto appendOne = [&](const auto& field) {
                const auto& member = record.*(field.member);
                if (field.omitEmpty && isEmptyValue(member))
                    return;
                appendField(enc, field.name, member);
            };
            (appendOne(fields), ...);
        },
        BSONStructFields<T>::fields);
}

/**
 * Decodes `e` into a struct member. An optional member is reset by null and otherwise decoded in
 * place of its value.
 */
template <typename T>
void decodeField(const BSONElement& e, T& out, const DecodeContext& ctx) {
    if constexpr (IsOptional<T>::value) {
        if (e.type() == BSONType::null) {
            out.reset();
            return;
        }
        typename T::value_type value = out ? *out : typename T::value_type{};
        decodeField(e, value, ctx);
        out = std::move(value);
    } else if constexpr (isBSONStruct<T>) {
        if (checkCoercion(e, TargetKind::kStruct) == CoercionAction::kConvert) {
            out = T{};
            return;
        }
        decodeStruct(e.embeddedObject(), out, ctx.nested());
    } else {
        decodeElement(e, out, ctx);
    }
}

/**
 * Decodes the elements of `obj` into the matching members of `out`. Elements without a member
 * are skipped. Members without an element keep their value.
 */
template <typename T>
void decodeStruct(const BSONObj& obj, T& out, const DecodeContext& ctx) {
    BSONObjIterator it(obj);
    while (it.more()) {
        BSONElement e = it.next();
        StringData name = e.fieldNameStringData();
        checkUTF8(name, "field name", ctx);

        bool matched = false;
        std::apply(
            [&](const auto&... fields) {
                auto decodeOne = [&](const auto& field) {
                    if (matched || name != field.name)
                        return;
                    matched = true;
                    decodeField(e, out.*(field.member), ctx);
                };
                (decodeOne(fields), ...);
            },
            BSONStructFields<T>::fields);

        if (!matched) {
            noteSkippedField(e, typeid(T).name());
        }
    }
}

}  // namespace dualbson

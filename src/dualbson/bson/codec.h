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

#include <type_traits>
#include <typeinfo>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include "dualbson/base/data_range.h"
#include "dualbson/base/status.h"
#include "dualbson/base/status_with.h"
#include "dualbson/bson/bsonobj.h"
#include "dualbson/bson/codec_options.h"
#include "dualbson/bson/document.h"
#include "dualbson/bson/struct_codec.h"
#include "dualbson/bson/value.h"
#include "dualbson/bson/value_decoder.h"
#include "dualbson/bson/value_encoder.h"
#include "dualbson/util/assert_util.h"

namespace dualbson {

/**
 * Encodes `value` as one BSON document.
 *
 * Structural records and M / D of either family encode as documents. A generic sequence encodes
 * as a document keyed "0", "1", ... A generic Value must hold one of those. Any other type
 * yields UnsupportedBSONMapping.
 */
template <typename T>
StatusWith<std::vector<char>> encode(const T& value, const EncodeOptions& options = {}) {
    try {
        ValueEncoder enc(options);
        if constexpr (isBSONStruct<T>) {
            enc.beginDocument();
            appendStructFields(enc, value);
            enc.endDocument();
        } else if constexpr (isFamilyContainer<T>) {
            enc.beginDocument();
            enc.appendFields(value);
            enc.endDocument();
        } else if constexpr (std::is_same_v<T, Value>) {
            uassert(ErrorCodes::UnsupportedBSONMapping,
                    fmt::format("A generic value of kind {} cannot be encoded as a top level "
                                "document",
                                typeName(value.type())),
                    value.isContainer());
            enc.beginDocument();
            enc.appendFieldsOf(value);
            enc.endDocument();
        } else {
            uasserted(ErrorCodes::UnsupportedBSONMapping,
                      fmt::format("Type {} cannot be encoded as a top level document",
                                  typeid(T).name()));
        }
        return enc.release();
    } catch (const DBException&) {
        return exceptionToStatus();
    }
}

/**
 * Decodes the BSON document in `bytes` into `*destination`.
 *
 * Struct members without a matching element keep their value. Containers and generic values
 * are replaced. On failure `*destination` is left as it was.
 */
template <typename T>
Status decode(ConstDataRange bytes, T* destination, const DecodeOptions& options) {
    invariant(destination);
    try {
        BSONObj obj(bytes);
        uassert(ErrorCodes::InvalidBSON,
                fmt::format("BSON document of {} bytes is followed by {} trailing bytes",
                            obj.objsize(),
                            bytes.length() - obj.objsize()),
                static_cast<std::size_t>(obj.objsize()) == bytes.length());

        const DecodeContext ctx = DecodeContext::root(options);
        if constexpr (isBSONStruct<T>) {
            T result = *destination;
            decodeStruct(obj, result, ctx);
            *destination = std::move(result);
        } else if constexpr (isFamilyContainer<T> || std::is_same_v<T, Value>) {
            T result;
            decodeDocument(obj, result, ctx);
            *destination = std::move(result);
        } else {
            uasserted(ErrorCodes::TypeMismatch,
                      fmt::format("Cannot decode a BSON document into {}", typeid(T).name()));
        }
        return Status::OK();
    } catch (const DBException&) {
        return exceptionToStatus();
    }
}

namespace legacy {

/** Encodes with the shared encoder. The bytes do not depend on the front-end. */
template <typename T>
StatusWith<std::vector<char>> marshal(const T& value) {
    return encode(value);
}

/**
 * Decodes with legacy generic values: legacy ids, regexes and arrays, int32 as native int, and
 * legacy::M for documents no container type fixes.
 */
template <typename T>
Status unmarshal(ConstDataRange bytes, T* destination) {
    return decode(bytes, destination, DecodeOptions::legacy());
}

}  // namespace legacy

namespace current {

template <typename T>
StatusWith<std::vector<char>> marshal(const T& value) {
    return encode(value);
}

/**
 * Decodes with current generic values: current ids, regexes and arrays, int32 kept, and
 * current::D for documents no container type fixes.
 */
template <typename T>
Status unmarshal(ConstDataRange bytes, T* destination) {
    return decode(bytes, destination, DecodeOptions::current());
}

}  // namespace current

}  // namespace dualbson

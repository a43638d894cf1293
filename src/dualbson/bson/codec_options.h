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

#include "dualbson/bson/bson_depth.h"
#include "dualbson/bson/family.h"
#include "dualbson/bson/util/builder.h"

namespace dualbson {

/**
 * Limits applied while encoding. Exceeding either one is an EncodeError.
 */
struct EncodeOptions {
    // Deepest nesting of documents and arrays, the top level document being depth 1.
    int32_t maxDepth = BSONDepth::kDefaultMaxAllowableDepth;

    // Largest encoded size in bytes of the top level document.
    int32_t maxObjectSize = BSONObjMaxUserSize;
};

/**
 * Settings of a decode entry point.
 */
struct DecodeOptions {
    // Family of the generic values produced: identifiers, regexes, arrays, the default document
    // shape, and whether int32 becomes a native int.
    Family family = Family::kCurrent;

    // Reject strings, field names and regexes that are not well formed UTF-8.
    bool validateUTF8 = true;

    int32_t maxDepth = BSONDepth::kDefaultMaxAllowableDepth;

    /** The settings of the legacy front-end: legacy family, no UTF-8 validation. */
    static DecodeOptions legacy() {
        DecodeOptions options;
        options.family = Family::kLegacy;
        options.validateUTF8 = false;
        return options;
    }

    /** The settings of the current front-end: current family, strict UTF-8. */
    static DecodeOptions current() {
        return DecodeOptions{};
    }
};

}  // namespace dualbson

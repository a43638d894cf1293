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
#include <string>

#include "dualbson/base/string_data.h"

namespace dualbson {

/**
 * Broad groupings of error codes. A code may belong to any number of categories.
 */
enum class ErrorCategory {
    // The value handed to the encoder cannot be written as BSON.
    EncodeError,
    // The buffer handed to the decoder cannot be read into the requested destination.
    DecodeError,
};

/**
 * The table of error codes. Names, numbers and category membership are defined together in
 * error_codes.cpp; keep the enum below in sync with that table.
 */
class ErrorCodes {
public:
    enum Error : std::int32_t {
        OK = 0,
        InternalError = 1,
        BadValue = 2,
        UnknownError = 8,
        FailedToParse = 9,
        TypeMismatch = 14,
        Overflow = 15,
        InvalidBSON = 22,
        UnsupportedBSONMapping = 401,
        UnrepresentableValue = 402,
        InvalidUTF8 = 403,
        BSONObjectTooLarge = 10334,
        MaxError
    };

    static std::string errorString(Error err);

    /**
     * Parses an Error from its "name".  Returns UnknownError if "name" is unrecognized.
     *
     * NOTE: Also returns UnknownError for the string "UnknownError".
     */
    static Error fromString(StringData name);

    template <ErrorCategory category>
    static bool isA(Error code);

    static bool isEncodeError(Error code);
    static bool isDecodeError(Error code);
};

template <>
inline bool ErrorCodes::isA<ErrorCategory::EncodeError>(Error code) {
    return isEncodeError(code);
}

template <>
inline bool ErrorCodes::isA<ErrorCategory::DecodeError>(Error code) {
    return isDecodeError(code);
}

std::ostream& operator<<(std::ostream& stream, ErrorCodes::Error code);

}  // namespace dualbson

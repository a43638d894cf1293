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

#include <cstddef>
#include <string>

#include "dualbson/base/string_data.h"

namespace dualbson {

/** Hex encoding of opaque byte blobs such as ObjectId payloads. */
namespace hexblob {

/** Returns the 2-character lowercase hex representation of each byte of `data`. */
std::string encodeLower(const void* data, std::size_t len);

/**
 * Decodes `s`, a string of hex digit pairs, into the bytes they represent.
 * Throws FailedToParse on odd length or a non-hex character.
 */
std::string decode(StringData s);

/** True if every character of `s` is a hex digit and the length is even. */
bool validate(StringData s);

}  // namespace hexblob

/** Returns true if `c` is one of [0-9a-fA-F]. */
inline bool isHexit(char c) {
    return ((c >= '0') && (c <= '9')) || ((c >= 'a') && (c <= 'f')) || ((c >= 'A') && (c <= 'F'));
}

}  // namespace dualbson

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

#include "dualbson/util/hex.h"

#include <algorithm>

#include <fmt/format.h>

#include "dualbson/util/assert_util.h"

namespace dualbson {

namespace {

constexpr StringData kHexcharsLower = "0123456789abcdef";

unsigned char fromHexit(char c) {
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    uasserted(ErrorCodes::FailedToParse,
              fmt::format("The character \\x{:02x} failed to parse from hex.",
                          static_cast<unsigned char>(c)));
}

}  // namespace

namespace hexblob {

std::string encodeLower(const void* data, std::size_t len) {
    std::string out;
    out.reserve(2 * len);
    auto p = static_cast<const unsigned char*>(data);
    for (std::size_t i = 0; i < len; ++i) {
        out.push_back(kHexcharsLower[p[i] >> 4]);
        out.push_back(kHexcharsLower[p[i] & 0xF]);
    }
    return out;
}

std::string decode(StringData s) {
    uassert(ErrorCodes::FailedToParse,
            fmt::format("Hex blob with odd digit count: {}", s.size()),
            s.size() % 2 == 0);
    std::string out;
    out.reserve(s.size() / 2);
    for (std::size_t i = 0; i < s.size(); i += 2) {
        out.push_back(static_cast<char>((fromHexit(s[i]) << 4) | fromHexit(s[i + 1])));
    }
    return out;
}

bool validate(StringData s) {
    return s.size() % 2 == 0 && std::all_of(s.begin(), s.end(), isHexit);
}

}  // namespace hexblob
}  // namespace dualbson

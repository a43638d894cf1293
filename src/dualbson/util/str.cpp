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

#include "dualbson/util/str.h"

namespace dualbson {
namespace str {

namespace {

// Number of leading one bits in `c`. 0 for ASCII, 1 for a continuation byte, 2-4 for the lead
// byte of a multi-byte sequence.
int leadingOnes(unsigned char c) {
    int ones = 0;
    while (ones < 8 && (c & (0x80 >> ones)))
        ++ones;
    return ones;
}

}  // namespace

bool validUTF8(StringData s) {
    auto it = s.begin();
    while (it != s.end()) {
        const unsigned char c = static_cast<unsigned char>(*it++);
        const int ones = leadingOnes(c);
        if (ones == 0)
            continue;  // ASCII byte
        if (ones == 1 || ones > 4)
            return false;  // unexpected continuation byte or invalid lead byte

        if (s.end() - it < ones - 1)
            return false;  // string ended mid-codepoint

        char32_t codePoint = c & (0x7F >> ones);
        for (int i = 1; i < ones; ++i) {
            const unsigned char cont = static_cast<unsigned char>(*it++);
            if (leadingOnes(cont) != 1)
                return false;
            codePoint = (codePoint << 6) | (cont & 0x3F);
        }

        static constexpr char32_t kMinForLength[] = {0, 0, 0x80, 0x800, 0x10000};
        if (codePoint < kMinForLength[ones])
            return false;  // overlong
        if (codePoint > 0x10FFFF)
            return false;
        if (codePoint >= 0xD800 && codePoint <= 0xDFFF)
            return false;  // surrogate half
    }
    return true;
}

}  // namespace str
}  // namespace dualbson

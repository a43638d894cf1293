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
#include <cstring>
#include <string>
#include <vector>

#include <fmt/format.h>

#include "dualbson/base/data_view.h"
#include "dualbson/base/string_data.h"
#include "dualbson/util/assert_util.h"

namespace dualbson {

/**
 * Default limit on the size of a single encoded document. See EncodeOptions::maxObjectSize.
 */
const int BSONObjMaxUserSize = 16 * 1024 * 1024;

/**
 * The encoder refuses to grow a single buffer beyond this size regardless of the configured
 * object size limit.
 */
const int BufferMaxSize = 64 * 1024 * 1024;

/**
 * A growable byte buffer used to build BSON. All numbers are appended little endian.
 */
class BufBuilder {
public:
    BufBuilder(int initsize = 512) {
        _buf.reserve(initsize);
    }

    void reset() {
        _buf.clear();
    }

    /** leave room for some stuff later
        @return offset in the buffer that was our current position
    */
    std::size_t skip(int n) {
        std::size_t at = _buf.size();
        grow(n);
        return at;
    }

    /** Current length of the data written. */
    int len() const {
        return static_cast<int>(_buf.size());
    }

    const char* buf() const {
        return _buf.data();
    }

    /** Overwrites previously skipped bytes at `offset`. */
    void setInt32At(std::size_t offset, int32_t value) {
        DataView(_buf.data()).write<LittleEndian<int32_t>>(value, offset);
    }

    void appendUChar(unsigned char j) {
        appendChar(static_cast<char>(j));
    }
    void appendChar(char j) {
        *grow(sizeof(char)) = j;
    }
    void appendNum(char j) {
        appendChar(j);
    }
    void appendNum(bool j) {
        appendChar(j ? 1 : 0);
    }
    void appendNum(int32_t j) {
        DataView(grow(sizeof(j))).write<LittleEndian<int32_t>>(j);
    }
    void appendNum(int64_t j) {
        DataView(grow(sizeof(j))).write<LittleEndian<int64_t>>(j);
    }
    void appendNum(double j) {
        DataView(grow(sizeof(j))).writeDouble(j);
    }

    void appendBuf(const void* src, std::size_t len) {
        if (len == 0)
            return;
        std::memcpy(grow(static_cast<int>(len)), src, len);
    }

    /** Appends `str` followed by a NUL terminator when `includeEndingNull` is set. */
    void appendStr(StringData str, bool includeEndingNull = true) {
        appendBuf(str.data(), str.size());
        if (includeEndingNull)
            appendChar('\0');
    }

    /** Moves the built bytes out, leaving the builder empty. */
    std::vector<char> release() {
        std::vector<char> out;
        out.swap(_buf);
        return out;
    }

private:
    /* returns the pre-grow write position */
    char* grow(int by) {
        std::size_t oldlen = _buf.size();
        std::size_t newLen = oldlen + by;
        if (DUALBSON_unlikely(newLen > static_cast<std::size_t>(BufferMaxSize))) {
            growFailure(newLen);
        }
        _buf.resize(newLen);
        return _buf.data() + oldlen;
    }

    DUALBSON_COMPILER_NOINLINE DUALBSON_COMPILER_NORETURN void growFailure(std::size_t newLen) {
        uasserted(ErrorCodes::BSONObjectTooLarge,
                  fmt::format("BufBuilder attempted to grow() to {} bytes, past the 64MB limit.",
                              newLen));
    }

    std::vector<char> _buf;
};

}  // namespace dualbson

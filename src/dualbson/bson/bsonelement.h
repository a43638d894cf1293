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

#include "dualbson/base/data_view.h"
#include "dualbson/base/string_data.h"
#include "dualbson/bson/bsontypes.h"
#include "dualbson/bson/oid.h"
#include "dualbson/util/time_support.h"

namespace dualbson {

class BSONObj;

/**
 * A read-only view of one element of a BSON document: type byte, field name, value.
 *
 * Elements are only produced by BSONObjIterator, which has already checked that the whole
 * element lies inside the enclosing document. The accessors therefore do not re-check bounds,
 * but they do check that the element has the type they read.
 */
class BSONElement {
public:
    BSONElement() = default;

    BSONType type() const {
        return static_cast<BSONType>(static_cast<signed char>(*_data));
    }

    bool eoo() const {
        return type() == BSONType::eoo;
    }

    StringData fieldNameStringData() const {
        return StringData(_data + 1, _fieldNameSize - 1);
    }

    /** Size of the element in bytes, type byte and field name included. */
    int size() const {
        return _totalSize;
    }

    /** Size of the value part. */
    int valuesize() const {
        return _totalSize - _fieldNameSize - 1;
    }

    const char* value() const {
        return _data + _fieldNameSize + 1;
    }

    double _numberDouble() const {
        return ConstDataView(value()).readDouble();
    }
    int32_t _numberInt() const {
        return ConstDataView(value()).read<LittleEndian<int32_t>>();
    }
    int64_t _numberLong() const {
        return ConstDataView(value()).read<LittleEndian<int64_t>>();
    }

    /** The string value without its terminating NUL. Embedded NULs are kept. */
    StringData valueStringData() const;

    bool boolean() const;
    Date_t date() const;
    OID __oid() const;

    /** The pattern of a regex element. */
    StringData regex() const;
    /** The option letters of a regex element. */
    StringData regexFlags() const;

    /** The embedded document or array. */
    BSONObj embeddedObject() const;

    std::string toString() const;

private:
    friend class BSONObjIterator;

    BSONElement(const char* data, int fieldNameSize, int totalSize)
        : _data(data), _fieldNameSize(fieldNameSize), _totalSize(totalSize) {}

    void checkType(BSONType expected) const;

    const char* _data = nullptr;
    // Includes the terminating NUL.
    int _fieldNameSize = 0;
    int _totalSize = 0;
};

}  // namespace dualbson

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

#include "dualbson/bson/bsonelement.h"

#include <cstring>
#include <iterator>

#include <fmt/format.h>

#include "dualbson/bson/bsonobj.h"
#include "dualbson/util/assert_util.h"

namespace dualbson {

namespace {

// The values of the kSkipXX styles are used to compute the size, the remaining ones are arbitrary.
// NOTE: The kSkipXX values directly encode the amount of 4-byte words to skip: don't change them!
enum SizeStyle : uint8_t {
    kSkip0 = 0,          // The element only consists of the type byte and field name.
    kSkip4 = 1,          // There are 4 additional bytes of data, see note above.
    kSkip8 = 2,          // There are 8 additional bytes of data, see note above.
    kSkip12 = 3,         // There are 12 additional bytes of data, see note above.
    kSkip16 = 4,         // There are 16 additional bytes of data, see note above.
    kString = 5,         // An int32 with the string length (including NUL) follows the field name.
    kObjectOrArray = 6,  // The type starts a new nested object or array.
    kSpecial = 7,        // Handled specially: any cases that don't fall into the above.
};

constexpr SizeStyle kTypeInfoTable[20] = {
    SizeStyle::kSpecial,        // \x00 EOO
    SizeStyle::kSkip8,          // \x01 NumberDouble
    SizeStyle::kString,         // \x02 String
    SizeStyle::kObjectOrArray,  // \x03 Object
    SizeStyle::kObjectOrArray,  // \x04 Array
    SizeStyle::kSpecial,        // \x05 BinData
    SizeStyle::kSkip0,          // \x06 Undefined
    SizeStyle::kSkip12,         // \x07 OID
    SizeStyle::kSpecial,        // \x08 Bool (requires 0/1 false/true validation)
    SizeStyle::kSkip8,          // \x09 Date
    SizeStyle::kSkip0,          // \x0a Null
    SizeStyle::kSpecial,        // \x0b Regex (two nul-terminated strings)
    SizeStyle::kSpecial,        // \x0c DBRef
    SizeStyle::kString,         // \x0d Code
    SizeStyle::kString,         // \x0e Symbol
    SizeStyle::kSpecial,        // \x0f CodeWScope
    SizeStyle::kSkip4,          // \x10 Int
    SizeStyle::kSkip8,          // \x11 Timestamp
    SizeStyle::kSkip8,          // \x12 Long
    SizeStyle::kSkip16,         // \x13 Decimal
};

int32_t readInt32(const char* p) {
    return ConstDataView(p).read<LittleEndian<int32_t>>();
}

// Returns the length of the NUL terminated string at `p` including the NUL, or throws if the
// terminator is not found before `end`.
int cstringSize(const char* p, const char* end, StringData what) {
    auto nul = static_cast<const char*>(std::memchr(p, '\0', end - p));
    uassert(ErrorCodes::InvalidBSON,
            fmt::format("BSON {} is not NUL terminated", what),
            nul != nullptr);
    return static_cast<int>(nul - p) + 1;
}

// Size of a length prefixed string value, checked against `avail`.
int stringValueSize(const char* p, std::ptrdiff_t avail) {
    uassert(ErrorCodes::InvalidBSON, "BSON string length prefix is truncated", avail >= 4);
    int32_t len = readInt32(p);
    uassert(ErrorCodes::InvalidBSON,
            fmt::format("Invalid BSON string length {}", len),
            len >= 1 && len <= avail - 4);
    uassert(ErrorCodes::InvalidBSON, "BSON string is not NUL terminated", p[4 + len - 1] == '\0');
    return 4 + len;
}

// Size of the value of an element of `type` starting at `p`, given `avail` bytes before the
// enclosing document's EOO.
int valueSize(BSONType type, const char* p, std::ptrdiff_t avail) {
    auto rawType = static_cast<int>(type);
    if (rawType == static_cast<int>(BSONType::minKey) ||
        rawType == static_cast<int>(BSONType::maxKey))
        return 0;

    uassert(ErrorCodes::InvalidBSON,
            fmt::format("Unrecognized BSON type {}", rawType),
            isValidBSONType(rawType) && type != BSONType::eoo);

    int size = 0;
    switch (kTypeInfoTable[rawType]) {
        case kSkip0:
        case kSkip4:
        case kSkip8:
        case kSkip12:
        case kSkip16:
            size = 4 * kTypeInfoTable[rawType];
            break;
        case kString:
            return stringValueSize(p, avail);
        case kObjectOrArray: {
            uassert(ErrorCodes::InvalidBSON, "BSON object length is truncated", avail >= 4);
            size = readInt32(p);
            uassert(ErrorCodes::InvalidBSON,
                    fmt::format("Invalid BSON object length {}", size),
                    size >= BSONObj::kMinBSONLength);
            break;
        }
        case kSpecial:
            switch (type) {
                case BSONType::binData:
                    uassert(ErrorCodes::InvalidBSON, "BSON binData is truncated", avail >= 5);
                    size = readInt32(p);
                    uassert(ErrorCodes::InvalidBSON,
                            fmt::format("Invalid BSON binData length {}", size),
                            size >= 0 && size <= avail - 5);
                    size += 5;
                    break;
                case BSONType::boolean:
                    uassert(ErrorCodes::InvalidBSON, "BSON bool is truncated", avail >= 1);
                    uassert(ErrorCodes::InvalidBSON,
                            fmt::format("Invalid BSON bool value {}", int(p[0])),
                            p[0] == 0 || p[0] == 1);
                    size = 1;
                    break;
                case BSONType::regEx: {
                    int patternSize = cstringSize(p, p + avail, "regex pattern");
                    size = patternSize + cstringSize(p + patternSize, p + avail, "regex options");
                    break;
                }
                case BSONType::dbRef:
                    size = stringValueSize(p, avail) + OID::kOIDSize;
                    break;
                case BSONType::codeWScope:
                    uassert(ErrorCodes::InvalidBSON, "BSON codeWScope is truncated", avail >= 4);
                    size = readInt32(p);
                    uassert(ErrorCodes::InvalidBSON,
                            fmt::format("Invalid BSON codeWScope length {}", size),
                            size >= 4 + 4 + 1 + BSONObj::kMinBSONLength);
                    break;
                default:
                    uasserted(ErrorCodes::InvalidBSON,
                              fmt::format("Unrecognized BSON type {}", rawType));
            }
            break;
    }

    uassert(ErrorCodes::InvalidBSON,
            fmt::format("BSON {} element overruns its document", typeName(type)),
            size <= avail);
    return size;
}

}  // namespace

BSONObj::BSONObj(ConstDataRange buffer) : _data(buffer.data()), _size(0) {
    uassert(ErrorCodes::InvalidBSON,
            fmt::format("BSON document of {} bytes is shorter than the minimum of {}",
                        buffer.length(),
                        kMinBSONLength),
            buffer.length() >= static_cast<std::size_t>(kMinBSONLength));
    _size = readInt32(_data);
    uassert(ErrorCodes::InvalidBSON,
            fmt::format("BSON document length {} does not fit the {} available bytes",
                        _size,
                        buffer.length()),
            _size >= kMinBSONLength && static_cast<std::size_t>(_size) <= buffer.length());
    uassert(ErrorCodes::InvalidBSON,
            "BSON document is not terminated by EOO",
            _data[_size - 1] == '\0');
}

int BSONObj::nFields() const {
    int n = 0;
    BSONObjIterator it(*this);
    while (it.more()) {
        it.next();
        ++n;
    }
    return n;
}

BSONObjIterator::BSONObjIterator(const BSONObj& obj)
    : _pos(obj.objdata() + 4), _theend(obj.objdata() + obj.objsize() - 1) {}

BSONElement BSONObjIterator::next() {
    invariant(more());

    auto type = static_cast<BSONType>(static_cast<signed char>(*_pos));
    uassert(ErrorCodes::InvalidBSON,
            "Unexpected EOO inside a BSON document",
            type != BSONType::eoo);

    int fieldNameSize = cstringSize(_pos + 1, _theend, "field name");
    const char* valuePtr = _pos + 1 + fieldNameSize;
    int size = 1 + fieldNameSize + valueSize(type, valuePtr, _theend - valuePtr);

    BSONElement e(_pos, fieldNameSize, size);
    _pos += size;
    return e;
}

void BSONElement::checkType(BSONType expected) const {
    uassert(ErrorCodes::TypeMismatch,
            fmt::format("Expected BSON element '{}' to be of type {} but found {}",
                        fieldNameStringData(),
                        typeName(expected),
                        typeName(type())),
            type() == expected);
}

StringData BSONElement::valueStringData() const {
    checkType(BSONType::string);
    return StringData(value() + 4, readInt32(value()) - 1);
}

bool BSONElement::boolean() const {
    checkType(BSONType::boolean);
    return *value() != 0;
}

Date_t BSONElement::date() const {
    checkType(BSONType::date);
    return Date_t::fromMillisSinceEpoch(_numberLong());
}

OID BSONElement::__oid() const {
    checkType(BSONType::oid);
    return OID::from(value());
}

StringData BSONElement::regex() const {
    checkType(BSONType::regEx);
    return StringData(value());
}

StringData BSONElement::regexFlags() const {
    StringData pattern = regex();
    return StringData(value() + pattern.size() + 1);
}

BSONObj BSONElement::embeddedObject() const {
    uassert(ErrorCodes::TypeMismatch,
            fmt::format("Expected BSON element '{}' to be an object or array but found {}",
                        fieldNameStringData(),
                        typeName(type())),
            type() == BSONType::object || type() == BSONType::array);
    return BSONObj(ConstDataRange(value(), static_cast<std::size_t>(valuesize())));
}

std::string BSONElement::toString() const {
    switch (type()) {
        case BSONType::string:
            return fmt::format("{}: \"{}\"", fieldNameStringData(), valueStringData());
        case BSONType::numberInt:
            return fmt::format("{}: {}", fieldNameStringData(), _numberInt());
        case BSONType::numberLong:
            return fmt::format("{}: {}", fieldNameStringData(), _numberLong());
        case BSONType::numberDouble:
            return fmt::format("{}: {}", fieldNameStringData(), _numberDouble());
        case BSONType::oid:
            return fmt::format("{}: ObjectId('{}')", fieldNameStringData(), __oid().toString());
        default:
            return fmt::format("{}: <{}, {} bytes>",
                               fieldNameStringData(),
                               typeName(type()),
                               valuesize());
    }
}

}  // namespace dualbson

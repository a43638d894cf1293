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

#include "dualbson/bson/value.h"

#include <sstream>
#include <utility>

#include <fmt/format.h>

#include "dualbson/bson/document.h"
#include "dualbson/util/assert_util.h"

namespace dualbson {

using value_detail::Box;

Value::Value() : _type(Type::kNull) {}
Value::Value(std::nullptr_t) : Value() {}
Value::Value(bool b) : _type(Type::kBool), _storage(b) {}
Value::Value(int i) : _type(Type::kInt), _storage(int64_t{i}) {}
Value::Value(long l) : _type(Type::kInt64), _storage(static_cast<int64_t>(l)) {}
Value::Value(long long l) : _type(Type::kInt64), _storage(static_cast<int64_t>(l)) {}
Value::Value(double d) : _type(Type::kDouble), _storage(d) {}
Value::Value(const char* s) : _type(Type::kString), _storage(std::string(s)) {}
Value::Value(std::string s) : _type(Type::kString), _storage(std::move(s)) {}
Value::Value(Date_t d) : _type(Type::kDate), _storage(d) {}
Value::Value(legacy::ObjectId id) : _type(Type::kLegacyObjectId), _storage(id) {}
Value::Value(current::ObjectID id) : _type(Type::kObjectID), _storage(id) {}
Value::Value(legacy::RegEx re) : _type(Type::kLegacyRegEx), _storage(std::move(re)) {}
Value::Value(current::Regex re) : _type(Type::kRegex), _storage(std::move(re)) {}
Value::Value(legacy::M m) : _type(Type::kLegacyM), _storage(Box<legacy::M>(std::move(m))) {}
Value::Value(legacy::D d) : _type(Type::kLegacyD), _storage(Box<legacy::D>(std::move(d))) {}
Value::Value(legacy::Array a)
    : _type(Type::kLegacyArray), _storage(Box<legacy::Array>(std::move(a))) {}
Value::Value(current::M m) : _type(Type::kM), _storage(Box<current::M>(std::move(m))) {}
Value::Value(current::D d) : _type(Type::kD), _storage(Box<current::D>(std::move(d))) {}
Value::Value(current::A a) : _type(Type::kA), _storage(Box<current::A>(std::move(a))) {}

Value::Value(Type type, Storage storage) : _type(type), _storage(std::move(storage)) {}

Value Value::nativeInt(int64_t i) {
    return Value(Type::kInt, Storage(i));
}

Value Value::int32(int32_t i) {
    return Value(Type::kInt32, Storage(int64_t{i}));
}

Value Value::int64(int64_t i) {
    return Value(Type::kInt64, Storage(i));
}

Value Value::uint64(uint64_t u) {
    return Value(Type::kUInt64, Storage(u));
}

Value::Value(const Value& other) = default;
Value::Value(Value&& other) noexcept
    : _type(std::exchange(other._type, Type::kNull)),
      _storage(std::exchange(other._storage, Storage{})) {}

Value& Value::operator=(const Value& other) = default;

Value& Value::operator=(Value&& other) noexcept {
    if (this != &other) {
        _type = std::exchange(other._type, Type::kNull);
        _storage = std::exchange(other._storage, Storage{});
    }
    return *this;
}
Value::~Value() = default;

bool Value::isContainer() const {
    return isDocument() || isSequence();
}

bool Value::isDocument() const {
    switch (_type) {
        case Type::kLegacyM:
        case Type::kLegacyD:
        case Type::kM:
        case Type::kD:
            return true;
        default:
            return false;
    }
}

bool Value::isSequence() const {
    return _type == Type::kLegacyArray || _type == Type::kA;
}

bool Value::hasFamily() const {
    return _type >= Type::kLegacyObjectId && _type < Type::kNumTypes;
}

Family Value::family() const {
    switch (_type) {
        case Type::kLegacyObjectId:
        case Type::kLegacyRegEx:
        case Type::kLegacyM:
        case Type::kLegacyD:
        case Type::kLegacyArray:
            return Family::kLegacy;
        case Type::kObjectID:
        case Type::kRegex:
        case Type::kM:
        case Type::kD:
        case Type::kA:
            return Family::kCurrent;
        default:
            break;
    }
    uasserted(ErrorCodes::BadValue,
              fmt::format("Value of kind {} belongs to neither family", typeName(_type)));
}

void Value::checkType(Type expected) const {
    uassert(ErrorCodes::TypeMismatch,
            fmt::format("Expected a Value of kind {} but it holds {}",
                        typeName(expected),
                        typeName(_type)),
            _type == expected);
}

template <typename T>
const T& Value::boxed(Type expected) const {
    checkType(expected);
    return std::get<Box<T>>(_storage).get();
}

template <typename T>
T& Value::boxed(Type expected) {
    checkType(expected);
    return std::get<Box<T>>(_storage).get();
}

bool Value::getBool() const {
    checkType(Type::kBool);
    return std::get<bool>(_storage);
}

int64_t Value::getInt() const {
    checkType(Type::kInt);
    return std::get<int64_t>(_storage);
}

int32_t Value::getInt32() const {
    checkType(Type::kInt32);
    return static_cast<int32_t>(std::get<int64_t>(_storage));
}

int64_t Value::getInt64() const {
    checkType(Type::kInt64);
    return std::get<int64_t>(_storage);
}

uint64_t Value::getUInt64() const {
    checkType(Type::kUInt64);
    return std::get<uint64_t>(_storage);
}

double Value::getDouble() const {
    checkType(Type::kDouble);
    return std::get<double>(_storage);
}

const std::string& Value::getString() const {
    checkType(Type::kString);
    return std::get<std::string>(_storage);
}

Date_t Value::getDate() const {
    checkType(Type::kDate);
    return std::get<Date_t>(_storage);
}

const legacy::ObjectId& Value::getLegacyObjectId() const {
    checkType(Type::kLegacyObjectId);
    return std::get<legacy::ObjectId>(_storage);
}

const current::ObjectID& Value::getObjectID() const {
    checkType(Type::kObjectID);
    return std::get<current::ObjectID>(_storage);
}

const legacy::RegEx& Value::getLegacyRegEx() const {
    checkType(Type::kLegacyRegEx);
    return std::get<legacy::RegEx>(_storage);
}

const current::Regex& Value::getRegex() const {
    checkType(Type::kRegex);
    return std::get<current::Regex>(_storage);
}

const legacy::M& Value::getLegacyM() const {
    return boxed<legacy::M>(Type::kLegacyM);
}
const legacy::D& Value::getLegacyD() const {
    return boxed<legacy::D>(Type::kLegacyD);
}
const legacy::Array& Value::getLegacyArray() const {
    return boxed<legacy::Array>(Type::kLegacyArray);
}
const current::M& Value::getM() const {
    return boxed<current::M>(Type::kM);
}
const current::D& Value::getD() const {
    return boxed<current::D>(Type::kD);
}
const current::A& Value::getA() const {
    return boxed<current::A>(Type::kA);
}

legacy::M& Value::getLegacyM() {
    return boxed<legacy::M>(Type::kLegacyM);
}
legacy::D& Value::getLegacyD() {
    return boxed<legacy::D>(Type::kLegacyD);
}
legacy::Array& Value::getLegacyArray() {
    return boxed<legacy::Array>(Type::kLegacyArray);
}
current::M& Value::getM() {
    return boxed<current::M>(Type::kM);
}
current::D& Value::getD() {
    return boxed<current::D>(Type::kD);
}
current::A& Value::getA() {
    return boxed<current::A>(Type::kA);
}

bool Value::operator==(const Value& other) const {
    if (_type != other._type)
        return false;

    // The tag check keeps int, int32 and int64 apart even though they share storage.
    return _storage == other._storage;
}

std::string Value::toString() const {
    std::ostringstream ss;
    ss << *this;
    return ss.str();
}

StringData typeName(Value::Type type) {
    switch (type) {
        case Value::Type::kNull:
            return "null";
        case Value::Type::kBool:
            return "bool";
        case Value::Type::kInt:
            return "int";
        case Value::Type::kInt32:
            return "int32";
        case Value::Type::kInt64:
            return "int64";
        case Value::Type::kUInt64:
            return "uint64";
        case Value::Type::kDouble:
            return "double";
        case Value::Type::kString:
            return "string";
        case Value::Type::kDate:
            return "date";
        case Value::Type::kLegacyObjectId:
            return "legacy::ObjectId";
        case Value::Type::kObjectID:
            return "current::ObjectID";
        case Value::Type::kLegacyRegEx:
            return "legacy::RegEx";
        case Value::Type::kRegex:
            return "current::Regex";
        case Value::Type::kLegacyM:
            return "legacy::M";
        case Value::Type::kLegacyD:
            return "legacy::D";
        case Value::Type::kLegacyArray:
            return "legacy::Array";
        case Value::Type::kM:
            return "current::M";
        case Value::Type::kD:
            return "current::D";
        case Value::Type::kA:
            return "current::A";
        case Value::Type::kNumTypes:
            break;
    }
    return "invalid";
}

std::ostream& operator<<(std::ostream& os, Value::Type type) {
    return os << typeName(type);
}

std::ostream& operator<<(std::ostream& os, const Value& value) {
    switch (value.type()) {
        case Value::Type::kNull:
            return os << "null";
        case Value::Type::kBool:
            return os << (value.getBool() ? "true" : "false");
        case Value::Type::kInt:
            return os << value.getInt();
        case Value::Type::kInt32:
            return os << "int32(" << value.getInt32() << ")";
        case Value::Type::kInt64:
            return os << "int64(" << value.getInt64() << ")";
        case Value::Type::kUInt64:
            return os << "uint64(" << value.getUInt64() << ")";
        case Value::Type::kDouble:
            return os << value.getDouble();
        case Value::Type::kString:
            return os << '"' << value.getString() << '"';
        case Value::Type::kDate:
            return os << value.getDate();
        case Value::Type::kLegacyObjectId:
            return os << value.getLegacyObjectId();
        case Value::Type::kObjectID:
            return os << value.getObjectID();
        case Value::Type::kLegacyRegEx:
            return os << value.getLegacyRegEx();
        case Value::Type::kRegex:
            return os << value.getRegex();
        case Value::Type::kLegacyM:
            return os << value.getLegacyM();
        case Value::Type::kLegacyD:
            return os << value.getLegacyD();
        case Value::Type::kLegacyArray:
            return os << value.getLegacyArray();
        case Value::Type::kM:
            return os << value.getM();
        case Value::Type::kD:
            return os << value.getD();
        case Value::Type::kA:
            return os << value.getA();
        case Value::Type::kNumTypes:
            break;
    }
    return os << "<invalid>";
}

}  // namespace dualbson

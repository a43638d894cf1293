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
#include <memory>
#include <ostream>
#include <string>
#include <variant>

#include "dualbson/base/string_data.h"
#include "dualbson/bson/family.h"
#include "dualbson/bson/object_id.h"
#include "dualbson/bson/regex.h"
#include "dualbson/util/time_support.h"

namespace dualbson {

template <Family F>
class UnorderedDocument;
template <Family F>
class OrderedDocument;
template <Family F>
class Sequence;

namespace legacy {
using M = UnorderedDocument<Family::kLegacy>;
using D = OrderedDocument<Family::kLegacy>;
using Array = Sequence<Family::kLegacy>;
}  // namespace legacy

namespace current {
using M = UnorderedDocument<Family::kCurrent>;
using D = OrderedDocument<Family::kCurrent>;
using A = Sequence<Family::kCurrent>;
}  // namespace current

namespace value_detail {

/**
 * Owning pointer with value semantics. Lets a Value hold the containers that themselves hold
 * Values.
 */
template <typename T>
class Box {
public:
    explicit Box(T t) : _p(std::make_unique<T>(std::move(t))) {}
    Box(const Box& other) : _p(std::make_unique<T>(*other._p)) {}
    Box(Box&&) noexcept = default;
    Box& operator=(const Box& other) {
        if (this != &other)
            _p = std::make_unique<T>(*other._p);
        return *this;
    }
    Box& operator=(Box&&) noexcept = default;
    ~Box() = default;

    T& get() {
        return *_p;
    }
    const T& get() const {
        return *_p;
    }

    bool operator==(const Box& other) const {
        return get() == other.get();
    }

private:
    std::unique_ptr<T> _p;
};

}  // namespace value_detail

/**
 * A generic value of either family: the closed set of kinds a decoded BSON element may become
 * when the destination does not fix its type.
 *
 * Native int is the platform integer of the legacy family. It encodes as int32 when it fits and
 * int64 otherwise. The legacy decoder produces it for every int32 element.
 */
class Value {
public:
    enum class Type {
        kNull,
        kBool,
        kInt,
        kInt32,
        kInt64,
        kUInt64,
        kDouble,
        kString,
        kDate,
        kLegacyObjectId,
        kObjectID,
        kLegacyRegEx,
        kRegex,
        kLegacyM,
        kLegacyD,
        kLegacyArray,
        kM,
        kD,
        kA,
        kNumTypes,
    };

    // Constructors and the special members are out of line: they need the complete container
    // types, which in turn need Value.

    Value();
    Value(std::nullptr_t);
    Value(bool b);
    Value(int i);
    Value(long l);
    Value(long long l);
    Value(double d);
    Value(const char* s);
    Value(std::string s);
    Value(Date_t d);
    Value(legacy::ObjectId id);
    Value(current::ObjectID id);
    Value(legacy::RegEx re);
    Value(current::Regex re);
    Value(legacy::M m);
    Value(legacy::D d);
    Value(legacy::Array a);
    Value(current::M m);
    Value(current::D d);
    Value(current::A a);

    /** A native int. Spelled out for call sites that hold an int64_t. */
    static Value nativeInt(int64_t i);
    static Value int32(int32_t i);
    static Value int64(int64_t i);
    static Value uint64(uint64_t u);

    Value(const Value& other);
    /** A moved-from Value is null. */
    Value(Value&& other) noexcept;
    Value& operator=(const Value& other);
    Value& operator=(Value&& other) noexcept;
    ~Value();

    Type type() const {
        return _type;
    }

    bool isNull() const {
        return _type == Type::kNull;
    }

    /** True for the six container kinds. */
    bool isContainer() const;

    /** True for M and D of either family. */
    bool isDocument() const;

    /** True for legacy::Array and current::A. */
    bool isSequence() const;

    /** The family the held kind belongs to, if the kind is family specific. */
    bool hasFamily() const;
    Family family() const;

    bool getBool() const;
    int64_t getInt() const;
    int32_t getInt32() const;
    int64_t getInt64() const;
    uint64_t getUInt64() const;
    double getDouble() const;
    const std::string& getString() const;
    Date_t getDate() const;
    const legacy::ObjectId& getLegacyObjectId() const;
    const current::ObjectID& getObjectID() const;
    const legacy::RegEx& getLegacyRegEx() const;
    const current::Regex& getRegex() const;

    const legacy::M& getLegacyM() const;
    const legacy::D& getLegacyD() const;
    const legacy::Array& getLegacyArray() const;
    const current::M& getM() const;
    const current::D& getD() const;
    const current::A& getA() const;

    legacy::M& getLegacyM();
    legacy::D& getLegacyD();
    legacy::Array& getLegacyArray();
    current::M& getM();
    current::D& getD();
    current::A& getA();

    /** Kinds must match exactly: a native int never equals an int32 of the same value. */
    bool operator==(const Value& other) const;
    bool operator!=(const Value& other) const {
        return !(*this == other);
    }

    std::string toString() const;

private:
    using Storage = std::variant<std::monostate,
                                 bool,
                                 int64_t,
                                 uint64_t,
                                 double,
                                 std::string,
                                 Date_t,
                                 legacy::ObjectId,
                                 current::ObjectID,
                                 legacy::RegEx,
                                 current::Regex,
                                 value_detail::Box<legacy::M>,
                                 value_detail::Box<legacy::D>,
                                 value_detail::Box<legacy::Array>,
                                 value_detail::Box<current::M>,
                                 value_detail::Box<current::D>,
                                 value_detail::Box<current::A>>;

    Value(Type type, Storage storage);

    void checkType(Type expected) const;

    template <typename T>
    const T& boxed(Type expected) const;
    template <typename T>
    T& boxed(Type expected);

    Type _type;
    Storage _storage;
};

/** Returns a short name for the kind, such as "int32" or "legacy::M". */
StringData typeName(Value::Type type);

std::ostream& operator<<(std::ostream& os, Value::Type type);
std::ostream& operator<<(std::ostream& os, const Value& value);

}  // namespace dualbson

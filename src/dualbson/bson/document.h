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

#include <map>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include "dualbson/bson/family.h"
#include "dualbson/bson/value.h"

namespace dualbson {

/**
 * One entry of an ordered document.
 */
template <Family F>
struct DocElement {
    std::string name;
    Value value;

    bool operator==(const DocElement& other) const {
        return name == other.name && value == other.value;
    }
    bool operator!=(const DocElement& other) const {
        return !(*this == other);
    }
};

/**
 * Document with unique keys. Iteration, and therefore encoding, visits keys in sorted order, so
 * equal documents always produce identical bytes.
 */
template <Family F>
class UnorderedDocument : public std::map<std::string, Value> {
public:
    static constexpr Family kFamily = F;

    using std::map<std::string, Value>::map;
};

/**
 * Document that keeps its entries in insertion order. Keys may repeat.
 */
template <Family F>
class OrderedDocument : public std::vector<DocElement<F>> {
public:
    static constexpr Family kFamily = F;

    using std::vector<DocElement<F>>::vector;

    /**
     * Returns the entries as an unordered document of the same family. When a key repeats, the
     * last entry wins.
     */
    UnorderedDocument<F> toMap() const {
        UnorderedDocument<F> m;
        for (const auto& elem : *this) {
            m[elem.name] = elem.value;
        }
        return m;
    }
};

/**
 * Ordered sequence of generic values, encoded as a BSON array.
 */
template <Family F>
class Sequence : public std::vector<Value> {
public:
    static constexpr Family kFamily = F;

    using std::vector<Value>::vector;
};

namespace legacy {
using DocElem = DocElement<Family::kLegacy>;
}  // namespace legacy

namespace current {
using E = DocElement<Family::kCurrent>;
}  // namespace current

template <Family F>
std::ostream& operator<<(std::ostream& os, const UnorderedDocument<F>& doc) {
    os << (F == Family::kLegacy ? "legacy::M{" : "current::M{");
    bool first = true;
    for (const auto& [key, value] : doc) {
        os << (first ? "" : ", ") << key << ": " << value;
        first = false;
    }
    return os << "}";
}

template <Family F>
std::ostream& operator<<(std::ostream& os, const OrderedDocument<F>& doc) {
    os << (F == Family::kLegacy ? "legacy::D{" : "current::D{");
    bool first = true;
    for (const auto& elem : doc) {
        os << (first ? "" : ", ") << elem.name << ": " << elem.value;
        first = false;
    }
    return os << "}";
}

template <Family F>
std::ostream& operator<<(std::ostream& os, const Sequence<F>& seq) {
    os << (F == Family::kLegacy ? "legacy::Array[" : "current::A[");
    bool first = true;
    for (const auto& value : seq) {
        os << (first ? "" : ", ") << value;
        first = false;
    }
    return os << "]";
}

}  // namespace dualbson

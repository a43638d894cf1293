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

#include <sstream>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include "dualbson/base/string_data.h"

namespace dualbson::logv2 {

/** A log attribute, rendered to text at the call site. */
struct NamedAttribute {
    const char* name;
    std::string value;
};

namespace detail {

template <typename T>
std::string renderAttribute(const T& value) {
    if constexpr (std::is_same_v<T, bool>) {
        return value ? "true" : "false";
    } else if constexpr (std::is_arithmetic_v<T> || std::is_convertible_v<const T&, StringData>) {
        return fmt::format("{}", value);
    } else {
        std::ostringstream os;
        os << value;
        return os.str();
    }
}

}  // namespace detail

/** Proxy returned by the _attr literal; assigning a value produces a NamedAttribute. */
struct AttributeName {
    const char* name;

    template <typename T>
    NamedAttribute operator=(const T& value) const {
        return {name, detail::renderAttribute(value)};
    }
};

/** Attributes of a single log statement, in call order. */
using TypeErasedAttributeStorage = std::vector<NamedAttribute>;

inline namespace literals {

constexpr AttributeName operator""_attr(const char* name, std::size_t) {
    return {name};
}

}  // namespace literals

}  // namespace dualbson::logv2

namespace dualbson {
using namespace logv2::literals;
}  // namespace dualbson

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

#include <chrono>
#include <cstdint>
#include <iosfwd>
#include <limits>
#include <string>

namespace dualbson {

using Milliseconds = std::chrono::milliseconds;

/**
 * Representation of a point in time, with millisecond resolution and capable
 * of representing all times representable by the BSON Date type.
 *
 * The epoch used for this type is the Posix Epoch (1970-01-01T00:00:00Z).
 */
class Date_t {
public:
    /**
     * The largest representable Date_t.
     */
    static constexpr Date_t max() {
        return fromMillisSinceEpoch(std::numeric_limits<long long>::max());
    }

    /**
     * The minimum representable Date_t.
     */
    static constexpr Date_t min() {
        return fromMillisSinceEpoch(0);
    }

    /**
     * Reads the system clock and returns a Date_t representing the present time.
     */
    static Date_t now();

    /**
     * Returns a Date_t from an integer number of milliseconds since the epoch.
     */
    static constexpr Date_t fromMillisSinceEpoch(long long m) {
        return Date_t(m);
    }

    /**
     * Returns a Date_t from a system clock time point. Precision finer than a millisecond is
     * discarded by rounding towards negative infinity.
     */
    static Date_t fromSystemTimePoint(const std::chrono::system_clock::time_point& tp);

    /**
     * Constructs a Date_t representing the epoch.
     */
    constexpr Date_t() = default;

    std::string toString() const;

    long long toMillisSinceEpoch() const {
        return millis;
    }

    /** Seconds since the epoch, rounding towards negative infinity. */
    long long toTimeT() const;

    std::chrono::system_clock::time_point toSystemTimePoint() const;

    bool isFormattable() const;

    Date_t& operator+=(Milliseconds duration) {
        millis += duration.count();
        return *this;
    }

    Date_t operator+(Milliseconds duration) const {
        Date_t result = *this;
        result += duration;
        return result;
    }

    Milliseconds operator-(Date_t other) const {
        return Milliseconds(millis - other.millis);
    }

    bool operator==(Date_t other) const {
        return millis == other.millis;
    }
    bool operator!=(Date_t other) const {
        return !(*this == other);
    }
    bool operator<(Date_t other) const {
        return millis < other.millis;
    }
    bool operator>(Date_t other) const {
        return millis > other.millis;
    }
    bool operator<=(Date_t other) const {
        return !(*this > other);
    }
    bool operator>=(Date_t other) const {
        return !(*this < other);
    }

private:
    constexpr explicit Date_t(long long m) : millis(m) {}

    long long millis = 0;
};

std::ostream& operator<<(std::ostream& os, Date_t date);

}  // namespace dualbson

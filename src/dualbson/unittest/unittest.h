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

/**
 * Unit test vocabulary, layered over GoogleTest.
 *
 * Test files include this header, define DUALBSON_LOGV2_DEFAULT_COMPONENT as kTest if they log, and
 * declare cases with TEST(SuiteName, CaseName). The ASSERT_* family aborts the current case on
 * failure.
 */

#pragma once

#include <sstream>
#include <string>

#include <gtest/gtest.h>

#include "dualbson/base/status.h"
#include "dualbson/base/status_with.h"
#include "dualbson/logv2/log.h"
#include "dualbson/util/assert_util.h"

namespace dualbson::unittest {

inline const Status& statusOf(const Status& s) {
    return s;
}

template <typename T>
const Status& statusOf(const StatusWith<T>& sw) {
    return sw.getStatus();
}

inline ::testing::AssertionResult assertOk(const char* expr, const Status& status) {
    if (status.isOK())
        return ::testing::AssertionSuccess();
    return ::testing::AssertionFailure() << "Expected " << expr << " to be OK but got " << status;
}

inline ::testing::AssertionResult assertNotOk(const char* expr, const Status& status) {
    if (!status.isOK())
        return ::testing::AssertionSuccess();
    return ::testing::AssertionFailure() << "Expected " << expr << " to fail but it was OK";
}

inline ::testing::AssertionResult assertStringContains(const char* haystackExpr,
                                                       const char* needleExpr,
                                                       const std::string& haystack,
                                                       const std::string& needle) {
    if (haystack.find(needle) != std::string::npos)
        return ::testing::AssertionSuccess();
    return ::testing::AssertionFailure() << "Expected " << haystackExpr << " (" << haystack
                                         << ") to contain " << needleExpr << " (" << needle << ")";
}

}  // namespace dualbson::unittest

#define ASSERT(EXPRESSION) ASSERT_TRUE(EXPRESSION)
#define ASSERT_EQUALS(a, b) ASSERT_EQ(a, b)
#define ASSERT_NOT_EQUALS(a, b) ASSERT_NE(a, b)
#define ASSERT_LESS_THAN(a, b) ASSERT_LT(a, b)
#define ASSERT_GREATER_THAN(a, b) ASSERT_GT(a, b)

#define ASSERT_OK(EXPRESSION) \
    ASSERT_PRED_FORMAT1(::dualbson::unittest::assertOk, ::dualbson::unittest::statusOf(EXPRESSION))
#define ASSERT_NOT_OK(EXPRESSION) \
    ASSERT_PRED_FORMAT1(::dualbson::unittest::assertNotOk, \
                        ::dualbson::unittest::statusOf(EXPRESSION))

#define ASSERT_STRING_CONTAINS(BIG_STRING, CONTAINS) \
    ASSERT_PRED_FORMAT2(::dualbson::unittest::assertStringContains, BIG_STRING, CONTAINS)

/**
 * Fails unless evaluating STATEMENT throws an exception of EXCEPTION_TYPE.
 */
#define ASSERT_THROWS(STATEMENT, EXCEPTION_TYPE) ASSERT_THROW(STATEMENT, EXCEPTION_TYPE)

/**
 * Behaves like ASSERT_THROWS, above, but also fails if the code of the thrown exception is not
 * EXPECTED_CODE.
 */
#define ASSERT_THROWS_CODE(STATEMENT, EXCEPTION_TYPE, EXPECTED_CODE)                 \
    do {                                                                             \
        bool threw_ = false;                                                         \
        try {                                                                        \
            STATEMENT;                                                               \
        } catch (const EXCEPTION_TYPE& ex_) {                                        \
            threw_ = true;                                                           \
            ASSERT_EQ(::dualbson::ErrorCodes::Error(EXPECTED_CODE), ex_.code())      \
                << "Expected " #STATEMENT " to throw " #EXPECTED_CODE ", got "       \
                << ex_.toString();                                                   \
        }                                                                            \
        ASSERT_TRUE(threw_) << "Expected " #STATEMENT " to throw " #EXCEPTION_TYPE;  \
    } while (false)

/** Asserts that a Status or StatusWith carries the given error code. */
#define ASSERT_STATUS_CODE(EXPECTED_CODE, EXPRESSION) \
    ASSERT_EQ(::dualbson::ErrorCodes::Error(EXPECTED_CODE), \
              ::dualbson::unittest::statusOf(EXPRESSION).code())

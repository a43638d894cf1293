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

#include <cstdlib>
#include <cstring>

#include <gtest/gtest.h>

#include "dualbson/logv2/log.h"

/**
 * Test runner shared by every test binary. Besides the GoogleTest flags it accepts -v, -vv, ...
 * or --verbose=N to enable debug logging at that level.
 */
int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);

    int verbosity = 0;
    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        if (std::strncmp(arg, "--verbose=", 10) == 0) {
            verbosity = std::atoi(arg + 10);
        } else if (arg[0] == '-' && arg[1] == 'v') {
            verbosity = static_cast<int>(std::strspn(arg + 1, "v"));
        }
    }
    if (verbosity > 0) {
        ::dualbson::logv2::setMinimumLoggedSeverity(
            ::dualbson::logv2::LogSeverity::Debug(verbosity));
    }

    return RUN_ALL_TESTS();
}

/**
 * This file tests the exception and logging modules.
 *
 *       File: error_test.cpp
 *
 *    Copyright 2023 University Corporation for Atmospheric Research
 *
 * Licensed under the Apache License, Version 2.0 (the "License"); you may not use this file except
 * in compliance with the License. You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software distributed under the License
 * is distributed on an "AS IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express
 * or implied. See the License for the specific language governing permissions and limitations under
 * the License.
 */

#include "CommonTypes.h"
#include "error.h"
#include "logging.h"

#include <exception>
#include <gtest/gtest.h>
#include <libgen.h>

namespace {

using namespace sockcast;

// The fixture for testing modules `error` and `logging`.
class ErrorTest : public ::testing::Test {
protected:
    ErrorTest() {
        log_setLevel(LogLevel::DEBUG);
    }
};

// Tests simple logging
TEST_F(ErrorTest, SimpleLogging) {
    LOG_DEBUG("Debug message");
    LOG_INFO("Info message");
    LOG_NOTE("Notice message");
    LOG_WARNING("Warning message");
    LOG_ERROR("Error message");
    LOG_DEBUG("Debug message %d", 1);
    LOG_INFO("Info message %d", 2);
    LOG_NOTE("Notice message %d", 3);
    LOG_WARNING("Warning message %d", 4);
    LOG_ERROR("Error message %d", 5);
}

// Tests exception logging levels
TEST_F(ErrorTest, ExceptionLoggingLevels) {
    LOG_ERROR(RUNTIME_ERROR("Error level"));
    LOG_WARNING(RUNTIME_ERROR("Warning level"));
    LOG_NOTE(RUNTIME_ERROR("Notice level"));
    LOG_INFO(RUNTIME_ERROR("Informational level"));
    LOG_DEBUG(RUNTIME_ERROR("Debug level"));
}

// Tests setting the logging level by name
TEST_F(ErrorTest, SetLevelByName) {
    log_setLevel("warn");
    EXPECT_EQ(LogLevel::WARN, log_getLevel());
    log_setLevel("TRACE");
    EXPECT_EQ(LogLevel::TRACE, log_getLevel());
    EXPECT_THROW(log_setLevel("loud"), InvalidArgument);
    EXPECT_EQ(LogLevel::TRACE, log_getLevel());
}

// Tests the location information in an exception's message
TEST_F(ErrorTest, Location) {
    auto ex = INVALID_ARGUMENT("Bad argument");
    const String what(ex.what());
    EXPECT_NE(String::npos, what.find("error_test.cpp"));
    EXPECT_NE(String::npos, what.find("Bad argument"));
}

// Tests the taxonomy of the domain exceptions
TEST_F(ErrorTest, Taxonomy) {
    EXPECT_THROW(throw CONNECTION_ERROR("Refused"), RuntimeError);
    EXPECT_THROW(throw STREAM_FAULT("Reset"), RuntimeError);
    EXPECT_THROW(throw OVERSIZE_ERROR("Too big", 2000), RuntimeError);
    EXPECT_THROW(throw EOF_ERROR("End of file"), RuntimeError);
    EXPECT_THROW(throw INVALID_ARGUMENT("Bad argument"), std::invalid_argument);
    EXPECT_THROW(throw LOGIC_ERROR("Bad logic"), std::logic_error);

    try {
        throw OVERSIZE_ERROR("Too big", 2000);
    }
    catch (const OversizeMessageError& ex) {
        EXPECT_EQ(2000, ex.getSize());
    }
}

// Tests system error
TEST_F(ErrorTest, SystemError) {
    try {
        errno = EPIPE;
        throw SYSTEM_ERROR("System error");
    }
    catch (const std::system_error& ex) {
        EXPECT_EQ(EPIPE, ex.code().value());
        LOG_ERROR(ex);
    }
    try {
        throw SYSTEM_ERROR("System error", ECONNRESET);
    }
    catch (const std::system_error& ex) {
        EXPECT_EQ(ECONNRESET, ex.code().value());
        LOG_ERROR(ex);
    }
}

static void throwNestedException() {
    try {
        errno = ECONNREFUSED;
        throw SYSTEM_ERROR("Inner exception");
    }
    catch (const std::exception& ex) {
        std::throw_with_nested(CONNECTION_ERROR("Outer exception"));
    }
}

// Tests nested exception
TEST_F(ErrorTest, NestedException) {
    try {
        throwNestedException();
        FAIL() << "No exception thrown";
    }
    catch (const ConnectionError& ex) {
        LOG_ERROR(ex);
        try {
            std::rethrow_if_nested(ex);
            FAIL() << "No nested exception";
        }
        catch (const std::system_error& inner) {
            EXPECT_EQ(ECONNREFUSED, inner.code().value());
        }
    }
}

}  // namespace

int main(int argc, char **argv) {
  log_setName(::basename(argv[0]));
  std::set_terminate(&sockcast::terminate);
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}

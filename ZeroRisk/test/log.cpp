/*
 Copyright (C) 2024 Quaternion Risk Management Ltd
 All rights reserved.

 This file is part of ORE, a free-software/open-source library
 for transparent pricing and risk analysis - http://opensourcerisk.org

 ORE is free software: you can redistribute it and/or modify it
 under the terms of the Modified BSD License.  You should have received a
 copy of the license along with this program.
 The license is also available online at <http://opensourcerisk.org>

 This program is distributed on the basis that it will form a useful
 contribution to risk analytics and model standardisation, but WITHOUT
 ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or
 FITNESS FOR A PARTICULAR PURPOSE. See the license for more details.
*/

#include "toplevelfixture.hpp"
#include <boost/test/unit_test.hpp>

#include <zrk/utilities/log.hpp>

#include <boost/algorithm/string/predicate.hpp>

#include <cstdio>
#include <fstream>
#include <iostream>
#include <sstream>
#include <vector>

using namespace ZeroRisk;
using namespace boost::unit_test_framework;
using std::string;

namespace {
QuantLib::ext::shared_ptr<BufferLogger> setupBufferLogger(unsigned mask) {
    QuantLib::ext::shared_ptr<BufferLogger> logger = QuantLib::ext::make_shared<BufferLogger>();
    Log::instance().registerLogger(logger);
    Log::instance().switchOn();
    Log::instance().setMask(mask);
    return logger;
}

// sends std::cerr to a string for the lifetime of the object
class CaptureStderr {
public:
    CaptureStderr() : previous_(std::cerr.rdbuf(captured_.rdbuf())) {}
    ~CaptureStderr() { std::cerr.rdbuf(previous_); }
    string str() const { return captured_.str(); }

private:
    std::ostringstream captured_;
    std::streambuf* previous_;
};
} // namespace

BOOST_FIXTURE_TEST_SUITE(ZeroRiskTestSuite, ZeroRisk::test::TopLevelFixture)

BOOST_AUTO_TEST_SUITE(LogTest)

BOOST_AUTO_TEST_CASE(testBufferLogger) {

    BOOST_TEST_MESSAGE("Testing log messages are passed to a registered logger");

    QuantLib::ext::shared_ptr<BufferLogger> logger = setupBufferLogger(255);

    LOG("notice " << 42);
    WLOG("warning");

    BOOST_REQUIRE(logger->hasNext());
    string msg = logger->next();
    BOOST_CHECK(boost::starts_with(msg, "NOTICE"));
    BOOST_CHECK(boost::ends_with(msg, " : notice 42"));
    BOOST_CHECK(msg.find("log.cpp") != string::npos);

    BOOST_REQUIRE(logger->hasNext());
    BOOST_CHECK(boost::starts_with(logger->next(), "WARNING"));
    BOOST_CHECK(!logger->hasNext());
    BOOST_CHECK_THROW(logger->next(), QuantLib::Error);
}

BOOST_AUTO_TEST_CASE(testMask) {

    BOOST_TEST_MESSAGE("Testing log messages are filtered by the mask");

    QuantLib::ext::shared_ptr<BufferLogger> logger = setupBufferLogger(ZRK_ALERT | ZRK_ERROR);

    ALOG("alert");
    CLOG("critical");
    ELOG("error");
    WLOG("warning");
    LOG("notice");
    DLOG("debug");
    TLOG("data");

    BOOST_REQUIRE(logger->hasNext());
    BOOST_CHECK(boost::ends_with(logger->next(), "alert"));
    BOOST_REQUIRE(logger->hasNext());
    BOOST_CHECK(boost::ends_with(logger->next(), "error"));
    BOOST_CHECK(!logger->hasNext());

    BOOST_CHECK(Log::instance().filter(ZRK_ALERT));
    BOOST_CHECK(!Log::instance().filter(ZRK_DEBUG));
    BOOST_CHECK_EQUAL(Log::instance().mask(), static_cast<unsigned>(ZRK_ALERT | ZRK_ERROR));
}

BOOST_AUTO_TEST_CASE(testSwitchOff) {

    BOOST_TEST_MESSAGE("Testing nothing is logged when logging is switched off");

    QuantLib::ext::shared_ptr<BufferLogger> logger = setupBufferLogger(255);
    Log::instance().switchOff();
    BOOST_CHECK(!Log::instance().enabled());

    ALOG("alert");
    BOOST_CHECK(!logger->hasNext());

    Log::instance().switchOn();
    ALOG("alert");
    BOOST_CHECK(logger->hasNext());
}

BOOST_AUTO_TEST_CASE(testBufferLoggerMinLevel) {

    BOOST_TEST_MESSAGE("Testing the buffer logger keeps messages up to its level only");

    BufferLogger logger(ZRK_WARNING);
    logger.log(ZRK_ERROR, "error");
    logger.log(ZRK_DEBUG, "debug");
    BOOST_REQUIRE(logger.hasNext());
    BOOST_CHECK_EQUAL(logger.next(), "error");
    BOOST_CHECK(!logger.hasNext());
}

BOOST_AUTO_TEST_CASE(testLoggerRegistry) {

    BOOST_TEST_MESSAGE("Testing registration and removal of loggers");

    QuantLib::ext::shared_ptr<BufferLogger> logger = setupBufferLogger(255);
    BOOST_CHECK(Log::instance().hasLogger(BufferLogger::name));
    BOOST_CHECK(Log::instance().logger(BufferLogger::name) == logger);
    BOOST_CHECK_THROW(Log::instance().registerLogger(QuantLib::ext::make_shared<BufferLogger>()), QuantLib::Error);

    Log::instance().removeLogger(BufferLogger::name);
    BOOST_CHECK(!Log::instance().hasLogger(BufferLogger::name));
    BOOST_CHECK_THROW(Log::instance().removeLogger(BufferLogger::name), QuantLib::Error);
    BOOST_CHECK_THROW(Log::instance().logger(BufferLogger::name), QuantLib::Error);
}

BOOST_AUTO_TEST_CASE(testStderrLogger) {

    BOOST_TEST_MESSAGE("Testing the stderr logger");

    CaptureStderr captured;

    StderrLogger all;
    all.log(ZRK_WARNING, "warning message");
    StderrLogger alertOnly(true);
    alertOnly.log(ZRK_ERROR, "error message");
    alertOnly.log(ZRK_ALERT, "alert message");

    string out = captured.str();
    BOOST_CHECK(out.find("warning message") != string::npos);
    BOOST_CHECK(out.find("error message") == string::npos);
    BOOST_CHECK(out.find("alert message") != string::npos);
}

BOOST_AUTO_TEST_CASE(testFileLogger) {

    BOOST_TEST_MESSAGE("Testing the file logger");

    string fileName = "zerorisk_log_test.log";
    {
        QuantLib::ext::shared_ptr<FileLogger> logger = QuantLib::ext::make_shared<FileLogger>(fileName);
        Log::instance().registerLogger(logger);
        Log::instance().switchOn();
        Log::instance().setMask(ZRK_ALERT | ZRK_NOTICE);
        ALOG("first " << 1);
        DLOG("not written");
        LOG("second " << 2);
        Log::instance().removeLogger(FileLogger::name);
    }

    std::ifstream in(fileName.c_str());
    BOOST_REQUIRE(in.is_open());
    string line;
    std::vector<string> lines;
    while (std::getline(in, line))
        lines.push_back(line);
    in.close();
    std::remove(fileName.c_str());

    BOOST_REQUIRE_EQUAL(lines.size(), 2);
    BOOST_CHECK(boost::starts_with(lines[0], "ALERT"));
    BOOST_CHECK(boost::ends_with(lines[0], "first 1"));
    BOOST_CHECK(boost::starts_with(lines[1], "NOTICE"));
    BOOST_CHECK(boost::ends_with(lines[1], "second 2"));

    BOOST_CHECK_THROW(FileLogger("zerorisk_no_such_directory/test.log"), QuantLib::Error);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE_END()

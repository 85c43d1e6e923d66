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

/*! \file zrk/utilities/log.cpp
    \brief Classes and functions for log message handling.
    \ingroup utilities
*/

#include <zrk/utilities/log.hpp>

#include <boost/date_time/posix_time/posix_time.hpp>
#include <ql/errors.hpp>

#include <iomanip>
#include <iostream>

using namespace boost::posix_time;
using std::string;

namespace ZeroRisk {

const string StderrLogger::name = "StderrLogger";
const string FileLogger::name = "FileLogger";
const string BufferLogger::name = "BufferLogger";

void StderrLogger::log(unsigned l, const string& s) {
    if (!alertOnly_ || l == ZRK_ALERT)
        std::cerr << s << std::endl;
}

FileLogger::FileLogger(const string& filename) : Logger(name), filename_(filename) {
    fout_.open(filename.c_str(), std::ios_base::out);
    QL_REQUIRE(fout_.is_open(), "Error opening file " << filename);
    fout_.setf(std::ios::fixed, std::ios::floatfield);
    fout_.setf(std::ios::showpoint);
}

FileLogger::~FileLogger() {
    if (fout_.is_open())
        fout_.close();
}

void FileLogger::log(unsigned, const string& msg) {
    if (fout_.is_open())
        fout_ << msg << std::endl;
}

void BufferLogger::log(unsigned level, const string& s) {
    if (level <= minLevel_)
        buffer_.push(s);
}

bool BufferLogger::hasNext() { return !buffer_.empty(); }

string BufferLogger::next() {
    QL_REQUIRE(!buffer_.empty(), "Log Buffer is empty");
    string msg = buffer_.front();
    buffer_.pop();
    return msg;
}

Log::Log() : loggers_(), enabled_(false), mask_(255), ls_() {
    ls_.setf(std::ios::fixed, std::ios::floatfield);
    ls_.setf(std::ios::showpoint);
}

void Log::registerLogger(const QuantLib::ext::shared_ptr<Logger>& logger) {
    boost::unique_lock<boost::shared_mutex> lock(mutex_);
    QL_REQUIRE(loggers_.find(logger->name()) == loggers_.end(),
               "Logger with name " << logger->name() << " already registered");
    loggers_[logger->name()] = logger;
}

bool Log::hasLogger(const string& name) const {
    boost::shared_lock<boost::shared_mutex> lock(mutex_);
    return loggers_.find(name) != loggers_.end();
}

QuantLib::ext::shared_ptr<Logger> Log::logger(const string& name) const {
    boost::shared_lock<boost::shared_mutex> lock(mutex_);
    auto it = loggers_.find(name);
    QL_REQUIRE(it != loggers_.end(), "No logger found with name " << name);
    return it->second;
}

void Log::removeLogger(const string& name) {
    boost::unique_lock<boost::shared_mutex> lock(mutex_);
    auto it = loggers_.find(name);
    if (it != loggers_.end()) {
        loggers_.erase(it);
    } else {
        QL_FAIL("No logger found with name " << name);
    }
}

void Log::removeAllLoggers() {
    boost::unique_lock<boost::shared_mutex> lock(mutex_);
    loggers_.clear();
}

void Log::header(unsigned m, const char* filename, int lineNo) {
    // 1. Reset stringstream
    ls_.str(string());
    ls_.clear();

    // Write the header to the stream
    // TYPE [Time Stamp] (file:line)
    switch (m) {
    case ZRK_ALERT:
        ls_ << "ALERT    ";
        break;
    case ZRK_CRITICAL:
        ls_ << "CRITICAL ";
        break;
    case ZRK_ERROR:
        ls_ << "ERROR    ";
        break;
    case ZRK_WARNING:
        ls_ << "WARNING  ";
        break;
    case ZRK_NOTICE:
        ls_ << "NOTICE   ";
        break;
    case ZRK_DEBUG:
        ls_ << "DEBUG    ";
        break;
    case ZRK_DATA:
        ls_ << "DATA     ";
        break;
    }

    // Timestamp
    ls_ << '[' << to_simple_string(microsec_clock::local_time()) << ']';

    // Filename & line no
    // Only the file name is written, the path is dropped to keep the header short
    string filepart = filename;
    string::size_type pos = filepart.find_last_of("/\\");
    if (pos != string::npos)
        filepart = filepart.substr(pos + 1);
    std::ostringstream location;
    location << " (" << filepart << ':' << lineNo << ") ";
    string loc = location.str();
    if (static_cast<int>(loc.size()) > maxLen_)
        loc = " (..." + loc.substr(loc.size() - maxLen_ + 5);
    ls_ << std::left << std::setw(maxLen_) << loc << " : ";
}

void Log::log(unsigned m) {
    string msg = ls_.str();
    for (auto& l : loggers_)
        l.second->log(m, msg);
}

} // namespace ZeroRisk

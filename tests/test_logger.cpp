/**
 * @file test_logger.cpp
 * @brief Session log format and level filtering.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include <doctest/doctest.h>

#include <cstdio>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

#include "Logger.h"

TEST_SUITE("logger") {

TEST_CASE("lines carry the level and the turn once it is set") {
    const std::string path = "ants_tests_logger.log";
    std::remove(path.c_str());
    Logger::init(path);
    Logger::setLevel(Logger::Level::Info);
    Logger::setTurn(-1);
    Logger::info("before the first turn");
    Logger::setTurn(4);
    Logger::warn("low food");
    Logger::debug("filtered out");
    Logger::logException("deploy", std::logic_error("Two ants in tunnel_0_1"));
    Logger::setTurn(-1);
    CHECK(Logger::level() == Logger::Level::Info);
    Logger::shutdown();

    std::ifstream in(path);
    std::stringstream text;
    text << in.rdbuf();
    const std::string log = text.str();
    CHECK(log.find("session start") != std::string::npos);
    CHECK(log.find("[INFO] before the first turn") != std::string::npos);
    CHECK(log.find("[WARN] [turn 4] low food") != std::string::npos);
    CHECK(log.find("[ERROR] [turn 4] deploy: Two ants in tunnel_0_1") != std::string::npos);
    CHECK(log.find("filtered out") == std::string::npos);
    CHECK(log.find("session end") != std::string::npos);
    std::remove(path.c_str());
}

}

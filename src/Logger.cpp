/**
 * @file Logger.cpp
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "Logger.h"

#include <cctype>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <mutex>
#include <sstream>

namespace {

/** @brief Everything the logger keeps between calls; guarded by @c mtx. */
struct Session {
    std::mutex mtx;
    std::ofstream out;
    Logger::Level threshold{Logger::Level::Info};
    int turn{-1};
};

Session& session() {
    static Session s;
    return s;
}

const char* levelTag(Logger::Level lvl) {
    switch (lvl) {
        case Logger::Level::Debug: return "DEBUG";
        case Logger::Level::Info: return "INFO";
        case Logger::Level::Warn: return "WARN";
        case Logger::Level::Error: return "ERROR";
        case Logger::Level::None: break;
    }
    return "NONE";
}

// Unrecognized names keep @p fallback.
Logger::Level parseLevel(std::string text, Logger::Level fallback) {
    for (auto& c : text) c = (char)std::tolower((unsigned char)c);
    if (text == "debug") return Logger::Level::Debug;
    if (text == "info") return Logger::Level::Info;
    if (text == "warn" || text == "warning") return Logger::Level::Warn;
    if (text == "error") return Logger::Level::Error;
    if (text == "none" || text == "off") return Logger::Level::None;
    return fallback;
}

std::string timestamp() {
    using namespace std::chrono;
    const auto now = system_clock::now();
    const std::time_t secs = system_clock::to_time_t(now);
    const auto ms = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;
    std::tm local{};
    localtime_r(&secs, &local);
    std::ostringstream oss;
    oss << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << ms;
    return oss.str();
}

} // namespace

void Logger::initFromArgv0(const char* argv0) {
    std::string name = argv0 ? argv0 : "";
    const size_t slash = name.find_last_of('/');
    if (slash != std::string::npos) name.erase(0, slash + 1);
    if (name.empty()) name = "ants";
    init("./" + name + ".log");
}

void Logger::init(const std::string& filename) {
    Session& s = session();
    std::lock_guard<std::mutex> lock(s.mtx);
    if (s.out.is_open()) return;
    s.out.open(filename, std::ios::out | std::ios::app);
    if (!s.out.is_open()) return;
    if (const char* env = std::getenv("LOG_LEVEL")) s.threshold = parseLevel(env, s.threshold);
    s.out << "===== session start " << timestamp() << " =====\n";
    s.out.flush();
}

void Logger::shutdown() {
    Session& s = session();
    std::lock_guard<std::mutex> lock(s.mtx);
    if (!s.out.is_open()) return;
    s.out << "===== session end   " << timestamp() << " =====" << std::endl;
    s.out.close();
}

void Logger::logImpl(Level lvl, const std::string& msg) {
    Session& s = session();
    std::lock_guard<std::mutex> lock(s.mtx);
    if (!s.out.is_open() || lvl < s.threshold) return;
    s.out << timestamp() << " [" << levelTag(lvl) << "]";
    if (s.turn >= 0) s.out << " [turn " << s.turn << "]";
    s.out << ' ' << msg << '\n';
    if (lvl >= Level::Warn) s.out.flush();
}

void Logger::debug(const std::string& msg) { logImpl(Level::Debug, msg); }
void Logger::info(const std::string& msg) { logImpl(Level::Info, msg); }
void Logger::warn(const std::string& msg) { logImpl(Level::Warn, msg); }
void Logger::error(const std::string& msg) { logImpl(Level::Error, msg); }

void Logger::logException(const std::string& where, const std::exception& e) {
    logImpl(Level::Error, where + ": " + e.what());
}

void Logger::logUnknownException(const std::string& where) {
    logImpl(Level::Error, where + ": unknown exception");
}

void Logger::setLevel(Level lvl) {
    Session& s = session();
    std::lock_guard<std::mutex> lock(s.mtx);
    s.threshold = lvl;
}

Logger::Level Logger::level() {
    Session& s = session();
    std::lock_guard<std::mutex> lock(s.mtx);
    return s.threshold;
}

void Logger::setTurn(int turn) {
    Session& s = session();
    std::lock_guard<std::mutex> lock(s.mtx);
    s.turn = turn;
}

#include "util/log.hpp"

#include <iostream>
#include <mutex>
#include <stdexcept>

namespace skyshield::log {
namespace {

std::mutex g_mu;
Level g_level = Level::Info;
Sink g_sink;

void emit(Level l, const std::string& msg) {
    if (g_level == Level::Off || l < g_level) return;
    std::lock_guard<std::mutex> lock(g_mu);
    if (g_sink) {
        g_sink(l, msg);
        return;
    }
    std::cerr << "[" << level_name(l) << "] " << msg << "\n";
}

} // namespace

void set_level(Level lvl) { g_level = lvl; }
Level level() { return g_level; }

Level parse_level(const std::string& name) {
    if (name == "debug") return Level::Debug;
    if (name == "info") return Level::Info;
    if (name == "warn") return Level::Warn;
    if (name == "error") return Level::Error;
    if (name == "off") return Level::Off;
    throw std::runtime_error("Unknown log level: " + name);
}

const char* level_name(Level lvl) {
    switch (lvl) {
        case Level::Debug: return "DEBUG";
        case Level::Info: return "INFO";
        case Level::Warn: return "WARN";
        case Level::Error: return "ERROR";
        default: return "";
    }
}

void set_sink(Sink sink) {
    std::lock_guard<std::mutex> lock(g_mu);
    g_sink = std::move(sink);
}

void debug(const std::string& msg) { emit(Level::Debug, msg); }
void info(const std::string& msg) { emit(Level::Info, msg); }
void warn(const std::string& msg) { emit(Level::Warn, msg); }
void error(const std::string& msg) { emit(Level::Error, msg); }

} // namespace skyshield::log

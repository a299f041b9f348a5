#include "steps/log.hpp"

#include <cctype>
#include <cstdlib>
#include <iostream>
#include <string>

namespace steps::log {

namespace {

Level gLevel = Level::Info;

class NullBuffer : public std::streambuf {
protected:
    int overflow(int c) override { return traits_type::not_eof(c); }
};

std::ostream& NullStream() {
    static NullBuffer buffer;
    static std::ostream stream(&buffer);
    return stream;
}

} // namespace

void SetLevel(Level level) { gLevel = level; }
Level GetLevel() { return gLevel; }
bool Enabled(Level level) { return static_cast<int>(level) <= static_cast<int>(gLevel); }

bool ParseLevel(std::string_view text, Level* out) {
    std::string lower;
    lower.reserve(text.size());
    for (char c : text) lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));

    if (lower == "error") { *out = Level::Error; return true; }
    if (lower == "warn" || lower == "warning") { *out = Level::Warn; return true; }
    if (lower == "info") { *out = Level::Info; return true; }
    if (lower == "debug") { *out = Level::Debug; return true; }
    return false;
}

void InitFromEnvironment() {
    const char* env = std::getenv("STEPS_LOG");
    if (!env) return;
    Level level;
    if (ParseLevel(env, &level)) {
        SetLevel(level);
    } else {
        std::cerr << "[log] Ignoring unknown STEPS_LOG value: " << env << "\n";
    }
}

std::ostream& Stream(Level level, const char* tag) {
    if (!Enabled(level)) return NullStream();
    std::ostream& out = (level == Level::Error || level == Level::Warn) ? std::cerr : std::cout;
    out << "[" << tag << "] ";
    return out;
}

} // namespace steps::log

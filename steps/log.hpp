#pragma once

#include <ostream>
#include <string_view>

// Tagged iostream logging: "[wgpu] message". Info and debug go to std::cout,
// warnings and errors to std::cerr. Levels above the threshold go nowhere.
namespace steps::log {

enum class Level { Error = 0, Warn, Info, Debug };

void SetLevel(Level level);
Level GetLevel();
bool Enabled(Level level);

// Accepts "error", "warn", "info", "debug" (case-insensitive).
bool ParseLevel(std::string_view text, Level* out);

// Reads STEPS_LOG; an unset or unrecognized value leaves the level alone.
void InitFromEnvironment();

std::ostream& Stream(Level level, const char* tag);

inline std::ostream& Error(const char* tag) { return Stream(Level::Error, tag); }
inline std::ostream& Warn(const char* tag) { return Stream(Level::Warn, tag); }
inline std::ostream& Info(const char* tag) { return Stream(Level::Info, tag); }
inline std::ostream& Debug(const char* tag) { return Stream(Level::Debug, tag); }

} // namespace steps::log

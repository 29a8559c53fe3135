#pragma once
#include <chrono>
#include <nlohmann/json.hpp>
#include <string>
#include <algorithm>
#include <cctype>

namespace roster {

using json = nlohmann::json;

// Returns current time in milliseconds since epoch
static inline long long NowMillis() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(
               steady_clock::now().time_since_epoch()
           ).count();
}

// ---------- small label helpers ----------
// Engine days/rooms are 0-based; everything a person reads is 1-based.
inline std::string day_label(int day) { return "Day " + std::to_string(day + 1); }
inline std::string room_label(int room) { return "Room " + std::to_string(room + 1); }

static inline std::string trim(const std::string& s) {
    auto b = std::find_if_not(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
    auto e = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c); }).base();
    return (b < e) ? std::string(b, e) : std::string();
}

static inline std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return (char)std::tolower(c); });
    return s;
}

}  // namespace roster

#include "Ids.hpp"
#include <chrono>
#include <cstdint>
#include <iomanip>
#include <random>
#include <sstream>

std::string generateID() {
    using namespace std::chrono;

    auto now = system_clock::now();
    auto millis = duration_cast<milliseconds>(now.time_since_epoch()).count();

    thread_local std::mt19937_64 eng{ std::random_device{}() };
    std::uniform_int_distribution<uint64_t> dist;

    uint64_t randPart = dist(eng);

    std::stringstream ss;
    ss << std::hex << millis << "-" << std::setw(16) << std::setfill('0') << randPart;
    return ss.str();
}

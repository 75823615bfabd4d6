#include "chatraw/store_utils.hpp"
#include <chrono>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <random>
#include <sstream>

namespace chatraw
{

std::string generateUuid()
{
    static thread_local std::random_device rd;
    static thread_local std::mt19937 gen(rd());
    static thread_local std::uniform_int_distribution<uint32_t> dis(0, 0xFFFFFFFF);
    static thread_local std::uniform_int_distribution<uint16_t> dis16(0, 0xFFFF);
    static thread_local std::uniform_int_distribution<unsigned int> dis8(0, 0xFF);

    // xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx, y is one of 8, 9, a, b
    uint32_t time_low = dis(gen);
    uint16_t time_mid = dis16(gen);
    uint16_t time_hi_and_version = static_cast<uint16_t>((dis16(gen) & 0x0FFF) | 0x4000);
    uint8_t clock_seq_hi_and_reserved = static_cast<uint8_t>((dis8(gen) & 0x3F) | 0x80);
    uint8_t clock_seq_low = static_cast<uint8_t>(dis8(gen));
    uint64_t node = (static_cast<uint64_t>(dis(gen)) << 16) | dis16(gen);

    std::stringstream ss;
    ss << std::hex << std::setfill('0');
    ss << std::setw(8) << time_low << "-";
    ss << std::setw(4) << time_mid << "-";
    ss << std::setw(4) << time_hi_and_version << "-";
    ss << std::setw(2) << static_cast<int>(clock_seq_hi_and_reserved);
    ss << std::setw(2) << static_cast<int>(clock_seq_low) << "-";
    ss << std::setw(12) << node;

    return ss.str();
}

std::string currentIsoTimestamp()
{
    auto now = std::chrono::system_clock::now();
    std::time_t time = std::chrono::system_clock::to_time_t(now);
    auto us = std::chrono::duration_cast<std::chrono::microseconds>(now.time_since_epoch()) % 1000000;

    std::tm localTime{};
#ifdef _WIN32
    localtime_s(&localTime, &time);
#else
    localtime_r(&time, &localTime);
#endif

    std::stringstream ss;
    ss << std::put_time(&localTime, "%Y-%m-%dT%H:%M:%S");
    ss << '.' << std::setfill('0') << std::setw(6) << us.count();
    return ss.str();
}

} // namespace chatraw

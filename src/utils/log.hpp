// ============================================================================
// utils/log.hpp - Minimal stderr logging for accelio readers
// ============================================================================
#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <string_view>

namespace accelio {
namespace log {

using steady_t = std::chrono::steady_clock;

inline steady_t::time_point start_time() {
    static const auto t0 = steady_t::now();
    return t0;
}

inline uint64_t ms_since_start() {
    return (uint64_t)std::chrono::duration_cast<std::chrono::milliseconds>(
        steady_t::now() - start_time()).count();
}

inline std::atomic<bool>& verbose_flag() {
    static std::atomic<bool> flag{[] {
        const char* v = std::getenv("VERBOSE");
        return v && *v && std::string_view(v) != "0";
    }()};
    return flag;
}

inline bool verbose() { return verbose_flag().load(); }
inline void set_verbose(bool on) { verbose_flag().store(on); }

} // namespace log
} // namespace accelio

#define ACCELIO_LOG_LINE(level, msg) do { \
    std::cerr << "[" << std::setw(6) << ::accelio::log::ms_since_start() << " ms] " \
              << level << ": " << msg << std::endl; \
} while(0)

#define ACCELIO_LOG_WARN(msg) ACCELIO_LOG_LINE("warning", msg)
#define ACCELIO_LOG_INFO(msg) do { if (::accelio::log::verbose()) ACCELIO_LOG_LINE("info", msg); } while(0)
#define ACCELIO_LOG_DBG(msg)  do { if (::accelio::log::verbose()) ACCELIO_LOG_LINE("debug", msg); } while(0)

#include "logging.h"
#include <chrono>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <ctime>

std::string getTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(
        now.time_since_epoch()) % 1000000000;

    std::tm tm_buf;
    #ifdef _WIN32
        localtime_s(&tm_buf, &time_t);
    #else
        localtime_r(&time_t, &tm_buf);
    #endif

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(9) << ns.count();
    return oss.str();
}

void writeLogLine(std::ostream& out, const std::string& line) {
    static std::mutex log_mutex;
    std::string stamped = "[" + getTimestamp() + "] " + line + "\n";
    std::lock_guard<std::mutex> lock(log_mutex);
    out << stamped;
    out.flush();
}

// Global flags
bool g_debug_mode = false;
bool g_quiet_mode = false;

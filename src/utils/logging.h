#ifndef LOGGING_H
#define LOGGING_H

#include <string>
#include <sstream>
#include <iostream>

// Global flags
extern bool g_debug_mode;
extern bool g_quiet_mode;

// Helper macros for timestamped output
// Each line is formatted first and written under a lock so worker threads don't interleave
#define LOG_COUT(msg) do { if (!g_quiet_mode) { std::ostringstream log_line_; log_line_ << msg; writeLogLine(std::cout, log_line_.str()); } } while (0)
#define LOG_CERR(msg) do { std::ostringstream log_line_; log_line_ << msg; writeLogLine(std::cerr, log_line_.str()); } while (0)
#define LOG_DEBUG(msg) do { if (g_debug_mode) { LOG_CERR("[DEBUG] " << msg); } } while (0)

// Get current timestamp as string in format [YYYY-MM-DD HH:MM:SS.nnnnnnnnn]
std::string getTimestamp();

// Write "[timestamp] line\n" to the stream as one unit
void writeLogLine(std::ostream& out, const std::string& line);

#endif // LOGGING_H

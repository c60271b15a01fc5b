#include <dimtol/logging/fmt_logger.hpp>

#include <chrono>
#include <cstdio>
#include <ctime>
#include <string>

#include <fmt/core.h>

namespace dimtol::logging {

static std::string now_hms() {
    using namespace std::chrono;
    std::time_t t = system_clock::to_time_t(system_clock::now());
    std::tm tm{};
#if defined(_WIN32)
    localtime_s(&tm, &t);
#else
    localtime_r(&t, &tm);
#endif
    return fmt::format("[{:02d}:{:02d}:{:02d}] ", tm.tm_hour, tm.tm_min, tm.tm_sec);
}

static void print_line(std::FILE* out, bool timestamps, std::string_view level, std::string_view msg) {
    fmt::print(out, "{}[{}] {}\n", timestamps ? now_hms() : std::string(), level, msg);
}

void FmtLogger::info(std::string_view msg) { print_line(stdout, timestamps_.load(), "INFO", msg); }
void FmtLogger::warn(std::string_view msg) { print_line(stdout, timestamps_.load(), "WARN", msg); }
void FmtLogger::error(std::string_view msg) {
    print_line(stderr, timestamps_.load(), "ERROR", msg);
    std::fflush(stderr);
}
void FmtLogger::debug(std::string_view msg) {
    if (enable_debug_.load()) print_line(stdout, timestamps_.load(), "DEBUG", msg);
}

} // namespace dimtol::logging

#pragma once

#include <dimtol/logging/logger.hpp>

#include <atomic>

namespace dimtol::logging {

// Writes "[HH:MM:SS] [LEVEL] msg" lines; ERROR goes to stderr, the rest to stdout.
class FmtLogger : public Logger {
public:
    explicit FmtLogger(bool enable_debug = false, bool timestamps = true)
        : enable_debug_(enable_debug), timestamps_(timestamps) {}
    void info(std::string_view msg) override;
    void warn(std::string_view msg) override;
    void error(std::string_view msg) override;
    void debug(std::string_view msg) override;

    void set_debug(bool v) { enable_debug_.store(v); }
    void set_timestamps(bool v) { timestamps_.store(v); }

private:
    std::atomic<bool> enable_debug_{false};
    std::atomic<bool> timestamps_{true};
};

} // namespace dimtol::logging

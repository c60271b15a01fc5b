#include <dimtol/logging/fmt_logger.hpp>

#include <atomic>

namespace dimtol::logging {

namespace {

FmtLogger& default_logger() {
    static FmtLogger logger;
    return logger;
}

std::atomic<Logger*> installed{nullptr};

} // namespace

Logger& sink() {
    Logger* logger = installed.load();
    return logger ? *logger : default_logger();
}

void set_sink(Logger* logger) {
    installed.store(logger);
}

} // namespace dimtol::logging

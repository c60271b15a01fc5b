#pragma once

#include <string_view>

namespace dimtol::logging {

class Logger {
public:
    virtual ~Logger() = default;
    virtual void info(std::string_view msg) = 0;
    virtual void warn(std::string_view msg) = 0;
    virtual void error(std::string_view msg) = 0;
    virtual void debug(std::string_view msg) = 0;
};

// Process-wide sink used for diagnostics the library emits on its own
// (contract violations). Defaults to an FmtLogger writing to stdout/stderr.
Logger& sink();

// Installs 'logger' as the sink. Passing nullptr restores the default.
// The caller keeps ownership and must keep the logger alive while installed.
void set_sink(Logger* logger);

} // namespace dimtol::logging

/*
 * Unit tests for the logging sink and error taxonomy
 * Copyright (C) 2025 Regis Araujo Melo
 * GPL-3.0-only
 */

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <csignal>
#include <string>
#include <vector>

#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <dimtol/error.hpp>
#include <dimtol/fixed_point.hpp>
#include <dimtol/logging/fmt_logger.hpp>
#include <dimtol/logging/logger.hpp>
#include <dimtol/tolerance.hpp>

using namespace dimtol;

namespace {

class RecordingLogger : public logging::Logger {
public:
    void info(std::string_view msg) override { lines.push_back("INFO " + std::string(msg)); }
    void warn(std::string_view msg) override { lines.push_back("WARN " + std::string(msg)); }
    void error(std::string_view msg) override { lines.push_back("ERROR " + std::string(msg)); }
    void debug(std::string_view msg) override { lines.push_back("DEBUG " + std::string(msg)); }

    std::vector<std::string> lines;
};

// Writes "LEVEL msg" lines to a file descriptor.
class FdLogger : public logging::Logger {
public:
    explicit FdLogger(int fd) : fd_(fd) {}

    void info(std::string_view msg) override { write_line("INFO ", msg); }
    void warn(std::string_view msg) override { write_line("WARN ", msg); }
    void error(std::string_view msg) override { write_line("ERROR ", msg); }
    void debug(std::string_view msg) override { write_line("DEBUG ", msg); }

private:
    void write_line(std::string_view level, std::string_view msg) {
        std::string line = std::string(level) + std::string(msg) + "\n";
        const char* p = line.data();
        std::size_t left = line.size();
        while (left > 0) {
            ssize_t n = ::write(fd_, p, left);
            if (n <= 0) return;
            p += n;
            left -= static_cast<std::size_t>(n);
        }
    }

    int fd_;
};

struct FatalRun {
    int signal = 0;
    std::string output;
};

// Runs fn in a child process whose sink writes to a pipe.
template<typename Fn>
FatalRun run_in_child(Fn&& fn) {
    FatalRun run;
    int fds[2];
    REQUIRE(::pipe(fds) == 0);
    pid_t pid = ::fork();
    REQUIRE(pid >= 0);
    if (pid == 0) {
        ::close(fds[0]);
        FdLogger logger(fds[1]);
        logging::set_sink(&logger);
        fn();
        ::_exit(0);
    }
    ::close(fds[1]);
    char buf[256];
    ssize_t n;
    while ((n = ::read(fds[0], buf, sizeof(buf))) > 0) {
        run.output.append(buf, static_cast<std::size_t>(n));
    }
    ::close(fds[0]);
    int status = 0;
    REQUIRE(::waitpid(pid, &status, 0) == pid);
    if (WIFSIGNALED(status)) run.signal = WTERMSIG(status);
    return run;
}

} // namespace

TEST_SUITE("Logging") {
    TEST_CASE("sink defaults to an FmtLogger") {
        logging::set_sink(nullptr);
        CHECK(dynamic_cast<logging::FmtLogger*>(&logging::sink()) != nullptr);
    }

    TEST_CASE("installed sink receives messages") {
        RecordingLogger rec;
        logging::set_sink(&rec);
        CHECK(&logging::sink() == &rec);

        logging::sink().error("contract violation: test");
        logging::sink().info("hello");
        REQUIRE(rec.lines.size() == 2);
        CHECK(rec.lines[0] == "ERROR contract violation: test");
        CHECK(rec.lines[1] == "INFO hello");

        logging::set_sink(nullptr);
        CHECK(&logging::sink() != &rec);
    }

    TEST_CASE("FmtLogger debug switch") {
        logging::FmtLogger logger(false, false);
        logger.debug("hidden");
        logger.set_debug(true);
        logger.debug("shown");
        logger.info("info line");
        logger.set_timestamps(true);
        logger.warn("stamped line");
    }
}

TEST_SUITE("Contract Violations") {
    TEST_CASE("plus below minus logs and aborts") {
        FatalRun run = run_in_child([] { (void)TWide::make(0, -5, 5); });
        CHECK(run.signal == SIGABRT);
        CHECK(run.output.find("ERROR contract violation") != std::string::npos);
    }

    TEST_CASE("division by zero logs and aborts") {
        FatalRun run = run_in_child([] { (void)(F32::ONE / F32::ZERO); });
        CHECK(run.signal == SIGABRT);
        CHECK(run.output.find("ERROR contract violation") != std::string::npos);
    }

    TEST_CASE("valid input exits normally") {
        FatalRun run = run_in_child([] { (void)TWide::make(0, 5, -5); });
        CHECK(run.signal == 0);
        CHECK(run.output.empty());
    }
}

TEST_SUITE("Errors") {
    TEST_CASE("kinds and names") {
        parse_error p("bad input");
        overflow_error o("too big");
        CHECK(p.kind() == error_kind::parse);
        CHECK(o.kind() == error_kind::overflow);
        CHECK(to_string(p.kind()) == "ParseError");
        CHECK(to_string(o.kind()) == "Overflow");
        CHECK(std::string(p.what()) == "bad input");
    }

    TEST_CASE("hierarchy") {
        CHECK_THROWS_AS(throw overflow_error("x"), error);
        CHECK_THROWS_AS(throw parse_error("x"), std::runtime_error);
    }
}

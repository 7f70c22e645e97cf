#include <catch2/catch.hpp>
#include <cuuid/log.hpp>
#include <cstdio>
#include <functional>
#include <string>

#ifdef _WIN32
#include <io.h>
#define dup _dup
#define dup2 _dup2
#define fileno _fileno
#define read _read
#define close _close
#define pipe(fds) _pipe(fds, 4096, 0)
#else
#include <unistd.h>
#endif

using namespace cuuid::log;

// Capture everything written to stderr while `fn` runs
static std::string capture_stderr(const std::function<void()>& fn) {
    std::fflush(stderr);
    int saved_stderr = dup(fileno(stderr));

    int pipefd[2];
    REQUIRE(pipe(pipefd) == 0);
    dup2(pipefd[1], fileno(stderr));
    close(pipefd[1]);

    fn();

    std::fflush(stderr);
    dup2(saved_stderr, fileno(stderr));
    close(saved_stderr);

    std::string output;
    char buf[1024];
    ssize_t n;
    while ((n = read(pipefd[0], buf, sizeof(buf))) > 0) {
        output.append(buf, static_cast<size_t>(n));
    }
    close(pipefd[0]);
    return output;
}

TEST_CASE("set_level / get_level roundtrip", "[log]") {
    for (Level lvl : {Trace, Debug, Info, Warn, Error}) {
        set_level(lvl);
        REQUIRE(get_level() == lvl);
    }
    set_level(Info);
}

TEST_CASE("level_name() returns correct strings", "[log]") {
    REQUIRE(std::string(level_name(Trace)) == "trace");
    REQUIRE(std::string(level_name(Debug)) == "debug");
    REQUIRE(std::string(level_name(Info)) == "info");
    REQUIRE(std::string(level_name(Warn)) == "warn");
    REQUIRE(std::string(level_name(Error)) == "error");
}

TEST_CASE("parse_level accepts names in any case", "[log]") {
    REQUIRE(parse_level("trace").value() == Trace);
    REQUIRE(parse_level("DEBUG").value() == Debug);
    REQUIRE(parse_level("Info").value() == Info);
    REQUIRE(parse_level("warning").value() == Warn);
    REQUIRE(parse_level("error").value() == Error);

    auto bad = parse_level("verbose");
    REQUIRE(bad.is_err());
    REQUIRE(bad.error().code == cuuid::CuuidError::Config);
}

TEST_CASE("set_color_enabled / is_color_enabled", "[log]") {
    set_color_enabled(true);
    REQUIRE(is_color_enabled() == true);

    set_color_enabled(false);
    REQUIRE(is_color_enabled() == false);
}

TEST_CASE("Messages below threshold are suppressed", "[log]") {
    set_level(Warn);
    set_color_enabled(false);

    auto output = capture_stderr([] {
        info("should not appear");
        debug("nor this");
    });
    REQUIRE(output.empty());

    set_level(Info);
}

TEST_CASE("Messages at or above threshold are emitted", "[log]") {
    set_level(Warn);
    set_color_enabled(false);

    auto output = capture_stderr([] {
        warn("this is a warning");
        error("this is an error");
    });
    REQUIRE(output.find("warn: this is a warning\n") != std::string::npos);
    REQUIRE(output.find("error: this is an error\n") != std::string::npos);

    set_level(Info);
}

TEST_CASE("Each level function tags its own level", "[log]") {
    set_level(Trace);
    set_color_enabled(false);

    auto output = capture_stderr([] {
        trace("t %d", 1);
        debug("d %d", 2);
        info("i %d", 3);
        warn("w %d", 4);
        error("e %d", 5);
    });
    REQUIRE(output == "trace: t 1\ndebug: d 2\ninfo: i 3\nwarn: w 4\nerror: e 5\n");

    set_level(Info);
}

TEST_CASE("Colored output wraps the level name", "[log]") {
    set_level(Info);
    set_color_enabled(true);

    auto output = capture_stderr([] {
        info("colored");
    });
    REQUIRE(output.find("\033[32minfo\033[0m: colored") != std::string::npos);

    set_level(Trace);
    auto gray = capture_stderr([] {
        trace("dim");
    });
    REQUIRE(gray.find("\033[90mtrace\033[0m: dim") != std::string::npos);
    set_level(Info);

    set_color_enabled(false);
}

TEST_CASE("Format string substitution", "[log]") {
    set_level(Info);
    set_color_enabled(false);

    auto output = capture_stderr([] {
        info("id %s has %d symbols", "00041061050R3GG28A1C60T3GF", 26);
    });
    REQUIRE(output.find("info: id 00041061050R3GG28A1C60T3GF has 26 symbols") != std::string::npos);
}

#pragma once
#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <string>
#include "fixedstep.hpp"
#include "logger.hpp"
#include "matchconfig.hpp"

struct Options {
    MatchConfig         match;
    FixedStep::Settings loop;
    std::uint32_t       seed = 0;
    bool                seeded = false;
    bool                realtime = false;
    int                 matches = 1;
    int                 snapshotEvery = 120;
    Logger::Level       logLevel = Logger::Level::Info;
    std::string         logFile;
    bool                showHelp = false;
};

inline const char* usageText() {
    return
        "usage: paddlesim [options]\n"
        "  --hz <n>              tick rate (default 60)\n"
        "  --frames <n>          stop after n ticks (default: when matches are done)\n"
        "  --maxCatchUp <n>      extra ticks per frame when behind (default 4)\n"
        "  --realtime            pace ticks to the wall clock\n"
        "  --seed <n>            random seed (default: random)\n"
        "  --matches <n>         matches to play (default 1)\n"
        "  --snapshot-every <n>  log a snapshot every n ticks, 0 = never (default 120)\n"
        "  --log-level <lvl>     trace|debug|info|warn|error|none (default info)\n"
        "  --log-file <path>     also append log lines to path\n"
        "  --width <px> --height <px> --paddle-height <px>\n"
        "  --ball-speed <px> --paddle-speed <px> --win-score <n>\n"
        "  --help\n";
}

namespace detail {

inline double parseDouble(const char* flag, const char* s) {
    char* e = nullptr;
    errno = 0;
    double v = std::strtod(s, &e);
    if (e == s || *e != 0 || errno == ERANGE)
        throw ConfigError(std::string(flag) + ": not a number: '" + s + "'");
    return v;
}

inline long parseLong(const char* flag, const char* s) {
    char* e = nullptr;
    errno = 0;
    long v = std::strtol(s, &e, 10);
    if (e == s || *e != 0 || errno == ERANGE)
        throw ConfigError(std::string(flag) + ": not an integer: '" + s + "'");
    return v;
}

inline int parseInt(const char* flag, const char* s, long lo, long hi) {
    long v = parseLong(flag, s);
    if (v < lo || v > hi)
        throw ConfigError(std::string(flag) + ": out of range: " + s);
    return static_cast<int>(v);
}

} // namespace detail

// Throws ConfigError on unknown flags, missing values or malformed numbers.
// Match values are range-checked later by MatchConfig::validate().
inline Options parseOptions(int argc, const char* const argv[]) {
    Options o;
    for (int i=1;i<argc;++i){
        const char* a = argv[i];
        auto value = [&]() -> const char* {
            if (i+1 >= argc) throw ConfigError(std::string(a) + ": missing value");
            return argv[++i];
        };
        if      (std::strcmp(a,"--help")==0 || std::strcmp(a,"-h")==0) o.showHelp = true;
        else if (std::strcmp(a,"--realtime")==0) o.realtime = true;
        else if (std::strcmp(a,"--hz")==0) o.loop.hz = detail::parseDouble(a, value());
        else if (std::strcmp(a,"--frames")==0) o.loop.maxFrames = detail::parseLong(a, value());
        else if (std::strcmp(a,"--maxCatchUp")==0) o.loop.maxCatchUp = detail::parseInt(a, value(), 0, 1000);
        else if (std::strcmp(a,"--seed")==0) {
            o.seed = static_cast<std::uint32_t>(detail::parseInt(a, value(), 0, 0x7fffffffL));
            o.seeded = true;
        }
        else if (std::strcmp(a,"--matches")==0) o.matches = detail::parseInt(a, value(), 1, 1000000);
        else if (std::strcmp(a,"--snapshot-every")==0) o.snapshotEvery = detail::parseInt(a, value(), 0, 1000000000);
        else if (std::strcmp(a,"--log-level")==0) {
            const char* v = value();
            auto lvl = Logger::parseLevel(v);
            if (!lvl) throw ConfigError(std::string("--log-level: unknown level '") + v + "'");
            o.logLevel = *lvl;
        }
        else if (std::strcmp(a,"--log-file")==0) o.logFile = value();
        else if (std::strcmp(a,"--width")==0) o.match.arenaWidth = detail::parseDouble(a, value());
        else if (std::strcmp(a,"--height")==0) o.match.arenaHeight = detail::parseDouble(a, value());
        else if (std::strcmp(a,"--paddle-height")==0) o.match.paddleHeight = detail::parseDouble(a, value());
        else if (std::strcmp(a,"--ball-speed")==0) o.match.baseBallSpeed = detail::parseDouble(a, value());
        else if (std::strcmp(a,"--paddle-speed")==0) o.match.paddleSpeed = detail::parseDouble(a, value());
        else if (std::strcmp(a,"--win-score")==0) o.match.winScore = detail::parseInt(a, value(), -1000000, 1000000);
        else throw ConfigError(std::string("unknown option '") + a + "'");
    }
    if (!o.showHelp) o.match.validate();
    return o;
}

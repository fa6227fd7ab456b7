#pragma once
#include <string>
#include <stdexcept>
#include <cstdint>
#include <spdlog/spdlog.h>

struct DemoOptions {
    size_t order = 2;
    bool char_mode = false;
    size_t generate = 5;
    size_t max_len = 40;
    uint64_t seed = 123;
    std::string prompt;
    spdlog::level::level_enum log_level = spdlog::level::info;
    std::string input;          // empty -> stdin
    bool help = false;
};

inline size_t parse_count(const std::string& flag, const std::string& v) {
    size_t used = 0;
    unsigned long long n = 0;
    try {
        n = std::stoull(v, &used);
    } catch (const std::exception&) {
        throw std::invalid_argument(flag + " expects a non-negative integer, got '" + v + "'");
    }
    if (used != v.size() || v[0] == '-') {
        throw std::invalid_argument(flag + " expects a non-negative integer, got '" + v + "'");
    }
    return static_cast<size_t>(n);
}

// spdlog::level::from_str() maps unknown names to "off"; only accept real level names.
inline spdlog::level::level_enum parse_log_level(const std::string& v) {
    if (v == "trace") return spdlog::level::trace;
    if (v == "debug") return spdlog::level::debug;
    if (v == "info") return spdlog::level::info;
    if (v == "warn" || v == "warning") return spdlog::level::warn;
    if (v == "error" || v == "err") return spdlog::level::err;
    if (v == "critical") return spdlog::level::critical;
    if (v == "off") return spdlog::level::off;
    throw std::invalid_argument("--log-level must be one of trace|debug|info|warn|error|critical|off, got '" + v + "'");
}

inline DemoOptions parse_args(int argc, const char* const* argv) {
    DemoOptions opt;
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        auto value = [&]() -> std::string {
            if (i + 1 >= argc) throw std::invalid_argument(a + " requires a value");
            return argv[++i];
        };
        if (a == "--order") opt.order = parse_count(a, value());
        else if (a == "--mode") {
            std::string m = value();
            if (m == "word") opt.char_mode = false;
            else if (m == "char") opt.char_mode = true;
            else throw std::invalid_argument("--mode must be 'word' or 'char'");
        }
        else if (a == "--generate") opt.generate = parse_count(a, value());
        else if (a == "--max-len") opt.max_len = parse_count(a, value());
        else if (a == "--seed") opt.seed = parse_count(a, value());
        else if (a == "--prompt") opt.prompt = value();
        else if (a == "--log-level") opt.log_level = parse_log_level(value());
        else if (a == "-h" || a == "--help") opt.help = true;
        else if (!a.empty() && a[0] == '-') throw std::invalid_argument("unknown option " + a);
        else opt.input = a;
    }
    return opt;
}

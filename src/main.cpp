#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

#include "HostLoop.hpp"
#include "conversions.hpp"
#include "evaluator.hpp"

#ifndef SANDSTEP_VERSION
#define SANDSTEP_VERSION "0.0.0"
#endif

static Value builtin_print(NativeCall& call) {
    std::string line;
    for (size_t i = 0; i < call.argc(); ++i) {
        if (i) line += ' ';
        line += to_display_string(call.arg(i));
    }
    std::cout << line << std::endl;
    return Value{};
}

static bool parse_count(const std::string& text, size_t& out) {
    char* end = nullptr;
    unsigned long long n = std::strtoull(text.c_str(), &end, 10);
    if (end == text.c_str() || *end != '\0' || n == 0) return false;
    out = static_cast<size_t>(n);
    return true;
}

static int run_file_mode(const std::string& filename, EngineOptions options, size_t steps_per_tick) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        std::cerr << "Error: Could not open file " << filename << std::endl;
        return 1;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    options.filename = filename;

    try {
        HostLoop loop(steps_per_tick);
        Evaluator engine(buffer.str(), [&loop](Evaluator& e, const ObjectPtr& global) {
            e.register_native(global, "print", builtin_print, 1);
            e.register_native(global, "alert", builtin_print, 1);
            loop.install_timer_natives(e);
        }, options);

        loop.drive(engine);
        if (engine.is_suspended_awaiting_external_event()) {
            std::cerr << "Error: script is still waiting for an external event" << std::endl;
            return 1;
        }
    } catch (const std::exception& e) {
        bool color = Color::supports_color();
        std::cerr << (color ? Color::bright_red : "") << "Error: " << (color ? Color::reset : "") << e.what() << std::endl;
        return 1;
    }
    return 0;
}

int main(int argc, char* argv[]) {
    auto print_usage = []() {
        std::cout << "Usage: sandstep [options] file\n"
                  << "Options:\n"
                  << "  -v, --version          Print version and exit\n"
                  << "  -h, --help             Show this help message\n"
                  << "  --steps-per-tick N     Evaluation steps per event-loop tick (default 64)\n"
                  << "  --max-depth N          Maximum guest call depth\n"
                  << "  --trace                Log every evaluation step to stderr\n"
                  << "\n"
                  << "Environment: SANDSTEP_MAX_CALL_DEPTH, SANDSTEP_LOG_LEVEL, SANDSTEP_STRICT_AWAIT\n";
    };

    EngineOptions options = EngineOptions::from_env();
    size_t steps_per_tick = 64;
    std::string filename;
    bool seen_double_dash = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (seen_double_dash || arg.empty() || arg[0] != '-') {
            if (!filename.empty()) {
                std::cerr << "sandstep: only one script may be given\n";
                return 1;
            }
            filename = arg;
            continue;
        }

        if (arg == "--") {
            seen_double_dash = true;
        } else if (arg == "-v" || arg == "--version") {
            std::cout << "sandstep v" << SANDSTEP_VERSION << std::endl;
            return 0;
        } else if (arg == "-h" || arg == "--help") {
            print_usage();
            return 0;
        } else if (arg == "--trace") {
            options.log_level = LogLevel::Trace;
        } else if (arg == "--steps-per-tick" || arg == "--max-depth") {
            size_t n = 0;
            if (i + 1 >= argc || !parse_count(argv[i + 1], n)) {
                std::cerr << "sandstep: " << arg << " needs a positive number\n";
                return 1;
            }
            ++i;
            if (arg == "--steps-per-tick") {
                steps_per_tick = n;
            } else {
                options.max_call_depth = n;
            }
        } else {
            std::cerr << "sandstep: unknown option '" << arg << "'\n";
            std::cerr << "Try 'sandstep --help' for more information.\n";
            return 1;
        }
    }

    if (filename.empty()) {
        print_usage();
        return 1;
    }
    return run_file_mode(filename, options, steps_per_tick);
}

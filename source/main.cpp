#include <charconv>
#include <cstddef>
#include <cstdlib>
#include <exception>
#include <fstream>
#include <iostream>
#include <span>
#include <string>
#include <string_view>
#include <system_error>

#include <error/error.hpp>
#include <eval/evaluator.hpp>
#include <fmt/format.h>
#include <lexer/lexer.hpp>
#include <lexer/token.hpp>
#include <lexer/token_type.hpp>

namespace
{
constexpr auto prompt = ">> ";

auto show_error(const error& err)
{
    std::cerr << "Whoops! We ran into some " << err.kind() << " error: \n  " << err.what() << '\n';
}

struct command_line_args
{
    bool help {};
    bool debug {};
    evaluate_options options {};
    std::string_view file;
};

auto get_logged_in_user() -> std::string
{
    // NOLINTBEGIN(concurrency-mt-unsafe)
    const char* username = getenv("USER");

    if (username == nullptr) {
        username = getenv("USERNAME");
    }
    // NOLINTEND(concurrency-mt-unsafe)

    return (username != nullptr) ? std::string(username) : "Unknown";
}

[[noreturn]] auto show_usage(std::string_view program, std::string_view error_msg = {})
{
    auto exit_code = EXIT_SUCCESS;
    if (!error_msg.empty()) {
        fmt::print("Error: {}\n", error_msg);
        exit_code = EXIT_FAILURE;
    }
    fmt::print("Usage: {} [-d] [-h] [-l <max-depth>] [<file>]\n\n", program);
    // NOLINTBEGIN(concurrency-mt-unsafe)
    exit(exit_code);
    // NOLINTEND(concurrency-mt-unsafe)
}

auto parse_max_depth(std::string_view program, std::string_view arg) -> std::size_t
{
    std::size_t depth {};
    const auto* end = arg.data() + arg.size();
    const auto [ptr, ec] = std::from_chars(arg.data(), end, depth);
    if (ec != std::errc {} || ptr != end || depth == 0) {
        show_usage(program, fmt::format("invalid maximum depth {}", arg));
    }
    return depth;
}

auto parse_command_line(std::string_view program, int argc, char** argv) -> command_line_args
{
    command_line_args opts {};
    const auto args = std::span(argv, static_cast<size_t>(argc));
    for (auto itr = args.begin(); itr != args.end(); ++itr) {
        const std::string_view arg = *itr;
        if (arg.empty()) {
            continue;
        }
        if (arg[0] == '-' && arg.size() == 1) {
            show_usage(program, fmt::format("invalid option {}", arg));
        }
        if (arg[0] == '-' && arg.size() > 1) {
            switch (arg[1]) {
                case 'h':
                    opts.help = true;
                    break;
                case 'd':
                    opts.debug = true;
                    break;
                case 'l':
                    if (++itr == args.end()) {
                        show_usage(program, "option -l requires a value");
                    }
                    opts.options.max_depth = parse_max_depth(program, *itr);
                    break;
                default: {
                    show_usage(program, fmt::format("invalid option {}", arg));
                }
            }
        } else {
            if (opts.file.empty()) {
                opts.file = arg;
            } else {
                fmt::print("ignoring file argument {}, already have one set.\n", arg);
            }
        }
    }
    return opts;
}

void debug_tokens(std::string_view input)
{
    std::cout << "Tokens:\n";
    auto lxr = lexer {input};
    for (auto tok = lxr.next_token(); tok.type != token_type::eof; tok = lxr.next_token()) {
        fmt::print("  {}\n", tok);
    }
}

// prints the result or reports the error, returns whether evaluation succeeded
auto run_line(std::string_view input, const command_line_args& opts) -> bool
{
    try {
        if (opts.debug) {
            debug_tokens(input);
        }
        fmt::print("{}\n", evaluate(input, opts.options));
    } catch (const error& err) {
        show_error(err);
        return false;
    }
    return true;
}

auto run_file(const command_line_args& opts) -> int
{
    std::ifstream ifs(std::string {opts.file});
    if (!ifs) {
        std::cerr << "ERROR: could not open file: " << opts.file << '\n';
        return 1;
    }
    auto failed = false;
    auto input = std::string {};
    while (getline(ifs, input)) {
        if (input.empty()) {
            continue;
        }
        if (!run_line(input, opts)) {
            failed = true;
        }
    }
    return failed ? 1 : 0;
}

auto run_repl(const command_line_args& opts) -> int
{
    std::cout << "Hello " << get_logged_in_user() << ". This is letlisp, it understands add, mult and let.\n";
    std::cout << "Feel free to type in expressions\n";
    auto show_prompt = []() { std::cout << prompt << std::flush; };
    auto input = std::string {};
    show_prompt();
    while (getline(std::cin, input)) {
        if (!input.empty()) {
            run_line(input, opts);
        }
        show_prompt();
    }
    return 0;
}
}  // namespace

auto main(int argc, char* argv[]) -> int
{
    auto program = std::string_view(*argv);
    auto opts = parse_command_line(program, argc - 1, ++argv);
    if (opts.help) {
        show_usage(program);
    }
    try {
        if (!opts.file.empty()) {
            return run_file(opts);
        }
        return run_repl(opts);

    } catch (const std::exception& e) {
        std::cerr << "Caught an exception: " << e.what() << '\n';
        return 1;
    }
}

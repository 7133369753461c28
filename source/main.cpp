#include <cstddef>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <fstream>
#include <iostream>
#include <iterator>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <ast/program.hpp>
#include <eval/evaluator.hpp>
#include <fmt/format.h>
#include <lexer/lexer.hpp>
#include <object/object.hpp>
#include <parser/parser.hpp>

namespace
{
constexpr auto prompt = ">> ";

constexpr auto macaque_face = R"r(
       .-"-.
     _/.-.-.\_
    ( ( o o ) )
     |/  "  \|
      \'---'/
      /`"""`\
)r";

auto macaque_business()
{
    fmt::print(stderr, "{}", macaque_face);
    fmt::print(stderr, "Woops! We ran into some macaque business here!\n");
}

auto print_parse_errors(const std::vector<std::string>& errors)
{
    macaque_business();
    fmt::print(stderr, "  parser errors:\n");
    for (const auto& error : errors) {
        fmt::print(stderr, "    {}\n", error);
    }
}

struct command_line_args
{
    bool help {};
    bool debug {};
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
    fmt::print("Usage: {} [-d] [-h] [<file>]\n\n", program);
    fmt::print("  -d  print the parsed program before its result\n");
    fmt::print("  -h  show this help\n\n");
    fmt::print("Without <file> an interactive session is started.\n");
    // NOLINTBEGIN(concurrency-mt-unsafe)
    exit(exit_code);
    // NOLINTEND(concurrency-mt-unsafe)
}

auto parse_command_line(std::string_view program, int argc, char** argv) -> command_line_args
{
    command_line_args opts {};
    for (std::string_view arg : std::span(argv, static_cast<std::size_t>(argc))) {
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

/// Parses and evaluates one source text. Returns false on parse errors.
auto run_source(std::string_view source, const command_line_args& opts) -> bool
{
    auto prsr = parser {lexer {source}};
    auto prgrm = prsr.parse_program();
    if (!prsr.errors().empty()) {
        print_parse_errors(prsr.errors());
        return false;
    }
    if (opts.debug) {
        std::cout << prgrm->string() << '\n';
    }
    evaluator eval;
    const auto* result = eval.evaluate(*prgrm);
    if (result != nullptr) {
        std::cout << result->inspect() << '\n';
    }
    return true;
}

auto run_file(const command_line_args& opts) -> int
{
    std::ifstream ifs(std::string {opts.file});
    if (!ifs) {
        fmt::print(stderr, "ERROR: could not open file: {}\n", opts.file);
        return 1;
    }
    const std::string contents {(std::istreambuf_iterator<char>(ifs)), (std::istreambuf_iterator<char>())};
    return run_source(contents, opts) ? 0 : 1;
}

auto run_repl(const command_line_args& opts) -> int
{
    std::cout << "Hello " << get_logged_in_user() << ". This is the macaque programming language.\n";
    std::cout << "Feel free to type in commands\n";
    auto show_prompt = []() { std::cout << prompt << std::flush; };
    auto input = std::string {};
    show_prompt();
    while (getline(std::cin, input)) {
        run_source(input, opts);
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
        macaque_business();
        fmt::print(stderr, "Caught an exception: {}\n", e.what());
        return 1;
    }
}

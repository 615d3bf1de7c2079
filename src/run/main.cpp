#include "cxxopts.hpp"
#include "fmt/format.h"
#include "lusitano/compiler.hpp"

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>
#include <variant>

#include <sys/wait.h>
#include <unistd.h>

namespace {

struct OptionsError {
    std::string message;
};

struct ShowHelp {
    std::string content;
};

struct Options {
    std::string input;
    std::optional<std::string> output;
    bool dump_tokens = false;
    bool dump_ast = false;
    bool dump_symbols = false;
    bool run = false;
    std::string python = "python3";
};

using OptionsResult = std::variant<Options, ShowHelp, OptionsError>;

OptionsResult parse_options(int argc, char** argv);
std::optional<std::string> compile(std::string content, const Options& options);
int run(const std::string& code, const std::optional<std::string>& script, const std::string& python);
std::string read_file_contents(const char* path);
void write_file_contents(const char* path, const std::string& content);

} // namespace

int main(int argc, char* argv[]) {
    try {
        OptionsResult options_result = parse_options(argc, argv);
        if (auto err = std::get_if<OptionsError>(&options_result)) {
            fmt::print(stderr, "{}\n", err->message);
            return 1;
        }
        if (auto help = std::get_if<ShowHelp>(&options_result)) {
            fmt::print(stdout, "{}\n", help->content);
            return 0;
        }

        Options options = std::get<Options>(options_result);
        std::string content;
        try {
            content = read_file_contents(options.input.c_str());
        } catch (const std::exception& e) {
            fmt::print(stderr, "Failed to read '{}': {}\n", options.input, e.what());
            return 1;
        }

        std::optional<std::string> code;
        try {
            code = compile(std::move(content), options);
        } catch (const std::exception& e) {
            fmt::print(stderr, "Compilation failed: {}\n", e.what());
            return 1;
        }

        if (!code)
            return 1;

        if (options.output) {
            try {
                write_file_contents(options.output->c_str(), *code);
            } catch (const std::exception& e) {
                fmt::print(stderr, "Failed to write '{}': {}\n", *options.output, e.what());
                return 1;
            }
        } else if (!options.run) {
            fmt::print(stdout, "{}", *code);
        }

        if (options.run)
            return run(*code, options.output, options.python);
    } catch (const std::exception& e) {
        fmt::print(stderr, "Fatal error: {}\n", e.what());
        return 1;
    }
    return 0;
}

namespace {

OptionsResult parse_options(int argc, char** argv) {
    cxxopts::Options options(argv[0], "compiles lusitano programs to python");
    options.positional_help("<input>");

    /* clang-format off */
    options.add_options()
        ("o,output", "write the generated python code to this file", cxxopts::value<std::string>(), "<file>")
        ("dump-tokens", "print the token list", cxxopts::value<bool>())
        ("dump-ast", "print the abstract syntax tree as json", cxxopts::value<bool>())
        ("dump-symbols", "print the scopes and symbols", cxxopts::value<bool>())
        ("run", "execute the generated program", cxxopts::value<bool>())
        ("python", "the python interpreter used by --run", cxxopts::value<std::string>()->default_value("python3"), "<exe>")
        ("input", "input file", cxxopts::value<std::string>(), "<file>")
        ("h,help", "show this message", cxxopts::value<bool>());
    /* clang-format on */
    options.parse_positional("input");

    // Work around missing default constructor
    std::optional<cxxopts::ParseResult> opt_result;
    try {
        opt_result.emplace(options.parse(argc, argv));
    } catch (const cxxopts::OptionException& e) {
        return OptionsError{fmt::format("Error: {}", e.what())};
    }

    auto& result = *opt_result;
    if (result.count("help")) {
        return ShowHelp{options.help()};
    }

    Options parsed_options;
    if (auto input = result["input"]; input.count()) {
        parsed_options.input = input.as<std::string>();
    } else {
        return OptionsError{"Error: input file is required"};
    }

    if (auto output = result["output"]; output.count())
        parsed_options.output = output.as<std::string>();
    parsed_options.dump_tokens = result["dump-tokens"].as<bool>();
    parsed_options.dump_ast = result["dump-ast"].as<bool>();
    parsed_options.dump_symbols = result["dump-symbols"].as<bool>();
    parsed_options.run = result["run"].as<bool>();
    parsed_options.python = result["python"].as<std::string>();
    return parsed_options;
}

// Returns the generated code if compilation succeeded. Diagnostics are printed to stderr.
std::optional<std::string> compile(std::string content, const Options& options) {
    lusitano::api::CompileSettings settings;
    if (options.dump_tokens)
        settings.attachments.push_back(lusitano::api::Attachment::Tokens);
    if (options.dump_ast)
        settings.attachments.push_back(lusitano::api::Attachment::Ast);
    if (options.dump_symbols)
        settings.attachments.push_back(lusitano::api::Attachment::Symbols);
    settings.message_callback = [](const lusitano::api::CompilerMessage& message) {
        fmt::print(stderr, "{} {} {}:{}: {}\n", lusitano::api::phase_str(message.phase),
            lusitano::api::severity_str(message.severity), message.line, message.column,
            message.text);
    };

    auto result = lusitano::api::compile(options.input, std::move(content), settings);

    // Print as much as possible, regardless of errors
    for (const auto* opt : {&result.tokens, &result.ast, &result.symbols}) {
        if (opt->has_value())
            fmt::print("{}\n\n", **opt);
    }

    if (!result.success) {
        fmt::print(stderr, "Compilation of '{}' failed.\n", options.input);
        return {};
    }
    return std::move(result.code);
}

// Executes the program with the python interpreter. The program is read from `script` if
// it was written to an output file, otherwise from a temporary file. Standard input stays
// connected to the terminal so that `leia` works.
int run(const std::string& code, const std::optional<std::string>& script, const std::string& python) {
    namespace fs = std::filesystem;

    std::optional<fs::path> temp_file;
    fs::path path;
    if (script) {
        path = *script;
    } else {
        std::error_code ec;
        auto dir = fs::temp_directory_path(ec);
        if (ec) {
            fmt::print(stderr, "Failed to find a temporary directory: {}\n", ec.message());
            return 1;
        }

        path = dir / fmt::format("lusitano-{}.py", static_cast<long>(getpid()));
        try {
            write_file_contents(path.c_str(), code);
        } catch (const std::exception& e) {
            fmt::print(stderr, "Failed to write '{}': {}\n", path.string(), e.what());
            return 1;
        }
        temp_file = path;
    }

    std::fflush(stdout);
    const std::string command = fmt::format("\"{}\" \"{}\"", python, path.string());
    const int status = std::system(command.c_str());

    if (temp_file) {
        std::error_code ec;
        fs::remove(*temp_file, ec);
    }

    if (status == -1) {
        fmt::print(stderr, "Failed to start '{}': {}\n", python,
            std::system_category().message(errno));
        return 1;
    }
    return WIFEXITED(status) ? WEXITSTATUS(status) : 1;
}

std::string read_file_contents(const char* path) {
    struct file_handle {
        FILE* fd = nullptr;

        ~file_handle() {
            if (fd)
                std::fclose(fd);
        }
    } file;

    file.fd = std::fopen(path, "rb");
    if (!file.fd) {
        throw std::system_error(errno, std::system_category());
    };

    // Use the file size as a hint for the required memory (the file size might change while we're reading it).
    std::string result;
    {
        auto size = std::filesystem::file_size(path);
        if (size > result.max_size()) {
            throw std::runtime_error("file is too large");
        }
        result.reserve(size);
    }

    // Read file chunk by chunk.
    unsigned char buffer[4096];
    while (1) {
        size_t read = std::fread(buffer, 1, sizeof(buffer), file.fd);
        if (ferror(file.fd)) {
            throw std::system_error(errno, std::system_category());
        }

        result.append(buffer, buffer + read);
        if (feof(file.fd)) {
            break;
        }
    }

    return result;
}

void write_file_contents(const char* path, const std::string& content) {
    FILE* fd = std::fopen(path, "wb");
    if (!fd)
        throw std::system_error(errno, std::system_category());

    const size_t written = std::fwrite(content.data(), 1, content.size(), fd);
    const int close_result = std::fclose(fd);
    if (written != content.size() || close_result != 0)
        throw std::system_error(errno, std::system_category());
}

} // namespace

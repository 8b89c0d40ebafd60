#include "CommandLine.h"

#include <cctype>
#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <getopt.h>
#include <utility>

namespace LTextSanitizer {

namespace {

const struct option kLongOptions[] = {
    {"buffer-size", required_argument, nullptr, 'b'},
    {"ascii-only",  no_argument,       nullptr, 'a'},
    {"verbose",     no_argument,       nullptr, 'v'},
    {"help",        no_argument,       nullptr, 'h'},
    {"version",     no_argument,       nullptr, 'V'},
    {nullptr, 0, nullptr, 0},
};

// Plain decimal only: strtoull alone would accept signs, spaces and hex.
bool parseSize(const char* text, std::size_t& out) {
    if (text == nullptr || *text == '\0') return false;
    for (const char* p = text; *p; ++p) {
        if (!std::isdigit(static_cast<unsigned char>(*p))) return false;
    }
    errno = 0;
    const unsigned long long v = std::strtoull(text, nullptr, 10);
    if (errno == ERANGE || v > static_cast<unsigned long long>(SIZE_MAX)) return false;
    out = static_cast<std::size_t>(v);
    return true;
}

// getopt leaves the offending short option in optopt, unknown long ones only
// in argv. A long option missing its argument reports its short letter too, so
// the word the user typed is preferred when it names that same option.
std::string optionName(char* argv[]) {
    const char* last = optind > 0 ? argv[optind - 1] : "";
    if (optopt == 0) return last;
    if (std::strncmp(last, "--", 2) == 0 && last[2] != '\0') {
        const std::size_t len = std::strlen(last + 2);
        for (const struct option* o = kLongOptions; o->name != nullptr; ++o) {
            if (o->val == optopt && std::strncmp(o->name, last + 2, len) == 0) return last;
        }
    }
    return std::string("-") + static_cast<char>(optopt);
}

ParseResult invalid(std::string msg) {
    ParseResult r;
    r.status = ParseResult::Status::Invalid;
    r.message = std::move(msg);
    return r;
}

} // namespace

ParseResult parseCommandLine(int argc, char* argv[]) {
    ParseResult result;
    CliOptions& opts = result.options;

    optind = 0;   // glibc: full reinitialization
    opterr = 0;

    int opt;
    while ((opt = getopt_long(argc, argv, ":b:avhV", kLongOptions, nullptr)) != -1) {
        switch (opt) {
        case 'b':
            if (!parseSize(optarg, opts.pipeline.bufferSize)) {
                return invalid(std::string("invalid buffer size '") + optarg + "'");
            }
            break;
        case 'a':
            opts.pipeline.asciiOnly = true;
            break;
        case 'v':
            ++opts.verbosity;
            break;
        case 'h':
            result.status = ParseResult::Status::Help;
            return result;
        case 'V':
            result.status = ParseResult::Status::Version;
            return result;
        case ':':
            return invalid("option '" + optionName(argv) + "' requires an argument");
        default:
            return invalid("unknown option '" + optionName(argv) + "'");
        }
    }

    if (argc - optind > 1) {
        return invalid("at most one input file may be given");
    }
    if (optind < argc) {
        opts.inputPath = argv[optind];
    }
    return result;
}

std::string usage(const char* prog) {
    std::string u = "Usage: ";
    u += prog;
    u += " [-a] [-b BUFFER_SIZE] [-v]... [FILE]\n"
         "Copy FILE (or stdin) to stdout, keeping only well-formed UTF-8.\n"
         "\n"
         "  -a, --ascii-only         keep only printable ASCII, tab and newline\n"
         "  -b, --buffer-size SIZE   working buffer size in bytes (default 128, 4..16384)\n"
         "  -v, --verbose            log more to stderr (repeatable)\n"
         "  -h, --help               show this help and exit\n"
         "  -V, --version            show version and exit\n";
    return u;
}

} // namespace LTextSanitizer

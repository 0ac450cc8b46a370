#include <fmt/format.h>

#include <cctype>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <limits>
#include <stdexcept>
#include <string>

#include "anf.h"

// anf_rule RULE N [--width 8|16|32|64]
//
// Reads a decimal rule number (packed truth table of an N-variable Boolean function, e.g. an elementary cellular automaton rule with N = 3),
// computes its ANF coefficient table and prints it as a number and as a bit string, index 0 first.
//
// Exit status: 0 on success, 1 if the rule is not valid for N variables, 2 on usage errors.

namespace {

void usage(const char* prog){
    fmt::print(stderr, "usage: {} RULE N [--width 8|16|32|64]\n", prog);
}

// Parse a whole argument as a non-negative decimal integer.  Rejects signs, whitespace, prefixes, trailing characters and overflow.
template <typename T>
bool parse_decimal(const char* arg, T& value){
    if (!std::isdigit(static_cast<unsigned char>(arg[0]))) return false;
    try {
        std::size_t pos = 0;
        const unsigned long long v = std::stoull(arg, &pos, 10);
        if (arg[pos] != '\0' || v > static_cast<unsigned long long>(std::numeric_limits<T>::max())) return false;
        value = static_cast<T>(v);
        return true;
    } catch (const std::out_of_range&) {
        return false;
    }
}

template <typename U>
int run(uint64_t rule, int n, int width){
    if (rule > uint64_t(U(~U(0)))){
        fmt::print(stderr, "error: rule {} does not fit in {} bits\n", rule, width);
        return 1;
    }
    U coef = 0;
    const AnfStatus st = anf_transform_packed_checked(U(rule), n, coef);
    if (st != AnfStatus::Ok){
        fmt::print(stderr, "error: rule {} with n = {}: {}\n", rule, n, anf_status_str(st));
        return 1;
    }

    std::string bits;
    for (int i = 0; i < (1 << n); ++i) bits.push_back(test_bit(coef, i) ? '1' : '0');

    fmt::print("rule {}  n = {}  width = {}\n", rule, n, width);
    fmt::print("anf  {}\n", uint64_t(coef));
    fmt::print("coef {}\n", bits);
    return 0;
}

} // namespace

int main(int argc, char** argv){
    if (argc != 3 && argc != 5){ usage(argv[0]); return 2; }

    uint64_t rule = 0;
    int n = 0;
    int width = 64;
    const bool width_ok = argc == 3 || (std::strcmp(argv[3], "--width") == 0 && parse_decimal(argv[4], width));
    if (!parse_decimal(argv[1], rule) || !parse_decimal(argv[2], n) || !width_ok){
        fmt::print(stderr, "error: arguments must be non-negative decimal integers\n");
        usage(argv[0]);
        return 2;
    }

    switch (width){
        case 8:  return run<uint8_t>(rule, n, width);
        case 16: return run<uint16_t>(rule, n, width);
        case 32: return run<uint32_t>(rule, n, width);
        case 64: return run<uint64_t>(rule, n, width);
        default:
            fmt::print(stderr, "error: unsupported width {}\n", width);
            usage(argv[0]);
            return 2;
    }
}

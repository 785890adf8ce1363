#include "farfalle/deck.hpp"
#include "farfalle/util.hpp"

#include <vector>
#include <string>
#include <fstream>
#include <iostream>
#include <cstdlib>
#include <span>
#include <cstdint>

using namespace farfalle;

static void die(const char* msg) {
    std::cerr << msg << "\n";
    std::exit(1);
}

static std::int64_t parse_len(const char* s) {
    char* end = nullptr;
    long long v = std::strtoll(s, &end, 10);
    if (end == s || *end != '\0') die("bad --out-bytes");
    return static_cast<std::int64_t>(v);
}

static void secure_zero(void* p, std::size_t n) {
    volatile unsigned char* v = static_cast<volatile unsigned char*>(p);
    while (n--) *v++ = 0;
}

int main(int argc, char** argv) {
    std::string key;
    std::vector<std::string> msgs;
    std::string infile;
    std::int64_t out_bytes = 32;
    PrfParams params{};

    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        auto need_val = [&](int& i)->const char* {
            if (i + 1 >= argc) die("missing value for flag");
            return argv[++i];
        };
        if (a == "--key")            key = need_val(i);
        else if (a == "--msg")       msgs.emplace_back(need_val(i));
        else if (a == "--in")        infile = need_val(i);
        else if (a == "--out-bytes") out_bytes = parse_len(need_val(i));
        else if (a == "--xoofff")    params.instance = Instance::Xoofff;
        else die("unknown flag");
    }

    if (key.empty() || (msgs.empty() && infile.empty())) {
        die("usage:\n"
            "  ./farfalle_demo --key K --msg \"part\" [--msg \"part\" ...] [--out-bytes N] [--xoofff]\n"
            "  ./farfalle_demo --key K --in file.bin [--out-bytes N] [--xoofff]");
    }

    std::vector<std::uint8_t> file_part;
    if (!infile.empty()) {
        std::ifstream f(infile, std::ios::binary);
        if (!f) die("cannot open --in file");
        file_part.assign((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    }

    std::vector<std::uint8_t> out;
    try {
        KeyedSpongePRF prf(as_bytes(key), params);
        for (const auto& m : msgs) prf.absorb(as_bytes(m));
        if (!infile.empty()) prf.absorb(file_part);
        out = prf.finalize_and_squeeze(out_bytes);
    } catch (const std::invalid_argument& e) {
        die(e.what());
    }

    std::cout << hex_lower(out) << "\n";

    secure_zero(key.data(), key.size());
    if (!file_part.empty()) secure_zero(file_part.data(), file_part.size());

    return 0;
}

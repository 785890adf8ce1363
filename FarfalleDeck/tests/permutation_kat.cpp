#include "keccak_p.hpp"
#include "xoodoo.hpp"
#include "farfalle/util.hpp"

#include <array>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>
#include <cstdint>

using namespace farfalle;

static bool report(const std::string& name, bool ok, const std::string& expected = {}, const std::string& got = {}) {
    std::cout << (ok ? "[OK] " : "[FAIL] ") << name << "\n";
    if (!ok && !expected.empty()) {
        std::cout << "  expected: " << expected << "\n";
        std::cout << "  got     : " << got << "\n";
    }
    return ok;
}

// SHA3-256 over Keccak-f[1600]: rate 136, domain byte 0x06.
static std::string sha3_256_hex(std::string_view msg) {
    constexpr std::size_t rate = 136;
    KeccakState1600 st;
    std::vector<std::uint8_t> data = to_bytes(msg);
    data.push_back(0x06);
    while (data.size() % rate != 0) data.push_back(0x00);
    data.back() |= 0x80;
    for (std::size_t off = 0; off < data.size(); off += rate) {
        st.xor_bytes(0, std::span<const std::uint8_t>(data.data() + off, rate));
        keccak_f1600(st);
    }
    std::array<std::uint8_t, 32> out{};
    st.read_bytes(0, out);
    return hex_lower(out);
}

static bool chk_xoodoo(const std::string& name, unsigned rounds, const std::array<std::uint32_t, 12>& expected) {
    XoodooState st;
    xoodoo(st, rounds);
    const bool ok = (st.lanes() == expected);
    std::string got_s, exp_s;
    if (!ok) {
        std::array<std::uint8_t, XoodooState::SIZE> g{};
        st.read_bytes(0, g);
        got_s = hex_lower(g);
        XoodooState e;
        e.lanes() = expected;
        e.read_bytes(0, g);
        exp_s = hex_lower(g);
    }
    return report(name, ok, exp_s, got_s);
}

template <typename F>
static bool chk_throws(const std::string& name, F&& f) {
    try {
        f();
    } catch (const std::invalid_argument&) {
        return report(name, true);
    }
    return report(name, false);
}

int main() {
    bool ok = true;

    {
        const std::string want = "a7ffc6f8bf1ed76651c14756a061d662f580ff4de43b49fa82d80a4b80f8434a";
        const std::string got = sha3_256_hex("");
        ok &= report("keccak-f[1600]: SHA3-256(\"\")", got == want, want, got);
    }
    {
        const std::string want = "3a985da74fe225b2045c172d6bd390bd855f086e3e9d525b46bfe24511431532";
        const std::string got = sha3_256_hex("abc");
        ok &= report("keccak-f[1600]: SHA3-256(\"abc\")", got == want, want, got);
    }

    // Zero-state vectors from XKCP.
    ok &= chk_xoodoo("xoodoo[12] on zero state", 12, {
        0x89D5D88D, 0xA963FCBF, 0x1B232D19, 0xFFA5A014, 0x36B18106, 0xAFC7C1FE,
        0xAEE57CBE, 0xA77540BD, 0x2E86E870, 0xFEF5B7C9, 0x8B4FADF2, 0x5E4F4062,
    });
    ok &= chk_xoodoo("xoodoo[6] on zero state", 6, {
        0x28C9CEA3, 0xAD204F60, 0x2EC3D0D6, 0xF050C7C5, 0x08DC1225, 0x61992304,
        0x9E0D402D, 0x42D59B9B, 0x1E6114FC, 0x186EB697, 0x35DBBC7F, 0xA1F9104E,
    });

    {
        KeccakState1600 a, b, c;
        keccak_p1600(a, 6);
        keccak_p1600(b, 6);
        keccak_f1600(c);
        ok &= report("keccak-p[1600, 6] deterministic and distinct from keccak-f", a == b && !(a == c));
    }

    {
        KeccakState1600 st;
        const std::uint8_t bytes[3] = {0x01, 0x02, 0x03};
        st.write_bytes(7, bytes);
        const bool lanes_ok = st.lanes()[0] == 0x0100000000000000ULL && st.lanes()[1] == 0x0000000000000302ULL;
        st.zero_from(8);
        const bool zero_ok = st.lanes()[0] == 0x0100000000000000ULL && st.lanes()[1] == 0;
        ok &= report("state bytes map little endian onto lanes", lanes_ok && zero_ok);
    }

    ok &= chk_throws("keccak_p1600 rejects 0 rounds", [] { KeccakState1600 s; keccak_p1600(s, 0); });
    ok &= chk_throws("keccak_p1600 rejects 25 rounds", [] { KeccakState1600 s; keccak_p1600(s, 25); });
    ok &= chk_throws("xoodoo rejects 13 rounds", [] { XoodooState s; xoodoo(s, 13); });

    {
        bool threw = false;
        try {
            XoodooState s;
            std::array<std::uint8_t, 2> out{};
            s.read_bytes(XoodooState::SIZE - 1, out);
        } catch (const std::out_of_range&) {
            threw = true;
        }
        ok &= report("state access past the end throws", threw);
    }

    return ok ? 0 : 1;
}

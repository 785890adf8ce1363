#include "farfalle/deck.hpp"
#include "farfalle/util.hpp"
#include "instances.hpp"

#include <algorithm>
#include <iostream>
#include <string>
#include <vector>
#include <span>
#include <utility>
#include <cstdint>

using namespace farfalle;

using Bytes = std::vector<std::uint8_t>;
using Parts = std::vector<std::span<const std::uint8_t>>;

static int g_fail_count = 0;

static bool report(const std::string& name, bool ok) {
    std::cout << (ok ? "[OK] " : "[FAIL] ") << name << "\n";
    if (!ok) ++g_fail_count;
    return ok;
}

template <typename E, typename F>
static void expect_throw(const std::string& name, F&& f) {
    try {
        f();
    } catch (const E&) {
        report(name, true);
        return;
    } catch (const std::exception& e) {
        std::cout << "  unexpected exception: " << e.what() << "\n";
    }
    report(name, false);
}

static Bytes pattern(std::size_t n, std::uint8_t seed) {
    Bytes out(n);
    for (std::size_t i = 0; i < n; ++i) out[i] = static_cast<std::uint8_t>(seed + 31 * i);
    return out;
}

static bool is_prefix(const Bytes& shorter, const Bytes& longer) {
    return shorter.size() <= longer.size()
        && std::equal(shorter.begin(), shorter.end(), longer.begin());
}

static void contract_properties(Instance inst) {
    const std::string tag = std::string(instance_name(inst)) + ": ";
    PrfParams p;
    p.instance = inst;
    const auto key = as_bytes(inst == Instance::Kravatte ? "kravatte test key" : "xoofff test key");
    const auto hello = as_bytes("hello");
    const auto world = as_bytes("world");

    report(tag + "determinism",
           deck_digest(key, {hello, world}, 64, p) == deck_digest(key, {hello, world}, 64, p));

    report(tag + "part order matters",
           deck_digest(key, {hello, world}, 32, p) != deck_digest(key, {world, hello}, 32, p));

    report(tag + "part boundaries matter",
           deck_digest(key, {hello, world}, 32, p) != deck_digest(key, {as_bytes("helloworld")}, 32, p));

    report(tag + "key matters",
           deck_digest(key, {hello}, 32, p) != deck_digest(as_bytes("another key"), {hello}, 32, p));

    for (std::int64_t len : {1, 32, 150, 250}) {
        const Bytes a = deck_digest(key, {hello, world}, len, p);
        const Bytes b = deck_digest(key, {hello, world}, 4 * len, p);
        report(tag + "output of " + std::to_string(len) + " bytes is a prefix of 4x",
               a.size() == static_cast<std::size_t>(len) && is_prefix(a, b));
    }

    report(tag + "zero-length digest is empty",
           deck_digest(key, {hello}, 0, p).empty());

    {
        const Bytes none = deck_digest(key, {}, 32, p);
        const Bytes empty_part = deck_digest(key, {std::span<const std::uint8_t>()}, 32, p);
        report(tag + "no parts and one empty part differ",
               none.size() == 32 && none != empty_part);
    }

    {
        // Pieces of a single part never change the digest, whatever the
        // block boundaries.
        const Bytes msg = pattern(1000, 7);
        const Bytes whole = deck_digest(key, {msg}, 48, p);
        bool all_equal = true;
        for (std::size_t step : {1, 7, 47, 48, 49, 199, 200, 201, 999}) {
            Parts pieces;
            for (std::size_t off = 0; off < msg.size(); off += step) {
                const std::size_t n = std::min(step, msg.size() - off);
                pieces.emplace_back(msg.data() + off, n);
            }
            KeyedSpongePRF prf(key, p);
            prf.absorb_concat(pieces);
            all_equal &= (prf.finalize_and_squeeze(48) == whole);
        }
        report(tag + "concatenated pieces equal one part", all_equal);
    }

    {
        // Messages around the block size, including one that fills a block
        // exactly and gets a separate padding block.
        const std::size_t block = (inst == Instance::Kravatte) ? KravatteConfig::State::SIZE
                                                               : XoofffConfig::State::SIZE;
        const Bytes m1 = pattern(block - 1, 3);
        const Bytes m2 = pattern(block, 3);
        const Bytes m3 = pattern(block + 1, 3);
        const Bytes d1 = deck_digest(key, {m1}, 32, p);
        const Bytes d2 = deck_digest(key, {m2}, 32, p);
        const Bytes d3 = deck_digest(key, {m3}, 32, p);
        report(tag + "messages around the block size differ", d1 != d2 && d2 != d3 && d1 != d3);
    }

    {
        const Bytes whole = deck_digest(key, {hello}, 600, p);
        KeyedSpongePRF prf(key, p);
        prf.absorb(hello);
        Bytes out = prf.finalize_and_squeeze(0);
        for (std::int64_t step : {13, 200, 1, 186, 200}) {
            const Bytes more = prf.squeeze(step);
            out.insert(out.end(), more.begin(), more.end());
        }
        report(tag + "chunked squeeze equals one squeeze", out == whole);
    }
}

static void key_limits() {
    const Bytes k199 = pattern(199, 1);
    const Bytes k200 = pattern(200, 1);
    const Bytes k47 = pattern(47, 1);
    const Bytes k48 = pattern(48, 1);
    PrfParams xp;
    xp.instance = Instance::Xoofff;

    report("max key bytes", KeyedSpongePRF::max_key_bytes(Instance::Kravatte) == 199
                            && KeyedSpongePRF::max_key_bytes(Instance::Xoofff) == 47);

    expect_throw<InvalidKeyError>("empty key rejected", [] {
        KeyedSpongePRF prf(std::span<const std::uint8_t>{});
    });
    expect_throw<InvalidKeyError>("Kravatte: 200-byte key rejected", [&] {
        KeyedSpongePRF prf(k200);
    });
    expect_throw<InvalidKeyError>("Xoofff: 48-byte key rejected", [&] {
        KeyedSpongePRF prf(k48, xp);
    });

    report("Kravatte: 199-byte key accepted", deck_digest(k199, {as_bytes("m")}, 16).size() == 16);
    report("Xoofff: 47-byte key accepted", deck_digest(k47, {as_bytes("m")}, 16, xp).size() == 16);
}

static void length_and_state() {
    const auto key = as_bytes("kravatte test key");
    const auto msg = as_bytes("hello world");

    expect_throw<InvalidLengthError>("negative length rejected", [&] {
        deck_digest(key, {msg}, -1);
    });

    {
        PrfParams p;
        p.max_out_bytes = 64;
        KeyedSpongePRF prf(key, p);
        prf.absorb(msg);
        expect_throw<InvalidLengthError>("length above configured maximum rejected", [&] {
            prf.finalize_and_squeeze(65);
        });
        report("failed finalize leaves the instance absorbing", prf.state() == PrfState::Absorbing);
        report("finalize after a rejected length still works",
               prf.finalize_and_squeeze(64) == deck_digest(key, {msg}, 64));
        expect_throw<InvalidLengthError>("squeeze above configured maximum rejected", [&] {
            prf.squeeze(65);
        });
    }

    {
        KeyedSpongePRF prf(key);
        bool ok = prf.state() == PrfState::Keyed && prf.instance() == Instance::Kravatte;
        prf.absorb(msg);
        ok &= prf.state() == PrfState::Absorbing;
        prf.absorb(msg);
        ok &= prf.state() == PrfState::Absorbing;
        (void)prf.finalize_and_squeeze(8);
        ok &= prf.state() == PrfState::Finalized;
        report("state transitions Keyed -> Absorbing -> Finalized", ok);

        expect_throw<FinalizedError>("absorb after finalize rejected", [&] { prf.absorb(msg); });
        expect_throw<FinalizedError>("absorb_concat after finalize rejected", [&] {
            prf.absorb_concat({msg});
        });
        expect_throw<FinalizedError>("second finalize rejected", [&] { prf.finalize_and_squeeze(8); });
    }

    {
        KeyedSpongePRF prf(key);
        expect_throw<std::logic_error>("squeeze before finalize rejected", [&] { prf.squeeze(8); });
    }

    {
        KeyedSpongePRF a(key);
        a.absorb(msg);
        KeyedSpongePRF b(std::move(a));
        report("moved instance keeps its state",
               b.state() == PrfState::Absorbing && b.finalize_and_squeeze(32) == deck_digest(key, {msg}, 32));
    }
}

static void low_level() {
    const auto key = as_bytes("kravatte test key");

    {
        Kravatte full(key);
        Kravatte split(key);
        full.absorb(as_bytes("hello world"));
        auto w = split.input_writer();
        w.write(as_bytes("hello "));
        w.write(as_bytes("world"));
        w.finish();
        report("split writes give the same internal state", full == split);
    }

    {
        Kravatte deck(key);
        deck.absorb(as_bytes("hello"));
        auto g1 = deck.output_reader();
        auto g2 = deck.output_reader();
        const Bytes a = g1.read(300);
        deck.absorb(as_bytes("world"));
        const Bytes b = g2.read(300);
        auto g3 = deck.output_reader();
        report("output generators are independent of later input", a == b && g3.read(300) != a);
    }

    {
        Xoofff deck(as_bytes("xoofff test key"));
        deck.absorb(as_bytes("hello"));
        auto g1 = deck.output_reader();
        auto g2 = deck.output_reader();
        const Bytes all = g1.read(120);
        g2.skip(50);
        const Bytes tail = g2.read(70);
        report("skip advances the output stream", Bytes(all.begin() + 50, all.end()) == tail);
    }

    {
        Kravatte deck(key);
        auto w = deck.input_writer();
        w.finish();
        bool threw = false;
        try {
            w.write(as_bytes("late"));
        } catch (const std::logic_error&) {
            threw = true;
        }
        report("writing to a finished input writer throws", threw && w.finished());
    }

    report("Kravatte and Xoofff differ",
           deck_digest(as_bytes("key"), {as_bytes("m")}, 32)
               != deck_digest(as_bytes("key"), {as_bytes("m")}, 32, PrfParams{Instance::Xoofff}));
}

static void formatting() {
    const Bytes v = {0x1a, 0x00, 0xff};
    report("hex_list renders unpadded literals", hex_list(v) == "[0x1a, 0x0, 0xff, ]");
    report("hex_list of nothing", hex_list(Bytes{}) == "[]");
    report("hex_lower pads", hex_lower(v) == "1a00ff");
    report("from_hex round trips", from_hex("1A00ff") == v);
    expect_throw<std::invalid_argument>("from_hex rejects odd length", [] { from_hex("abc"); });
    expect_throw<std::invalid_argument>("from_hex rejects non-hex", [] { from_hex("zz"); });

    report("instance names", instance_name(Instance::Kravatte) == "Kravatte"
                             && instance_name(Instance::Xoofff) == "Xoofff");
    report("parse_instance", parse_instance("xoofff") == Instance::Xoofff
                             && parse_instance("kravatte") == Instance::Kravatte);
    expect_throw<std::invalid_argument>("parse_instance rejects unknown names", [] { parse_instance("keccak"); });
}

static void scenario() {
    const auto key = as_bytes("kravatte test key");
    const Bytes d1 = deck_digest(key, {as_bytes("hello world")}, 32);
    const Bytes d2 = deck_digest(key, {as_bytes("hello"), as_bytes("world")}, 32);
    const Bytes d3 = deck_digest(key, {as_bytes("hello world")}, 128);
    report("scenario: fragmentation changes the digest", d1 != d2);
    report("scenario: 128-byte digest extends the 32-byte one", d3.size() == 128 && is_prefix(d1, d3));
}

int main() {
    contract_properties(Instance::Kravatte);
    contract_properties(Instance::Xoofff);
    key_limits();
    length_and_state();
    low_level();
    formatting();
    scenario();

    if (g_fail_count > 0) {
        std::cout << "FAILED CHECKS: " << g_fail_count << "\n";
        return 1;
    }
    return 0;
}

#include "svgcore/document/identity_token.h"

#include <cstdio>

namespace svgcore {

namespace {

int hexValue(char c) noexcept {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::uint64_t seedFromDevice() {
    std::random_device rd;
    const std::uint64_t a = rd();
    const std::uint64_t b = rd();
    return (a << 32) ^ b;
}

} // namespace

std::string IdentityToken::toString() const {
    char buf[40];
    std::snprintf(
        buf,
        sizeof(buf),
        "%08x-%04x-%04x-%04x-%012llx",
        static_cast<unsigned>(hi >> 32),
        static_cast<unsigned>((hi >> 16) & 0xFFFFu),
        static_cast<unsigned>(hi & 0xFFFFu),
        static_cast<unsigned>(lo >> 48),
        static_cast<unsigned long long>(lo & 0xFFFFFFFFFFFFull));
    return std::string(buf);
}

bool IdentityToken::parse(std::string_view text, IdentityToken& out) noexcept {
    if (text.size() != 36) return false;
    std::uint64_t words[2] = {0, 0};
    int nibbles = 0;
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (i == 8 || i == 13 || i == 18 || i == 23) {
            if (text[i] != '-') return false;
            continue;
        }
        const int v = hexValue(text[i]);
        if (v < 0) return false;
        std::uint64_t& w = words[nibbles < 16 ? 0 : 1];
        w = (w << 4) | static_cast<std::uint64_t>(v);
        nibbles++;
    }
    IdentityToken t;
    t.hi = words[0];
    t.lo = words[1];
    if (t.isNull()) return false;
    out = t;
    return true;
}

TokenSource::TokenSource(std::uint64_t seed)
    : rng_(seed != 0 ? seed : seedFromDevice()) {}

IdentityToken TokenSource::next() {
    IdentityToken t;
    do {
        t.hi = rng_();
        t.lo = rng_();
        // version 4, variant 10xx
        t.hi = (t.hi & ~0x000000000000F000ull) | 0x0000000000004000ull;
        t.lo = (t.lo & ~0xC000000000000000ull) | 0x8000000000000000ull;
    } while (t.isNull());
    issued_++;
    return t;
}

} // namespace svgcore

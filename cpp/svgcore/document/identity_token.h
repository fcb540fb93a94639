#pragma once

#include <cstdint>
#include <functional>
#include <random>
#include <string>
#include <string_view>

namespace svgcore {

// 128-bit element identity, written as an RFC 4122 v4 string in internal text.
struct IdentityToken {
    std::uint64_t hi = 0;
    std::uint64_t lo = 0;

    bool isNull() const noexcept { return hi == 0 && lo == 0; }
    std::string toString() const;

    static bool parse(std::string_view text, IdentityToken& out) noexcept;

    friend bool operator==(const IdentityToken& a, const IdentityToken& b) noexcept {
        return a.hi == b.hi && a.lo == b.lo;
    }
    friend bool operator!=(const IdentityToken& a, const IdentityToken& b) noexcept {
        return !(a == b);
    }
    friend bool operator<(const IdentityToken& a, const IdentityToken& b) noexcept {
        return a.hi < b.hi || (a.hi == b.hi && a.lo < b.lo);
    }
};

struct IdentityTokenHash {
    std::size_t operator()(const IdentityToken& t) const noexcept {
        return std::hash<std::uint64_t>{}(t.hi ^ (t.lo * 0x9E3779B97F4A7C15ull));
    }
};

/**
 * Source of fresh tokens. A zero seed draws from std::random_device;
 * tests pass a fixed seed to get reproducible token sequences.
 */
class TokenSource {
public:
    explicit TokenSource(std::uint64_t seed = 0);

    IdentityToken next();
    std::uint64_t issuedCount() const noexcept { return issued_; }

private:
    std::mt19937_64 rng_;
    std::uint64_t issued_ = 0;
};

} // namespace svgcore

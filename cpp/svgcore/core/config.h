#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace svgcore {

struct EditorConfig {
    std::size_t historyCapacity = 50;
    double dragEpsilon = 0.01;
    std::string idPrefix = "svg-node";
    std::string tokenAttribute = "data-uuid";
    bool prettyPrint = true;
    std::string indent = "  ";
    std::uint64_t tokenSeed = 0;  // 0 = non-deterministic
};

struct EditorStats {
    std::uint32_t generation = 0;
    std::uint32_t elementCount = 0;
    std::uint32_t historySize = 0;
    std::uint32_t historyCursor = 0;
    std::uint32_t commitCount = 0;
    float lastParseMs = 0.0f;
    float lastSerializeMs = 0.0f;
    float lastCommitMs = 0.0f;
};

} // namespace svgcore

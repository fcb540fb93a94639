#pragma once

#include "svgcore/core/types.h"

#include <cstdint>
#include <string>
#include <string_view>

namespace svgcore {

class Document;

struct SerializeOptions {
    bool keepUUID = false;
    bool prettyPrint = true;
    std::string indent = "  ";
    std::string tokenAttribute = "data-uuid";
    NodeIndex omitNode = kInvalidNode;  // subtree left out of the output
};

// Writes the whole document. Internal ids are never emitted; identity
// tokens only when keepUUID is set.
std::string serialize(const Document& doc, const SerializeOptions& options = SerializeOptions{});

// Writes one element subtree with no leading indentation.
std::string serializeElement(const Document& doc, NodeIndex node, const SerializeOptions& options = SerializeOptions{});

// FNV-1a over the compact keepUUID form.
std::uint64_t documentDigest(const Document& doc);

std::string escapeAttributeValue(std::string_view value);
std::string escapeText(std::string_view text);

} // namespace svgcore

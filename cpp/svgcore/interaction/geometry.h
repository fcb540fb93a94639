#pragma once

#include "svgcore/core/types.h"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace svgcore {

class Document;
struct ElementNode;
struct AttributeState;

// How an element's position is expressed in its attributes.
enum class MoveStrategy : std::uint8_t {
    Origin = 0,     // x, y
    Center = 1,     // cx, cy
    Endpoints = 2,  // x1, y1, x2, y2
    Transform = 3,  // leading translate() in transform
};

MoveStrategy moveStrategyForTag(std::string_view tag) noexcept;

// Attribute names written by a move of the given strategy.
const std::vector<const char*>& positionAttributes(MoveStrategy strategy);

/**
 * Reads a leading translate(tx[, ty]) from a transform list.
 * rest receives whatever follows it, trimmed.
 */
bool parseLeadingTranslate(std::string_view transform, double& tx, double& ty, std::string_view* rest = nullptr);

// Adds (dx, dy) to the leading translate, prepending one when missing and
// dropping it when it returns to the origin.
std::string translateTransform(std::string_view transform, double dx, double dy);

// Position attributes of node as they stand now, for an exact restore later.
std::vector<AttributeState> capturePosition(const ElementNode& node);

// Shifts an element's position attributes by (dx, dy).
void translateElement(ElementNode& node, double dx, double dy);

// Axis-aligned bounds in the parent's coordinate space.
Bounds elementBounds(const Document& doc, NodeIndex node);

inline Bounds unionBounds(const Bounds& a, const Bounds& b) noexcept {
    if (!a.valid) return b;
    if (!b.valid) return a;
    return Bounds{
        a.minX < b.minX ? a.minX : b.minX,
        a.minY < b.minY ? a.minY : b.minY,
        a.maxX > b.maxX ? a.maxX : b.maxX,
        a.maxY > b.maxY ? a.maxY : b.maxY,
        true};
}

} // namespace svgcore

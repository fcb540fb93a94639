#pragma once

#include <cstdint>
#include <limits>
#include <string>
#include <vector>

namespace svgcore {

using NodeIndex = std::uint32_t;
static constexpr NodeIndex kInvalidNode = std::numeric_limits<NodeIndex>::max();

enum class EditorError : std::uint32_t {
    Ok = 0,
    NoDocument = 1,
    ParseFailed = 2,
    InvalidAttribute = 3,
    ElementNotFound = 4,
    ReplayFailed = 5,
    InvalidOperation = 6,
};

inline const char* editorErrorName(EditorError err) noexcept {
    switch (err) {
        case EditorError::Ok: return "Ok";
        case EditorError::NoDocument: return "NoDocument";
        case EditorError::ParseFailed: return "ParseFailed";
        case EditorError::InvalidAttribute: return "InvalidAttribute";
        case EditorError::ElementNotFound: return "ElementNotFound";
        case EditorError::ReplayFailed: return "ReplayFailed";
        case EditorError::InvalidOperation: return "InvalidOperation";
    }
    return "Unknown";
}

// Location is 1-based; column is 0 when the parser could not tell.
struct ParseError {
    int line = 1;
    int column = 0;
    std::string message;
};

enum class ElementKind : std::uint8_t {
    Rect = 0,
    Circle = 1,
    Ellipse = 2,
    Line = 3,
    Group = 4,
    Text = 5,
    Passthrough = 6,
};

enum class NodeType : std::uint8_t {
    Element = 0,
    TextRun = 1,
};

struct Point2 {
    double x;
    double y;
};

struct Bounds {
    double minX;
    double minY;
    double maxX;
    double maxY;
    bool valid;
};

} // namespace svgcore

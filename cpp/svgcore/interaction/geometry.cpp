#include "svgcore/interaction/geometry.h"
#include "svgcore/document/document.h"
#include "svgcore/core/string_utils.h"

#include <algorithm>
#include <cmath>
#include <cstdlib>

namespace svgcore {

namespace {

constexpr double kOriginEpsilon = 1e-9;

double numberAttr(const ElementNode& n, const char* name, double fallback = 0.0) {
    const std::string* v = n.attributes.find(name);
    return v ? parseLeadingNumber(*v, fallback) : fallback;
}

void shiftAttr(ElementNode& n, const char* name, double delta) {
    const double next = numberAttr(n, name) + delta;
    n.attributes.set(name, formatNumber(next));
}

Bounds pointBounds(double x, double y) {
    return Bounds{x, y, x, y, true};
}

Bounds offsetBounds(const Bounds& b, double dx, double dy) {
    if (!b.valid) return b;
    return Bounds{b.minX + dx, b.minY + dy, b.maxX + dx, b.maxY + dy, true};
}

} // namespace

MoveStrategy moveStrategyForTag(std::string_view tag) noexcept {
    if (tag == "rect" || tag == "image" || tag == "use" || tag == "text" || tag == "tspan"
        || tag == "foreignObject" || tag == "svg") {
        return MoveStrategy::Origin;
    }
    if (tag == "circle" || tag == "ellipse") return MoveStrategy::Center;
    if (tag == "line") return MoveStrategy::Endpoints;
    return MoveStrategy::Transform;
}

const std::vector<const char*>& positionAttributes(MoveStrategy strategy) {
    static const std::vector<const char*> origin{"x", "y"};
    static const std::vector<const char*> center{"cx", "cy"};
    static const std::vector<const char*> endpoints{"x1", "y1", "x2", "y2"};
    static const std::vector<const char*> transform{"transform"};
    switch (strategy) {
        case MoveStrategy::Origin: return origin;
        case MoveStrategy::Center: return center;
        case MoveStrategy::Endpoints: return endpoints;
        case MoveStrategy::Transform: return transform;
    }
    return transform;
}

std::vector<AttributeState> capturePosition(const ElementNode& node) {
    return captureAttributes(node.attributes, positionAttributes(moveStrategyForTag(node.tag)));
}

bool parseLeadingTranslate(std::string_view transform, double& tx, double& ty, std::string_view* rest) {
    const std::string_view t = trimView(transform);
    static constexpr std::string_view kTranslate = "translate";
    if (!startsWith(t, kTranslate)) return false;

    std::size_t i = kTranslate.size();
    while (i < t.size() && isXmlSpace(t[i])) i++;
    if (i >= t.size() || t[i] != '(') return false;
    const std::size_t close = t.find(')', i);
    if (close == std::string_view::npos) return false;

    const std::vector<std::string_view> args = splitNumberList(t.substr(i + 1, close - i - 1));
    if (args.empty() || args.size() > 2) return false;
    for (const auto& a : args) {
        const std::string buf(a);
        char* end = nullptr;
        std::strtod(buf.c_str(), &end);
        if (end == buf.c_str() || *end != '\0') return false;
    }
    tx = parseLeadingNumber(args[0]);
    ty = args.size() == 2 ? parseLeadingNumber(args[1]) : 0.0;
    if (rest) *rest = trimView(t.substr(close + 1));
    return true;
}

std::string translateTransform(std::string_view transform, double dx, double dy) {
    double tx = 0.0;
    double ty = 0.0;
    std::string_view rest = trimView(transform);
    if (parseLeadingTranslate(transform, tx, ty, &rest)) {
        tx += dx;
        ty += dy;
    } else {
        tx = dx;
        ty = dy;
    }

    std::string out;
    if (std::fabs(tx) > kOriginEpsilon || std::fabs(ty) > kOriginEpsilon) {
        out = "translate(" + formatNumber(tx) + ", " + formatNumber(ty) + ")";
    }
    if (!rest.empty()) {
        if (!out.empty()) out += ' ';
        out.append(rest.data(), rest.size());
    }
    return out;
}

void translateElement(ElementNode& node, double dx, double dy) {
    switch (moveStrategyForTag(node.tag)) {
        case MoveStrategy::Origin:
            shiftAttr(node, "x", dx);
            shiftAttr(node, "y", dy);
            break;
        case MoveStrategy::Center:
            shiftAttr(node, "cx", dx);
            shiftAttr(node, "cy", dy);
            break;
        case MoveStrategy::Endpoints:
            shiftAttr(node, "x1", dx);
            shiftAttr(node, "y1", dy);
            shiftAttr(node, "x2", dx);
            shiftAttr(node, "y2", dy);
            break;
        case MoveStrategy::Transform: {
            const std::string* current = node.attributes.find("transform");
            const std::string next = translateTransform(current ? *current : std::string(), dx, dy);
            if (next.empty()) {
                node.attributes.remove("transform");
            } else {
                node.attributes.set("transform", next);
            }
            break;
        }
    }
}

Bounds elementBounds(const Document& doc, NodeIndex index) {
    const ElementNode* n = doc.tryNode(index);
    if (!n || !n->isElement()) return Bounds{0, 0, 0, 0, false};

    switch (moveStrategyForTag(n->tag)) {
        case MoveStrategy::Origin: {
            const double x = numberAttr(*n, "x");
            const double y = numberAttr(*n, "y");
            const double w = std::max(0.0, numberAttr(*n, "width"));
            const double h = std::max(0.0, numberAttr(*n, "height"));
            return Bounds{x, y, x + w, y + h, true};
        }
        case MoveStrategy::Center: {
            const double cx = numberAttr(*n, "cx");
            const double cy = numberAttr(*n, "cy");
            double rx = 0.0;
            double ry = 0.0;
            if (n->tag == "circle") {
                rx = ry = std::fabs(numberAttr(*n, "r"));
            } else {
                rx = std::fabs(numberAttr(*n, "rx"));
                ry = std::fabs(numberAttr(*n, "ry"));
            }
            return Bounds{cx - rx, cy - ry, cx + rx, cy + ry, true};
        }
        case MoveStrategy::Endpoints: {
            const double x1 = numberAttr(*n, "x1");
            const double y1 = numberAttr(*n, "y1");
            const double x2 = numberAttr(*n, "x2");
            const double y2 = numberAttr(*n, "y2");
            return Bounds{std::min(x1, x2), std::min(y1, y2), std::max(x1, x2), std::max(y1, y2), true};
        }
        case MoveStrategy::Transform:
            break;
    }

    double tx = 0.0;
    double ty = 0.0;
    const std::string* transform = n->attributes.find("transform");
    if (transform) parseLeadingTranslate(*transform, tx, ty);

    Bounds inner{0, 0, 0, 0, false};
    for (const NodeIndex c : n->children) {
        inner = unionBounds(inner, elementBounds(doc, c));
    }
    if (!inner.valid) return pointBounds(tx, ty);
    return offsetBounds(inner, tx, ty);
}

} // namespace svgcore

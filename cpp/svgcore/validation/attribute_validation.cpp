#include "svgcore/validation/attribute_validation.h"
#include "svgcore/core/string_utils.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <initializer_list>
#include <unordered_set>

namespace svgcore {

namespace {

const std::unordered_set<std::string>& namedColors() {
    static const std::unordered_set<std::string> colors{
        "aliceblue", "antiquewhite", "aqua", "aquamarine", "azure",
        "beige", "bisque", "black", "blanchedalmond", "blue", "blueviolet", "brown", "burlywood",
        "cadetblue", "chartreuse", "chocolate", "coral", "cornflowerblue", "cornsilk", "crimson", "cyan",
        "darkblue", "darkcyan", "darkgoldenrod", "darkgray", "darkgrey", "darkgreen", "darkkhaki",
        "darkmagenta", "darkolivegreen", "darkorange", "darkorchid", "darkred", "darksalmon",
        "darkseagreen", "darkslateblue", "darkslategray", "darkslategrey", "darkturquoise",
        "darkviolet", "deeppink", "deepskyblue", "dimgray", "dimgrey", "dodgerblue",
        "firebrick", "floralwhite", "forestgreen", "fuchsia",
        "gainsboro", "ghostwhite", "gold", "goldenrod", "gray", "grey", "green", "greenyellow",
        "honeydew", "hotpink", "indianred", "indigo", "ivory", "khaki",
        "lavender", "lavenderblush", "lawngreen", "lemonchiffon", "lightblue", "lightcoral",
        "lightcyan", "lightgoldenrodyellow", "lightgray", "lightgrey", "lightgreen", "lightpink",
        "lightsalmon", "lightseagreen", "lightskyblue", "lightslategray", "lightslategrey",
        "lightsteelblue", "lightyellow", "lime", "limegreen", "linen",
        "magenta", "maroon", "mediumaquamarine", "mediumblue", "mediumorchid", "mediumpurple",
        "mediumseagreen", "mediumslateblue", "mediumspringgreen", "mediumturquoise",
        "mediumvioletred", "midnightblue", "mintcream", "mistyrose", "moccasin",
        "navajowhite", "navy", "oldlace", "olive", "olivedrab", "orange", "orangered", "orchid",
        "palegoldenrod", "palegreen", "paleturquoise", "palevioletred", "papayawhip", "peachpuff",
        "peru", "pink", "plum", "powderblue", "purple",
        "red", "rosybrown", "royalblue",
        "saddlebrown", "salmon", "sandybrown", "seagreen", "seashell", "sienna", "silver", "skyblue",
        "slateblue", "slategray", "slategrey", "snow", "springgreen", "steelblue",
        "tan", "teal", "thistle", "tomato", "turquoise",
        "violet", "wheat", "white", "whitesmoke", "yellow", "yellowgreen",
        "transparent", "currentcolor", "none",
    };
    return colors;
}

bool contains(std::initializer_list<std::string_view> names, std::string_view name) {
    return std::find(names.begin(), names.end(), name) != names.end();
}

bool isHex(char c) noexcept {
    return std::isxdigit(static_cast<unsigned char>(c)) != 0;
}

bool allDigits(std::string_view s) noexcept {
    if (s.empty()) return false;
    for (const char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

// "[\d.]+" with at least one digit
bool isAlphaComponent(std::string_view s) noexcept {
    bool digit = false;
    for (const char c : s) {
        if (std::isdigit(static_cast<unsigned char>(c))) {
            digit = true;
        } else if (c != '.') {
            return false;
        }
    }
    return digit;
}

// Splits the argument list of "name(a, b, c)". Returns false when the
// value is not of that shape.
bool functionArgs(std::string_view value, std::string_view fn, std::vector<std::string_view>& args) {
    if (!startsWith(value, fn)) return false;
    std::string_view rest = value.substr(fn.size());
    if (rest.size() < 2 || rest.front() != '(' || rest.back() != ')') return false;
    rest = rest.substr(1, rest.size() - 2);

    args.clear();
    std::size_t start = 0;
    while (true) {
        const std::size_t comma = rest.find(',', start);
        args.push_back(trimView(rest.substr(start, comma == std::string_view::npos ? std::string_view::npos : comma - start)));
        if (comma == std::string_view::npos) break;
        start = comma + 1;
    }
    return true;
}

bool isValidRgb(std::string_view v, bool& outOfRange) {
    outOfRange = false;
    std::vector<std::string_view> args;
    std::size_t expected = 3;
    if (functionArgs(v, "rgba", args)) {
        expected = 4;
    } else if (!functionArgs(v, "rgb", args)) {
        return false;
    }
    if (args.size() != expected) return false;
    for (std::size_t i = 0; i < 3; ++i) {
        if (!allDigits(args[i])) return false;
        if (std::strtol(std::string(args[i]).c_str(), nullptr, 10) > 255) outOfRange = true;
    }
    if (expected == 4 && !isAlphaComponent(args[3])) return false;
    return !outOfRange;
}

bool isValidHsl(std::string_view v) {
    std::vector<std::string_view> args;
    if (!functionArgs(v, "hsla", args) && !functionArgs(v, "hsl", args)) return false;
    if (args.size() != 3 && args.size() != 4) return false;
    if (!allDigits(args[0])) return false;
    for (std::size_t i = 1; i < 3; ++i) {
        if (args[i].empty() || args[i].back() != '%') return false;
        if (!allDigits(args[i].substr(0, args[i].size() - 1))) return false;
    }
    if (args.size() == 4 && !isAlphaComponent(args[3])) return false;
    return true;
}

ValidationResult invalid(std::string message) {
    return ValidationResult{false, std::move(message)};
}

std::string quoted(std::string_view s) {
    std::string out = "\"";
    out.append(s.data(), s.size());
    out += '"';
    return out;
}

} // namespace

bool isValidNumber(std::string_view value) noexcept {
    return isPlainNumber(trimView(value));
}

bool isValidLength(std::string_view value) noexcept {
    const std::string_view v = trimView(value);
    static constexpr std::string_view kUnits[] = {"px", "em", "rem", "%", "pt", "pc", "cm", "mm", "in"};
    if (isPlainNumber(v)) return true;
    for (const auto unit : kUnits) {
        if (v.size() > unit.size() && v.compare(v.size() - unit.size(), unit.size(), unit) == 0
            && isPlainNumber(v.substr(0, v.size() - unit.size()))) {
            return true;
        }
    }
    return false;
}

bool isValidColor(std::string_view value) {
    const std::string v = toLowerAscii(trimView(value));
    if (v.empty()) return false;
    if (namedColors().count(v) != 0) return true;

    if (v[0] == '#') {
        if (v.size() != 4 && v.size() != 7) return false;
        return std::all_of(v.begin() + 1, v.end(), isHex);
    }

    bool outOfRange = false;
    if (isValidRgb(v, outOfRange)) return true;
    return isValidHsl(v);
}

bool isValidIdentifier(std::string_view value) noexcept {
    if (value.empty()) return false;
    const auto first = static_cast<unsigned char>(value[0]);
    if (!std::isalpha(first) && value[0] != '_') return false;
    for (const char c : value.substr(1)) {
        const auto u = static_cast<unsigned char>(c);
        if (!std::isalnum(u) && c != '_' && c != '.' && c != '-') return false;
    }
    return true;
}

bool isValidAttributeName(std::string_view name) noexcept {
    const std::size_t colon = name.find(':');
    if (colon != std::string_view::npos) {
        if (name.find(':', colon + 1) != std::string_view::npos) return false;
        return isValidAttributeName(name.substr(0, colon)) && isValidAttributeName(name.substr(colon + 1));
    }
    if (name.empty()) return false;
    const auto first = static_cast<unsigned char>(name[0]);
    if (!std::isalpha(first) && first != '_' && first < 0x80) return false;
    for (const char c : name.substr(1)) {
        const auto u = static_cast<unsigned char>(c);
        if (u >= 0x80) continue;
        if (!std::isalnum(u) && c != '_' && c != '.' && c != '-') return false;
    }
    return true;
}

bool isValidViewBox(std::string_view value) {
    const std::vector<std::string_view> parts = splitNumberList(value);
    if (parts.size() != 4) return false;
    for (const auto& p : parts) {
        const std::string buf(p);
        char* end = nullptr;
        std::strtod(buf.c_str(), &end);
        if (end == buf.c_str() || *end != '\0') return false;
    }
    return true;
}

const std::vector<std::string>& enumValuesFor(std::string_view name) {
    static const std::vector<std::string> none;
    static const std::vector<std::string> fillRule{"nonzero", "evenodd"};
    static const std::vector<std::string> linecap{"butt", "round", "square"};
    static const std::vector<std::string> linejoin{"miter", "round", "bevel"};
    static const std::vector<std::string> textAnchor{"start", "middle", "end"};
    static const std::vector<std::string> visibility{"visible", "hidden", "collapse"};
    if (name == "fill-rule") return fillRule;
    if (name == "stroke-linecap") return linecap;
    if (name == "stroke-linejoin") return linejoin;
    if (name == "text-anchor") return textAnchor;
    if (name == "visibility") return visibility;
    return none;
}

ValidationResult validateAttribute(std::string_view name, std::string_view value) {
    if (contains({"x", "y", "cx", "cy", "r", "rx", "ry", "x1", "y1", "x2", "y2"}, name)) {
        if (!isValidNumber(value)) {
            return invalid("Attribute " + quoted(name) + " must be a valid number. Got: " + quoted(value));
        }
        return {};
    }

    if (contains({"width", "height", "stroke-width", "font-size"}, name)) {
        if (!isValidLength(value)) {
            return invalid("Attribute " + quoted(name) + " must be a valid length (number with optional unit). Got: "
                + quoted(value));
        }
        return {};
    }

    if (contains({"fill", "stroke", "stop-color", "flood-color", "lighting-color"}, name)) {
        const std::string lower = toLowerAscii(trimView(value));
        bool outOfRange = false;
        if (isValidRgb(lower, outOfRange)) return {};
        if (outOfRange) return invalid("RGB values must be between 0 and 255");
        if (!isValidColor(value)) {
            return invalid("Attribute " + quoted(name) + " must be a valid color. Got: " + quoted(value));
        }
        return {};
    }

    if (contains({"opacity", "fill-opacity", "stroke-opacity"}, name)) {
        const std::string_view v = trimView(value);
        const std::string buf(v);
        char* end = nullptr;
        const double d = std::strtod(buf.c_str(), &end);
        if (buf.empty() || end == buf.c_str() || *end != '\0') {
            return invalid("Attribute " + quoted(name) + " must be a valid number. Got: " + quoted(value));
        }
        if (d < 0.0) return invalid("Must be at least 0");
        if (d > 1.0) return invalid("Must be at most 1");
        return {};
    }

    if (name == "viewBox") {
        if (!isValidViewBox(value)) return invalid("Must be 4 numbers (x y w h)");
        return {};
    }

    if (name == "id") {
        if (value.empty()) return invalid("This attribute is required");
        if (!isValidIdentifier(value)) {
            return invalid("ID must start with a letter or underscore and contain only letters, digits, hyphens, "
                "underscores, and periods");
        }
        return {};
    }

    const std::vector<std::string>& allowed = enumValuesFor(name);
    if (!allowed.empty()) {
        if (std::find(allowed.begin(), allowed.end(), value) == allowed.end()) {
            std::string list;
            for (const auto& a : allowed) {
                if (!list.empty()) list += ", ";
                list += a;
            }
            return invalid("Attribute " + quoted(name) + " must be one of: " + list + ". Got: " + quoted(value));
        }
        return {};
    }

    return {};
}

} // namespace svgcore

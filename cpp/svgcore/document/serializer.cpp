#include "svgcore/document/serializer.h"
#include "svgcore/document/document.h"
#include "svgcore/core/util.h"

namespace svgcore {

std::string escapeAttributeValue(std::string_view value) {
    std::string out;
    out.reserve(value.size());
    for (const char c : value) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '"': out += "&quot;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '\n': out += "&#10;"; break;
            case '\r': out += "&#13;"; break;
            case '\t': out += "&#9;"; break;
            default: out += c; break;
        }
    }
    return out;
}

std::string escapeText(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (const char c : text) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            default: out += c; break;
        }
    }
    return out;
}

namespace {

class Writer {
public:
    Writer(const Document& doc, const SerializeOptions& options) : doc_(doc), options_(options) {}

    void element(NodeIndex i, int depth, bool inlineMode) {
        if (i == options_.omitNode) return;
        const ElementNode& n = doc_.node(i);
        if (!n.isElement()) {
            out_ += escapeText(n.text);
            return;
        }

        if (!inlineMode) indent(depth);
        out_ += '<';
        out_ += n.tag;
        if (!n.originalId.empty()) attribute("id", n.originalId);
        for (const auto& a : n.attributes) attribute(a.name, a.value);
        if (options_.keepUUID && !n.token.isNull()) attribute(options_.tokenAttribute, n.token.toString());

        if (!hasWrittenChildren(n)) {
            out_ += " />";
            if (!inlineMode) newline();
            return;
        }
        out_ += '>';

        const bool childrenInline = inlineMode || hasInlineContent(n);
        if (!childrenInline) newline();
        for (const NodeIndex c : n.children) element(c, depth + 1, childrenInline);
        if (!childrenInline) indent(depth);

        out_ += "</";
        out_ += n.tag;
        out_ += '>';
        if (!inlineMode) newline();
    }

    std::string take() {
        // The last newline belongs to no line.
        if (!out_.empty() && out_.back() == '\n') out_.pop_back();
        return std::move(out_);
    }

private:
    bool hasWrittenChildren(const ElementNode& n) const {
        for (const NodeIndex c : n.children) {
            if (c != options_.omitNode) return true;
        }
        return false;
    }

    bool hasInlineContent(const ElementNode& n) const {
        if (isTextBearingTag(n.tag)) return true;
        for (const NodeIndex c : n.children) {
            if (!doc_.node(c).isElement()) return true;
        }
        return false;
    }

    void attribute(std::string_view name, std::string_view value) {
        out_ += ' ';
        out_.append(name.data(), name.size());
        out_ += "=\"";
        out_ += escapeAttributeValue(value);
        out_ += '"';
    }

    void indent(int depth) {
        if (!options_.prettyPrint) return;
        for (int d = 0; d < depth; ++d) out_ += options_.indent;
    }

    void newline() {
        if (options_.prettyPrint) out_ += '\n';
    }

    const Document& doc_;
    const SerializeOptions& options_;
    std::string out_;
};

} // namespace

std::string serialize(const Document& doc, const SerializeOptions& options) {
    if (!doc.hasRoot()) return std::string();
    Writer w(doc, options);
    w.element(doc.root(), 0, false);
    return w.take();
}

std::string serializeElement(const Document& doc, NodeIndex node, const SerializeOptions& options) {
    if (!doc.tryNode(node)) return std::string();
    Writer w(doc, options);
    w.element(node, 0, false);
    return w.take();
}

std::uint64_t documentDigest(const Document& doc) {
    SerializeOptions options;
    options.keepUUID = true;
    options.prettyPrint = false;
    const std::string text = serialize(doc, options);
    return fnv1a64(text.data(), text.size());
}

} // namespace svgcore

#include "svgcore/document/parser.h"
#include "svgcore/document/identity_assigner.h"
#include "svgcore/core/logging.h"
#include "svgcore/core/string_utils.h"

#include <libxml/parser.h>
#include <libxml/tree.h>
#include <libxml/xmlerror.h>
#include <libxml/xmlversion.h>

#include <climits>

namespace svgcore {

namespace {

struct ErrorCollector {
    std::vector<ParseError> errors;
};

std::string trimMessage(const char* msg) {
    std::string out = msg ? msg : "";
    while (!out.empty() && isXmlSpace(out.back())) out.pop_back();
    if (out.empty()) out = "Malformed markup";
    return out;
}

#if LIBXML_VERSION >= 21200
void collectStructuredError(void* userData, const xmlError* err)
#else
void collectStructuredError(void* userData, xmlErrorPtr err)
#endif
{
    auto* collector = static_cast<ErrorCollector*>(userData);
    if (!collector || !err) return;

    if (err->domain == XML_FROM_NAMESPACE) {
        SVGCORE_LOG_WARN("namespace diagnostic ignored (line %d): %s", err->line, err->message ? err->message : "");
        return;
    }
    if (err->level < XML_ERR_ERROR) return;

    ParseError pe;
    pe.line = err->line > 0 ? err->line : 1;
    pe.column = err->int2 > 0 ? err->int2 : 0;
    pe.message = trimMessage(err->message);
    collector->errors.push_back(std::move(pe));
}

// Routes libxml2 diagnostics into a collector for the lifetime of one parse.
class ScopedErrorCapture {
public:
    explicit ScopedErrorCapture(ErrorCollector& collector)
        : previousHandler_(xmlStructuredError), previousContext_(xmlStructuredErrorContext) {
        xmlSetStructuredErrorFunc(&collector, collectStructuredError);
    }
    ~ScopedErrorCapture() { xmlSetStructuredErrorFunc(previousContext_, previousHandler_); }

    ScopedErrorCapture(const ScopedErrorCapture&) = delete;
    ScopedErrorCapture& operator=(const ScopedErrorCapture&) = delete;

private:
    xmlStructuredErrorFunc previousHandler_;
    void* previousContext_;
};

struct ParserCtxtDeleter {
    void operator()(xmlParserCtxtPtr ctxt) const { xmlFreeParserCtxt(ctxt); }
};
struct XmlDocDeleter {
    void operator()(xmlDocPtr doc) const { xmlFreeDoc(doc); }
};

std::string qualifiedName(const xmlChar* name, const xmlNs* ns) {
    std::string out;
    if (ns && ns->prefix) {
        out = reinterpret_cast<const char*>(ns->prefix);
        out += ':';
    }
    if (name) out += reinterpret_cast<const char*>(name);
    return out;
}

std::string takeXmlString(xmlChar* s) {
    if (!s) return std::string();
    std::string out(reinterpret_cast<const char*>(s));
    xmlFree(s);
    return out;
}

class TreeBuilder {
public:
    TreeBuilder(Document& doc, const ParserOptions& options) : doc_(doc), options_(options) {}

    NodeIndex buildElement(xmlNodePtr el) {
        const NodeIndex index = doc_.createElement(qualifiedName(el->name, el->ns));

        for (xmlNsPtr ns = el->nsDef; ns; ns = ns->next) {
            std::string name = "xmlns";
            if (ns->prefix) {
                name += ':';
                name += reinterpret_cast<const char*>(ns->prefix);
            }
            doc_.node(index).attributes.set(name, ns->href ? reinterpret_cast<const char*>(ns->href) : "");
        }

        for (xmlAttrPtr attr = el->properties; attr; attr = attr->next) {
            const std::string name = qualifiedName(attr->name, attr->ns);
            std::string value = takeXmlString(xmlNodeGetContent(reinterpret_cast<xmlNodePtr>(attr)));
            ElementNode& n = doc_.node(index);
            if (name == options_.tokenAttribute) {
                IdentityToken stamp;
                if (IdentityToken::parse(value, stamp)) {
                    n.token = stamp;
                } else {
                    SVGCORE_LOG_DEBUG("malformed identity stamp '%s' replaced", value.c_str());
                }
                continue;
            }
            if (name == "id") {
                n.originalId = std::move(value);
                continue;
            }
            n.attributes.set(name, value);
        }

        const bool keepWhitespace = isTextBearingTag(doc_.node(index).tag);
        for (xmlNodePtr child = el->children; child; child = child->next) {
            switch (child->type) {
                case XML_ELEMENT_NODE: {
                    const NodeIndex c = buildElement(child);
                    doc_.appendChild(index, c);
                    break;
                }
                case XML_TEXT_NODE:
                case XML_CDATA_SECTION_NODE:
                case XML_ENTITY_REF_NODE: {
                    std::string text = takeXmlString(xmlNodeGetContent(child));
                    if (text.empty()) break;
                    if (!keepWhitespace && isWhitespaceOnly(text)) break;
                    appendText(index, text);
                    break;
                }
                default:
                    // comments, processing instructions
                    break;
            }
        }
        return index;
    }

private:
    void appendText(NodeIndex parent, const std::string& text) {
        auto& kids = doc_.node(parent).children;
        if (!kids.empty() && !doc_.node(kids.back()).isElement()) {
            doc_.node(kids.back()).text += text;
            return;
        }
        const NodeIndex t = doc_.createTextRun(text);
        doc_.appendChild(parent, t);
    }

    Document& doc_;
    const ParserOptions& options_;
};

} // namespace

Parser::Parser(TokenSource& tokens, ParserOptions options)
    : tokens_(tokens), options_(std::move(options)) {}

ParseResult Parser::parse(std::string_view text) {
    return parseImpl(text, true);
}

ParseResult Parser::parseFragment(std::string_view text) {
    return parseImpl(text, false);
}

ParseResult Parser::parseImpl(std::string_view text, bool requireSvgRoot) {
    ParseResult result;

    if (isWhitespaceOnly(text)) {
        result.errors.push_back(ParseError{1, 0, "Document is empty"});
        return result;
    }
    if (text.size() > static_cast<std::size_t>(INT_MAX)) {
        result.errors.push_back(ParseError{1, 0, "Document is too large"});
        return result;
    }

    xmlInitParser();

    ErrorCollector collector;
    std::unique_ptr<xmlDoc, XmlDocDeleter> xdoc;
    bool wellFormed = false;
    {
        ScopedErrorCapture capture(collector);
        std::unique_ptr<xmlParserCtxt, ParserCtxtDeleter> ctxt(xmlNewParserCtxt());
        if (!ctxt) {
            result.errors.push_back(ParseError{1, 0, "Out of memory"});
            return result;
        }
        const int options = XML_PARSE_NONET | XML_PARSE_NOCDATA;
        xdoc.reset(xmlCtxtReadMemory(ctxt.get(), text.data(), static_cast<int>(text.size()), nullptr, "UTF-8", options));
        wellFormed = ctxt->wellFormed != 0;
    }

    if (!xdoc || !wellFormed || !collector.errors.empty()) {
        result.errors = std::move(collector.errors);
        if (result.errors.empty()) result.errors.push_back(ParseError{1, 0, "Malformed markup"});
        SVGCORE_LOG_WARN("parse rejected at %d:%d: %s", result.errors.front().line, result.errors.front().column,
            result.errors.front().message.c_str());
        return result;
    }

    xmlNodePtr rootEl = xmlDocGetRootElement(xdoc.get());
    if (!rootEl) {
        result.errors.push_back(ParseError{1, 0, "Document has no root element"});
        return result;
    }
    if (requireSvgRoot && !xmlStrEqual(rootEl->name, reinterpret_cast<const xmlChar*>("svg"))) {
        const int line = rootEl->line > 0 ? static_cast<int>(rootEl->line) : 1;
        result.errors.push_back(ParseError{line, 0, "Root element must be <svg>"});
        SVGCORE_LOG_WARN("parse rejected: root element is <%s>", reinterpret_cast<const char*>(rootEl->name));
        return result;
    }

    auto doc = std::make_unique<Document>();
    TreeBuilder builder(*doc, options_);
    doc->setRoot(builder.buildElement(rootEl));
    doc->setRawText(std::string(text));

    IdentityAssigner assigner(tokens_, options_.idPrefix);
    assigner.assign(*doc);
    result.synthesizedTokens = assigner.lastSynthesizedCount();

    if (requireSvgRoot) result.tree = buildHierarchy(*doc);
    result.document = std::move(doc);
    result.success = true;
    return result;
}

} // namespace svgcore

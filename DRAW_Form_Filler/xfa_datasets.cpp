#include "xfa_datasets.h"
#include "fill_common.h"

#include <sstream>

namespace DrawForm {

const char* const XFA_DATA_NS = "http://www.xfa.org/schema/xfa-data/1.0/";

const unsigned int XML_PARSE_OPTIONS = pugi::parse_default | pugi::parse_ws_pcdata;

// ============================================================================
// XmlUtil Implementation
// ============================================================================

namespace XmlUtil {

static std::string prefixOf(const pugi::xml_node& element) {
    std::string name = element.name();
    size_t colon = name.find(':');
    return colon == std::string::npos ? std::string() : name.substr(0, colon);
}

std::string localName(const pugi::xml_node& element) {
    std::string name = element.name();
    size_t colon = name.find(':');
    return colon == std::string::npos ? name : name.substr(colon + 1);
}

std::string namespaceUri(const pugi::xml_node& element) {
    std::string prefix = prefixOf(element);
    std::string attrName = prefix.empty() ? "xmlns" : "xmlns:" + prefix;

    for (pugi::xml_node scope = element; scope && scope.type() == pugi::node_element;
         scope = scope.parent()) {
        pugi::xml_attribute uri = scope.attribute(attrName.c_str());
        if (uri) return uri.value();
    }
    return "";
}

pugi::xml_node findPath(const pugi::xml_node& base, const std::string& path) {
    pugi::xml_node current = base;
    size_t start = 0;
    while (current && start <= path.size()) {
        size_t slash = path.find('/', start);
        std::string step = path.substr(start, slash == std::string::npos ? std::string::npos
                                                                         : slash - start);
        if (!step.empty()) {
            current = current.child(step.c_str());
        }
        if (slash == std::string::npos) break;
        start = slash + 1;
    }
    return current;
}

std::string elementText(const pugi::xml_node& element) {
    if (!element) return "";
    return element.child_value();
}

} // namespace XmlUtil

// ============================================================================
// XfaDatasets Implementation
// ============================================================================

XfaDatasets::XfaDatasets()
    : claimed_(false) {
}

void XfaDatasets::load(const std::string& xml) {
    data_ = pugi::xml_node();
    claimed_ = false;

    pugi::xml_parse_result result = doc_.load_buffer(xml.data(), xml.size(), XML_PARSE_OPTIONS);
    if (!result) {
        throw TemplateStructureError(std::string("XFA datasets packet is not well-formed XML: ") +
                                     result.description());
    }

    data_ = locateDataNode();
    if (!data_) {
        throw TemplateStructureError("XFA datasets packet has no xfa:data element");
    }
}

pugi::xml_node XfaDatasets::locateDataNode() const {
    pugi::xml_node root = doc_.document_element();
    if (!root) return pugi::xml_node();

    pugi::xml_node fallback;
    for (pugi::xml_node child = root.first_child(); child; child = child.next_sibling()) {
        if (child.type() != pugi::node_element) continue;
        if (XmlUtil::localName(child) != "data") continue;
        if (XmlUtil::namespaceUri(child) == XFA_DATA_NS) {
            return child;
        }
        // Some producers write a bare <data> without the prefix binding
        if (!fallback && std::string(child.name()) == "data") {
            fallback = child;
        }
    }
    return fallback;
}

bool XfaDatasets::claimForAssembly() {
    if (claimed_) return false;
    claimed_ = true;
    return true;
}

std::string XfaDatasets::serialize() const {
    // Declarations are not parsed (no parse_declaration), so none is written back
    std::ostringstream out;
    doc_.save(out, "", pugi::format_raw | pugi::format_no_declaration);
    return out.str();
}

} // namespace DrawForm

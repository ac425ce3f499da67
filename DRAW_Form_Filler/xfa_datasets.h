#ifndef DRAWFORM_XFA_DATASETS_H
#define DRAWFORM_XFA_DATASETS_H

#include <string>

#include <pugixml.hpp>

namespace DrawForm {

// XFA data namespace of the datasets packet (xfa:datasets / xfa:data)
extern const char* const XFA_DATA_NS;

// Parse options shared by every template tree: whitespace-only text is
// content (a field holding " ", a run holding one preserved space)
extern const unsigned int XML_PARSE_OPTIONS;

// Parsed XFA "datasets" packet. Owns the XML tree that the tree assembler
// mutates; locate() is the precondition check for the tree target.
class XfaDatasets {
public:
    XfaDatasets();
    XfaDatasets(const XfaDatasets&) = delete;
    XfaDatasets& operator=(const XfaDatasets&) = delete;

    // Parse the packet and find its data node. Throws TemplateStructureError
    // when the XML is malformed or no xfa:data element exists.
    void load(const std::string& xml);

    bool isLoaded() const { return static_cast<bool>(data_); }

    pugi::xml_node dataNode() const { return data_; }

    // One assembly per handle. Returns false if an assembler already ran.
    bool claimForAssembly();

    // Compact XML without a declaration, as the datasets stream stores it
    std::string serialize() const;

private:
    pugi::xml_document doc_;
    pugi::xml_node data_;
    bool claimed_;

    pugi::xml_node locateDataNode() const;
};

namespace XmlUtil {
    // "xfa:data" -> "data"
    std::string localName(const pugi::xml_node& element);

    // Namespace URI bound to the element's prefix, searching xmlns
    // declarations on the element and its ancestors. Empty if unbound.
    std::string namespaceUri(const pugi::xml_node& element);

    // Follow a '/'-separated chain of child element names. Empty handle if
    // any step is missing.
    pugi::xml_node findPath(const pugi::xml_node& base, const std::string& path);

    // Text of the first child text node, or "" for empty elements
    std::string elementText(const pugi::xml_node& element);
}

} // namespace DrawForm

#endif // DRAWFORM_XFA_DATASETS_H

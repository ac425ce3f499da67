#include "docx_table.h"
#include "fill_common.h"
#include "xfa_datasets.h"

#include <cstdlib>
#include <cstring>
#include <sstream>

namespace DrawForm {

static const char* const DOCUMENT_PART = "word/document.xml";

// ============================================================================
// WordprocessingML helpers
// ============================================================================

static bool hasName(const pugi::xml_node& node, const char* name) {
    return node.type() == pugi::node_element && std::strcmp(node.name(), name) == 0;
}

static int intAttribute(const pugi::xml_node& element, int fallback) {
    if (!element) return fallback;
    pugi::xml_attribute val = element.attribute("w:val");
    if (!val) return fallback;
    int parsed = std::atoi(val.value());
    return parsed > 0 ? parsed : fallback;
}

static int gridBefore(const pugi::xml_node& tr) {
    return intAttribute(tr.child("w:trPr").child("w:gridBefore"), 0);
}

static int gridSpan(const pugi::xml_node& tc) {
    return intAttribute(tc.child("w:tcPr").child("w:gridSpan"), 1);
}

static bool isMergeContinuation(const pugi::xml_node& tc) {
    pugi::xml_node vMerge = tc.child("w:tcPr").child("w:vMerge");
    if (!vMerge) return false;
    pugi::xml_attribute val = vMerge.attribute("w:val");
    return !val || std::strcmp(val.value(), "continue") == 0;
}

static void appendTextElement(pugi::xml_node run, const std::string& text) {
    if (text.empty()) return;
    pugi::xml_node t = run.append_child("w:t");
    if (text.front() == ' ' || text.back() == ' ') {
        t.append_attribute("xml:space") = "preserve";
    }
    t.text().set(text.c_str());
}

// Tabs become <w:tab/>, CR and LF each become <w:br/>
static void appendRun(pugi::xml_node paragraph, const std::string& text, bool bold) {
    pugi::xml_node run = paragraph.append_child("w:r");
    if (bold) {
        run.append_child("w:rPr").append_child("w:b");
    }

    std::string pending;
    for (char ch : text) {
        if (ch == '\t' || ch == '\n' || ch == '\r') {
            appendTextElement(run, pending);
            pending.clear();
            run.append_child(ch == '\t' ? "w:tab" : "w:br");
        } else {
            pending.push_back(ch);
        }
    }
    appendTextElement(run, pending);
}

static std::string runText(const pugi::xml_node& run) {
    std::string out;
    for (pugi::xml_node child = run.first_child(); child; child = child.next_sibling()) {
        if (hasName(child, "w:t")) {
            out += child.child_value();
        } else if (hasName(child, "w:tab")) {
            out += "\t";
        } else if (hasName(child, "w:br") || hasName(child, "w:cr")) {
            out += "\n";
        }
    }
    return out;
}

// ============================================================================
// DocxTable Implementation
// ============================================================================

DocxTable::DocxTable(const pugi::xml_node& tbl)
    : tbl_(tbl) {
    refreshRows();
}

void DocxTable::refreshRows() {
    rows_.clear();
    for (pugi::xml_node tr = tbl_.child("w:tr"); tr; tr = tr.next_sibling("w:tr")) {
        rows_.push_back(tr);
    }
}

pugi::xml_node DocxTable::row(int index) const {
    if (index < 0 || index >= rowCount()) return pugi::xml_node();
    return rows_[static_cast<size_t>(index)];
}

pugi::xml_node DocxTable::cellAtGridColumn(int rowIndex, int column, int* startColumn) const {
    pugi::xml_node tr = row(rowIndex);
    if (!tr || column < 0) return pugi::xml_node();

    int col = gridBefore(tr);
    for (pugi::xml_node tc = tr.child("w:tc"); tc; tc = tc.next_sibling("w:tc")) {
        int span = gridSpan(tc);
        if (column >= col && column < col + span) {
            if (startColumn) *startColumn = col;
            return tc;
        }
        col += span;
    }
    return pugi::xml_node();
}

pugi::xml_node DocxTable::cell(int rowIndex, int column) const {
    int start = 0;
    pugi::xml_node tc = cellAtGridColumn(rowIndex, column, &start);
    if (!tc || !isMergeContinuation(tc)) return tc;

    for (int above = rowIndex - 1; above >= 0; --above) {
        int aboveStart = 0;
        pugi::xml_node candidate = cellAtGridColumn(above, start, &aboveStart);
        if (!candidate) break;
        if (!isMergeContinuation(candidate)) return candidate;
    }
    return tc;
}

bool DocxTable::insertRowCopyAfter(int anchorRow, const pugi::xml_node& source) {
    pugi::xml_node anchor = row(anchorRow);
    if (!anchor || !source) return false;
    if (!tbl_.insert_copy_after(source, anchor)) return false;
    refreshRows();
    return true;
}

bool DocxTable::setCellText(int rowIndex, int column, const std::string& text) {
    pugi::xml_node tc = cell(rowIndex, column);
    if (!tc) return false;

    // Keep cell properties (width, borders, merge state); drop the content
    pugi::xml_node child = tc.first_child();
    while (child) {
        pugi::xml_node next = child.next_sibling();
        if (!hasName(child, "w:tcPr")) {
            tc.remove_child(child);
        }
        child = next;
    }

    appendRun(tc.append_child("w:p"), text, false);
    return true;
}

bool DocxTable::appendCellLabel(int rowIndex, int column, const std::string& text) {
    pugi::xml_node tc = cell(rowIndex, column);
    if (!tc) return false;

    pugi::xml_node last;
    for (pugi::xml_node p = tc.child("w:p"); p; p = p.next_sibling("w:p")) {
        last = p;
    }
    if (!last) {
        return setCellText(rowIndex, column, text);
    }
    appendRun(last, " " + text, true);
    return true;
}

std::string DocxTable::cellText(int rowIndex, int column) const {
    pugi::xml_node tc = cell(rowIndex, column);
    if (!tc) return "";

    std::string out;
    bool first = true;
    for (pugi::xml_node p = tc.child("w:p"); p; p = p.next_sibling("w:p")) {
        if (!first) out += "\n";
        first = false;
        for (pugi::xml_node r = p.child("w:r"); r; r = r.next_sibling("w:r")) {
            out += runText(r);
        }
    }
    return out;
}

// ============================================================================
// DocxTemplate Implementation
// ============================================================================

DocxTemplate::DocxTemplate()
    : claimed_(false) {
}

void DocxTemplate::open(const std::string& docxPath) {
    if (!package_.load(docxPath)) {
        throw TemplateStructureError("Failed to open DOCX template " + docxPath + ": " +
                                     package_.getLastError());
    }
    locateTable();
}

void DocxTemplate::openFromMemory(const std::vector<uint8_t>& packageData) {
    if (!package_.loadFromMemory(packageData)) {
        throw TemplateStructureError("Failed to read DOCX package: " + package_.getLastError());
    }
    locateTable();
}

void DocxTemplate::locateTable() {
    table_.reset();
    claimed_ = false;

    std::string xml;
    if (!package_.readEntry(DOCUMENT_PART, xml)) {
        throw TemplateStructureError("DOCX package has no readable " + std::string(DOCUMENT_PART) +
                                     ": " + package_.getLastError());
    }

    // Keep the part's own declaration (Word writes standalone="yes")
    pugi::xml_parse_result result = document_.load_buffer(
        xml.data(), xml.size(), XML_PARSE_OPTIONS | pugi::parse_declaration);
    if (!result) {
        throw TemplateStructureError(std::string("word/document.xml is not well-formed XML: ") +
                                     result.description());
    }

    pugi::xml_node root = document_.document_element();
    if (!root || XmlUtil::localName(root) != "document") {
        throw TemplateStructureError("word/document.xml has no w:document root");
    }
    pugi::xml_node body = root.child("w:body");
    if (!body) {
        throw TemplateStructureError("word/document.xml has no w:body");
    }
    pugi::xml_node tbl = body.child("w:tbl");
    if (!tbl) {
        throw TemplateStructureError("DOCX template body contains no table");
    }

    table_.reset(new DocxTable(tbl));
}

DocxTable& DocxTemplate::table() {
    if (!table_) {
        throw TemplateStructureError("DOCX template not open");
    }
    return *table_;
}

bool DocxTemplate::claimForAssembly() {
    if (claimed_) return false;
    claimed_ = true;
    return true;
}

std::string DocxTemplate::serializeDocument() const {
    std::ostringstream out;
    document_.save(out, "", pugi::format_raw | pugi::format_no_declaration);
    return out.str();
}

std::vector<uint8_t> DocxTemplate::saveToMemory() {
    if (!table_) {
        throw TemplateStructureError("DOCX template not open");
    }
    std::vector<uint8_t> data;
    if (!package_.replaceEntry(DOCUMENT_PART, serializeDocument()) || !package_.saveToMemory(data)) {
        throw TemplateStructureError("Failed to rebuild DOCX package: " + package_.getLastError());
    }
    return data;
}

void DocxTemplate::save(const std::string& outputPath) {
    if (!table_) {
        throw TemplateStructureError("DOCX template not open");
    }
    if (!package_.replaceEntry(DOCUMENT_PART, serializeDocument())) {
        throw TemplateStructureError("Failed to rebuild DOCX package: " + package_.getLastError());
    }

    std::string tmpPath = FileUtil::temporarySiblingPath(outputPath);
    if (!package_.save(tmpPath)) {
        FileUtil::discardTemporaryFile(tmpPath);
        throw TemplateStructureError("Failed to write DOCX " + outputPath + ": " +
                                     package_.getLastError());
    }

    std::string error;
    if (!FileUtil::commitTemporaryFile(tmpPath, outputPath, error)) {
        throw TemplateStructureError(error);
    }
}

} // namespace DrawForm

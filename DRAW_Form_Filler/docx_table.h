#ifndef DRAWFORM_DOCX_TABLE_H
#define DRAWFORM_DOCX_TABLE_H

#include <memory>
#include <string>
#include <vector>

#include <pugixml.hpp>

#include "zip_archive.h"

namespace DrawForm {

// WordprocessingML table addressed by (row, grid column). A cell spanning n
// grid columns (w:gridSpan) answers for all n of them, w:gridBefore shifts a
// row's first cell, and a vertically merged continuation cell (w:vMerge
// without "restart") resolves to the cell that opened the merge.
class DocxTable {
public:
    explicit DocxTable(const pugi::xml_node& tbl);

    int rowCount() const { return static_cast<int>(rows_.size()); }
    pugi::xml_node row(int index) const;

    // Empty handle when the address falls outside the grid
    pugi::xml_node cell(int row, int column) const;

    // Insert a deep copy of source (typically a row held in a snapshot
    // document) directly after anchorRow. Returns false if the anchor does
    // not exist.
    bool insertRowCopyAfter(int anchorRow, const pugi::xml_node& source);

    // Replace the cell's content with one paragraph holding one run
    bool setCellText(int row, int column, const std::string& text);

    // Append " text" as a bold run to the cell's last paragraph, keeping the
    // printed label that the template already carries
    bool appendCellLabel(int row, int column, const std::string& text);

    // Concatenated run text of a cell; line breaks read back as '\n'
    std::string cellText(int row, int column) const;

private:
    pugi::xml_node tbl_;
    std::vector<pugi::xml_node> rows_;

    void refreshRows();
    pugi::xml_node cellAtGridColumn(int row, int column, int* startColumn) const;
};

// Template handle for the tabular target: the DOCX package and its parsed
// main document part. The grid is the first table in the document body.
class DocxTemplate {
public:
    DocxTemplate();
    DocxTemplate(const DocxTemplate&) = delete;
    DocxTemplate& operator=(const DocxTemplate&) = delete;

    // Throws TemplateStructureError when the package, word/document.xml or
    // the body table is missing
    void open(const std::string& docxPath);
    void openFromMemory(const std::vector<uint8_t>& packageData);

    DocxTable& table();

    bool claimForAssembly();

    // Re-deflate word/document.xml and write the package via a temporary
    // file. Throws TemplateStructureError.
    void save(const std::string& outputPath);
    std::vector<uint8_t> saveToMemory();

private:
    ZipArchive package_;
    pugi::xml_document document_;
    std::unique_ptr<DocxTable> table_;
    bool claimed_;

    void locateTable();
    std::string serializeDocument() const;
};

} // namespace DrawForm

#endif // DRAWFORM_DOCX_TABLE_H

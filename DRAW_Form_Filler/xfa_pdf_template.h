// XFA form template access through the QPDF C++ library
//
// The DD2977 PDF keeps its form values in the "datasets" packet of the
// /AcroForm /XFA array: [ (preamble) stream (config) stream ... (datasets) stream ... ].
// Only that stream is rewritten; every other object is carried over by QPDFWriter.

#ifndef DRAWFORM_XFA_PDF_TEMPLATE_H
#define DRAWFORM_XFA_PDF_TEMPLATE_H

#include <memory>
#include <string>

#include <qpdf/QPDF.hh>
#include <qpdf/QPDFObjectHandle.hh>

#include "xfa_datasets.h"

namespace DrawForm {

// Template handle for the tree target. Owns the open QPDF document and the
// parsed datasets tree; both are released when the handle goes out of scope.
class XfaPdfTemplate {
public:
    XfaPdfTemplate();
    ~XfaPdfTemplate();
    XfaPdfTemplate(const XfaPdfTemplate&) = delete;
    XfaPdfTemplate& operator=(const XfaPdfTemplate&) = delete;

    // Open the PDF and locate its datasets packet. Throws TemplateStructureError.
    void open(const std::string& pdfPath);

    XfaDatasets& datasets() { return datasets_; }

    // Number of entries in the /XFA array (names and streams)
    int packetCount() const { return packetCount_; }

    // Replace the datasets stream with the serialized tree and write the
    // whole PDF. Output goes to a temporary file that is renamed into place,
    // so a failed save leaves no partial output. Throws TemplateStructureError.
    void save(const std::string& outputPath);

    // Decoded bytes of a named XFA packet ("datasets", "template", ...)
    static std::string readPacket(QPDF& pdf, const std::string& packetName);

private:
    std::unique_ptr<QPDF> pdf_;
    QPDFObjectHandle datasetsStream_;
    XfaDatasets datasets_;
    std::string sourcePath_;
    int packetCount_;

    static QPDFObjectHandle findPacket(QPDF& pdf, const std::string& packetName, int* count);
};

} // namespace DrawForm

#endif // DRAWFORM_XFA_PDF_TEMPLATE_H

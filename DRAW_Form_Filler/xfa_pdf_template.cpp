#include "xfa_pdf_template.h"
#include "fill_common.h"

#include <exception>

#include <qpdf/Buffer.hh>
#include <qpdf/QPDFWriter.hh>

namespace DrawForm {

XfaPdfTemplate::XfaPdfTemplate()
    : packetCount_(0) {
}

XfaPdfTemplate::~XfaPdfTemplate() {
}

QPDFObjectHandle XfaPdfTemplate::findPacket(QPDF& pdf, const std::string& packetName, int* count) {
    QPDFObjectHandle root = pdf.getRoot();
    QPDFObjectHandle acroform = root.getKey("/AcroForm");
    if (!acroform.isDictionary()) {
        throw TemplateStructureError("No /AcroForm in PDF");
    }

    QPDFObjectHandle xfa = acroform.getKey("/XFA");
    if (!xfa.isArray()) {
        throw TemplateStructureError("No /XFA array found");
    }

    int n = xfa.getArrayNItems();
    if (count) *count = n;

    // [key, stream, key, stream, ...]
    for (int i = 0; i + 1 < n; i += 2) {
        QPDFObjectHandle key = xfa.getArrayItem(i);
        if (key.isString() && key.getUTF8Value() == packetName) {
            QPDFObjectHandle stream = xfa.getArrayItem(i + 1);
            if (!stream.isStream()) {
                throw TemplateStructureError("XFA packet '" + packetName + "' is not a stream");
            }
            return stream;
        }
    }

    throw TemplateStructureError(packetName + " XFA packet not found");
}

std::string XfaPdfTemplate::readPacket(QPDF& pdf, const std::string& packetName) {
    QPDFObjectHandle stream = findPacket(pdf, packetName, nullptr);
    std::shared_ptr<Buffer> data = stream.getStreamData(qpdf_dl_generalized);
    return std::string(reinterpret_cast<const char*>(data->getBuffer()), data->getSize());
}

void XfaPdfTemplate::open(const std::string& pdfPath) {
    pdf_.reset(new QPDF());
    sourcePath_ = pdfPath;

    try {
        pdf_->processFile(pdfPath.c_str());
        datasetsStream_ = findPacket(*pdf_, "datasets", &packetCount_);

        std::shared_ptr<Buffer> data = datasetsStream_.getStreamData(qpdf_dl_generalized);
        datasets_.load(std::string(reinterpret_cast<const char*>(data->getBuffer()),
                                   data->getSize()));
    } catch (TemplateStructureError&) {
        pdf_.reset();
        throw;
    } catch (std::exception& e) {
        pdf_.reset();
        throw TemplateStructureError("Failed to open template PDF " + pdfPath + ": " + e.what());
    }
}

void XfaPdfTemplate::save(const std::string& outputPath) {
    if (!pdf_ || !datasets_.isLoaded()) {
        throw TemplateStructureError("XFA template not open");
    }

    std::string tmpPath = FileUtil::temporarySiblingPath(outputPath);
    try {
        datasetsStream_.replaceStreamData(datasets_.serialize(),
                                          QPDFObjectHandle::newNull(),
                                          QPDFObjectHandle::newNull());

        QPDFWriter writer(*pdf_, tmpPath.c_str());
        writer.setStreamDataMode(qpdf_s_compress);
        writer.write();
    } catch (std::exception& e) {
        FileUtil::discardTemporaryFile(tmpPath);
        throw TemplateStructureError("Failed to write PDF " + outputPath + ": " + e.what());
    }

    std::string error;
    if (!FileUtil::commitTemporaryFile(tmpPath, outputPath, error)) {
        throw TemplateStructureError(error);
    }
}

} // namespace DrawForm

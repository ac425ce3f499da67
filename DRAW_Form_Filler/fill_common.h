#ifndef DRAWFORM_FILL_COMMON_H
#define DRAWFORM_FILL_COMMON_H

#include <stdexcept>
#include <string>
#include <vector>

namespace DrawForm {

// Raised when a template asset lacks the container or node the fill
// depends on (no /XFA datasets packet, no xfa:data, no table in the body).
// Always fatal for the assembly in progress.
class TemplateStructureError : public std::runtime_error {
public:
    explicit TemplateStructureError(const std::string& message)
        : std::runtime_error(message) {}
};

// Outcome of one assembly call. Fields the template instance does not carry
// are skipped and listed in missingFields; they never abort the fill.
struct AssemblyReport {
    std::vector<std::string> missingFields;
    int entriesWritten = 0;   // Hazard rows / row pairs populated
    int trailerRow = -1;      // Tabular target only: final overall-risk row index

    void noteMissing(const std::string& field) { missingFields.push_back(field); }
    bool complete() const { return missingFields.empty(); }
};

namespace FileUtil {
    // "<path>.partial" beside the final output; written first, then renamed
    std::string temporarySiblingPath(const std::string& finalPath);

    // Rename tmpPath over finalPath. Removes tmpPath and returns false on failure.
    bool commitTemporaryFile(const std::string& tmpPath, const std::string& finalPath,
                             std::string& error);

    // Copy sourcePath to "<finalPath>.staged" beside the destination, then
    // rename that over finalPath. finalPath is never partially written.
    bool copyIntoPlace(const std::string& sourcePath, const std::string& finalPath,
                       std::string& error);

    // Best-effort removal of a leftover temporary file
    void discardTemporaryFile(const std::string& tmpPath);

    // True when both paths name the same existing file
    bool samePath(const std::string& a, const std::string& b);

    bool readFile(const std::string& path, std::string& out, std::string& error);
}

} // namespace DrawForm

#endif // DRAWFORM_FILL_COMMON_H

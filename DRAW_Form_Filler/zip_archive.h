// zip_archive.h - Office Open XML package access through miniz
//
// The source archive stays open in a miniz reader over an owned buffer.
// Replaced parts are held uncompressed until save; every other entry is
// copied into the new archive with its compressed bytes untouched
// (mz_zip_writer_add_from_zip_reader), in the original order.

#ifndef DRAWFORM_ZIP_ARCHIVE_H
#define DRAWFORM_ZIP_ARCHIVE_H

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include <miniz.h>

namespace DrawForm {

class ZipArchive {
public:
    ZipArchive();
    ~ZipArchive();
    ZipArchive(const ZipArchive&) = delete;
    ZipArchive& operator=(const ZipArchive&) = delete;

    bool load(const std::string& filename);
    bool loadFromMemory(const std::vector<uint8_t>& data);

    bool hasEntry(const std::string& name) const;
    std::vector<std::string> entryNames() const { return names_; }

    // Decompress an entry; miniz verifies its CRC-32
    bool readEntry(const std::string& name, std::string& content);

    // Stage new content for an entry; appends the entry when it does not exist
    bool replaceEntry(const std::string& name, const std::string& content);

    bool save(const std::string& filename);
    bool saveToMemory(std::vector<uint8_t>& out);

    const std::string& getLastError() const { return lastError_; }

private:
    std::vector<uint8_t> storage_;     // Backing buffer of reader_
    mz_zip_archive reader_;
    bool readerOpen_;
    std::vector<std::string> names_;   // Entry order of the written archive
    std::map<std::string, std::string> replaced_;
    std::string lastError_;

    void close();
    int locate(const std::string& name);
    static std::string zipError(mz_zip_archive& zip);
};

} // namespace DrawForm

#endif // DRAWFORM_ZIP_ARCHIVE_H

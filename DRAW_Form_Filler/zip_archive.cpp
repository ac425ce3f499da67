#include "zip_archive.h"

#include <algorithm>
#include <cstring>
#include <fstream>
#include <iterator>

namespace DrawForm {

ZipArchive::ZipArchive()
    : readerOpen_(false) {
    std::memset(&reader_, 0, sizeof(reader_));
}

ZipArchive::~ZipArchive() {
    close();
}

void ZipArchive::close() {
    if (readerOpen_) {
        mz_zip_reader_end(&reader_);
        readerOpen_ = false;
    }
    std::memset(&reader_, 0, sizeof(reader_));
    storage_.clear();
    names_.clear();
    replaced_.clear();
}

std::string ZipArchive::zipError(mz_zip_archive& zip) {
    return mz_zip_get_error_string(mz_zip_get_last_error(&zip));
}

bool ZipArchive::load(const std::string& filename) {
    std::ifstream file(filename, std::ios::binary);
    if (!file.is_open()) {
        lastError_ = "Failed to open file: " + filename;
        return false;
    }
    std::vector<uint8_t> data((std::istreambuf_iterator<char>(file)),
                              std::istreambuf_iterator<char>());
    if (file.bad()) {
        lastError_ = "Failed to read file: " + filename;
        return false;
    }
    return loadFromMemory(data);
}

bool ZipArchive::loadFromMemory(const std::vector<uint8_t>& data) {
    close();
    lastError_.clear();

    storage_ = data;
    if (!mz_zip_reader_init_mem(&reader_, storage_.data(), storage_.size(), 0)) {
        lastError_ = "Not a ZIP archive: " + zipError(reader_);
        close();
        return false;
    }
    readerOpen_ = true;

    mz_uint count = mz_zip_reader_get_num_files(&reader_);
    for (mz_uint i = 0; i < count; ++i) {
        mz_zip_archive_file_stat stat;
        if (!mz_zip_reader_file_stat(&reader_, i, &stat)) {
            lastError_ = "Corrupt ZIP central directory entry " + std::to_string(i) + ": " +
                         zipError(reader_);
            close();
            return false;
        }
        if (stat.m_is_encrypted) {
            lastError_ = std::string("Encrypted ZIP entry not supported: ") + stat.m_filename;
            close();
            return false;
        }
        names_.push_back(stat.m_filename);
    }
    return true;
}

int ZipArchive::locate(const std::string& name) {
    if (!readerOpen_) return -1;
    return mz_zip_reader_locate_file(&reader_, name.c_str(), nullptr, 0);
}

bool ZipArchive::hasEntry(const std::string& name) const {
    return std::find(names_.begin(), names_.end(), name) != names_.end();
}

bool ZipArchive::readEntry(const std::string& name, std::string& content) {
    auto staged = replaced_.find(name);
    if (staged != replaced_.end()) {
        content = staged->second;
        return true;
    }

    int index = locate(name);
    if (index < 0) {
        lastError_ = "ZIP entry not found: " + name;
        return false;
    }

    size_t size = 0;
    void* data = mz_zip_reader_extract_to_heap(&reader_, static_cast<mz_uint>(index), &size, 0);
    if (!data) {
        lastError_ = name + ": " + zipError(reader_);
        return false;
    }
    content.assign(static_cast<const char*>(data), size);
    mz_free(data);
    return true;
}

bool ZipArchive::replaceEntry(const std::string& name, const std::string& content) {
    if (name.empty()) {
        lastError_ = "ZIP entry name is empty";
        return false;
    }
    if (!hasEntry(name)) {
        names_.push_back(name);
    }
    replaced_[name] = content;
    return true;
}

bool ZipArchive::saveToMemory(std::vector<uint8_t>& out) {
    out.clear();

    mz_zip_archive writer;
    std::memset(&writer, 0, sizeof(writer));
    if (!mz_zip_writer_init_heap(&writer, 0, 0)) {
        lastError_ = "Failed to start ZIP writer: " + zipError(writer);
        return false;
    }

    for (const auto& name : names_) {
        auto staged = replaced_.find(name);
        bool added;
        if (staged != replaced_.end()) {
            added = mz_zip_writer_add_mem(&writer, name.c_str(), staged->second.data(),
                                          staged->second.size(), MZ_DEFAULT_LEVEL);
        } else {
            int index = locate(name);
            added = index >= 0 &&
                    mz_zip_writer_add_from_zip_reader(&writer, &reader_, static_cast<mz_uint>(index));
        }
        if (!added) {
            lastError_ = "Failed to write ZIP entry " + name + ": " + zipError(writer);
            mz_zip_writer_end(&writer);
            return false;
        }
    }

    void* buffer = nullptr;
    size_t size = 0;
    if (!mz_zip_writer_finalize_heap_archive(&writer, &buffer, &size)) {
        lastError_ = "Failed to finalize ZIP archive: " + zipError(writer);
        mz_zip_writer_end(&writer);
        return false;
    }
    const uint8_t* bytes = static_cast<const uint8_t*>(buffer);
    out.assign(bytes, bytes + size);
    mz_free(buffer);
    mz_zip_writer_end(&writer);
    return true;
}

bool ZipArchive::save(const std::string& filename) {
    std::vector<uint8_t> data;
    if (!saveToMemory(data)) {
        return false;
    }

    std::ofstream file(filename, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        lastError_ = "Failed to create file: " + filename;
        return false;
    }
    file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    if (!file) {
        lastError_ = "Failed to write file: " + filename;
        return false;
    }
    return true;
}

} // namespace DrawForm

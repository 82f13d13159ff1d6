#include "io/zip_archive.hpp"
#include <cpl_conv.h>
#include <cpl_error.h>
#include <fstream>
#include <iostream>
#include <utility>
#include <vector>

namespace iotrans {
namespace io {

namespace {
const size_t COPY_BUFFER_SIZE = 1 << 20;
}

ZipArchive::ZipArchive(std::string zip_path)
    : zip_path_(std::move(zip_path)), handle_(nullptr) {}

ZipArchive::~ZipArchive() {
    if (handle_ && !close()) {
        std::cerr << "Warning: " << last_error_ << std::endl;
    }
}

bool ZipArchive::open() {
    clearError();
    if (handle_) {
        last_error_ = "Zip archive already open: " + zip_path_;
        return false;
    }

    handle_ = CPLCreateZip(zip_path_.c_str(), nullptr);
    if (!handle_) {
        last_error_ = "Failed to create zip archive: " + zip_path_ + " (" + CPLGetLastErrorMsg() + ")";
        return false;
    }
    return true;
}

bool ZipArchive::addFile(const std::string& file_path, const std::string& entry_name) {
    if (!handle_) {
        last_error_ = "Zip archive is not open: " + zip_path_;
        return false;
    }

    std::ifstream file(file_path, std::ios::in | std::ios::binary);
    if (!file.is_open()) {
        last_error_ = "Failed to open file for zipping: " + file_path;
        return false;
    }

    if (CPLCreateFileInZip(handle_, entry_name.c_str(), nullptr) != CE_None) {
        last_error_ = "Failed to add zip entry: " + entry_name;
        return false;
    }

    std::vector<char> buffer(COPY_BUFFER_SIZE);
    bool ok = true;
    while (file) {
        file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        std::streamsize read = file.gcount();
        if (read > 0 && CPLWriteFileInZip(handle_, buffer.data(), static_cast<int>(read)) != CE_None) {
            last_error_ = "Failed to write zip entry: " + entry_name;
            ok = false;
            break;
        }
    }

    if (ok && file.bad()) {
        last_error_ = "Failed to read file for zipping: " + file_path;
        ok = false;
    }

    if (CPLCloseFileInZip(handle_) != CE_None && ok) {
        last_error_ = "Failed to close zip entry: " + entry_name;
        ok = false;
    }
    return ok;
}

bool ZipArchive::close() {
    if (!handle_) {
        return true;
    }

    void* handle = handle_;
    handle_ = nullptr;
    if (CPLCloseZip(handle) != CE_None) {
        last_error_ = "Failed to finalize zip archive: " + zip_path_;
        return false;
    }
    return true;
}

} // namespace io
} // namespace iotrans

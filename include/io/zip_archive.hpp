#ifndef IOTRANS_ZIP_ARCHIVE_HPP
#define IOTRANS_ZIP_ARCHIVE_HPP

#include <string>

namespace iotrans {
namespace io {

/**
 * Write-only zip archive built on GDAL's CPL zip support
 */
class ZipArchive {
public:
    /**
     * @param zip_path Archive to create
     */
    explicit ZipArchive(std::string zip_path);

    /**
     * Closes the archive if still open
     */
    ~ZipArchive();

    // Disable copy constructor and assignment
    ZipArchive(const ZipArchive&) = delete;
    ZipArchive& operator=(const ZipArchive&) = delete;

    /**
     * Create the archive file
     * @return true if successful, false otherwise
     */
    bool open();

    /**
     * Copy a file into the archive
     * @param file_path File on disk
     * @param entry_name Name inside the archive
     * @return true if successful, false otherwise
     */
    bool addFile(const std::string& file_path, const std::string& entry_name);

    /**
     * Finish the archive (writes the central directory)
     * @return true if successful, false otherwise
     */
    bool close();

    const std::string& getPath() const { return zip_path_; }

    std::string getLastError() const { return last_error_; }
    void clearError() { last_error_.clear(); }

private:
    std::string zip_path_;
    void* handle_;
    std::string last_error_;
};

} // namespace io
} // namespace iotrans

#endif // IOTRANS_ZIP_ARCHIVE_HPP

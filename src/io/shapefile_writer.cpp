#include "io/shapefile_writer.hpp"
#include "io/csv_writer.hpp"
#include "io/zip_archive.hpp"
#include "core/errors.hpp"
#include <boost/filesystem.hpp>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <set>
#include <utility>

namespace iotrans {
namespace io {

namespace fs = boost::filesystem;

namespace {

const size_t SHAPEFILE_NAME_LIMIT = 10;
const size_t TRUNCATED_PREFIX_LENGTH = 7;
const char* const SHAPEFILE_DRIVER = "ESRI Shapefile";

// Sidecar extensions bundled with the .shp, in archive order
const std::vector<std::string> SHAPEFILE_EXTENSIONS = {".shp", ".shx", ".dbf", ".prj", ".cpg"};
const std::vector<std::string> REQUIRED_EXTENSIONS = {".shp", ".shx", ".dbf"};

/**
 * Directory that exists only for the lifetime of the object
 */
class ScratchDirectory {
public:
    explicit ScratchDirectory(fs::path path) : path_(std::move(path)), created_(false) {}

    ~ScratchDirectory() {
        if (!created_) {
            return;
        }
        boost::system::error_code ec;
        fs::remove_all(path_, ec);
        if (ec) {
            std::cerr << "Warning: Failed to remove scratch directory " << path_.string()
                      << ": " << ec.message() << std::endl;
        }
    }

    ScratchDirectory(const ScratchDirectory&) = delete;
    ScratchDirectory& operator=(const ScratchDirectory&) = delete;

    /**
     * @return false if the directory already exists or cannot be created
     */
    bool create(std::string& error) {
        boost::system::error_code ec;
        if (fs::exists(path_, ec)) {
            error = "Scratch directory already exists: " + path_.string();
            return false;
        }
        if (!fs::create_directory(path_, ec) || ec) {
            error = "Failed to create scratch directory " + path_.string() + ": " + ec.message();
            return false;
        }
        created_ = true;
        return true;
    }

    const fs::path& path() const { return path_; }

private:
    fs::path path_;
    bool created_;
};

std::string upperCase(const std::string& name) {
    std::string upper = name;
    for (auto& c : upper) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return upper;
}

} // namespace

std::string ShapefileWriter::utf8Prefix(const std::string& text, size_t max_bytes) {
    size_t length = std::min(max_bytes, text.size());
    // Never stop inside a multi-byte character
    while (length > 0 && length < text.size() &&
           (static_cast<unsigned char>(text[length]) & 0xC0) == 0x80) {
        --length;
    }
    return text.substr(0, length);
}

std::map<std::string, std::string> ShapefileWriter::buildColumnMap(const std::vector<std::string>& field_ids) {
    std::map<std::string, std::string> column_map;

    bool needs_truncation = false;
    for (const auto& id : field_ids) {
        if (id.size() > SHAPEFILE_NAME_LIMIT) {
            needs_truncation = true;
            break;
        }
    }
    if (!needs_truncation) {
        return column_map;
    }

    // dBASE field names compare case-insensitively
    std::set<std::string> used_names;

    for (size_t i = 0; i < field_ids.size(); ++i) {
        const std::string& id = field_ids[i];
        std::string sequence = std::to_string(i + 1);
        size_t prefix_length = std::min(TRUNCATED_PREFIX_LENGTH, SHAPEFILE_NAME_LIMIT - sequence.size());

        // "{prefix}{seq}" first; on a clash shorten the prefix, then try "{prefix}_{seq}"
        std::vector<std::string> candidates;
        for (size_t length = prefix_length + 1; length-- > 0;) {
            candidates.push_back(utf8Prefix(id, length) + sequence);
        }
        for (size_t length = SHAPEFILE_NAME_LIMIT - sequence.size(); length-- > 0;) {
            candidates.push_back(utf8Prefix(id, length) + "_" + sequence);
        }

        bool assigned = false;
        for (const auto& candidate : candidates) {
            if (used_names.insert(upperCase(candidate)).second) {
                column_map[id] = candidate;
                assigned = true;
                break;
            }
        }
        if (!assigned) {
            throw SchemaError("Cannot build a unique shapefile column name for field " + id);
        }
    }
    return column_map;
}

bool ShapefileWriter::writeFieldsFile(const std::string& file_path,
                                      const std::vector<std::string>& field_ids,
                                      const std::map<std::string, std::string>& column_map) {
    std::ofstream file(file_path, std::ios::out | std::ios::trunc | std::ios::binary);
    if (!file.is_open()) {
        last_error_ = "Failed to create fields file: " + file_path;
        return false;
    }

    file << CsvWriter::formatRow({"field", "name"}) << "\r\n";
    for (const auto& id : field_ids) {
        auto it = column_map.find(id);
        const std::string& name = it == column_map.end() ? id : it->second;
        file << CsvWriter::formatRow({name, id}) << "\r\n";
    }

    file.close();
    if (file.fail()) {
        last_error_ = "Failed to write fields file: " + file_path;
        return false;
    }
    return true;
}

bool ShapefileWriter::writeRecords(const ShapefileWriterConfig& config, RecordStream& records) {
    clearError();
    output_path_.clear();
    written_count_ = 0;

    fs::path nominal_path(config.output_file_path);
    std::string stem = nominal_path.stem().string();
    fs::path output_dir = nominal_path.parent_path();

    // Apply column map
    std::vector<std::string> field_ids;
    for (const auto& spec : config.fields) {
        field_ids.push_back(spec.source_id);
    }
    std::map<std::string, std::string> column_map;
    try {
        column_map = buildColumnMap(field_ids);
    } catch (const SchemaError& e) {
        last_error_ = e.what();
        return false;
    }

    OgrLayerWriterConfig layer_config;
    layer_config.driver_name = SHAPEFILE_DRIVER;
    layer_config.layer_name = stem;
    layer_config.target_epsg = config.target_epsg;
    layer_config.geometry_type = config.geometry_type;
    layer_config.layer_options = {"ENCODING=UTF-8"};
    for (const auto& spec : config.fields) {
        auto it = column_map.find(spec.source_id);
        layer_config.fields.emplace_back(spec.source_id,
                                         it == column_map.end() ? spec.source_id : it->second,
                                         spec.type);
    }

    ScratchDirectory scratch(output_dir / stem);
    if (!scratch.create(last_error_)) {
        return false;
    }
    layer_config.output_file_path = (scratch.path() / (stem + ".shp")).string();

    OgrLayerWriter layer_writer;
    if (!layer_writer.writeRecords(layer_config, records)) {
        last_error_ = layer_writer.getLastError();
        return false;
    }
    written_count_ = layer_writer.getWrittenCount();

    fs::path fields_file = scratch.path() / (fileSafeName(config.dataset_name) + " fields.csv");
    if (!writeFieldsFile(fields_file.string(), field_ids, column_map)) {
        return false;
    }

    // Collect the shapefile set
    std::vector<fs::path> bundle;
    for (const auto& extension : SHAPEFILE_EXTENSIONS) {
        fs::path part = scratch.path() / (stem + extension);
        if (fs::exists(part)) {
            bundle.push_back(part);
        } else if (std::find(REQUIRED_EXTENSIONS.begin(), REQUIRED_EXTENSIONS.end(), extension) !=
                   REQUIRED_EXTENSIONS.end()) {
            last_error_ = "Shapefile component missing: " + part.string();
            return false;
        }
    }
    bundle.push_back(fields_file);

    fs::path zip_path = output_dir / (stem + ".zip");
    ZipArchive archive(zip_path.string());
    if (!archive.open()) {
        last_error_ = archive.getLastError();
        return false;
    }
    for (const auto& part : bundle) {
        if (!archive.addFile(part.string(), part.filename().string())) {
            last_error_ = archive.getLastError();
            return false;
        }
    }
    if (!archive.close()) {
        last_error_ = archive.getLastError();
        return false;
    }

    output_path_ = zip_path.string();
    return true;
}

} // namespace io
} // namespace iotrans

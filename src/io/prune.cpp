#include "io/prune.hpp"
#include "core/errors.hpp"
#include <boost/filesystem.hpp>

namespace iotrans {
namespace io {

namespace fs = boost::filesystem;

namespace {

fs::path normalize(const std::string& path) {
    boost::system::error_code ec;
    fs::path absolute = fs::absolute(fs::path(path));
    // weakly_canonical resolves ".." and symlinks of the existing prefix
    fs::path canonical = fs::weakly_canonical(absolute, ec);
    return ec ? absolute.lexically_normal() : canonical;
}

bool isInside(const fs::path& path, const fs::path& root) {
    auto path_it = path.begin();
    for (auto root_it = root.begin(); root_it != root.end(); ++root_it, ++path_it) {
        // A trailing separator shows up as an empty or "." element
        if (root_it->empty() || *root_it == ".") {
            continue;
        }
        if (path_it == path.end() || *path_it != *root_it) {
            return false;
        }
    }
    return true;
}

} // namespace

std::string prunePath(const std::string& path, const std::string& storage_root) {
    if (path.empty()) {
        throw ValidationError("Input 'path' required");
    }

    fs::path target = normalize(path);
    fs::path root = normalize(storage_root);

    if (!isInside(target, root)) {
        throw ValidationError("Path " + target.string() + " is not inside the storage root " + root.string());
    }
    boost::system::error_code ec;
    if (target == root || fs::equivalent(target, root, ec)) {
        throw ValidationError("Refusing to prune the storage root itself: " + root.string());
    }
    if (!fs::exists(target, ec)) {
        throw ValidationError("Path does not exist: " + target.string());
    }

    // Directories go with their whole contents
    fs::remove_all(target, ec);
    if (ec) {
        throw IoError("Failed to remove " + target.string() + ": " + ec.message());
    }

    return target.string();
}

} // namespace io
} // namespace iotrans

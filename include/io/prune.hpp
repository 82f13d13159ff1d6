#ifndef IOTRANS_PRUNE_HPP
#define IOTRANS_PRUNE_HPP

#include <string>

namespace iotrans {
namespace io {

/**
 * Delete a file or directory produced under the storage root.
 * A directory has its contents removed first, then the directory itself.
 * @param path File or directory to delete
 * @param storage_root Root every deletable path must lie under
 * @return Normalized absolute path that was removed
 * @throws ValidationError if the path is outside the storage root, is the root itself or does not exist
 * @throws IoError if the deletion fails
 */
std::string prunePath(const std::string& path, const std::string& storage_root);

} // namespace io
} // namespace iotrans

#endif // IOTRANS_PRUNE_HPP

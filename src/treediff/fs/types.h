#ifndef TREEDIFF_FS_TYPES_H
#define TREEDIFF_FS_TYPES_H

#include <filesystem>

namespace treediff {

// file_path is the type used to represent paths to files (and directories).
typedef std::filesystem::path file_path;

} // namespace treediff

#endif

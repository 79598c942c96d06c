/**
 * @file FileSelection.h
 * @brief Expands user-selected paths into the upload list of a transfer
 */

#pragma once

#include "ControlMessage.h"
#include <cstdint>
#include <string>
#include <vector>

namespace SecureXfer {

/**
 * @brief One regular file that will be uploaded
 */
struct SelectedFile {
    std::string path;           ///< Local path
    std::string name;           ///< Base name
    uint64_t size = 0;
    std::string relativePath;   ///< Upload filename, '/' separated
};

struct FileSelectionResult {
    std::vector<SelectedFile> files;
    std::vector<std::string> warnings;   ///< Skipped entries, one line each

    uint64_t totalSize() const;
};

namespace FileSelection {

/**
 * @brief Expand files and directories into regular files
 *
 * A file is taken as-is with relativePath = its name. A directory is walked
 * recursively and every file below it gets a relativePath relative to the
 * directory's parent, so "photos/2024/a.jpg" keeps the "photos" prefix.
 * Missing or unreadable entries are skipped with a warning. Directory
 * symlinks are not followed. Files inside a directory are returned sorted.
 */
FileSelectionResult processPaths(const std::vector<std::string>& paths);

/**
 * @brief Build the request for a set of files
 *
 * fileName is the single file's relative path or "<N> items";
 * fileSize and totalSize are the summed sizes; fileType is left empty.
 */
TransferRequest buildRequest(const std::string& transferId, const std::string& senderName,
                             const std::vector<SelectedFile>& files);

}  // namespace FileSelection

}  // namespace SecureXfer

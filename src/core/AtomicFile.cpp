/**
 * @file AtomicFile.cpp
 * @brief Atomic file helpers implementation.
 */

#include "securexfer/AtomicFile.h"

#include <fstream>

namespace SecureXfer {

AtomicFilePaths computeAtomicFilePaths(const std::filesystem::path& finalPath)
{
    AtomicFilePaths out;
    out.finalPath = finalPath;
    out.tempPath = finalPath;
    out.tempPath += ".part";
    return out;
}

bool writeFileAtomically(const std::filesystem::path& finalPath,
                         const std::string& content,
                         std::string& errorMsg)
{
    errorMsg.clear();

    const AtomicFilePaths paths = computeAtomicFilePaths(finalPath);

    std::error_code ec;
    if (finalPath.has_parent_path()) {
        std::filesystem::create_directories(finalPath.parent_path(), ec);
        if (ec) {
            errorMsg = "Cannot create " + finalPath.parent_path().string() + ": " + ec.message();
            return false;
        }
    }

    {
        std::ofstream out(paths.tempPath, std::ios::binary | std::ios::trunc);
        if (!out) {
            errorMsg = "Cannot open " + paths.tempPath.string() + " for writing";
            return false;
        }
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
        out.flush();
        if (!out) {
            errorMsg = "Write to " + paths.tempPath.string() + " failed";
            out.close();
            std::filesystem::remove(paths.tempPath, ec);
            return false;
        }
    }

    // rename(2) replaces the destination atomically on POSIX
    std::filesystem::rename(paths.tempPath, finalPath, ec);
    if (ec) {
        errorMsg = std::string("rename failed: ") + ec.message();
        std::error_code removeEc;
        std::filesystem::remove(paths.tempPath, removeEc);
        return false;
    }

    return true;
}

}  // namespace SecureXfer

/**
 * @file FileSelection.cpp
 * @brief Path expansion for outgoing transfers
 */

#include "securexfer/FileSelection.h"
#include "securexfer/ThreadSafeLog.h"

#include <algorithm>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace SecureXfer {

uint64_t FileSelectionResult::totalSize() const {
    uint64_t total = 0;
    for (const auto& file : files) {
        total += file.size;
    }
    return total;
}

namespace FileSelection {

namespace {

void addWarning(FileSelectionResult& result, const std::string& warning) {
    ThreadSafeLog::warn("[FileSelection] " + warning);
    result.warnings.push_back(warning);
}

bool makeEntry(const fs::path& path, const fs::path& baseDir, SelectedFile& entry,
               std::string& errorMsg) {
    std::error_code ec;
    const uint64_t size = fs::file_size(path, ec);
    if (ec) {
        errorMsg = "Skipping " + path.string() + ": " + ec.message();
        return false;
    }

    entry.path = path.string();
    entry.name = path.filename().string();
    entry.size = size;
    if (baseDir.empty()) {
        entry.relativePath = entry.name;
    } else {
        entry.relativePath = path.lexically_relative(baseDir).generic_string();
    }
    return true;
}

void walkDirectory(const fs::path& dir, FileSelectionResult& result) {
    const fs::path baseDir = dir.parent_path();
    std::vector<SelectedFile> found;

    std::error_code ec;
    fs::recursive_directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        addWarning(result, "Skipping " + dir.string() + ": " + ec.message());
        return;
    }

    const fs::recursive_directory_iterator end;
    while (it != end) {
        const fs::path entryPath = it->path();

        std::error_code statusEc;
        if (it->is_regular_file(statusEc)) {
            SelectedFile entry;
            std::string errorMsg;
            if (makeEntry(entryPath, baseDir, entry, errorMsg)) {
                found.push_back(entry);
            } else {
                addWarning(result, errorMsg);
            }
        } else if (statusEc) {
            addWarning(result, "Skipping " + entryPath.string() + ": " + statusEc.message());
        }

        it.increment(ec);
        if (ec) {
            addWarning(result, "Stopped walking " + dir.string() + ": " + ec.message());
            break;
        }
    }

    std::sort(found.begin(), found.end(), [](const SelectedFile& a, const SelectedFile& b) {
        return a.relativePath < b.relativePath;
    });
    result.files.insert(result.files.end(), found.begin(), found.end());
}

}  // namespace

FileSelectionResult processPaths(const std::vector<std::string>& paths) {
    FileSelectionResult result;

    for (const auto& raw : paths) {
        if (raw.empty()) {
            continue;
        }

        // "dir/" would otherwise have an empty filename and a parent of "dir"
        fs::path path = fs::path(raw).lexically_normal();
        if (!path.has_filename() && path.has_parent_path()) {
            path = path.parent_path();
        }

        std::error_code ec;
        const fs::file_status status = fs::status(path, ec);
        if (ec || !fs::exists(status)) {
            addWarning(result, "Skipping " + raw + ": not found");
            continue;
        }

        if (fs::is_directory(status)) {
            walkDirectory(path, result);
        } else if (fs::is_regular_file(status)) {
            SelectedFile entry;
            std::string errorMsg;
            if (makeEntry(path, fs::path(), entry, errorMsg)) {
                result.files.push_back(entry);
            } else {
                addWarning(result, errorMsg);
            }
        } else {
            addWarning(result, "Skipping " + raw + ": not a regular file");
        }
    }

    return result;
}

TransferRequest buildRequest(const std::string& transferId, const std::string& senderName,
                             const std::vector<SelectedFile>& files) {
    TransferRequest request;
    request.transferId = transferId;
    request.senderName = senderName;
    request.fileCount = static_cast<uint32_t>(files.size());

    uint64_t total = 0;
    for (const auto& file : files) {
        total += file.size;
    }
    request.fileSize = total;
    request.totalSize = total;

    if (files.size() == 1) {
        request.fileName = files.front().relativePath;
    } else {
        request.fileName = std::to_string(files.size()) + " items";
    }
    return request;
}

}  // namespace FileSelection

}  // namespace SecureXfer

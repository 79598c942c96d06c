/**
 * @file FileTransfer.cpp
 * @brief Upload streaming: file sender and file receiver
 */

#include "securexfer/FileTransfer.h"
#include "securexfer/ErrorCodes.h"
#include "securexfer/ThreadSafeLog.h"

#include <algorithm>
#include <fstream>
#include <system_error>
#include <vector>

namespace SecureXfer {

//=============================================================================
// FileSender Implementation
//=============================================================================

FileSender::FileSender(const std::string& filePath, const std::string& uploadName)
    : m_filePath(filePath)
    , m_uploadName(uploadName)
    , m_fileSize(0)
{
}

bool FileSender::initialize(std::string& errorMsg) {
    std::error_code ec;
    const std::filesystem::path path(m_filePath);

    if (!std::filesystem::is_regular_file(path, ec)) {
        errorMsg = ErrorCodes::format(ErrorCodes::TRANSFER_FILE_FAILED,
                                      "Not a regular file: " + m_filePath);
        return false;
    }

    const auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        errorMsg = ErrorCodes::format(ErrorCodes::TRANSFER_FILE_FAILED,
                                      "Cannot read file size of " + m_filePath + ": " + ec.message());
        return false;
    }

    if (m_uploadName.empty()) {
        m_uploadName = path.filename().string();
    }
    if (m_uploadName.size() > MAX_UPLOAD_PATH_LENGTH) {
        errorMsg = ErrorCodes::format(ErrorCodes::TRANSFER_FILE_FAILED,
                                      "Upload name too long: " + m_uploadName);
        return false;
    }

    m_fileSize = static_cast<uint64_t>(size);
    return true;
}

bool FileSender::sendUpload(TransportStream& stream, const std::string& host,
                            const std::string& transferId, std::string& errorMsg,
                            ProgressCallback progress,
                            const std::atomic<bool>* cancelFlag)
{
    std::string ioError;
    if (!HttpUpload::writeRequestHead(stream, host, m_uploadName, transferId, m_fileSize, ioError)) {
        errorMsg = ErrorCodes::format(ErrorCodes::TRANSFER_STREAM_FAILED,
                                      "Failed to send upload head: " + ioError);
        return false;
    }

    if (!sendFileData(stream, errorMsg, std::move(progress), cancelFlag)) {
        return false;
    }

    UploadResponse response;
    if (!HttpUpload::readResponse(stream, response, ioError)) {
        errorMsg = ErrorCodes::format(ErrorCodes::TRANSFER_STREAM_FAILED,
                                      "No response to upload of " + m_uploadName + ": " + ioError);
        return false;
    }

    if (response.statusCode < 200 || response.statusCode >= 300) {
        errorMsg = ErrorCodes::format(ErrorCodes::TRANSFER_REJECTED_BY_RECEIVER,
                                      "Receiver answered " + std::to_string(response.statusCode) +
                                      " for " + m_uploadName + ": " +
                                      HttpUpload::responseMessage(response));
        return false;
    }

    return true;
}

bool FileSender::sendFileData(TransportStream& stream, std::string& errorMsg,
                              ProgressCallback progress, const std::atomic<bool>* cancelFlag)
{
    std::ifstream file(m_filePath, std::ios::binary);
    if (!file) {
        errorMsg = ErrorCodes::format(ErrorCodes::TRANSFER_FILE_FAILED,
                                      "Failed to open file for reading: " + m_filePath);
        return false;
    }

    std::vector<uint8_t> buffer(BUFFER_SIZE);
    uint64_t totalSent = 0;

    while (totalSent < m_fileSize) {
        if (cancelFlag && cancelFlag->load()) {
            errorMsg = ErrorCodes::format(ErrorCodes::TRANSFER_STREAM_FAILED, "Upload cancelled");
            return false;
        }

        const size_t want = static_cast<size_t>(
            std::min<uint64_t>(buffer.size(), m_fileSize - totalSent));
        file.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(want));
        const std::streamsize bytesRead = file.gcount();

        if (bytesRead <= 0) {
            // File shrank after initialize(); Content-Length can no longer be met
            errorMsg = ErrorCodes::format(ErrorCodes::TRANSFER_FILE_FAILED,
                                          "Unexpected end of file: " + m_filePath);
            return false;
        }

        std::string ioError;
        if (!stream.sendExact(buffer.data(), static_cast<size_t>(bytesRead), ioError)) {
            errorMsg = ErrorCodes::format(ErrorCodes::TRANSFER_STREAM_FAILED,
                                          "Failed to send file chunk: " + ioError);
            return false;
        }

        totalSent += static_cast<uint64_t>(bytesRead);
        if (progress) {
            progress(totalSent, m_fileSize);
        }
    }

    return true;
}

//=============================================================================
// FileReceiver Implementation
//=============================================================================

FileReceiver::FileReceiver(const std::string& downloadDir)
    : m_downloadDir(downloadDir)
    , m_bytesReceived(0)
{
}

bool FileReceiver::resolveUploadPath(const std::string& downloadDir,
                                     const std::string& relativePath,
                                     std::filesystem::path& out,
                                     std::string& errorMsg)
{
    if (relativePath.empty()) {
        errorMsg = "Empty file name";
        return false;
    }
    if (relativePath.size() > MAX_UPLOAD_PATH_LENGTH) {
        errorMsg = "File name too long";
        return false;
    }
    if (relativePath.find('\0') != std::string::npos) {
        errorMsg = "File name contains NUL";
        return false;
    }

    std::string normalized = relativePath;
    std::replace(normalized.begin(), normalized.end(), '\\', '/');

    if (normalized.front() == '/' ||
        (normalized.size() >= 2 && normalized[1] == ':')) {
        errorMsg = "Absolute paths are not allowed: " + relativePath;
        return false;
    }

    std::filesystem::path result(downloadDir);
    bool hasComponent = false;
    size_t start = 0;
    while (start <= normalized.size()) {
        size_t slash = normalized.find('/', start);
        if (slash == std::string::npos) {
            slash = normalized.size();
        }
        const std::string component = normalized.substr(start, slash - start);
        start = slash + 1;

        if (component.empty() || component == ".") {
            continue;
        }
        if (component == "..") {
            errorMsg = "Path traversal rejected: " + relativePath;
            return false;
        }
        result /= component;
        hasComponent = true;
    }

    if (!hasComponent || normalized.back() == '/') {
        errorMsg = "File name has no file component: " + relativePath;
        return false;
    }

    out = result;
    return true;
}

bool FileReceiver::receiveUpload(UploadReader& reader, const UploadRequest& request,
                                 std::string& errorMsg, ProgressCallback progress)
{
    std::filesystem::path target;
    std::string pathError;
    if (!resolveUploadPath(m_downloadDir, request.filename, target, pathError)) {
        errorMsg = ErrorCodes::format(ErrorCodes::TRANSFER_PROTOCOL_ERROR, pathError);
        return false;
    }

    std::error_code ec;
    std::filesystem::create_directories(target.parent_path(), ec);
    if (ec) {
        errorMsg = ErrorCodes::format(ErrorCodes::TRANSFER_FILE_FAILED,
                                      "Failed to create directory " +
                                      target.parent_path().string() + ": " + ec.message());
        return false;
    }

    m_outputPath = target.string();

    std::ofstream file(target, std::ios::binary | std::ios::trunc);
    if (!file) {
        errorMsg = ErrorCodes::format(ErrorCodes::TRANSFER_FILE_FAILED,
                                      "Failed to open output file: " + m_outputPath);
        return false;
    }

    const uint64_t progressTotal = request.hasDeclaredSize ? request.declaredSize : 0;
    std::vector<uint8_t> buffer(BUFFER_SIZE);
    m_bytesReceived = 0;

    while (!reader.isDone()) {
        size_t received = 0;
        std::string ioError;
        const bool readOk = reader.readBody(buffer.data(), buffer.size(), received, ioError);

        if (received > 0) {
            file.write(reinterpret_cast<const char*>(buffer.data()),
                       static_cast<std::streamsize>(received));
            if (!file) {
                errorMsg = ErrorCodes::format(ErrorCodes::TRANSFER_FILE_FAILED,
                                              "Failed to write " + m_outputPath);
                return false;
            }
            m_bytesReceived += received;
            if (progress) {
                progress(m_bytesReceived, progressTotal);
            }
        }

        if (!readOk || (received == 0 && !reader.isDone())) {
            errorMsg = ErrorCodes::format(ErrorCodes::TRANSFER_STREAM_FAILED,
                                          "Upload interrupted after " +
                                          std::to_string(m_bytesReceived) + " bytes: " +
                                          (ioError.empty() ? std::string("no data") : ioError));
            return false;
        }
    }

    file.flush();
    if (!file) {
        errorMsg = ErrorCodes::format(ErrorCodes::TRANSFER_FILE_FAILED,
                                      "Failed to flush " + m_outputPath);
        return false;
    }

    ThreadSafeLog::info("Saved " + std::to_string(m_bytesReceived) + " bytes to " + m_outputPath);
    return true;
}

}  // namespace SecureXfer

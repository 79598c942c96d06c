/**
 * @file FileTransfer.h
 * @brief Upload streaming: file sender and file receiver
 */

#pragma once

#include "HttpUpload.h"
#include "TransportStream.h"
#include "config.h"
#include <atomic>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>

namespace SecureXfer {

/**
 * @brief Progress callback function type
 *
 * Called after every chunk written to or read from the stream.
 *
 * @param bytesTransferred Bytes of this file moved so far
 * @param totalBytes File size (0 when unknown)
 */
using ProgressCallback = std::function<void(uint64_t bytesTransferred, uint64_t totalBytes)>;

//=============================================================================
// FileSender Class
//=============================================================================

/**
 * @class FileSender
 * @brief Streams one file as an HTTP upload
 *
 * Writes the POST head, streams the body in BUFFER_SIZE chunks and reads the
 * receiver's response. Partial data written before a failure stays on disk
 * on the receiving side. A non-2xx response fails with
 * TRANSFER_REJECTED_BY_RECEIVER.
 */
class FileSender {
public:
    /**
     * @param filePath Local file to send
     * @param uploadName Relative name on the receiver ("dir/sub/file.txt")
     */
    FileSender(const std::string& filePath, const std::string& uploadName);

    /**
     * @brief Check the file and read its size
     */
    bool initialize(std::string& errorMsg);

    /**
     * @brief Upload the file
     * @param stream Connected stream (TLS, fingerprint already checked)
     * @param host Value of the Host header
     * @param transferId Owning transfer
     * @param errorMsg Output error message, prefixed with an SXF-IO code
     * @param progress Optional per-chunk progress
     * @param cancelFlag Optional; checked between chunks
     * @return true once the receiver answered 2xx
     */
    bool sendUpload(TransportStream& stream, const std::string& host,
                    const std::string& transferId, std::string& errorMsg,
                    ProgressCallback progress = nullptr,
                    const std::atomic<bool>* cancelFlag = nullptr);

    uint64_t getFileSize() const { return m_fileSize; }
    const std::string& getUploadName() const { return m_uploadName; }

private:
    bool sendFileData(TransportStream& stream, std::string& errorMsg,
                      ProgressCallback progress, const std::atomic<bool>* cancelFlag);

    std::string m_filePath;
    std::string m_uploadName;
    uint64_t m_fileSize;
};

//=============================================================================
// FileReceiver Class
//=============================================================================

/**
 * @class FileReceiver
 * @brief Writes one upload body below the download directory
 *
 * Intermediate directories are created. Existing files are overwritten.
 * On failure the partial file is left in place.
 */
class FileReceiver {
public:
    explicit FileReceiver(const std::string& downloadDir);

    /**
     * @brief Receive the upload body into the resolved path
     * @param reader Reader whose head has been read
     * @param request Parsed upload head
     * @param errorMsg Output error message, prefixed with an SXF-IO code
     * @param progress Optional; totalBytes is request.declaredSize, or 0 if absent
     */
    bool receiveUpload(UploadReader& reader, const UploadRequest& request,
                       std::string& errorMsg, ProgressCallback progress = nullptr);

    const std::string& getOutputPath() const { return m_outputPath; }
    uint64_t getBytesReceived() const { return m_bytesReceived; }

    /**
     * @brief Map an upload name to a path inside downloadDir
     * @param downloadDir Destination root
     * @param relativePath Upload name; '/' or '\\' separated
     * @param out Resolved path
     * @param errorMsg Set for empty, absolute or ".." names
     * @return false if the name would escape downloadDir
     */
    static bool resolveUploadPath(const std::string& downloadDir,
                                  const std::string& relativePath,
                                  std::filesystem::path& out,
                                  std::string& errorMsg);

private:
    std::string m_downloadDir;
    std::string m_outputPath;
    uint64_t m_bytesReceived;
};

}  // namespace SecureXfer

/**
 * @file HttpUpload.h
 * @brief HTTP/1.1 upload data channel on Boost.Beast
 *
 * One upload per TLS connection:
 * @code
 * POST /upload?filename=<pct-encoded>&id=<transferId>&size=<bytes> HTTP/1.1
 * Host: <ip>:<port>
 * Content-Type: application/octet-stream
 * Content-Length: <bytes>
 * Connection: close
 *
 * <body>
 * @endcode
 * The response is `200 OK` with {"message":"Success"}, or an error status
 * with {"error":"..."}.
 *
 * Beast does the HTTP framing; the bytes travel over TransportStream, so the
 * same code runs over TLS and over the in-memory stream used by tests.
 */

#pragma once

#include "TransportStream.h"
#include <boost/asio/buffer.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http.hpp>
#include <boost/system/error_code.hpp>
#include <boost/system/system_error.hpp>
#include <cstddef>
#include <cstdint>
#include <string>

namespace SecureXfer {

/**
 * @brief Parsed upload request head
 */
struct UploadRequest {
    std::string filename;         ///< Relative path under the download directory
    std::string transferId;       ///< Owning transfer
    uint64_t declaredSize = 0;    ///< "size" query parameter (progress denominator)
    bool hasDeclaredSize = false; ///< false: progress is indeterminate
    uint64_t contentLength = 0;   ///< Exact body length
};

/**
 * @brief Upload response as seen by the sender
 */
struct UploadResponse {
    int statusCode = 0;
    std::string reason;
    std::string body;
};

//=============================================================================
// HttpTransport Class
//=============================================================================

/**
 * @class HttpTransport
 * @brief Presents a TransportStream as a Beast SyncReadStream and SyncWriteStream
 *
 * A clean close is reported as asio::error::eof so Beast can tell a
 * complete message from a truncated one. The text of the last transport
 * failure is kept because it says more than the mapped error_code.
 */
class HttpTransport {
public:
    explicit HttpTransport(TransportStream& stream) : m_stream(stream) {}

    template <class MutableBufferSequence>
    std::size_t read_some(const MutableBufferSequence& buffers) {
        boost::system::error_code ec;
        const std::size_t n = read_some(buffers, ec);
        if (ec) {
            throw boost::system::system_error(ec);
        }
        return n;
    }

    template <class MutableBufferSequence>
    std::size_t read_some(const MutableBufferSequence& buffers, boost::system::error_code& ec) {
        for (auto it = boost::asio::buffer_sequence_begin(buffers);
             it != boost::asio::buffer_sequence_end(buffers); ++it) {
            const boost::asio::mutable_buffer buffer(*it);
            if (buffer.size() > 0) {
                return readSome(static_cast<uint8_t*>(buffer.data()), buffer.size(), ec);
            }
        }
        ec = {};
        return 0;
    }

    template <class ConstBufferSequence>
    std::size_t write_some(const ConstBufferSequence& buffers) {
        boost::system::error_code ec;
        const std::size_t n = write_some(buffers, ec);
        if (ec) {
            throw boost::system::system_error(ec);
        }
        return n;
    }

    template <class ConstBufferSequence>
    std::size_t write_some(const ConstBufferSequence& buffers, boost::system::error_code& ec) {
        for (auto it = boost::asio::buffer_sequence_begin(buffers);
             it != boost::asio::buffer_sequence_end(buffers); ++it) {
            const boost::asio::const_buffer buffer(*it);
            if (buffer.size() > 0) {
                return writeSome(static_cast<const uint8_t*>(buffer.data()), buffer.size(), ec);
            }
        }
        ec = {};
        return 0;
    }

    /**
     * @brief Transport failure text if there was one, else the Beast error text
     */
    std::string describe(const boost::system::error_code& ec) const;

private:
    std::size_t readSome(uint8_t* data, std::size_t size, boost::system::error_code& ec);
    std::size_t writeSome(const uint8_t* data, std::size_t size, boost::system::error_code& ec);

    TransportStream& m_stream;
    std::string m_lastError;
};

//=============================================================================
// UploadReader Class
//=============================================================================

/**
 * @class UploadReader
 * @brief Listener side of one upload connection
 *
 * Parses the request head, then hands the body out in caller-sized chunks
 * through a buffer_body parser. Bytes read past the head stay in the
 * parser's buffer and are delivered as body, so the body streams to disk
 * without being held in memory.
 */
class UploadReader {
public:
    explicit UploadReader(TransportStream& stream);

    /**
     * @brief Read and validate the request head
     * @param prefix Bytes the caller already consumed ("POST")
     * @param request Output head fields
     * @param errorMsg Output error (malformed head, wrong method or path,
     *        missing parameters, chunked or length-less body)
     */
    bool readHead(const std::string& prefix, UploadRequest& request, std::string& errorMsg);

    /**
     * @brief Read the next body chunk
     * @param received Bytes placed in buffer, also set when the read fails
     * @return false on a truncated body or transport failure
     */
    bool readBody(uint8_t* buffer, std::size_t capacity, std::size_t& received,
                  std::string& errorMsg);

    bool isDone() const { return m_parser.is_done(); }

private:
    HttpTransport m_transport;
    boost::beast::flat_buffer m_buffer;
    boost::beast::http::request_parser<boost::beast::http::buffer_body> m_parser;
};

namespace HttpUpload {

//=========================================================================
// URL Encoding
//=========================================================================

/**
 * @brief Percent-encode everything except RFC 3986 unreserved characters
 */
std::string urlEncode(const std::string& value);

/**
 * @brief Decode %XX escapes ('+' becomes a space)
 * @return false on a truncated or non-hex escape
 */
bool urlDecode(const std::string& value, std::string& out);

//=========================================================================
// Request
//=========================================================================

/**
 * @brief "/upload?filename=...&id=...&size=..."
 */
std::string buildTarget(const std::string& filename, const std::string& transferId,
                        uint64_t size);

/**
 * @brief Parse a request target into filename, id and declared size
 *
 * Requires path /upload with non-empty filename and id parameters. A
 * missing or non-numeric size leaves progress indeterminate.
 */
bool parseTarget(const std::string& target, UploadRequest& request, std::string& errorMsg);

/**
 * @brief Write the request head; the caller streams size body bytes after it
 */
bool writeRequestHead(TransportStream& stream, const std::string& host,
                      const std::string& filename, const std::string& transferId,
                      uint64_t size, std::string& errorMsg);

//=========================================================================
// Response
//=========================================================================

/**
 * @brief Write a complete response with a JSON body
 * @param statusCode HTTP status
 * @param message Success text (2xx) or error text
 */
bool writeResponse(TransportStream& stream, int statusCode, const std::string& message,
                   std::string& errorMsg);

/**
 * @brief Read and parse a complete response from the stream
 */
bool readResponse(TransportStream& stream, UploadResponse& response, std::string& errorMsg);

/**
 * @brief Text of the "message" or "error" field of a JSON response body
 */
std::string responseMessage(const UploadResponse& response);

}  // namespace HttpUpload

}  // namespace SecureXfer

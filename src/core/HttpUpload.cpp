/**
 * @file HttpUpload.cpp
 * @brief HTTP/1.1 upload data channel on Boost.Beast
 */

#include "securexfer/HttpUpload.h"
#include "securexfer/config.h"

#include <boost/asio/error.hpp>
#include <boost/optional.hpp>
#include <nlohmann/json.hpp>

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <limits>
#include <sstream>

namespace SecureXfer {

namespace http = boost::beast::http;

namespace {

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

bool parseUnsigned(const std::string& text, uint64_t& out) {
    if (text.empty() || text.size() > 20) {
        return false;
    }
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    errno = 0;
    char* end = nullptr;
    const unsigned long long value = std::strtoull(text.c_str(), &end, 10);
    if (errno == ERANGE || !end || *end != '\0') {
        return false;
    }
    out = static_cast<uint64_t>(value);
    return true;
}

std::string toString(boost::beast::string_view view) {
    return std::string(view.data(), view.size());
}

}  // namespace

//=============================================================================
// HttpTransport Implementation
//=============================================================================

std::size_t HttpTransport::readSome(uint8_t* data, std::size_t size,
                                    boost::system::error_code& ec) {
    std::string ioError;
    const std::size_t n = m_stream.recvSome(data, size, ioError);
    if (n > 0) {
        ec = {};
        return n;
    }
    if (ioError.empty()) {
        m_lastError = "Connection closed by peer";
        ec = boost::asio::error::eof;
    } else {
        m_lastError = ioError;
        ec = boost::asio::error::connection_reset;
    }
    return 0;
}

std::size_t HttpTransport::writeSome(const uint8_t* data, std::size_t size,
                                     boost::system::error_code& ec) {
    std::string ioError;
    if (!m_stream.sendExact(data, size, ioError)) {
        m_lastError = ioError;
        ec = boost::asio::error::broken_pipe;
        return 0;
    }
    ec = {};
    return size;
}

std::string HttpTransport::describe(const boost::system::error_code& ec) const {
    if (m_lastError.empty()) {
        return ec.message();
    }
    return m_lastError + " (" + ec.message() + ")";
}

//=============================================================================
// UploadReader Implementation
//=============================================================================

UploadReader::UploadReader(TransportStream& stream)
    : m_transport(stream)
{
    m_parser.header_limit(static_cast<std::uint32_t>(MAX_HTTP_HEAD_SIZE));
    // The body goes to disk chunk by chunk; the incoming size limit is
    // enforced by the listener against Content-Length
    m_parser.body_limit((std::numeric_limits<std::uint64_t>::max)());
}

bool UploadReader::readHead(const std::string& prefix, UploadRequest& request,
                            std::string& errorMsg) {
    m_buffer.commit(boost::asio::buffer_copy(m_buffer.prepare(prefix.size()),
                                             boost::asio::buffer(prefix)));

    boost::system::error_code ec;
    http::read_header(m_transport, m_buffer, m_parser, ec);
    if (ec) {
        errorMsg = "Malformed upload head: " + m_transport.describe(ec);
        return false;
    }

    const auto& header = m_parser.get();
    if (header.method() != http::verb::post) {
        errorMsg = "Unsupported method: " + toString(header.method_string());
        return false;
    }

    UploadRequest parsed;
    if (!HttpUpload::parseTarget(toString(header.target()), parsed, errorMsg)) {
        return false;
    }

    if (m_parser.chunked()) {
        errorMsg = "Chunked uploads are not supported";
        return false;
    }

    const boost::optional<std::uint64_t> length = m_parser.content_length();
    if (!length) {
        errorMsg = "Missing Content-Length";
        return false;
    }
    parsed.contentLength = *length;

    request = std::move(parsed);
    return true;
}

bool UploadReader::readBody(uint8_t* buffer, std::size_t capacity, std::size_t& received,
                            std::string& errorMsg) {
    received = 0;
    if (m_parser.is_done()) {
        return true;
    }

    auto& body = m_parser.get().body();
    body.data = buffer;
    body.size = capacity;

    boost::system::error_code ec;
    http::read(m_transport, m_buffer, m_parser, ec);
    received = capacity - body.size;

    // need_buffer only means the chunk is full
    if (ec == http::error::need_buffer) {
        ec = {};
    }
    if (ec) {
        errorMsg = m_transport.describe(ec);
        return false;
    }
    return true;
}

namespace HttpUpload {

//=============================================================================
// URL Encoding
//=============================================================================

std::string urlEncode(const std::string& value) {
    static const char kHex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(value.size() * 3);
    for (char c : value) {
        const unsigned char uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc) || c == '-' || c == '_' || c == '.' || c == '~') {
            out.push_back(c);
        } else {
            out.push_back('%');
            out.push_back(kHex[uc >> 4]);
            out.push_back(kHex[uc & 0x0F]);
        }
    }
    return out;
}

bool urlDecode(const std::string& value, std::string& out) {
    std::string decoded;
    decoded.reserve(value.size());
    for (size_t i = 0; i < value.size(); ++i) {
        const char c = value[i];
        if (c == '%') {
            if (i + 2 >= value.size()) {
                return false;
            }
            const int hi = hexValue(value[i + 1]);
            const int lo = hexValue(value[i + 2]);
            if (hi < 0 || lo < 0) {
                return false;
            }
            decoded.push_back(static_cast<char>((hi << 4) | lo));
            i += 2;
        } else if (c == '+') {
            decoded.push_back(' ');
        } else {
            decoded.push_back(c);
        }
    }
    out = std::move(decoded);
    return true;
}

//=============================================================================
// Request
//=============================================================================

std::string buildTarget(const std::string& filename, const std::string& transferId,
                        uint64_t size) {
    std::ostringstream oss;
    oss << UPLOAD_PATH
        << "?filename=" << urlEncode(filename)
        << "&id=" << urlEncode(transferId)
        << "&size=" << size;
    return oss.str();
}

bool parseTarget(const std::string& target, UploadRequest& request, std::string& errorMsg) {
    const size_t q = target.find('?');
    const std::string path = target.substr(0, q);
    if (path != UPLOAD_PATH) {
        errorMsg = "Unknown path: " + path;
        return false;
    }

    UploadRequest parsed;
    bool hasFilename = false;
    bool hasId = false;

    if (q != std::string::npos) {
        std::istringstream query(target.substr(q + 1));
        std::string pair;
        while (std::getline(query, pair, '&')) {
            if (pair.empty()) continue;
            const size_t eq = pair.find('=');
            std::string key;
            std::string value;
            if (!urlDecode(pair.substr(0, eq), key) ||
                !urlDecode(eq == std::string::npos ? std::string() : pair.substr(eq + 1), value)) {
                errorMsg = "Malformed query string";
                return false;
            }

            if (key == "filename") {
                parsed.filename = value;
                hasFilename = true;
            } else if (key == "id") {
                parsed.transferId = value;
                hasId = true;
            } else if (key == "size") {
                // Non-numeric size leaves progress indeterminate
                parsed.hasDeclaredSize = parseUnsigned(value, parsed.declaredSize);
            }
        }
    }

    if (!hasFilename || parsed.filename.empty()) {
        errorMsg = "Missing filename parameter";
        return false;
    }
    if (!hasId || parsed.transferId.empty() || parsed.transferId.size() > MAX_ID_LENGTH) {
        errorMsg = "Missing or invalid id parameter";
        return false;
    }

    request = std::move(parsed);
    return true;
}

bool writeRequestHead(TransportStream& stream, const std::string& host,
                      const std::string& filename, const std::string& transferId,
                      uint64_t size, std::string& errorMsg) {
    http::request<http::empty_body> request{http::verb::post,
                                            buildTarget(filename, transferId, size), 11};
    request.set(http::field::host, host);
    request.set(http::field::content_type, "application/octet-stream");
    request.set(http::field::connection, "close");
    request.content_length(size);

    HttpTransport transport(stream);
    http::request_serializer<http::empty_body> serializer{request};
    boost::system::error_code ec;
    http::write_header(transport, serializer, ec);
    if (ec) {
        errorMsg = transport.describe(ec);
        return false;
    }
    return true;
}

//=============================================================================
// Response
//=============================================================================

bool writeResponse(TransportStream& stream, int statusCode, const std::string& message,
                   std::string& errorMsg) {
    nlohmann::json body;
    if (statusCode >= 200 && statusCode < 300) {
        body["message"] = message;
    } else {
        body["error"] = message;
    }

    http::response<http::string_body> response{static_cast<http::status>(statusCode), 11};
    response.set(http::field::content_type, "application/json");
    response.keep_alive(false);
    response.body() = body.dump();
    response.prepare_payload();

    HttpTransport transport(stream);
    boost::system::error_code ec;
    http::write(transport, response, ec);
    if (ec) {
        errorMsg = transport.describe(ec);
        return false;
    }
    return true;
}

bool readResponse(TransportStream& stream, UploadResponse& response, std::string& errorMsg) {
    HttpTransport transport(stream);
    boost::beast::flat_buffer buffer;
    http::response_parser<http::string_body> parser;
    parser.header_limit(static_cast<std::uint32_t>(MAX_HTTP_HEAD_SIZE));
    parser.body_limit(MAX_HTTP_HEAD_SIZE);

    boost::system::error_code ec;
    http::read(transport, buffer, parser, ec);
    if (ec) {
        errorMsg = "Malformed upload response: " + transport.describe(ec);
        return false;
    }

    const auto& message = parser.get();
    UploadResponse parsed;
    parsed.statusCode = static_cast<int>(message.result_int());
    parsed.reason = toString(message.reason());
    parsed.body = message.body();

    response = std::move(parsed);
    return true;
}

std::string responseMessage(const UploadResponse& response) {
    const nlohmann::json body = nlohmann::json::parse(response.body, nullptr, false);
    if (body.is_object()) {
        for (const char* key : {"error", "message"}) {
            if (body.contains(key) && body[key].is_string()) {
                return body[key].get<std::string>();
            }
        }
    }
    return response.reason;
}

}  // namespace HttpUpload

}  // namespace SecureXfer

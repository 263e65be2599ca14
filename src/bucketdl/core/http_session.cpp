// Copyright (c) 2026 changcheng967. All rights reserved.

#include <bucketdl/core/http_session.hpp>
#include <bucketdl/core/config.hpp>
#include <curl/curl.h>
#include <cctype>
#include <cstdlib>
#include <string>

namespace bucketdl::core {

namespace {

constexpr std::size_t MAX_DOCUMENT_SIZE = 256 * 1024 * 1024;  // Listings, not objects

// RAII curl handle cleanup
struct CurlHandle {
    CURL* ptr = nullptr;

    CurlHandle() = default;
    explicit CurlHandle(CURL* c) : ptr(c) {}
    ~CurlHandle() { if (ptr) curl_easy_cleanup(ptr); }

    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;
};

// RAII header list
struct CurlHeaders {
    curl_slist* list = nullptr;

    CurlHeaders() = default;
    ~CurlHeaders() { if (list) curl_slist_free_all(list); }

    CurlHeaders(const CurlHeaders&) = delete;
    CurlHeaders& operator=(const CurlHeaders&) = delete;

    bool append(const std::string& header) noexcept {
        auto* next = curl_slist_append(list, header.c_str());
        if (!next) return false;
        list = next;
        return true;
    }
};

std::error_code curl_to_error(CURLcode code) noexcept {
    switch (code) {
        case CURLE_OK:                     return {};
        case CURLE_OPERATION_TIMEDOUT:     return make_error_code(DownloadErrc::timeout);
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:  return make_error_code(DownloadErrc::dns_error);
        case CURLE_COULDNT_CONNECT:        return make_error_code(DownloadErrc::refused);
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION:
        case CURLE_SSL_CERTPROBLEM:
        case CURLE_SSL_CIPHER:
        case CURLE_SSL_CACERT_BADFILE:     return make_error_code(DownloadErrc::ssl_error);
        case CURLE_TOO_MANY_REDIRECTS:     return make_error_code(DownloadErrc::too_many_redirects);
        case CURLE_RECV_ERROR:
        case CURLE_SEND_ERROR:
        case CURLE_PARTIAL_FILE:
        case CURLE_GOT_NOTHING:            return make_error_code(DownloadErrc::connection_lost);
        case CURLE_ABORTED_BY_CALLBACK:    return make_error_code(DownloadErrc::cancelled);
        case CURLE_RANGE_ERROR:            return make_error_code(DownloadErrc::invalid_range);
        default:                           return make_error_code(DownloadErrc::network_error);
    }
}

// Header callback for HEAD/GET responses
std::size_t header_callback(char* buffer, std::size_t size, std::size_t nitems, void* userdata) {
    std::size_t total = size * nitems;
    auto* headers = static_cast<std::map<std::string, std::string>*>(userdata);
    if (!headers) return total;

    std::string_view header(buffer, total);
    auto colon = header.find(':');
    if (colon == std::string_view::npos) return total;

    auto name = header.substr(0, colon);
    auto value = header.substr(colon + 1);

    // Trim whitespace and \r\n
    while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) {
        value.remove_prefix(1);
    }
    while (!value.empty() && (value.back() == '\r' || value.back() == '\n')) {
        value.remove_suffix(1);
    }

    std::string lower_name;
    lower_name.reserve(name.size());
    for (char c : name) {
        lower_name += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    (*headers)[lower_name] = std::string(value);
    return total;
}

// State shared with the ranged GET callbacks
struct RangeTransfer {
    CURL* curl{nullptr};
    const RangeSink* sink{nullptr};
    std::stop_token stop;
    std::uint64_t requested_start{0};
    std::uint64_t start_offset{0};
    std::uint64_t bytes_received{0};
    bool started{false};
    std::error_code sink_error;

    std::error_code begin() noexcept {
        started = true;
        long http_code = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
        // 200 to a range request means the server sent the whole object
        start_offset = (http_code == 206) ? requested_start : 0;
        return sink->begin ? sink->begin(start_offset) : std::error_code{};
    }
};

std::size_t range_write_callback(char* ptr, std::size_t size, std::size_t nmemb, void* userdata) noexcept {
    auto* t = static_cast<RangeTransfer*>(userdata);
    std::size_t bytes = size * nmemb;

    if (t->stop.stop_requested()) {
        t->sink_error = make_error_code(DownloadErrc::cancelled);
        return 0;
    }
    if (!t->started) {
        if (auto ec = t->begin()) {
            t->sink_error = ec;
            return 0;
        }
    }
    if (auto ec = t->sink->write(ptr, bytes)) {
        // Write failed - return 0 to abort the download
        t->sink_error = ec;
        return 0;
    }

    t->bytes_received += bytes;
    return bytes;
}

// libcurl progress callback - aborts once a stop is requested
int range_progress_callback(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) noexcept {
    auto* t = static_cast<RangeTransfer*>(userdata);
    return t->stop.stop_requested() ? 1 : 0;
}

std::size_t string_write_callback(char* ptr, std::size_t size, std::size_t nmemb, void* userdata) noexcept {
    auto* body = static_cast<std::string*>(userdata);
    std::size_t bytes = size * nmemb;
    if (body->size() + bytes > MAX_DOCUMENT_SIZE) {
        return 0;
    }
    try {
        body->append(ptr, bytes);
    } catch (const std::bad_alloc&) {
        return 0;
    }
    return bytes;
}

std::uint64_t parse_u64(const std::string& s) noexcept {
    if (s.empty()) return 0;
    char* end = nullptr;
    unsigned long long val = std::strtoull(s.c_str(), &end, 10);
    return (end == s.c_str() + s.size()) ? static_cast<std::uint64_t>(val) : 0;
}

} // namespace

//=============================================================================
// HttpSession
//=============================================================================

HttpSession::HttpSession(std::string endpoint, std::string token)
    : endpoint_(std::move(endpoint))
    , token_(std::move(token)) {
    while (!endpoint_.empty() && endpoint_.back() == '/') {
        endpoint_.pop_back();
    }
}

std::string HttpSession::escape_key(std::string_view key) {
    static constexpr char digits[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(key.size());
    for (unsigned char c : key) {
        if (std::isalnum(c) || c == '-' || c == '.' || c == '_' || c == '~' || c == '/') {
            out += static_cast<char>(c);
        } else {
            out += '%';
            out += digits[c >> 4];
            out += digits[c & 0x0F];
        }
    }
    return out;
}

std::string HttpSession::object_url(std::string_view key) const {
    return endpoint_ + "/" + escape_key(key);
}

std::error_code HttpSession::status_to_error(long http_code) noexcept {
    if (http_code < 400) return {};
    switch (http_code) {
        case 401: return make_error_code(DownloadErrc::authentication_failed);
        case 403: return make_error_code(DownloadErrc::permission_denied);
        case 404:
        case 410: return make_error_code(DownloadErrc::not_found);
        case 408: return make_error_code(DownloadErrc::timeout);
        case 416: return make_error_code(DownloadErrc::invalid_range);
        case 429: return make_error_code(DownloadErrc::throttled);
        default:  break;
    }
    if (http_code >= 500) {
        return make_error_code(DownloadErrc::server_error);
    }
    return make_error_code(DownloadErrc::invalid_argument);
}

std::expected<HttpResponse, std::error_code>
HttpSession::head(const std::string& url) noexcept {
    CurlHandle curl(curl_easy_init());
    if (!curl.ptr) {
        return std::unexpected(make_error_code(DownloadErrc::network_error));
    }

    HttpResponse response{};
    CurlHeaders headers;
    if (!token_.empty() && !headers.append("Authorization: Bearer " + token_)) {
        return std::unexpected(make_error_code(DownloadErrc::network_error));
    }

    curl_easy_setopt(curl.ptr, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.ptr, CURLOPT_NOBODY, 1L);
    curl_easy_setopt(curl.ptr, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.ptr, CURLOPT_MAXREDIRS, static_cast<long>(MAX_REDIRECTS));
    curl_easy_setopt(curl.ptr, CURLOPT_CONNECTTIMEOUT, static_cast<long>(CONNECTION_TIMEOUT_SEC));
    curl_easy_setopt(curl.ptr, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.ptr, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl.ptr, CURLOPT_SSL_VERIFYHOST, 2L);
    if (headers.list) {
        curl_easy_setopt(curl.ptr, CURLOPT_HTTPHEADER, headers.list);
    }

    curl_easy_setopt(curl.ptr, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl.ptr, CURLOPT_HEADERDATA, &response.headers);

    CURLcode result = curl_easy_perform(curl.ptr);
    if (result != CURLE_OK) {
        return std::unexpected(curl_to_error(result));
    }

    long http_code = 0;
    curl_easy_getinfo(curl.ptr, CURLINFO_RESPONSE_CODE, &http_code);
    response.status_code = static_cast<std::int32_t>(http_code);
    if (auto ec = status_to_error(http_code)) {
        return std::unexpected(ec);
    }

    // CURLINFO_CONTENT_LENGTH_DOWNLOAD_T doesn't work for HEAD
    if (auto it = response.headers.find("content-length"); it != response.headers.end()) {
        response.content_length = parse_u64(it->second);
    }
    if (auto it = response.headers.find("content-type"); it != response.headers.end()) {
        response.content_type = it->second;
    }
    if (auto it = response.headers.find("etag"); it != response.headers.end()) {
        response.etag = it->second;
    }
    if (auto it = response.headers.find("last-modified"); it != response.headers.end()) {
        response.last_modified = it->second;
    }
    auto ar_it = response.headers.find("accept-ranges");
    response.accepts_ranges = (ar_it != response.headers.end() && ar_it->second.find("bytes") != std::string::npos);

    return response;
}

std::expected<ObjectInfo, std::error_code>
HttpSession::head_object(std::string_view key) noexcept {
    try {
        auto response = head(object_url(key));
        if (!response) {
            return std::unexpected(response.error());
        }
        ObjectInfo info;
        info.size = response->content_length;
        info.checksum = response->etag;
        info.last_modified = response->last_modified;
        info.accepts_ranges = response->accepts_ranges;
        return info;
    } catch (const std::bad_alloc&) {
        return std::unexpected(make_error_code(DownloadErrc::network_error));
    }
}

std::expected<RangeResult, std::error_code>
HttpSession::get_object_range(std::string_view key,
                              std::uint64_t start_byte,
                              const RangeSink& sink,
                              std::stop_token stop) noexcept {
    if (!sink.write) {
        return std::unexpected(make_error_code(DownloadErrc::invalid_argument));
    }

    CurlHandle curl(curl_easy_init());
    if (!curl.ptr) {
        return std::unexpected(make_error_code(DownloadErrc::network_error));
    }

    std::string url;
    std::string range;
    CurlHeaders headers;
    try {
        url = object_url(key);
        if (start_byte > 0) {
            range = std::to_string(start_byte) + "-";
        }
        if (!token_.empty() && !headers.append("Authorization: Bearer " + token_)) {
            return std::unexpected(make_error_code(DownloadErrc::network_error));
        }
    } catch (const std::bad_alloc&) {
        return std::unexpected(make_error_code(DownloadErrc::network_error));
    }

    RangeTransfer transfer;
    transfer.curl = curl.ptr;
    transfer.sink = &sink;
    transfer.stop = std::move(stop);
    transfer.requested_start = start_byte;

    curl_easy_setopt(curl.ptr, CURLOPT_URL, url.c_str());
    if (!range.empty()) {
        curl_easy_setopt(curl.ptr, CURLOPT_RANGE, range.c_str());
    }
    if (headers.list) {
        curl_easy_setopt(curl.ptr, CURLOPT_HTTPHEADER, headers.list);
    }

    curl_easy_setopt(curl.ptr, CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(curl.ptr, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.ptr, CURLOPT_MAXREDIRS, static_cast<long>(MAX_REDIRECTS));
    curl_easy_setopt(curl.ptr, CURLOPT_CONNECTTIMEOUT, static_cast<long>(CONNECTION_TIMEOUT_SEC));
    curl_easy_setopt(curl.ptr, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl.ptr, CURLOPT_LOW_SPEED_TIME, static_cast<long>(STALL_TIMEOUT_SEC));
    curl_easy_setopt(curl.ptr, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.ptr, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl.ptr, CURLOPT_SSL_VERIFYHOST, 2L);
    curl_easy_setopt(curl.ptr, CURLOPT_BUFFERSIZE, static_cast<long>(WRITE_BUFFER_SIZE));
    curl_easy_setopt(curl.ptr, CURLOPT_TCP_NODELAY, 1L);

    curl_easy_setopt(curl.ptr, CURLOPT_WRITEFUNCTION, range_write_callback);
    curl_easy_setopt(curl.ptr, CURLOPT_WRITEDATA, &transfer);

    // Progress callback lets a stop request interrupt a stalled read
    curl_easy_setopt(curl.ptr, CURLOPT_XFERINFOFUNCTION, range_progress_callback);
    curl_easy_setopt(curl.ptr, CURLOPT_XFERINFODATA, &transfer);
    curl_easy_setopt(curl.ptr, CURLOPT_NOPROGRESS, 0L);

    CURLcode result = curl_easy_perform(curl.ptr);

    if (transfer.sink_error) {
        return std::unexpected(transfer.sink_error);
    }
    if (result == CURLE_HTTP_RETURNED_ERROR) {
        long http_code = 0;
        curl_easy_getinfo(curl.ptr, CURLINFO_RESPONSE_CODE, &http_code);
        return std::unexpected(status_to_error(http_code));
    }
    if (result != CURLE_OK) {
        return std::unexpected(curl_to_error(result));
    }

    // Empty body: the sink still learns where the object starts
    if (!transfer.started) {
        if (auto ec = transfer.begin()) {
            return std::unexpected(ec);
        }
    }

    return RangeResult{transfer.start_offset, transfer.bytes_received};
}

std::expected<std::string, std::error_code>
HttpSession::fetch(const std::string& url) noexcept {
    CurlHandle curl(curl_easy_init());
    if (!curl.ptr) {
        return std::unexpected(make_error_code(DownloadErrc::network_error));
    }

    std::string body;
    CurlHeaders headers;
    try {
        if (!token_.empty() && !headers.append("Authorization: Bearer " + token_)) {
            return std::unexpected(make_error_code(DownloadErrc::network_error));
        }
    } catch (const std::bad_alloc&) {
        return std::unexpected(make_error_code(DownloadErrc::network_error));
    }

    curl_easy_setopt(curl.ptr, CURLOPT_URL, url.c_str());
    if (headers.list) {
        curl_easy_setopt(curl.ptr, CURLOPT_HTTPHEADER, headers.list);
    }
    curl_easy_setopt(curl.ptr, CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(curl.ptr, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.ptr, CURLOPT_MAXREDIRS, static_cast<long>(MAX_REDIRECTS));
    curl_easy_setopt(curl.ptr, CURLOPT_CONNECTTIMEOUT, static_cast<long>(CONNECTION_TIMEOUT_SEC));
    curl_easy_setopt(curl.ptr, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.ptr, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl.ptr, CURLOPT_SSL_VERIFYHOST, 2L);
    curl_easy_setopt(curl.ptr, CURLOPT_WRITEFUNCTION, string_write_callback);
    curl_easy_setopt(curl.ptr, CURLOPT_WRITEDATA, &body);

    CURLcode result = curl_easy_perform(curl.ptr);
    if (result == CURLE_HTTP_RETURNED_ERROR) {
        long http_code = 0;
        curl_easy_getinfo(curl.ptr, CURLINFO_RESPONSE_CODE, &http_code);
        return std::unexpected(status_to_error(http_code));
    }
    if (result != CURLE_OK) {
        return std::unexpected(curl_to_error(result));
    }
    return body;
}

//=============================================================================
// Global CURL initialization
//=============================================================================

void HttpSession::global_init() noexcept {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

void HttpSession::global_cleanup() noexcept {
    curl_global_cleanup();
}

} // namespace bucketdl::core

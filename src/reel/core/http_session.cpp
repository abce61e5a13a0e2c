// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/core/http_session.hpp>
#include <reel/version.hpp>
#include <curl/curl.h>
#include <spdlog/spdlog.h>
#include <cctype>
#include <charconv>
#include <string>

namespace reel::core {

namespace {

// RAII curl handle cleanup
struct CurlHandle {
    CURL* ptr = nullptr;

    CurlHandle() = default;
    explicit CurlHandle(CURL* c) : ptr(c) {}
    ~CurlHandle() { if (ptr) curl_easy_cleanup(ptr); }

    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;
};

struct CurlHeaderList {
    curl_slist* ptr = nullptr;

    CurlHeaderList() = default;
    ~CurlHeaderList() { if (ptr) curl_slist_free_all(ptr); }

    CurlHeaderList(const CurlHeaderList&) = delete;
    CurlHeaderList& operator=(const CurlHeaderList&) = delete;

    void append(const std::string& line) noexcept {
        if (auto* next = curl_slist_append(ptr, line.c_str())) {
            ptr = next;
        }
    }
};

// Per-transfer state shared with the libcurl callbacks
struct Transfer {
    CURL* curl{nullptr};
    const BodySink* sink{nullptr};
    std::map<std::string, std::string> headers;
    std::uint64_t received{0};
    std::optional<ByteRange> range;
    std::int32_t status{0};
    bool status_checked{false};
    bool discard_body{false};
    bool sink_failed{false};
    bool range_ignored{false};
};

std::size_t header_callback(char* buffer, std::size_t size, std::size_t nitems, void* userdata) {
    std::size_t total = size * nitems;
    auto* transfer = static_cast<Transfer*>(userdata);
    if (!transfer) return total;

    std::string_view header(buffer, total);

    // A new status line starts a new response (redirect hop)
    if (header.starts_with("HTTP/")) {
        transfer->headers.clear();
        return total;
    }

    auto colon = header.find(':');
    if (colon == std::string_view::npos) return total;

    auto name = header.substr(0, colon);
    auto value = header.substr(colon + 1);

    while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) {
        value.remove_prefix(1);
    }
    while (!value.empty() && (value.back() == '\r' || value.back() == '\n' || value.back() == ' ')) {
        value.remove_suffix(1);
    }

    std::string lower_name;
    lower_name.reserve(name.size());
    for (char c : name) {
        lower_name += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    transfer->headers[lower_name] = std::string(value);
    return total;
}

std::size_t write_callback(char* ptr, std::size_t size, std::size_t nitems, void* userdata) {
    auto* transfer = static_cast<Transfer*>(userdata);
    if (!transfer) return 0;

    std::size_t total = size * nitems;

    if (!transfer->status_checked) {
        transfer->status_checked = true;
        long http_code = 0;
        curl_easy_getinfo(transfer->curl, CURLINFO_RESPONSE_CODE, &http_code);
        transfer->status = static_cast<std::int32_t>(http_code);

        // Error pages never reach the sink
        if (http_code >= 300) {
            transfer->discard_body = true;
        }
    }

    if (transfer->discard_body) {
        return total;
    }

    if (transfer->range) {
        std::optional<std::uint64_t> declared;
        if (auto it = transfer->headers.find("content-length"); it != transfer->headers.end()) {
            declared = parse_content_length(it->second);
        }
        if (range_ignored_by(transfer->status, *transfer->range, declared, transfer->received + total)) {
            transfer->range_ignored = true;
            return 0;
        }
    }

    if (transfer->sink && *transfer->sink && !(*transfer->sink)(ptr, total)) {
        transfer->sink_failed = true;
        return 0;
    }

    transfer->received += total;
    return total;
}

std::error_code curl_to_error(CURLcode code) noexcept {
    switch (code) {
        case CURLE_OPERATION_TIMEDOUT:     return make_error_code(FetchErrc::timeout);
        case CURLE_COULDNT_CONNECT:        return make_error_code(FetchErrc::refused);
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:  return make_error_code(FetchErrc::dns_error);
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION:
        case CURLE_SSL_CERTPROBLEM:
        case CURLE_SSL_CACERT_BADFILE:     return make_error_code(FetchErrc::ssl_error);
        case CURLE_TOO_MANY_REDIRECTS:     return make_error_code(FetchErrc::too_many_redirects);
        case CURLE_RECV_ERROR:
        case CURLE_SEND_ERROR:
        case CURLE_GOT_NOTHING:            return make_error_code(FetchErrc::connection_lost);
        case CURLE_PARTIAL_FILE:           return make_error_code(FetchErrc::short_read);
        case CURLE_URL_MALFORMAT:
        case CURLE_UNSUPPORTED_PROTOCOL:   return make_error_code(FetchErrc::invalid_url);
        case CURLE_HTTP_RETURNED_ERROR:    return make_error_code(FetchErrc::client_error);
        default:                           return make_error_code(FetchErrc::network_error);
    }
}

} // namespace

std::string ByteRange::header_value() const {
    return std::to_string(offset) + "-" + std::to_string(last());
}

std::optional<std::uint64_t> parse_content_length(std::string_view value) noexcept {
    while (!value.empty() && value.front() == ' ') value.remove_prefix(1);
    if (value.empty()) return std::nullopt;

    std::uint64_t result = 0;
    auto [end, ec] = std::from_chars(value.data(), value.data() + value.size(), result);
    if (ec != std::errc{} || end != value.data() + value.size()) {
        return std::nullopt;
    }
    return result;
}

bool range_ignored_by(std::int32_t status,
                      const ByteRange& range,
                      std::optional<std::uint64_t> content_length,
                      std::uint64_t received) noexcept {
    if (status != 200) {
        return false;
    }
    if (range.offset > 0) {
        return true;
    }
    if (content_length && *content_length > range.length) {
        return true;
    }
    return received > range.length;
}

//=============================================================================
// HttpSession
//=============================================================================

HttpSession::HttpSession() = default;

HttpSession::HttpSession(HttpOptions options)
    : options_(std::move(options)) {}

HttpSession::~HttpSession() = default;

HttpSession::HttpSession(HttpSession&& other) noexcept = default;

HttpSession& HttpSession::operator=(HttpSession&& other) noexcept = default;

namespace {

void apply_common_options(CURL* curl, const HttpOptions& options,
                          CurlHeaderList& header_list, Transfer& transfer) {
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, static_cast<long>(options.max_redirects));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, static_cast<long>(options.connect_timeout_sec));
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, static_cast<long>(options.stall_timeout_sec));
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, options.verify_tls ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, options.verify_tls ? 2L : 0L);
    curl_easy_setopt(curl, CURLOPT_HTTP_VERSION, CURL_HTTP_VERSION_2TLS);
    curl_easy_setopt(curl, CURLOPT_BUFFERSIZE, static_cast<long>(RECEIVE_BUFFER_SIZE));
    curl_easy_setopt(curl, CURLOPT_TCP_NODELAY, 1L);

    std::string agent = options.user_agent.empty()
        ? std::string(USER_AGENT_PRODUCT) + "/" + reel::version.to_string()
        : options.user_agent;
    curl_easy_setopt(curl, CURLOPT_USERAGENT, agent.c_str());  // libcurl copies strings

    for (const auto& [name, value] : options.headers) {
        header_list.append(name + ": " + value);
    }
    if (header_list.ptr) {
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list.ptr);
    }

    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &transfer);
}

void collect_response(CURL* curl, Transfer& transfer, HttpResponse& response) {
    long http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
    response.status_code = static_cast<std::int32_t>(http_code);

    char* effective = nullptr;
    if (curl_easy_getinfo(curl, CURLINFO_EFFECTIVE_URL, &effective) == CURLE_OK && effective) {
        response.effective_url = effective;
    }

    response.headers = std::move(transfer.headers);
    response.bytes_received = transfer.received;

    if (auto it = response.headers.find("content-length"); it != response.headers.end()) {
        response.content_length = parse_content_length(it->second);
    }
    if (auto it = response.headers.find("content-type"); it != response.headers.end()) {
        response.content_type = it->second;
    }
    auto ar_it = response.headers.find("accept-ranges");
    response.accepts_ranges = ar_it != response.headers.end()
        && ar_it->second.find("bytes") != std::string::npos;
}

} // namespace

std::expected<HttpResponse, std::error_code>
HttpSession::head(const std::string& url) noexcept {
    try {
        CurlHandle curl(curl_easy_init());
        if (!curl.ptr) {
            return std::unexpected(make_error_code(FetchErrc::network_error));
        }

        Transfer transfer;
        transfer.curl = curl.ptr;
        CurlHeaderList header_list;

        curl_easy_setopt(curl.ptr, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl.ptr, CURLOPT_NOBODY, 1L);
        apply_common_options(curl.ptr, options_, header_list, transfer);

        CURLcode result = curl_easy_perform(curl.ptr);
        if (result != CURLE_OK) {
            spdlog::debug("HEAD {} failed: {}", url, curl_easy_strerror(result));
            return std::unexpected(curl_to_error(result));
        }

        HttpResponse response;
        collect_response(curl.ptr, transfer, response);
        return response;
    } catch (const std::exception& e) {
        spdlog::error("HEAD {}: {}", url, e.what());
        return std::unexpected(make_error_code(FetchErrc::network_error));
    }
}

std::expected<HttpResponse, std::error_code>
HttpSession::get(const std::string& url,
                 const std::optional<ByteRange>& range,
                 const BodySink& sink) noexcept {
    try {
        CurlHandle curl(curl_easy_init());
        if (!curl.ptr) {
            return std::unexpected(make_error_code(FetchErrc::network_error));
        }

        Transfer transfer;
        transfer.curl = curl.ptr;
        transfer.sink = &sink;
        CurlHeaderList header_list;

        curl_easy_setopt(curl.ptr, CURLOPT_URL, url.c_str());

        std::string range_value;
        if (range && range->length > 0) {
            range_value = range->header_value();
            curl_easy_setopt(curl.ptr, CURLOPT_RANGE, range_value.c_str());
            transfer.range = range;
        }

        apply_common_options(curl.ptr, options_, header_list, transfer);
        curl_easy_setopt(curl.ptr, CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(curl.ptr, CURLOPT_WRITEDATA, &transfer);

        CURLcode result = curl_easy_perform(curl.ptr);
        if (result != CURLE_OK) {
            if (transfer.range_ignored) {
                return std::unexpected(make_error_code(FetchErrc::range_ignored));
            }
            if (transfer.sink_failed) {
                return std::unexpected(make_error_code(FetchErrc::sink_failed));
            }
            spdlog::debug("GET {} failed: {}", url, curl_easy_strerror(result));
            return std::unexpected(curl_to_error(result));
        }

        HttpResponse response;
        collect_response(curl.ptr, transfer, response);
        return response;
    } catch (const std::exception& e) {
        spdlog::error("GET {}: {}", url, e.what());
        return std::unexpected(make_error_code(FetchErrc::network_error));
    }
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

} // namespace reel::core

/**
 * @file CurlTransport.cpp
 * @brief libcurl transport for SecureHttpClient
 * @author Warden Security Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Warden Security. All rights reserved.
 */

#include <Warden/Core/HttpClient.hpp>
#include <Warden/Core/ErrorHandler.hpp>
#include <Warden/Core/Logger.hpp>

#include <curl/curl.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <memory>
#include <mutex>

namespace Warden::Network {

// ============================================================================
// Global cURL initialization
// ============================================================================

namespace {

std::once_flag g_curlInitFlag;
bool g_curlInitialized = false;

void initializeCurl() {
    std::call_once(g_curlInitFlag, []() {
        CURLcode res = curl_global_init(CURL_GLOBAL_ALL);
        g_curlInitialized = (res == CURLE_OK);
    });
}

// curl_global_cleanup() is not called; it is not thread-safe

// ============================================================================
// cURL callbacks
// ============================================================================

/// State shared with the callbacks of one transfer
struct TransferState {
    ResponseCollector* collector = nullptr;
    HttpHeaders* headers = nullptr;
    const std::atomic<bool>* cancel = nullptr;
};

size_t writeCallback(char* contents, size_t size, size_t nmemb, void* userp) {
    const size_t realsize = size * nmemb;
    auto* state = static_cast<TransferState*>(userp);

    if (!state->collector->onData(contents, realsize)) {
        return 0; // Aborts with CURLE_WRITE_ERROR
    }
    return realsize;
}

size_t headerCallback(char* buffer, size_t size, size_t nmemb, void* userp) {
    const size_t realsize = size * nmemb;
    auto* state = static_cast<TransferState*>(userp);

    std::string header(buffer, realsize);

    // A new status line starts a new header block
    if (header.rfind("HTTP/", 0) == 0) {
        state->headers->clear();
        return realsize;
    }

    size_t colonPos = header.find(':');
    if (colonPos == std::string::npos || colonPos == 0) {
        return realsize;
    }

    std::string name = header.substr(0, colonPos);
    std::string value = header.substr(colonPos + 1);
    value.erase(0, value.find_first_not_of(" \t"));
    value.erase(value.find_last_not_of(" \t\r\n") + 1);
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (name == "content-length") {
        char* end = nullptr;
        unsigned long long declared = std::strtoull(value.c_str(), &end, 10);
        if (end != value.c_str() && !state->collector->onContentLength(declared)) {
            return 0;
        }
    }

    (*state->headers)[name] = value;
    return realsize;
}

int progressCallback(void* userp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* state = static_cast<TransferState*>(userp);
    if (state->cancel != nullptr && state->cancel->load()) {
        return 1; // Aborts with CURLE_ABORTED_BY_CALLBACK
    }
    return 0;
}

// ============================================================================
// TLS configuration
// ============================================================================

/// TLS 1.2 minimum, peer and host verification, https only, no redirects
ErrorCode configureSecureTransfer(CURL* curl) {
    if (curl_easy_setopt(curl, CURLOPT_SSLVERSION, CURL_SSLVERSION_TLSv1_2) != CURLE_OK) {
        return ErrorCode::TlsVersionTooOld;
    }
    if (curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L) != CURLE_OK ||
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L) != CURLE_OK) {
        return ErrorCode::CertificateInvalid;
    }
#if LIBCURL_VERSION_NUM >= 0x075500
    if (curl_easy_setopt(curl, CURLOPT_PROTOCOLS_STR, "https") != CURLE_OK) {
        return ErrorCode::CurlInitFailed;
    }
#else
    if (curl_easy_setopt(curl, CURLOPT_PROTOCOLS, static_cast<long>(CURLPROTO_HTTPS)) != CURLE_OK) {
        return ErrorCode::CurlInitFailed;
    }
#endif
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 0L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    return ErrorCode::Success;
}

ErrorCode mapCurlError(CURLcode res) {
    switch (res) {
        case CURLE_COULDNT_RESOLVE_HOST:
            return ErrorCode::DnsResolutionFailed;
        case CURLE_COULDNT_CONNECT:
            return ErrorCode::ConnectionFailed;
        case CURLE_OPERATION_TIMEDOUT:
            return ErrorCode::Timeout;
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_SSL_CERTPROBLEM:
        case CURLE_SSL_CIPHER:
            return ErrorCode::TlsHandshakeFailed;
        case CURLE_PEER_FAILED_VERIFICATION:
            return ErrorCode::CertificateInvalid;
        case CURLE_RECV_ERROR:
        case CURLE_SEND_ERROR:
        case CURLE_GOT_NOTHING:
        case CURLE_PARTIAL_FILE:
            return ErrorCode::ConnectionReset;
        case CURLE_ABORTED_BY_CALLBACK:
            return ErrorCode::TransferAborted;
        default:
            return ErrorCode::HttpRequestFailed;
    }
}

using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
using CurlHeaderList = std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;

} // anonymous namespace

// ============================================================================
// CurlTransport
// ============================================================================

CurlTransport::CurlTransport() {
    initializeCurl();
}

CurlTransport::~CurlTransport() = default;

Result<HttpResponse> CurlTransport::perform(const HttpRequest& request,
                                            ResponseCollector& collector) {
    if (!g_curlInitialized) {
        return makeError(ErrorCode::CurlInitFailed);
    }

    CurlHandle curl(curl_easy_init(), &curl_easy_cleanup);
    if (!curl) {
        return makeError(ErrorCode::CurlInitFailed);
    }

    ErrorCode tlsResult = configureSecureTransfer(curl.get());
    if (tlsResult != ErrorCode::Success) {
        return makeError(tlsResult);
    }

    curl_easy_setopt(curl.get(), CURLOPT_URL, request.url.c_str());

    switch (request.method) {
        case HttpMethod::GET:
            curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
            break;
        case HttpMethod::POST:
            curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
            curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE,
                             static_cast<long>(request.body.size()));
            curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, request.body.c_str());
            break;
        case HttpMethod::HEAD:
            curl_easy_setopt(curl.get(), CURLOPT_NOBODY, 1L);
            break;
    }

    // Accept-Encoding goes through libcurl so bodies are decoded and the cap
    // applies to decoded bytes
    CurlHeaderList headerList(nullptr, &curl_slist_free_all);
    for (const auto& [name, value] : request.headers) {
        std::string lowered = name;
        std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (lowered == "accept-encoding") {
            curl_easy_setopt(curl.get(), CURLOPT_ACCEPT_ENCODING, value.c_str());
            continue;
        }
        if (lowered == "user-agent") {
            curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, value.c_str());
            continue;
        }

        std::string line = name + ": " + value;
        curl_slist* appended = curl_slist_append(headerList.get(), line.c_str());
        if (appended == nullptr) {
            return makeError(ErrorCode::AllocationFailed);
        }
        headerList.release();
        headerList.reset(appended);
    }
    if (headerList) {
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headerList.get());
    }

    const long timeoutMs = static_cast<long>(request.timeout.count());
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS, timeoutMs);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, timeoutMs);

    HttpResponse response;
    TransferState state;
    state.collector = &collector;
    state.headers = &response.headers;
    state.cancel = request.cancel;

    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &state);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, headerCallback);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &state);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, progressCallback);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, &state);
    curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);

    CURLcode res = curl_easy_perform(curl.get());

    if (collector.exceeded()) {
        return makeError(ErrorCode::ResponseTooLarge,
                         "Response too large (max " + std::to_string(collector.maxBytes()) +
                             " bytes)");
    }

    if (res != CURLE_OK) {
        ErrorCode code = mapCurlError(res);
        WARDEN_LOG_DEBUG_F("Transfer failed: %s", curl_easy_strerror(res));
        if (code == ErrorCode::Timeout) {
            return makeError(code, "Request timed out after " +
                                       std::to_string(request.timeout.count()) + "ms");
        }
        return makeError(code, curl_easy_strerror(res));
    }

    long httpCode = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &httpCode);
    response.statusCode = static_cast<int>(httpCode);
    response.body = collector.takeBody();

    return response;
}

} // namespace Warden::Network

#include "curl_http_client.hpp"
#include "cancellation.hpp"
#include "errors.hpp"
#include <curl/curl.h>
#include <memory>

namespace {
    struct TransferContext {
        const HttpClient::ChunkSink* sink;
        const CancellationToken* cancel;
        std::uint64_t bytes = 0;
        bool aborted = false;
    };

    size_t writeCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
        auto* context = static_cast<TransferContext*>(userdata);
        size_t total = size * nmemb;
        if (!(*context->sink)(ptr, total)) {
            context->aborted = true;
            return 0;
        }
        context->bytes += total;
        return total;
    }

    int progressCallback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
        auto* context = static_cast<TransferContext*>(clientp);
        if (context->cancel && context->cancel->isCancelled()) {
            context->aborted = true;
            return 1;
        }
        return 0;
    }

    struct CurlDeleter {
        void operator()(CURL* curl) const { curl_easy_cleanup(curl); }
    };

    struct SlistDeleter {
        void operator()(curl_slist* list) const { curl_slist_free_all(list); }
    };

    bool isTimeoutOrNetwork(CURLcode code) {
        switch (code) {
            case CURLE_COULDNT_RESOLVE_HOST:
            case CURLE_COULDNT_RESOLVE_PROXY:
            case CURLE_COULDNT_CONNECT:
            case CURLE_OPERATION_TIMEDOUT:
            case CURLE_RECV_ERROR:
            case CURLE_SEND_ERROR:
            case CURLE_PARTIAL_FILE:
            case CURLE_GOT_NOTHING:
            case CURLE_SSL_CONNECT_ERROR:
            case CURLE_HTTP2:
            case CURLE_HTTP2_STREAM:
                return true;
            default:
                return false;
        }
    }
}

CurlHttpClient::CurlHttpClient(const std::string& user_agent) : user_agent_(user_agent) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

CurlHttpClient::~CurlHttpClient() {
    curl_global_cleanup();
}

void CurlHttpClient::setLowSpeedLimit(long bytes_per_second, long seconds) {
    low_speed_bytes_ = bytes_per_second;
    low_speed_seconds_ = seconds;
}

std::string CurlHttpClient::buildUrl(const HttpRequest& request) const {
    if (request.query.empty()) {
        return request.url;
    }

    std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
    if (!curl) {
        throw TransientFetchError("Failed to initialize CURL for query encoding");
    }

    std::string url = request.url;
    char separator = url.find('?') != std::string::npos ? '&' : '?';
    for (const auto& [key, value] : request.query) {
        char* escaped = curl_easy_escape(curl.get(), value.c_str(), static_cast<int>(value.length()));
        if (!escaped) {
            throw PermanentItemError("Failed to encode query parameter: " + key);
        }
        url += separator;
        url += key + "=" + escaped;
        curl_free(escaped);
        separator = '&';
    }
    return url;
}

HttpResponse CurlHttpClient::get(const HttpRequest& request) {
    HttpResponse response;
    ChunkSink sink = [&response](const char* data, std::size_t size) {
        response.body.append(data, size);
        return true;
    };
    HttpResponse result = perform(request, sink, false);
    result.body = std::move(response.body);
    return result;
}

HttpResponse CurlHttpClient::stream(const HttpRequest& request, const ChunkSink& sink) {
    return perform(request, sink, true);
}

HttpResponse CurlHttpClient::perform(const HttpRequest& request, const ChunkSink& sink, bool streaming) {
    std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
    if (!curl) {
        throw TransientFetchError("Failed to initialize CURL");
    }

    std::string url = buildUrl(request);
    TransferContext context{&sink, request.cancel};

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &context);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, progressCallback);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, &context);
    curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, user_agent_.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, 20L);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, request.timeout_seconds);
    if (streaming) {
        curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_LIMIT, low_speed_bytes_);
        curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_TIME, low_speed_seconds_);
    }

    std::unique_ptr<curl_slist, SlistDeleter> headers;
    for (const auto& header : request.headers) {
        curl_slist* appended = curl_slist_append(headers.get(), header.c_str());
        if (!appended) {
            throw TransientFetchError("Failed to build request headers");
        }
        headers.release();
        headers.reset(appended);
    }
    if (headers) {
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    }

    CURLcode res = curl_easy_perform(curl.get());

    HttpResponse response;
    response.bytes = context.bytes;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);

    if (res == CURLE_OK) {
        return response;
    }

    if (context.aborted && (res == CURLE_WRITE_ERROR || res == CURLE_ABORTED_BY_CALLBACK)) {
        response.aborted = true;
        return response;
    }

    std::string message = "Network error for " + request.url + ": " + curl_easy_strerror(res);
    if (isTimeoutOrNetwork(res)) {
        throw TransientFetchError(message);
    }
    throw PermanentItemError(message);
}

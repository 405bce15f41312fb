#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <utility>
#include <vector>

class CancellationToken;

struct HttpRequest {
    std::string url;
    std::vector<std::pair<std::string, std::string>> query;
    std::vector<std::string> headers;
    long timeout_seconds = 20;
    const CancellationToken* cancel = nullptr;
};

struct HttpResponse {
    long status = 0;
    std::string body;
    std::uint64_t bytes = 0;
    bool aborted = false;
};

// Transport seam. Implementations throw TransientFetchError on transport
// failures (DNS, connect, timeout) and report HTTP status codes as-is.
class HttpClient {
public:
    // Returns false to abort the transfer.
    using ChunkSink = std::function<bool(const char* data, std::size_t size)>;

    virtual ~HttpClient() = default;

    virtual HttpResponse get(const HttpRequest& request) = 0;

    // Streams the body into the sink instead of buffering it; body stays empty.
    virtual HttpResponse stream(const HttpRequest& request, const ChunkSink& sink) = 0;
};

#pragma once
#include "http_client.hpp"
#include <string>

class CurlHttpClient : public HttpClient {
public:
    explicit CurlHttpClient(const std::string& user_agent);
    ~CurlHttpClient() override;

    CurlHttpClient(const CurlHttpClient&) = delete;
    CurlHttpClient& operator=(const CurlHttpClient&) = delete;

    HttpResponse get(const HttpRequest& request) override;
    HttpResponse stream(const HttpRequest& request, const ChunkSink& sink) override;

    // Below this rate for low_speed_seconds, a media transfer is abandoned.
    void setLowSpeedLimit(long bytes_per_second, long seconds);

private:
    std::string user_agent_;
    long low_speed_bytes_ = 1024;
    long low_speed_seconds_ = 60;

    std::string buildUrl(const HttpRequest& request) const;
    HttpResponse perform(const HttpRequest& request, const ChunkSink& sink, bool streaming);
};

#pragma once
#include <string>
#include <memory>

namespace remoteops::runtime {

// Downloaded body or the reason it could not be fetched
struct FetchResult {
    bool success = false;
    std::string body;
    std::string error;
};

// Retrieves the content behind a URL. Implementations must be callable from
// several threads at once.
class Fetcher {
public:
    virtual ~Fetcher() = default;

    virtual FetchResult fetch(const std::string& url) = 0;
};

// Fetcher backed by the curl binary
class CurlFetcher : public Fetcher {
public:
    explicit CurlFetcher(std::string curl_path = "curl");

    FetchResult fetch(const std::string& url) override;

private:
    std::string curl_path_;
};

std::unique_ptr<Fetcher> make_default_fetcher();

} // namespace remoteops::runtime

#pragma once

#include <chrono>
#include <filesystem>
#include <string>

namespace blossom {

class ProcessRunner;

class Downloader {
public:
    virtual ~Downloader() = default;

    // Fetches url into dest, replacing it. Throws ProvisioningError on failure.
    virtual void download(const std::string& url,
                          const std::filesystem::path& dest,
                          std::chrono::milliseconds timeout) = 0;
};

// Shells out to curl, which follows the redirects release hosts answer with.
class CurlDownloader : public Downloader {
public:
    explicit CurlDownloader(ProcessRunner& runner, std::string curl_program = "curl");

    void download(const std::string& url,
                  const std::filesystem::path& dest,
                  std::chrono::milliseconds timeout) override;

private:
    ProcessRunner& runner_;
    std::string curl_program_;
};

} // namespace blossom

#include "downloader.hpp"
#include "errors.hpp"
#include "process_runner.hpp"

#include <system_error>

namespace blossom {

CurlDownloader::CurlDownloader(ProcessRunner& runner, std::string curl_program)
    : runner_(runner), curl_program_(std::move(curl_program)) {}

void CurlDownloader::download(const std::string& url,
                              const std::filesystem::path& dest,
                              std::chrono::milliseconds timeout) {
    std::vector<std::string> argv = {curl_program_, "-fsSL"};
    if (timeout.count() > 0) {
        auto seconds = std::chrono::duration_cast<std::chrono::seconds>(timeout).count();
        argv.push_back("--max-time");
        argv.push_back(std::to_string(seconds > 0 ? seconds : 1));
    }
    argv.push_back("-o");
    argv.push_back(dest.string());
    argv.push_back(url);

    ProcessResult result;
    try {
        result = runner_.run(argv, timeout);
    } catch (const ProcessError& e) {
        throw ProvisioningError("Failed to download " + url + ": " + e.what());
    }

    if (!result.succeeded()) {
        std::error_code ec;
        std::filesystem::remove(dest, ec);

        std::string detail = result.timed_out
            ? "timed out"
            : (result.stderr_data.empty() ? "exit code " + std::to_string(result.exit_code)
                                          : result.stderr_data);
        throw ProvisioningError("Failed to download " + url + ": " + detail);
    }
}

} // namespace blossom

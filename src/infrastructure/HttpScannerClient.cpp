#include "infrastructure/HttpScannerClient.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <algorithm>
#include <vector>

namespace filegate::infrastructure {

using json = nlohmann::json;
using domain::ScannerResponse;

namespace {
constexpr std::size_t kUploadChunk = 64 * 1024;

void ApplyTimeout(httplib::Client& cli, std::chrono::milliseconds timeout) {
    auto sec = static_cast<time_t>(timeout.count() / 1000);
    auto usec = static_cast<time_t>((timeout.count() % 1000) * 1000);
    cli.set_connection_timeout(sec, usec);
    cli.set_read_timeout(sec, usec);
    cli.set_write_timeout(sec, usec);
}
}

HttpScannerClient::HttpScannerClient(const domain::ScannerSettings& settings)
    : m_host(settings.host), m_port(settings.port), m_path(settings.path) {}

HttpScannerClient::HttpScannerClient(const std::string& host, int port, const std::string& path)
    : m_host(host), m_port(port), m_path(path) {}

ScannerResponse HttpScannerClient::ParseResponse(const std::string& body) {
    try {
        auto parsed = json::parse(body);
        if (!parsed.is_object() || !parsed.contains("infected") || !parsed["infected"].is_boolean()) {
            return ScannerResponse::Failed(ScannerResponse::Status::TransportError, "Response lacks 'infected'");
        }
        if (!parsed["infected"].get<bool>()) {
            return ScannerResponse::Clean();
        }
        std::string signature = "unnamed";
        if (parsed.contains("signature") && parsed["signature"].is_string()) {
            signature = parsed["signature"].get<std::string>();
        }
        return ScannerResponse::Infected(signature);
    } catch (const std::exception& e) {
        std::cerr << "[HttpScannerClient] JSON Parse Error: " << e.what() << std::endl;
        return ScannerResponse::Failed(ScannerResponse::Status::TransportError,
                                       std::string("Unparseable scanner response: ") + e.what());
    }
}

ScannerResponse HttpScannerClient::scan(const std::string& path, std::chrono::milliseconds timeout) {
    std::error_code ec;
    auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        return ScannerResponse::Failed(ScannerResponse::Status::TransportError, "Cannot stat " + path);
    }
    auto file = std::make_shared<std::ifstream>(path, std::ios::binary);
    if (!file->is_open()) {
        return ScannerResponse::Failed(ScannerResponse::Status::TransportError, "Cannot open " + path);
    }

    httplib::Client cli(m_host, m_port);
    ApplyTimeout(cli, timeout);

    auto res = cli.Post(m_path, static_cast<size_t>(size),
                        [file](size_t offset, size_t length, httplib::DataSink& sink) {
                            std::vector<char> chunk(std::min(length, kUploadChunk));
                            file->seekg(static_cast<std::streamoff>(offset));
                            file->read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
                            std::streamsize n = file->gcount();
                            if (n <= 0) return false;
                            return sink.write(chunk.data(), static_cast<size_t>(n));
                        },
                        "application/octet-stream");

    if (!res) {
        auto err = res.error();
        std::string detail = httplib::to_string(err);
        std::cerr << "[HttpScannerClient] Connection failed: " << detail << std::endl;
        if (err == httplib::Error::Read || err == httplib::Error::Write ||
            err == httplib::Error::ConnectionTimeout) {
            return ScannerResponse::Failed(ScannerResponse::Status::Timeout, detail);
        }
        return ScannerResponse::Failed(ScannerResponse::Status::TransportError, detail);
    }
    if (res->status != 200) {
        std::cerr << "[HttpScannerClient] HTTP Error " << res->status << ": " << res->body << std::endl;
        return ScannerResponse::Failed(ScannerResponse::Status::TransportError,
                                       "HTTP status " + std::to_string(res->status));
    }
    return ParseResponse(res->body);
}

} // namespace filegate::infrastructure

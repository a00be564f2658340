/*****************************************************************************
 * Tile Harvest
 * Copyright (C) 2024 alpinemaps.org
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <http://www.gnu.org/licenses/>.
 *****************************************************************************/

#ifndef HTTPCLIENT_H
#define HTTPCLIENT_H

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <tl/expected.hpp>

namespace fetch {

enum class HttpErrorKind {
    InitFailed,
    Timeout,
    Transport,
    Status,
    InvalidContent, // the body is not a png image
    WriteFailed
};

class HttpError {
public:
    HttpError() = default;
    HttpError(HttpErrorKind kind, long status = 0, std::string detail = {})
        : m_kind(kind)
        , m_status(status)
        , m_detail(std::move(detail))
    {
    }

    operator HttpErrorKind() const { return m_kind; }
    [[nodiscard]] HttpErrorKind kind() const { return m_kind; }
    // HTTP status of the response, 0 if none was received.
    [[nodiscard]] long status() const { return m_status; }
    [[nodiscard]] const std::string& detail() const { return m_detail; }

    [[nodiscard]] std::string description() const;

private:
    HttpErrorKind m_kind = HttpErrorKind::Transport;
    long m_status = 0;
    std::string m_detail;
};

struct HttpResponse {
    long status = 0; // 0 for non http schemes such as file://
    std::vector<uint8_t> body;
    std::string content_type;
};

/// One connection worth of state. Implementations are not thread safe, every worker owns its own client.
class HttpClient {
public:
    virtual ~HttpClient() = default;
    virtual tl::expected<HttpResponse, HttpError> get(const std::string& url, std::chrono::milliseconds timeout) = 0;
};

using HttpClientFactory = std::function<std::unique_ptr<HttpClient>()>;

class CurlHttpClient : public HttpClient {
public:
    explicit CurlHttpClient(std::string user_agent = "tileharvest/1.0");
    ~CurlHttpClient() override;
    CurlHttpClient(const CurlHttpClient&) = delete;
    CurlHttpClient& operator=(const CurlHttpClient&) = delete;

    tl::expected<HttpResponse, HttpError> get(const std::string& url, std::chrono::milliseconds timeout) override;

private:
    void* m_curl = nullptr; // CURL*
    std::string m_user_agent;
};

[[nodiscard]] HttpClientFactory curl_client_factory(const std::string& user_agent);

// curl_global_init is not thread safe and must run before the first easy handle is created.
void initialize_curl_once();

}

#endif // HTTPCLIENT_H

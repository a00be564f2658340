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

#include "http_client.h"

#include <array>
#include <mutex>
#include <new>

#include <curl/curl.h>
#include <fmt/core.h>

#include "Exception.h"
#include "log.h"

using namespace fetch;

std::string HttpError::description() const
{
    std::string what;
    switch (m_kind) {
    case HttpErrorKind::InitFailed:
        what = "failed to initialise cURL";
        break;
    case HttpErrorKind::Timeout:
        what = "timed out";
        break;
    case HttpErrorKind::Transport:
        what = "transport error";
        break;
    case HttpErrorKind::Status:
        what = fmt::format("HTTP status {}", m_status);
        break;
    case HttpErrorKind::InvalidContent:
        what = "invalid tile content";
        break;
    case HttpErrorKind::WriteFailed:
        what = "failed to write tile";
        break;
    default:
        what = "undefined error";
    }
    if (m_detail.empty())
        return what;
    return fmt::format("{} ({})", what, m_detail);
}

namespace {
std::once_flag g_curl_initialized_once_flag;

struct CurlDeinitialiserHandler {
    ~CurlDeinitialiserHandler()
    {
        curl_global_cleanup();
    }
};

// Write callback function to collect the downloaded data
size_t write_callback(void* ptr, size_t size, size_t nmemb, void* userdata)
{
    auto& body = *static_cast<std::vector<uint8_t>*>(userdata);
    const size_t total_size = size * nmemb;
    try {
        const auto* bytes = static_cast<const uint8_t*>(ptr);
        body.insert(body.end(), bytes, bytes + total_size);
    } catch (const std::bad_alloc&) {
        return 0; // Returning 0 will abort the download
    }
    return total_size;
}
}

void fetch::initialize_curl_once()
{
    std::call_once(g_curl_initialized_once_flag, []() {
        LOG_DEBUG("calling curl_global_init...");
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK)
            throw Exception("failed to initialise cURL");
    });
    static CurlDeinitialiserHandler deinitialiser;
}

CurlHttpClient::CurlHttpClient(std::string user_agent)
    : m_user_agent(std::move(user_agent))
{
    initialize_curl_once();
    m_curl = curl_easy_init();
}

CurlHttpClient::~CurlHttpClient()
{
    if (m_curl)
        curl_easy_cleanup(static_cast<CURL*>(m_curl));
}

tl::expected<HttpResponse, HttpError> CurlHttpClient::get(const std::string& url, std::chrono::milliseconds timeout)
{
    if (!m_curl)
        return tl::unexpected(HttpError(HttpErrorKind::InitFailed));

    CURL* curl = static_cast<CURL*>(m_curl);
    curl_easy_reset(curl);

    HttpResponse response;
    std::array<char, CURL_ERROR_SIZE> error_buffer = {};
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, error_buffer.data());
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, long(timeout.count()));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, long(timeout.count()));
    curl_easy_setopt(curl, CURLOPT_USERAGENT, m_user_agent.c_str());

    const CURLcode res = curl_easy_perform(curl);
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, nullptr);

    if (res != CURLE_OK) {
        const std::string detail = error_buffer[0] != '\0' ? std::string(error_buffer.data()) : std::string(curl_easy_strerror(res));
        if (res == CURLE_OPERATION_TIMEDOUT)
            return tl::unexpected(HttpError(HttpErrorKind::Timeout, response.status, detail));
        if (res == CURLE_WRITE_ERROR)
            return tl::unexpected(HttpError(HttpErrorKind::WriteFailed, response.status, detail));
        return tl::unexpected(HttpError(HttpErrorKind::Transport, response.status, detail));
    }

    if (response.status != 0 && (response.status < 200 || response.status >= 300))
        return tl::unexpected(HttpError(HttpErrorKind::Status, response.status));

    char* content_type = nullptr;
    if (curl_easy_getinfo(curl, CURLINFO_CONTENT_TYPE, &content_type) == CURLE_OK && content_type != nullptr)
        response.content_type = content_type;

    return response;
}

HttpClientFactory fetch::curl_client_factory(const std::string& user_agent)
{
    return [user_agent]() -> std::unique_ptr<HttpClient> { return std::make_unique<CurlHttpClient>(user_agent); };
}

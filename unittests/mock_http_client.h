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

#ifndef MOCK_HTTP_CLIENT_H
#define MOCK_HTTP_CLIENT_H

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "http_client.h"

// Serves responses from a handler shared by all clients of a factory, and counts requests.
class MockBackend {
public:
  using Handler = std::function<tl::expected<fetch::HttpResponse, fetch::HttpError>(const std::string& url, unsigned request_number)>;

  explicit MockBackend(Handler handler) : m_handler(std::move(handler)) {}

  tl::expected<fetch::HttpResponse, fetch::HttpError> get(const std::string& url)
  {
    unsigned request_number = 0;
    {
      const std::scoped_lock lock(m_mutex);
      request_number = m_requests_per_url[url]++;
      m_urls.push_back(url);
    }
    ++m_requests;
    return m_handler(url, request_number);
  }

  [[nodiscard]] unsigned requests() const { return m_requests; }
  [[nodiscard]] unsigned clients_created() const { return m_clients_created; }
  [[nodiscard]] std::vector<std::string> urls() const
  {
    const std::scoped_lock lock(m_mutex);
    return m_urls;
  }

  fetch::HttpClientFactory factory();

  static tl::expected<fetch::HttpResponse, fetch::HttpError> ok(std::vector<uint8_t> body)
  {
    fetch::HttpResponse response;
    response.status = 200;
    response.body = std::move(body);
    response.content_type = "image/png";
    return response;
  }
  static tl::expected<fetch::HttpResponse, fetch::HttpError> status(long code)
  {
    return tl::unexpected(fetch::HttpError(fetch::HttpErrorKind::Status, code));
  }

private:
  Handler m_handler;
  mutable std::mutex m_mutex;
  std::unordered_map<std::string, unsigned> m_requests_per_url;
  std::vector<std::string> m_urls;
  std::atomic<unsigned> m_requests = 0;
  std::atomic<unsigned> m_clients_created = 0;
};

class MockHttpClient : public fetch::HttpClient {
public:
  explicit MockHttpClient(MockBackend& backend) : m_backend(backend) {}

  tl::expected<fetch::HttpResponse, fetch::HttpError> get(const std::string& url, std::chrono::milliseconds) override
  {
    return m_backend.get(url);
  }

private:
  MockBackend& m_backend;
};

inline fetch::HttpClientFactory MockBackend::factory()
{
  return [this]() -> std::unique_ptr<fetch::HttpClient> {
    ++m_clients_created;
    return std::make_unique<MockHttpClient>(*this);
  };
}

#endif // MOCK_HTTP_CLIENT_H

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

#ifndef CATCH2_HELPERS_H
#define CATCH2_HELPERS_H

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <random>
#include <string>
#include <vector>

#include <catch2/catch.hpp>
#include <fmt/core.h>

#include <glm/gtx/string_cast.hpp>

#include "tile.h"

namespace Catch {

template<glm::length_t s,  typename T>
struct StringMaker<glm::vec<s, T>> {
  static std::string convert(const glm::vec<s, T>& value) {
    return glm::to_string(value);
  }
};

template<>
struct StringMaker<tile::Id> {
  static std::string convert(const tile::Id& value) {
    return fmt::format("{}{}", tile::to_string(value), value.scheme == tile::Scheme::Tms ? " (tms)" : "");
  }
};
}

namespace test_helpers {

// Signature plus a few bytes of junk. Enough for the structural check, not a decodable image.
inline std::vector<uint8_t> png_bytes()
{
  return { 0x89, 0x50, 0x4E, 0x47, 0x0D, 0x0A, 0x1A, 0x0A, 0x00, 0x00, 0x00, 0x0D, 'I', 'H', 'D', 'R' };
}

inline std::vector<uint8_t> html_bytes()
{
  const std::string html = "<html><body>502 Bad Gateway</body></html>";
  return { html.begin(), html.end() };
}

inline void write_file(const std::filesystem::path& path, const std::vector<uint8_t>& bytes)
{
  std::filesystem::create_directories(path.parent_path());
  std::ofstream file(path, std::ios::binary | std::ios::trunc);
  file.write(reinterpret_cast<const char*>(bytes.data()), std::streamsize(bytes.size()));
}

inline std::vector<uint8_t> read_file(const std::filesystem::path& path)
{
  std::ifstream file(path, std::ios::binary);
  return { std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>() };
}

// Unique directory below the system temp directory, removed again on destruction.
class TempDirectory {
public:
  TempDirectory()
  {
    static std::atomic<unsigned> counter = 0;
    std::random_device rd;
    m_path = std::filesystem::temp_directory_path() / fmt::format("tileharvest_test_{}_{}", rd(), counter++);
    std::filesystem::create_directories(m_path);
  }
  ~TempDirectory()
  {
    std::error_code ec;
    std::filesystem::remove_all(m_path, ec);
  }
  TempDirectory(const TempDirectory&) = delete;
  TempDirectory& operator=(const TempDirectory&) = delete;

  [[nodiscard]] const std::filesystem::path& path() const { return m_path; }

private:
  std::filesystem::path m_path;
};
}

#endif // CATCH2_HELPERS_H

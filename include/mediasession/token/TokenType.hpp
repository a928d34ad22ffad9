/* Copyright 2026, Ableton AG, Berlin. All rights reserved.
 *
 *  This program is free software: you can redistribute it and/or modify
 *  it under the terms of the GNU General Public License as published by
 *  the Free Software Foundation, either version 2 of the License, or
 *  (at your option) any later version.
 *
 *  This program is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU General Public License for more details.
 *
 *  You should have received a copy of the GNU General Public License
 *  along with this program.  If not, see <http://www.gnu.org/licenses/>.
 *
 *  If you would like to incorporate MediaSession into a proprietary software
 *  application, please contact <link-devs@ableton.com>.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <ostream>

namespace mediasession
{
namespace token
{

// Owner id value requesting resolution through the package registry
constexpr std::int32_t kUnknownUid = -1;

enum class TokenType : std::int32_t
{
  Session = 0,
  SessionService = 1,
  LibraryService = 2
};

inline bool isValid(const TokenType type)
{
  switch (type)
  {
  case TokenType::Session:
  case TokenType::SessionService:
  case TokenType::LibraryService:
    return true;
  }
  return false;
}

// Decodes the integer form used in transferable records
inline std::optional<TokenType> tokenTypeFromInt(const std::int32_t code)
{
  const auto type = static_cast<TokenType>(code);
  return isValid(type) ? std::optional<TokenType>{type} : std::nullopt;
}

inline std::int32_t toInt(const TokenType type)
{
  return static_cast<std::int32_t>(type);
}

inline std::ostream& operator<<(std::ostream& stream, const TokenType type)
{
  return stream << toInt(type);
}

} // namespace token
} // namespace mediasession

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

#include <mediasession/token/TokenType.hpp>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>

namespace mediasession
{
namespace token
{

// Actions advertised by components that host sessions
constexpr char kSessionServiceInterface[] = "mediasession.SessionService";
constexpr char kLibraryServiceInterface[] = "mediasession.LibraryService";

// Metadata key under which a service component declares its session id
constexpr char kSessionIdMetaData[] = "mediasession.session";

// A component discovered through the package registry
struct ComponentInfo
{
  using MetaData = std::map<std::string, std::string>;

  std::string packageName;
  std::string serviceName;
  std::optional<MetaData> metaData;
};

// Concept: PackageRegistry
// Resolves package ownership and discovers components. Both calls
// block until the registry answers. Requirements:
//  - std::optional<std::int32_t> ownerId(PackageRegistry&,
//      const std::string& packageName)
//    nullopt if the package is not installed
//  - std::optional<ComponentInfo> findComponent(PackageRegistry&,
//      const std::string& action, const std::string& packageName,
//      const std::string& serviceName)
//    the component packageName/serviceName if it advertises action,
//    including its declared metadata

// Returns nullopt if no component was found, the empty string if the
// component declares no metadata, and the session id entry otherwise.
inline std::optional<std::string> sessionIdFromComponent(
  const std::optional<ComponentInfo>& oComponent)
{
  if (!oComponent)
  {
    return std::nullopt;
  }
  else if (!oComponent->metaData)
  {
    return std::string{};
  }

  const auto it = oComponent->metaData->find(kSessionIdMetaData);
  return it == oComponent->metaData->end() ? std::string{} : it->second;
}

// The action a service component of the given type advertises
inline std::string serviceInterface(const TokenType type)
{
  switch (type)
  {
  case TokenType::SessionService:
    return kSessionServiceInterface;
  case TokenType::LibraryService:
    return kLibraryServiceInterface;
  case TokenType::Session:
    break;
  }
  throw std::invalid_argument("Invalid type");
}

} // namespace token
} // namespace mediasession

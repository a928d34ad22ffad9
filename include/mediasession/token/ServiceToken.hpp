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

#include <mediasession/token/PackageRegistry.hpp>
#include <mediasession/token/SessionToken.hpp>
#include <initializer_list>
#include <stdexcept>
#include <string>

namespace mediasession
{
namespace token
{

// Builds a token for the service component packageName/serviceName
// when its type is not known up front. Library services are a kind of
// session service, so the library action is tried first.
template <typename Binder, typename Registry, typename Log>
SessionToken<Binder> discoverServiceToken(Registry& registry,
                                          const std::string& packageName,
                                          const std::string& serviceName,
                                          Log log)
{
  auto serviceLog = channel(log, "ServiceToken");
  for (const auto type : {TokenType::LibraryService, TokenType::SessionService})
  {
    const auto action = serviceInterface(type);
    auto oId = sessionIdFromComponent(findComponent(registry, action, packageName, serviceName));
    if (oId)
    {
      debug(serviceLog) << "Found " << action << " in " << packageName << "/" << serviceName;
      return {registry, kUnknownUid, type, packageName, serviceName, std::move(oId), nullptr};
    }
    debug(serviceLog) << packageName << "/" << serviceName << " doesn't implement " << action;
  }

  throw std::invalid_argument(
    "service " + serviceName + " in " + packageName + " is not a session service");
}

} // namespace token
} // namespace mediasession

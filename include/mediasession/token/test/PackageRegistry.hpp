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
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <tuple>

namespace mediasession
{
namespace token
{
namespace test
{

// In-memory registry that counts the queries it answers
struct PackageRegistry
{
  void addPackage(const std::string& packageName, const std::int32_t uid)
  {
    uids[packageName] = uid;
  }

  void addComponent(const std::string& action, ComponentInfo component)
  {
    auto key = std::make_tuple(action, component.packageName, component.serviceName);
    components[std::move(key)] = std::move(component);
  }

  friend std::optional<std::int32_t> ownerId(PackageRegistry& registry,
                                             const std::string& packageName)
  {
    ++registry.ownerIdQueries;
    const auto it = registry.uids.find(packageName);
    return it == registry.uids.end() ? std::nullopt : std::optional<std::int32_t>{it->second};
  }

  friend std::optional<ComponentInfo> findComponent(PackageRegistry& registry,
                                                    const std::string& action,
                                                    const std::string& packageName,
                                                    const std::string& serviceName)
  {
    ++registry.componentQueries;
    const auto it = registry.components.find(std::make_tuple(action, packageName, serviceName));
    return it == registry.components.end() ? std::nullopt
                                           : std::optional<ComponentInfo>{it->second};
  }

  using ComponentKey = std::tuple<std::string, std::string, std::string>;

  std::map<std::string, std::int32_t> uids;
  std::map<ComponentKey, ComponentInfo> components;
  std::size_t ownerIdQueries = 0;
  std::size_t componentQueries = 0;
};

} // namespace test
} // namespace token
} // namespace mediasession

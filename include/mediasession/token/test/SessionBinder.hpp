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

#include <mediasession/token/BinderHandle.hpp>
#include <mediasession/wire/NetworkByteStreamSerializable.hpp>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <optional>
#include <ostream>
#include <stdexcept>

namespace mediasession
{
namespace token
{
namespace test
{

// Binder proxy naming a remote object by number. Binders without a
// remote id are local stubs and only equal to themselves.
struct SessionBinder
{
  friend bool operator==(const SessionBinder& lhs, const SessionBinder& rhs)
  {
    if (lhs.remoteId && rhs.remoteId)
    {
      return *lhs.remoteId == *rhs.remoteId;
    }
    return &lhs == &rhs;
  }

  friend bool operator!=(const SessionBinder& lhs, const SessionBinder& rhs)
  {
    return !(lhs == rhs);
  }

  friend std::size_t hashValue(const SessionBinder& binder)
  {
    return binder.remoteId ? std::hash<std::uint32_t>{}(*binder.remoteId)
                           : std::hash<const void*>{}(&binder);
  }

  friend std::optional<BinderHandle> toHandle(const SessionBinder& binder)
  {
    if (!binder.remoteId)
    {
      return std::nullopt;
    }
    BinderHandle handle;
    handle.bytes.resize(wire::sizeInByteStream(*binder.remoteId));
    wire::toNetworkByteStream(*binder.remoteId, handle.bytes.begin());
    return handle;
  }

  friend std::ostream& operator<<(std::ostream& stream, const SessionBinder& binder)
  {
    if (binder.remoteId)
    {
      return stream << "SessionBinder{" << *binder.remoteId << "}";
    }
    return stream << "SessionBinder{local}";
  }

  std::optional<std::uint32_t> remoteId;
};

// Hands out a fresh proxy object for every handle it is given, so that
// tokens restored from the same record hold distinct binder objects
struct BinderTable
{
  SessionBinder* remote(const std::uint32_t remoteId)
  {
    binders.push_back(SessionBinder{remoteId});
    return &binders.back();
  }

  SessionBinder* local()
  {
    binders.push_back(SessionBinder{});
    return &binders.back();
  }

  friend SessionBinder* fromHandle(BinderTable& table, const BinderHandle& handle)
  {
    ++table.handleLookups;
    if (handle.bytes.size() != sizeof(std::uint32_t))
    {
      throw std::invalid_argument("Malformed binder handle");
    }
    const auto result = wire::Deserialize<std::uint32_t>::fromNetworkByteStream(
      handle.bytes.begin(), handle.bytes.end());
    return table.remote(result.first);
  }

  std::deque<SessionBinder> binders;
  std::size_t handleLookups = 0;
};

} // namespace test
} // namespace token
} // namespace mediasession

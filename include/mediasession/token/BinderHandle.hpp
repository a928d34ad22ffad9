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

#include <mediasession/wire/NetworkByteStreamSerializable.hpp>
#include <cstdint>
#include <iomanip>
#include <ostream>
#include <vector>

namespace mediasession
{
namespace token
{

// Opaque byte form of a reference to a remote session endpoint. Only
// the binder table that produced it can interpret the bytes.
struct BinderHandle
{
  static constexpr std::int32_t key = 'sbnd';
  static_assert(key == 0x73626e64, "Unexpected byte order");

  friend bool operator==(const BinderHandle& lhs, const BinderHandle& rhs)
  {
    return lhs.bytes == rhs.bytes;
  }

  friend bool operator!=(const BinderHandle& lhs, const BinderHandle& rhs)
  {
    return !(lhs == rhs);
  }

  friend std::ostream& operator<<(std::ostream& stream, const BinderHandle& handle)
  {
    const auto flags = stream.flags();
    const auto fill = stream.fill();

    stream << "0x" << std::hex << std::setfill('0');
    for (const auto byte : handle.bytes)
    {
      stream << std::setw(2) << static_cast<int>(byte);
    }

    stream.flags(flags);
    stream.fill(fill);
    return stream;
  }

  // Model the NetworkByteStreamSerializable concept. The handle takes
  // the remainder of the byte range it is parsed from, so it must be
  // framed by a payload entry.
  friend std::uint32_t sizeInByteStream(const BinderHandle& handle)
  {
    return wire::sizeInByteStream(handle.bytes);
  }

  template <typename It>
  friend It toNetworkByteStream(const BinderHandle& handle, It out)
  {
    return wire::toNetworkByteStream(handle.bytes, std::move(out));
  }

  template <typename It>
  static std::pair<BinderHandle, It> fromNetworkByteStream(It begin, It end)
  {
    auto result = wire::Deserialize<std::vector<std::uint8_t>>::fromNetworkByteStream(
      std::move(begin), std::move(end));
    return std::make_pair(BinderHandle{std::move(result.first)}, std::move(result.second));
  }

  std::vector<std::uint8_t> bytes;
};

// Concept: SessionBinder
// A live capability referring to a session endpoint, typically in
// another process. Requirements:
//  - operator== is identity equality: true iff both refer to the same
//    underlying endpoint, even when they are distinct objects
//  - std::size_t hashValue(const SessionBinder&), consistent with ==
//  - std::optional<BinderHandle> toHandle(const SessionBinder&), the
//    opaque form of the reference; nullopt for local-only stubs that
//    cannot leave the process
//  - operator<< for diagnostics

// Concept: BinderTable
// The connection table owned by the surrounding framework.
// Requirements:
//  - SessionBinder* fromHandle(BinderTable&, const BinderHandle&)
//    returns a non-owning pointer to a binder that remains valid for
//    the lifetime of the table. Throws std::invalid_argument if the
//    handle cannot be interpreted.

} // namespace token
} // namespace mediasession

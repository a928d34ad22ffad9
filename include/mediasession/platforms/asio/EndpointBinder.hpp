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

#include <mediasession/platforms/asio/AsioWrapper.hpp>
#include <mediasession/token/BinderHandle.hpp>
#include <mediasession/wire/NetworkByteStreamSerializable.hpp>
#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <iterator>
#include <map>
#include <memory>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <vector>

namespace mediasession
{
namespace platforms
{
namespace asio
{

using Endpoint = ::asio::ip::udp::endpoint;

namespace detail
{

enum : std::uint8_t
{
  kFamilyV4 = 4,
  kFamilyV6 = 6
};

// Handle layout: family byte, address bytes, for IPv6 the scope id, and
// the port. Multi-byte values are in network order.
inline token::BinderHandle encodeEndpoint(const Endpoint& endpoint)
{
  token::BinderHandle handle;
  const auto address = endpoint.address();
  if (address.is_v4())
  {
    const auto bytes = address.to_v4().to_bytes();
    handle.bytes.resize(
      1 + wire::sizeInByteStream(bytes) + wire::sizeInByteStream(endpoint.port()));
    auto it = wire::toNetworkByteStream(std::uint8_t{kFamilyV4}, handle.bytes.begin());
    it = wire::toNetworkByteStream(bytes, it);
    wire::toNetworkByteStream(endpoint.port(), it);
  }
  else
  {
    const auto v6 = address.to_v6();
    const auto bytes = v6.to_bytes();
    const auto scopeId = static_cast<std::uint32_t>(v6.scope_id());
    handle.bytes.resize(1 + wire::sizeInByteStream(bytes) + wire::sizeInByteStream(scopeId)
                        + wire::sizeInByteStream(endpoint.port()));
    auto it = wire::toNetworkByteStream(std::uint8_t{kFamilyV6}, handle.bytes.begin());
    it = wire::toNetworkByteStream(bytes, it);
    it = wire::toNetworkByteStream(scopeId, it);
    wire::toNetworkByteStream(endpoint.port(), it);
  }
  return handle;
}

using HandleIt = std::vector<std::uint8_t>::const_iterator;

inline void checkHandleSize(const HandleIt begin, const HandleIt end, const std::size_t size)
{
  if (std::distance(begin, end) != static_cast<std::ptrdiff_t>(size))
  {
    throw std::invalid_argument("Malformed endpoint binder handle");
  }
}

inline Endpoint decodeEndpointV4(const HandleIt begin, const HandleIt end)
{
  using Bytes = ::asio::ip::address_v4::bytes_type;
  checkHandleSize(begin, end, std::tuple_size<Bytes>::value + sizeof(std::uint16_t));
  const auto addrRes = wire::Deserialize<Bytes>::fromNetworkByteStream(begin, end);
  const auto portRes =
    wire::Deserialize<std::uint16_t>::fromNetworkByteStream(addrRes.second, end);
  return {::asio::ip::address_v4{addrRes.first}, portRes.first};
}

inline Endpoint decodeEndpointV6(const HandleIt begin, const HandleIt end)
{
  using Bytes = ::asio::ip::address_v6::bytes_type;
  checkHandleSize(begin, end,
    std::tuple_size<Bytes>::value + sizeof(std::uint32_t) + sizeof(std::uint16_t));
  const auto addrRes = wire::Deserialize<Bytes>::fromNetworkByteStream(begin, end);
  const auto scopeRes =
    wire::Deserialize<std::uint32_t>::fromNetworkByteStream(addrRes.second, end);
  const auto portRes =
    wire::Deserialize<std::uint16_t>::fromNetworkByteStream(scopeRes.second, end);
  return {::asio::ip::address_v6{addrRes.first, scopeRes.first}, portRes.first};
}

inline Endpoint decodeEndpoint(const token::BinderHandle& handle)
{
  if (handle.bytes.empty())
  {
    throw std::invalid_argument("Empty endpoint binder handle");
  }

  const auto begin = handle.bytes.cbegin();
  switch (handle.bytes.front())
  {
  case kFamilyV4:
    return decodeEndpointV4(begin + 1, handle.bytes.cend());
  case kFamilyV6:
    return decodeEndpointV6(begin + 1, handle.bytes.cend());
  default:
    throw std::invalid_argument("Unknown address family in endpoint binder handle");
  }
}

} // namespace detail

// Binder whose identity is the UDP endpoint of the remote session.
// Default constructed binders are local-only stubs: they have no
// endpoint, cannot be turned into a handle and are only equal to
// themselves.
class EndpointBinder
{
public:
  EndpointBinder() = default;

  explicit EndpointBinder(Endpoint endpoint)
    : mEndpoint(std::move(endpoint))
  {
  }

  const std::optional<Endpoint>& endpoint() const
  {
    return mEndpoint;
  }

  friend bool operator==(const EndpointBinder& lhs, const EndpointBinder& rhs)
  {
    if (lhs.mEndpoint && rhs.mEndpoint)
    {
      return *lhs.mEndpoint == *rhs.mEndpoint;
    }
    return &lhs == &rhs;
  }

  friend bool operator!=(const EndpointBinder& lhs, const EndpointBinder& rhs)
  {
    return !(lhs == rhs);
  }

  friend std::size_t hashValue(const EndpointBinder& binder)
  {
    if (!binder.mEndpoint)
    {
      return std::hash<const void*>{}(&binder);
    }

    std::size_t result = binder.mEndpoint->port();
    for (const auto byte : detail::encodeEndpoint(*binder.mEndpoint).bytes)
    {
      result = 31 * result + byte;
    }
    return result;
  }

  friend std::optional<token::BinderHandle> toHandle(const EndpointBinder& binder)
  {
    if (!binder.mEndpoint)
    {
      return std::nullopt;
    }
    return detail::encodeEndpoint(*binder.mEndpoint);
  }

  friend std::ostream& operator<<(std::ostream& stream, const EndpointBinder& binder)
  {
    if (binder.mEndpoint)
    {
      return stream << "EndpointBinder{" << *binder.mEndpoint << "}";
    }
    return stream << "EndpointBinder{local}";
  }

private:
  std::optional<Endpoint> mEndpoint;
};

// Connection table owning the binders. Binders stay at a stable
// address for the lifetime of the table, and each endpoint maps to
// exactly one binder. Not thread-safe.
class EndpointBinderTable
{
public:
  EndpointBinderTable() = default;
  EndpointBinderTable(const EndpointBinderTable&) = delete;
  EndpointBinderTable& operator=(const EndpointBinderTable&) = delete;

  friend EndpointBinder* binderFor(EndpointBinderTable& table, const Endpoint& endpoint)
  {
    auto& pBinder = table.mRemote[endpoint];
    if (!pBinder)
    {
      pBinder = std::make_unique<EndpointBinder>(endpoint);
    }
    return pBinder.get();
  }

  friend EndpointBinder* localBinder(EndpointBinderTable& table)
  {
    table.mLocal.push_back(std::make_unique<EndpointBinder>());
    return table.mLocal.back().get();
  }

  // Throws std::invalid_argument for handles not produced by toHandle
  friend EndpointBinder* fromHandle(EndpointBinderTable& table,
                                    const token::BinderHandle& handle)
  {
    return binderFor(table, detail::decodeEndpoint(handle));
  }

  friend std::size_t size(const EndpointBinderTable& table)
  {
    return table.mRemote.size() + table.mLocal.size();
  }

private:
  std::map<Endpoint, std::unique_ptr<EndpointBinder>> mRemote;
  std::vector<std::unique_ptr<EndpointBinder>> mLocal;
};

} // namespace asio
} // namespace platforms
} // namespace mediasession

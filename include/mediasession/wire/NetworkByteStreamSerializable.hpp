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

#include <algorithm>
#include <array>
#include <cstdint>
#include <iterator>
#include <stdexcept>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

#if defined(MEDIASESSION_PLATFORM_WINDOWS)
#include <WinSock2.h>
#include <WS2tcpip.h>
#include <Windows.h>
#else
#include <arpa/inet.h>
#endif

namespace mediasession
{
namespace wire
{

// Concept: NetworkByteStreamSerializable
//
// A type that can be encoded to a stream of bytes and decoded from a
// stream of bytes in network byte order. The following type is for
// documentation purposes only.

struct NetworkByteStreamSerializable
{
  friend std::uint32_t sizeInByteStream(const NetworkByteStreamSerializable&);

  // The byte stream pointed to by 'out' must have sufficient space to
  // hold this object, as defined by sizeInByteStream.
  template <typename It>
  friend It toNetworkByteStream(const NetworkByteStreamSerializable&, It out);
};

// Deserialization aspect of the concept. Clients must name the type
// explicitly, so it lives outside the demonstration type above. The
// default implementation defers to a class static method on T.
template <typename T>
struct Deserialize
{
  // Throws std::range_error if parsing the type from the given byte
  // range fails. Returns a pair of the parsed value and an iterator to
  // the next byte to parse.
  template <typename It>
  static std::pair<T, It> fromNetworkByteStream(It begin, It end)
  {
    return T::fromNetworkByteStream(std::move(begin), std::move(end));
  }
};


// Default size implementation. Works for primitive types.

template <typename T>
std::uint32_t sizeInByteStream(T)
{
  return sizeof(T);
}

namespace detail
{

template <typename T, typename It>
It copyToByteStream(T t, It out)
{
  using namespace std;
  return copy_n(
    reinterpret_cast<typename iterator_traits<It>::pointer>(&t), sizeof(t), out);
}

template <typename T, typename It>
std::pair<T, It> copyFromByteStream(It begin, const It end)
{
  using namespace std;
  using ItDiff = typename iterator_traits<It>::difference_type;

  if (distance(begin, end) < static_cast<ItDiff>(sizeof(T)))
  {
    throw range_error("Parsing type from byte stream failed");
  }
  else
  {
    T t;
    const auto n = sizeof(t);
    copy_n(begin, n, reinterpret_cast<uint8_t*>(&t));
    return make_pair(t, begin + n);
  }
}

} // namespace detail


// uint8_t
template <typename It>
It toNetworkByteStream(const std::uint8_t byte, It out)
{
  return detail::copyToByteStream(byte, std::move(out));
}

template <>
struct Deserialize<std::uint8_t>
{
  template <typename It>
  static std::pair<std::uint8_t, It> fromNetworkByteStream(It begin, It end)
  {
    return detail::copyFromByteStream<std::uint8_t>(std::move(begin), std::move(end));
  }
};

// uint16_t
template <typename It>
It toNetworkByteStream(const std::uint16_t s, It out)
{
  return detail::copyToByteStream(htons(s), std::move(out));
}

template <>
struct Deserialize<std::uint16_t>
{
  template <typename It>
  static std::pair<std::uint16_t, It> fromNetworkByteStream(It begin, It end)
  {
    auto result =
      detail::copyFromByteStream<std::uint16_t>(std::move(begin), std::move(end));
    result.first = ntohs(result.first);
    return result;
  }
};

// uint32_t
template <typename It>
It toNetworkByteStream(const std::uint32_t l, It out)
{
  return detail::copyToByteStream(htonl(l), std::move(out));
}

template <>
struct Deserialize<std::uint32_t>
{
  template <typename It>
  static std::pair<std::uint32_t, It> fromNetworkByteStream(It begin, It end)
  {
    auto result =
      detail::copyFromByteStream<std::uint32_t>(std::move(begin), std::move(end));
    result.first = ntohl(result.first);
    return result;
  }
};

// int32_t in terms of uint32_t
template <typename It>
It toNetworkByteStream(const std::int32_t l, It out)
{
  return toNetworkByteStream(static_cast<std::uint32_t>(l), std::move(out));
}

template <>
struct Deserialize<std::int32_t>
{
  template <typename It>
  static std::pair<std::int32_t, It> fromNetworkByteStream(It begin, It end)
  {
    auto result =
      Deserialize<std::uint32_t>::fromNetworkByteStream(std::move(begin), std::move(end));
    return std::make_pair(static_cast<std::int32_t>(result.first), result.second);
  }
};

// string, prefixed with its length as uint32_t
inline std::uint32_t sizeInByteStream(const std::string& str)
{
  return sizeInByteStream(std::uint32_t{}) + static_cast<std::uint32_t>(str.size());
}

template <typename It>
It toNetworkByteStream(const std::string& str, It out)
{
  out = toNetworkByteStream(static_cast<std::uint32_t>(str.size()), std::move(out));
  return std::copy(str.begin(), str.end(), std::move(out));
}

template <>
struct Deserialize<std::string>
{
  template <typename It>
  static std::pair<std::string, It> fromNetworkByteStream(It begin, It end)
  {
    using namespace std;
    using ItDiff = typename iterator_traits<It>::difference_type;

    auto lengthRes = Deserialize<uint32_t>::fromNetworkByteStream(move(begin), end);
    if (distance(lengthRes.second, end) < static_cast<ItDiff>(lengthRes.first))
    {
      throw range_error("Parsing string from byte stream failed");
    }

    const auto strEnd = lengthRes.second + static_cast<ItDiff>(lengthRes.first);
    return make_pair(string(lengthRes.second, strEnd), strEnd);
  }
};

namespace detail
{

// Generic serialize/deserialize utilities for containers

template <typename Container>
std::uint32_t containerSizeInByteStream(const Container& container)
{
  std::uint32_t totalSize = 0;
  for (const auto& val : container)
  {
    totalSize += sizeInByteStream(val);
  }
  return totalSize;
}

template <typename Container, typename It>
It containerToNetworkByteStream(const Container& container, It out)
{
  for (const auto& val : container)
  {
    out = toNetworkByteStream(val, out);
  }
  return out;
}

template <typename T, typename BytesIt, typename InsertIt>
BytesIt deserializeContainer(BytesIt bytesBegin,
                             const BytesIt bytesEnd,
                             InsertIt contBegin,
                             const std::uint32_t maxElements)
{
  using namespace std;
  uint32_t numElements = 0;
  while (bytesBegin < bytesEnd && numElements < maxElements)
  {
    T newVal;
    tie(newVal, bytesBegin) = Deserialize<T>::fromNetworkByteStream(bytesBegin, bytesEnd);
    *contBegin++ = newVal;
    ++numElements;
  }
  return bytesBegin;
}

} // namespace detail

// array
template <typename T, std::size_t Size>
std::uint32_t sizeInByteStream(const std::array<T, Size>& arr)
{
  return detail::containerSizeInByteStream(arr);
}

template <typename T, std::size_t Size, typename It>
It toNetworkByteStream(const std::array<T, Size>& arr, It out)
{
  return detail::containerToNetworkByteStream(arr, std::move(out));
}

template <typename T, std::size_t Size>
struct Deserialize<std::array<T, Size>>
{
  template <typename It>
  static std::pair<std::array<T, Size>, It> fromNetworkByteStream(It begin, It end)
  {
    using namespace std;
    array<T, Size> result{};
    auto resultIt =
      detail::deserializeContainer<T>(move(begin), move(end), result.begin(), Size);
    return make_pair(move(result), move(resultIt));
  }
};

// vector, consumes the remainder of the given range
template <typename T, typename Alloc>
std::uint32_t sizeInByteStream(const std::vector<T, Alloc>& vec)
{
  return detail::containerSizeInByteStream(vec);
}

template <typename T, typename Alloc, typename It>
It toNetworkByteStream(const std::vector<T, Alloc>& vec, It out)
{
  return detail::containerToNetworkByteStream(vec, std::move(out));
}

template <typename T, typename Alloc>
struct Deserialize<std::vector<T, Alloc>>
{
  template <typename It>
  static std::pair<std::vector<T, Alloc>, It> fromNetworkByteStream(
    It bytesBegin, It bytesEnd)
  {
    using namespace std;
    vector<T, Alloc> result;
    // The number of bytes remaining is the only available upper bound
    // on the number of elements
    const auto maxElements = static_cast<uint32_t>(distance(bytesBegin, bytesEnd));
    auto resultIt = detail::deserializeContainer<T>(
      move(bytesBegin), move(bytesEnd), back_inserter(result), maxElements);

    return make_pair(move(result), move(resultIt));
  }
};

} // namespace wire
} // namespace mediasession

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
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>

namespace mediasession
{
namespace wire
{

struct PayloadEntryHeader
{
  using Key = std::uint32_t;
  using Size = std::uint32_t;

  Key key;
  Size size;

  friend Size sizeInByteStream(const PayloadEntryHeader& header)
  {
    return sizeInByteStream(header.key) + sizeInByteStream(header.size);
  }

  template <typename It>
  friend It toNetworkByteStream(const PayloadEntryHeader& header, It out)
  {
    return toNetworkByteStream(header.size, toNetworkByteStream(header.key, std::move(out)));
  }

  template <typename It>
  static std::pair<PayloadEntryHeader, It> fromNetworkByteStream(It begin, const It end)
  {
    using namespace std;
    Key key;
    Size size;
    tie(key, begin) = Deserialize<Key>::fromNetworkByteStream(begin, end);
    tie(size, begin) = Deserialize<Size>::fromNetworkByteStream(begin, end);
    return make_pair(PayloadEntryHeader{key, size}, move(begin));
  }
};

template <typename EntryType>
struct PayloadEntry
{
  PayloadEntry(EntryType entryVal)
    : value(std::move(entryVal))
  {
    header = {static_cast<PayloadEntryHeader::Key>(EntryType::key), sizeInByteStream(value)};
  }

  PayloadEntryHeader header;
  EntryType value;

  friend std::uint32_t sizeInByteStream(const PayloadEntry& entry)
  {
    return sizeInByteStream(entry.header) + sizeInByteStream(entry.value);
  }

  template <typename It>
  friend It toNetworkByteStream(const PayloadEntry& entry, It out)
  {
    return toNetworkByteStream(entry.value, toNetworkByteStream(entry.header, std::move(out)));
  }
};

// Entries that are absent take no space in the byte stream
template <typename EntryType>
std::uint32_t sizeInByteStream(const std::optional<PayloadEntry<EntryType>>& oEntry)
{
  return oEntry ? sizeInByteStream(*oEntry) : 0;
}

template <typename EntryType, typename It>
It toNetworkByteStream(const std::optional<PayloadEntry<EntryType>>& oEntry, It out)
{
  return oEntry ? toNetworkByteStream(*oEntry, std::move(out)) : out;
}

namespace detail
{

template <typename It, typename Log>
using HandlerMap =
  std::unordered_map<PayloadEntryHeader::Key, std::function<void(It, It, Log)>>;

// Given an index of handlers and a byte range, parse the bytes as a
// sequence of payload entries and invoke the appropriate handler for
// each entry type. Entries that do not have a corresponding handler in
// the map are ignored. Throws std::range_error if parsing fails for any
// entry. Handlers of entries preceding the failing one have already
// been called when that happens.
template <typename It, typename Log>
void parseByteStream(HandlerMap<It, Log>& map, It bsBegin, const It bsEnd, Log log)
{
  using namespace std;

  while (bsBegin < bsEnd)
  {
    PayloadEntryHeader header;
    It valueBegin;
    tie(header, valueBegin) =
      Deserialize<PayloadEntryHeader>::fromNetworkByteStream(bsBegin, bsEnd);

    // The reported size of the entry must not exceed the byte stream
    if (distance(valueBegin, bsEnd) < static_cast<ptrdiff_t>(header.size))
    {
      throw range_error("Partial payload entry with key: " + to_string(header.key));
    }
    const It valueEnd = valueBegin + static_cast<ptrdiff_t>(header.size);

    bsBegin = valueEnd;

    auto handlerIt = map.find(header.key);
    if (handlerIt == end(map))
    {
      debug(log) << "Ignored unknown payload entry with key: " << header.key;
    }
    else
    {
      handlerIt->second(move(valueBegin), move(valueEnd), log);
    }
  }
}

} // namespace detail

// Parse payloads to values
template <typename... Entries>
struct ParsePayload;

template <typename First, typename... Rest>
struct ParsePayload<First, Rest...>
{
  template <typename It, typename Log, typename... Handlers>
  static void parse(It begin, It end, Log log, Handlers... handlers)
  {
    detail::HandlerMap<It, Log> map;
    collectHandlers(map, std::move(handlers)...);
    detail::parseByteStream(map, std::move(begin), std::move(end), std::move(log));
  }

  template <typename It, typename Log, typename FirstHandler, typename... RestHandlers>
  static void collectHandlers(detail::HandlerMap<It, Log>& map,
                              FirstHandler handler,
                              RestHandlers... rest)
  {
    using namespace std;
    map[static_cast<PayloadEntryHeader::Key>(First::key)] =
      [handler](const It begin, const It end, Log log) {
        const auto res = Deserialize<First>::fromNetworkByteStream(begin, end);
        if (res.second != end)
        {
          warning(log) << "Parsing payload entry " << First::key
                       << " did not consume the expected number of bytes. "
                       << " Expected: " << distance(begin, end)
                       << ", Actual: " << distance(begin, res.second);
        }
        handler(res.first);
      };

    ParsePayload<Rest...>::collectHandlers(map, std::move(rest)...);
  }
};

template <>
struct ParsePayload<>
{
  template <typename It, typename Log>
  static void collectHandlers(detail::HandlerMap<It, Log>&)
  {
  }
};

template <typename... Entries, typename It, typename Log, typename... Handlers>
void parsePayload(It begin, It end, Log log, Handlers... handlers)
{
  ParsePayload<Entries...>::parse(
    std::move(begin), std::move(end), std::move(log), std::move(handlers)...);
}

} // namespace wire
} // namespace mediasession

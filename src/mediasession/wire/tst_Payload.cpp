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

#include <mediasession/test/CatchWrapper.hpp>
#include <mediasession/util/Log.hpp>
#include <mediasession/wire/Payload.hpp>
#include <mediasession/wire/test/PayloadEntries.hpp>
#include <optional>
#include <vector>

namespace mediasession
{
namespace wire
{

TEST_CASE("Payload | FixedSizeEntrySize", "[Payload]")
{
  // Header (key and size) followed by the int32 value
  CHECK(12 == sizeInByteStream(PayloadEntry<test::Foo>{test::Foo{}}));
}

TEST_CASE("Payload | AbsentEntryTakesNoSpace", "[Payload]")
{
  const auto oEntry = std::optional<PayloadEntry<test::Foo>>{};
  CHECK(0 == sizeInByteStream(oEntry));

  std::vector<std::uint8_t> bytes(4);
  CHECK(begin(bytes) == toNetworkByteStream(oEntry, begin(bytes)));
}

TEST_CASE("Payload | SingleEntryEncoding", "[Payload]")
{
  const auto entry = PayloadEntry<test::Foo>{test::Foo{-1}};
  std::vector<std::uint8_t> bytes(sizeInByteStream(entry));
  const auto end = toNetworkByteStream(entry, begin(bytes));

  CHECK(bytes.size() == static_cast<size_t>(end - begin(bytes)));
  // Key, then size of the value, then the value
  CHECK(bytes[0] == '_');
  CHECK(bytes[3] == 'o');
  CHECK(bytes[7] == 4);
  CHECK(bytes[8] == 0xff);
  CHECK(bytes[11] == 0xff);
}

TEST_CASE("Payload | RoundtripTwoEntries", "[Payload]")
{
  const auto expectedFoo = test::Foo{1};
  const auto expectedBar = test::Bar{{0, 1, 2}};
  const auto fooEntry = PayloadEntry<test::Foo>{expectedFoo};
  const auto barEntry = PayloadEntry<test::Bar>{expectedBar};

  std::vector<std::uint8_t> bytes(sizeInByteStream(fooEntry) + sizeInByteStream(barEntry));
  const auto end =
    toNetworkByteStream(barEntry, toNetworkByteStream(fooEntry, begin(bytes)));

  test::Foo actualFoo{};
  test::Bar actualBar{};
  parsePayload<test::Foo, test::Bar>(
    begin(bytes), end, util::NullLog{},
    [&actualFoo](const test::Foo& foo) { actualFoo = foo; },
    [&actualBar](const test::Bar& bar) { actualBar = bar; });

  CHECK(expectedFoo.fooVal == actualFoo.fooVal);
  CHECK(expectedBar.barVals == actualBar.barVals);
}

TEST_CASE("Payload | UnknownEntriesAreSkipped", "[Payload]")
{
  const auto fooEntry = PayloadEntry<test::Foo>{test::Foo{5}};
  const auto barEntry = PayloadEntry<test::Bar>{test::Bar{{3}}};

  std::vector<std::uint8_t> bytes(sizeInByteStream(fooEntry) + sizeInByteStream(barEntry));
  const auto end =
    toNetworkByteStream(fooEntry, toNetworkByteStream(barEntry, begin(bytes)));

  test::Foo actualFoo{};
  parsePayload<test::Foo>(begin(bytes), end, util::NullLog{},
                          [&actualFoo](const test::Foo& foo) { actualFoo = foo; });

  CHECK(5 == actualFoo.fooVal);
}

TEST_CASE("Payload | TruncatedEntryThrows", "[Payload]")
{
  const auto expectedBar = test::Bar{{0, 1, 2}};
  const auto barEntry = PayloadEntry<test::Bar>{expectedBar};
  const auto fooEntry = PayloadEntry<test::Foo>{test::Foo{1}};

  std::vector<std::uint8_t> bytes(sizeInByteStream(barEntry) + sizeInByteStream(fooEntry));
  const auto end =
    toNetworkByteStream(fooEntry, toNetworkByteStream(barEntry, begin(bytes)));

  test::Foo actualFoo{};
  test::Bar actualBar{};

  REQUIRE_THROWS_AS(
    (parsePayload<test::Foo, test::Bar>(
      begin(bytes), end - 1, util::NullLog{},
      [&actualFoo](const test::Foo& foo) { actualFoo = foo; },
      [&actualBar](const test::Bar& bar) { actualBar = bar; })),
    std::range_error);

  // Entries preceding the truncated one have been delivered
  CHECK(0 == actualFoo.fooVal);
  CHECK(expectedBar.barVals == actualBar.barVals);
}

} // namespace wire
} // namespace mediasession

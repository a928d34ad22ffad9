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
#include <mediasession/wire/NetworkByteStreamSerializable.hpp>
#include <array>
#include <string>
#include <vector>

namespace mediasession
{
namespace wire
{

TEST_CASE("NetworkByteStreamSerializable")
{
  SECTION("Uint32IsWrittenBigEndian")
  {
    auto byteStream = std::vector<std::uint8_t>(4);
    toNetworkByteStream(std::uint32_t{0x01020304}, begin(byteStream));
    CHECK(byteStream == std::vector<std::uint8_t>{1, 2, 3, 4});
  }

  SECTION("NegativeInt32RoundtripByteStreamEncoding")
  {
    using namespace std;
    const auto expected = int32_t{-7};
    auto byteStream = vector<uint8_t>(sizeInByteStream(expected));
    const auto serializedEndIt = toNetworkByteStream(expected, begin(byteStream));
    CHECK(end(byteStream) == serializedEndIt);

    const auto deserialized =
      Deserialize<int32_t>::fromNetworkByteStream(begin(byteStream), end(byteStream));
    CHECK(expected == deserialized.first);
    CHECK(end(byteStream) == deserialized.second);
  }

  SECTION("StringRoundtripByteStreamEncoding")
  {
    using namespace std;
    const auto expectedString = string{"com.example.player"};
    const auto size = sizeInByteStream(expectedString);
    CHECK(4 + expectedString.size() == size);

    auto byteStream = vector<uint8_t>(size);
    const auto serializedEndIt = toNetworkByteStream(expectedString, begin(byteStream));
    CHECK(byteStream.size()
          == static_cast<size_t>(distance(begin(byteStream), serializedEndIt)));

    const auto deserialized =
      Deserialize<string>::fromNetworkByteStream(begin(byteStream), end(byteStream));
    CHECK(expectedString == deserialized.first);
  }

  SECTION("EmptyStringRoundtripByteStreamEncoding")
  {
    using namespace std;
    auto byteStream = vector<uint8_t>(sizeInByteStream(string{}));
    CHECK(4 == byteStream.size());
    toNetworkByteStream(string{}, begin(byteStream));

    const auto deserialized =
      Deserialize<string>::fromNetworkByteStream(begin(byteStream), end(byteStream));
    CHECK(deserialized.first.empty());
  }

  SECTION("TruncatedStringThrows")
  {
    using namespace std;
    const auto str = string{"session"};
    auto byteStream = vector<uint8_t>(sizeInByteStream(str));
    toNetworkByteStream(str, begin(byteStream));

    CHECK_THROWS_AS(
      Deserialize<string>::fromNetworkByteStream(begin(byteStream), end(byteStream) - 1),
      range_error);
  }

  SECTION("TruncatedIntegerThrows")
  {
    const auto bytes = std::array<std::uint8_t, 3>{{0, 0, 1}};
    CHECK_THROWS_AS(
      Deserialize<std::uint32_t>::fromNetworkByteStream(begin(bytes), end(bytes)),
      std::range_error);
  }

  SECTION("ArrayRoundtripByteStreamEncoding")
  {
    using namespace std;
    using Array = array<uint16_t, 3>;
    const auto expectedArray = Array{{0, 1, 0xffff}};
    const auto size = sizeInByteStream(expectedArray);
    CHECK(6 == size);

    auto byteStream = vector<uint8_t>(size);
    toNetworkByteStream(expectedArray, begin(byteStream));

    const auto deserialized =
      Deserialize<Array>::fromNetworkByteStream(begin(byteStream), end(byteStream));
    CHECK(expectedArray == deserialized.first);
  }

  SECTION("VectorTakesRemainingBytes")
  {
    using namespace std;
    using Vector = vector<uint8_t>;
    const auto expectedVector = Vector{9, 8, 7, 6, 5};
    const auto size = sizeInByteStream(expectedVector);
    CHECK(5 == size);

    auto byteStream = vector<uint8_t>(size);
    toNetworkByteStream(expectedVector, begin(byteStream));

    const auto deserialized =
      Deserialize<Vector>::fromNetworkByteStream(begin(byteStream), end(byteStream));
    CHECK(expectedVector == deserialized.first);
    CHECK(end(byteStream) == deserialized.second);
  }
}

} // namespace wire
} // namespace mediasession

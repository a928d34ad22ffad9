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

#include <mediasession/platforms/Config.hpp>
#include <mediasession/test/CatchWrapper.hpp>
#include <mediasession/token/test/PackageRegistry.hpp>
#include <initializer_list>
#include <sstream>
#include <vector>

namespace mediasession
{
namespace platforms
{
namespace asio
{

namespace
{

Endpoint v4Endpoint()
{
  return {::asio::ip::make_address_v4("192.168.1.20"), 5555};
}

Endpoint v6Endpoint()
{
  return {::asio::ip::make_address_v6("fe80::1"), 6000};
}

Endpoint scopedV6Endpoint()
{
  auto address = ::asio::ip::make_address_v6("fe80::1");
  address.scope_id(3);
  return {address, 6000};
}

} // namespace

TEST_CASE("EndpointBinder | Identity", "[EndpointBinder]")
{
  SECTION("SameEndpointCompareEqual")
  {
    const auto lhs = EndpointBinder{v4Endpoint()};
    const auto rhs = EndpointBinder{v4Endpoint()};
    CHECK(lhs == rhs);
    CHECK(hashValue(lhs) == hashValue(rhs));
  }

  SECTION("DifferentEndpointsDiffer")
  {
    CHECK(EndpointBinder{v4Endpoint()} != EndpointBinder{v6Endpoint()});
    CHECK(EndpointBinder{v4Endpoint()}
          != EndpointBinder{Endpoint{::asio::ip::make_address_v4("192.168.1.20"), 5556}});
  }

  SECTION("LocalStubsAreOnlyEqualToThemselves")
  {
    const auto stub = EndpointBinder{};
    const auto other = EndpointBinder{};
    CHECK(stub == stub);
    CHECK(stub != other);
    CHECK(stub != EndpointBinder{v4Endpoint()});
    CHECK(!toHandle(stub));
  }

  SECTION("Rendering")
  {
    std::ostringstream stream;
    stream << EndpointBinder{v4Endpoint()} << " " << EndpointBinder{};
    CHECK(stream.str() == "EndpointBinder{192.168.1.20:5555} EndpointBinder{local}");
  }
}

TEST_CASE("EndpointBinder | Handles", "[EndpointBinder]")
{
  SECTION("V4HandleLayout")
  {
    const auto oHandle = toHandle(EndpointBinder{v4Endpoint()});
    REQUIRE(oHandle);
    // 5555 == 0x15b3
    CHECK(oHandle->bytes == std::vector<std::uint8_t>{4, 192, 168, 1, 20, 0x15, 0xb3});
  }

  SECTION("V6HandleLayoutCarriesScopeId")
  {
    const auto oHandle = toHandle(EndpointBinder{scopedV6Endpoint()});
    REQUIRE(oHandle);
    REQUIRE(23 == oHandle->bytes.size());
    CHECK(6 == oHandle->bytes[0]);
    // 3 == scope id, 6000 == 0x1770
    CHECK(std::vector<std::uint8_t>(oHandle->bytes.begin() + 17, oHandle->bytes.end())
          == std::vector<std::uint8_t>{0, 0, 0, 3, 0x17, 0x70});
  }

  SECTION("HandleRoundtrip")
  {
    for (const auto& endpoint : {v4Endpoint(), v6Endpoint(), scopedV6Endpoint()})
    {
      EndpointBinderTable table;
      const auto oHandle = toHandle(EndpointBinder{endpoint});
      REQUIRE(oHandle);
      const auto pBinder = fromHandle(table, *oHandle);
      REQUIRE(pBinder->endpoint());
      CHECK(endpoint == *pBinder->endpoint());
    }
  }

  SECTION("MalformedHandlesThrow")
  {
    EndpointBinderTable table;
    CHECK_THROWS_AS(fromHandle(table, token::BinderHandle{}), std::invalid_argument);
    CHECK_THROWS_AS(
      fromHandle(table, token::BinderHandle{{5, 1, 2, 3, 4, 0, 1}}), std::invalid_argument);
    CHECK_THROWS_AS(
      fromHandle(table, token::BinderHandle{{4, 1, 2, 3, 4, 0}}), std::invalid_argument);
    CHECK(0 == size(table));
  }
}

TEST_CASE("EndpointBinderTable", "[EndpointBinder]")
{
  EndpointBinderTable table;

  SECTION("OneBinderPerEndpoint")
  {
    const auto pBinder = binderFor(table, v4Endpoint());
    CHECK(pBinder == binderFor(table, v4Endpoint()));
    CHECK(pBinder == fromHandle(table, *toHandle(*pBinder)));
    CHECK(pBinder != binderFor(table, v6Endpoint()));
    CHECK(2 == size(table));
  }

  SECTION("ScopedEndpointsKeepTheirOwnBinder")
  {
    const auto pScoped = binderFor(table, scopedV6Endpoint());
    CHECK(pScoped != binderFor(table, v6Endpoint()));
    CHECK(pScoped == fromHandle(table, *toHandle(*pScoped)));
    CHECK(2 == size(table));
  }

  SECTION("LocalBindersAreDistinct")
  {
    const auto pFirst = localBinder(table);
    const auto pSecond = localBinder(table);
    CHECK(pFirst != pSecond);
    CHECK(*pFirst != *pSecond);
    CHECK(2 == size(table));
  }
}

TEST_CASE("EndpointBinder | SessionTokenTransfer", "[EndpointBinder]")
{
  token::test::PackageRegistry registry;
  registry.addPackage("com.example.player", 10042);

  EndpointBinderTable senderTable;
  EndpointBinderTable receiverTable;

  const auto sent = SessionToken{registry, token::kUnknownUid, token::TokenType::Session,
                                 "com.example.player", std::nullopt, "main",
                                 binderFor(senderTable, scopedV6Endpoint())};

  const auto record = toRecord(sent);
  std::vector<std::uint8_t> bytes(sizeInByteStream(record));
  toNetworkByteStream(record, begin(bytes));

  const auto oRestored = SessionToken::fromRecord(
    receiverTable, token::TokenRecord::fromPayload(begin(bytes), end(bytes), platform::Log{}));

  REQUIRE(oRestored);
  CHECK(10042 == oRestored->uid());
  // Equal binders held in different tables
  CHECK(sent.sessionBinder() != oRestored->sessionBinder());
  CHECK(sent == *oRestored);
  CHECK(std::hash<SessionToken>{}(sent) == std::hash<SessionToken>{}(*oRestored));
}

TEST_CASE("EndpointBinder | LocalStubTokenCannotBeRestored", "[EndpointBinder]")
{
  token::test::PackageRegistry registry;
  EndpointBinderTable table;

  const auto local = SessionToken{registry, 1, token::TokenType::Session, "com.example.player",
                                  std::nullopt, "main", localBinder(table)};

  CHECK_THROWS_AS(SessionToken::fromRecord(table, toRecord(local)), std::invalid_argument);
}

} // namespace asio
} // namespace platforms
} // namespace mediasession

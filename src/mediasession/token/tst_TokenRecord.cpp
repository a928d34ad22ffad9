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
#include <mediasession/token/SessionToken.hpp>
#include <mediasession/token/TokenRecord.hpp>
#include <mediasession/token/test/PackageRegistry.hpp>
#include <mediasession/token/test/SessionBinder.hpp>
#include <mediasession/util/Log.hpp>
#include <vector>

namespace mediasession
{
namespace token
{

using Token = SessionToken<test::SessionBinder>;

namespace
{

TokenRecord sessionRecord()
{
  TokenRecord record;
  record.uid = 10042;
  record.type = toInt(TokenType::Session);
  record.packageName = "com.example.player";
  record.id = "main";
  record.sessionBinder = BinderHandle{{0, 0, 0, 5}};
  return record;
}

TokenRecord serviceRecord(const TokenType type)
{
  TokenRecord record;
  record.uid = 10042;
  record.type = toInt(type);
  record.packageName = "com.example.player";
  record.serviceName = "PlaybackService";
  record.id = "";
  return record;
}

std::vector<std::uint8_t> encode(const TokenRecord& record)
{
  std::vector<std::uint8_t> bytes(sizeInByteStream(record));
  toNetworkByteStream(record, begin(bytes));
  return bytes;
}

TokenRecord decode(const std::vector<std::uint8_t>& bytes)
{
  return TokenRecord::fromPayload(begin(bytes), end(bytes), util::NullLog{});
}

} // namespace

TEST_CASE("TokenRecord | ByteStreamEncoding", "[TokenRecord]")
{
  SECTION("FullRecordRoundtrip")
  {
    auto record = sessionRecord();
    record.serviceName = "PlaybackService";
    CHECK(record == decode(encode(record)));
  }

  SECTION("AbsentFieldsStayAbsent")
  {
    const auto record = serviceRecord(TokenType::LibraryService);
    const auto decoded = decode(encode(record));
    CHECK(record == decoded);
    CHECK(!decoded.sessionBinder);
    // An empty id is still present
    REQUIRE(decoded.id);
    CHECK(decoded.id->empty());
  }

  SECTION("EmptyRecordHasNoBytes")
  {
    CHECK(0 == sizeInByteStream(TokenRecord{}));
    CHECK(TokenRecord{} == decode({}));
  }

  SECTION("UnknownEntriesAreSkipped")
  {
    auto bytes = encode(sessionRecord());
    // Entry with key 'xtra' and a two byte value
    const std::vector<std::uint8_t> extra{'x', 't', 'r', 'a', 0, 0, 0, 2, 1, 2};
    bytes.insert(bytes.begin(), extra.begin(), extra.end());
    CHECK(sessionRecord() == decode(bytes));
  }

  SECTION("TruncatedRecordThrows")
  {
    auto bytes = encode(sessionRecord());
    bytes.pop_back();
    CHECK_THROWS_AS(decode(bytes), std::range_error);
  }
}

TEST_CASE("TokenRecord | FromRecord", "[TokenRecord]")
{
  test::BinderTable table;

  SECTION("AbsentRecordIsNoToken")
  {
    CHECK(!Token::fromRecord(table, std::nullopt));
    CHECK(0 == table.handleLookups);
  }

  SECTION("SessionRecord")
  {
    const auto oToken = Token::fromRecord(table, sessionRecord());
    REQUIRE(oToken);
    CHECK(10042 == oToken->uid());
    CHECK(TokenType::Session == oToken->type());
    CHECK("com.example.player" == oToken->packageName());
    CHECK("main" == oToken->id());
    REQUIRE(oToken->sessionBinder());
    CHECK(5 == *oToken->sessionBinder()->remoteId);
  }

  SECTION("MissingUidDefaultsToZero")
  {
    auto record = sessionRecord();
    record.uid = std::nullopt;
    CHECK(0 == Token::fromRecord(table, record)->uid());
  }

  SECTION("ServiceRecordWithEmptyId")
  {
    const auto oToken = Token::fromRecord(table, serviceRecord(TokenType::SessionService));
    REQUIRE(oToken);
    CHECK(oToken->id().empty());
    CHECK(!oToken->sessionBinder());
  }

  SECTION("SessionWithoutBinderThrows")
  {
    auto record = sessionRecord();
    record.sessionBinder = std::nullopt;
    CHECK_THROWS_AS(Token::fromRecord(table, record), std::invalid_argument);
  }

  SECTION("LibraryServiceWithEmptyServiceNameThrows")
  {
    auto record = serviceRecord(TokenType::LibraryService);
    record.serviceName = "";
    CHECK_THROWS_AS(Token::fromRecord(table, record), std::invalid_argument);
    record.serviceName = std::nullopt;
    CHECK_THROWS_AS(Token::fromRecord(table, record), std::invalid_argument);
  }

  SECTION("UnknownOrMissingTypeThrows")
  {
    auto record = sessionRecord();
    record.type = 3;
    CHECK_THROWS_AS(Token::fromRecord(table, record), std::invalid_argument);
    record.type = -1;
    CHECK_THROWS_AS(Token::fromRecord(table, record), std::invalid_argument);
    record.type = std::nullopt;
    CHECK_THROWS_AS(Token::fromRecord(table, record), std::invalid_argument);
  }

  SECTION("MissingPackageNameOrIdThrows")
  {
    auto record = serviceRecord(TokenType::SessionService);
    record.packageName = "";
    CHECK_THROWS_AS(Token::fromRecord(table, record), std::invalid_argument);

    record = serviceRecord(TokenType::SessionService);
    record.packageName = std::nullopt;
    CHECK_THROWS_AS(Token::fromRecord(table, record), std::invalid_argument);

    record = serviceRecord(TokenType::SessionService);
    record.id = std::nullopt;
    CHECK_THROWS_AS(Token::fromRecord(table, record), std::invalid_argument);
  }

  SECTION("NegativeUidThrows")
  {
    auto record = serviceRecord(TokenType::SessionService);
    record.uid = -5;
    CHECK_THROWS_AS(Token::fromRecord(table, record), std::invalid_argument);
  }

  SECTION("MalformedBinderHandleThrows")
  {
    auto record = sessionRecord();
    record.sessionBinder = BinderHandle{{1, 2}};
    CHECK_THROWS_AS(Token::fromRecord(table, record), std::invalid_argument);
  }
}

TEST_CASE("TokenRecord | ToRecord", "[TokenRecord]")
{
  test::PackageRegistry registry;
  test::BinderTable table;

  SECTION("SessionWithRemoteBinder")
  {
    const auto token = Token{registry, 7, TokenType::Session, "com.example.player",
                             std::nullopt, "main", table.remote(5)};
    auto expected = sessionRecord();
    expected.uid = 7;
    CHECK(expected == toRecord(token));
  }

  SECTION("LocalStubHasNoHandle")
  {
    const auto token = Token{registry, 7, TokenType::Session, "com.example.player",
                             std::nullopt, "main", table.local()};
    CHECK(!toRecord(token).sessionBinder);
  }

  SECTION("ServiceKeepsServiceName")
  {
    const auto token = Token{registry, 10042, TokenType::LibraryService,
                             "com.example.player", "PlaybackService", "", nullptr};
    CHECK(serviceRecord(TokenType::LibraryService) == toRecord(token));
  }
}

TEST_CASE("TokenRecord | TokenRoundtrip", "[TokenRecord]")
{
  test::PackageRegistry registry;
  test::BinderTable senderTable;
  test::BinderTable receiverTable;

  const auto tokens = std::vector<Token>{
    Token{registry, 1, TokenType::Session, "com.example.a", std::nullopt, "s",
          senderTable.remote(11)},
    Token{registry, 2, TokenType::SessionService, "com.example.b", "Service", "", nullptr},
    Token{registry, 3, TokenType::LibraryService, "com.example.c", "Library", "lib",
          senderTable.remote(12)}};

  for (const auto& token : tokens)
  {
    const auto bytes = encode(toRecord(token));
    const auto oRestored = Token::fromRecord(receiverTable, decode(bytes));
    REQUIRE(oRestored);
    CHECK(token == *oRestored);
    CHECK(hashValue(token) == hashValue(*oRestored));
  }
}

} // namespace token
} // namespace mediasession

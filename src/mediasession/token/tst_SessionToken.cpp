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
#include <mediasession/token/test/PackageRegistry.hpp>
#include <mediasession/token/test/SessionBinder.hpp>
#include <sstream>
#include <unordered_set>

namespace mediasession
{
namespace token
{

using Token = SessionToken<test::SessionBinder>;

namespace
{

const std::string kPackage = "com.example.player";
const std::string kService = "PlaybackService";

test::PackageRegistry makeRegistry()
{
  test::PackageRegistry registry;
  registry.addPackage(kPackage, 10042);
  registry.addComponent(kSessionServiceInterface,
                        {kPackage, kService, ComponentInfo::MetaData{{kSessionIdMetaData, "X"}}});
  registry.addComponent(kLibraryServiceInterface,
                        {kPackage, "BrowseService", ComponentInfo::MetaData{}});
  registry.addComponent(kLibraryServiceInterface, {kPackage, "BareService", std::nullopt});
  return registry;
}

} // namespace

TEST_CASE("SessionToken | SessionWithBinderIsStoredVerbatim", "[SessionToken]")
{
  auto registry = makeRegistry();
  test::BinderTable table;
  auto pBinder = table.remote(7);

  const auto token =
    Token{registry, 10042, TokenType::Session, kPackage, std::nullopt, "main", pBinder};

  CHECK(pBinder == token.sessionBinder());
  CHECK(10042 == token.uid());
  CHECK(TokenType::Session == token.type());
  CHECK(kPackage == token.packageName());
  CHECK(!token.serviceName());
  CHECK("main" == token.id());
  // A known uid and id need no registry lookups
  CHECK(0 == registry.ownerIdQueries);
  CHECK(0 == registry.componentQueries);
}

TEST_CASE("SessionToken | UnknownUidIsResolved", "[SessionToken]")
{
  auto registry = makeRegistry();

  const auto token =
    Token{registry, kUnknownUid, TokenType::Session, kPackage, std::nullopt, "main", nullptr};

  CHECK(10042 == token.uid());
  CHECK(1 == registry.ownerIdQueries);
}

TEST_CASE("SessionToken | UnknownPackageThrows", "[SessionToken]")
{
  auto registry = makeRegistry();
  CHECK_THROWS_AS(
    (Token{registry, kUnknownUid, TokenType::Session, "com.example.missing", std::nullopt,
           "main", nullptr}),
    std::invalid_argument);
}

TEST_CASE("SessionToken | ServiceIdIsReadFromMetaData", "[SessionToken]")
{
  auto registry = makeRegistry();

  const auto token = Token{
    registry, kUnknownUid, TokenType::SessionService, kPackage, kService, std::nullopt, nullptr};

  CHECK("X" == token.id());
  CHECK(kService == *token.serviceName());
  CHECK(1 == registry.componentQueries);
}

TEST_CASE("SessionToken | ServiceWithoutSessionIdEntryGetsEmptyId", "[SessionToken]")
{
  auto registry = makeRegistry();

  const auto withMetaData = Token{
    registry, 1, TokenType::LibraryService, kPackage, "BrowseService", std::nullopt, nullptr};
  const auto withoutMetaData = Token{
    registry, 1, TokenType::LibraryService, kPackage, "BareService", std::nullopt, nullptr};

  CHECK(withMetaData.id().empty());
  CHECK(withoutMetaData.id().empty());
}

TEST_CASE("SessionToken | ExplicitIdSkipsComponentLookup", "[SessionToken]")
{
  auto registry = makeRegistry();

  const auto token =
    Token{registry, 1, TokenType::SessionService, kPackage, kService, "given", nullptr};

  CHECK("given" == token.id());
  CHECK(0 == registry.componentQueries);
}

TEST_CASE("SessionToken | ConstructionFailures", "[SessionToken]")
{
  auto registry = makeRegistry();

  SECTION("ComponentNotFound")
  {
    CHECK_THROWS_AS((Token{registry, 1, TokenType::SessionService, kPackage, "Unknown",
                           std::nullopt, nullptr}),
                    std::invalid_argument);
  }

  SECTION("ComponentAdvertisesOtherAction")
  {
    // PlaybackService is only registered as a session service
    CHECK_THROWS_AS((Token{registry, 1, TokenType::LibraryService, kPackage, kService,
                           std::nullopt, nullptr}),
                    std::invalid_argument);
  }

  SECTION("SessionTypeCannotDiscoverId")
  {
    CHECK_THROWS_AS(
      (Token{registry, 1, TokenType::Session, kPackage, kService, std::nullopt, nullptr}),
      std::invalid_argument);
  }

  SECTION("ServiceTypeWithoutServiceName")
  {
    CHECK_THROWS_AS((Token{registry, 1, TokenType::SessionService, kPackage, std::nullopt,
                           "id", nullptr}),
                    std::invalid_argument);
    CHECK_THROWS_AS((Token{registry, 1, TokenType::LibraryService, kPackage, std::string{},
                           "id", nullptr}),
                    std::invalid_argument);
    CHECK_THROWS_AS((Token{registry, 1, TokenType::SessionService, kPackage, std::string{},
                           std::nullopt, nullptr}),
                    std::invalid_argument);
  }

  SECTION("MissingIdWithoutService")
  {
    CHECK_THROWS_AS(
      (Token{registry, 1, TokenType::Session, kPackage, std::nullopt, std::nullopt, nullptr}),
      std::invalid_argument);
  }

  SECTION("UnknownType")
  {
    CHECK_THROWS_AS((Token{registry, 1, static_cast<TokenType>(3), kPackage, std::nullopt,
                           "main", nullptr}),
                    std::invalid_argument);
  }

  SECTION("EmptyPackageName")
  {
    CHECK_THROWS_AS(
      (Token{registry, 1, TokenType::Session, std::string{}, std::nullopt, "main", nullptr}),
      std::invalid_argument);
  }
}

TEST_CASE("SessionToken | Equality", "[SessionToken]")
{
  auto registry = makeRegistry();
  test::BinderTable table;

  const auto make = [&](test::SessionBinder* pBinder) {
    return Token{registry, 1, TokenType::Session, kPackage, std::nullopt, "main", pBinder};
  };

  SECTION("Reflexive")
  {
    const auto token = make(table.remote(1));
    CHECK(token == token);
  }

  SECTION("SameBinderObject")
  {
    auto pBinder = table.remote(1);
    CHECK(make(pBinder) == make(pBinder));
  }

  SECTION("BothWithoutBinder")
  {
    CHECK(make(nullptr) == make(nullptr));
  }

  SECTION("DistinctBindersForSameRemote")
  {
    const auto lhs = make(table.remote(1));
    const auto rhs = make(table.remote(1));
    REQUIRE(lhs.sessionBinder() != rhs.sessionBinder());
    CHECK(lhs == rhs);
    CHECK(rhs == lhs);
    CHECK(hashValue(lhs) == hashValue(rhs));
  }

  SECTION("Transitive")
  {
    const auto a = make(table.remote(4));
    const auto b = make(table.remote(4));
    const auto c = make(table.remote(4));
    REQUIRE(a == b);
    REQUIRE(b == c);
    CHECK(a == c);
  }

  SECTION("DifferentRemotes")
  {
    CHECK(make(table.remote(1)) != make(table.remote(2)));
  }

  SECTION("OneSideWithoutBinder")
  {
    CHECK(make(table.remote(1)) != make(nullptr));
    CHECK(make(nullptr) != make(table.remote(1)));
  }

  SECTION("DistinctLocalStubs")
  {
    CHECK(make(table.local()) != make(table.local()));
  }

  SECTION("FieldsDiffer")
  {
    const auto base = Token{registry, 1, TokenType::SessionService, kPackage, kService, "id",
                            nullptr};
    CHECK(base
          != Token{registry, 2, TokenType::SessionService, kPackage, kService, "id", nullptr});
    CHECK(base
          != Token{registry, 1, TokenType::LibraryService, kPackage, kService, "id", nullptr});
    CHECK(base
          != Token{registry, 1, TokenType::SessionService, "com.example.Player", kService,
                   "id", nullptr});
    CHECK(base
          != Token{registry, 1, TokenType::SessionService, kPackage, "Other", "id", nullptr});
    CHECK(base
          != Token{registry, 1, TokenType::SessionService, kPackage, kService, "ID", nullptr});
  }

  SECTION("ServiceNamePresence")
  {
    const auto withService =
      Token{registry, 1, TokenType::Session, kPackage, kService, "id", table.remote(1)};
    CHECK(withService
          != Token{registry, 1, TokenType::Session, kPackage, std::nullopt, "id",
                   table.remote(1)});
  }
}

TEST_CASE("SessionToken | HashIsUsableInUnorderedContainers", "[SessionToken]")
{
  auto registry = makeRegistry();
  test::BinderTable table;

  std::unordered_set<Token> tokens;
  tokens.insert(
    Token{registry, 1, TokenType::Session, kPackage, std::nullopt, "a", table.remote(3)});
  tokens.insert(
    Token{registry, 1, TokenType::Session, kPackage, std::nullopt, "a", table.remote(3)});
  tokens.insert(
    Token{registry, 1, TokenType::Session, kPackage, std::nullopt, "b", table.remote(3)});

  CHECK(2 == tokens.size());
}

TEST_CASE("SessionToken | StringRendering", "[SessionToken]")
{
  auto registry = makeRegistry();
  test::BinderTable table;

  SECTION("Session")
  {
    std::ostringstream stream;
    stream << Token{registry, 1, TokenType::Session, kPackage, std::nullopt, "main",
                    table.remote(9)};
    CHECK(stream.str()
          == "SessionToken {pkg=com.example.player id=main type=0 service=null "
             "binder=SessionBinder{9}}");
  }

  SECTION("Service")
  {
    std::ostringstream stream;
    stream << Token{registry, 1, TokenType::SessionService, kPackage, kService, std::nullopt,
                    nullptr};
    CHECK(stream.str()
          == "SessionToken {pkg=com.example.player id=X type=1 service=PlaybackService "
             "binder=null}");
  }
}

} // namespace token
} // namespace mediasession

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
#include <mediasession/token/PackageRegistry.hpp>

namespace mediasession
{
namespace token
{

TEST_CASE("PackageRegistry")
{
  SECTION("NoComponentHasNoSessionId")
  {
    CHECK(!sessionIdFromComponent(std::nullopt));
  }

  SECTION("ComponentWithoutMetaDataHasEmptySessionId")
  {
    const auto oId =
      sessionIdFromComponent(ComponentInfo{"com.example.player", "Service", std::nullopt});
    REQUIRE(oId);
    CHECK(oId->empty());
  }

  SECTION("MetaDataWithoutSessionIdEntryHasEmptySessionId")
  {
    const auto oId = sessionIdFromComponent(ComponentInfo{
      "com.example.player", "Service", ComponentInfo::MetaData{{"other.key", "value"}}});
    REQUIRE(oId);
    CHECK(oId->empty());
  }

  SECTION("SessionIdIsReadFromMetaData")
  {
    const auto oId = sessionIdFromComponent(ComponentInfo{
      "com.example.player", "Service", ComponentInfo::MetaData{{kSessionIdMetaData, "main"}}});
    REQUIRE(oId);
    CHECK("main" == *oId);
  }

  SECTION("ServiceInterfaceForType")
  {
    CHECK(kSessionServiceInterface == serviceInterface(TokenType::SessionService));
    CHECK(kLibraryServiceInterface == serviceInterface(TokenType::LibraryService));
    CHECK_THROWS_AS(serviceInterface(TokenType::Session), std::invalid_argument);
  }

  SECTION("TokenTypeFromInt")
  {
    CHECK(TokenType::Session == tokenTypeFromInt(0));
    CHECK(TokenType::SessionService == tokenTypeFromInt(1));
    CHECK(TokenType::LibraryService == tokenTypeFromInt(2));
    CHECK(!tokenTypeFromInt(3));
    CHECK(!tokenTypeFromInt(-1));
  }
}

} // namespace token
} // namespace mediasession

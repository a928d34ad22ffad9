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
#include <mediasession/token/ServiceToken.hpp>
#include <mediasession/token/test/PackageRegistry.hpp>
#include <mediasession/token/test/SessionBinder.hpp>
#include <mediasession/util/Log.hpp>
#include <sstream>
#include <string>

namespace mediasession
{
namespace token
{

namespace
{

const std::string kPackage = "com.example.player";

test::PackageRegistry makeRegistry()
{
  test::PackageRegistry registry;
  registry.addPackage(kPackage, 10042);
  registry.addComponent(kSessionServiceInterface,
                        {kPackage, "PlaybackService",
                         ComponentInfo::MetaData{{kSessionIdMetaData, "playback"}}});
  registry.addComponent(kLibraryServiceInterface,
                        {kPackage, "LibraryService",
                         ComponentInfo::MetaData{{kSessionIdMetaData, "library"}}});
  // Library services also answer to the session service action
  registry.addComponent(kSessionServiceInterface,
                        {kPackage, "LibraryService",
                         ComponentInfo::MetaData{{kSessionIdMetaData, "library"}}});
  return registry;
}

} // namespace

TEST_CASE("ServiceToken")
{
  auto registry = makeRegistry();

  SECTION("LibraryServiceIsPreferred")
  {
    const auto token = discoverServiceToken<test::SessionBinder>(
      registry, kPackage, "LibraryService", util::NullLog{});
    CHECK(TokenType::LibraryService == token.type());
    CHECK("library" == token.id());
    CHECK(10042 == token.uid());
    CHECK("LibraryService" == *token.serviceName());
    CHECK(!token.sessionBinder());
  }

  SECTION("SessionServiceIsFoundSecond")
  {
    const auto token = discoverServiceToken<test::SessionBinder>(
      registry, kPackage, "PlaybackService", util::NullLog{});
    CHECK(TokenType::SessionService == token.type());
    CHECK("playback" == token.id());
  }

  SECTION("NonSessionServiceThrows")
  {
    CHECK_THROWS_AS(discoverServiceToken<test::SessionBinder>(
                      registry, kPackage, "DownloadService", util::NullLog{}),
                    std::invalid_argument);
    CHECK(2 == registry.componentQueries);
  }

  SECTION("UnknownPackageThrows")
  {
    registry.addComponent(kSessionServiceInterface,
                          {"com.example.ghost", "PlaybackService", std::nullopt});
    CHECK_THROWS_AS(discoverServiceToken<test::SessionBinder>(
                      registry, "com.example.ghost", "PlaybackService", util::NullLog{}),
                    std::invalid_argument);
  }

  SECTION("LookupsAreLoggedOnOwnChannel")
  {
    std::ostringstream output;
    std::ostringstream errors;
    discoverServiceToken<test::SessionBinder>(
      registry, kPackage, "PlaybackService", util::StdLog{"app", output, errors});
    const auto expected =
      std::string{"[app::ServiceToken] com.example.player/PlaybackService doesn't implement "}
      + kLibraryServiceInterface + "\n[app::ServiceToken] Found " + kSessionServiceInterface
      + " in com.example.player/PlaybackService\n";
    CHECK(expected == output.str());
    CHECK(errors.str().empty());
  }
}

} // namespace token
} // namespace mediasession

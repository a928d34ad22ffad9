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

#include <mediasession/token/BinderHandle.hpp>
#include <mediasession/token/PackageRegistry.hpp>
#include <mediasession/token/TokenRecord.hpp>
#include <mediasession/token/TokenType.hpp>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>

namespace mediasession
{
namespace token
{

// Identifies a media session, or a service that provides sessions,
// without holding a connection to it. Immutable once constructed.
//
// The session binder is a non-owning reference into a BinderTable that
// the surrounding framework owns. The token never manages its lifetime
// and only reads its identity.
template <typename Binder>
class SessionToken
{
public:
  using BinderType = Binder;

  // Resolves missing parts of the identity through the registry. Service
  // types require a non-empty serviceName. A negative uid is replaced by the owner of packageName. For service
  // types without an id, the id is read from the metadata of the
  // component packageName/serviceName. Throws std::invalid_argument if
  // anything fails to resolve.
  template <typename Registry>
  SessionToken(Registry& registry,
               std::int32_t uid,
               const TokenType type,
               std::string packageName,
               std::optional<std::string> serviceName,
               std::optional<std::string> id,
               Binder* const pSessionBinder)
    : mType(type)
    , mPackageName(std::move(packageName))
    , mServiceName(std::move(serviceName))
    , mpSessionBinder(pSessionBinder)
  {
    if (!isValid(mType))
    {
      throw std::invalid_argument("Invalid type");
    }
    if (mPackageName.empty())
    {
      throw std::invalid_argument("Package name cannot be empty");
    }
    if (mType != TokenType::Session && (!mServiceName || mServiceName->empty()))
    {
      throw std::invalid_argument("Session service needs service name");
    }

    if (uid < 0)
    {
      const auto oUid = ownerId(registry, mPackageName);
      if (!oUid)
      {
        throw std::invalid_argument("Invalid uid=" + std::to_string(uid));
      }
      uid = *oUid;
    }
    mUid = uid;

    if (!id && mServiceName && !mServiceName->empty())
    {
      const auto action = serviceInterface(mType);
      id = sessionIdFromComponent(
        findComponent(registry, action, mPackageName, *mServiceName));
      if (!id)
      {
        throw std::invalid_argument(
          "service " + *mServiceName + " doesn't implement " + action);
      }
    }
    else if (!id)
    {
      throw std::invalid_argument("ID shouldn't be null");
    }
    mId = std::move(*id);
  }

  std::int32_t uid() const
  {
    return mUid;
  }

  TokenType type() const
  {
    return mType;
  }

  const std::string& packageName() const
  {
    return mPackageName;
  }

  const std::optional<std::string>& serviceName() const
  {
    return mServiceName;
  }

  const std::string& id() const
  {
    return mId;
  }

  Binder* sessionBinder() const
  {
    return mpSessionBinder;
  }

  // Restores a token from its transferable record without consulting
  // any registry. The session binder handle, if present, is resolved
  // through the table. Returns nullopt for an absent record and throws
  // std::invalid_argument for an inconsistent one.
  template <typename Table>
  static std::optional<SessionToken> fromRecord(Table& table,
                                                const std::optional<TokenRecord>& oRecord)
  {
    if (!oRecord)
    {
      return std::nullopt;
    }
    const auto& record = *oRecord;

    const auto oType = record.type ? tokenTypeFromInt(*record.type) : std::nullopt;
    if (!oType)
    {
      throw std::invalid_argument("Invalid type");
    }

    switch (*oType)
    {
    case TokenType::Session:
      if (!record.sessionBinder)
      {
        throw std::invalid_argument("Session token needs a session binder");
      }
      break;
    case TokenType::SessionService:
    case TokenType::LibraryService:
      if (!record.serviceName || record.serviceName->empty())
      {
        throw std::invalid_argument("Session service needs service name");
      }
      break;
    }

    if (!record.packageName || record.packageName->empty() || !record.id)
    {
      throw std::invalid_argument("Package name nor ID cannot be null");
    }
    if (record.uid && *record.uid < 0)
    {
      throw std::invalid_argument("Invalid uid=" + std::to_string(*record.uid));
    }

    Binder* pBinder =
      record.sessionBinder ? fromHandle(table, *record.sessionBinder) : nullptr;

    return SessionToken{record.uid.value_or(0), *oType, *record.packageName,
                        record.serviceName, *record.id, pBinder};
  }

  friend TokenRecord toRecord(const SessionToken& token)
  {
    TokenRecord record;
    record.uid = token.mUid;
    record.type = toInt(token.mType);
    record.packageName = token.mPackageName;
    record.serviceName = token.mServiceName;
    record.id = token.mId;
    if (token.mpSessionBinder)
    {
      record.sessionBinder = toHandle(*token.mpSessionBinder);
    }
    return record;
  }

  friend bool operator==(const SessionToken& lhs, const SessionToken& rhs)
  {
    if (lhs.mUid != rhs.mUid || lhs.mPackageName != rhs.mPackageName
        || lhs.mServiceName != rhs.mServiceName || lhs.mId != rhs.mId
        || lhs.mType != rhs.mType)
    {
      return false;
    }

    if (lhs.mpSessionBinder == rhs.mpSessionBinder)
    {
      return true;
    }
    else if (!lhs.mpSessionBinder || !rhs.mpSessionBinder)
    {
      return false;
    }
    return *lhs.mpSessionBinder == *rhs.mpSessionBinder;
  }

  friend bool operator!=(const SessionToken& lhs, const SessionToken& rhs)
  {
    return !(lhs == rhs);
  }

  friend std::size_t hashValue(const SessionToken& token)
  {
    const std::size_t prime = 31;
    const auto stringHash = std::hash<std::string>{};
    return static_cast<std::size_t>(toInt(token.mType))
           + prime
               * (static_cast<std::size_t>(token.mUid)
                  + prime
                      * (stringHash(token.mPackageName)
                         + prime
                             * (stringHash(token.mId)
                                + prime
                                    * ((token.mServiceName ? stringHash(*token.mServiceName)
                                                           : 0)
                                       + prime
                                           * (token.mpSessionBinder
                                                ? hashValue(*token.mpSessionBinder)
                                                : 0)))));
  }

  friend std::ostream& operator<<(std::ostream& stream, const SessionToken& token)
  {
    stream << "SessionToken {pkg=" << token.mPackageName << " id=" << token.mId
           << " type=" << token.mType << " service=";
    if (token.mServiceName)
    {
      stream << *token.mServiceName;
    }
    else
    {
      stream << "null";
    }
    stream << " binder=";
    if (token.mpSessionBinder)
    {
      stream << *token.mpSessionBinder;
    }
    else
    {
      stream << "null";
    }
    return stream << "}";
  }

private:
  SessionToken(const std::int32_t uid,
               const TokenType type,
               std::string packageName,
               std::optional<std::string> serviceName,
               std::string id,
               Binder* const pSessionBinder)
    : mUid(uid)
    , mType(type)
    , mPackageName(std::move(packageName))
    , mServiceName(std::move(serviceName))
    , mId(std::move(id))
    , mpSessionBinder(pSessionBinder)
  {
  }

  std::int32_t mUid;
  TokenType mType;
  std::string mPackageName;
  std::optional<std::string> mServiceName;
  std::string mId;
  Binder* mpSessionBinder;
};

} // namespace token
} // namespace mediasession

namespace std
{

template <typename Binder>
struct hash<mediasession::token::SessionToken<Binder>>
{
  std::size_t operator()(const mediasession::token::SessionToken<Binder>& token) const
  {
    return hashValue(token);
  }
};

} // namespace std

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
#include <mediasession/wire/Payload.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <tuple>

namespace mediasession
{
namespace token
{
namespace detail
{

// A single keyed value of a record
template <std::int32_t Key, typename T>
struct RecordField
{
  static constexpr std::int32_t key = Key;

  friend std::uint32_t sizeInByteStream(const RecordField& field)
  {
    return wire::sizeInByteStream(field.value);
  }

  template <typename It>
  friend It toNetworkByteStream(const RecordField& field, It out)
  {
    return wire::toNetworkByteStream(field.value, std::move(out));
  }

  template <typename It>
  static std::pair<RecordField, It> fromNetworkByteStream(It begin, It end)
  {
    auto result = wire::Deserialize<T>::fromNetworkByteStream(std::move(begin), std::move(end));
    return std::make_pair(RecordField{std::move(result.first)}, std::move(result.second));
  }

  T value;
};

using UidField = RecordField<'uid_', std::int32_t>;
using TypeField = RecordField<'type', std::int32_t>;
using PackageNameField = RecordField<'pkgn', std::string>;
using ServiceNameField = RecordField<'svcn', std::string>;
using IdField = RecordField<'id__', std::string>;

template <typename Field, typename T>
std::optional<wire::PayloadEntry<Field>> entry(const std::optional<T>& oValue)
{
  if (oValue)
  {
    return wire::PayloadEntry<Field>{Field{*oValue}};
  }
  return std::nullopt;
}

} // namespace detail

// Flat keyed form of a token, used to move it across a process
// boundary. Every field is optional so that absence can be told apart
// from empty values.
struct TokenRecord
{
  std::optional<std::int32_t> uid;
  std::optional<std::int32_t> type;
  std::optional<std::string> packageName;
  std::optional<std::string> serviceName;
  std::optional<std::string> id;
  std::optional<BinderHandle> sessionBinder;

  friend bool operator==(const TokenRecord& lhs, const TokenRecord& rhs)
  {
    return std::tie(lhs.uid, lhs.type, lhs.packageName, lhs.serviceName, lhs.id,
                    lhs.sessionBinder)
           == std::tie(rhs.uid, rhs.type, rhs.packageName, rhs.serviceName, rhs.id,
                       rhs.sessionBinder);
  }

  friend bool operator!=(const TokenRecord& lhs, const TokenRecord& rhs)
  {
    return !(lhs == rhs);
  }

  // Only present fields are encoded, each as a payload entry
  friend std::uint32_t sizeInByteStream(const TokenRecord& record)
  {
    using namespace detail;
    return wire::sizeInByteStream(entry<UidField>(record.uid))
           + wire::sizeInByteStream(entry<TypeField>(record.type))
           + wire::sizeInByteStream(entry<PackageNameField>(record.packageName))
           + wire::sizeInByteStream(entry<ServiceNameField>(record.serviceName))
           + wire::sizeInByteStream(entry<IdField>(record.id))
           + wire::sizeInByteStream(entry<BinderHandle>(record.sessionBinder));
  }

  template <typename It>
  friend It toNetworkByteStream(const TokenRecord& record, It out)
  {
    using namespace detail;
    out = wire::toNetworkByteStream(entry<UidField>(record.uid), std::move(out));
    out = wire::toNetworkByteStream(entry<TypeField>(record.type), std::move(out));
    out = wire::toNetworkByteStream(
      entry<PackageNameField>(record.packageName), std::move(out));
    out = wire::toNetworkByteStream(
      entry<ServiceNameField>(record.serviceName), std::move(out));
    out = wire::toNetworkByteStream(entry<IdField>(record.id), std::move(out));
    return wire::toNetworkByteStream(
      entry<BinderHandle>(record.sessionBinder), std::move(out));
  }

  // Throws std::range_error if an entry is truncated. Entries with
  // unknown keys are skipped.
  template <typename It, typename Log>
  static TokenRecord fromPayload(It begin, It end, Log log)
  {
    using namespace detail;
    TokenRecord record;
    wire::parsePayload<UidField, TypeField, PackageNameField, ServiceNameField, IdField,
                       BinderHandle>(
      std::move(begin), std::move(end), std::move(log),
      [&record](const UidField& uid) { record.uid = uid.value; },
      [&record](const TypeField& type) { record.type = type.value; },
      [&record](const PackageNameField& name) { record.packageName = name.value; },
      [&record](const ServiceNameField& name) { record.serviceName = name.value; },
      [&record](const IdField& id) { record.id = id.value; },
      [&record](const BinderHandle& handle) { record.sessionBinder = handle; });
    return record;
  }
};

} // namespace token
} // namespace mediasession

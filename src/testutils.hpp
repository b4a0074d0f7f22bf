/*
    Barter - asset ledger with atomic trade offers
    Copyright (C) 2020-2021  Autonomous Worlds Ltd

    This program is free software: you can redistribute it and/or modify
    it under the terms of the GNU General Public License as published by
    the Free Software Foundation, either version 3 of the License, or
    (at your option) any later version.

    This program is distributed in the hope that it will be useful,
    but WITHOUT ANY WARRANTY; without even the implied warranty of
    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
    GNU General Public License for more details.

    You should have received a copy of the GNU General Public License
    along with this program.  If not, see <https://www.gnu.org/licenses/>.
*/

#ifndef BARTER_TESTUTILS_HPP
#define BARTER_TESTUTILS_HPP

#include "errors.hpp"
#include "observer.hpp"
#include "proto/ledger.pb.h"

#include <json/json.h>

#include <glog/logging.h>
#include <gmock/gmock.h>

#include <google/protobuf/text_format.h>
#include <google/protobuf/util/message_differencer.h>

#include <mutex>
#include <string>
#include <vector>

namespace barter
{

/**
 * Parses a string to JSON.
 */
Json::Value ParseJson (const std::string& str);

/**
 * Parses a protocol buffer from text format.
 */
template <typename Proto>
  Proto
  ParseTextProto (const std::string& str)
{
  Proto res;
  CHECK (google::protobuf::TextFormat::ParseFromString (str, &res));
  return res;
}

#define DEFINE_PROTO_MATCHER(name, type) \
  MATCHER_P (name, str, "") \
  { \
    const auto expected = ParseTextProto<proto::type> (str);\
    if (google::protobuf::util::MessageDifferencer::Equals (arg, expected)) \
      return true; \
    *result_listener << "actual: " << arg.DebugString (); \
    return false; \
  }

DEFINE_PROTO_MATCHER (EqualsAsset, Asset)
DEFINE_PROTO_MATCHER (EqualsOffer, TradeOffer)
DEFINE_PROTO_MATCHER (EqualsEvent, LedgerEvent)

/**
 * Expects that executing the statement throws a LedgerError of the
 * given kind.
 */
#define EXPECT_THROW_KIND(statement, expectedKind) \
  do { \
    try \
      { \
        statement; \
        ADD_FAILURE () << "Expected LedgerError was not thrown"; \
      } \
    catch (const LedgerError& exc) \
      { \
        EXPECT_EQ (exc.GetKind (), LedgerError::Kind::expectedKind) \
            << exc.what (); \
      } \
  } while (false)

/**
 * LedgerObserver that records all events, so that tests can
 * verify them.
 */
class RecordingObserver : public LedgerObserver
{

private:

  /** The events received so far.  */
  std::vector<proto::LedgerEvent> events;

  /** Lock for the events (notifications may come from many threads).  */
  mutable std::mutex mut;

public:

  RecordingObserver () = default;

  void Notify (const proto::LedgerEvent& ev) override;

  /**
   * Returns all events received since the last call, and clears them.
   */
  std::vector<proto::LedgerEvent> Flush ();

};

} // namespace barter

#endif // BARTER_TESTUTILS_HPP

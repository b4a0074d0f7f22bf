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

#ifndef BARTER_ERRORS_HPP
#define BARTER_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace barter
{

/**
 * Exception thrown when a ledger operation is rejected.  A rejected
 * operation has no effect on the state and does not trigger any
 * notifications.
 */
class LedgerError : public std::runtime_error
{

public:

  /**
   * The reasons why an operation can be rejected.
   */
  enum class Kind
  {

    /** The caller is not the principal required for the action.  */
    UNAUTHORIZED,

    /** The offer is not pending anymore.  */
    INVALID_STATE,

    /** An asset is not held by the party that is supposed to give it.  */
    OWNERSHIP_MISMATCH,

    /** The referenced offer does not exist.  */
    NOT_FOUND,

    /** Some argument (other than the caller) is malformed.  */
    INVALID_ARGUMENT,

  };

private:

  /** The kind of error this is.  */
  Kind kind;

public:

  explicit LedgerError (const Kind k, const std::string& msg)
    : std::runtime_error(msg), kind(k)
  {}

  Kind
  GetKind () const
  {
    return kind;
  }

};

/**
 * Returns a short string naming the given error kind (e.g. for logs).
 */
std::string ErrorKindToString (LedgerError::Kind k);

} // namespace barter

#endif // BARTER_ERRORS_HPP

/* Pylon
 * Copyright 2023 Akamai Technologies, Inc.
 *
 * Licensed under the Apache License, Version 2.0 (the
 * "License"); you may not use this file except in
 * compliance with the License.  You may obtain a copy
 * of the License at
 *
 *   https://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in
 * writing, software distributed under the License is
 * distributed on an "AS IS" BASIS, WITHOUT WARRANTIES OR
 * CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing
 * permissions and limitations under the License. */

/// @file
#include "pylon/error.hpp"

namespace pylon::error
{

// Types.

/// The boost.system category for errors returned by Pylon.
class Category :
  public boost::system::error_category
{
public:
  // Constants.

  /// The one Category.
  static const Category S_CATEGORY;

  // Methods.

  /**
   * Returns a `static` string representing this `error_category` (which, for example, could be used
   * to compare two `Error_code`s' categories by string).
   *
   * @return See above.
   */
  const char* name() const noexcept override;

  /**
   * Returns the message corresponding to the given Code value.  This is what ends up in front of the user
   * when the error is reported, so it is written to stand on its own.
   *
   * @param val
   *        `int` value of a Code.
   * @return See above.
   */
  std::string message(int val) const override;

  /**
   * Helper that returns the `enum` name of the given Code sans "S_" prefix; satisfies `istream_to_enum()`.
   *
   * @param code
   *        The code.
   * @return See above.
   */
  static flow::util::String_view code_symbol(Code code);

private:
  // Constructors.

  /// Boring constructor.
  explicit Category();
}; // class Category

// Static initializations.

const Category Category::S_CATEGORY;

// Implementations.

Error_code make_error_code(Code err_code)
{
  /* Assign Category as the category for pylon::error::Code-cast error_codes;
   * this basically glues together Category::name()/message() with the Code enum. */
  return Error_code(static_cast<int>(err_code), Category::S_CATEGORY);
}

Kind kind_of(const Error_code& err_code)
{
  assert(err_code && "Classifying success is meaningless.");

  if (err_code.category() != Category::S_CATEGORY)
  {
    return Kind::S_GENERIC;
  }
  // else

  switch (static_cast<Code>(err_code.value()))
  {
  case Code::S_INVALID_ARGUMENT:
  case Code::S_HANDSHAKE_ALREADY_PENDING:
  case Code::S_NO_ACTIVE_HANDSHAKE:
  case Code::S_NO_ACTIVE_TRANSFER_REQUEST:
  case Code::S_INVALID_FILE_NAME:
  case Code::S_DESTINATION_EXISTS:
    return Kind::S_VALIDATION;

  case Code::S_MISSING_APP_ID:
  case Code::S_URL_PARSE_FAILED:
  case Code::S_RELAY_HINT_PARSE_FAILED:
    return Kind::S_CONFIGURATION;

  case Code::S_MALFORMED_CODE:
  case Code::S_PEER_ABSENT:
  case Code::S_CODE_ALREADY_USED:
  case Code::S_AUTHENTICATION_MISMATCH:
  case Code::S_UNEXPECTED_PEER_MESSAGE:
  case Code::S_MALFORMED_PEER_MESSAGE:
    return Kind::S_PROTOCOL;

  case Code::S_TRANSFER_CANCELED:
  case Code::S_TRANSFER_REJECTED:
  case Code::S_TRANSFER_PEER_ERROR:
  case Code::S_TRANSIT_NO_COMMON_ABILITY:
  case Code::S_TRANSFER_SIZE_MISMATCH:
  case Code::S_TRANSFER_CHECKSUM_MISMATCH:
    return Kind::S_TRANSFER;

  case Code::S_RENDEZVOUS_UNREACHABLE:
  case Code::S_CHANNEL_CLOSED:
    return Kind::S_TRANSPORT;

  case Code::S_END_SENTINEL:
    assert(false && "SENTINEL: Not an error.");
  }
  // Some value outside the enum altogether: treat it as opaque.
  return Kind::S_GENERIC;
} // kind_of()

Category::Category() = default;

const char* Category::name() const noexcept // Virtual.
{
  return "pylon";
}

std::string Category::message(int val) const // Virtual.
{
  // KEEP THESE STRINGS IN SYNC WITH COMMENT IN error.hpp ON THE INDIVIDUAL ENUM MEMBERS!

  switch (static_cast<Code>(val))
  {
  case Code::S_INVALID_ARGUMENT:
    return "User called an API with 1 or more arguments in violation of the API contract.";
  case Code::S_HANDSHAKE_ALREADY_PENDING:
    return "Error generating wormhole code: the current Pylon already has a pending handshake.";
  case Code::S_NO_ACTIVE_HANDSHAKE:
    return "There is currently no active handshake.";
  case Code::S_NO_ACTIVE_TRANSFER_REQUEST:
    return "There is currently no active transfer request.";
  case Code::S_INVALID_FILE_NAME:
    return "Could not extract file name from the given path.";
  case Code::S_DESTINATION_EXISTS:
    return "Destination file already exists, and this Pylon is configured not to overwrite files.";
  case Code::S_MISSING_APP_ID:
    return "Error building Pylon: no application ID was given.";
  case Code::S_URL_PARSE_FAILED:
    return "Error parsing a rendezvous server or relay server URL.";
  case Code::S_RELAY_HINT_PARSE_FAILED:
    return "Error parsing relay server URL: not usable as a relay hint (unknown scheme or no port).";
  case Code::S_MALFORMED_CODE:
    return "Wormhole code is malformed; expected <nameplate>-<word>[-<word>...].";
  case Code::S_PEER_ABSENT:
    return "No peer is waiting on the wormhole code's nameplate.";
  case Code::S_CODE_ALREADY_USED:
    return "Wormhole code has already been used; codes are single-use.";
  case Code::S_AUTHENTICATION_MISMATCH:
    return "Key agreement failed: the two sides used different wormhole codes.";
  case Code::S_UNEXPECTED_PEER_MESSAGE:
    return "Peer sent a message that is not expected at this stage of the transfer.";
  case Code::S_MALFORMED_PEER_MESSAGE:
    return "Peer sent a message that could not be decoded.";
  case Code::S_TRANSFER_CANCELED:
    return "Error occurred during transfer: canceled by user.";
  case Code::S_TRANSFER_REJECTED:
    return "Error occurred during transfer: receiver rejected the file offer.";
  case Code::S_TRANSFER_PEER_ERROR:
    return "Error occurred during transfer: peer reported an error.";
  case Code::S_TRANSIT_NO_COMMON_ABILITY:
    return "Error occurred during transfer: the two sides share no transit ability usable to connect.";
  case Code::S_TRANSFER_SIZE_MISMATCH:
    return "Error occurred during transfer: number of bytes transferred does not match the offered file size.";
  case Code::S_TRANSFER_CHECKSUM_MISMATCH:
    return "Error occurred during transfer: receiver's checksum of the data does not match the sender's.";
  case Code::S_RENDEZVOUS_UNREACHABLE:
    return "The rendezvous server could not be reached.";
  case Code::S_CHANNEL_CLOSED:
    return "The peer channel was closed by the other side or torn down.";

  case Code::S_END_SENTINEL:
    assert(false && "SENTINEL: Not an error.  "
                    "This Code must never be issued by an error/success-emitting API; I/O use only.");
  }
  assert(false);
  return "";
} // Category::message()

flow::util::String_view Category::code_symbol(Code code) // Static.
{
  // Note: Must satisfy istream_to_enum() requirements.

  switch (code)
  {
  case Code::S_INVALID_ARGUMENT:
    return "INVALID_ARGUMENT";
  case Code::S_HANDSHAKE_ALREADY_PENDING:
    return "HANDSHAKE_ALREADY_PENDING";
  case Code::S_NO_ACTIVE_HANDSHAKE:
    return "NO_ACTIVE_HANDSHAKE";
  case Code::S_NO_ACTIVE_TRANSFER_REQUEST:
    return "NO_ACTIVE_TRANSFER_REQUEST";
  case Code::S_INVALID_FILE_NAME:
    return "INVALID_FILE_NAME";
  case Code::S_DESTINATION_EXISTS:
    return "DESTINATION_EXISTS";
  case Code::S_MISSING_APP_ID:
    return "MISSING_APP_ID";
  case Code::S_URL_PARSE_FAILED:
    return "URL_PARSE_FAILED";
  case Code::S_RELAY_HINT_PARSE_FAILED:
    return "RELAY_HINT_PARSE_FAILED";
  case Code::S_MALFORMED_CODE:
    return "MALFORMED_CODE";
  case Code::S_PEER_ABSENT:
    return "PEER_ABSENT";
  case Code::S_CODE_ALREADY_USED:
    return "CODE_ALREADY_USED";
  case Code::S_AUTHENTICATION_MISMATCH:
    return "AUTHENTICATION_MISMATCH";
  case Code::S_UNEXPECTED_PEER_MESSAGE:
    return "UNEXPECTED_PEER_MESSAGE";
  case Code::S_MALFORMED_PEER_MESSAGE:
    return "MALFORMED_PEER_MESSAGE";
  case Code::S_TRANSFER_CANCELED:
    return "TRANSFER_CANCELED";
  case Code::S_TRANSFER_REJECTED:
    return "TRANSFER_REJECTED";
  case Code::S_TRANSFER_PEER_ERROR:
    return "TRANSFER_PEER_ERROR";
  case Code::S_TRANSIT_NO_COMMON_ABILITY:
    return "TRANSIT_NO_COMMON_ABILITY";
  case Code::S_TRANSFER_SIZE_MISMATCH:
    return "TRANSFER_SIZE_MISMATCH";
  case Code::S_TRANSFER_CHECKSUM_MISMATCH:
    return "TRANSFER_CHECKSUM_MISMATCH";
  case Code::S_RENDEZVOUS_UNREACHABLE:
    return "RENDEZVOUS_UNREACHABLE";
  case Code::S_CHANNEL_CLOSED:
    return "CHANNEL_CLOSED";

  case Code::S_END_SENTINEL:
    return "END_SENTINEL";
  }
  assert(false);
  return "";
}

std::ostream& operator<<(std::ostream& os, Code val)
{
  // Note: Must satisfy istream_to_enum() requirements.
  return os << Category::code_symbol(val);
}

std::istream& operator>>(std::istream& is, Code& val)
{
  /* Range [<1st Code>, END_SENTINEL); no match => END_SENTINEL;
   * allow for number instead of ostream<< string; case-insensitive. */
  val = flow::util::istream_to_enum(&is, Code::S_END_SENTINEL, Code::S_END_SENTINEL, true, false,
                                    Code(S_CODE_LOWEST_INT_VALUE));
  return is;
}

std::ostream& operator<<(std::ostream& os, Kind val)
{
  switch (val)
  {
  case Kind::S_VALIDATION:
    return os << "validation";
  case Kind::S_CONFIGURATION:
    return os << "configuration";
  case Kind::S_PROTOCOL:
    return os << "protocol";
  case Kind::S_TRANSFER:
    return os << "transfer";
  case Kind::S_TRANSPORT:
    return os << "transport";
  case Kind::S_GENERIC:
    return os << "generic";
  }
  assert(false);
  return os;
}

} // namespace pylon::error

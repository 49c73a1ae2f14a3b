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
#pragma once

#include "pylon/common.hpp"

/**
 * Namespace containing Pylon's extension of boost.system error conventions, so that its APIs can return
 * codes/messages from within its own set of error codes/messages.
 *
 * Every fallible Pylon API takes a trailing `Error_code* err_code` argument.  If it is null, an error is reported
 * by throwing `flow::error::Runtime_error` (which carries the #Error_code); otherwise `*err_code` is set to the
 * error, or cleared on success.  Errors from outside this category (most notably system and boost.filesystem
 * errors encountered when touching the local file) are passed through as-is.
 *
 * Each Code belongs to exactly one Kind; see kind_of().
 */
namespace pylon::error
{

// Types.

/// Numeric value of the lowest Code.
constexpr int S_CODE_LOWEST_INT_VALUE = 1;

/**
 * All possible errors returned (via `Error_code` arguments) by Pylon functions/methods outside of
 * system-triggered errors.  The doc header of each member names its Kind.
 */
enum class Code
{
  /// Validation: user called an API with 1 or more arguments in violation of the API contract.
  S_INVALID_ARGUMENT = S_CODE_LOWEST_INT_VALUE,

  /// Validation: code generation requested, but this Pylon already has a pending handshake.
  S_HANDSHAKE_ALREADY_PENDING,

  /// Validation: file send requested, but there is no pending handshake from a preceding code generation.
  S_NO_ACTIVE_HANDSHAKE,

  /// Validation: file receive (or rejection) requested, but there is no pending transfer request.
  S_NO_ACTIVE_TRANSFER_REQUEST,

  /// Validation: could not extract a usable file name from the given path.
  S_INVALID_FILE_NAME,

  /// Validation: destination file exists, and this Pylon is configured not to overwrite files.
  S_DESTINATION_EXISTS,

  /// Configuration: no application ID was given when building the Pylon.
  S_MISSING_APP_ID,

  /// Configuration: a URL (rendezvous server or relay server) could not be parsed.
  S_URL_PARSE_FAILED,

  /// Configuration: relay server URL parsed but is not usable as a relay hint (unknown scheme, no port).
  S_RELAY_HINT_PARSE_FAILED,

  /// Protocol: wormhole code is not of the form `<nameplate>-<word>[-<word>...]`.
  S_MALFORMED_CODE,

  /// Protocol: no peer is waiting on the code's nameplate.
  S_PEER_ABSENT,

  /// Protocol: the code's nameplate has already been claimed; codes are single-use.
  S_CODE_ALREADY_USED,

  /// Protocol: key agreement failed; the two sides used different codes.
  S_AUTHENTICATION_MISMATCH,

  /// Protocol: peer sent a message that is not expected at this stage of the transfer.
  S_UNEXPECTED_PEER_MESSAGE,

  /// Protocol: peer sent a message that could not be decoded.
  S_MALFORMED_PEER_MESSAGE,

  /// Transfer: operation was canceled via its cancel signal.
  S_TRANSFER_CANCELED,

  /// Transfer: the receiving peer rejected the file offer.
  S_TRANSFER_REJECTED,

  /// Transfer: peer reported an error instead of continuing the transfer.
  S_TRANSFER_PEER_ERROR,

  /// Transfer: the two sides share no transit ability (direct or relay) usable to set up the data channel.
  S_TRANSIT_NO_COMMON_ABILITY,

  /// Transfer: number of bytes transferred does not match the offered file size.
  S_TRANSFER_SIZE_MISMATCH,

  /// Transfer: receiver's checksum of the received data does not match the sender's.
  S_TRANSFER_CHECKSUM_MISMATCH,

  /// Transport: the rendezvous server could not be reached.
  S_RENDEZVOUS_UNREACHABLE,

  /// Transport: the peer channel (wormhole or transit) was closed by the other side or torn down.
  S_CHANNEL_CLOSED,

  /// SENTINEL: Not an error.  This Code must never be issued by an error/success-emitting API; I/O use only.
  S_END_SENTINEL
}; // enum class Code

/// Classification of errors for uniform reporting.  Every Code belongs to exactly one of these.
enum class Kind
{
  /// Misuse of the session state machine or bad argument.
  S_VALIDATION,
  /// Unusable configuration, e.g., URL fails to parse.
  S_CONFIGURATION,
  /// Handshake/code-redemption or peer-protocol failure.
  S_PROTOCOL,
  /// Failure during the file transfer proper, including cancellation.
  S_TRANSFER,
  /// Other failure surfaced by the rendezvous or data channel.
  S_TRANSPORT,
  /// An error not from the Pylon category: filesystem and other resource failures; see its own message.
  S_GENERIC
}; // enum class Kind

// Free functions.

/**
 * Given a `Code` `enum` value, creates a lightweight `Error_code` (a/k/a boost.system `error_code`)
 * representing that error.  This is needed to make the `boost::system::error_code::error_code<Code>()`
 * template implementation work.  Or, slightly more in English, it glues the (completely general)
 * `Error_code` to the (Pylon-specific) error code set `Code`, so that one can implicitly covert
 * from the latter to the former.
 *
 * @param err_code
 *        The `enum` value.
 * @return A corresponding `Error_code`.
 */
Error_code make_error_code(Code err_code);

/**
 * Classifies the given error.  Pylon-category codes map per their Code doc headers; anything else
 * (system, boost.filesystem, ...) is Kind::S_GENERIC.
 *
 * @param err_code
 *        A truthy error code.
 * @return See above.
 */
Kind kind_of(const Error_code& err_code);

/**
 * Deserializes a Code from a standard input stream.  Reads up to but not including the next
 * non-alphanumeric-or-underscore character; the resulting string is then mapped to a Code.  If none is
 * recognized, Code::S_END_SENTINEL is the result.  The recognized values are:
 *   - Code numeric value, e.g., "3" for Code::S_NO_ACTIVE_HANDSHAKE.
 *   - Code `enum` name without the "S_" prefix, case-insensitive, e.g., "no_active_handshake".
 *
 * @param is
 *        Stream from which to deserialize.
 * @param val
 *        Value to set.
 * @return `is`.
 */
std::istream& operator>>(std::istream& is, Code& val);

/**
 * Serializes a Code to a standard output stream, as its `enum` name sans the "S_" prefix.
 *
 * @param os
 *        Stream to which to serialize.
 * @param val
 *        Value to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Code val);

/**
 * Serializes a Kind to a standard output stream, e.g., "validation".
 *
 * @param os
 *        Stream to which to serialize.
 * @param val
 *        Value to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Kind val);

} // namespace pylon::error

namespace boost::system
{

// Types.

/**
 * Ummm -- it specializes this `struct` to -- look -- the end result is boost.system uses this as
 * authorization to make `enum` `Code` convertible to `Error_code`.  The non-specialized
 * version of this sets `value` to `false`, so that random arbitary `enum`s can't just be used as
 * `Error_code`s.  Note that this is the offical way to accomplish that, as (confusingly but
 * formally) documented in boost.system docs.
 */
template<>
struct is_error_code_enum<::pylon::error::Code>
{
  /// Means `Code` `enum` values can be used for `Error_code`.
  static const bool value = true;
};

} // namespace boost::system

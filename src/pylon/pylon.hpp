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

#include "pylon/config.hpp"
#include "pylon/transfer/transfer.hpp"
#include <flow/async/single_thread_task_loop.hpp>
#include <boost/move/unique_ptr.hpp>
#include <boost/noncopyable.hpp>
#include <optional>

namespace pylon
{

// Types.

/**
 * A file-transfer session: the entry point of Pylon.  Two parties, each with a Pylon, use it to transfer one file
 * authenticated by a short code that they exchange out-of-band (e.g., read aloud).  Obtain one from Pylon_builder.
 *
 * ### Sending ###
 * gen_code() allocates a code on the rendezvous server and returns it right away; the Pylon now holds a pending
 * *handshake*.  Give the code to the receiver, then call send_file(), which awaits the receiver, offers the file, and
 * sends it once accepted.  send_file() uses up the handshake, whether it succeeds or fails: to try again, start over
 * with gen_code().  If it fails before the receiver redeemed the code, the code is released at the rendezvous, and
 * redeeming it later fails with error::Code::S_CODE_ALREADY_USED.
 *
 * ### Receiving ###
 * request_file() redeems the sender's code and awaits the sender's offer; the Pylon now holds a pending *offer*
 * (see transfer_offer()).  receive_file() accepts it and writes the file; reject_file() declines it.  Either uses up
 * the offer, whether it succeeds or fails.  If the sender gives up before offering anything, request_file() succeeds
 * but no offer is pending.
 *
 * The two sides are independent: a Pylon may hold a pending handshake and a pending offer at the same time.
 *
 * ### Blocking, cancellation, progress ###
 * send_file(), request_file() and receive_file() block until done.  Each takes a #Cancel_future: once it becomes
 * ready the operation gives up at its next wait or record boundary with error::Code::S_TRANSFER_CANCELED.  A
 * partially received destination file is left as-is.  Transfers report progress to a #Progress_func, first with
 * `(0, total)` once the data channel is up, then after every record; the last call reports `(total, total)`.
 * There is no retry anywhere: every failure is final for its operation.
 *
 * The async_*() variants run the same operation on a thread owned by `*this` and report its result to a
 * completion handler on that thread.
 *
 * ### Thread safety ###
 * None: the caller must not invoke an operation while another is in progress on the same Pylon.  (That includes
 * operations started via async_*(), until their completion handler has been invoked.)
 *
 * ### Error reporting ###
 * Standard Flow semantics: each fallible method takes a trailing `Error_code* err_code = 0`; if null, a
 * `flow::error::Runtime_error` is thrown instead.  error::kind_of() classifies any #Error_code emitted.
 *
 * ### Destruction ###
 * Dropping a Pylon abandons any pending handshake or offer: the code of a pending handshake is released (as if
 * send_file() had failed), and the peer of a pending offer observes its channel closing.  No more graceful
 * teardown of the rendezvous connection is performed.  The destructor waits for an async_*() operation in progress;
 * cancel it first.
 */
class Pylon :
  public flow::log::Log_context,
  private boost::noncopyable
{
public:
  // Constructors/destructor.

  /**
   * Constructs the session with no pending handshake or offer.  Prefer Pylon_builder, which supplies defaults and
   * checks `config`.
   *
   * @param logger_ptr
   *        Logger to use for subsequently logging.
   * @param config
   *        Configuration; `m_rendezvous` and `m_transit_connector` must not be null.
   */
  explicit Pylon(flow::log::Logger* logger_ptr, const Config& config);

  /// Abandons any pending handshake or offer; see "Destruction" in class doc header.
  ~Pylon();

  // Methods.

  /**
   * Allocates a code of `code_length` words for a new handshake, which becomes pending; returns the code without
   * waiting for the receiver.
   *
   * @param code_length
   *        Number of words in the code; at least 1.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_HANDSHAKE_ALREADY_PENDING, error::Code::S_INVALID_ARGUMENT (zero `code_length`),
   *        error::Code::S_URL_PARSE_FAILED (rendezvous URL), error::Code::S_RENDEZVOUS_UNREACHABLE.
   * @return The code; empty on error.
   */
  std::string gen_code(size_t code_length, Error_code* err_code = 0);

  /**
   * Sends the given file to the peer of the pending handshake: awaits the peer, offers the file, and sends it once
   * the peer accepts.  The handshake is used up, whatever the outcome.
   *
   * @param file_path
   *        File to send.  The peer sees its base name.
   * @param on_progress
   *        `(bytes_sent, bytes_total)`; may be empty.
   * @param cancel
   *        Cancellation signal.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_NO_ACTIVE_HANDSHAKE, error::Code::S_INVALID_FILE_NAME, filesystem errors (file absent or
   *        unreadable), error::Code::S_URL_PARSE_FAILED or error::Code::S_RELAY_HINT_PARSE_FAILED (relay URL),
   *        handshake failure codes (see wormhole::Rendezvous::connect_with_code()),
   *        error::Code::S_TRANSFER_CANCELED, error::Code::S_TRANSFER_REJECTED, and the other failures of
   *        transfer::send_file().
   */
  void send_file(const fs::path& file_path, const Progress_func& on_progress,
                 const Cancel_future& cancel = Cancel_future(), Error_code* err_code = 0);

  /**
   * Redeems the given code and awaits the sender's offer, which becomes pending (if the sender made one).  An offer
   * already pending is discarded first.
   *
   * @param code
   *        Code obtained from the sender.
   * @param cancel
   *        Cancellation signal.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_URL_PARSE_FAILED or error::Code::S_RELAY_HINT_PARSE_FAILED (relay or rendezvous URL),
   *        error::Code::S_MALFORMED_CODE, error::Code::S_PEER_ABSENT, error::Code::S_CODE_ALREADY_USED,
   *        error::Code::S_AUTHENTICATION_MISMATCH, error::Code::S_RENDEZVOUS_UNREACHABLE,
   *        error::Code::S_TRANSFER_CANCELED, and the other failures of transfer::request_file().
   */
  void request_file(const std::string& code, const Cancel_future& cancel = Cancel_future(), Error_code* err_code = 0);

  /**
   * Accepts the pending offer and writes the file to `destination` (created, or truncated if it exists and config
   * allows).  The offer is used up, whatever the outcome.
   *
   * @param destination
   *        Where to write the file.
   * @param on_progress
   *        `(bytes_received, bytes_total)`; may be empty.
   * @param cancel
   *        Cancellation signal.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_NO_ACTIVE_TRANSFER_REQUEST, error::Code::S_DESTINATION_EXISTS, filesystem errors,
   *        error::Code::S_TRANSFER_CANCELED, and the other failures of transfer::Receive_request::accept().
   */
  void receive_file(const fs::path& destination, const Progress_func& on_progress,
                    const Cancel_future& cancel = Cancel_future(), Error_code* err_code = 0);

  /**
   * Declines the pending offer; the sender's send_file() fails with error::Code::S_TRANSFER_REJECTED.  The offer is
   * used up, whatever the outcome.
   *
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_NO_ACTIVE_TRANSFER_REQUEST, error::Code::S_CHANNEL_CLOSED.
   */
  void reject_file(Error_code* err_code = 0);

  /**
   * Like send_file() but runs on thread W owned by `*this`, then invokes `on_done_func(err_code)` from W.
   *
   * @tparam On_done_func
   *         Handler type compatible with #Task_err.
   * @param file_path
   *        See send_file().
   * @param on_progress
   *        See send_file().  Invoked from W.
   * @param cancel
   *        See send_file().
   * @param on_done_func
   *        Completion handler.
   */
  template<typename On_done_func>
  void async_send_file(const fs::path& file_path, Progress_func on_progress, Cancel_future cancel,
                       On_done_func&& on_done_func);

  /**
   * Like request_file() but runs on thread W owned by `*this`, then invokes `on_done_func(err_code)` from W.
   *
   * @tparam On_done_func
   *         Handler type compatible with #Task_err.
   * @param code
   *        See request_file().
   * @param cancel
   *        See request_file().
   * @param on_done_func
   *        Completion handler.
   */
  template<typename On_done_func>
  void async_request_file(const std::string& code, Cancel_future cancel, On_done_func&& on_done_func);

  /**
   * Like receive_file() but runs on thread W owned by `*this`, then invokes `on_done_func(err_code)` from W.
   *
   * @tparam On_done_func
   *         Handler type compatible with #Task_err.
   * @param destination
   *        See receive_file().
   * @param on_progress
   *        See receive_file().  Invoked from W.
   * @param cancel
   *        See receive_file().
   * @param on_done_func
   *        Completion handler.
   */
  template<typename On_done_func>
  void async_receive_file(const fs::path& destination, Progress_func on_progress, Cancel_future cancel,
                          On_done_func&& on_done_func);

  /**
   * Returns `true` if and only if a handshake from gen_code() is pending.
   *
   * @return See above.
   */
  bool has_pending_handshake() const;

  /**
   * The pending offer's file name and size, if an offer is pending.
   *
   * @return See above.
   */
  std::optional<transfer::Offer> transfer_offer() const;

  /**
   * Renders the session's identity and configuration as compact JSON with camelCase keys: `id`, `relayUrl`,
   * `rendezvousUrl`, `abilities`, `allowOverwrite`.  Pending handshake and offer are not included.
   *
   * @return See above.
   */
  std::string to_json() const;

  /**
   * The configuration.
   *
   * @return See above.
   */
  const Config& config() const;

private:
  // Types.

  /// The send-side slot: a code awaiting redemption by the peer.
  struct Pending_handshake
  {
    /// Application identity the code was allocated under.
    wormhole::App_config m_app;

    /// The code.
    wormhole::Code m_code;

    /// Becomes ready when the peer redeems #m_code.
    wormhole::Handshake m_handshake;
  };

  // Methods.

  /**
   * Makes the given code worthless at the rendezvous, so that nobody can redeem it after we stopped waiting.
   * No-op if it has been redeemed already.
   *
   * @param ticket
   *        The handshake given up.
   */
  void release_code(const Pending_handshake& ticket);

  /**
   * Builds the wormhole::App_config for the rendezvous, parsing the rendezvous URL.
   *
   * @param app
   *        On success, set.
   * @param err_code
   *        Must not be null.  error::Code::S_URL_PARSE_FAILED; or cleared.
   */
  void make_app_config(wormhole::App_config* app, Error_code* err_code) const;

  /**
   * Builds our side of the data-channel negotiation, parsing the relay URL into a relay hint.
   *
   * @param setup
   *        On success, set.
   * @param err_code
   *        Must not be null.  error::Code::S_URL_PARSE_FAILED, error::Code::S_RELAY_HINT_PARSE_FAILED; or cleared.
   */
  void make_transit_setup(transfer::Transit_setup* setup, Error_code* err_code) const;

  // Data.

  /// See config().
  const Config m_config;

  /// The pending handshake from gen_code(); consumed by send_file().
  std::optional<Pending_handshake> m_handshake;

  /// The pending offer from request_file(); consumed by receive_file() or reject_file().
  std::optional<transfer::Receive_request> m_transfer_request;

  /// Thread W, on which async_*() operations run.  Last member: stopped before anything else is destroyed.
  flow::async::Single_thread_task_loop m_async_worker;
}; // class Pylon

/// Short-hand for unique pointer to Pylon, as returned by Pylon_builder.
using Pylon_ptr = boost::movelib::unique_ptr<Pylon>;

// Free functions.

/**
 * Prints string representation of the given `Pylon` to the given `ostream`.
 *
 * @relatesalso Pylon
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Pylon& val);

// Template implementations.

template<typename On_done_func>
void Pylon::async_send_file(const fs::path& file_path, Progress_func on_progress, Cancel_future cancel,
                            On_done_func&& on_done_func)
{
  m_async_worker.post([this, file_path, on_progress = std::move(on_progress), cancel = std::move(cancel),
                       on_done_func = std::forward<On_done_func>(on_done_func)]() mutable
  {
    Error_code err_code;
    send_file(file_path, on_progress, cancel, &err_code);
    on_done_func(err_code);
  });
}

template<typename On_done_func>
void Pylon::async_request_file(const std::string& code, Cancel_future cancel, On_done_func&& on_done_func)
{
  m_async_worker.post([this, code, cancel = std::move(cancel),
                       on_done_func = std::forward<On_done_func>(on_done_func)]() mutable
  {
    Error_code err_code;
    request_file(code, cancel, &err_code);
    on_done_func(err_code);
  });
}

template<typename On_done_func>
void Pylon::async_receive_file(const fs::path& destination, Progress_func on_progress, Cancel_future cancel,
                               On_done_func&& on_done_func)
{
  m_async_worker.post([this, destination, on_progress = std::move(on_progress), cancel = std::move(cancel),
                       on_done_func = std::forward<On_done_func>(on_done_func)]() mutable
  {
    Error_code err_code;
    receive_file(destination, on_progress, cancel, &err_code);
    on_done_func(err_code);
  });
}

} // namespace pylon

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

#include "pylon/pylon.hpp"

namespace pylon
{

// Types.

/**
 * Builds a Pylon.  Only the application id is required; every other setting has the default documented on the
 * corresponding Config member.  Setters return `*this` for chaining:
 *
 *   ~~~
 *   auto pylon = Pylon_builder(&logger).id("example.com/file-xfer").allow_overwrite(false).build();
 *   ~~~
 *
 * A builder may build any number of Pylons; each gets a copy of the settings at the time of build().
 */
class Pylon_builder :
  public flow::log::Log_context
{
public:
  // Constructors/destructor.

  /**
   * Constructs builder with default settings and no application id.
   *
   * @param logger_ptr
   *        Logger for the builder and for the Pylons it builds.
   */
  explicit Pylon_builder(flow::log::Logger* logger_ptr);

  // Methods.

  /**
   * Sets Config::m_id.
   *
   * @param id
   *        Value.
   * @return `*this`.
   */
  Pylon_builder& id(const std::string& id);

  /**
   * Sets Config::m_relay_url.
   *
   * @param relay_url
   *        Value.
   * @return `*this`.
   */
  Pylon_builder& relay_url(const std::string& relay_url);

  /**
   * Sets Config::m_rendezvous_url.
   *
   * @param rendezvous_url
   *        Value.
   * @return `*this`.
   */
  Pylon_builder& rendezvous_url(const std::string& rendezvous_url);

  /**
   * Sets Config::m_abilities.
   *
   * @param abilities
   *        Value.
   * @return `*this`.
   */
  Pylon_builder& abilities(const transit::Abilities& abilities);

  /**
   * Sets Config::m_allow_overwrite.
   *
   * @param allow_overwrite
   *        Value.
   * @return `*this`.
   */
  Pylon_builder& allow_overwrite(bool allow_overwrite);

  /**
   * Sets Config::m_rendezvous.
   *
   * @param rendezvous
   *        Value; null restores the default.
   * @return `*this`.
   */
  Pylon_builder& rendezvous(wormhole::Rendezvous_ptr rendezvous);

  /**
   * Sets Config::m_transit_connector.
   *
   * @param connector
   *        Value; null restores the default.
   * @return `*this`.
   */
  Pylon_builder& transit_connector(transit::Connector_ptr connector);

  /**
   * Sets Config::m_transit_handler.
   *
   * @param handler
   *        Value.
   * @return `*this`.
   */
  Pylon_builder& transit_handler(transit::Transit_handler handler);

  /**
   * Builds a Pylon with the current settings.
   *
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_MISSING_APP_ID.
   * @return The Pylon; null on error.
   */
  Pylon_ptr build(Error_code* err_code = 0) const;

private:
  // Data.

  /// The settings so far.
  Config m_config;
}; // class Pylon_builder

} // namespace pylon

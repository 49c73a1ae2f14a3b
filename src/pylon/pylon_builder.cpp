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
#include "pylon/pylon_builder.hpp"
#include "pylon/error.hpp"
#include "pylon/wormhole/loopback_rendezvous.hpp"
#include "pylon/transit/loopback_connector.hpp"
#include <boost/move/make_unique.hpp>

namespace pylon
{

// Implementations.

Pylon_builder::Pylon_builder(flow::log::Logger* logger_ptr) :
  flow::log::Log_context(logger_ptr, Log_component::S_SESSION)
{
  m_config.m_relay_url = Config::S_DEFAULT_RELAY_URL;
  m_config.m_rendezvous_url = Config::S_DEFAULT_RENDEZVOUS_URL;
  m_config.m_abilities = transit::Abilities::S_ALL_ABILITIES;
  m_config.m_allow_overwrite = true;
}

Pylon_builder& Pylon_builder::id(const std::string& id)
{
  m_config.m_id = id;
  return *this;
}

Pylon_builder& Pylon_builder::relay_url(const std::string& relay_url)
{
  m_config.m_relay_url = relay_url;
  return *this;
}

Pylon_builder& Pylon_builder::rendezvous_url(const std::string& rendezvous_url)
{
  m_config.m_rendezvous_url = rendezvous_url;
  return *this;
}

Pylon_builder& Pylon_builder::abilities(const transit::Abilities& abilities)
{
  m_config.m_abilities = abilities;
  return *this;
}

Pylon_builder& Pylon_builder::allow_overwrite(bool allow_overwrite)
{
  m_config.m_allow_overwrite = allow_overwrite;
  return *this;
}

Pylon_builder& Pylon_builder::rendezvous(wormhole::Rendezvous_ptr rendezvous)
{
  m_config.m_rendezvous = std::move(rendezvous);
  return *this;
}

Pylon_builder& Pylon_builder::transit_connector(transit::Connector_ptr connector)
{
  m_config.m_transit_connector = std::move(connector);
  return *this;
}

Pylon_builder& Pylon_builder::transit_handler(transit::Transit_handler handler)
{
  m_config.m_transit_handler = std::move(handler);
  return *this;
}

Pylon_ptr Pylon_builder::build(Error_code* err_code) const
{
  Pylon_ptr pylon;
  if (flow::error::exec_and_throw_on_error
        ([&](Error_code* actual_err_code) -> Pylon_ptr { return build(actual_err_code); },
         &pylon, err_code, "Pylon_builder::build()"))
  {
    return pylon;
  }
  // else

  if (m_config.m_id.empty())
  {
    FLOW_LOG_WARNING("Pylon_builder [" << this << "]: Cannot build: application id not set.");
    *err_code = error::Code::S_MISSING_APP_ID;
    return pylon;
  }
  // else

  auto config = m_config;
  if (!config.m_rendezvous)
  {
    config.m_rendezvous = wormhole::Loopback_rendezvous::default_instance();
  }
  if (!config.m_transit_connector)
  {
    config.m_transit_connector = transit::Loopback_connector::default_instance();
  }

  pylon = boost::movelib::make_unique<Pylon>(get_logger(), config);
  err_code->clear();
  return pylon;
} // Pylon_builder::build()

} // namespace pylon

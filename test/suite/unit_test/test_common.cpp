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
#include "test_common.hpp"
#include <boost/filesystem/fstream.hpp>
#include <iterator>

namespace pylon::test
{

Test_logging::Test_logging() :
  m_config(flow::log::Sev::S_WARNING),
  m_logger(&m_config)
{
  config_log_components(&m_config);
}

flow::log::Logger* Test_logging::logger()
{
  return &m_logger;
}

Temp_dir::Temp_dir() :
  m_path(fs::temp_directory_path() / fs::unique_path("pylon-test-%%%%-%%%%-%%%%"))
{
  fs::create_directories(m_path);
}

Temp_dir::~Temp_dir()
{
  Error_code err_code;
  fs::remove_all(m_path, err_code);
}

const fs::path& Temp_dir::path() const
{
  return m_path;
}

Canceler::Canceler() :
  m_canceled(false),
  m_future(m_promise.get_future())
{
  // That's it.
}

Cancel_future Canceler::signal() const
{
  return m_future;
}

void Canceler::cancel()
{
  boost::lock_guard<boost::mutex> lock(m_mutex);
  if (!m_canceled)
  {
    m_canceled = true;
    m_promise.set_value();
  }
}

void write_test_file(const fs::path& path, size_t size)
{
  fs::ofstream file(path, std::ios::binary | std::ios::trunc);
  for (size_t idx = 0; idx != size; ++idx)
  {
    file.put(char((idx * 31 + idx / 251) & 0xFF));
  }
}

std::string read_file(const fs::path& path)
{
  fs::ifstream file(path, std::ios::binary);
  return std::string(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

} // namespace pylon::test

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
#include <flow/log/simple_ostream_logger.hpp>
#include <boost/thread/future.hpp>
#include <boost/thread/mutex.hpp>

namespace pylon::test
{

// Types.

/**
 * Logging for a test: a `flow::log::Config` with Pylon's components registered, and a logger writing to the
 * console.  Verbosity is WARNING so that the expected failures of negative tests show up without flooding.
 */
class Test_logging
{
public:
  /// Sets up logging.
  Test_logging();

  /// The logger.
  flow::log::Logger* logger();

private:
  flow::log::Config m_config;
  flow::log::Simple_ostream_logger m_logger;
}; // class Test_logging

/// A fresh, empty temporary directory, removed with its contents on destruction.
class Temp_dir
{
public:
  Temp_dir();
  ~Temp_dir();

  /// The directory.
  const fs::path& path() const;

private:
  fs::path m_path;
}; // class Temp_dir

/// A cancellation signal and the means to fire it.
class Canceler
{
public:
  Canceler();

  /// The signal to hand to an operation.
  Cancel_future signal() const;

  /// Requests cancellation.  May be invoked repeatedly, from any thread.
  void cancel();

private:
  boost::mutex m_mutex;
  bool m_canceled;
  boost::promise<void> m_promise;
  Cancel_future m_future;
}; // class Canceler

// Free functions.

/**
 * Writes a file of the given size with non-trivial contents.
 *
 * @param path
 *        Path.
 * @param size
 *        Size in bytes.
 */
void write_test_file(const fs::path& path, size_t size);

/**
 * Reads a whole file.
 *
 * @param path
 *        Path.
 * @return Contents.
 */
std::string read_file(const fs::path& path);

} // namespace pylon::test

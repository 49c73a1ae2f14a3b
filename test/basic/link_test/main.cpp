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

#include <pylon/pylon_builder.hpp>
#include <flow/log/simple_ostream_logger.hpp>
#include <boost/filesystem/fstream.hpp>
#include <iostream>

/* This little thing is *not* a unit-test; it is built to ensure the proper stuff links through our
 * build process.  We try to use a compiled thing or two; and a template (header-only) thing or two;
 * not so much for correctness testing but to see it build successfully and run without barfing.
 * Two Pylons in this one process send a small file from one to the other, via the default in-process
 * rendezvous and transit. */
int main()
{
  using flow::log::Simple_ostream_logger;
  using flow::log::Sev;
  using flow::error::Runtime_error;
  using pylon::Error_code;
  using pylon::Pylon_builder;
  using pylon::Log_component;
  using boost::promise;
  using std::exception;

  flow::log::Config log_config(Sev::S_INFO);
  pylon::config_log_components(&log_config);
  Simple_ostream_logger std_logger(&log_config);
  FLOW_LOG_SET_CONTEXT(&std_logger, Log_component::S_UNCAT);

  const auto work_dir = pylon::fs::temp_directory_path() / pylon::fs::unique_path("pylon-link-test-%%%%-%%%%");
  try
  {
    pylon::fs::create_directories(work_dir);
    const auto src_path = work_dir / "greeting.txt";
    const auto dst_path = work_dir / "received.txt";
    {
      pylon::fs::ofstream src(src_path);
      src << "Hello from the other side of the wormhole.\n";
    }

    promise<Error_code> sent_promise;
    auto sender = Pylon_builder(&std_logger).id("pylon.example/link-test").build();
    auto receiver = Pylon_builder(&std_logger).id("pylon.example/link-test").build();
    FLOW_LOG_INFO("Sender [" << *sender << "] JSON view: [" << sender->to_json() << "].");

    /* Goes away before `sender` does: should we bail out before the receiver got going, the broken promise
     * cancels the send, so that `sender` destructor is not stuck waiting for it. */
    promise<void> send_abort;

    const auto code = sender->gen_code(2);
    FLOW_LOG_INFO("Sender allocated a code; receiver redeems it.");

    // Sender blocks until the receiver accepts; so send from sender's own thread.
    sender->async_send_file(src_path, pylon::Progress_func(), send_abort.get_future().share(),
                            [&](const Error_code& err_code) { sent_promise.set_value(err_code); });

    receiver->request_file(code); // Throws on error.
    const auto offer = receiver->transfer_offer();
    if (!offer)
    {
      throw Runtime_error(Error_code(), "sender made no offer");
    }
    // else
    FLOW_LOG_INFO("Offer: [" << *offer << "].");

    receiver->receive_file(dst_path, [&](uint64_t received, uint64_t total)
    {
      FLOW_LOG_INFO("Received [" << received << "] of [" << total << "] bytes.");
    });

    const auto err_code = sent_promise.get_future().get();
    if (err_code)
    {
      throw Runtime_error(err_code, "totally unexpected error while sending");
    }
    // else

    FLOW_LOG_INFO("Transfer done; [" << pylon::fs::file_size(dst_path) << "] bytes at destination.  Exiting.");
    pylon::fs::remove_all(work_dir);
  } // try
  catch (const exception& exc)
  {
    FLOW_LOG_WARNING("Caught exception: [" << exc.what() << "].");
    Error_code rm_err_code;
    pylon::fs::remove_all(work_dir, rm_err_code);
    return 1;
  }

  return 0;
} // main()

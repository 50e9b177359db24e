#pragma once

#include "kernel.h"
#include "namespace_store.h"

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace cascade {

// What a worker reports back through its result pipe.
struct worker_message {
  bool ok{ false };
  fault_kind kind{ fault_kind::runtime };
  std::string error;    // rendering when !ok
  std::string display;  // rendered trailing values, empty when there are none
  std::optional<std::string> rich_json;
  std::string namespace_bytes;  // namespace_store::encode() of the mutated namespace
};

class worker_protocol_error : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

std::string worker_message_encode(worker_message const &message);
worker_message worker_message_decode(std::string_view bytes);

// Source with the trailing expression turned into a return statement.
std::string kernel_prepare_source(run_request const &request);

// Runs the cell against a private copy of `ns` in the calling process and reports
// the outcome. Faults are reported in the message; nothing is thrown.
worker_message kernel_worker_execute(run_request const &request,
                                     namespace_store const &ns,
                                     kernel_cfg const &cfg);

// Entry point of a forked worker: routes stdout and stderr into `capture_fd`, runs the
// cell, writes the encoded message to `result_fd` and exits.
[[noreturn]] void kernel_worker_main(int capture_fd,
                                     int result_fd,
                                     run_request const &request,
                                     namespace_store const &ns,
                                     kernel_cfg const &cfg);

}  // namespace cascade

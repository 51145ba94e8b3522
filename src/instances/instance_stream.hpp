#pragma once

#include "core/json_dom.hpp"

#include <cstdint>
#include <istream>
#include <string>

namespace jtdv::instances {

// Forward-only sequence of JSON documents read back-to-back from one byte
// stream. Documents need no delimiter between them ("1 2", "{}[]" and
// "\"a\"\"b\"" each hold two instances).
//
// The stream does not own `input`; the caller keeps it alive (and closes it)
// for as long as the InstanceStream is used. Safe on non-seekable sources
// such as std::cin.
class InstanceStream {
public:
  enum class Status {
    kInstance,
    kEnd,
    kError,
    kReadError,
  };

  explicit InstanceStream(std::istream& input) : parser_(input) {}

  InstanceStream(const InstanceStream&) = delete;
  InstanceStream& operator=(const InstanceStream&) = delete;

  // Pulls the next document.
  //
  // Contract:
  // - kInstance: `instance` holds the parsed value.
  // - kEnd: no bytes other than whitespace remain.
  // - kError: `error` holds the parse diagnostic (byte offset, line, column)
  //   prefixed with the 1-based instance number.
  // - kReadError: the underlying stream failed while reading; `error` holds
  //   the cause, prefixed the same way.
  // After kError or kReadError the stream stays failed and later calls repeat
  // the same status and message.
  Status Next(core::json::Value& instance, std::string& error);

  // Number of instances successfully returned so far.
  std::uint64_t Count() const {
    return count_;
  }

private:
  core::json::StreamParser parser_;
  std::uint64_t count_ = 0;
  bool failed_ = false;
  Status last_status_ = Status::kError;
  std::string last_error_;
};

} // namespace jtdv::instances

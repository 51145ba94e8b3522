#include "instances/instance_stream.hpp"

namespace jtdv::instances {

InstanceStream::Status InstanceStream::Next(core::json::Value& instance, std::string& error) {
  if (failed_) {
    error = last_error_;
    return last_status_;
  }

  std::string parse_error;
  switch (parser_.Next(instance, parse_error)) {
  case core::json::StreamParser::Status::kValue:
    ++count_;
    return Status::kInstance;
  case core::json::StreamParser::Status::kEnd:
    return Status::kEnd;
  case core::json::StreamParser::Status::kError:
    last_status_ = Status::kError;
    break;
  case core::json::StreamParser::Status::kReadError:
    last_status_ = Status::kReadError;
    break;
  }

  failed_ = true;
  last_error_ = "instance " + std::to_string(count_ + 1U) + ": " + parse_error;
  error = last_error_;
  return last_status_;
}

} // namespace jtdv::instances

#pragma once

#include <google/protobuf/message.h>

#include <string>

namespace sandbox::queue {

/*
  Job payloads are protobuf messages stored as JSON text, so the jobs
  table stays readable and searchable.
*/

std::string EncodePayload(const google::protobuf::Message& message);

// Throws PermanentJobError when the text does not parse into `out`.
void DecodePayload(const std::string& json, google::protobuf::Message* out);

template <typename T>
T DecodePayload(const std::string& json) {
  T message;
  DecodePayload(json, &message);
  return message;
}

} // namespace sandbox::queue

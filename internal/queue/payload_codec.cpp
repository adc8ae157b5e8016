#include "payload_codec.hpp"

#include <google/protobuf/util/json_util.h>

#include "internal/queue/job_context.hpp"
#include "internal/util/errors.hpp"

namespace sandbox::queue {

std::string EncodePayload(const google::protobuf::Message& message) {
  std::string                             json;
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace = false;

  auto status = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    throw util::InvalidArgument("cannot encode job payload: " + std::string(status.message()));
  }
  return json;
}

void DecodePayload(const std::string& json, google::protobuf::Message* out) {
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  auto status = google::protobuf::util::JsonStringToMessage(json.empty() ? "{}" : json, out, options);
  if (!status.ok()) {
    throw PermanentJobError("malformed job payload: " + std::string(status.message()));
  }
}

} // namespace sandbox::queue

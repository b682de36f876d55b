#pragma once

#include "outbox/v1/envelope.pb.h"

namespace outbox::v1 {

/*
  Convenience aliases for protobuf message types used across the codebase.
*/

using Command = google::protobuf::Any;

} // namespace outbox::v1

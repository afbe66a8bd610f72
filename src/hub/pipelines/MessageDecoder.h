#pragma once
#include <stdint.h>

#include <string>

#include "app/DeviceEvent.h"

enum class DecodeError {
  none,
  bad_topic,
  unknown_kind,
  malformed_payload
};

static inline const char* toString(DecodeError e) {
  switch (e) {
    case DecodeError::none:              return "none";
    case DecodeError::bad_topic:         return "bad_topic";
    case DecodeError::unknown_kind:      return "unknown_kind";
    case DecodeError::malformed_payload: return "malformed_payload";
    default:                             return "unknown";
  }
}

// Parses "uplink/{gatewayId}/{messageKind}" plus a flat JSON body.
// Pure: no state, safe to call from any task.
class MessageDecoder {
public:
  DecodeError decode(const std::string& topic,
                     const std::string& body,
                     uint32_t receivedMs,
                     DeviceEvent& out,
                     std::string* detail = nullptr) const;

  static bool splitTopic(const std::string& topic, std::string& gatewayId, std::string& kind);
};

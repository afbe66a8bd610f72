#include "pipelines/MessageDecoder.h"

#include "pipelines/JsonFields.h"

namespace {
constexpr const char* kTopicPrefix = "uplink/";
constexpr double kMaxBatteryV = 20.0;

struct FieldReport {
  std::string* detail;

  DecodeError missing(const char* key) const {
    if (detail) *detail = std::string("missing ") + key;
    return DecodeError::malformed_payload;
  }

  DecodeError invalid(const char* key) const {
    if (detail) *detail = std::string("invalid ") + key;
    return DecodeError::malformed_payload;
  }
};

DecodeError readSensor(JsonObjectConst body, bool required, DeviceEvent& out, const FieldReport& r) {
  if (!JsonFields::hasField(body, "sensor")) {
    return required ? r.missing("sensor") : DecodeError::none;
  }
  if (!JsonFields::extractString(body, "sensor", out.sensor_id) || out.sensor_id.empty()) {
    return r.invalid("sensor");
  }
  return DecodeError::none;
}

DecodeError readBattery(JsonObjectConst body, bool required, DeviceEvent& out, const FieldReport& r) {
  if (!JsonFields::hasField(body, "battery_v")) {
    return required ? r.missing("battery_v") : DecodeError::none;
  }
  double v = 0.0;
  if (!JsonFields::extractDouble(body, "battery_v", v)) return r.invalid("battery_v");
  if (v < 0.0 || v > kMaxBatteryV) return r.invalid("battery_v");
  out.has_battery = true;
  out.battery_v = (float)v;
  return DecodeError::none;
}

DecodeError readRssi(JsonObjectConst body, bool required, DeviceEvent& out, const FieldReport& r) {
  if (!JsonFields::hasField(body, "rssi")) {
    return required ? r.missing("rssi") : DecodeError::none;
  }
  long v = 0;
  if (!JsonFields::extractInt(body, "rssi", v)) return r.invalid("rssi");
  if (v < -200 || v > 50) return r.invalid("rssi");
  out.has_rssi = true;
  out.rssi_dbm = (int16_t)v;
  return DecodeError::none;
}

DecodeError readFirmware(JsonObjectConst body, bool required, DeviceEvent& out, const FieldReport& r) {
  if (!JsonFields::hasField(body, "fw")) {
    return required ? r.missing("fw") : DecodeError::none;
  }
  if (!JsonFields::extractString(body, "fw", out.firmware) || out.firmware.empty()) {
    return r.invalid("fw");
  }
  return DecodeError::none;
}

DecodeError readSeverity(JsonObjectConst body, DeviceEvent& out, const FieldReport& r) {
  if (!JsonFields::hasField(body, "severity")) return DecodeError::none;
  std::string text;
  if (!JsonFields::extractString(body, "severity", text)) return r.invalid("severity");
  if (!parseSeverity(text, out.severity)) return r.invalid("severity");
  out.has_severity = true;
  return DecodeError::none;
}

#define DECODE_STEP(expr)                        \
  do {                                           \
    const DecodeError stepErr = (expr);          \
    if (stepErr != DecodeError::none) return stepErr; \
  } while (0)

DecodeError decodeBody(JsonObjectConst body, DeviceEvent& out, const FieldReport& r) {
  switch (out.kind) {
    case EventKind::power_on:
      DECODE_STEP(readFirmware(body, true, out, r));
      DECODE_STEP(readBattery(body, false, out, r));
      DECODE_STEP(readRssi(body, false, out, r));
      DECODE_STEP(readSensor(body, false, out, r));
      return DecodeError::none;

    case EventKind::heartbeat:
      DECODE_STEP(readBattery(body, true, out, r));
      DECODE_STEP(readRssi(body, true, out, r));
      DECODE_STEP(readSensor(body, false, out, r));
      return DecodeError::none;

    case EventKind::smoke_alarm:
      DECODE_STEP(readSensor(body, true, out, r));
      DECODE_STEP(readSeverity(body, out, r));
      DECODE_STEP(readBattery(body, false, out, r));
      return DecodeError::none;

    case EventKind::smoke_register:
      DECODE_STEP(readSensor(body, true, out, r));
      DECODE_STEP(readFirmware(body, false, out, r));
      return DecodeError::none;

    case EventKind::delete_response:
      DECODE_STEP(readSensor(body, true, out, r));
      if (JsonFields::hasField(body, "ok") && !JsonFields::extractBool(body, "ok", out.delete_ok)) {
        return r.invalid("ok");
      }
      return DecodeError::none;

    case EventKind::self_test: {
      DECODE_STEP(readSensor(body, true, out, r));
      if (!JsonFields::hasField(body, "result")) return r.missing("result");
      std::string result;
      if (!JsonFields::extractString(body, "result", result)) return r.invalid("result");
      if (result == "pass") {
        out.self_test_ok = true;
      } else if (result == "fail") {
        out.self_test_ok = false;
      } else {
        return r.invalid("result");
      }
      return DecodeError::none;
    }

    case EventKind::low_battery:
      DECODE_STEP(readBattery(body, true, out, r));
      DECODE_STEP(readSensor(body, false, out, r));
      return DecodeError::none;

    default:
      return DecodeError::unknown_kind;
  }
}

#undef DECODE_STEP
} // namespace

bool MessageDecoder::splitTopic(const std::string& topic, std::string& gatewayId, std::string& kind) {
  const std::string prefix(kTopicPrefix);
  if (topic.compare(0, prefix.size(), prefix) != 0) return false;

  const size_t sep = topic.find('/', prefix.size());
  if (sep == std::string::npos) return false;
  if (topic.find('/', sep + 1) != std::string::npos) return false;

  gatewayId = topic.substr(prefix.size(), sep - prefix.size());
  kind = topic.substr(sep + 1);
  return !gatewayId.empty() && !kind.empty();
}

DecodeError MessageDecoder::decode(const std::string& topic,
                                   const std::string& body,
                                   uint32_t receivedMs,
                                   DeviceEvent& out,
                                   std::string* detail) const {
  std::string gatewayId;
  std::string kindText;
  if (!splitTopic(topic, gatewayId, kindText)) {
    if (detail) *detail = topic;
    return DecodeError::bad_topic;
  }

  DeviceEvent ev;
  if (!parseEventKind(kindText, ev.kind)) {
    if (detail) *detail = kindText;
    return DecodeError::unknown_kind;
  }
  ev.gateway_id = gatewayId;
  ev.received_ms = receivedMs;

  DynamicJsonDocument doc(JsonFields::kBodyDocCapacity);
  JsonObjectConst root;
  if (!JsonFields::parseObject(body, doc, root, detail)) {
    return DecodeError::malformed_payload;
  }

  const FieldReport report{detail};
  const DecodeError err = decodeBody(root, ev, report);
  if (err != DecodeError::none) return err;

  out = ev;
  return DecodeError::none;
}

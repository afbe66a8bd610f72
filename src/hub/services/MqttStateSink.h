#pragma once

#include "app/StateSink.h"
#include "services/MqttBus.h"

// Durable store writer: retained device/incident documents and an audit
// stream under firehub/state/.
class MqttStateSink : public StateSink {
public:
  explicit MqttStateSink(MqttBus& bus) : bus_(bus) {}

  void saveDevice(const DeviceState& st) override;
  void saveIncident(const AlarmIncident& inc) override;
  void appendAudit(const AuditRecord& rec) override;

  uint32_t dropped() const { return dropped_; }

private:
  MqttBus& bus_;
  volatile uint32_t dropped_ = 0;

  void put(const std::string& topic, const std::string& body, bool retain);
};

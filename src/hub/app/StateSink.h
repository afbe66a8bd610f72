#pragma once

#include "app/DeviceState.h"
#include "app/Incident.h"
#include "app/Notification.h"

// Write side of the durable store. Implementations must not block for long:
// calls arrive from ingress and dispatch tasks.
class StateSink {
public:
  virtual ~StateSink() = default;

  virtual void saveDevice(const DeviceState& st) = 0;
  virtual void saveIncident(const AlarmIncident& inc) = 0;
  virtual void appendAudit(const AuditRecord& rec) = 0;
};

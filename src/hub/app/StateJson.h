#pragma once

#include <string>

#include "app/DeviceState.h"
#include "app/Incident.h"
#include "app/Notification.h"

// Flat JSON renderings shared by broadcast envelopes and the state sink.
std::string toJson(const DeviceState& st);
std::string toJson(const AlarmIncident& inc);
std::string toJson(const AuditRecord& rec);

#include "services/Logger.h"

#include "app/HubConfig.h"

void Logger::begin() {
#if defined(ARDUINO_ARCH_ESP32)
  if (!mu_) mu_ = xSemaphoreCreateMutex();
#endif
}

void Logger::line(const char* tag, const String& text) {
#if defined(ARDUINO_ARCH_ESP32)
  if (mu_) xSemaphoreTake(mu_, portMAX_DELAY);
#endif
  Serial.print('[');
  Serial.print(tag);
  Serial.print("] ");
  Serial.println(text);
#if defined(ARDUINO_ARCH_ESP32)
  if (mu_) xSemaphoreGive(mu_);
#endif
}

void Logger::info(const char* tag, const char* text) {
  line(tag, String(text ? text : ""));
}

void Logger::logIngest(const IngestReport& r) {
  if (!r.decoded()) {
    String s = "drop ";
    s += toString(r.decode);
    if (!r.detail.empty()) {
      s += ": ";
      s += r.detail.c_str();
    }
    line("DECODE", s);
    return;
  }

#if APP_VERBOSE_LOG
  {
    String s = toString(r.event.kind);
    s += " gw=";
    s += r.event.gateway_id.c_str();
    s += " device=";
    s += r.device.state.id.c_str();
    s += " status=";
    s += toString(r.device.state.status);
    line("EV", s);
  }
#endif

  if (r.device.statusChanged() || r.device.removed) {
    String s = r.device.state.id.c_str();
    s += ' ';
    s += toString(r.device.previous);
    s += "->";
    s += r.device.removed ? "removed" : toString(r.device.state.status);
    line("DEV", s);
  }
  if (r.device.low_battery) {
    String s = "low battery ";
    s += r.device.state.id.c_str();
    s += " v=";
    s += String(r.device.state.battery_v, 2);
    line("DEV", s);
  }

  if (!r.incident) return;
  const AlarmTransition& t = r.transition;
  String s = toString(t.status);
  s += " incident=";
  s += String(t.incident.id);
  s += " sensor=";
  s += t.incident.sensor_id.c_str();
  s += " severity=";
  s += toString(t.incident.severity);
  if (r.fanout.attempted) {
    if (r.fanout.route != RouteError::none) {
      s += " route=";
      s += toString(r.fanout.route);
    } else {
      s += " queued=";
      s += String((uint32_t)r.fanout.queued);
      s += " no_channel=";
      s += String((uint32_t)r.fanout.no_channel);
    }
  }
  line("ALARM", s);
}

void Logger::logDirectory(const char* topic, DirectoryError err) {
  if (err == DirectoryError::none) {
#if APP_VERBOSE_LOG
    line("DIR", String("applied ") + (topic ? topic : ""));
#endif
    return;
  }
  String s = toString(err);
  s += ' ';
  s += topic ? topic : "";
  line("DIR", s);
}

void Logger::logDelivery(const DeliveryOutcome& o) {
  if (o.status == DeliveryStatus::sent) {
#if APP_VERBOSE_LOG
    line("PUSH", String("sent ") + o.recipient_id.c_str() + " incident=" + String(o.incident_id) +
                   " attempts=" + String(o.attempts));
#endif
    return;
  }
  String s = toString(o.status);
  s += ' ';
  s += o.recipient_id.c_str();
  s += " incident=";
  s += String(o.incident_id);
  s += " attempts=";
  s += String(o.attempts);
  if (!o.last_error.empty()) {
    s += " err=";
    s += o.last_error.c_str();
  }
  line("PUSH", s);
}

void Logger::logTick(const TickReport& r) {
  for (const DeviceState& st : r.offline) {
    String s = st.id.c_str();
    s += " offline last_heartbeat_ms=";
    s += String(st.last_heartbeat_ms);
    line("SWEEP", s);
  }
  for (size_t i = 0; i < r.escalated.size(); ++i) {
    const AlarmTransition& t = r.escalated[i];
    String s = "escalated incident=";
    s += String(t.incident.id);
    s += " severity=";
    s += toString(t.incident.severity);
    if (i < r.escalation_fanout.size()) {
      const FanOutReport& f = r.escalation_fanout[i];
      if (f.route != RouteError::none) {
        s += " route=";
        s += toString(f.route);
      } else {
        s += " queued=";
        s += String((uint32_t)f.queued);
      }
    }
    line("ALARM", s);
  }
  if (!r.pruned.empty()) {
    line("SWEEP", String("pruned ") + String((uint32_t)r.pruned.size()) + " resolved incidents");
  }
}

void Logger::logCommand(const char* origin, const CommandAck& ack) {
  String s = origin ? origin : "";
  s += ' ';
  s += ack.cmd.c_str();
  s += ack.ok ? " ok " : " fail ";
  s += ack.detail.c_str();
  line("CMD", s);
}

void Logger::logDrop(const char* what, uint32_t total) {
  String s = "dropped ";
  s += what ? what : "";
  s += " total=";
  s += String(total);
  line("QUEUE", s);
}

#include "services/SerialConsole.h"

#include "app/CommandParser.h"

void SerialConsole::begin() {
  lineLen_ = 0;
  lastByteMs_ = 0;
  Serial.print("[CONSOLE] ");
  Serial.println(commandHelp());
}

bool SerialConsole::commit(std::string& out) {
  lineBuf_[lineLen_] = '\0';
  out.assign(lineBuf_, lineLen_);
  lineLen_ = 0;
  return true;
}

bool SerialConsole::poll(uint32_t nowMs, std::string& out) {
  while (Serial.available()) {
    const char c = (char)Serial.read();
    if (c == '\r') continue;

    lastByteMs_ = nowMs;

    if (c == '\n') {
      if (lineLen_ == 0) continue;
      return commit(out);
    }

    if (lineLen_ >= (sizeof(lineBuf_) - 1)) {
      lineLen_ = 0;
      Serial.println("[CONSOLE] line too long");
      return false;
    }
    lineBuf_[lineLen_++] = c;
  }

  // Serial monitors set to "No line ending" never send '\n'.
  if (lineLen_ > 0 && (nowMs - lastByteMs_) >= 40) {
    return commit(out);
  }

  return false;
}

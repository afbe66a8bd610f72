#pragma once
#include <Arduino.h>

#include <string>

// Line-oriented operator input on the USB serial port.
class SerialConsole {
public:
  void begin();

  // True when a complete line is ready in `out`.
  bool poll(uint32_t nowMs, std::string& out);

private:
  char lineBuf_[256] = {0};
  uint16_t lineLen_ = 0;
  uint32_t lastByteMs_ = 0;

  bool commit(std::string& out);
};

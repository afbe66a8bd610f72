#include <Arduino.h>

#include "app/App.h"

namespace {
App app;
}

void setup() {
  Serial.begin(115200);
  delay(50);
  app.begin();
}

void loop() {
  app.tick(millis());
  delay(5);
}

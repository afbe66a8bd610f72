#pragma once

#include <Arduino.h>

#include <string>

#include "pipelines/DeliveryDispatcher.h"

// POSTs delivery payloads to the push gateway. Blocking; runs on the
// dispatch worker tasks only.
class HttpPushTransport : public PushTransport {
public:
  HttpPushTransport(const char* url, const char* token, uint32_t timeoutMs)
  : url_(url ? url : ""), token_(token ? token : ""), timeoutMs_(timeoutMs) {}

  PushResult send(const std::string& recipientId, const std::string& payload, std::string& error) override;

private:
  String url_;
  String token_;
  uint32_t timeoutMs_;
};

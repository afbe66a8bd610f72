#include "services/HttpPushTransport.h"

#include <HTTPClient.h>
#include <WiFi.h>
#include <WiFiClient.h>
#include <WiFiClientSecure.h>

PushResult HttpPushTransport::send(const std::string& recipientId, const std::string& payload, std::string& error) {
  if (url_.length() == 0) {
    error = "push gateway not configured";
    return PushResult::permanent_error;
  }
  if (WiFi.status() != WL_CONNECTED) {
    error = "wifi down";
    return PushResult::transient_error;
  }

  HTTPClient http;
  http.setTimeout(timeoutMs_);

  // Use plain WiFiClient for HTTP, WiFiClientSecure for HTTPS
  WiFiClient plain;
  WiFiClientSecure secure;
  bool begun = false;
  if (url_.startsWith("https://")) {
    secure.setInsecure();
    begun = http.begin(secure, url_);
  } else {
    begun = http.begin(plain, url_);
  }
  if (!begun) {
    error = "bad push url";
    return PushResult::permanent_error;
  }

  http.addHeader("Content-Type", "application/json");
  http.addHeader("X-Recipient", recipientId.c_str());
  if (token_.length() > 0) {
    http.addHeader("Authorization", String("Bearer ") + token_);
  }

  const int httpCode = http.POST(String(payload.c_str()));
  http.end();

  const PushResult result = classifyPushStatus(httpCode);
  if (result != PushResult::success) {
    if (httpCode < 0) {
      error = HTTPClient::errorToString(httpCode).c_str();
    } else {
      error = "http ";
      error += std::to_string(httpCode);
    }
  }
  return result;
}

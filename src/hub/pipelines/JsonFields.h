#pragma once

#include <stddef.h>

#include <string>

#include <ArduinoJson.h>

// Typed field reads over a parsed uplink/directory body.
// Each extractor returns false when the key is absent or the value has the
// wrong type; numeric extractors never coerce text to a number.
namespace JsonFields {

constexpr size_t kBodyDocCapacity = 1024;

// Deserializes `body` into `doc` and requires an object at the root.
// `error` receives a short reason on failure.
bool parseObject(const std::string& body, JsonDocument& doc, JsonObjectConst& out, std::string* error = nullptr);

bool hasField(JsonObjectConst obj, const char* key);
bool extractString(JsonObjectConst obj, const char* key, std::string& out);
bool extractBool(JsonObjectConst obj, const char* key, bool& out);
bool extractDouble(JsonObjectConst obj, const char* key, double& out);
bool extractInt(JsonObjectConst obj, const char* key, long& out);

// Quotes and escapes `text` as a JSON string literal.
std::string quote(const std::string& text);

} // namespace JsonFields

#include "pipelines/JsonFields.h"

#include <cmath>

namespace JsonFields {

bool parseObject(const std::string& body, JsonDocument& doc, JsonObjectConst& out, std::string* error) {
  const DeserializationError err = deserializeJson(doc, body);
  if (err) {
    if (error) *error = std::string("bad json: ") + err.c_str();
    return false;
  }
  if (!doc.is<JsonObjectConst>()) {
    if (error) *error = "body is not an object";
    return false;
  }
  out = doc.as<JsonObjectConst>();
  return true;
}

bool hasField(JsonObjectConst obj, const char* key) {
  return obj.containsKey(key);
}

bool extractString(JsonObjectConst obj, const char* key, std::string& out) {
  JsonVariantConst v = obj[key];
  if (!v.is<const char*>()) return false;
  out = v.as<const char*>();
  return true;
}

bool extractBool(JsonObjectConst obj, const char* key, bool& out) {
  JsonVariantConst v = obj[key];
  if (!v.is<bool>()) return false;
  out = v.as<bool>();
  return true;
}

bool extractDouble(JsonObjectConst obj, const char* key, double& out) {
  JsonVariantConst v = obj[key];
  if (!v.is<double>()) return false;
  const double d = v.as<double>();
  if (!std::isfinite(d)) return false;
  out = d;
  return true;
}

bool extractInt(JsonObjectConst obj, const char* key, long& out) {
  JsonVariantConst v = obj[key];
  if (!v.is<long>()) return false;
  out = v.as<long>();
  return true;
}

std::string quote(const std::string& text) {
  std::string out;
  out.reserve(text.size() + 2);
  out += '"';
  for (size_t i = 0; i < text.size(); ++i) {
    const char c = text[i];
    if (c == '"' || c == '\\') {
      out += '\\';
      out += c;
    } else if (c == '\n') {
      out += "\\n";
    } else if (c == '\r') {
      out += "\\r";
    } else if (c == '\t') {
      out += "\\t";
    } else {
      out += c;
    }
  }
  out += '"';
  return out;
}

} // namespace JsonFields

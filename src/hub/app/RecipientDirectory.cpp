#include "app/RecipientDirectory.h"

#include <cmath>

#include "pipelines/JsonFields.h"

namespace {
constexpr const char* kDirPrefix = "firehub/dir/";
constexpr double kEarthRadiusM = 6371000.0;
constexpr double kPi = 3.14159265358979323846;

inline double toRad(double deg) {
  return deg * kPi / 180.0;
}

bool readPoint(JsonObjectConst body, GeoPoint& out) {
  double lat = 0.0;
  double lon = 0.0;
  if (!JsonFields::extractDouble(body, "lat", lat)) return false;
  if (!JsonFields::extractDouble(body, "lon", lon)) return false;
  if (lat < -90.0 || lat > 90.0 || lon < -180.0 || lon > 180.0) return false;
  out.lat = lat;
  out.lon = lon;
  return true;
}

bool readOptionalFlag(JsonObjectConst body, const char* key, bool& out) {
  out = false;
  if (!JsonFields::hasField(body, key)) return true;
  return JsonFields::extractBool(body, key, out);
}
} // namespace

double distanceMeters(const GeoPoint& a, const GeoPoint& b) {
  const double dLat = toRad(b.lat - a.lat);
  const double dLon = toRad(b.lon - a.lon);
  const double s1 = std::sin(dLat / 2.0);
  const double s2 = std::sin(dLon / 2.0);
  const double h = s1 * s1 + std::cos(toRad(a.lat)) * std::cos(toRad(b.lat)) * s2 * s2;
  return 2.0 * kEarthRadiusM * std::asin(std::sqrt(std::fmin(1.0, h)));
}

void InMemoryDirectory::upsertHouse(const House& h) {
  std::lock_guard<std::mutex> lk(mu_);
  houses_[h.id] = h;
}

void InMemoryDirectory::bindGateway(const std::string& gatewayId, const std::string& houseId) {
  std::lock_guard<std::mutex> lk(mu_);
  gatewayHouse_[gatewayId] = houseId;
}

void InMemoryDirectory::upsertRecipient(const Recipient& r) {
  std::lock_guard<std::mutex> lk(mu_);
  recipients_[r.id] = r;
}

bool InMemoryDirectory::removeHouse(const std::string& houseId) {
  std::lock_guard<std::mutex> lk(mu_);
  return houses_.erase(houseId) > 0;
}

bool InMemoryDirectory::unbindGateway(const std::string& gatewayId) {
  std::lock_guard<std::mutex> lk(mu_);
  return gatewayHouse_.erase(gatewayId) > 0;
}

bool InMemoryDirectory::removeRecipient(const std::string& recipientId) {
  std::lock_guard<std::mutex> lk(mu_);
  return recipients_.erase(recipientId) > 0;
}

DirectoryError InMemoryDirectory::applyMessage(const std::string& topic, const std::string& payload) {
  const std::string prefix(kDirPrefix);
  if (topic.compare(0, prefix.size(), prefix) != 0) return DirectoryError::bad_topic;

  const size_t sep = topic.find('/', prefix.size());
  if (sep == std::string::npos) return DirectoryError::bad_topic;
  const std::string kind = topic.substr(prefix.size(), sep - prefix.size());
  const std::string id = topic.substr(sep + 1);
  if (id.empty() || id.find('/') != std::string::npos) return DirectoryError::bad_topic;

  if (kind != "house" && kind != "gateway" && kind != "recipient") return DirectoryError::bad_topic;

  const bool removal = payload.empty();
  DynamicJsonDocument doc(JsonFields::kBodyDocCapacity);
  JsonObjectConst body;
  if (!removal && !JsonFields::parseObject(payload, doc, body)) return DirectoryError::malformed_payload;

  if (kind == "house") {
    if (removal) {
      removeHouse(id);
      return DirectoryError::none;
    }
    House h;
    h.id = id;
    if (!readPoint(body, h.location)) return DirectoryError::malformed_payload;
    if (JsonFields::hasField(body, "tenant") && !JsonFields::extractString(body, "tenant", h.tenant_id)) {
      return DirectoryError::malformed_payload;
    }
    upsertHouse(h);
    return DirectoryError::none;
  }

  if (kind == "gateway") {
    if (removal) {
      unbindGateway(id);
      return DirectoryError::none;
    }
    std::string houseId;
    if (!JsonFields::extractString(body, "house", houseId) || houseId.empty()) {
      return DirectoryError::malformed_payload;
    }
    bindGateway(id, houseId);
    return DirectoryError::none;
  }

  if (kind == "recipient") {
    if (removal) {
      removeRecipient(id);
      return DirectoryError::none;
    }
    Recipient r;
    r.id = id;
    if (!readPoint(body, r.location)) return DirectoryError::malformed_payload;
    if (JsonFields::hasField(body, "house") && !JsonFields::extractString(body, "house", r.house_id)) {
      return DirectoryError::malformed_payload;
    }
    std::string role = "occupant";
    if (JsonFields::hasField(body, "role") && !JsonFields::extractString(body, "role", role)) {
      return DirectoryError::malformed_payload;
    }
    if (role == "occupant") {
      r.role = RecipientRole::occupant;
    } else if (role == "emergency") {
      r.role = RecipientRole::emergency;
    } else {
      return DirectoryError::malformed_payload;
    }
    if (!readOptionalFlag(body, "push", r.has_push) ||
        !readOptionalFlag(body, "sms", r.has_sms) ||
        !readOptionalFlag(body, "email", r.has_email)) {
      return DirectoryError::malformed_payload;
    }
    upsertRecipient(r);
    return DirectoryError::none;
  }

  return DirectoryError::bad_topic;
}

bool InMemoryDirectory::houseForGateway(const std::string& gatewayId, House& out) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto g = gatewayHouse_.find(gatewayId);
  if (g == gatewayHouse_.end()) return false;
  auto h = houses_.find(g->second);
  if (h == houses_.end()) return false;
  out = h->second;
  return true;
}

std::vector<Recipient> InMemoryDirectory::occupantsOf(const std::string& houseId) const {
  std::vector<Recipient> out;
  std::lock_guard<std::mutex> lk(mu_);
  for (const auto& kv : recipients_) {
    if (kv.second.house_id == houseId && kv.second.role == RecipientRole::occupant) {
      out.push_back(kv.second);
    }
  }
  return out;
}

std::vector<Recipient> InMemoryDirectory::findWithinRadius(const GeoPoint& center, double radiusM) const {
  std::vector<Recipient> out;
  std::lock_guard<std::mutex> lk(mu_);
  for (const auto& kv : recipients_) {
    if (distanceMeters(center, kv.second.location) <= radiusM) out.push_back(kv.second);
  }
  return out;
}

size_t InMemoryDirectory::recipientCount() const {
  std::lock_guard<std::mutex> lk(mu_);
  return recipients_.size();
}

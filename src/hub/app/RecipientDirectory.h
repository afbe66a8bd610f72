#pragma once
#include <stdint.h>

#include <map>
#include <mutex>
#include <string>
#include <vector>

struct GeoPoint {
  double lat = 0.0;
  double lon = 0.0;
};

enum class RecipientRole : uint8_t { occupant, emergency };

static inline const char* toString(RecipientRole r) {
  switch (r) {
    case RecipientRole::occupant:  return "occupant";
    case RecipientRole::emergency: return "emergency";
    default:                       return "unknown";
  }
}

struct House {
  std::string id;
  std::string tenant_id;
  GeoPoint location;
};

struct Recipient {
  std::string id;
  std::string house_id;
  RecipientRole role = RecipientRole::occupant;
  GeoPoint location;
  bool has_push = false;
  bool has_sms = false;
  bool has_email = false;
};

// Great-circle distance in metres.
double distanceMeters(const GeoPoint& a, const GeoPoint& b);

// Read side of the durable store as the router sees it.
class Directory {
public:
  virtual ~Directory() = default;

  virtual bool houseForGateway(const std::string& gatewayId, House& out) const = 0;
  virtual std::vector<Recipient> occupantsOf(const std::string& houseId) const = 0;
  virtual std::vector<Recipient> findWithinRadius(const GeoPoint& center, double radiusM) const = 0;
};

enum class DirectoryError {
  none,
  bad_topic,
  malformed_payload
};

static inline const char* toString(DirectoryError e) {
  switch (e) {
    case DirectoryError::none:              return "none";
    case DirectoryError::bad_topic:         return "bad_topic";
    case DirectoryError::malformed_payload: return "malformed_payload";
    default:                                return "unknown";
  }
}

// Hub-local copy of houses, gateways and recipients, kept in sync from
// retained "firehub/dir/..." messages.
class InMemoryDirectory : public Directory {
public:
  void upsertHouse(const House& h);
  void bindGateway(const std::string& gatewayId, const std::string& houseId);
  void upsertRecipient(const Recipient& r);
  bool removeHouse(const std::string& houseId);
  bool unbindGateway(const std::string& gatewayId);
  bool removeRecipient(const std::string& recipientId);

  // "firehub/dir/{house|gateway|recipient}/{id}"; an empty body removes.
  DirectoryError applyMessage(const std::string& topic, const std::string& body);

  bool houseForGateway(const std::string& gatewayId, House& out) const override;
  std::vector<Recipient> occupantsOf(const std::string& houseId) const override;
  std::vector<Recipient> findWithinRadius(const GeoPoint& center, double radiusM) const override;

  size_t recipientCount() const;

private:
  mutable std::mutex mu_;
  std::map<std::string, House> houses_;
  std::map<std::string, std::string> gatewayHouse_;
  std::map<std::string, Recipient> recipients_;
};

#pragma once

#ifndef WIFI_SSID
#define WIFI_SSID ""
#endif

#ifndef WIFI_PASSWORD
#define WIFI_PASSWORD ""
#endif

#ifndef MQTT_BROKER
#define MQTT_BROKER "192.168.1.10"
#endif

#ifndef MQTT_PORT
#define MQTT_PORT 1883
#endif

#ifndef MQTT_USERNAME
#define MQTT_USERNAME ""
#endif

#ifndef MQTT_PASSWORD
#define MQTT_PASSWORD ""
#endif

#ifndef MQTT_CLIENT_ID
#define MQTT_CLIENT_ID "firehub-esp32"
#endif

#ifndef MQTT_KEEPALIVE_S
#define MQTT_KEEPALIVE_S 15
#endif

#ifndef MQTT_SOCKET_TIMEOUT_S
#define MQTT_SOCKET_TIMEOUT_S 1
#endif

// Uplink bodies and state documents exceed PubSubClient's 256 byte default.
#ifndef MQTT_BUFFER_SIZE
#define MQTT_BUFFER_SIZE 1024
#endif

#ifndef WIFI_RECONNECT_MS
#define WIFI_RECONNECT_MS 5000
#endif

#ifndef MQTT_RECONNECT_MS
#define MQTT_RECONNECT_MS 3000
#endif

#ifndef MQTT_TOPIC_UPLINK
#define MQTT_TOPIC_UPLINK "uplink/+/+"
#endif

#ifndef MQTT_TOPIC_UPLINK_PREFIX
#define MQTT_TOPIC_UPLINK_PREFIX "uplink/"
#endif

#ifndef MQTT_TOPIC_DIR
#define MQTT_TOPIC_DIR "firehub/dir/#"
#endif

#ifndef MQTT_TOPIC_DIR_PREFIX
#define MQTT_TOPIC_DIR_PREFIX "firehub/dir/"
#endif

#ifndef MQTT_TOPIC_CMD
#define MQTT_TOPIC_CMD "firehub/cmd"
#endif

#ifndef MQTT_TOPIC_STATUS
#define MQTT_TOPIC_STATUS "firehub/status"
#endif

#ifndef MQTT_TOPIC_ACK
#define MQTT_TOPIC_ACK "firehub/ack"
#endif

#ifndef MQTT_TOPIC_METRICS
#define MQTT_TOPIC_METRICS "firehub/metrics"
#endif

// firehub/state/{device|incident|audit}/...
#ifndef MQTT_TOPIC_STATE_PREFIX
#define MQTT_TOPIC_STATE_PREFIX "firehub/state/"
#endif

#ifndef MQTT_METRICS_PERIOD_MS
#define MQTT_METRICS_PERIOD_MS 10000
#endif

#ifndef MQTT_STORE_CAP
#define MQTT_STORE_CAP 24
#endif

#ifndef MQTT_STORE_FLUSH_BURST
#define MQTT_STORE_FLUSH_BURST 8
#endif

#ifndef MQTT_PUB_DRAIN_BURST
#define MQTT_PUB_DRAIN_BURST 8
#endif

#ifndef HUB_INGRESS_QUEUE_DEPTH
#define HUB_INGRESS_QUEUE_DEPTH 24
#endif

#ifndef HUB_PUB_QUEUE_DEPTH
#define HUB_PUB_QUEUE_DEPTH 24
#endif

#ifndef HUB_CMD_QUEUE_DEPTH
#define HUB_CMD_QUEUE_DEPTH 8
#endif

#ifndef HUB_MAX_DISPATCH_WORKERS
#define HUB_MAX_DISPATCH_WORKERS 4
#endif

#ifndef HUB_DISPATCH_IDLE_MS
#define HUB_DISPATCH_IDLE_MS 200
#endif

#ifndef HUB_PUMP_PERIOD_MS
#define HUB_PUMP_PERIOD_MS 20
#endif

#ifndef HUB_PUMP_BURST
#define HUB_PUMP_BURST 4
#endif

#ifndef HUB_SWEEP_POLL_MS
#define HUB_SWEEP_POLL_MS 250
#endif

#ifndef PUSH_GATEWAY_URL
#define PUSH_GATEWAY_URL ""
#endif

#ifndef PUSH_AUTH_TOKEN
#define PUSH_AUTH_TOKEN ""
#endif

#ifndef PUSH_TIMEOUT_MS
#define PUSH_TIMEOUT_MS 4000
#endif

#ifndef WS_PORT
#define WS_PORT 80
#endif

#ifndef WS_PATH
#define WS_PATH "/ws"
#endif

#ifndef CONFIG_NVS_NAMESPACE
#define CONFIG_NVS_NAMESPACE "firehubcfg1"
#endif

#ifndef OUTBOX_NVS_NAMESPACE
#define OUTBOX_NVS_NAMESPACE "firehubmq1"
#endif

#ifndef APP_VERBOSE_LOG
#define APP_VERBOSE_LOG 0
#endif

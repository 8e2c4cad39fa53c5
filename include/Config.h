#pragma once

// Coyote V3 GATT layout
#define COYOTE_SERVICE_UUID "0000180c-0000-1000-8000-00805f9b34fb"
#define COYOTE_WRITE_CHAR_UUID "0000150a-0000-1000-8000-00805f9b34fb"
#define COYOTE_NOTIFY_CHAR_UUID "0000150b-0000-1000-8000-00805f9b34fb"
#define COYOTE_BATTERY_SERVICE_UUID "0000180a-0000-1000-8000-00805f9b34fb"
#define COYOTE_BATTERY_CHAR_UUID "00001500-0000-1000-8000-00805f9b34fb"

// Advertised local name of a Coyote 3 pulse host
#define COYOTE_NAME_PREFIX "47L121000"

#define DEFAULT_SCAN_TIMEOUT_MS 10000

// Connect: attempts and linear backoff (delay grows with the attempt number)
#define CONNECT_RETRY_COUNT 4
#define CONNECT_RETRY_DELAY_MS 700
#define CONNECT_ATTEMPT_TIMEOUT_MS 15000

// Pairing is opportunistic; many hosts connect fine unpaired
#define PAIR_TIMEOUT_MS 4000
#define PAIR_SETTLE_MS 200
#define ACCESS_SETTLE_MS 150

#define SUBSCRIBE_RETRY_COUNT 3
#define WRITE_RETRY_COUNT 3
#define GATT_RETRY_DELAY_MS 350
#define GATT_OPERATION_TIMEOUT_MS 5000
#define LOCK_WAIT_MS 5000

#define RECOVERY_RETRY_COUNT 3
#define RECOVERY_BASE_DELAY_MS 350

// The V3 firmware plays each B0 frame for 100 ms and then runs dry
#define WAVEFORM_KEEPALIVE_MS 100
#define STRENGTH_ACK_WAIT_MS 50
#define BATTERY_FIRST_POLL_MS 5000
#define BATTERY_POLL_INTERVAL_MS 60000

#define DEFAULT_SOFT_LIMIT 200
#define DEFAULT_BALANCE 128

// Host link UART; the USB console carries the log
#define HOST_SERIAL_BAUD 115200
#define HOST_UART_RX_PIN 16
#define HOST_UART_TX_PIN 17
#define HOST_FRAME_MAX_BYTES 256

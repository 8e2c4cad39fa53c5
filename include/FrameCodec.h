#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace pulsebridge {

enum class Channel : uint8_t {
    A,
    B,
    AB
};

// Two-bit strength interpretation, packed per channel into byte 1 of a B0 frame.
enum class StrengthMode : uint8_t {
    NoChange = 0,
    Increase = 1,
    Decrease = 2,
    Absolute = 3
};

constexpr uint8_t kStrengthCeiling = 200;
constexpr uint8_t kWaveformStrengthMax = 100;
// Any waveform strength above 100 makes the firmware discard the channel's four samples.
constexpr uint8_t kSilentStrength = 101;
constexpr uint8_t kFrequencyMin = 10;
constexpr uint8_t kFrequencyMax = 240;

constexpr uint8_t kStrengthHeader = 0xB0;
constexpr uint8_t kSoftLimitHeader = 0xBF;
constexpr uint8_t kTelemetryHeader = 0xB1;

constexpr size_t kStrengthFrameSize = 20;
constexpr size_t kSoftLimitFrameSize = 7;
constexpr size_t kTelemetryFrameSize = 4;

using StrengthFrame = std::array<uint8_t, kStrengthFrameSize>;
using SoftLimitFrame = std::array<uint8_t, kSoftLimitFrameSize>;

struct WaveformSample {
    uint8_t frequency = kFrequencyMin;
    uint8_t strength = 0;

    bool operator==(const WaveformSample& other) const {
        return frequency == other.frequency && strength == other.strength;
    }
};

using WaveformSamples = std::array<WaveformSample, 4>;

struct StrengthSet {
    Channel channel = Channel::A;
    StrengthMode mode = StrengthMode::Absolute;
    uint8_t value = 0;
    uint8_t sequence = 0;

    bool operator==(const StrengthSet& other) const {
        return channel == other.channel && mode == other.mode && value == other.value &&
               sequence == other.sequence;
    }
};

struct Waveform {
    Channel channel = Channel::A;
    WaveformSamples samples{};

    bool operator==(const Waveform& other) const {
        return channel == other.channel && samples == other.samples;
    }
};

struct BalanceParams {
    uint8_t frequencyA = 128;
    uint8_t frequencyB = 128;
    uint8_t strengthA = 128;
    uint8_t strengthB = 128;
};

struct SoftLimits {
    uint8_t limitA = kStrengthCeiling;
    uint8_t limitB = kStrengthCeiling;
    BalanceParams balance;

    bool operator==(const SoftLimits& other) const {
        return limitA == other.limitA && limitB == other.limitB &&
               balance.frequencyA == other.balance.frequencyA &&
               balance.frequencyB == other.balance.frequencyB &&
               balance.strengthA == other.balance.strengthA &&
               balance.strengthB == other.balance.strengthB;
    }
};

struct TelemetryAck {
    uint8_t sequence = 0;
    uint8_t strengthA = 0;
    uint8_t strengthB = 0;
};

/**
 * @brief Builds a B0 frame that changes strength on one or both channels.
 *
 * The value is clamped to [0, 200]. A channel that is not addressed is sent as
 * NoChange so the frame never disturbs it, and both waveform halves carry the
 * silent sentinel.
 */
StrengthFrame encodeStrengthSet(Channel channel, StrengthMode mode, int value, uint8_t sequence);

/**
 * @brief Builds a B0 frame carrying 100 ms of waveform (four 25 ms samples).
 *
 * Frequencies are clamped to [10, 240] and strengths to [0, 100]. The channel
 * not addressed is silenced with frequencies {0,0,0,0} and strengths {0,0,0,101}.
 */
StrengthFrame encodeWaveform(Channel channel, const WaveformSamples& samples);

// Waveform frame with independent halves; a null half is silenced.
StrengthFrame encodeWaveformPair(const WaveformSamples* channelA, const WaveformSamples* channelB);

SoftLimitFrame encodeSoftLimit(const SoftLimits& limits);

// A frame that leaves both channels unchanged with a zero value decodes as Channel::AB,
// since the channel it was encoded for is not recoverable from the bytes.
std::optional<StrengthSet> decodeStrengthSet(const uint8_t* data, size_t len);
std::optional<Waveform> decodeWaveform(const uint8_t* data, size_t len);
std::optional<SoftLimits> decodeSoftLimit(const uint8_t* data, size_t len);
std::optional<TelemetryAck> decodeTelemetry(const uint8_t* data, size_t len);

/**
 * @brief Maps a user-facing frequency (10..1000) onto the device's byte (10..240).
 *
 * 10..100 is passed through, 101..600 is compressed 5:1 above 100 and 601..1000
 * is compressed 10:1 above 200. Inputs outside 10..1000 clamp to the ends.
 */
uint8_t mapFrequency(int userUnits);

// Parses 16 hex digits: four frequency bytes followed by four strength bytes.
bool parseWaveformHex(const std::string& hex, WaveformSamples& out);

}  // namespace pulsebridge

#include "FrameCodec.h"

#include <algorithm>

namespace pulsebridge {

namespace {

constexpr size_t kWaveAFreq = 4;
constexpr size_t kWaveAStrength = 8;
constexpr size_t kWaveBFreq = 12;
constexpr size_t kWaveBStrength = 16;

uint8_t clampByte(int value, int lo, int hi) {
    return static_cast<uint8_t>(std::clamp(value, lo, hi));
}

uint8_t packModes(uint8_t sequence, StrengthMode modeA, StrengthMode modeB) {
    return static_cast<uint8_t>(((sequence & 0x0F) << 4) |
                                ((static_cast<uint8_t>(modeA) & 0x03) << 2) |
                                (static_cast<uint8_t>(modeB) & 0x03));
}

void writeSilent(StrengthFrame& frame, size_t freqOffset, size_t strengthOffset) {
    for (size_t i = 0; i < 4; ++i) {
        frame[freqOffset + i] = 0;
        frame[strengthOffset + i] = 0;
    }
    frame[strengthOffset + 3] = kSilentStrength;
}

void writeSamples(StrengthFrame& frame, size_t freqOffset, size_t strengthOffset, const WaveformSamples& samples) {
    for (size_t i = 0; i < samples.size(); ++i) {
        frame[freqOffset + i] = clampByte(samples[i].frequency, kFrequencyMin, kFrequencyMax);
        frame[strengthOffset + i] = clampByte(samples[i].strength, 0, kWaveformStrengthMax);
    }
}

bool halfSilent(const uint8_t* data, size_t strengthOffset) {
    for (size_t i = 0; i < 4; ++i) {
        if (data[strengthOffset + i] > kWaveformStrengthMax) {
            return true;
        }
    }
    return false;
}

WaveformSamples readSamples(const uint8_t* data, size_t freqOffset, size_t strengthOffset) {
    WaveformSamples samples{};
    for (size_t i = 0; i < samples.size(); ++i) {
        samples[i].frequency = data[freqOffset + i];
        samples[i].strength = data[strengthOffset + i];
    }
    return samples;
}

StrengthFrame emptyFrame() {
    StrengthFrame frame{};
    frame[0] = kStrengthHeader;
    return frame;
}

}  // namespace

StrengthFrame encodeStrengthSet(Channel channel, StrengthMode mode, int value, uint8_t sequence) {
    StrengthFrame frame = emptyFrame();
    const uint8_t clamped = clampByte(value, 0, kStrengthCeiling);
    const bool touchA = channel == Channel::A || channel == Channel::AB;
    const bool touchB = channel == Channel::B || channel == Channel::AB;

    frame[1] = packModes(sequence,
                         touchA ? mode : StrengthMode::NoChange,
                         touchB ? mode : StrengthMode::NoChange);
    frame[2] = touchA ? clamped : 0;
    frame[3] = touchB ? clamped : 0;
    writeSilent(frame, kWaveAFreq, kWaveAStrength);
    writeSilent(frame, kWaveBFreq, kWaveBStrength);
    return frame;
}

StrengthFrame encodeWaveform(Channel channel, const WaveformSamples& samples) {
    const bool toA = channel == Channel::A || channel == Channel::AB;
    const bool toB = channel == Channel::B || channel == Channel::AB;
    return encodeWaveformPair(toA ? &samples : nullptr, toB ? &samples : nullptr);
}

StrengthFrame encodeWaveformPair(const WaveformSamples* channelA, const WaveformSamples* channelB) {
    StrengthFrame frame = emptyFrame();
    frame[1] = packModes(0, StrengthMode::NoChange, StrengthMode::NoChange);
    if (channelA) {
        writeSamples(frame, kWaveAFreq, kWaveAStrength, *channelA);
    } else {
        writeSilent(frame, kWaveAFreq, kWaveAStrength);
    }
    if (channelB) {
        writeSamples(frame, kWaveBFreq, kWaveBStrength, *channelB);
    } else {
        writeSilent(frame, kWaveBFreq, kWaveBStrength);
    }
    return frame;
}

SoftLimitFrame encodeSoftLimit(const SoftLimits& limits) {
    SoftLimitFrame frame{};
    frame[0] = kSoftLimitHeader;
    frame[1] = std::min(limits.limitA, kStrengthCeiling);
    frame[2] = std::min(limits.limitB, kStrengthCeiling);
    frame[3] = limits.balance.frequencyA;
    frame[4] = limits.balance.frequencyB;
    frame[5] = limits.balance.strengthA;
    frame[6] = limits.balance.strengthB;
    return frame;
}

std::optional<StrengthSet> decodeStrengthSet(const uint8_t* data, size_t len) {
    if (!data || len != kStrengthFrameSize || data[0] != kStrengthHeader) {
        return std::nullopt;
    }
    if (!halfSilent(data, kWaveAStrength) || !halfSilent(data, kWaveBStrength)) {
        return std::nullopt;
    }
    const auto modeA = static_cast<StrengthMode>((data[1] >> 2) & 0x03);
    const auto modeB = static_cast<StrengthMode>(data[1] & 0x03);

    StrengthSet out;
    out.sequence = static_cast<uint8_t>((data[1] >> 4) & 0x0F);
    if (modeA != StrengthMode::NoChange && modeB != StrengthMode::NoChange) {
        if (modeA != modeB || data[2] != data[3]) {
            return std::nullopt;
        }
        out.channel = Channel::AB;
        out.mode = modeA;
        out.value = data[2];
    } else if (modeA != StrengthMode::NoChange) {
        out.channel = Channel::A;
        out.mode = modeA;
        out.value = data[2];
    } else if (modeB != StrengthMode::NoChange) {
        out.channel = Channel::B;
        out.mode = modeB;
        out.value = data[3];
    } else {
        // Both channels unchanged: the value bytes tell which channel the frame named.
        out.mode = StrengthMode::NoChange;
        if (data[2] != 0 && data[3] == 0) {
            out.channel = Channel::A;
            out.value = data[2];
        } else if (data[2] == 0 && data[3] != 0) {
            out.channel = Channel::B;
            out.value = data[3];
        } else if (data[2] == data[3]) {
            out.channel = Channel::AB;
            out.value = data[2];
        } else {
            return std::nullopt;
        }
    }
    return out;
}

std::optional<Waveform> decodeWaveform(const uint8_t* data, size_t len) {
    if (!data || len != kStrengthFrameSize || data[0] != kStrengthHeader || data[1] != 0) {
        return std::nullopt;
    }
    const bool silentA = halfSilent(data, kWaveAStrength);
    const bool silentB = halfSilent(data, kWaveBStrength);
    if (silentA && silentB) {
        return std::nullopt;
    }

    Waveform out;
    if (!silentA && !silentB) {
        out.samples = readSamples(data, kWaveAFreq, kWaveAStrength);
        if (out.samples != readSamples(data, kWaveBFreq, kWaveBStrength)) {
            return std::nullopt;
        }
        out.channel = Channel::AB;
    } else if (!silentA) {
        out.channel = Channel::A;
        out.samples = readSamples(data, kWaveAFreq, kWaveAStrength);
    } else {
        out.channel = Channel::B;
        out.samples = readSamples(data, kWaveBFreq, kWaveBStrength);
    }
    return out;
}

std::optional<SoftLimits> decodeSoftLimit(const uint8_t* data, size_t len) {
    if (!data || len != kSoftLimitFrameSize || data[0] != kSoftLimitHeader) {
        return std::nullopt;
    }
    SoftLimits out;
    out.limitA = data[1];
    out.limitB = data[2];
    out.balance.frequencyA = data[3];
    out.balance.frequencyB = data[4];
    out.balance.strengthA = data[5];
    out.balance.strengthB = data[6];
    return out;
}

std::optional<TelemetryAck> decodeTelemetry(const uint8_t* data, size_t len) {
    if (!data || len < kTelemetryFrameSize || data[0] != kTelemetryHeader) {
        return std::nullopt;
    }
    TelemetryAck ack;
    ack.sequence = data[1];
    ack.strengthA = data[2];
    ack.strengthB = data[3];
    return ack;
}

uint8_t mapFrequency(int userUnits) {
    const int v = std::clamp(userUnits, 10, 1000);
    if (v <= 100) {
        return static_cast<uint8_t>(v);
    }
    if (v <= 600) {
        return static_cast<uint8_t>((v - 100) / 5 + 100);
    }
    return static_cast<uint8_t>((v - 600) / 10 + 200);
}

bool parseWaveformHex(const std::string& hex, WaveformSamples& out) {
    if (hex.size() != 16) {
        return false;
    }
    uint8_t bytes[8] = {0};
    for (size_t i = 0; i < 8; ++i) {
        int value = 0;
        for (size_t j = 0; j < 2; ++j) {
            const char c = hex[i * 2 + j];
            int digit = -1;
            if (c >= '0' && c <= '9') {
                digit = c - '0';
            } else if (c >= 'a' && c <= 'f') {
                digit = c - 'a' + 10;
            } else if (c >= 'A' && c <= 'F') {
                digit = c - 'A' + 10;
            }
            if (digit < 0) {
                return false;
            }
            value = value * 16 + digit;
        }
        bytes[i] = static_cast<uint8_t>(value);
    }
    for (size_t i = 0; i < out.size(); ++i) {
        out[i].frequency = bytes[i];
        out[i].strength = bytes[4 + i];
    }
    return true;
}

}  // namespace pulsebridge

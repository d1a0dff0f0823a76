#include <dhtexpo/protocol/dht_decoder.hpp>

namespace {
    bool withinResponseWindow(int64_t duration_us, const DecoderSettings& settings) {
        return duration_us >= static_cast<int64_t>(settings.response_min_us) &&
               duration_us <= static_cast<int64_t>(settings.response_max_us);
    }

    //              0      1      2      3      4
    //          +------+------+------+------+------+
    //  DHT11   | RH%  |  0   | temp |  0   | sum  |
    //  DHT22   | RH%  | RH%  | temp | temp | sum  |
    //          | MSB  | LSB  | MSB  | LSB  |      |
    //          +------+------+------+------+------+
    bool convertDht22(const uint8_t (&frame)[DhtDecoder::kFrameBytes], float& humidity, float& temperature) {
        const uint16_t humidity_raw = static_cast<uint16_t>((frame[0] << 8) | frame[1]);
        // Bit 7 of the temperature MSB is the sign; the other 15 bits are magnitude
        const uint16_t temperature_raw = static_cast<uint16_t>(((frame[2] & 0x7F) << 8) | frame[3]);

        humidity = static_cast<float>(humidity_raw) / 10.0f;
        temperature = static_cast<float>(temperature_raw) / 10.0f;
        // A set sign bit on a zero magnitude is still 0.0, not -0.0
        if ((frame[2] & 0x80) != 0 && temperature_raw != 0) {
            temperature = -temperature;
        }

        return humidity >= DhtDecoder::humidity_min_pct && humidity <= DhtDecoder::humidity_max_pct &&
               temperature >= DhtDecoder::temperature_min_c && temperature <= DhtDecoder::temperature_max_c;
    }

    bool convertDht11(const uint8_t (&frame)[DhtDecoder::kFrameBytes], float& humidity, float& temperature) {
        // DHT11 range is 20-80 %RH / 0-50 C; accept a little slack either side
        if (frame[1] != 0 || frame[3] != 0) {
            return false;
        }
        if (frame[2] > 60 || frame[0] < 9 || frame[0] > 90) {
            return false;
        }
        humidity = static_cast<float>(frame[0]);
        temperature = static_cast<float>(frame[2]);
        return true;
    }
}

uint32_t triggerLowUs(SensorModel model) {
    // AUTO must wake a DHT11 too, so it pays the long start pulse
    if (model == SensorModel::DHT22) {
        return Config::Hardware::Dht::trigger_low_dht22_us;
    }
    return Config::Hardware::Dht::trigger_low_dht11_us;
}

namespace DhtDecoder {
    SensorStatus extractFrame(const CaptureWindow& window, const DecoderSettings& settings,
                              uint8_t (&frame)[kFrameBytes]) {
        for (int b = 0; b < kFrameBytes; ++b) {
            frame[b] = 0;
        }

        // Anything before the first falling edge is the host releasing the line
        std::size_t i = 0;
        while (i < window.count && window.edges[i].level) {
            ++i;
        }

        // Response: sensor pulls low, releases high, then pulls low for bit 0
        if (window.count - i < 3) {
            return SensorStatus::RESPONSE_MISSING;
        }
        const Edge& response_low = window.edges[i];
        const Edge& response_high = window.edges[i + 1];
        const Edge& first_bit_low = window.edges[i + 2];
        if (!response_high.level || first_bit_low.level) {
            return SensorStatus::RESPONSE_MISSING;
        }
        if (!withinResponseWindow(response_high.timestamp_us - response_low.timestamp_us, settings) ||
            !withinResponseWindow(first_bit_low.timestamp_us - response_high.timestamp_us, settings)) {
            return SensorStatus::RESPONSE_MISSING;
        }
        i += 3;

        // Each bit: rising edge, high pulse, falling edge
        int bits = 0;
        while (bits < kFrameBits && i + 1 < window.count) {
            const Edge& rise = window.edges[i];
            const Edge& fall = window.edges[i + 1];
            if (!rise.level || fall.level) {
                break;
            }
            const int64_t high_us = fall.timestamp_us - rise.timestamp_us;
            if (high_us < 0) {
                break;
            }
            const uint8_t bit = (high_us >= static_cast<int64_t>(settings.bit_one_threshold_us)) ? 1 : 0;
            frame[bits / 8] = static_cast<uint8_t>((frame[bits / 8] << 1) | bit);
            ++bits;
            i += 2;
        }

        if (bits < kFrameBits) {
            return SensorStatus::INCOMPLETE_FRAME;
        }
        return SensorStatus::OK;
    }

    SensorStatus decodeFrame(const uint8_t (&frame)[kFrameBytes], SensorModel model, Reading& out) {
        if (checksum(frame) != frame[4]) {
            return SensorStatus::CHECKSUM_ERROR;
        }

        float humidity = 0.0f;
        float temperature = 0.0f;
        bool valid = false;
        switch (model) {
            case SensorModel::DHT22:
                valid = convertDht22(frame, humidity, temperature);
                break;
            case SensorModel::DHT11:
                valid = convertDht11(frame, humidity, temperature);
                break;
            case SensorModel::AUTO:
                valid = convertDht22(frame, humidity, temperature);
                if (!valid) {
                    valid = convertDht11(frame, humidity, temperature);
                }
                break;
        }
        if (!valid) {
            return SensorStatus::OUT_OF_RANGE;
        }

        out.humidity_pct = humidity;
        out.temperature_c = temperature;
        return SensorStatus::OK;
    }

    SensorStatus decode(const CaptureWindow& window, const DecoderSettings& settings, Reading& out) {
        uint8_t frame[kFrameBytes];
        SensorStatus status = extractFrame(window, settings, frame);
        if (status != SensorStatus::OK) {
            return status;
        }
        return decodeFrame(frame, settings.model, out);
    }
}

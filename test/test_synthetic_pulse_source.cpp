/// @file test_synthetic_pulse_source.cpp
/// @brief Unit tests for the dummy-mode pulse source

#include <unity.h>

#include <dhtexpo/hardware/synthetic_pulse_source.hpp>
#include <dhtexpo/protocol/dht_decoder.hpp>

// ============================================================================
// Test Helpers
// ============================================================================

void setUp() {}

void tearDown() {}

// ============================================================================
// Tests
// ============================================================================

void test_captures_decode_within_dummy_range() {
  SyntheticPulseSource source(42);
  DecoderSettings settings;
  CaptureWindow window;

  for (int i = 0; i < 1000; ++i) {
    TEST_ASSERT_EQUAL(SensorStatus::OK, source.capture(1100, 1000, window));
    TEST_ASSERT_EQUAL_UINT(85, window.count);
    TEST_ASSERT_EQUAL_UINT(0, window.overflow);

    Reading r{};
    TEST_ASSERT_EQUAL(SensorStatus::OK, DhtDecoder::decode(window, settings, r));
    TEST_ASSERT_TRUE(r.humidity_pct >= 15.0f && r.humidity_pct <= 30.0f);
    TEST_ASSERT_TRUE(r.temperature_c >= 15.0f && r.temperature_c <= 30.0f);
  }
}

void test_timestamps_strictly_increase_across_captures() {
  SyntheticPulseSource source(7);
  CaptureWindow window;

  int64_t last = -1;
  for (int i = 0; i < 10; ++i) {
    TEST_ASSERT_EQUAL(SensorStatus::OK, source.capture(1100, 1000, window));
    for (std::size_t e = 0; e < window.count; ++e) {
      TEST_ASSERT_TRUE(window.edges[e].timestamp_us > last);
      last = window.edges[e].timestamp_us;
    }
  }
}

void test_same_seed_same_readings() {
  SyntheticPulseSource a(99);
  SyntheticPulseSource b(99);
  DecoderSettings settings;
  CaptureWindow wa;
  CaptureWindow wb;

  for (int i = 0; i < 20; ++i) {
    (void)a.capture(1100, 1000, wa);
    (void)b.capture(1100, 1000, wb);
    Reading ra{};
    Reading rb{};
    TEST_ASSERT_EQUAL(SensorStatus::OK, DhtDecoder::decode(wa, settings, ra));
    TEST_ASSERT_EQUAL(SensorStatus::OK, DhtDecoder::decode(wb, settings, rb));
    TEST_ASSERT_EQUAL_FLOAT(ra.humidity_pct, rb.humidity_pct);
    TEST_ASSERT_EQUAL_FLOAT(ra.temperature_c, rb.temperature_c);
  }
}

void test_build_frame_positive() {
  uint8_t frame[5];
  SyntheticPulseSource::buildFrame(500, 260, frame);
  TEST_ASSERT_EQUAL_HEX8(0x01, frame[0]);
  TEST_ASSERT_EQUAL_HEX8(0xF4, frame[1]);
  TEST_ASSERT_EQUAL_HEX8(0x01, frame[2]);
  TEST_ASSERT_EQUAL_HEX8(0x04, frame[3]);
  TEST_ASSERT_EQUAL_HEX8(DhtDecoder::checksum(frame), frame[4]);
}

void test_build_frame_negative_temperature_sets_sign_bit() {
  uint8_t frame[5];
  SyntheticPulseSource::buildFrame(400, -101, frame);
  TEST_ASSERT_EQUAL_HEX8(0x80, frame[2]);
  TEST_ASSERT_EQUAL_HEX8(0x65, frame[3]);

  Reading r{};
  TEST_ASSERT_EQUAL(SensorStatus::OK, DhtDecoder::decodeFrame(frame, SensorModel::DHT22, r));
  TEST_ASSERT_FLOAT_WITHIN(0.001f, 40.0f, r.humidity_pct);
  TEST_ASSERT_FLOAT_WITHIN(0.001f, -10.1f, r.temperature_c);
}

void test_zero_seed_is_usable() {
  SyntheticPulseSource source(0);
  CaptureWindow window;
  Reading r{};
  TEST_ASSERT_EQUAL(SensorStatus::OK, source.capture(1100, 1000, window));
  TEST_ASSERT_EQUAL(SensorStatus::OK, DhtDecoder::decode(window, DecoderSettings(), r));
}

// ============================================================================
// Main
// ============================================================================

int main(int argc, char** argv) {
  (void)argc;
  (void)argv;
  UNITY_BEGIN();
  RUN_TEST(test_captures_decode_within_dummy_range);
  RUN_TEST(test_timestamps_strictly_increase_across_captures);
  RUN_TEST(test_same_seed_same_readings);
  RUN_TEST(test_build_frame_positive);
  RUN_TEST(test_build_frame_negative_temperature_sets_sign_bit);
  RUN_TEST(test_zero_seed_is_usable);
  return UNITY_END();
}

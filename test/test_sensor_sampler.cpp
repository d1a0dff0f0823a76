/// @file test_sensor_sampler.cpp
/// @brief Unit tests for the sample cycle and its publish/failure policy

#include <unity.h>

#include <dhtexpo/sensor/sensor_sampler.hpp>
#include "capture_fixtures.hpp"

using Fixtures::ScriptedPulseSource;
using Fixtures::windowFor;

// ============================================================================
// Test Helpers
// ============================================================================

static uint32_t gNow = 0;

static uint32_t fakeClock() {
  return gNow;
}

void setUp() {
  gNow = 1700000000;
}

void tearDown() {}

static const uint8_t kGoodFrame[5] = {0x32, 0x00, 0x01, 0x04, 0x37};   // 50.0 %RH, 26.0 C
static const uint8_t kOtherFrame[5] = {0x01, 0x90, 0x80, 0x65, 0x76};  // 40.0 %RH, -10.1 C
static const uint8_t kBadChecksum[5] = {0x19, 0x00, 0x80, 0x65, 0xDE};

// ============================================================================
// Tests
// ============================================================================

void test_success_publishes_reading() {
  ScriptedPulseSource source;
  source.add(SensorStatus::OK, windowFor(kGoodFrame));
  MetricsStore store;
  SensorSampler sampler(source, store, SamplerSettings(), &fakeClock);

  TEST_ASSERT_EQUAL(SensorStatus::OK, sampler.sample());

  MetricsSnapshot snap = store.snapshot();
  TEST_ASSERT_TRUE(snap.has(MetricField::HUMIDITY));
  TEST_ASSERT_FLOAT_WITHIN(0.001, 50.0, snap.value(MetricField::HUMIDITY));
  TEST_ASSERT_FLOAT_WITHIN(0.001, 26.0, snap.value(MetricField::TEMPERATURE));
  TEST_ASSERT_EQUAL_UINT32(1700000000, static_cast<uint32_t>(snap.value(MetricField::LAST_SUCCESS_TIMESTAMP)));
  TEST_ASSERT_FLOAT_WITHIN(0.001, 0.0, snap.value(MetricField::READ_ERRORS_TOTAL));

  TEST_ASSERT_TRUE(sampler.hasReading());
  TEST_ASSERT_EQUAL_UINT32(1700000000, sampler.lastGoodReading().timestamp_s);
  TEST_ASSERT_EQUAL_UINT32(0, sampler.consecutiveFailures());
}

void test_failure_counts_error_and_keeps_last_reading() {
  ScriptedPulseSource source;
  source.add(SensorStatus::OK, windowFor(kGoodFrame));
  source.add(SensorStatus::OK, windowFor(kBadChecksum));
  MetricsStore store;
  SensorSampler sampler(source, store, SamplerSettings(), &fakeClock);

  TEST_ASSERT_EQUAL(SensorStatus::OK, sampler.sample());
  gNow += 10;
  TEST_ASSERT_EQUAL(SensorStatus::CHECKSUM_ERROR, sampler.sample());

  MetricsSnapshot snap = store.snapshot();
  TEST_ASSERT_FLOAT_WITHIN(0.001, 1.0, snap.value(MetricField::READ_ERRORS_TOTAL));
  TEST_ASSERT_FLOAT_WITHIN(0.001, 50.0, snap.value(MetricField::HUMIDITY));
  TEST_ASSERT_FLOAT_WITHIN(0.001, 26.0, snap.value(MetricField::TEMPERATURE));
  // Timestamp still points at the last success
  TEST_ASSERT_EQUAL_UINT32(1700000000, static_cast<uint32_t>(snap.value(MetricField::LAST_SUCCESS_TIMESTAMP)));

  TEST_ASSERT_TRUE(sampler.hasReading());
  TEST_ASSERT_FLOAT_WITHIN(0.001f, 50.0f, sampler.lastGoodReading().humidity_pct);
  TEST_ASSERT_EQUAL_UINT32(1, sampler.consecutiveFailures());
}

void test_failure_before_any_success_publishes_only_the_counter() {
  ScriptedPulseSource source;
  source.add(SensorStatus::OK, CaptureWindow());
  MetricsStore store;
  SensorSampler sampler(source, store, SamplerSettings(), &fakeClock);

  TEST_ASSERT_EQUAL(SensorStatus::RESPONSE_MISSING, sampler.sample());

  MetricsSnapshot snap = store.snapshot();
  TEST_ASSERT_FALSE(snap.has(MetricField::HUMIDITY));
  TEST_ASSERT_FALSE(snap.has(MetricField::TEMPERATURE));
  TEST_ASSERT_FALSE(snap.has(MetricField::LAST_SUCCESS_TIMESTAMP));
  TEST_ASSERT_FLOAT_WITHIN(0.001, 1.0, snap.value(MetricField::READ_ERRORS_TOTAL));
  TEST_ASSERT_FALSE(sampler.hasReading());
}

void test_unknown_wall_time_leaves_timestamp_unpublished() {
  ScriptedPulseSource source;
  source.add(SensorStatus::OK, windowFor(kGoodFrame));
  source.add(SensorStatus::OK, windowFor(kOtherFrame));
  MetricsStore store;
  SensorSampler sampler(source, store, SamplerSettings(), &fakeClock);

  // Clock not set yet
  gNow = 0;
  TEST_ASSERT_EQUAL(SensorStatus::OK, sampler.sample());
  MetricsSnapshot snap = store.snapshot();
  TEST_ASSERT_TRUE(snap.has(MetricField::HUMIDITY));
  TEST_ASSERT_FLOAT_WITHIN(0.001, 26.0, snap.value(MetricField::TEMPERATURE));
  TEST_ASSERT_FALSE(snap.has(MetricField::LAST_SUCCESS_TIMESTAMP));

  gNow = 1700000020;
  TEST_ASSERT_EQUAL(SensorStatus::OK, sampler.sample());
  snap = store.snapshot();
  TEST_ASSERT_TRUE(snap.has(MetricField::LAST_SUCCESS_TIMESTAMP));
  TEST_ASSERT_EQUAL_UINT32(1700000020, static_cast<uint32_t>(snap.value(MetricField::LAST_SUCCESS_TIMESTAMP)));
}

void test_hardware_failure_handled_like_decode_failure() {
  ScriptedPulseSource source;
  source.add(SensorStatus::HARDWARE_UNAVAILABLE);
  source.add(SensorStatus::HARDWARE_UNAVAILABLE);
  source.add(SensorStatus::OK, windowFor(kGoodFrame));
  MetricsStore store;
  SensorSampler sampler(source, store, SamplerSettings(), &fakeClock);

  TEST_ASSERT_EQUAL(SensorStatus::HARDWARE_UNAVAILABLE, sampler.sample());
  TEST_ASSERT_EQUAL(SensorStatus::HARDWARE_UNAVAILABLE, sampler.sample());
  TEST_ASSERT_EQUAL_UINT32(2, sampler.consecutiveFailures());
  TEST_ASSERT_FLOAT_WITHIN(0.001, 2.0, store.snapshot().value(MetricField::READ_ERRORS_TOTAL));

  // Keeps trying; the next good read clears the streak
  TEST_ASSERT_EQUAL(SensorStatus::OK, sampler.sample());
  TEST_ASSERT_EQUAL_UINT32(0, sampler.consecutiveFailures());
  TEST_ASSERT_FLOAT_WITHIN(0.001, 2.0, store.snapshot().value(MetricField::READ_ERRORS_TOTAL));
}

void test_one_capture_per_sample_even_on_failure() {
  ScriptedPulseSource source;
  source.add(SensorStatus::OK, windowFor(kBadChecksum));
  source.add(SensorStatus::OK, windowFor(kGoodFrame));
  MetricsStore store;
  SensorSampler sampler(source, store, SamplerSettings(), &fakeClock);

  TEST_ASSERT_EQUAL(SensorStatus::CHECKSUM_ERROR, sampler.sample());
  TEST_ASSERT_EQUAL_UINT(1, source.calls);
  TEST_ASSERT_EQUAL(SensorStatus::OK, sampler.sample());
  TEST_ASSERT_EQUAL_UINT(2, source.calls);
}

void test_new_success_replaces_published_values() {
  ScriptedPulseSource source;
  source.add(SensorStatus::OK, windowFor(kGoodFrame));
  source.add(SensorStatus::OK, windowFor(kOtherFrame));
  MetricsStore store;
  SensorSampler sampler(source, store, SamplerSettings(), &fakeClock);

  TEST_ASSERT_EQUAL(SensorStatus::OK, sampler.sample());
  gNow += 10;
  TEST_ASSERT_EQUAL(SensorStatus::OK, sampler.sample());

  MetricsSnapshot snap = store.snapshot();
  TEST_ASSERT_FLOAT_WITHIN(0.001, 40.0, snap.value(MetricField::HUMIDITY));
  TEST_ASSERT_FLOAT_WITHIN(0.001, -10.1, snap.value(MetricField::TEMPERATURE));
  TEST_ASSERT_EQUAL_UINT32(1700000010, static_cast<uint32_t>(snap.value(MetricField::LAST_SUCCESS_TIMESTAMP)));
  TEST_ASSERT_FLOAT_WITHIN(0.001, 0.0, snap.value(MetricField::READ_ERRORS_TOTAL));
}

void test_capture_gets_configured_timing() {
  ScriptedPulseSource source;
  source.add(SensorStatus::OK, windowFor(kGoodFrame));
  MetricsStore store;
  SamplerSettings settings;
  settings.trigger_low_us = 18000;
  settings.idle_timeout_us = 750;
  SensorSampler sampler(source, store, settings, &fakeClock);

  (void)sampler.sample();
  TEST_ASSERT_EQUAL_UINT32(18000, source.lastTriggerLowUs);
  TEST_ASSERT_EQUAL_UINT32(750, source.lastTimeoutUs);
}

void test_dummy_source_keeps_producing_valid_readings() {
  SyntheticPulseSource source(12345);
  MetricsStore store;
  SensorSampler sampler(source, store, SamplerSettings(), &fakeClock);

  for (int i = 0; i < 500; ++i) {
    gNow += 10;
    TEST_ASSERT_EQUAL(SensorStatus::OK, sampler.sample());
    const Reading& r = sampler.lastGoodReading();
    TEST_ASSERT_TRUE(r.humidity_pct >= 15.0f && r.humidity_pct <= 30.0f);
    TEST_ASSERT_TRUE(r.temperature_c >= 15.0f && r.temperature_c <= 30.0f);
  }
  MetricsSnapshot snap = store.snapshot();
  TEST_ASSERT_FLOAT_WITHIN(0.001, 0.0, snap.value(MetricField::READ_ERRORS_TOTAL));
  TEST_ASSERT_EQUAL_UINT32(gNow, static_cast<uint32_t>(snap.value(MetricField::LAST_SUCCESS_TIMESTAMP)));
}

// ============================================================================
// Main
// ============================================================================

int main(int argc, char** argv) {
  (void)argc;
  (void)argv;
  UNITY_BEGIN();
  RUN_TEST(test_success_publishes_reading);
  RUN_TEST(test_failure_counts_error_and_keeps_last_reading);
  RUN_TEST(test_failure_before_any_success_publishes_only_the_counter);
  RUN_TEST(test_unknown_wall_time_leaves_timestamp_unpublished);
  RUN_TEST(test_hardware_failure_handled_like_decode_failure);
  RUN_TEST(test_one_capture_per_sample_even_on_failure);
  RUN_TEST(test_new_success_replaces_published_values);
  RUN_TEST(test_capture_gets_configured_timing);
  RUN_TEST(test_dummy_source_keeps_producing_valid_readings);
  return UNITY_END();
}

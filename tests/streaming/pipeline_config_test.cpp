/// @file pipeline_config_test.cpp
/// @brief Tests for PipelineConfig and StreamConfig.

#include "streaming/pipeline_config.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <limits>

#include "streaming/stream_config.h"
#include "util/exception.h"

using namespace cadenza;
using Catch::Matchers::ContainsSubstring;
using Catch::Matchers::WithinRel;

TEST_CASE("PipelineConfig defaults", "[streaming][config]") {
  PipelineConfig config;
  REQUIRE(config.sensitivity == 5.0f);
  REQUIRE(config.skip_bins == 4);
  REQUIRE(config.activity_threshold == 0.1f);
  REQUIRE(config.decay_factor == 0.8f);
  REQUIRE(config.low_cut == 10);
  REQUIRE(config.high_cut == 500);
  REQUIRE(config.tuning_ref_hz == 440.0f);
  REQUIRE(config.music_threshold == 0.5f);
  REQUIRE_NOTHROW(config.validate());
}

TEST_CASE("PipelineConfig validate", "[streaming][config]") {
  PipelineConfig config;

  SECTION("sensitivity") {
    config.sensitivity = 0.0f;
    REQUIRE_THROWS_WITH(config.validate(), ContainsSubstring("sensitivity"));
    config.sensitivity = std::numeric_limits<float>::infinity();
    REQUIRE_THROWS_AS(config.validate(), CadenzaException);
  }

  SECTION("skip_bins") {
    config.skip_bins = -1;
    REQUIRE_THROWS_WITH(config.validate(), ContainsSubstring("skip_bins"));
  }

  SECTION("activity_threshold") {
    config.activity_threshold = -0.1f;
    REQUIRE_THROWS_WITH(config.validate(), ContainsSubstring("activity_threshold"));
  }

  SECTION("decay_factor") {
    config.decay_factor = 1.01f;
    REQUIRE_THROWS_WITH(config.validate(), ContainsSubstring("decay_factor"));
    config.decay_factor = 0.0f;
    REQUIRE_NOTHROW(config.validate());
  }

  SECTION("band") {
    config.low_cut = -1;
    REQUIRE_THROWS_WITH(config.validate(), ContainsSubstring("low_cut"));
    config.low_cut = 600;
    REQUIRE_THROWS_WITH(config.validate(), ContainsSubstring("high_cut"));
    config.high_cut = 600;
    REQUIRE_NOTHROW(config.validate());
  }

  SECTION("tuning") {
    config.tuning_ref_hz = 0.0f;
    REQUIRE_THROWS_WITH(config.validate(), ContainsSubstring("tuning_ref_hz"));
  }

  SECTION("music_threshold") {
    config.music_threshold = -1.0f;
    REQUIRE_THROWS_WITH(config.validate(), ContainsSubstring("music_threshold"));
  }
}

TEST_CASE("PipelineConfig to_reducer_config", "[streaming][config]") {
  PipelineConfig config;
  config.activity_threshold = 0.2f;
  config.decay_factor = 0.5f;
  config.low_cut = 12;
  config.high_cut = 300;
  config.tuning_ref_hz = 442.0f;

  ChromaReducerConfig reducer = config.to_reducer_config();
  REQUIRE(reducer.activity_threshold == 0.2f);
  REQUIRE(reducer.decay_factor == 0.5f);
  REQUIRE(reducer.low_cut == 12);
  REQUIRE(reducer.high_cut == 300);
  REQUIRE(reducer.tuning_ref_hz == 442.0f);
}

TEST_CASE("clamp_sensitivity", "[streaming][config]") {
  REQUIRE(clamp_sensitivity(0.2f) == kMinSensitivity);
  REQUIRE(clamp_sensitivity(5.0f) == 5.0f);
  REQUIRE(clamp_sensitivity(100.0f) == kMaxSensitivity);
  REQUIRE(kMinSensitivity == 1.0f);
  REQUIRE(kMaxSensitivity == 20.0f);
}

TEST_CASE("StreamConfig helpers", "[streaming][config]") {
  StreamConfig config;
  config.sample_rate = 44100;
  config.n_bins = 1024;
  config.hop_length = 512;

  SECTION("n_fft") { REQUIRE(config.n_fft() == 2048); }

  SECTION("frame_duration") {
    REQUIRE_THAT(config.frame_duration(), WithinRel(512.0f / 44100.0f, 0.001f));
  }

  SECTION("bin_resolution") {
    REQUIRE_THAT(config.bin_resolution(), WithinRel(21.5332f, 0.0001f));
  }

  SECTION("to_tap_config") {
    config.window = WindowType::Blackman;
    TapConfig tap = config.to_tap_config();
    REQUIRE(tap.n_bins == 1024);
    REQUIRE(tap.hop_length == 512);
    REQUIRE(tap.window == WindowType::Blackman);
  }
}

TEST_CASE("StreamConfig validate", "[streaming][config]") {
  StreamConfig config;
  REQUIRE_NOTHROW(config.validate());

  SECTION("non-positive n_bins") {
    config.n_bins = -8;
    REQUIRE_THROWS_WITH(config.validate(), ContainsSubstring("n_bins"));
    config.n_bins = 0;
    REQUIRE_THROWS_AS(config.validate(), CadenzaException);
  }

  SECTION("hop length outside one FFT frame") {
    config.hop_length = 0;
    REQUIRE_THROWS_WITH(config.validate(), ContainsSubstring("hop_length"));
    config.hop_length = 2 * config.n_bins + 1;
    REQUIRE_THROWS_AS(config.validate(), CadenzaException);
  }

  SECTION("sample rate and throttle") {
    config.sample_rate = 0;
    REQUIRE_THROWS_AS(config.validate(), CadenzaException);
    config.sample_rate = 44100;
    config.emit_every_n_frames = 0;
    REQUIRE_THROWS_AS(config.validate(), CadenzaException);
  }

  SECTION("nested pipeline policy") {
    config.pipeline.decay_factor = 1.5f;
    REQUIRE_THROWS_WITH(config.validate(), ContainsSubstring("decay_factor"));
  }
}

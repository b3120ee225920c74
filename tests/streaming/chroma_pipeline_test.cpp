/// @file chroma_pipeline_test.cpp
/// @brief Tests for ChromaPipeline.

#include "streaming/chroma_pipeline.h"

#include <atomic>
#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <cmath>
#include <limits>
#include <thread>
#include <vector>

#include "util/exception.h"

using namespace cadenza;
using Catch::Matchers::WithinAbs;

namespace {

constexpr float kSampleRate = 44100.0f;
constexpr size_t kBins = 1024;

std::vector<float> impulse_frame(size_t bin, float value) {
  std::vector<float> mags(kBins, 0.0f);
  mags[bin] = value;
  return mags;
}

}  // namespace

TEST_CASE("ChromaPipeline construction", "[streaming][pipeline]") {
  SECTION("defaults") {
    ChromaPipeline pipeline(PipelineConfig(), kSampleRate);
    REQUIRE(pipeline.sensitivity() == 5.0f);
    REQUIRE(pipeline.sample_rate() == kSampleRate);
    REQUIRE(pipeline.n_bins() == 0);
    REQUIRE(pipeline.frame_count() == 0);
    REQUIRE(pipeline.snapshot()->activity == ActivityLevel::Stopped);
  }

  SECTION("invalid sample rate") {
    REQUIRE_THROWS_AS(ChromaPipeline(PipelineConfig(), 0.0f), CadenzaException);
    REQUIRE_THROWS_AS(ChromaPipeline(PipelineConfig(), -44100.0f), CadenzaException);
  }

  SECTION("invalid configuration") {
    PipelineConfig config;
    config.decay_factor = 2.0f;
    REQUIRE_THROWS_AS(ChromaPipeline(config, kSampleRate), CadenzaException);
  }
}

TEST_CASE("ChromaPipeline scenario: single bin at 4306 Hz", "[streaming][pipeline]") {
  ChromaPipeline pipeline(PipelineConfig(), kSampleRate, kBins);
  auto mags = impulse_frame(200, 1.0f);

  ChromaSnapshot snapshot = pipeline.process(mags.data(), mags.size());

  REQUIRE(snapshot.frame_index == 0);
  REQUIRE(snapshot.loudness == 1.0f);
  REQUIRE(snapshot.raw_loudness == 5.0f);
  REQUIRE(snapshot.active);
  REQUIRE(snapshot.activity == ActivityLevel::HearingMusic);
  REQUIRE(snapshot.chroma[0] == 1.0f);
  for (int pc = 1; pc < kNumChroma; ++pc) {
    REQUIRE(snapshot.chroma[pc] == 0.0f);
  }

  auto latest = pipeline.snapshot();
  REQUIRE(latest->frame_index == 0);
  REQUIRE(latest->chroma == snapshot.chroma);
}

TEST_CASE("ChromaPipeline activity levels", "[streaming][pipeline]") {
  ChromaPipeline pipeline(PipelineConfig(), kSampleRate, kBins);

  SECTION("quiet input is listening, not active") {
    // raw = 0.01 * 5 = 0.05
    auto mags = impulse_frame(20, 0.01f);
    ChromaSnapshot s = pipeline.process(mags.data(), mags.size());
    REQUIRE_FALSE(s.active);
    REQUIRE(s.activity == ActivityLevel::Listening);
  }

  SECTION("moderate input is active but still listening") {
    // raw = 0.06 * 5 = 0.3
    auto mags = impulse_frame(20, 0.06f);
    ChromaSnapshot s = pipeline.process(mags.data(), mags.size());
    REQUIRE(s.active);
    REQUIRE(s.activity == ActivityLevel::Listening);
    REQUIRE(s.chroma[9] == 1.0f);
  }

  SECTION("loud input is hearing music") {
    // raw = 0.2 * 5 = 1.0
    auto mags = impulse_frame(20, 0.2f);
    ChromaSnapshot s = pipeline.process(mags.data(), mags.size());
    REQUIRE(s.activity == ActivityLevel::HearingMusic);
  }
}

TEST_CASE("ChromaPipeline decay across frames", "[streaming][pipeline]") {
  ChromaPipeline pipeline(PipelineConfig(), kSampleRate, kBins);
  auto tone = impulse_frame(20, 1.0f);
  std::vector<float> silence(kBins, 0.0f);

  pipeline.process(tone.data(), tone.size());
  ChromaSnapshot s1 = pipeline.process(silence.data(), silence.size());
  ChromaSnapshot s2 = pipeline.process(silence.data(), silence.size());

  REQUIRE(s1.frame_index == 1);
  REQUIRE(s2.frame_index == 2);
  REQUIRE_FALSE(s1.active);
  REQUIRE_THAT(s1.chroma[9], WithinAbs(0.8f, 1e-6f));
  REQUIRE_THAT(s2.chroma[9], WithinAbs(0.64f, 1e-6f));
  REQUIRE(s2.loudness == 0.0f);
}

TEST_CASE("ChromaPipeline frame length", "[streaming][pipeline]") {
  SECTION("learned from first frame") {
    ChromaPipeline pipeline(PipelineConfig(), kSampleRate);
    std::vector<float> mags(512, 0.0f);
    pipeline.process(mags.data(), mags.size());
    REQUIRE(pipeline.n_bins() == 512);

    std::vector<float> wrong(1024, 0.0f);
    REQUIRE_THROWS_AS(pipeline.process(wrong.data(), wrong.size()), CadenzaException);
  }

  SECTION("rejected frames leave state untouched") {
    ChromaPipeline pipeline(PipelineConfig(), kSampleRate, kBins);
    auto tone = impulse_frame(20, 1.0f);
    pipeline.process(tone.data(), tone.size());

    std::vector<float> wrong(100, 1.0f);
    REQUIRE_THROWS_AS(pipeline.process(wrong.data(), wrong.size()), CadenzaException);
    REQUIRE_THROWS_AS(pipeline.process(MagnitudeFrame()), CadenzaException);

    REQUIRE(pipeline.frame_count() == 1);
    REQUIRE(pipeline.snapshot()->frame_index == 0);
    REQUIRE(pipeline.snapshot()->chroma[9] == 1.0f);
  }
}

TEST_CASE("ChromaPipeline non-finite and extreme magnitudes", "[streaming][pipeline]") {
  ChromaPipeline pipeline(PipelineConfig(), kSampleRate, kBins);

  SECTION("non-finite frames are rejected before any state changes") {
    auto bad = impulse_frame(20, 1.0f);
    bad[200] = std::numeric_limits<float>::infinity();
    REQUIRE_THROWS_AS(pipeline.process(bad.data(), bad.size()), CadenzaException);
    bad[200] = std::numeric_limits<float>::quiet_NaN();
    REQUIRE_THROWS_AS(pipeline.process(bad.data(), bad.size()), CadenzaException);

    REQUIRE(pipeline.frame_count() == 0);
    REQUIRE(pipeline.snapshot()->activity == ActivityLevel::Stopped);

    std::vector<float> silence(kBins, 0.0f);
    for (int i = 0; i < 3; ++i) {
      ChromaSnapshot s = pipeline.process(silence.data(), silence.size());
      for (float v : s.chroma) {
        REQUIRE(v == 0.0f);
      }
    }
  }

  SECTION("finite magnitudes whose sum overflows float stay in range") {
    std::vector<float> loud(kBins, 0.0f);
    loud[10] = 3e38f;
    loud[20] = 3e38f;
    ChromaSnapshot s = pipeline.process(loud.data(), loud.size());

    REQUIRE(s.loudness == 1.0f);
    REQUIRE(s.chroma[9] == 1.0f);
    for (float v : s.chroma) {
      REQUIRE(std::isfinite(v));
    }

    std::vector<float> silence(kBins, 0.0f);
    ChromaSnapshot faded = pipeline.process(silence.data(), silence.size());
    REQUIRE_THAT(faded.chroma[9], WithinAbs(0.8f, 1e-6f));
  }
}

TEST_CASE("ChromaPipeline stop", "[streaming][pipeline]") {
  ChromaPipeline pipeline(PipelineConfig(), kSampleRate);
  auto tone = impulse_frame(20, 1.0f);
  pipeline.process(tone.data(), tone.size());
  REQUIRE(pipeline.n_bins() == kBins);

  pipeline.stop();

  auto latest = pipeline.snapshot();
  REQUIRE(latest->activity == ActivityLevel::Stopped);
  REQUIRE(latest->frame_index == -1);
  for (float v : latest->chroma) {
    REQUIRE(v == 0.0f);
  }
  REQUIRE(pipeline.frame_count() == 0);
  REQUIRE(pipeline.n_bins() == 0);

  SECTION("restart does not leak stale chroma") {
    std::vector<float> silence(512, 0.0f);
    ChromaSnapshot s = pipeline.process(silence.data(), silence.size());
    REQUIRE(s.frame_index == 0);
    for (float v : s.chroma) {
      REQUIRE(v == 0.0f);
    }
  }
}

TEST_CASE("ChromaPipeline sensitivity", "[streaming][pipeline]") {
  ChromaPipeline pipeline(PipelineConfig(), kSampleRate, kBins);
  auto mags = impulse_frame(20, 0.05f);

  ChromaSnapshot s5 = pipeline.process(mags.data(), mags.size());
  REQUIRE_THAT(s5.loudness, WithinAbs(0.25f, 1e-6f));

  pipeline.set_sensitivity(10.0f);
  REQUIRE(pipeline.sensitivity() == 10.0f);
  ChromaSnapshot s10 = pipeline.process(mags.data(), mags.size());
  REQUIRE_THAT(s10.loudness, WithinAbs(0.5f, 1e-6f));

  REQUIRE_THROWS_AS(pipeline.set_sensitivity(0.0f), CadenzaException);
  REQUIRE(pipeline.sensitivity() == 10.0f);
}

TEST_CASE("ChromaPipeline observers", "[streaming][pipeline]") {
  ChromaPipeline pipeline(PipelineConfig(), kSampleRate, kBins);
  std::vector<int> indices;
  std::vector<ActivityLevel> levels;
  auto id = pipeline.subscribe([&](const ChromaSnapshot& s) {
    indices.push_back(s.frame_index);
    levels.push_back(s.activity);
  });

  auto tone = impulse_frame(20, 1.0f);
  pipeline.process(tone.data(), tone.size());
  pipeline.process(tone.data(), tone.size());
  pipeline.stop();

  REQUIRE(indices == std::vector<int>{0, 1, -1});
  REQUIRE(levels.back() == ActivityLevel::Stopped);

  REQUIRE(pipeline.unsubscribe(id));
  pipeline.process(tone.data(), tone.size());
  REQUIRE(indices.size() == 3);
}

TEST_CASE("ChromaPipeline concurrent snapshot readers", "[streaming][pipeline]") {
  ChromaPipeline pipeline(PipelineConfig(), kSampleRate, kBins);
  std::atomic<bool> done{false};
  std::atomic<int> out_of_range{0};

  std::thread reader([&] {
    int last_index = -1;
    while (!done.load()) {
      auto s = pipeline.snapshot();
      for (float v : s->chroma) {
        if (v < 0.0f || v > 1.0f) ++out_of_range;
      }
      // Frames are published in arrival order
      if (s->frame_index < last_index) ++out_of_range;
      last_index = s->frame_index;
    }
  });

  std::thread controller([&] {
    for (int i = 0; i < 1000 && !done.load(); ++i) {
      pipeline.set_sensitivity(1.0f + static_cast<float>(i % 20));
    }
  });

  for (int i = 0; i < 2000; ++i) {
    auto mags = impulse_frame(10 + static_cast<size_t>(i % 400), 0.5f);
    pipeline.process(mags.data(), mags.size());
  }
  done = true;
  reader.join();
  controller.join();

  REQUIRE(out_of_range.load() == 0);
  REQUIRE(pipeline.frame_count() == 2000);
}

/// @file reference_sequence_test.cpp
/// @brief Tests for ReferenceSequence.

#include "reference/reference_sequence.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <cstdio>
#include <fstream>
#include <string>

#include "util/exception.h"

using namespace cadenza;
using Catch::Matchers::ContainsSubstring;
using Catch::Matchers::WithinAbs;

namespace {

const char* kTwoFrames =
    "[[1, 0, 0, 0, 0, 0, 0, 0, 0, 0.5, 0, 0],\n"
    " [0.25, 0, 0, 0, 0, 0, 0, 0, 0, 1.0, 0, 0]]";

ErrorCode parse_error(const std::string& json) {
  try {
    ReferenceSequence::parse(json);
  } catch (const CadenzaException& e) {
    return e.code();
  }
  return ErrorCode::Ok;
}

}  // namespace

TEST_CASE("ReferenceSequence parse", "[reference]") {
  ReferenceSequence sequence = ReferenceSequence::parse(kTwoFrames);

  REQUIRE(sequence.size() == 2);
  REQUIRE_FALSE(sequence.empty());
  REQUIRE(sequence.frame(0)[0] == 1.0f);
  REQUIRE(sequence.frame(0)[9] == 0.5f);
  REQUIRE(sequence.frame(1)[0] == 0.25f);
  REQUIRE(sequence.frame(1)[9] == 1.0f);

  SECTION("out-of-range frame index") {
    REQUIRE_THROWS_AS(sequence.frame(2), CadenzaException);
  }
}

TEST_CASE("ReferenceSequence parse edge cases", "[reference]") {
  SECTION("empty sequence") {
    REQUIRE(ReferenceSequence::parse("[]").empty());
    REQUIRE(ReferenceSequence::parse("  [ ]\n").empty());
  }

  SECTION("exponent notation") {
    auto sequence = ReferenceSequence::parse("[[1e-3,0,0,0,0,0,0,0,0,0,0,2.5E-1]]");
    REQUIRE_THAT(sequence.frame(0)[0], WithinAbs(0.001f, 1e-7f));
    REQUIRE_THAT(sequence.frame(0)[11], WithinAbs(0.25f, 1e-7f));
  }

  SECTION("float noise above 1 is clamped") {
    auto sequence = ReferenceSequence::parse("[[1.0000001,0,0,0,0,0,0,0,0,0,0,0]]");
    REQUIRE(sequence.frame(0)[0] == 1.0f);
  }
}

TEST_CASE("ReferenceSequence rejects malformed data", "[reference]") {
  REQUIRE(parse_error("") == ErrorCode::InvalidFormat);
  REQUIRE(parse_error("{}") == ErrorCode::InvalidFormat);
  REQUIRE(parse_error("[[0,0,0]]") == ErrorCode::InvalidFormat);
  REQUIRE(parse_error("[[0,0,0,0,0,0,0,0,0,0,0,0,0]]") == ErrorCode::InvalidFormat);
  REQUIRE(parse_error("[[0,0,0,0,0,0,0,0,0,0,0,\"a\"]]") == ErrorCode::InvalidFormat);
  REQUIRE(parse_error("[[0,0,0,0,0,0,0,0,0,0,0,-0.5]]") == ErrorCode::InvalidFormat);
  REQUIRE(parse_error("[[0,0,0,0,0,0,0,0,0,0,0,1.5]]") == ErrorCode::InvalidFormat);
  REQUIRE(parse_error("[[0,0,0,0,0,0,0,0,0,0,0,0]") == ErrorCode::InvalidFormat);
  REQUIRE(parse_error("[[0,0,0,0,0,0,0,0,0,0,0,0]] trailing") == ErrorCode::InvalidFormat);

  SECTION("numbers outside the JSON grammar") {
    const char* tails[] = {"0x1", "01", "1.", ".5", "+1", "1e", "1e+", "-", "inf", "nan"};
    for (const char* tail : tails) {
      std::string json = std::string("[[0,0,0,0,0,0,0,0,0,0,0,") + tail + "]]";
      INFO(json);
      REQUIRE(parse_error(json) == ErrorCode::InvalidFormat);
    }
    REQUIRE_THROWS_WITH(ReferenceSequence::parse("[[01,0,0,0,0,0,0,0,0,0,0,0]]"),
                        ContainsSubstring("leading zeros"));
  }

  SECTION("valid JSON number forms") {
    auto sequence = ReferenceSequence::parse("[[0,-0,0.5,1,1.0,5e-1,5E-1,0.05e+1,0,0,0,0]]");
    REQUIRE(sequence.frame(0)[1] == 0.0f);
    REQUIRE(sequence.frame(0)[2] == 0.5f);
    REQUIRE(sequence.frame(0)[4] == 1.0f);
    REQUIRE(sequence.frame(0)[5] == 0.5f);
    REQUIRE(sequence.frame(0)[6] == 0.5f);
    REQUIRE_THAT(sequence.frame(0)[7], WithinAbs(0.5f, 1e-7f));
  }

  SECTION("messages name the problem") {
    REQUIRE_THROWS_WITH(ReferenceSequence::parse("[[0,0,0]]"),
                        ContainsSubstring("has 3 values, expected 12"));
    REQUIRE_THROWS_WITH(ReferenceSequence::parse("[[0,0,0,0,0,0,0,0,0,0,0,0] x"),
                        ContainsSubstring("offset"));
  }
}

TEST_CASE("ReferenceSequence append and construct", "[reference]") {
  ChromaVector frame{};
  frame[4] = 0.75f;

  ReferenceSequence sequence;
  sequence.append(frame);
  REQUIRE(sequence.size() == 1);
  REQUIRE(sequence.frame(0)[4] == 0.75f);

  ChromaVector bad{};
  bad[0] = 2.0f;
  REQUIRE_THROWS_AS(sequence.append(bad), CadenzaException);
  REQUIRE(sequence.size() == 1);

  REQUIRE_THROWS_AS(ReferenceSequence({frame, bad}), CadenzaException);
}

TEST_CASE("ReferenceSequence mean", "[reference]") {
  ReferenceSequence sequence = ReferenceSequence::parse(kTwoFrames);
  ChromaVector mean = sequence.mean();

  REQUIRE_THAT(mean[0], WithinAbs(0.625f, 1e-6f));
  REQUIRE_THAT(mean[9], WithinAbs(0.75f, 1e-6f));
  REQUIRE(mean[5] == 0.0f);

  ChromaVector empty_mean = ReferenceSequence().mean();
  for (float v : empty_mean) {
    REQUIRE(v == 0.0f);
  }
}

TEST_CASE("ReferenceSequence save / load", "[reference]") {
  const std::string path = "/tmp/cadenza_reference_test.json";
  ReferenceSequence original = ReferenceSequence::parse(kTwoFrames);

  original.save(path);
  ReferenceSequence loaded = ReferenceSequence::load(path);

  REQUIRE(loaded.size() == original.size());
  for (size_t i = 0; i < loaded.size(); ++i) {
    REQUIRE(loaded.frame(i) == original.frame(i));
  }
  std::remove(path.c_str());

  SECTION("missing file") {
    try {
      ReferenceSequence::load("/nonexistent/cadenza/reference.json");
      FAIL("expected CadenzaException");
    } catch (const CadenzaException& e) {
      REQUIRE(e.code() == ErrorCode::FileNotFound);
    }
  }
}

TEST_CASE("ReferenceSequence to_json", "[reference]") {
  ChromaVector frame{};
  frame[0] = 1.0f;
  ReferenceSequence sequence({frame});

  std::string json = sequence.to_json();
  REQUIRE(json == "[[1, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0]]\n");
  REQUIRE(ReferenceSequence().to_json() == "[]\n");
}

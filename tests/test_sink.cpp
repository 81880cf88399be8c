/**
 * @file test_sink.cpp
 * @brief Tests for sink.hpp: FileSink and VectorSink.
 */

#include "farm/sink.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstdio>
#include <cstdlib>
#include <string>
#include <vector>

namespace {

std::vector<double> ReadValues(const char* path) {
  std::vector<double> out;
  FILE* f = std::fopen(path, "r");
  if (f == nullptr) return out;
  char line[64];
  while (std::fgets(line, sizeof(line), f) != nullptr) out.push_back(std::strtod(line, nullptr));
  std::fclose(f);
  return out;
}

}  // namespace

// ============================================================================
// FileSink
// ============================================================================

TEST_CASE("FileSink default path names the target", "[sink]") {
  REQUIRE(farm::FileSink::DefaultPath(1000064U) == "random_1000064_nums.txt");
  REQUIRE(farm::FileSink::DefaultPath(0U) == "random_0_nums.txt");
}

TEST_CASE("FileSink writes one exact value per line", "[sink]") {
  const char* path = "/tmp/__farm_test_sink__.txt";
  const double values[] = {0.1, -2.5, 1.0 / 3.0, 1e-300, 123456789.125};
  {
    farm::FileSink sink;
    REQUIRE(sink.Open(path).has_value());
    REQUIRE(sink.IsOpen());
    REQUIRE(sink.Path() == path);
    REQUIRE(sink.Append(values, 2U).has_value());
    REQUIRE(sink.Append(values + 2, 3U).has_value());
    REQUIRE(sink.Written() == 5U);
    REQUIRE(sink.Close().has_value());
    REQUIRE_FALSE(sink.IsOpen());
    REQUIRE(sink.Close().has_value());
  }

  std::vector<double> back = ReadValues(path);
  std::remove(path);
  REQUIRE(back.size() == 5U);
  for (size_t i = 0; i < back.size(); ++i) REQUIRE(back[i] == values[i]);
}

TEST_CASE("FileSink open truncates", "[sink]") {
  const char* path = "/tmp/__farm_test_sink_trunc__.txt";
  const double v = 1.0;
  {
    farm::FileSink sink;
    REQUIRE(sink.Open(path).has_value());
    REQUIRE(sink.Append(&v, 1U).has_value());
  }
  {
    farm::FileSink sink;
    REQUIRE(sink.Open(path).has_value());
  }
  REQUIRE(ReadValues(path).empty());
  std::remove(path);
}

TEST_CASE("FileSink failures", "[sink]") {
  farm::FileSink sink;
  const double v = 1.0;

  SECTION("append before open") {
    auto r = sink.Append(&v, 1U);
    REQUIRE_FALSE(r.has_value());
    REQUIRE(r.get_error() == farm::FarmError::kSinkFailure);
  }

  SECTION("unwritable path") {
    auto r = sink.Open("/nonexistent_dir/__farm__/out.txt");
    REQUIRE_FALSE(r.has_value());
    REQUIRE(r.get_error() == farm::FarmError::kSinkFailure);
    REQUIRE_FALSE(sink.IsOpen());
  }

  SECTION("open twice") {
    const char* path = "/tmp/__farm_test_sink_twice__.txt";
    REQUIRE(sink.Open(path).has_value());
    auto r = sink.Open(path);
    REQUIRE_FALSE(r.has_value());
    REQUIRE(r.get_error() == farm::FarmError::kInvalidArgument);
    REQUIRE(sink.Close().has_value());
    std::remove(path);
  }
}

// ============================================================================
// VectorSink
// ============================================================================

TEST_CASE("VectorSink keeps batches in order", "[sink]") {
  farm::VectorSink sink;
  const double a[] = {1.0, 2.0};
  const double b[] = {3.0};
  REQUIRE(sink.Append(a, 2U).has_value());
  REQUIRE(sink.Append(b, 1U).has_value());
  REQUIRE(sink.Total() == 3U);
  REQUIRE(sink.Batches().size() == 2U);
  REQUIRE(sink.Batches()[0] == std::vector<double>{1.0, 2.0});
  REQUIRE(sink.Batches()[1] == std::vector<double>{3.0});
}

TEST_CASE("VectorSink FailAfter", "[sink]") {
  farm::VectorSink sink;
  sink.FailAfter(1);
  const double v = 0.5;
  REQUIRE(sink.Append(&v, 1U).has_value());
  auto r = sink.Append(&v, 1U);
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.get_error() == farm::FarmError::kSinkFailure);
  REQUIRE(sink.Total() == 1U);
}

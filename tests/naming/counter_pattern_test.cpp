#include "naming/counter_pattern.hpp"
#include "naming/filename_formatter.hpp"

#include <catch2/catch.hpp>

#include <cstdint>
#include <optional>
#include <string>

using savefile::naming::CounterPattern;

TEST_CASE("CounterPattern extracts counters from formatted names", "[naming][pattern]") {
  const CounterPattern pattern("{base}_{counter}", "report", "pdf");
  REQUIRE(pattern.HasCounter());
  REQUIRE(pattern.ParseCounter("report_001.pdf") == std::optional<std::uint64_t>(1));
  REQUIRE(pattern.ParseCounter("report_42.pdf") == std::optional<std::uint64_t>(42));
  REQUIRE(pattern.ParseCounter("report_12345.pdf") == std::optional<std::uint64_t>(12345));
}

TEST_CASE("CounterPattern ignores foreign and malformed names", "[naming][pattern]") {
  const CounterPattern pattern("{base}_{counter}", "report", "pdf");
  REQUIRE_FALSE(pattern.ParseCounter("report_001.txt").has_value());
  REQUIRE_FALSE(pattern.ParseCounter("report_.pdf").has_value());
  REQUIRE_FALSE(pattern.ParseCounter("report_abc.pdf").has_value());
  REQUIRE_FALSE(pattern.ParseCounter("other_001.pdf").has_value());
  REQUIRE_FALSE(pattern.ParseCounter("xreport_001.pdf").has_value());
  REQUIRE_FALSE(pattern.ParseCounter("report_001.pdf.bak").has_value());
  // 2^64 does not fit; skipped rather than reported.
  REQUIRE_FALSE(pattern.ParseCounter("report_18446744073709551616.pdf").has_value());
}

TEST_CASE("CounterPattern escapes regex metacharacters in base and extension",
          "[naming][pattern]") {
  const CounterPattern pattern("{base}_{counter}", "a.b+c(1)", "tar.gz");
  REQUIRE(pattern.ParseCounter("a.b+c(1)_3.tar.gz") == std::optional<std::uint64_t>(3));
  REQUIRE_FALSE(pattern.ParseCounter("aXb+c(1)_3.tar.gz").has_value());
  REQUIRE_FALSE(pattern.ParseCounter("a.b+c(1)_3.tarXgz").has_value());
}

TEST_CASE("CounterPattern matches names whose pattern literals were sanitized",
          "[naming][pattern]") {
  const std::string pattern_text = "log:{base}|{counter}";
  const std::string name = savefile::naming::FormatFilename(pattern_text, "svc", 5, 2, "txt");
  REQUIRE(name == "log-svc-05.txt");

  const CounterPattern pattern(pattern_text, "svc", "txt");
  REQUIRE(pattern.ParseCounter(name) == std::optional<std::uint64_t>(5));
}

TEST_CASE("CounterPattern uses the sanitized base", "[naming][pattern]") {
  const CounterPattern pattern("{base}_{counter}", "a/b", "");
  REQUIRE(pattern.ParseCounter("a-b_7") == std::optional<std::uint64_t>(7));
}

TEST_CASE("CounterPattern keeps whitespace that ends up inside the name",
          "[naming][pattern]") {
  const std::string name =
      savefile::naming::FormatFilename("{base}_{counter}", "rep ", 1, 3, "txt");
  REQUIRE(name == "rep _001.txt");

  const CounterPattern pattern("{base}_{counter}", "rep ", "txt");
  REQUIRE(pattern.ParseCounter(name) == std::optional<std::uint64_t>(1));
  REQUIRE_FALSE(pattern.ParseCounter("rep_001.txt").has_value());
}

TEST_CASE("CounterPattern with counter before base", "[naming][pattern]") {
  const CounterPattern pattern("{counter}-{base}", "scan", "png");
  REQUIRE(pattern.ParseCounter("00042-scan.png") == std::optional<std::uint64_t>(42));
}

TEST_CASE("CounterPattern without counter token yields no counters", "[naming][pattern]") {
  const CounterPattern pattern("{base}", "single", "txt");
  REQUIRE_FALSE(pattern.HasCounter());
  REQUIRE_FALSE(pattern.ParseCounter("single.txt").has_value());
}

TEST_CASE("EscapeRegex escapes every metacharacter", "[naming][pattern]") {
  REQUIRE(savefile::naming::EscapeRegex("a.b*c") == "a\\.b\\*c");
  REQUIRE(savefile::naming::EscapeRegex("{x}[y](z)") == "\\{x\\}\\[y\\]\\(z\\)");
  REQUIRE(savefile::naming::EscapeRegex("plain-text_1") == "plain-text_1");
}

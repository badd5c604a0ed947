#include "storage/counter_scan.hpp"

#include "naming/counter_pattern.hpp"

#include <limits>
#include <optional>

namespace fs = std::filesystem;

namespace savefile::storage {

bool ScanExistingCounters(const fs::path& directory, const naming::NamingConfig& config,
                          ExistingCounterSet& counters, std::error_code& ec, std::string& error) {
  counters.clear();
  ec.clear();

  const naming::CounterPattern pattern(config);
  if (!pattern.HasCounter()) {
    return true;
  }

  fs::directory_iterator it(directory, ec);
  if (ec) {
    if (ec == std::errc::no_such_file_or_directory) {
      ec.clear();
      return true;
    }
    error = "failed to list folder '" + directory.string() + "'";
    return false;
  }

  for (; it != fs::directory_iterator(); it.increment(ec)) {
    if (ec) {
      break;
    }
    const std::optional<std::uint64_t> counter =
        pattern.ParseCounter(it->path().filename().string());
    if (counter.has_value()) {
      counters.insert(*counter);
    }
  }

  if (ec) {
    error = "failed while listing folder '" + directory.string() + "'";
    return false;
  }
  return true;
}

bool FindNextAvailableCounter(const ExistingCounterSet& counters, std::uint64_t start,
                              std::uint64_t max_attempts, std::uint64_t& counter) {
  const std::uint64_t headroom = std::numeric_limits<std::uint64_t>::max() - start;
  const std::uint64_t limit = start + (max_attempts < headroom ? max_attempts : headroom);

  counter = start;
  while (counter < limit && counters.contains(counter)) {
    ++counter;
  }
  return counter < limit;
}

} // namespace savefile::storage

#pragma once

#include "naming/filename_formatter.hpp"

#include <cstdint>
#include <filesystem>
#include <set>
#include <string>
#include <system_error>

namespace savefile::storage {

using ExistingCounterSet = std::set<std::uint64_t>;

// Lists `directory` once and collects the counters already used by names of
// the `config` scheme.
//
// Contract:
// - A missing directory yields an empty set and returns true.
// - Entries that do not match, or whose digits overflow, are skipped.
// - Any other listing failure returns false with `ec`/`error` populated.
// The result is a snapshot; it may be stale as soon as it is returned.
bool ScanExistingCounters(const std::filesystem::path& directory,
                          const naming::NamingConfig& config, ExistingCounterSet& counters,
                          std::error_code& ec, std::string& error);

// Finds the first value >= `start` not in `counters`, looking at no more than
// `max_attempts` values. Returns false when all of them are taken.
bool FindNextAvailableCounter(const ExistingCounterSet& counters, std::uint64_t start,
                              std::uint64_t max_attempts, std::uint64_t& counter);

} // namespace savefile::storage

#include <boxscan/match/in_memory_catalog.hpp>
#include <boxscan/core/log.hpp>
#include <boxscan/match/text_normalize.hpp>
#include <algorithm>
#include <charconv>
#include <fstream>
#include <mutex>
#include <set>

namespace boxscan::match {

namespace {

void trim(std::string& s) {
  const auto start = s.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) {
    s.clear();
    return;
  }
  const auto end = s.find_last_not_of(" \t\r\n");
  s = s.substr(start, end - start + 1);
}

std::vector<std::string> split(std::string_view line, char sep) {
  std::vector<std::string> out;
  std::size_t pos = 0;
  while (true) {
    const std::size_t next = line.find(sep, pos);
    std::string field(line.substr(
        pos, next == std::string_view::npos ? std::string_view::npos : next - pos));
    trim(field);
    out.push_back(std::move(field));
    if (next == std::string_view::npos) break;
    pos = next + 1;
  }
  return out;
}

void add_key(std::vector<std::string>& keys, std::string key) {
  if (key.empty()) return;
  if (std::find(keys.begin(), keys.end(), key) == keys.end()) {
    keys.push_back(std::move(key));
  }
}

bool has_key(const core::CatalogEntry& e, std::string_view key) {
  return std::find(e.search_keys.begin(), e.search_keys.end(), key) != e.search_keys.end();
}

}  // namespace

std::uint64_t InMemoryCatalog::add(core::CatalogEntry entry) {
  entry.category = normalize_text(entry.category);
  if (entry.category.empty()) entry.category = "general";

  std::vector<std::string> brands;
  for (auto& b : entry.brand_aliases) {
    trim(b);
    if (!b.empty() && std::find(brands.begin(), brands.end(), b) == brands.end()) {
      brands.push_back(b);
    }
  }
  entry.brand_aliases = std::move(brands);

  std::vector<std::string> keys;
  add_key(keys, strip_dosage(entry.canonical_name));
  add_key(keys, strip_dosage(entry.generic_name));
  for (const auto& b : entry.brand_aliases) add_key(keys, strip_dosage(b));
  for (const auto& k : entry.search_keys) add_key(keys, strip_dosage(k));
  entry.search_keys = std::move(keys);

  std::unique_lock lock(mutex_);
  entry.id = next_id_++;
  entries_.push_back(std::move(entry));
  return entries_.back().id;
}

std::expected<std::size_t, core::ScanError> InMemoryCatalog::load_file(
    const std::string& path) {
  std::ifstream f(path);
  if (!f) {
    core::log_error("catalog") << "cannot open " << path;
    return std::unexpected(core::ScanError::LoadFailed);
  }

  std::size_t added = 0;
  std::size_t line_no = 0;
  std::string line;
  while (std::getline(f, line)) {
    ++line_no;
    trim(line);
    if (line.empty() || line[0] == '#') continue;

    const auto fields = split(line, '|');
    if (fields[0].empty()) {
      core::log_warn("catalog") << path << ":" << line_no << ": missing canonical name";
      continue;
    }
    core::CatalogEntry e;
    e.canonical_name = fields[0];
    e.generic_name = fields.size() > 1 && !fields[1].empty() ? fields[1] : fields[0];
    if (fields.size() > 2 && !fields[2].empty()) e.brand_aliases = split(fields[2], ',');
    if (fields.size() > 3) e.category = fields[3];
    if (fields.size() > 4) e.atc_code = fields[4];
    if (fields.size() > 5 && !fields[5].empty()) {
      const auto& u = fields[5];
      const auto [ptr, ec] = std::from_chars(u.data(), u.data() + u.size(), e.usage_count);
      if (ec != std::errc{} || ptr != u.data() + u.size()) {
        core::log_warn("catalog") << path << ":" << line_no << ": bad usage count '" << u << "'";
        e.usage_count = 0;
      }
    }
    add(std::move(e));
    ++added;
  }
  core::log_info("catalog") << "loaded " << added << " entries from " << path;
  return added;
}

core::CatalogEntry* InMemoryCatalog::find_by_name(std::string_view normalized_name) {
  for (auto& e : entries_) {
    if (strip_dosage(e.canonical_name) == normalized_name ||
        strip_dosage(e.generic_name) == normalized_name) {
      return &e;
    }
  }
  for (auto& e : entries_) {
    for (const auto& b : e.brand_aliases) {
      if (strip_dosage(b) == normalized_name) return &e;
    }
  }
  return nullptr;
}

std::expected<void, core::ScanError> InMemoryCatalog::absorb(
    const core::CorrectionRecord& record) {
  if (std::holds_alternative<core::Rejected>(record.kind)) return {};

  const std::string target = strip_dosage(record.corrected_name);
  if (target.empty()) return std::unexpected(core::ScanError::InvalidInput);

  std::unique_lock lock(mutex_);
  core::CatalogEntry* entry = find_by_name(target);
  if (!entry) {
    core::log_warn("catalog") << "correction names unknown drug '" << record.corrected_name << "'";
    return std::unexpected(core::ScanError::NoMatchFound);
  }
  const std::string observed = strip_dosage(record.observed_text);
  if (!observed.empty() && !has_key(*entry, observed)) {
    entry->search_keys.push_back(observed);
  }
  ++entry->usage_count;
  return {};
}

std::vector<core::CatalogEntry> InMemoryCatalog::lookup_by_key(
    std::string_view normalized_key) const {
  std::vector<core::CatalogEntry> out;
  if (normalized_key.empty()) return out;
  std::shared_lock lock(mutex_);
  for (const auto& e : entries_) {
    if (has_key(e, normalized_key)) out.push_back(e);
  }
  return out;
}

std::vector<core::CatalogEntry> InMemoryCatalog::list_by_category(
    std::string_view category) const {
  std::vector<core::CatalogEntry> out;
  std::shared_lock lock(mutex_);
  for (const auto& e : entries_) {
    if (e.category == category) out.push_back(e);
  }
  return out;
}

std::vector<core::CatalogEntry> InMemoryCatalog::list_all() const {
  std::shared_lock lock(mutex_);
  return entries_;
}

std::vector<std::string> InMemoryCatalog::categories() const {
  std::set<std::string> names;
  std::shared_lock lock(mutex_);
  for (const auto& e : entries_) names.insert(e.category);
  return std::vector<std::string>(names.begin(), names.end());
}

std::size_t InMemoryCatalog::size() const {
  std::shared_lock lock(mutex_);
  return entries_.size();
}

}  // namespace boxscan::match

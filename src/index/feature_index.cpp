#include <boxscan/index/feature_index.hpp>
#include <boxscan/core/log.hpp>
#include <boxscan/match/text_normalize.hpp>
#include <algorithm>
#include <charconv>
#include <fstream>
#include <map>
#include <string_view>
#include <variant>

namespace boxscan::index {

namespace {

std::string_view next_field(std::string_view& line) {
  const auto bar = line.find('|');
  std::string_view field = line.substr(0, bar);
  line = bar == std::string_view::npos ? std::string_view{} : line.substr(bar + 1);
  return field;
}

}  // namespace

FeatureIndex::FeatureIndex(FeatureIndexConfig config) : config_(config) {}

void FeatureIndex::add(StoredImage image) {
  std::unique_lock lock(mutex_);
  images_.push_back(std::move(image));
}

void FeatureIndex::stage(StoredImage image) {
  std::lock_guard lock(pending_mutex_);
  pending_.push_back(std::move(image));
}

void FeatureIndex::absorb(const core::CorrectionRecord& record) {
  if (std::holds_alternative<core::Rejected>(record.kind) || record.features.empty() ||
      record.corrected_name.empty()) {
    return;
  }
  StoredImage image;
  image.image_ref = "correction/" + record.session_id + "/" + std::to_string(record.region_id);
  image.drug_name = record.corrected_name;
  image.features = record.features;
  stage(std::move(image));
}

std::expected<std::vector<core::VisualMatch>, core::ScanError> FeatureIndex::nearest(
    std::span<const core::FeatureVector> features, std::size_t k) const {
  if (features.empty() || k == 0) {
    return std::vector<core::VisualMatch>{};
  }
  std::vector<core::VisualMatch> matches;
  {
    std::shared_lock lock(mutex_);
    for (const auto& image : images_) {
      auto cmp = compare_features(features, image.features, config_.weights,
                                  config_.agreement_threshold);
      if (cmp.compared_types == 0 || cmp.combined < config_.similarity_floor) continue;
      matches.push_back(core::VisualMatch{image.image_ref, image.drug_name, cmp.combined,
                                          std::move(cmp.agreeing)});
    }
  }
  std::stable_sort(matches.begin(), matches.end(), [](const auto& a, const auto& b) {
    if (a.similarity != b.similarity) return a.similarity > b.similarity;
    return a.image_ref < b.image_ref;
  });
  if (matches.size() > k) {
    matches.resize(k);
  }
  return matches;
}

std::expected<OptimizeReport, core::ScanError> FeatureIndex::optimize() {
  std::vector<StoredImage> incoming;
  {
    std::lock_guard lock(pending_mutex_);
    incoming.swap(pending_);
  }

  OptimizeReport report;
  std::unique_lock lock(mutex_);
  for (auto& image : incoming) {
    report.vectors_updated += image.features.size();
    auto it = std::find_if(images_.begin(), images_.end(), [&](const StoredImage& s) {
      return s.image_ref == image.image_ref;
    });
    if (it != images_.end()) {
      *it = std::move(image);
    } else {
      images_.push_back(std::move(image));
    }
  }

  std::vector<std::string> names;
  names.reserve(images_.size());
  for (const auto& image : images_) names.push_back(match::normalize_text(image.drug_name));

  std::vector<bool> removed(images_.size(), false);
  for (std::size_t i = 0; i < images_.size(); ++i) {
    if (removed[i]) continue;
    for (std::size_t j = i + 1; j < images_.size(); ++j) {
      if (removed[j] || names[i] != names[j]) continue;
      const auto cmp = compare_features(images_[i].features, images_[j].features,
                                        config_.weights, config_.agreement_threshold);
      if (cmp.compared_types > 0 && cmp.combined >= config_.duplicate_threshold) {
        removed[j] = true;
        ++report.duplicates_removed;
      }
    }
  }
  std::size_t idx = 0;
  std::erase_if(images_, [&](const StoredImage&) { return removed[idx++]; });

  core::log_info("index") << "optimize: " << report.vectors_updated << " vectors merged, "
                          << report.duplicates_removed << " duplicates removed, "
                          << images_.size() << " images";
  return report;
}

std::expected<std::size_t, core::ScanError> FeatureIndex::load_file(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    core::log_error("index") << "cannot open " << path;
    return std::unexpected(core::ScanError::LoadFailed);
  }
  std::map<std::string, StoredImage> by_ref;
  std::vector<std::string> order;
  std::string raw;
  std::size_t line_no = 0;
  while (std::getline(in, raw)) {
    ++line_no;
    std::string_view line(raw);
    if (line.empty() || line.front() == '#') continue;
    const std::string_view ref = next_field(line);
    const std::string_view drug = next_field(line);
    const std::string_view type_name = next_field(line);
    const std::string_view conf_text = next_field(line);
    const std::string_view values_text = line;

    auto type = core::feature_type_from_string(type_name);
    auto values = core::parse_feature_values(values_text);
    float confidence = 0.f;
    const auto conf = std::from_chars(conf_text.data(), conf_text.data() + conf_text.size(),
                                      confidence);
    if (ref.empty() || !type || !values || conf.ec != std::errc{}) {
      core::log_warn("index") << path << ":" << line_no << ": malformed line skipped";
      continue;
    }
    auto [it, inserted] = by_ref.try_emplace(std::string(ref));
    if (inserted) {
      it->second.image_ref = std::string(ref);
      it->second.drug_name = std::string(drug);
      order.push_back(it->first);
    }
    core::FeatureVector fv;
    fv.type = *type;
    fv.values = std::move(*values);
    fv.confidence = confidence;
    it->second.features.push_back(std::move(fv));
  }

  std::unique_lock lock(mutex_);
  for (const auto& ref : order) {
    images_.push_back(std::move(by_ref[ref]));
  }
  return order.size();
}

std::expected<void, core::ScanError> FeatureIndex::save(const std::string& path) const {
  std::ofstream out(path);
  if (!out) {
    core::log_error("index") << "cannot write " << path;
    return std::unexpected(core::ScanError::LoadFailed);
  }
  std::shared_lock lock(mutex_);
  for (const auto& image : images_) {
    for (const auto& fv : image.features) {
      out << image.image_ref << '|' << image.drug_name << '|' << core::to_string(fv.type) << '|'
          << fv.confidence << '|' << fv.serialize() << '\n';
    }
  }
  if (!out) {
    return std::unexpected(core::ScanError::LoadFailed);
  }
  return {};
}

std::size_t FeatureIndex::size() const {
  std::shared_lock lock(mutex_);
  return images_.size();
}

std::size_t FeatureIndex::pending_count() const {
  std::lock_guard lock(pending_mutex_);
  return pending_.size();
}

}  // namespace boxscan::index

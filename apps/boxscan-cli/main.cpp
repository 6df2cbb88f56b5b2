/**
 * boxscan-cli: scan a photograph of medicine boxes; print every detected box
 * with its matched drug and recommended action.
 * Build: cmake -B build && cmake --build build
 * Run:   ./build/boxscan_cli [--config path] [--input path] [--catalog path]
 * With --input: also writes results to output/<basename>.txt (same content as terminal).
 */

#include <boxscan/app/config.hpp>
#include <boxscan/app/scanner.hpp>
#include <boxscan/core/image.hpp>
#include <boxscan/core/log.hpp>
#include <boxscan/core/region_result.hpp>
#include <boxscan/core/session.hpp>
#include <boxscan/index/feature_index.hpp>
#include <boxscan/match/in_memory_catalog.hpp>
#include <boxscan/vision/contour_region_proposer.hpp>
#include <boxscan/vision/load_image.hpp>
#include <boxscan/vision/mock_region_proposer.hpp>
#include <boxscan/vision/mock_text_recognizer.hpp>
#ifdef BOXSCAN_HAS_ONNX
#include <boxscan/vision/onnx_region_proposer.hpp>
#endif
#ifdef BOXSCAN_HAS_TESSERACT
#include <boxscan/vision/tesseract_text_recognizer.hpp>
#endif

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

constexpr std::uint32_t kDemoWidth = 640;
constexpr std::uint32_t kDemoHeight = 480;
constexpr const char* kDemoText = "PAROL 500 mg 20 tablet";

std::shared_ptr<boxscan::match::InMemoryCatalog> demo_catalog() {
  using boxscan::core::CatalogEntry;
  auto catalog = std::make_shared<boxscan::match::InMemoryCatalog>();
  catalog->add(CatalogEntry{0, "Paracetamol", "paracetamol", {"Parol", "Calpol", "Tylol"},
                            "analgesic", "N02BE01", {}, 120});
  catalog->add(CatalogEntry{0, "Ibuprofen", "ibuprofen", {"Advil", "Nurofen", "Brufen"},
                            "analgesic", "M01AE01", {}, 80});
  catalog->add(CatalogEntry{0, "Amoxicillin", "amoxicillin", {"Amoklavin", "Augmentin"},
                            "antibiotic", "J01CA04", {}, 60});
  catalog->add(CatalogEntry{0, "Metformin", "metformin", {"Glucophage", "Glifor"}, "diabetes",
                            "A10BA02", {}, 40});
  catalog->add(CatalogEntry{0, "Atorvastatin", "atorvastatin", {"Lipitor", "Ator"},
                            "cholesterol", "C10AA05", {}, 30});
  return catalog;
}

std::shared_ptr<boxscan::vision::IRegionProposer> build_proposer(
    const boxscan::app::ScanConfig& cfg, bool synthetic) {
  using namespace boxscan::vision;
  if (cfg.proposer_type == boxscan::app::ProposerType::Onnx) {
#ifdef BOXSCAN_HAS_ONNX
    if (cfg.model_path.empty()) {
      throw std::runtime_error("proposer=onnx requires model_path to be set in config");
    }
    auto onnx = std::make_shared<OnnxRegionProposer>(
        cfg.model_path, ProposalDecoder(cfg.proposal_score_threshold));
    onnx->warmup();
    return onnx;
#else
    throw std::runtime_error("ONNX proposer not available (build with -DBOXSCAN_USE_ONNX=ON)");
#endif
  }
  if (cfg.proposer_type == boxscan::app::ProposerType::Contour && !synthetic) {
    return std::make_shared<ContourRegionProposer>(cfg.contour);
  }
  auto mock = std::make_shared<MockRegionProposer>();
  mock->set_proposals({{{170, 90, 300, 300}, 0.92f}});
  return mock;
}

std::shared_ptr<boxscan::vision::ITextRecognizer> build_recognizer(
    const boxscan::app::ScanConfig& cfg, const std::string& text) {
  if (cfg.recognizer_type == boxscan::app::RecognizerType::Tesseract) {
#ifdef BOXSCAN_HAS_TESSERACT
    return std::make_shared<boxscan::vision::TesseractTextRecognizer>(cfg.tessdata_path,
                                                                       cfg.ocr_language);
#else
    throw std::runtime_error(
        "Tesseract recognizer not available (build with -DBOXSCAN_USE_TESSERACT=ON)");
#endif
  }
  auto mock = std::make_shared<boxscan::vision::MockTextRecognizer>();
  mock->set_default_text(text.empty() ? kDemoText : text, 0.9f);
  return mock;
}

boxscan::core::Image make_demo_image(std::uint32_t w, std::uint32_t h) {
  const std::size_t bytes = static_cast<std::size_t>(w) * h * 3;
  std::vector<std::byte> buffer(bytes, std::byte{200});
  return boxscan::core::Image(w, h, boxscan::core::PixelFormat::BGR8, std::move(buffer));
}

std::string format_result(const boxscan::core::MultiDrugResult& result) {
  using namespace boxscan::core;
  std::ostringstream out;
  out << "session=" << result.session_id << " regions=" << result.regions.size()
      << " drugs=" << result.drug_names.size()
      << " aggregate_confidence=" << result.aggregate_confidence
      << " frame_quality=" << to_string(result.frame_quality)
      << " duration_ms=" << result.duration.count() << "\n";
  for (const auto& r : result.regions) {
    out << "  region " << r.region_id << " bbox=(" << r.bbox.x << "," << r.bbox.y << ","
        << r.bbox.w << "," << r.bbox.h << ") action=" << action_name(r.action);
    if (r.best) {
      out << " drug=" << r.best->drug_name << " confidence=" << r.best->confidence
          << " type=" << to_string(r.best->type);
      if (r.best->brand_name) out << " brand=" << *r.best->brand_name;
    }
    if (r.extracted) out << " text='" << r.extracted->raw_text << "'";
    if (r.recovered) {
      out << " recovery=" << to_string(r.recovered->method) << " recovered='"
          << r.recovered->text << "'";
    }
    if (r.visual_gap) out << " visual_gap";
    if (r.duplicate_of) out << " duplicate_of=" << *r.duplicate_of;
    for (const auto e : r.errors) out << " error=" << to_string(e);
    out << "\n";
    for (const auto& alt : r.alternatives) {
      out << "    alt " << alt.drug_name << " confidence=" << alt.confidence << "\n";
    }
  }
  const auto& s = result.statistics;
  out << "stats auto=" << s.auto_selected << " options=" << s.show_options
      << " manual=" << s.manual_entry << " rescan=" << s.rescan << " recovered=" << s.recovered
      << " visual=" << s.visual_matches << " failed_extractions=" << s.failed_extractions
      << "\n";
  return out.str();
}

}  // namespace

int main(int argc, char* argv[]) {
  std::string config_path;
  std::string input_path;
  std::string catalog_override;
  std::string proposer_override;  // "mock", "contour" or "onnx"
  std::string model_override;
  std::string recognizer_override;  // "mock" or "tesseract"
  std::string scripted_text;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--input" && i + 1 < argc) {
      input_path = argv[++i];
    } else if (arg == "--catalog" && i + 1 < argc) {
      catalog_override = argv[++i];
    } else if (arg == "--proposer" && i + 1 < argc) {
      proposer_override = argv[++i];
    } else if (arg == "--model" && i + 1 < argc) {
      model_override = argv[++i];
    } else if (arg == "--recognizer" && i + 1 < argc) {
      recognizer_override = argv[++i];
    } else if (arg == "--text" && i + 1 < argc) {
      scripted_text = argv[++i];
    } else if (arg == "--help" || arg == "-h") {
      std::cout << "Usage: boxscan_cli [options] [--input <path>]\n"
                << "  --config <path>      Scanner config (key=value file); default: built-in\n"
                << "  --input <path>       Image path (optional; demo uses a synthetic image)\n"
                << "  --catalog <path>     Drug catalog (name|generic|brands|category|atc|usage)\n"
                << "  --proposer <type>    mock | contour | onnx (default from config)\n"
                << "  --model <path>       Detection model (required for --proposer onnx)\n"
                << "  --recognizer <type>  mock | tesseract (default from config)\n"
                << "  --text <text>        Text returned by the mock recognizer\n";
      return 0;
    }
  }

  boxscan::app::ScanConfig cfg = config_path.empty() ? boxscan::app::default_config()
                                                     : boxscan::app::load_config(config_path);
  if (!proposer_override.empty()) {
    if (proposer_override == "mock") {
      cfg.proposer_type = boxscan::app::ProposerType::Mock;
    } else if (proposer_override == "contour") {
      cfg.proposer_type = boxscan::app::ProposerType::Contour;
    } else if (proposer_override == "onnx") {
      cfg.proposer_type = boxscan::app::ProposerType::Onnx;
    } else {
      std::cerr << "Unknown --proposer " << proposer_override << " (use mock, contour, or onnx)\n";
      return 1;
    }
  }
  if (!recognizer_override.empty()) {
    if (recognizer_override == "mock") {
      cfg.recognizer_type = boxscan::app::RecognizerType::Mock;
    } else if (recognizer_override == "tesseract") {
      cfg.recognizer_type = boxscan::app::RecognizerType::Tesseract;
    } else {
      std::cerr << "Unknown --recognizer " << recognizer_override << " (use mock or tesseract)\n";
      return 1;
    }
  }
  if (!model_override.empty()) cfg.model_path = model_override;
  if (!catalog_override.empty()) cfg.catalog_path = catalog_override;
  boxscan::core::set_log_level(cfg.log_level);

  std::shared_ptr<boxscan::match::InMemoryCatalog> catalog;
  if (cfg.catalog_path.empty()) {
    catalog = demo_catalog();
  } else {
    catalog = std::make_shared<boxscan::match::InMemoryCatalog>();
    auto loaded = catalog->load_file(cfg.catalog_path);
    if (!loaded) {
      std::cerr << "Failed to load catalog: " << cfg.catalog_path << " ("
                << boxscan::core::to_string(loaded.error()) << ")\n";
      return 1;
    }
  }

  std::shared_ptr<boxscan::index::FeatureIndex> visual;
  if (!cfg.visual_catalog_path.empty()) {
    visual = std::make_shared<boxscan::index::FeatureIndex>(cfg.index);
    auto loaded = visual->load_file(cfg.visual_catalog_path);
    if (!loaded) {
      std::cerr << "Warning: visual catalog unavailable: " << cfg.visual_catalog_path << "\n";
      visual.reset();
    }
  }

  boxscan::core::Image image;
  boxscan::core::ImageSource source = boxscan::core::ImageSource::Synthetic;
  if (!input_path.empty()) {
    auto loaded = boxscan::vision::load_image(input_path);
    if (!loaded) {
      std::cerr << "Failed to load image: " << input_path << "\n";
      return 1;
    }
    image = std::move(*loaded);
    source = boxscan::core::ImageSource::File;
  } else {
    image = make_demo_image(kDemoWidth, kDemoHeight);
  }

  std::unique_ptr<boxscan::app::Scanner> scanner;
  try {
    boxscan::app::ScannerComponents parts;
    parts.detector = std::make_shared<boxscan::vision::RegionDetector>(
        build_proposer(cfg, input_path.empty()), cfg.detector,
        boxscan::vision::BoxAssessor(cfg.assessor));
    parts.extractor = std::make_shared<boxscan::vision::TextExtractor>(
        build_recognizer(cfg, scripted_text), cfg.extractor);
    parts.features = std::make_shared<boxscan::vision::FeatureExtractor>(cfg.features);
    parts.visual_store = visual;
    parts.catalog = catalog;
    parts.match = cfg.match;
    parts.recovery = cfg.recovery;
    parts.decision = cfg.decision;
    parts.worker_count = cfg.worker_count;
    parts.visual_k = cfg.visual_k;
    scanner = std::make_unique<boxscan::app::Scanner>(std::move(parts));
  } catch (const std::exception& e) {
    std::cerr << "Setup error: " << e.what() << "\n";
    return 1;
  }

  boxscan::core::ScanSession session(
      input_path.empty() ? "demo" : std::filesystem::path(input_path).stem().string(), source);
  auto result = scanner->process(image, session);
  if (!result) {
    std::cerr << "Scan error: " << boxscan::core::to_string(result.error()) << "\n";
    return 1;
  }

  std::string text = format_result(*result);
  std::cout << text;

  if (!input_path.empty()) {
    std::filesystem::path p(input_path);
    std::filesystem::path out_dir("output");
    std::filesystem::create_directories(out_dir);
    std::filesystem::path out_file = out_dir / (p.stem().string() + ".txt");
    std::ofstream f(out_file);
    if (f) {
      f << text;
    } else {
      std::cerr << "Warning: could not write " << out_file << "\n";
    }
  }
  return 0;
}

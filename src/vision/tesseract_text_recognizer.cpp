#include <boxscan/vision/tesseract_text_recognizer.hpp>

#ifdef BOXSCAN_HAS_TESSERACT

#include "image_cv_utils.hpp"
#include <boxscan/core/log.hpp>
#include <opencv2/imgproc.hpp>
#include <tesseract/baseapi.h>
#include <tesseract/ocrclass.h>
#include <climits>
#include <mutex>
#include <stdexcept>
#include <vector>

namespace boxscan::vision {

namespace nc = boxscan::core;

namespace {

bool cancel_requested(void* stop, int /*words*/) {
  return static_cast<const std::stop_token*>(stop)->stop_requested();
}

}  // namespace

/// Idle engines. A call leases one for its whole recognition, so concurrent
/// regions never queue behind each other; the pool grows to the number of
/// concurrent callers.
struct TesseractTextRecognizer::Impl {
  std::string tessdata_path;
  std::string language;
  std::mutex mutex;
  std::vector<std::unique_ptr<tesseract::TessBaseAPI>> idle;
  std::size_t created{0};

  std::unique_ptr<tesseract::TessBaseAPI> make_engine() const {
    auto api = std::make_unique<tesseract::TessBaseAPI>();
    const char* datapath = tessdata_path.empty() ? nullptr : tessdata_path.c_str();
    if (api->Init(datapath, language.c_str(), tesseract::OEM_LSTM_ONLY) != 0) {
      return nullptr;
    }
    api->SetPageSegMode(tesseract::PSM_AUTO);
    return api;
  }

  std::unique_ptr<tesseract::TessBaseAPI> acquire() {
    {
      std::lock_guard lock(mutex);
      if (!idle.empty()) {
        auto api = std::move(idle.back());
        idle.pop_back();
        return api;
      }
    }
    auto api = make_engine();
    if (api) {
      std::lock_guard lock(mutex);
      ++created;
      core::log_debug("tesseract") << "engine pool grew to " << created;
    }
    return api;
  }

  void release(std::unique_ptr<tesseract::TessBaseAPI> api) {
    api->Clear();
    std::lock_guard lock(mutex);
    idle.push_back(std::move(api));
  }

  ~Impl() {
    for (auto& api : idle) api->End();
  }

  /// Returns the leased engine to the pool on every exit path.
  class Lease {
   public:
    explicit Lease(Impl& pool) : pool_(pool), api_(pool.acquire()) {}
    ~Lease() {
      if (api_) pool_.release(std::move(api_));
    }
    Lease(const Lease&) = delete;
    Lease& operator=(const Lease&) = delete;

    tesseract::TessBaseAPI* operator->() const { return api_.get(); }
    explicit operator bool() const { return api_ != nullptr; }

   private:
    Impl& pool_;
    std::unique_ptr<tesseract::TessBaseAPI> api_;
  };
};

TesseractTextRecognizer::TesseractTextRecognizer(std::string tessdata_path, std::string language)
    : impl_(std::make_unique<Impl>()) {
  impl_->tessdata_path = std::move(tessdata_path);
  impl_->language = std::move(language);
  auto first = impl_->make_engine();
  if (!first) {
    throw std::runtime_error("TesseractTextRecognizer: cannot initialize language '" +
                             impl_->language + "'");
  }
  impl_->created = 1;
  impl_->idle.push_back(std::move(first));
}

TesseractTextRecognizer::~TesseractTextRecognizer() = default;

std::size_t TesseractTextRecognizer::engine_count() const {
  std::lock_guard lock(impl_->mutex);
  return impl_->created;
}

std::expected<RecognizedText, nc::ScanError> TesseractTextRecognizer::recognize(
    const nc::Region& region, const RecognitionOptions& options) {
  auto bgr = detail::to_bgr(region.image);
  if (!bgr) {
    return std::unexpected(nc::ScanError::InvalidImage);
  }
  cv::Mat rgb;
  cv::cvtColor(*bgr, rgb, cv::COLOR_BGR2RGB);

  if (options.stop.stop_requested()) {
    return std::unexpected(nc::ScanError::Cancelled);
  }
  Impl::Lease api(*impl_);
  if (!api) {
    core::log_error("tesseract") << "cannot start another engine for region " << region.id;
    return std::unexpected(nc::ScanError::ServiceUnavailable);
  }

  api->SetImage(rgb.data, rgb.cols, rgb.rows, 3, static_cast<int>(rgb.step));

  std::stop_token stop = options.stop;
  ETEXT_DESC monitor;
  monitor.cancel = &cancel_requested;
  monitor.cancel_this = &stop;
  const auto budget = options.timeout.count();
  monitor.set_deadline_msecs(budget > INT_MAX ? INT_MAX : static_cast<int>(budget));

  const int status = api->Recognize(&monitor);
  if (stop.stop_requested()) {
    return std::unexpected(nc::ScanError::Cancelled);
  }
  if (monitor.deadline_exceeded()) {
    return std::unexpected(nc::ScanError::Timeout);
  }
  if (status != 0) {
    core::log_warn("tesseract") << "region " << region.id << ": recognition failed";
    return std::unexpected(nc::ScanError::ExtractionFailure);
  }

  std::unique_ptr<char[]> text(api->GetUTF8Text());
  RecognizedText out;
  if (text) {
    out.text = text.get();
  }
  out.confidence = static_cast<float>(api->MeanTextConf()) / 100.f;
  return out;
}

}  // namespace boxscan::vision

#endif  // BOXSCAN_HAS_TESSERACT

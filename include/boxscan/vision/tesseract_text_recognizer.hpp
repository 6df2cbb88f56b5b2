#pragma once

#ifdef BOXSCAN_HAS_TESSERACT

#include <boxscan/vision/text_recognizer.hpp>
#include <cstddef>
#include <memory>
#include <string>

namespace boxscan::vision {

/// Tesseract LSTM recognizer. Each call leases a TessBaseAPI from a pool
/// that grows to the number of concurrent callers, so one slow region does
/// not hold up its siblings. The per-call timeout and stop token are
/// wired into Tesseract's progress monitor so long recognitions can be cut
/// short.
class TesseractTextRecognizer : public ITextRecognizer {
 public:
  /// \param tessdata_path Directory holding the .traineddata files; empty
  ///        uses Tesseract's default lookup.
  /// \param language Tesseract language string, e.g. "eng+tur".
  /// \throws std::runtime_error if the engine cannot be initialized.
  TesseractTextRecognizer(std::string tessdata_path, std::string language);
  ~TesseractTextRecognizer() override;

  TesseractTextRecognizer(const TesseractTextRecognizer&) = delete;
  TesseractTextRecognizer& operator=(const TesseractTextRecognizer&) = delete;

  [[nodiscard]] std::expected<RecognizedText, boxscan::core::ScanError> recognize(
      const boxscan::core::Region& region, const RecognitionOptions& options) override;

  /// Engines started so far (idle or in use).
  [[nodiscard]] std::size_t engine_count() const;

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace boxscan::vision

#endif  // BOXSCAN_HAS_TESSERACT

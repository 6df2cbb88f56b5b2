#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace boxscan::core {

/// Memory: Image owns a single contiguous, tightly packed buffer
/// (std::vector<std::byte>); move semantics and RAII throughout. Use data()
/// for std::span views (non-owning).
/// Thread-safety: distinct Image instances are independent; a const Image may
/// be read from several threads.

/// Pixel layout / format (8 bits per channel, interleaved).
enum class PixelFormat : std::uint8_t {
  Unknown,
  Grayscale8,
  RGB8,
  BGR8,
  RGBA8,
  BGRA8,
};

/// Axis-aligned rectangle in pixel coordinates.
struct BBox {
  int x{0};
  int y{0};
  int w{0};
  int h{0};

  [[nodiscard]] long long area() const noexcept {
    return w > 0 && h > 0 ? static_cast<long long>(w) * h : 0;
  }
  [[nodiscard]] bool empty() const noexcept { return w <= 0 || h <= 0; }

  friend bool operator==(const BBox&, const BBox&) = default;
};

/// Intersection of two boxes (empty box when they do not overlap).
[[nodiscard]] BBox intersect(const BBox& a, const BBox& b) noexcept;

/// Intersection-over-union in [0, 1].
[[nodiscard]] float iou(const BBox& a, const BBox& b) noexcept;

/// Grow \p box by \p padding on every side, clamped to width x height.
[[nodiscard]] BBox pad_and_clamp(const BBox& box, int padding,
                                 std::uint32_t width, std::uint32_t height) noexcept;

/// Single photograph or cropped region: dimensions, format, and owned buffer.
class Image {
 public:
  Image() = default;

  Image(std::uint32_t width,
        std::uint32_t height,
        PixelFormat format,
        std::vector<std::byte> buffer)
      : width_(width),
        height_(height),
        format_(format),
        buffer_(std::move(buffer)) {}

  [[nodiscard]] std::uint32_t width() const noexcept { return width_; }
  [[nodiscard]] std::uint32_t height() const noexcept { return height_; }
  [[nodiscard]] PixelFormat format() const noexcept { return format_; }

  [[nodiscard]] std::span<std::byte> data() noexcept {
    return std::span<std::byte>(buffer_.data(), buffer_.size());
  }
  [[nodiscard]] std::span<const std::byte> data() const noexcept {
    return std::span<const std::byte>(buffer_.data(), buffer_.size());
  }

  [[nodiscard]] bool empty() const noexcept { return buffer_.empty(); }
  [[nodiscard]] std::size_t size_bytes() const noexcept { return buffer_.size(); }

  /// True when dimensions, format and buffer size are consistent.
  [[nodiscard]] bool valid() const noexcept;

  /// Independent copy of the pixels inside \p box (clamped to the image).
  /// Returns an empty Image when the clamped box is empty.
  [[nodiscard]] Image crop(const BBox& box) const;

  [[nodiscard]] static std::size_t bytes_per_pixel(PixelFormat format) noexcept;

  /// Minimum bytes required for given dimensions and format (for validation).
  [[nodiscard]] static std::size_t min_bytes(std::uint32_t width,
                                             std::uint32_t height,
                                             PixelFormat format) noexcept;

 private:
  std::uint32_t width_{0};
  std::uint32_t height_{0};
  PixelFormat format_{PixelFormat::Unknown};
  std::vector<std::byte> buffer_;
};

}  // namespace boxscan::core

#include <boxscan/core/image.hpp>
#include <algorithm>
#include <cstring>

namespace boxscan::core {

BBox intersect(const BBox& a, const BBox& b) noexcept {
  const int x1 = std::max(a.x, b.x);
  const int y1 = std::max(a.y, b.y);
  const int x2 = std::min(a.x + a.w, b.x + b.w);
  const int y2 = std::min(a.y + a.h, b.y + b.h);
  if (x2 <= x1 || y2 <= y1) return BBox{};
  return BBox{x1, y1, x2 - x1, y2 - y1};
}

float iou(const BBox& a, const BBox& b) noexcept {
  const long long inter = intersect(a, b).area();
  const long long uni = a.area() + b.area() - inter;
  if (uni <= 0) return 0.f;
  return static_cast<float>(static_cast<double>(inter) / static_cast<double>(uni));
}

BBox pad_and_clamp(const BBox& box, int padding,
                   std::uint32_t width, std::uint32_t height) noexcept {
  const BBox padded{box.x - padding, box.y - padding,
                    box.w + 2 * padding, box.h + 2 * padding};
  return intersect(padded, BBox{0, 0, static_cast<int>(width), static_cast<int>(height)});
}

std::size_t Image::bytes_per_pixel(PixelFormat format) noexcept {
  switch (format) {
    case PixelFormat::Grayscale8:
      return 1;
    case PixelFormat::RGB8:
    case PixelFormat::BGR8:
      return 3;
    case PixelFormat::RGBA8:
    case PixelFormat::BGRA8:
      return 4;
    case PixelFormat::Unknown:
    default:
      return 0;
  }
}

std::size_t Image::min_bytes(std::uint32_t width,
                             std::uint32_t height,
                             PixelFormat format) noexcept {
  return static_cast<std::size_t>(width) * height * bytes_per_pixel(format);
}

bool Image::valid() const noexcept {
  if (empty() || width_ == 0 || height_ == 0) return false;
  const std::size_t need = min_bytes(width_, height_, format_);
  return need > 0 && buffer_.size() >= need;
}

Image Image::crop(const BBox& box) const {
  if (!valid()) return Image();
  const BBox clamped =
      intersect(box, BBox{0, 0, static_cast<int>(width_), static_cast<int>(height_)});
  if (clamped.empty()) return Image();

  const std::size_t bpp = bytes_per_pixel(format_);
  const std::size_t src_stride = static_cast<std::size_t>(width_) * bpp;
  const std::size_t row_bytes = static_cast<std::size_t>(clamped.w) * bpp;
  std::vector<std::byte> out(row_bytes * static_cast<std::size_t>(clamped.h));
  for (int row = 0; row < clamped.h; ++row) {
    const std::size_t src_off =
        static_cast<std::size_t>(clamped.y + row) * src_stride +
        static_cast<std::size_t>(clamped.x) * bpp;
    std::memcpy(out.data() + static_cast<std::size_t>(row) * row_bytes,
                buffer_.data() + src_off, row_bytes);
  }
  return Image(static_cast<std::uint32_t>(clamped.w),
               static_cast<std::uint32_t>(clamped.h), format_, std::move(out));
}

}  // namespace boxscan::core

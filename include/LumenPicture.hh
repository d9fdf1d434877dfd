// Floating-point color, the 8-bit output pixel and the shared frame buffer

#pragma once

#include <LumenMath.hh>

#include <cstdio>
#include <mutex>
#include <stdexcept>
#include <string>

namespace Lumen {
  // r, g, b, a; unclamped while accumulating
  using Color = Eigen::Vector4d;

  inline Color rgb(double r, double g, double b) { return Color(r, g, b, 1); }

  inline Color blend(const Color &a, const Color &b, double t) {
    return (1.0 - t) * a + t * b;
  }

  inline const Color WHITE = rgb(1, 1, 1);
  inline const Color BLACK = rgb(0, 0, 0);

  struct RGBA8 {
    std::uint8_t r, g, b, a;

    static std::uint8_t normalize(double v) {
      return std::uint8_t(std::clamp(v, 0.0, 1.0) * 255.0);
    }

    static RGBA8 fromColor(const Color &c) {
      return RGBA8{normalize(c.x()), normalize(c.y()), normalize(c.z()),
                   normalize(c.w())};
    }

    static constexpr RGBA8 fromHex(std::uint32_t rgba) {
      return RGBA8{std::uint8_t((rgba >> 24) & 0xff),
                   std::uint8_t((rgba >> 16) & 0xff),
                   std::uint8_t((rgba >> 8) & 0xff),
                   std::uint8_t(rgba & 0xff)};
    }

    bool operator==(const RGBA8 &o) const {
      return r == o.r && g == o.g && b == o.b && a == o.a;
    }
    bool operator!=(const RGBA8 &o) const { return !(*this == o); }
  };

  static_assert(sizeof(RGBA8) == 4, "RGBA8 must stay tightly packed");

  // Fixed-size pixel buffer shared by the scheduler and the presentation
  // side. Only whole pixel runs are ever replaced, always under the lock.
  // Row 0 is the bottom row of the image.
  class Frame {
    unsigned w, h;
    Array<RGBA8> pixels;
    mutable std::mutex m;

  public:
    Frame(unsigned w, unsigned h) : w(w), h(h) {
      if (w == 0 || h == 0)
        throw ConfigError("frame size must be positive, got " +
                          std::to_string(w) + "x" + std::to_string(h));
      pixels.assign(size_t(w) * h, RGBA8::fromHex(0x000000ff));
    }

    Frame(const Frame &) = delete;
    Frame &operator=(const Frame &) = delete;

    unsigned width() const { return w; }
    unsigned height() const { return h; }
    size_t size() const { return pixels.size(); }

    void submit(size_t offset, const Array<RGBA8> &run) {
      std::lock_guard<std::mutex> lock(m);
      if (offset > pixels.size() || run.size() > pixels.size() - offset)
        throw std::out_of_range("pixel run [" + std::to_string(offset) +
                                ", " + std::to_string(offset + run.size()) +
                                ") outside frame of " +
                                std::to_string(pixels.size()) + " pixels");
      std::copy(run.begin(), run.end(), pixels.begin() + offset);
    }

    Array<RGBA8> copyPixels() const {
      std::lock_guard<std::mutex> lock(m);
      return pixels;
    }

    RGBA8 pixel(unsigned x, unsigned y) const {
      std::lock_guard<std::mutex> lock(m);
      return pixels[size_t(y) * w + x];
    }

    void clear(RGBA8 color) {
      std::lock_guard<std::mutex> lock(m);
      std::fill(pixels.begin(), pixels.end(), color);
    }

    // placeholder shown until the first render lands
    void fillGradient() {
      std::lock_guard<std::mutex> lock(m);
      for (unsigned y = 0; y < h; ++y) {
        double r = double(y) / h;
        for (unsigned x = 0; x < w; ++x) {
          double g = double(x) / w;
          pixels[size_t(y) * w + x] = RGBA8::fromColor(Color(r, g, 1, 1));
        }
      }
    }
  };

  // ASCII P3, top row first
  inline void savePPM(const char *filename, unsigned w, unsigned h,
                      const Array<RGBA8> &pixels) {
    if (pixels.size() != size_t(w) * h)
      throw std::invalid_argument("pixel count does not match image size");
    FILE *f = fopen(filename, "w");
    if (!f)
      throw std::runtime_error(std::string("cannot open '") + filename +
                               "' for writing");
    fprintf(f, "P3\n%u %u\n255\n", w, h);
    for (unsigned row = 0; row < h; ++row) {
      unsigned y = h - 1 - row;
      for (unsigned x = 0; x < w; ++x) {
        const RGBA8 &p = pixels[size_t(y) * w + x];
        fprintf(f, "%d %d %d ", p.r, p.g, p.b);
      }
      fprintf(f, "\n");
    }
    fclose(f);
  }
} // namespace Lumen

#pragma once

#include <LumenMath.hh>

#include <initializer_list>

namespace Lumen {
  // Fixed sub-pixel offsets in [0,1]^2 used for anti-aliasing. The offsets
  // are deterministic, all noise comes from the materials and the lens.
  class SamplePattern {
    Array<Vector2d> offsets;

  public:
    SamplePattern(std::initializer_list<Vector2d> list)
        : SamplePattern(Array<Vector2d>(list)) {}

    explicit SamplePattern(Array<Vector2d> list) : offsets(std::move(list)) {
      if (offsets.empty())
        throw ConfigError("sample pattern needs at least one offset");
      for (const auto &o : offsets)
        if (!(o.x() >= 0 && o.x() <= 1 && o.y() >= 0 && o.y() <= 1))
          throw ConfigError("sample offset outside [0,1]x[0,1]");
    }

    const Array<Vector2d> &sampleOffsets() const { return offsets; }
    size_t size() const { return offsets.size(); }

    // Direct3D standard multisample positions, in 1/16 pixel units
    static SamplePattern single() { return {Vector2d(0.5, 0.5)}; }

    static SamplePattern multisample2x() {
      return {Vector2d(0.25, 0.75), Vector2d(0.75, 0.25)};
    }

    static SamplePattern multisample4x() {
      return {Vector2d(0.125, 0.375), Vector2d(0.375, 0.875),
              Vector2d(0.625, 0.125), Vector2d(0.875, 0.625)};
    }

    static SamplePattern multisample8x() {
      return {Vector2d(0.0625, 0.5625), Vector2d(0.1875, 0.1875),
              Vector2d(0.3125, 0.8125), Vector2d(0.4375, 0.3125),
              Vector2d(0.5625, 0.6875), Vector2d(0.6875, 0.0625),
              Vector2d(0.8125, 0.4375), Vector2d(0.9375, 0.9375)};
    }

    static SamplePattern standard(int samples) {
      switch (samples) {
      case 1:
        return single();
      case 2:
        return multisample2x();
      case 4:
        return multisample4x();
      case 8:
        return multisample8x();
      default:
        throw ConfigError("no standard pattern with " +
                          std::to_string(samples) + " samples");
      }
    }
  };
} // namespace Lumen

#pragma once

#include <Lumen>
#include <catch2/catch.hpp>

namespace Lumen {
  // replays a fixed list of draws, wrapping around at the end
  struct ScriptedGen {
    Array<double> values;
    size_t calls = 0;

    explicit ScriptedGen(Array<double> values) : values(std::move(values)) {}

    double operator()() { return values[calls++ % values.size()]; }
  };

  inline void requireNear(const Vector3d &a, const Vector3d &b,
                          double eps = 1e-9) {
    REQUIRE(a.x() == Approx(b.x()).margin(eps));
    REQUIRE(a.y() == Approx(b.y()).margin(eps));
    REQUIRE(a.z() == Approx(b.z()).margin(eps));
  }

  inline void requireNear(const Color &a, const Color &b, double eps = 1e-9) {
    REQUIRE(a.x() == Approx(b.x()).margin(eps));
    REQUIRE(a.y() == Approx(b.y()).margin(eps));
    REQUIRE(a.z() == Approx(b.z()).margin(eps));
    REQUIRE(a.w() == Approx(b.w()).margin(eps));
  }

  // a scene that is nothing but background
  inline SceneRef emptyScene() { return std::make_shared<ObjectList>(); }

  inline SceneRef singleSphere(const Vector3d &center, double radius,
                               MaterialRef mat) {
    auto list = std::make_shared<ObjectList>();
    list->add(sphere(center, radius, std::move(mat)));
    return list;
  }
} // namespace Lumen

// The demo scene: a field of small random spheres around three large ones

#pragma once

#include <LumenCamera.hh>
#include <LumenObject.hh>

namespace Lumen {
  inline std::unique_ptr<ObjectList> randomScene(RandEngine &gen) {
    auto rnd = [&](double lo, double hi) { return lo + (hi - lo) * gen(); };

    auto world = std::make_unique<ObjectList>();
    world->add(
        sphere(Vector3d(0, -1000, 0), 1000, lambertian(rgb(0.5, 0.5, 0.5))));

    for (int a = -11; a < 11; ++a) {
      for (int b = -11; b < 11; ++b) {
        double cx = a + 0.9 * gen();
        double cz = b + 0.9 * gen();
        Vector3d center(cx, 0.2, cz);
        if ((center - Vector3d(4, 0.2, 0)).norm() <= 0.9)
          continue;

        double choice = gen();
        MaterialRef mat;
        if (choice < 0.8) {
          double r = gen() * gen();
          double g = gen() * gen();
          double bl = gen() * gen();
          mat = lambertian(rgb(r, g, bl));
        } else if (choice < 0.95) {
          double r = rnd(0.5, 1.0);
          double g = rnd(0.5, 1.0);
          double bl = rnd(0.5, 1.0);
          mat = metal(rgb(r, g, bl), rnd(0.0, 0.5));
        } else {
          mat = dielectric(1.5);
        }
        world->add(sphere(center, 0.2, mat));
      }
    }

    world->add(sphere(Vector3d(0, 1, 0), 1.0, dielectric(1.5)));
    world->add(sphere(Vector3d(-4, 1, 0), 1.0, lambertian(rgb(0.4, 0.2, 0.1))));
    world->add(sphere(Vector3d(4, 1, 0), 1.0, metal(rgb(0.7, 0.6, 0.5), 0.0)));
    return world;
  }

  inline Camera defaultCamera() {
    return Camera(Vector3d(13, 2, 3), CameraDirection::lookAt(Vector3d::Zero()),
                  20.0, 0.1, 10.0);
  }
} // namespace Lumen

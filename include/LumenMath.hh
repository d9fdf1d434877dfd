// Eigen aliases, random engine and the sampling helpers used by the
// camera and the materials

#pragma once

#include <LumenConfig.hh>
#include <LumenError.hh>

#include <Eigen/Eigen>
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <random>
#include <string>
#include <vector>

namespace Lumen {
  template <typename T> using Array = std::vector<T>;

  template <typename T> class DefaultRandEngine {
    std::default_random_engine e;
    std::uniform_real_distribution<T> u;

  public:
    DefaultRandEngine() : u(0.0, 1.0) {}

    DefaultRandEngine(std::uint32_t a, std::uint32_t b) : u(0.0, 1.0) {
      setState(a, b);
    }

    void setState(std::uint32_t a, std::uint32_t b) {
      std::seed_seq seq{a, b};
      e.seed(seq);
    }

    // uniform in [0, 1)
    T operator()() { return u(e); }
  };

  using RandEngine = DefaultRandEngine<double>;

  using Eigen::AngleAxisd;
  using Eigen::Matrix3d;
  using Eigen::Vector2d;
  using Eigen::Vector3d;
  using Eigen::Vector4d;

  using std::max;
  using std::min;

  inline double degToRad(double deg) { return deg * PI / 180.0; }

  inline bool nearZero(const Vector3d &v) {
    const double s = 1e-8;
    return std::fabs(v.x()) < s && std::fabs(v.y()) < s &&
           std::fabs(v.z()) < s;
  }

  inline Vector3d reflect(const Vector3d &v, const Vector3d &n) {
    return v - 2.0 * v.dot(n) * n;
  }

  // uv must be unit length, n faces against uv
  inline Vector3d refract(const Vector3d &uv, const Vector3d &n,
                          double ratio) {
    double cosTheta = min(-uv.dot(n), 1.0);
    Vector3d rPerp = ratio * (uv + cosTheta * n);
    Vector3d rPar = -std::sqrt(std::fabs(1.0 - rPerp.squaredNorm())) * n;
    return rPerp + rPar;
  }

  // Schlick's approximation of the Fresnel reflectance
  inline double schlick(double cosTheta, double ratio) {
    double r0 = (1 - ratio) / (1 + ratio);
    r0 = r0 * r0;
    return r0 + (1 - r0) * std::pow(1 - cosTheta, 5);
  }

  // Draws candidates from `propose` until `accept` holds. Every loop
  // terminates with probability one, the cap only guards a broken
  // random source.
  template <typename Gen, typename Propose, typename Accept>
  inline auto rejectionSample(Gen &gen, Propose propose, Accept accept)
      -> decltype(propose(gen)) {
    for (int i = 0; i < MAX_REJECTION_TRIES; ++i) {
      auto candidate = propose(gen);
      if (accept(candidate))
        return candidate;
    }
    throw InternalFault("rejection sampling gave up after " +
                        std::to_string(MAX_REJECTION_TRIES) + " tries");
  }

  template <typename Gen> inline Vector3d randomInCube(Gen &gen) {
    double x = 2.0 * gen() - 1.0;
    double y = 2.0 * gen() - 1.0;
    double z = 2.0 * gen() - 1.0;
    return Vector3d(x, y, z);
  }

  template <typename Gen> inline Vector3d randomInUnitSphere(Gen &gen) {
    return rejectionSample(gen, randomInCube<Gen>, [](const Vector3d &p) {
      return p.squaredNorm() < 1.0;
    });
  }

  // uniform direction on the unit sphere
  template <typename Gen> inline Vector3d randomUnitVector(Gen &gen) {
    Vector3d p =
        rejectionSample(gen, randomInCube<Gen>, [](const Vector3d &c) {
          double n2 = c.squaredNorm();
          return n2 > 1e-12 && n2 <= 1.0;
        });
    return p.normalized();
  }

  template <typename Gen> inline Vector2d randomInUnitDisk(Gen &gen) {
    return rejectionSample(
        gen,
        [](Gen &g) {
          double x = 2.0 * g() - 1.0;
          double y = 2.0 * g() - 1.0;
          return Vector2d(x, y);
        },
        [](const Vector2d &p) { return p.squaredNorm() < 1.0; });
  }
} // namespace Lumen

#pragma once

#include <LumenMath.hh>

namespace Lumen {
  class Material;

  struct Ray {
    Vector3d o, d; // d is not normalized

    Ray() {}

    Ray(const Vector3d &org, const Vector3d &dir) : o(org), d(dir) {}

    Vector3d at(double t) const { return o + t * d; }
  };

  enum class Face { Front, Back };

  // Only produced by intersection tests. The material pointer borrows from
  // the scene, so a record must not outlive it.
  struct Hitrec {
    double t = 0;
    Vector3d pos, norm;
    Face face = Face::Front;
    const Material *mat = nullptr;

    void setFaceNormal(const Ray &r, const Vector3d &outward) {
      face = r.d.dot(outward) < 0 ? Face::Front : Face::Back;
      norm = face == Face::Front ? outward : Vector3d(-outward);
    }

    void setHit(double t, const Vector3d &pos, const Ray &r,
                const Vector3d &outward, const Material *mat) {
      this->t = t;
      this->pos = pos;
      this->mat = mat;
      setFaceNormal(r, outward);
    }
  };
} // namespace Lumen

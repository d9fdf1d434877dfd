#pragma once

#include <LumenMaterial.hh>
#include <LumenRay.hh>

#include <limits>
#include <memory>

namespace Lumen {
  constexpr double INF = std::numeric_limits<double>::infinity();

  class Object {
  public:
    // Nearest intersection with t in [tmin, tmax]. `h` is only written on
    // success.
    virtual bool intersect(const Ray &r, Hitrec &h, double tmin,
                           double tmax = INF) const = 0;

    virtual ~Object() {}
  };

  using ObjectPtr = std::unique_ptr<Object>;
  using SceneRef = std::shared_ptr<const Object>;

  class Sphere : public Object {
    Vector3d p;
    double rad;
    MaterialRef mat;

  public:
    Sphere(const Vector3d &p, double rad, MaterialRef mat)
        : p(p), rad(rad), mat(std::move(mat)) {
      if (!(rad > 0))
        throw ConfigError("sphere radius must be positive, got " +
                          std::to_string(rad));
      if (!this->mat)
        throw ConfigError("sphere needs a material");
    }

    const Vector3d &center() const { return p; }
    double radius() const { return rad; }

    bool intersect(const Ray &r, Hitrec &h, double tmin,
                   double tmax = INF) const override {
      Vector3d oc = r.o - p;
      double a = r.d.squaredNorm();
      if (!(a > 0))
        return false;
      double halfB = oc.dot(r.d);
      double c = oc.squaredNorm() - rad * rad;

      double det = halfB * halfB - a * c;
      if (det < 0)
        return false;
      double sqrtd = std::sqrt(det);

      // nearest root inside the range
      double t = (-halfB - sqrtd) / a;
      if (!(t >= tmin && t <= tmax)) {
        t = (-halfB + sqrtd) / a;
        if (!(t >= tmin && t <= tmax))
          return false;
      }

      Vector3d pos = r.at(t);
      h.setHit(t, pos, r, (pos - p) / rad, mat.get());
      return true;
    }
  };

  // Ordered children, owned. Which of two equally distant hits is reported
  // is unspecified.
  class ObjectList : public Object {
    Array<ObjectPtr> objects;

  public:
    ObjectList() {}

    void add(ObjectPtr obj) {
      if (!obj)
        throw ConfigError("object list child must not be null");
      objects.push_back(std::move(obj));
    }

    size_t size() const { return objects.size(); }
    bool empty() const { return objects.empty(); }

    bool intersect(const Ray &r, Hitrec &h, double tmin,
                   double tmax = INF) const override {
      Hitrec tmp;
      bool hit = false;
      double closest = tmax;
      for (const auto &obj : objects) {
        if (obj->intersect(r, tmp, tmin, closest)) {
          hit = true;
          closest = tmp.t;
          h = tmp;
        }
      }
      return hit;
    }
  };

  inline ObjectPtr sphere(const Vector3d &center, double radius,
                          MaterialRef mat) {
    return std::make_unique<Sphere>(center, radius, std::move(mat));
  }
} // namespace Lumen

#pragma once

#include <LumenPicture.hh>
#include <LumenRay.hh>

#include <memory>

namespace Lumen {
  // Scattering law of a surface. Every material here always scatters,
  // energy is lost only through the attenuation of each bounce.
  class Material {
  public:
    virtual bool scatter(const Ray &in, const Hitrec &h, Color &attenuation,
                         Ray &scattered, RandEngine &gen) const = 0;

    virtual ~Material() {}
  };

  using MaterialRef = std::shared_ptr<const Material>;

  class Lambertian : public Material {
    Color albedo;

  public:
    explicit Lambertian(const Color &albedo) : albedo(albedo) {}

    bool scatter(const Ray &in, const Hitrec &h, Color &attenuation,
                 Ray &scattered, RandEngine &gen) const override {
      Vector3d dir = h.norm + randomUnitVector(gen);
      if (nearZero(dir))
        dir = h.norm;
      scattered = Ray(h.pos, dir);
      attenuation = albedo;
      return true;
    }
  };

  class Metal : public Material {
    Color albedo;
    double fuzz;

  public:
    Metal(const Color &albedo, double fuzz = 0) : albedo(albedo), fuzz(fuzz) {
      if (!(fuzz >= 0 && fuzz <= 1))
        throw ConfigError("metal fuzz must lie in [0,1], got " +
                          std::to_string(fuzz));
    }

    bool scatter(const Ray &in, const Hitrec &h, Color &attenuation,
                 Ray &scattered, RandEngine &gen) const override {
      Vector3d reflected = reflect(in.d.normalized(), h.norm);
      if (fuzz > 0)
        reflected += fuzz * randomInUnitSphere(gen);
      scattered = Ray(h.pos, reflected);
      attenuation = albedo;
      return true;
    }
  };

  // Clear, non-absorbing medium surrounded by vacuum.
  class Dielectric : public Material {
    double refN;

  public:
    explicit Dielectric(double refN) : refN(refN) {
      if (!(refN > 0))
        throw ConfigError("refractive index must be positive, got " +
                          std::to_string(refN));
    }

    double refractiveIndex() const { return refN; }

    // outgoing direction for a uniform draw `u` in [0,1)
    Vector3d direction(const Vector3d &d, const Hitrec &h, double u) const {
      double ratio = h.face == Face::Front ? 1.0 / refN : refN;
      Vector3d unit = d.normalized();
      double cosTheta = min(-unit.dot(h.norm), 1.0);
      double sinTheta = std::sqrt(1.0 - cosTheta * cosTheta);

      // total internal reflection
      if (ratio * sinTheta > 1.0 || u < schlick(cosTheta, ratio))
        return reflect(unit, h.norm);
      return refract(unit, h.norm, ratio);
    }

    bool scatter(const Ray &in, const Hitrec &h, Color &attenuation,
                 Ray &scattered, RandEngine &gen) const override {
      scattered = Ray(h.pos, direction(in.d, h, gen()));
      attenuation = WHITE;
      return true;
    }
  };

  inline MaterialRef lambertian(const Color &albedo) {
    return std::make_shared<Lambertian>(albedo);
  }

  inline MaterialRef metal(const Color &albedo, double fuzz = 0) {
    return std::make_shared<Metal>(albedo, fuzz);
  }

  inline MaterialRef dielectric(double refN) {
    return std::make_shared<Dielectric>(refN);
  }
} // namespace Lumen

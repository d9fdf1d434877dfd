#pragma once

#include <LumenRay.hh>

namespace Lumen {
  // yaw about +y, then pitch about +x, then roll about +z
  inline Matrix3d rollPitchYaw(double pitch, double yaw, double roll) {
    return (AngleAxisd(yaw, Vector3d::UnitY()) *
            AngleAxisd(pitch, Vector3d::UnitX()) *
            AngleAxisd(roll, Vector3d::UnitZ()))
        .toRotationMatrix();
  }

  // Either an explicit rotation or a look-at target, resolved into a
  // rotation only when a viewport is built.
  struct CameraDirection {
    enum Kind { LOOK_AT, ROTATION };

    Kind kind = LOOK_AT;
    Vector3d target = Vector3d::Zero(), up = Vector3d::UnitY();
    Matrix3d rot = Matrix3d::Identity();

    static CameraDirection lookAt(const Vector3d &target,
                                  const Vector3d &up = Vector3d::UnitY()) {
      CameraDirection d;
      d.kind = LOOK_AT;
      d.target = target;
      d.up = up.normalized();
      return d;
    }

    static CameraDirection rotation(const Matrix3d &rot) {
      CameraDirection d;
      d.kind = ROTATION;
      d.rot = rot;
      return d;
    }

    // columns are the camera's right, up and backward axes
    Matrix3d resolve(const Vector3d &pos) const {
      if (kind == ROTATION)
        return rot;
      Vector3d w = (pos - target).normalized();
      Vector3d u = up.cross(w).normalized();
      Vector3d v = w.cross(u);
      Matrix3d m;
      m.col(0) = u;
      m.col(1) = v;
      m.col(2) = w;
      return m;
    }

    bool operator==(const CameraDirection &o) const {
      if (kind != o.kind)
        return false;
      return kind == LOOK_AT ? target == o.target && up == o.up : rot == o.rot;
    }
    bool operator!=(const CameraDirection &o) const { return !(*this == o); }
  };

  // Per-frame projection derived from a camera, never changed in place.
  struct Viewport {
    Vector3d origin;
    double imageWidth, imageHeight;
    Vector3d horizontal, vertical, lowerLeft;
    Vector3d lensU, lensV;
    double lensR;

    // p in [0,1]^2, (0,0) is the lower left corner
    template <typename Gen> Ray emitRay(const Vector2d &p, Gen &gen) const {
      Vector3d offset = Vector3d::Zero();
      if (lensR > 0) {
        Vector2d rd = lensR * randomInUnitDisk(gen);
        offset = lensU * rd.x() + lensV * rd.y();
      }
      return Ray(origin + offset, lowerLeft + p.x() * horizontal +
                                      p.y() * vertical - origin - offset);
    }
  };

  struct Camera {
    Vector3d pos;
    CameraDirection dir;
    double fov;      // vertical, degrees
    double aperture; // lens diameter
    double focus;    // distance to the plane in focus

    Camera()
        : pos(Vector3d::Zero()),
          dir(CameraDirection::lookAt(Vector3d(0, 0, -1))), fov(90),
          aperture(0), focus(1) {}

    Camera(const Vector3d &pos, const CameraDirection &dir, double fov,
           double aperture = 0, double focus = 1)
        : pos(pos), dir(dir), fov(fov), aperture(aperture), focus(focus) {}

    Matrix3d rotation() const { return dir.resolve(pos); }

    Viewport viewport(unsigned width, unsigned height) const {
      if (width == 0 || height == 0)
        throw ConfigError("viewport size must be positive");
      if (!(fov > 0 && fov < 180))
        throw ConfigError("field of view must lie in (0,180) degrees");
      if (!(focus > 0))
        throw ConfigError("focus distance must be positive");
      if (!(aperture >= 0))
        throw ConfigError("aperture must not be negative");

      Viewport vp;
      vp.origin = pos;
      vp.imageWidth = width;
      vp.imageHeight = height;

      double halfH = std::tan(degToRad(fov) / 2);
      double viewH = 2.0 * halfH;
      double viewW = viewH * (vp.imageWidth / vp.imageHeight);

      Matrix3d rot = rotation();
      vp.vertical = rot * Vector3d(0, viewH, 0) * focus;
      vp.horizontal = rot * Vector3d(viewW, 0, 0) * focus;
      Vector3d depth = rot * Vector3d(0, 0, focus);
      vp.lensU = rot * Vector3d::UnitX();
      vp.lensV = rot * Vector3d::UnitY();
      vp.lowerLeft = pos - vp.vertical / 2 - vp.horizontal / 2 - depth;
      vp.lensR = aperture / 2;
      return vp;
    }

    // Moves along the camera's own axes. A look-at camera keeps its target
    // in focus.
    void move(const Vector3d &local) {
      pos += rotation() * local;
      if (dir.kind == CameraDirection::LOOK_AT)
        focus = (pos - dir.target).norm();
    }

    bool operator==(const Camera &o) const {
      return pos == o.pos && dir == o.dir && fov == o.fov &&
             aperture == o.aperture && focus == o.focus;
    }
    bool operator!=(const Camera &o) const { return !(*this == o); }
  };
} // namespace Lumen

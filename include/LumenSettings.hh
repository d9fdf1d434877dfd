// Render settings and the reader for the configuration file. The file only
// carries image, render and camera settings; scenes are built in code.

#pragma once

#include <LumenCamera.hh>
#include <LumenSample.hh>

#include <istream>
#include <string>

namespace Lumen {
  struct RenderSettings {
    int w = 400, h = 225;
    int samples = 8;
    int lines = int(LINES_PER_WORK);
    int bounces = MAX_BOUNCES;
    int frames = 3;
    Vector3d step = Vector3d(0.5, 0, 0); // camera-space move between frames
    std::uint32_t seed = 42;
    std::string output = "frame";

    Vector3d pos = Vector3d(13, 2, 3);
    Vector3d lookAt = Vector3d::Zero();
    Vector3d up = Vector3d::UnitY();
    double fov = 20, aperture = 0.1, focus = 10;

    void validate() const {
      if (w <= 0 || h <= 0)
        throw ConfigError("size must be positive");
      SamplePattern::standard(samples);
      if (lines <= 0)
        throw ConfigError("lines must be positive");
      if (bounces < 0)
        throw ConfigError("bounces must not be negative");
      if (frames <= 0)
        throw ConfigError("frames must be positive");
      if (!(fov > 0 && fov < 180))
        throw ConfigError("fov must lie in (0,180)");
      if (!(aperture >= 0))
        throw ConfigError("aperture must not be negative");
      if (!(focus > 0))
        throw ConfigError("focus distance must be positive");
      if (output.empty())
        throw ConfigError("output name must not be empty");
    }

    Camera camera() const {
      return Camera(pos, CameraDirection::lookAt(lookAt, up), fov, aperture,
                    focus);
    }
  };

  inline RenderSettings parseSettings(std::istream &f) {
    RenderSettings cfg;
    std::string word, section;
    bool open = false;

    auto read = [&](auto &v, const std::string &key) {
      if (!(f >> v))
        throw ConfigError("bad value for '" + key + "'");
    };
    auto readVec = [&](Vector3d &v, const std::string &key) {
      read(v.x(), key);
      read(v.y(), key);
      read(v.z(), key);
    };

    while (f >> word) {
      if (word == "<<ENDCONFIG>>") {
        cfg.validate();
        return cfg;
      }
      if (word == "<<BEGIN>>") {
        open = true;
        continue;
      }
      if (!open)
        throw ConfigError("expected <<BEGIN>>, got '" + word + "'");
      if (word == "<<END>>") {
        open = false;
        section.clear();
        continue;
      }
      if (word == "<<CONFIG>>" || word == "<<CAMERA>>") {
        section = word;
        continue;
      }

      if (section == "<<CONFIG>>") {
        if (word == "size") {
          read(cfg.w, word);
          read(cfg.h, word);
        } else if (word == "samples") {
          read(cfg.samples, word);
        } else if (word == "lines") {
          read(cfg.lines, word);
        } else if (word == "bounces") {
          read(cfg.bounces, word);
        } else if (word == "frames") {
          read(cfg.frames, word);
        } else if (word == "step") {
          readVec(cfg.step, word);
        } else if (word == "seed") {
          read(cfg.seed, word);
        } else if (word == "output") {
          read(cfg.output, word);
        } else {
          throw ConfigError("unknown config key '" + word + "'");
        }
      } else if (section == "<<CAMERA>>") {
        if (word == "pos") {
          readVec(cfg.pos, word);
        } else if (word == "lookAt") {
          readVec(cfg.lookAt, word);
        } else if (word == "up") {
          readVec(cfg.up, word);
        } else if (word == "lens") {
          read(cfg.fov, word);
          read(cfg.aperture, word);
          read(cfg.focus, word);
        } else {
          throw ConfigError("unknown camera key '" + word + "'");
        }
      } else {
        throw ConfigError("unexpected '" + word + "' outside a section");
      }
    }
    throw ConfigError("configuration ended without <<ENDCONFIG>>");
  }
} // namespace Lumen

#include "TestHelpers.hh"

#include <sstream>

using namespace Lumen;

namespace {
  RenderSettings parse(const std::string &text) {
    std::istringstream in(text);
    return parseSettings(in);
  }
} // namespace

TEST_CASE("Configuration file", "[settings]") {
  SECTION("every key") {
    RenderSettings cfg = parse("<<BEGIN>>\n"
                               "<<CONFIG>>\n"
                               "size 320 200\n"
                               "samples 4\n"
                               "lines 10\n"
                               "bounces 12\n"
                               "frames 2\n"
                               "step 0 0 -1\n"
                               "seed 7\n"
                               "output shot\n"
                               "<<CAMERA>>\n"
                               "pos 1 2 3\n"
                               "lookAt 0 1 0\n"
                               "up 0 0 1\n"
                               "lens 35 0.5 4\n"
                               "<<END>>\n"
                               "<<ENDCONFIG>>\n");
    REQUIRE(cfg.w == 320);
    REQUIRE(cfg.h == 200);
    REQUIRE(cfg.samples == 4);
    REQUIRE(cfg.lines == 10);
    REQUIRE(cfg.bounces == 12);
    REQUIRE(cfg.frames == 2);
    requireNear(cfg.step, Vector3d(0, 0, -1));
    REQUIRE(cfg.seed == 7);
    REQUIRE(cfg.output == "shot");
    requireNear(cfg.pos, Vector3d(1, 2, 3));
    requireNear(cfg.lookAt, Vector3d(0, 1, 0));
    requireNear(cfg.up, Vector3d(0, 0, 1));
    REQUIRE(cfg.fov == 35);
    REQUIRE(cfg.aperture == 0.5);
    REQUIRE(cfg.focus == 4);

    Camera cam = cfg.camera();
    requireNear(cam.pos, Vector3d(1, 2, 3));
    REQUIRE(cam.dir.kind == CameraDirection::LOOK_AT);
    REQUIRE(cam.fov == 35);
  }

  SECTION("missing keys keep their defaults") {
    RenderSettings cfg = parse("<<BEGIN>> <<CONFIG>> size 16 8 <<END>> "
                               "<<ENDCONFIG>>");
    RenderSettings defaults;
    REQUIRE(cfg.w == 16);
    REQUIRE(cfg.h == 8);
    REQUIRE(cfg.samples == defaults.samples);
    REQUIRE(cfg.camera() == defaults.camera());
  }

  SECTION("malformed files are refused") {
    REQUIRE_THROWS_AS(parse(""), ConfigError);
    REQUIRE_THROWS_AS(parse("<<BEGIN>> <<CONFIG>> size 4 4 <<END>>"),
                      ConfigError);
    REQUIRE_THROWS_AS(parse("size 4 4 <<ENDCONFIG>>"), ConfigError);
    REQUIRE_THROWS_AS(
        parse("<<BEGIN>> <<CONFIG>> colour red <<END>> <<ENDCONFIG>>"),
        ConfigError);
    REQUIRE_THROWS_AS(
        parse("<<BEGIN>> <<CAMERA>> zoom 2 <<END>> <<ENDCONFIG>>"),
        ConfigError);
    REQUIRE_THROWS_AS(
        parse("<<BEGIN>> <<CONFIG>> size four 4 <<END>> <<ENDCONFIG>>"),
        ConfigError);
    REQUIRE_THROWS_AS(parse("<<BEGIN>> size 4 4 <<END>> <<ENDCONFIG>>"),
                      ConfigError);
  }

  SECTION("values are validated") {
    REQUIRE_THROWS_AS(
        parse("<<BEGIN>> <<CONFIG>> samples 3 <<END>> <<ENDCONFIG>>"),
        ConfigError);
    REQUIRE_THROWS_AS(
        parse("<<BEGIN>> <<CONFIG>> size 0 4 <<END>> <<ENDCONFIG>>"),
        ConfigError);
    REQUIRE_THROWS_AS(
        parse("<<BEGIN>> <<CONFIG>> lines 0 <<END>> <<ENDCONFIG>>"),
        ConfigError);
    REQUIRE_THROWS_AS(
        parse("<<BEGIN>> <<CAMERA>> lens 20 0.1 0 <<END>> <<ENDCONFIG>>"),
        ConfigError);
  }
}

#include "TestHelpers.hh"

#include <stdexcept>

using namespace Lumen;

namespace {
  class ExplodingMaterial : public Material {
  public:
    bool scatter(const Ray &, const Hitrec &, Color &, Ray &,
                 RandEngine &) const override {
      throw std::runtime_error("scatter exploded");
    }
  };

  Camera frontCamera() {
    return Camera(Vector3d(0, 0, 3), CameraDirection::lookAt(Vector3d::Zero()),
                  45.0, 0.0, 3.0);
  }
} // namespace

TEST_CASE("Chunks partition the frame", "[scheduler][chunks]") {
  SECTION("example layout") {
    Array<Chunk> chunks = workChunks(4, 5, 2);
    REQUIRE(chunks.size() == 3);
    REQUIRE(chunks[0].begin == 0);
    REQUIRE(chunks[0].end == 8);
    REQUIRE(chunks[1].begin == 8);
    REQUIRE(chunks[1].end == 16);
    REQUIRE(chunks[2].begin == 16);
    REQUIRE(chunks[2].end == 20);
  }

  SECTION("exact cover for many shapes") {
    for (unsigned w : {1u, 7u, 64u, 800u})
      for (unsigned h : {1u, 3u, 50u, 101u, 600u})
        for (unsigned lines : {1u, 2u, 50u, 200u}) {
          Array<Chunk> chunks = workChunks(w, h, lines);
          std::sort(chunks.begin(), chunks.end(),
                    [](const Chunk &a, const Chunk &b) {
                      return a.begin < b.begin;
                    });
          REQUIRE_FALSE(chunks.empty());
          size_t next = 0;
          for (const Chunk &c : chunks) {
            REQUIRE(c.begin == next);
            REQUIRE(c.end > c.begin);
            REQUIRE(c.size() <= size_t(w) * lines);
            next = c.end;
          }
          REQUIRE(next == size_t(w) * h);
        }
  }

  SECTION("zero lines per work item is refused") {
    REQUIRE_THROWS_AS(workChunks(4, 4, 0), ConfigError);
    REQUIRE_THROWS_AS(FrameScheduler(PathTracer(), SamplePattern::single(), 0),
                      ConfigError);
  }
}

TEST_CASE("Scheduler fills the frame", "[scheduler]") {
  Frame frame(13, 7);

  SECTION("uniform light gives a uniform image") {
    PathTracer tracer(4, Background::uniform(rgb(0.25, 0.25, 0.25)));
    FrameScheduler scheduler(tracer, SamplePattern::multisample4x(), 2);
    REQUIRE(scheduler.render(frame, frontCamera(), *emptyScene()));
    for (const RGBA8 &p : frame.copyPixels())
      REQUIRE(p == RGBA8::fromHex(0x7f7f7fff));
  }

  SECTION("row zero is the bottom of the picture") {
    FrameScheduler scheduler(PathTracer(), SamplePattern::single(), 3);
    REQUIRE(scheduler.render(frame, frontCamera(), *emptyScene()));
    RGBA8 bottom = frame.pixel(6, 0), top = frame.pixel(6, 6);
    REQUIRE(top.r < bottom.r);
    REQUIRE(top.b == 255);
  }

  SECTION("the same seed renders the same image") {
    RandEngine sceneGen(1, 0);
    SceneRef scene = randomScene(sceneGen);
    Camera cam = defaultCamera();
    Frame other(13, 7);
    FrameScheduler a(PathTracer(8), SamplePattern::multisample2x(), 1);
    FrameScheduler b(PathTracer(8), SamplePattern::multisample2x(), 1);
    a.setSeed(99);
    b.setSeed(99);
    REQUIRE(a.render(frame, cam, *scene));
    REQUIRE(b.render(other, cam, *scene));
    REQUIRE(frame.copyPixels() == other.copyPixels());
  }

  SECTION("a stale generation skips the work") {
    frame.clear(RGBA8::fromHex(0x000000ff));
    FrameScheduler scheduler(PathTracer(), SamplePattern::single(), 1);
    std::atomic<std::uint64_t> generation(5);
    REQUIRE_FALSE(
        scheduler.render(frame, frontCamera(), *emptyScene(), &generation, 4));
    for (const RGBA8 &p : frame.copyPixels())
      REQUIRE(p == RGBA8::fromHex(0x000000ff));

    REQUIRE(
        scheduler.render(frame, frontCamera(), *emptyScene(), &generation, 5));
    REQUIRE(frame.pixel(0, 0) != RGBA8::fromHex(0x000000ff));
  }

  SECTION("a failing chunk aborts the pass") {
    SceneRef scene = singleSphere(Vector3d::Zero(), 1.0,
                                  std::make_shared<ExplodingMaterial>());
    FrameScheduler scheduler(PathTracer(), SamplePattern::single(), 1);
    REQUIRE_THROWS_AS(scheduler.render(frame, frontCamera(), *scene),
                      std::runtime_error);
  }
}

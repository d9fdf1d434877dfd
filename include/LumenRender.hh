#pragma once

#include <LumenCamera.hh>
#include <LumenObject.hh>
#include <LumenPicture.hh>
#include <LumenSample.hh>

#include <atomic>
#include <cstdio>
#include <exception>

namespace Lumen {
  // Color seen by a ray that leaves the scene.
  class Background {
    bool flat;
    Color bottom, top;

    Background(bool flat, const Color &bottom, const Color &top)
        : flat(flat), bottom(bottom), top(top) {}

  public:
    // white below, sky blue above
    static Background gradient() {
      return Background(false, WHITE, rgb(0.5, 0.6, 1.0));
    }

    static Background uniform(const Color &c) { return Background(true, c, c); }

    Color operator()(const Ray &r) const {
      if (flat)
        return top;
      double t = 0.5 * (r.d.normalized().y() + 1.0);
      return blend(bottom, top, t);
    }
  };

  class PathTracer {
    int maxBounces;
    Background bg;

  public:
    explicit PathTracer(int maxBounces = MAX_BOUNCES,
                        Background bg = Background::gradient())
        : maxBounces(maxBounces), bg(bg) {
      if (maxBounces < 0)
        throw ConfigError("bounce budget must not be negative");
    }

    int bounces() const { return maxBounces; }

    Color renderRay(const Ray &r, const Object &scene, int bouncesLeft,
                    RandEngine &gen) const {
      if (bouncesLeft <= 0)
        return BLACK;

      Hitrec h;
      if (!scene.intersect(r, h, EPSILON))
        return bg(r);

      Color attenuation;
      Ray scattered;
      if (!h.mat->scatter(r, h, attenuation, scattered, gen))
        return BLACK;
      return attenuation.cwiseProduct(
          renderRay(scattered, scene, bouncesLeft - 1, gen));
    }

    // Averages one ray per pattern offset and applies gamma 2. Pixel (0,0)
    // is the lower left one.
    Color renderPixel(unsigned x, unsigned y, const Viewport &vp,
                      const Object &scene, const SamplePattern &pattern,
                      RandEngine &gen) const {
      double du = max(vp.imageWidth - 1.0, 1.0);
      double dv = max(vp.imageHeight - 1.0, 1.0);
      Color sum = Color::Zero();
      for (const auto &o : pattern.sampleOffsets()) {
        Vector2d p((x + o.x()) / du, (y + o.y()) / dv);
        sum += renderRay(vp.emitRay(p, gen), scene, maxBounces, gen);
      }
      Color avg = sum / double(pattern.size());
      return Color(std::sqrt(avg.x()), std::sqrt(avg.y()),
                   std::sqrt(avg.z()), 1.0);
    }
  };

  // half-open range of flattened pixel indices
  struct Chunk {
    size_t begin, end;

    size_t size() const { return end - begin; }
  };

  // Runs of `width * lines` pixels plus one shorter remainder run, covering
  // [0, width * height) exactly once.
  inline Array<Chunk> workChunks(unsigned width, unsigned height,
                                 unsigned lines) {
    if (lines == 0)
      throw ConfigError("lines per work item must be positive");
    size_t pixels = size_t(width) * height;
    size_t chunkLen = size_t(width) * lines;
    Array<Chunk> chunks;
    if (pixels == 0)
      return chunks;
    size_t full = pixels / chunkLen;
    for (size_t i = 0; i < full; ++i)
      chunks.push_back(Chunk{i * chunkLen, (i + 1) * chunkLen});
    if (pixels % chunkLen)
      chunks.push_back(Chunk{full * chunkLen, pixels});
    return chunks;
  }

  // Renders whole frames in parallel, one work item per chunk of rows.
  // The frame lock is only taken to copy a finished chunk in.
  class FrameScheduler {
    PathTracer tracer;
    SamplePattern pattern;
    unsigned lines;
    std::uint32_t seed = 0;
    std::uint32_t passes = 0;
    bool progress = false;

  public:
    FrameScheduler(const PathTracer &tracer, const SamplePattern &pattern,
                   unsigned lines = LINES_PER_WORK)
        : tracer(tracer), pattern(pattern), lines(lines) {
      if (lines == 0)
        throw ConfigError("lines per work item must be positive");
    }

    void setSeed(std::uint32_t s) { seed = s; }
    void setProgress(bool on) { progress = on; }

    const PathTracer &pathTracer() const { return tracer; }
    const SamplePattern &samplePattern() const { return pattern; }
    unsigned linesPerWork() const { return lines; }

    Array<RGBA8> renderChunk(const Chunk &c, unsigned width,
                             const Viewport &vp, const Object &scene,
                             RandEngine &gen) const {
      Array<RGBA8> run;
      run.reserve(c.size());
      for (size_t i = c.begin; i < c.end; ++i) {
        unsigned x = unsigned(i % width), y = unsigned(i / width);
        run.push_back(RGBA8::fromColor(
            tracer.renderPixel(x, y, vp, scene, pattern, gen)));
      }
      return run;
    }

    // Renders one full frame. When `generation` is given, chunks that have
    // not started yet are skipped as soon as it differs from `expected`;
    // returns false in that case. The first error raised by any chunk
    // aborts the remaining work and is rethrown here.
    bool render(Frame &frame, const Camera &camera, const Object &scene,
                const std::atomic<std::uint64_t> *generation = nullptr,
                std::uint64_t expected = 0) {
      const unsigned width = frame.width(), height = frame.height();
      const Viewport vp = camera.viewport(width, height);
      const Array<Chunk> chunks = workChunks(width, height, lines);
      const std::uint32_t pass = passes++;

      std::exception_ptr error;
      std::atomic<bool> failed(false), cancelled(false);
      std::atomic<size_t> done(0);

      const long n = long(chunks.size());
#pragma omp parallel for schedule(dynamic)
      for (long i = 0; i < n; ++i) {
        if (failed.load() || cancelled.load())
          continue;
        if (generation && generation->load() != expected) {
          cancelled = true;
          continue;
        }
        try {
          const Chunk &c = chunks[size_t(i)];
#ifdef LUMEN_TRACE_CHUNKS
          fprintf(stderr, "> chunk [%zu, %zu)\n", c.begin, c.end);
#endif
          RandEngine gen(seed + pass, std::uint32_t(i));
          Array<RGBA8> run = renderChunk(c, width, vp, scene, gen);
          frame.submit(c.begin, run);
        } catch (...) {
#pragma omp critical(lumen_render_error)
          {
            if (!error)
              error = std::current_exception();
          }
          failed = true;
        }
        size_t k = ++done;
        if (progress)
          fprintf(stderr, "\rRendering %5.2f%%", 100.0 * k / n);
      }
      if (progress)
        fprintf(stderr, "\n");

      if (error)
        std::rethrow_exception(error);
      return !cancelled.load();
    }
  };
} // namespace Lumen

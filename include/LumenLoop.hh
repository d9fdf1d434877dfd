// Render-trigger loop: a worker thread that re-renders the shared frame
// whenever the camera snapshot it polls has changed

#pragma once

#include <LumenRender.hh>

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

namespace Lumen {
  struct State {
    Camera camera;
    SceneRef world;
    std::uint64_t generation = 0;
  };

  // Camera and world owned in one place, handed out by value. Every real
  // change bumps the generation.
  class SharedState {
    mutable std::mutex m;
    State state;
    std::atomic<std::uint64_t> gen;

  public:
    SharedState(const Camera &camera, SceneRef world) : gen(0) {
      if (!world)
        throw ConfigError("shared state needs a scene");
      state.camera = camera;
      state.world = std::move(world);
    }

    State snapshot() const {
      std::lock_guard<std::mutex> lock(m);
      return state;
    }

    void setCamera(const Camera &camera) {
      updateCamera([&](Camera &c) { c = camera; });
    }

    template <typename F> void updateCamera(F fn) {
      std::lock_guard<std::mutex> lock(m);
      Camera c = state.camera;
      fn(c);
      if (c != state.camera) {
        state.camera = c;
        state.generation = ++gen;
      }
    }

    void setWorld(SceneRef world) {
      if (!world)
        throw ConfigError("shared state needs a scene");
      std::lock_guard<std::mutex> lock(m);
      if (world != state.world) {
        state.world = std::move(world);
        state.generation = ++gen;
      }
    }

    Camera camera() const {
      std::lock_guard<std::mutex> lock(m);
      return state.camera;
    }

    const std::atomic<std::uint64_t> &generation() const { return gen; }
  };

  // Polls the shared state and renders a full frame each time the camera
  // (or the world) differs from the last rendered one. A render runs to
  // completion unless stale cancellation is on. The loop ends when the
  // frame is released, on stop(), or after a failed render.
  class RenderLoop {
    std::weak_ptr<Frame> frame;
    SharedState &state;
    FrameScheduler scheduler;

    std::thread worker;
    std::atomic<bool> stopping, cancelStale;

    mutable std::mutex m;
    std::condition_variable cv;
    std::uint64_t frames = 0;
    bool active = false;
    std::exception_ptr error;

    void finished(bool failed, std::exception_ptr e = nullptr) {
      std::lock_guard<std::mutex> lock(m);
      if (failed) {
        error = e;
        active = false;
      } else {
        ++frames;
      }
      cv.notify_all();
    }

    void run() {
      printf("> Render worker started\n");
      bool hasLast = false;
      Camera lastCamera;
      const Object *lastWorld = nullptr;

      while (!stopping.load()) {
        std::shared_ptr<Frame> f = frame.lock();
        if (!f) {
          printf("> Render worker lost its frame\n");
          break;
        }

        State s = state.snapshot();
        if (hasLast && s.camera == lastCamera && s.world.get() == lastWorld) {
          f.reset();
          std::this_thread::sleep_for(std::chrono::milliseconds(1));
          continue;
        }
        hasLast = true;
        lastCamera = s.camera;
        lastWorld = s.world.get();

        printf("> Starting frame render\n");
        auto start = std::chrono::steady_clock::now();
        bool complete = false;
        try {
          complete = scheduler.render(
              *f, s.camera, *s.world,
              cancelStale.load() ? &state.generation() : nullptr,
              s.generation);
        } catch (const std::exception &e) {
          fprintf(stderr, "> Render failed: %s\n", e.what());
          finished(true, std::current_exception());
          return;
        } catch (...) {
          fprintf(stderr, "> Render failed: unknown exception\n");
          finished(true, std::current_exception());
          return;
        }
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                      std::chrono::steady_clock::now() - start)
                      .count();
        if (complete) {
          printf("> Finished rendering. Took %lld ms\n", (long long)ms);
          finished(false);
        } else {
          printf("> Render cancelled after %lld ms\n", (long long)ms);
          hasLast = false;
        }
      }

      printf("> Render worker stopped\n");
      std::lock_guard<std::mutex> lock(m);
      active = false;
      cv.notify_all();
    }

  public:
    RenderLoop(std::weak_ptr<Frame> frame, SharedState &state,
               const FrameScheduler &scheduler)
        : frame(std::move(frame)), state(state), scheduler(scheduler),
          stopping(false), cancelStale(false) {}

    RenderLoop(const RenderLoop &) = delete;
    RenderLoop &operator=(const RenderLoop &) = delete;

    ~RenderLoop() { stop(); }

    void start() {
      if (worker.joinable()) {
        if (running())
          return;
        worker.join();
      }
      {
        std::lock_guard<std::mutex> lock(m);
        active = true;
        error = nullptr;
      }
      stopping = false;
      worker = std::thread(&RenderLoop::run, this);
    }

    void stop() {
      stopping = true;
      if (worker.joinable())
        worker.join();
    }

    void setCancelStale(bool on) { cancelStale = on; }

    bool running() const {
      std::lock_guard<std::mutex> lock(m);
      return active;
    }

    std::uint64_t framesRendered() const {
      std::lock_guard<std::mutex> lock(m);
      return frames;
    }

    std::exception_ptr lastError() const {
      std::lock_guard<std::mutex> lock(m);
      return error;
    }

    // true once `n` frames have completed; false on timeout or when the
    // loop ended first
    template <typename Rep, typename Period>
    bool waitForFrames(std::uint64_t n,
                       std::chrono::duration<Rep, Period> timeout) {
      std::unique_lock<std::mutex> lock(m);
      cv.wait_for(lock, timeout, [&] { return frames >= n || !active; });
      return frames >= n;
    }
  };
} // namespace Lumen

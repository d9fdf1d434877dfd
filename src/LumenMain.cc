#include <Lumen>
#include <chrono>
#include <fstream>
#include <string>
using namespace Lumen;

static RenderSettings loadSettings(int argc, char *argv[]) {
  if (argc < 2) {
    printf("> No configuration given, using defaults\n");
    return RenderSettings();
  }
  std::ifstream f(argv[1]);
  if (!f)
    throw ConfigError(std::string("cannot open '") + argv[1] + "'");
  return parseSettings(f);
}

static void renderFrames(const RenderSettings &config) {
  RandEngine sceneGen(config.seed, 0);
  std::unique_ptr<ObjectList> scene = randomScene(sceneGen);
  printf("> Scene :: %zu objects\n", scene->size());
  SceneRef world = std::move(scene);

  auto frame = std::make_shared<Frame>(config.w, config.h);
  frame->fillGradient();

  SharedState state(config.camera(), world);
  FrameScheduler scheduler(PathTracer(config.bounces),
                           SamplePattern::standard(config.samples),
                           unsigned(config.lines));
  scheduler.setSeed(config.seed);
  scheduler.setProgress(true);

  RenderLoop loop(frame, state, scheduler);
  loop.start();

  std::uint64_t expected = 0;
  for (int i = 0; i < config.frames; ++i) {
    Camera before = state.camera();
    if (i > 0)
      state.updateCamera([&](Camera &c) { c.move(config.step); });
    if (i == 0 || state.camera() != before)
      ++expected;

    if (!loop.waitForFrames(expected, std::chrono::hours(24))) {
      std::exception_ptr e = loop.lastError();
      if (e)
        std::rethrow_exception(e);
      throw std::runtime_error("render loop ended before frame " +
                               std::to_string(i) + " was done");
    }

    char name[512];
    snprintf(name, sizeof(name), "%s%d.ppm", config.output.c_str(), i);
    savePPM(name, frame->width(), frame->height(), frame->copyPixels());
    printf("> Saved '%s'\n", name);
  }
  loop.stop();
}

int main(int argc, char *argv[]) {
  if (argc > 2) {
    fprintf(stderr, "Usage: lumen [configuration]\n");
    exit(EXIT_FAILURE);
  }

  RenderSettings config;
  try {
    config = loadSettings(argc, argv);
  } catch (const std::exception &e) {
    fprintf(stderr, "> Bad configuration: %s\n", e.what());
    exit(EXIT_FAILURE);
  }

  printf("> Canvas :: %dx%d\n", config.w, config.h);
  printf("> Render :: %d samples, %d bounces, %d frames\n", config.samples,
         config.bounces, config.frames);

  try {
    renderFrames(config);
  } catch (const std::exception &e) {
    fprintf(stderr, "> %s\n", e.what());
    exit(EXIT_FAILURE);
  }
  return 0;
}

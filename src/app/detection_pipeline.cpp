#include <neurolens/app/detection_pipeline.hpp>
#include <neurolens/vision/model_detector.hpp>
#include <neurolens/vision/onnx_inference_backend.hpp>
#include <neurolens/vision/simulated_detector.hpp>
#include <array>
#include <chrono>
#include <exception>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <utility>

namespace neurolens::app {

namespace nc = neurolens::core;
namespace nv = neurolens::vision;

namespace {

constexpr std::array<std::string_view, 7> kStageNames{
    "decode", "to_rgb", "resize", "normalize", "layout", "detect", "annotate"};

double elapsed_ms(std::chrono::steady_clock::time_point start) {
  const auto end = std::chrono::steady_clock::now();
  return 1e-3 * static_cast<double>(
      std::chrono::duration_cast<std::chrono::microseconds>(end - start).count());
}

std::unique_ptr<nv::IDetector> make_simulator(const PipelineConfig& config,
                                              const nc::Logger& logger) {
  nv::SimulatorOptions options;
  options.min_latency = std::chrono::milliseconds(config.simulated_latency_ms);
  options.seed = config.simulator_seed;
  return std::make_unique<nv::SimulatedDetector>(options, logger);
}

/// Load and warm up a backend behind a ModelDetector; failures carry the reason.
std::expected<std::unique_ptr<nv::IDetector>, nc::PipelineFailure>
make_model_detector(const PipelineConfig& config, const nc::Logger& logger,
                    const BackendLoader& loader) {
  auto fail = [&config](std::string detail) {
    return std::unexpected(nc::PipelineFailure{
        nc::PipelineError::InvalidConfig,
        "failed to load model " + config.model_path + ": " + std::move(detail)});
  };
  try {
    std::unique_ptr<nv::IInferenceBackend> backend = loader(config);
    if (!backend) {
      return fail("no backend");
    }
    // A model whose output cannot be decoded would fail every request.
    auto warm = backend->warmup();
    if (!warm) {
      return fail("warmup failed: " + warm.error().detail);
    }
    return std::make_unique<nv::ModelDetector>(std::move(backend), logger);
  } catch (const std::exception& e) {
    return fail(e.what());
  }
}

}  // namespace

std::string_view stage_name(std::size_t index) noexcept {
  return index < kStageNames.size() ? kStageNames[index] : std::string_view("unknown");
}

DetectionPipeline::DetectionPipeline(nv::ImagePreprocessor preprocessor,
                                     std::unique_ptr<nv::IDetector> detector,
                                     nv::Annotator annotator,
                                     bool annotate_in_original_space,
                                     nc::Logger logger)
    : preprocessor_(std::move(preprocessor)),
      detector_(std::move(detector)),
      annotator_(std::move(annotator)),
      annotate_in_original_space_(annotate_in_original_space),
      logger_(std::move(logger)) {
  if (!detector_) {
    throw std::invalid_argument("DetectionPipeline: detector must not be null");
  }
}

std::expected<PipelineOutput, nc::PipelineFailure>
DetectionPipeline::run(std::span<const std::byte> image_bytes,
                       nc::StageTimingCallback* timing_cb) {
  auto prepared = preprocessor_.preprocess(image_bytes, timing_cb);
  if (!prepared) return std::unexpected(prepared.error());

  nv::DetectionRun run = detector_->detect(prepared->tensor);
  if (timing_cb && *timing_cb) (*timing_cb)(kDetectStageIndex, run.elapsed_ms);

  PipelineOutput out;
  out.elapsed_ms = run.elapsed_ms;
  out.original_size = prepared->original_size;
  out.result = std::move(run.result);

  if (out.result.found && out.result.box) {
    const auto start = std::chrono::steady_clock::now();
    nc::BBox box = *out.result.box;
    if (annotate_in_original_space_) {
      box = preprocessor_.denormalize_box(box, out.original_size);
    }
    const std::array<int, 4> values = box.to_array();
    out.annotated = annotator_.annotate(image_bytes, std::span<const int>(values), true);
    if (timing_cb && *timing_cb) (*timing_cb)(kAnnotateStageIndex, elapsed_ms(start));
  }

  logger_.info("Prediction complete: found=" + std::string(out.result.found ? "true" : "false") +
               " source=" + std::string(nc::to_string(out.result.source)));
  return out;
}

std::unique_ptr<nv::IInferenceBackend> load_onnx_backend(const PipelineConfig& config) {
  std::error_code ec;
  if (config.model_path.empty() || !std::filesystem::is_regular_file(config.model_path, ec)) {
    throw std::runtime_error("model file not found");
  }
  return std::make_unique<nv::OnnxInferenceBackend>(
      config.model_path, nv::DetectorThresholds{config.confidence_threshold, config.iou_threshold});
}

std::expected<std::unique_ptr<nv::IDetector>, nc::PipelineFailure>
make_detector(const PipelineConfig& config, const nc::Logger& logger) {
  return make_detector(config, logger, load_onnx_backend);
}

std::expected<std::unique_ptr<nv::IDetector>, nc::PipelineFailure>
make_detector(const PipelineConfig& config, const nc::Logger& logger,
              const BackendLoader& loader) {
  switch (config.backend_type) {
    case BackendMode::Simulated:
      logger.info("Using simulated detector");
      return make_simulator(config, logger);
    case BackendMode::Onnx: {
      auto detector = make_model_detector(config, logger, loader);
      if (detector) logger.info("Loaded model " + config.model_path);
      return detector;
    }
    case BackendMode::Auto: {
      auto detector = make_model_detector(config, logger, loader);
      if (detector) {
        logger.info("Loaded model " + config.model_path);
        return detector;
      }
      logger.warn(detector.error().detail + "; falling back to simulated detector");
      return make_simulator(config, logger);
    }
  }
  return std::unexpected(nc::PipelineFailure{nc::PipelineError::InvalidConfig,
                                             "unknown backend_type"});
}

std::expected<DetectionPipeline, nc::PipelineFailure>
build_pipeline(const PipelineConfig& config, nc::Logger logger) {
  auto valid = validate_config(config);
  if (!valid) return std::unexpected(valid.error());

  if (config.cache_predictions) {
    logger.warn("cache_predictions is set but ignored: predictions are never cached");
  }

  auto detector = make_detector(config, logger);
  if (!detector) return std::unexpected(detector.error());

  nv::PreprocessorOptions options;
  options.target_width = config.target_width;
  options.target_height = config.target_height;
  options.mean = config.normalize_mean;
  options.std = config.normalize_std;

  return DetectionPipeline(nv::ImagePreprocessor(options, logger), std::move(*detector),
                           nv::Annotator({}, logger), config.annotate_in_original_space,
                           logger);
}

void run_pipeline_batch(DetectionPipeline& pipeline,
                        const std::vector<nc::RawImage>& images,
                        const PipelineOutputCallback& callback,
                        nc::StageTimingCallback* timing_cb) {
  for (std::size_t i = 0; i < images.size(); ++i) {
    auto outcome = pipeline.run(images[i], timing_cb);
    if (callback) callback(i, outcome);
  }
}

}  // namespace neurolens::app

/**
 * neurolens-cli — Run tumor detection on MRI scan image(s); print one JSON result per image.
 * Build: cmake -B build && cmake --build build
 * Run:   ./build/neurolens_cli [--config path] [--backend auto|onnx|simulated] --input path...
 * With --annotated-out: also writes <dir>/<basename>_annotated.png for every positive finding.
 */

#include <neurolens/app/config.hpp>
#include <neurolens/app/detection_pipeline.hpp>
#include <neurolens/app/result_json.hpp>
#include <neurolens/core/error.hpp>
#include <neurolens/core/logging.hpp>
#include <neurolens/core/raw_image.hpp>
#include <neurolens/vision/load_image.hpp>

#include <charconv>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace {

constexpr int kExitOk = 0;
constexpr int kExitUsage = 1;
constexpr int kExitInputFailed = 2;

void print_usage() {
  std::cout << "Usage: neurolens_cli [options] --input <path> [--input <path> ...]\n"
            << "  --config <path>         Pipeline config (key=value file); default: built-in\n"
            << "  --backend <mode>        auto | onnx | simulated (default from config: auto)\n"
            << "  --model <path>          Override model path (.onnx)\n"
            << "  --seed <n>              Seed the simulated detector for reproducible output\n"
            << "  --annotated-out <dir>   Write annotated PNGs for positive findings\n"
            << "  --original-space        Draw boxes rescaled to the uploaded image\n"
            << "  --verbose               Log at debug level (stage timings)\n"
            << "  --input <path>          Image path; may be repeated\n"
            << "\nEnvironment: MODEL_PATH, CONFIDENCE_THRESHOLD, IOU_THRESHOLD, DETECTOR_BACKEND,\n"
            << "SIMULATOR_SEED and LOG_LEVEL override the config file; flags override both.\n";
}

bool write_png(const std::filesystem::path& path, const std::vector<std::byte>& png) {
  std::ofstream f(path, std::ios::binary);
  if (!f) return false;
  f.write(reinterpret_cast<const char*>(png.data()), static_cast<std::streamsize>(png.size()));
  return static_cast<bool>(f);
}

}  // namespace

int main(int argc, char* argv[]) {
  std::string config_path;
  std::vector<std::string> input_paths;
  std::string backend_override;
  std::string model_override;
  std::string seed_override;
  std::string annotated_dir;
  bool original_space = false;
  bool verbose = false;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--input" && i + 1 < argc) {
      input_paths.emplace_back(argv[++i]);
    } else if (arg == "--backend" && i + 1 < argc) {
      backend_override = argv[++i];
    } else if (arg == "--model" && i + 1 < argc) {
      model_override = argv[++i];
    } else if (arg == "--seed" && i + 1 < argc) {
      seed_override = argv[++i];
    } else if (arg == "--annotated-out" && i + 1 < argc) {
      annotated_dir = argv[++i];
    } else if (arg == "--original-space") {
      original_space = true;
    } else if (arg == "--verbose") {
      verbose = true;
    } else if (arg == "--help" || arg == "-h") {
      print_usage();
      return kExitOk;
    } else {
      std::cerr << "Unknown argument: " << arg << "\n";
      print_usage();
      return kExitUsage;
    }
  }
  if (input_paths.empty()) {
    std::cerr << "At least one --input is required\n";
    print_usage();
    return kExitUsage;
  }

  auto loaded = config_path.empty() ? std::expected<neurolens::app::PipelineConfig,
                                                    neurolens::core::PipelineFailure>(
                                          neurolens::app::default_config())
                                    : neurolens::app::load_config(config_path);
  if (!loaded) {
    std::cerr << "Config error: " << loaded.error().detail << "\n";
    return kExitUsage;
  }
  neurolens::app::PipelineConfig cfg = std::move(*loaded);

  if (auto env = neurolens::app::apply_env_overrides(cfg); !env) {
    std::cerr << "Config error: " << env.error().detail << "\n";
    return kExitUsage;
  }

  if (!backend_override.empty()) {
    const auto mode = neurolens::app::parse_backend_mode(backend_override);
    if (!mode) {
      std::cerr << "Unknown --backend " << backend_override << " (use auto, onnx, or simulated)\n";
      return kExitUsage;
    }
    cfg.backend_type = *mode;
  }
  if (!model_override.empty()) {
    cfg.model_path = model_override;
  }
  if (!seed_override.empty()) {
    std::uint64_t seed = 0;
    const char* end = seed_override.data() + seed_override.size();
    const auto [ptr, ec] = std::from_chars(seed_override.data(), end, seed);
    if (ec != std::errc{} || ptr != end) {
      std::cerr << "Invalid --seed " << seed_override << "\n";
      return kExitUsage;
    }
    cfg.simulator_seed = seed;
  }
  if (original_space) {
    cfg.annotate_in_original_space = true;
  }
  if (verbose) {
    cfg.log_level = neurolens::core::LogLevel::Debug;
  }

  neurolens::core::Logger logger(neurolens::core::stderr_sink(), cfg.log_level);

  auto pipeline = neurolens::app::build_pipeline(cfg, logger);
  if (!pipeline) {
    std::cerr << "Pipeline error: " << neurolens::core::to_string(pipeline.error().code) << ": "
              << pipeline.error().detail << "\n";
    return kExitUsage;
  }
  logger.info("Detector: " + std::string(pipeline->detector().name()));

  neurolens::core::StageTimingCallback timing = [&logger](std::size_t stage, double ms) {
    std::ostringstream msg;
    msg << "  " << neurolens::app::stage_name(stage) << ": " << std::fixed
        << std::setprecision(3) << ms << " ms";
    logger.debug(msg.str());
  };

  if (!annotated_dir.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(annotated_dir, ec);
    if (ec) {
      std::cerr << "Cannot create " << annotated_dir << ": " << ec.message() << "\n";
      return kExitUsage;
    }
  }

  int exit_code = kExitOk;
  std::vector<neurolens::core::RawImage> images;
  std::vector<std::string> image_paths;
  for (const auto& input_path : input_paths) {
    auto image = neurolens::vision::read_raw_image(input_path);
    if (!image) {
      std::cerr << "Failed to read image: " << input_path << "\n";
      exit_code = kExitInputFailed;
      continue;
    }
    images.push_back(std::move(*image));
    image_paths.push_back(input_path);
  }

  neurolens::app::run_pipeline_batch(
      *pipeline, images,
      [&](std::size_t index,
          const std::expected<neurolens::app::PipelineOutput, neurolens::core::PipelineFailure>&
              outcome) {
        const std::string& input_path = image_paths[index];
        nlohmann::json doc;
        if (!outcome) {
          doc = neurolens::app::to_json(outcome.error());
          exit_code = kExitInputFailed;
        } else {
          doc = neurolens::app::to_json(*outcome);
          if (outcome->result.error) exit_code = kExitInputFailed;
          if (outcome->annotated && !annotated_dir.empty()) {
            const std::filesystem::path out_file =
                std::filesystem::path(annotated_dir) /
                (std::filesystem::path(input_path).stem().string() + "_annotated.png");
            if (write_png(out_file, outcome->annotated->png)) {
              doc["annotated_path"] = out_file.string();
            } else {
              std::cerr << "Warning: could not write " << out_file << "\n";
            }
          }
        }
        doc["input"] = input_path;
        std::cout << doc.dump(2) << "\n";
      },
      &timing);
  return exit_code;
}

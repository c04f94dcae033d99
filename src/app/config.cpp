#include <neurolens/app/config.hpp>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <string_view>
#include <system_error>
#include <utility>

namespace neurolens::app {

namespace nc = neurolens::core;

namespace {

void trim(std::string& s) {
  const auto start = s.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) {
    s.clear();
    return;
  }
  const auto end = s.find_last_not_of(" \t\r\n");
  s = s.substr(start, end == std::string::npos ? std::string::npos : end - start + 1);
}

bool parse_line(std::string_view line, std::string& key, std::string& value) {
  const auto pos = line.find('=');
  if (pos == std::string_view::npos) return false;
  key.assign(line.substr(0, pos));
  value.assign(line.substr(pos + 1));
  trim(key);
  trim(value);
  return !key.empty();
}

nc::PipelineFailure invalid(std::string_view key, std::string_view value) {
  return nc::PipelineFailure{nc::PipelineError::InvalidConfig,
                             "invalid value for " + std::string(key) + ": '" +
                                 std::string(value) + "'"};
}

template <typename T>
bool parse_number(std::string_view text, T& out) {
  T parsed{};
  const char* first = text.data();
  const char* last = text.data() + text.size();
  const auto [ptr, ec] = std::from_chars(first, last, parsed);
  if (ec != std::errc{} || ptr != last) return false;
  out = parsed;
  return true;
}

bool parse_bool(std::string_view text, bool& out) {
  if (text == "true" || text == "1" || text == "yes" || text == "on") {
    out = true;
    return true;
  }
  if (text == "false" || text == "0" || text == "no" || text == "off") {
    out = false;
    return true;
  }
  return false;
}

/// "a,b,c" -> three floats.
bool parse_triple(std::string_view text, neurolens::vision::ChannelStats& out) {
  neurolens::vision::ChannelStats parsed{};
  std::size_t start = 0;
  for (std::size_t i = 0; i < parsed.size(); ++i) {
    const auto comma = text.find(',', start);
    const bool last = i + 1 == parsed.size();
    if (last != (comma == std::string_view::npos)) return false;
    std::string item(text.substr(start, last ? std::string_view::npos : comma - start));
    trim(item);
    if (!parse_number(std::string_view(item), parsed[i])) return false;
    start = comma + 1;
  }
  out = parsed;
  return true;
}

/// Applies one key; false when the value is malformed. Unknown keys are accepted.
bool apply_key(PipelineConfig& c, const std::string& key, const std::string& value) {
  if (key == "model_path") {
    c.model_path = value;
    return true;
  }
  if (key == "backend_type") {
    const auto mode = parse_backend_mode(value);
    if (!mode) return false;
    c.backend_type = *mode;
    return true;
  }
  if (key == "target_width") return parse_number(value, c.target_width);
  if (key == "target_height") return parse_number(value, c.target_height);
  if (key == "normalize_mean") return parse_triple(value, c.normalize_mean);
  if (key == "normalize_std") return parse_triple(value, c.normalize_std);
  if (key == "confidence_threshold") return parse_number(value, c.confidence_threshold);
  if (key == "iou_threshold") return parse_number(value, c.iou_threshold);
  if (key == "simulated_latency_ms") return parse_number(value, c.simulated_latency_ms);
  if (key == "simulator_seed") {
    std::uint64_t seed = 0;
    if (!parse_number(value, seed)) return false;
    c.simulator_seed = seed;
    return true;
  }
  if (key == "annotate_in_original_space") return parse_bool(value, c.annotate_in_original_space);
  if (key == "cache_predictions") return parse_bool(value, c.cache_predictions);
  if (key == "log_level") {
    const auto level = nc::parse_log_level(value);
    if (!level) return false;
    c.log_level = *level;
    return true;
  }
  return true;
}

std::optional<std::string> process_env(std::string_view name) {
  const char* value = std::getenv(std::string(name).c_str());
  if (value == nullptr) return std::nullopt;
  return std::string(value);
}

}  // namespace

PipelineConfig default_config() {
  return PipelineConfig{};
}

std::expected<PipelineConfig, nc::PipelineFailure> load_config(const std::string& path) {
  PipelineConfig c = default_config();
  std::ifstream f(path);
  if (!f) return c;

  std::string line;
  std::string key;
  std::string value;
  while (std::getline(f, line)) {
    trim(line);
    if (line.empty() || line[0] == '#') continue;
    if (!parse_line(line, key, value)) continue;
    if (!apply_key(c, key, value)) {
      return std::unexpected(invalid(key, value));
    }
  }
  return c;
}

std::expected<void, nc::PipelineFailure> apply_env_overrides(PipelineConfig& config,
                                                             const EnvLookup& lookup) {
  static constexpr std::pair<std::string_view, std::string_view> kOverrides[] = {
      {"MODEL_PATH", "model_path"},
      {"CONFIDENCE_THRESHOLD", "confidence_threshold"},
      {"IOU_THRESHOLD", "iou_threshold"},
      {"DETECTOR_BACKEND", "backend_type"},
      {"SIMULATOR_SEED", "simulator_seed"},
      {"LOG_LEVEL", "log_level"},
  };
  for (const auto& [env_name, key] : kOverrides) {
    auto value = lookup ? lookup(env_name) : process_env(env_name);
    if (!value) continue;
    trim(*value);
    if (!apply_key(config, std::string(key), *value)) {
      return std::unexpected(invalid(env_name, *value));
    }
  }
  return {};
}

std::expected<void, nc::PipelineFailure> validate_config(const PipelineConfig& config) {
  auto fail = [](std::string detail) {
    return std::unexpected(nc::PipelineFailure{nc::PipelineError::InvalidConfig,
                                               std::move(detail)});
  };
  if (config.target_width == 0 || config.target_height == 0) {
    return fail("target size must be positive");
  }
  for (float s : config.normalize_std) {
    if (!(s > 0.f)) return fail("normalize_std values must be positive");
  }
  if (!(config.confidence_threshold >= 0.f && config.confidence_threshold <= 1.f)) {
    return fail("confidence_threshold must be in [0, 1]");
  }
  if (!(config.iou_threshold >= 0.f && config.iou_threshold <= 1.f)) {
    return fail("iou_threshold must be in [0, 1]");
  }
  if (config.backend_type == BackendMode::Onnx && config.model_path.empty()) {
    return fail("backend_type=onnx requires model_path");
  }
  return {};
}

std::optional<BackendMode> parse_backend_mode(std::string_view text) {
  if (text == "auto") return BackendMode::Auto;
  if (text == "onnx") return BackendMode::Onnx;
  if (text == "simulated") return BackendMode::Simulated;
  return std::nullopt;
}

std::string_view to_string(BackendMode mode) noexcept {
  switch (mode) {
    case BackendMode::Auto:
      return "auto";
    case BackendMode::Onnx:
      return "onnx";
    case BackendMode::Simulated:
      return "simulated";
  }
  return "unknown";
}

}  // namespace neurolens::app

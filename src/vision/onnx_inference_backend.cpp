#include <neurolens/vision/onnx_inference_backend.hpp>
#include <neurolens/vision/model_output.hpp>
#include "frame_cv_utils.hpp"
#include <onnxruntime_cxx_api.h>
#include <array>
#include <cstdint>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

namespace neurolens::vision {

namespace nc = neurolens::core;

namespace {

constexpr std::int64_t kNumChannels = 3;

Ort::MemoryInfo CpuMemoryInfo() {
  return Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault);
}

nc::PipelineFailure fault(std::string detail) {
  return nc::PipelineFailure{nc::PipelineError::InferenceFault, std::move(detail)};
}

}  // namespace

struct OnnxInferenceBackend::Impl {
  Ort::Env env{ORT_LOGGING_LEVEL_WARNING, "neurolens"};
  Ort::SessionOptions session_options;
  Ort::Session session{nullptr};

  std::string input_name;
  std::string output_name;
  DetectorThresholds thresholds;

  std::uint32_t input_height{0};
  std::uint32_t input_width{0};
  bool input_is_nchw{true};

  std::vector<float> input_buffer;  // scratch for CHW -> HWC

  Impl() {
    session_options.SetIntraOpNumThreads(1);
    session_options.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_EXTENDED);
  }
};

OnnxInferenceBackend::OnnxInferenceBackend(std::string model_path,
                                           DetectorThresholds thresholds,
                                           std::string input_name)
    : impl_(std::make_unique<Impl>()) {
  impl_->thresholds = thresholds;
  impl_->session = Ort::Session(impl_->env, model_path.c_str(), impl_->session_options);

  Ort::AllocatorWithDefaultOptions allocator;
  if (impl_->session.GetInputCount() == 0) {
    throw std::runtime_error("OnnxInferenceBackend: model has no inputs");
  }
  if (input_name.empty()) {
    impl_->input_name = impl_->session.GetInputNameAllocated(0, allocator).get();
  } else {
    impl_->input_name = std::move(input_name);
  }

  Ort::TypeInfo input_type = impl_->session.GetInputTypeInfo(0);
  const auto shape_info = input_type.GetTensorTypeAndShapeInfo();
  const std::vector<int64_t> dims = shape_info.GetShape();
  if (dims.size() != 4u) {
    throw std::runtime_error("OnnxInferenceBackend: expected 4D input");
  }
  // NCHW: [1, C, H, W] or NHWC: [1, H, W, C]; non-positive H/W means dynamic.
  auto to_size = [](int64_t d) { return d > 0 ? static_cast<std::uint32_t>(d) : 0u; };
  if (dims[1] == kNumChannels) {
    impl_->input_is_nchw = true;
    impl_->input_height = to_size(dims[2]);
    impl_->input_width = to_size(dims[3]);
  } else if (dims[3] == kNumChannels) {
    impl_->input_is_nchw = false;
    impl_->input_height = to_size(dims[1]);
    impl_->input_width = to_size(dims[2]);
  } else {
    throw std::runtime_error("OnnxInferenceBackend: expected input shape [1,3,H,W] or [1,H,W,3]");
  }

  if (impl_->session.GetOutputCount() == 0) {
    throw std::runtime_error("OnnxInferenceBackend: model has no outputs");
  }
  impl_->output_name = impl_->session.GetOutputNameAllocated(0, allocator).get();
}

OnnxInferenceBackend::~OnnxInferenceBackend() = default;

const DetectorThresholds& OnnxInferenceBackend::thresholds() const noexcept {
  return impl_->thresholds;
}

std::uint32_t OnnxInferenceBackend::input_width() const noexcept { return impl_->input_width; }

std::uint32_t OnnxInferenceBackend::input_height() const noexcept { return impl_->input_height; }

std::expected<void, nc::PipelineFailure>
OnnxInferenceBackend::validate_input(const nc::NormalizedTensor& input) const {
  if (input.empty()) {
    return std::unexpected(fault("empty input tensor"));
  }
  if (input.channels() != static_cast<std::uint32_t>(kNumChannels)) {
    return std::unexpected(fault("model expects a 3-channel tensor"));
  }
  if ((impl_->input_width != 0 && input.width() != impl_->input_width) ||
      (impl_->input_height != 0 && input.height() != impl_->input_height)) {
    return std::unexpected(fault("tensor size " + std::to_string(input.width()) + "x" +
                                 std::to_string(input.height()) + " does not match model input " +
                                 std::to_string(impl_->input_width) + "x" +
                                 std::to_string(impl_->input_height)));
  }
  return {};
}

std::expected<InferenceResult, nc::PipelineFailure>
OnnxInferenceBackend::infer(const nc::NormalizedTensor& input) {
  auto valid = validate_input(input);
  if (!valid) {
    return std::unexpected(valid.error());
  }

  const std::uint32_t h = input.height();
  const std::uint32_t w = input.width();
  const std::size_t num_floats = input.size();

  Ort::MemoryInfo mem_info = CpuMemoryInfo();
  Ort::Value input_tensor{nullptr};

  if (impl_->input_is_nchw) {
    const std::array<int64_t, 4> shape{1, kNumChannels, static_cast<int64_t>(h),
                                       static_cast<int64_t>(w)};
    input_tensor = Ort::Value::CreateTensor<float>(
        mem_info, const_cast<float*>(input.values().data()), num_floats,
        shape.data(), shape.size());
  } else {
    impl_->input_buffer.resize(num_floats);
    detail::chw_to_hwc(input.values().data(), h, w, static_cast<std::uint32_t>(kNumChannels),
                       impl_->input_buffer.data());
    const std::array<int64_t, 4> shape{1, static_cast<int64_t>(h), static_cast<int64_t>(w),
                                       kNumChannels};
    input_tensor = Ort::Value::CreateTensor<float>(
        mem_info, impl_->input_buffer.data(), num_floats, shape.data(), shape.size());
  }

  const char* input_names_c[] = {impl_->input_name.c_str()};
  const char* output_names_c[] = {impl_->output_name.c_str()};
  Ort::RunOptions run_options;

  std::vector<Ort::Value> outputs;
  try {
    outputs = impl_->session.Run(run_options, input_names_c, &input_tensor, 1,
                                 output_names_c, 1);
  } catch (const Ort::Exception& e) {
    return std::unexpected(fault(std::string("onnxruntime: ") + e.what()));
  }
  if (outputs.size() != 1u || !outputs[0].IsTensor()) {
    return std::unexpected(fault("model produced no output tensor"));
  }

  const auto type_info = outputs[0].GetTensorTypeAndShapeInfo();
  if (type_info.GetElementType() != ONNX_TENSOR_ELEMENT_DATA_TYPE_FLOAT) {
    return std::unexpected(fault("model output is not a float tensor"));
  }
  const std::vector<std::int64_t> shape = type_info.GetShape();
  const std::span<const float> data(outputs[0].GetTensorData<float>(),
                                    type_info.GetElementCount());
  return decode_model_output(data, shape, impl_->thresholds);
}

std::expected<void, nc::PipelineFailure> OnnxInferenceBackend::warmup() {
  const std::uint32_t h = impl_->input_height != 0 ? impl_->input_height : 640u;
  const std::uint32_t w = impl_->input_width != 0 ? impl_->input_width : 640u;
  std::vector<float> zeros(static_cast<std::size_t>(kNumChannels) * h * w, 0.f);
  const nc::NormalizedTensor tensor(static_cast<std::uint32_t>(kNumChannels), h, w,
                                    std::move(zeros));
  auto result = infer(tensor);
  if (!result) {
    return std::unexpected(result.error());
  }
  return {};
}

}  // namespace neurolens::vision

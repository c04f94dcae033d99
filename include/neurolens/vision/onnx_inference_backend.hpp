#pragma once

#include <neurolens/core/error.hpp>
#include <neurolens/core/tensor.hpp>
#include <neurolens/vision/inference_backend.hpp>
#include <neurolens/vision/inference_result.hpp>
#include <cstdint>
#include <memory>
#include <string>

namespace neurolens::vision {

/// ONNX Runtime inference backend: loads an ONNX detection model and implements IInferenceBackend.
///
/// Expected model: one float image input, [1,3,H,W] (NCHW) or [1,H,W,3] (NHWC), and a
/// first output in one of these layouts:
/// - **End-to-end**: [1, N, 6] or [1, 6, N] with (x1, y1, x2, y2, score, class_id) per
///   detection (e.g. YOLOv10 exports).
/// - **Raw YOLOv8 head**: [1, 4+C, N] (or [1, N, 4+C]) with (cx, cy, w, h) followed by
///   C class scores per candidate.
/// Candidates scoring below the confidence threshold are dropped, then class-aware
/// non-maximum suppression with the IoU threshold is applied. Boxes stay in
/// tensor-space pixels.
///
/// The constructor throws (Ort::Exception or std::runtime_error) when the model
/// cannot be loaded or has an unsupported shape. infer() reuses a scratch buffer,
/// so one instance must not be used from several threads at once.
class OnnxInferenceBackend : public IInferenceBackend {
 public:
  /// \param model_path Path to the .onnx model file.
  /// \param thresholds Confidence / IoU cutoffs applied to every inference.
  /// \param input_name Optional input tensor name; if empty, the first input is used.
  OnnxInferenceBackend(std::string model_path,
                       DetectorThresholds thresholds = {},
                       std::string input_name = {});

  ~OnnxInferenceBackend() override;

  OnnxInferenceBackend(const OnnxInferenceBackend&) = delete;
  OnnxInferenceBackend& operator=(const OnnxInferenceBackend&) = delete;

  [[nodiscard]] std::expected<InferenceResult, neurolens::core::PipelineFailure>
  infer(const neurolens::core::NormalizedTensor& input) override;

  [[nodiscard]] std::expected<void, neurolens::core::PipelineFailure>
  validate_input(const neurolens::core::NormalizedTensor& input) const override;

  /// Runs a zero tensor; fails when the model output cannot be decoded.
  [[nodiscard]] std::expected<void, neurolens::core::PipelineFailure> warmup() override;

  [[nodiscard]] std::string_view name() const noexcept override { return "onnx"; }

  [[nodiscard]] const DetectorThresholds& thresholds() const noexcept;
  /// Model input size; 0 when the model accepts a dynamic size.
  [[nodiscard]] std::uint32_t input_width() const noexcept;
  [[nodiscard]] std::uint32_t input_height() const noexcept;

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace neurolens::vision

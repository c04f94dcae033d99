#include <neurolens/vision/model_output.hpp>
#include <opencv2/core/types.hpp>
#include <opencv2/dnn.hpp>
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace neurolens::vision {

namespace nc = neurolens::core;

namespace {

constexpr std::int64_t kEndToEndAttributes = 6;  // x1, y1, x2, y2, score, class_id
constexpr std::int64_t kBoxAttributes = 4;       // cx, cy, w, h
/// Per-class box offset so one NMS pass never suppresses across classes.
constexpr double kClassOffset = 7680.0;

nc::PipelineFailure fault(std::string detail) {
  return nc::PipelineFailure{nc::PipelineError::InferenceFault, std::move(detail)};
}

struct Candidate {
  cv::Rect2d rect;
  float score{0.f};
  std::int64_t class_id{0};
};

std::vector<Candidate> read_end_to_end(const float* data, std::int64_t n, bool row_major,
                                       float min_score) {
  std::vector<Candidate> out;
  for (std::int64_t i = 0; i < n; ++i) {
    auto at = [&](std::int64_t attr) {
      return row_major ? data[i * kEndToEndAttributes + attr] : data[attr * n + i];
    };
    const float score = at(4);
    if (score < min_score) continue;
    const float x1 = at(0);
    const float y1 = at(1);
    out.push_back(Candidate{cv::Rect2d(x1, y1, at(2) - x1, at(3) - y1), score,
                            static_cast<std::int64_t>(at(5))});
  }
  return out;
}

std::vector<Candidate> read_raw_head(const float* data, std::int64_t n, std::int64_t attributes,
                                     bool channel_major, float min_score) {
  std::vector<Candidate> out;
  for (std::int64_t i = 0; i < n; ++i) {
    auto at = [&](std::int64_t attr) {
      return channel_major ? data[attr * n + i] : data[i * attributes + attr];
    };
    std::int64_t best_class = 0;
    float best_score = -1.f;
    for (std::int64_t c = kBoxAttributes; c < attributes; ++c) {
      const float s = at(c);
      if (s > best_score) {
        best_score = s;
        best_class = c - kBoxAttributes;
      }
    }
    if (best_score < min_score) continue;
    const float cx = at(0);
    const float cy = at(1);
    const float bw = at(2);
    const float bh = at(3);
    out.push_back(Candidate{cv::Rect2d(cx - bw / 2.f, cy - bh / 2.f, bw, bh), best_score,
                            best_class});
  }
  return out;
}

InferenceResult suppress(const std::vector<Candidate>& candidates,
                         const DetectorThresholds& thresholds) {
  InferenceResult result;
  if (candidates.empty()) return result;

  std::vector<cv::Rect2d> shifted;
  std::vector<float> scores;
  shifted.reserve(candidates.size());
  scores.reserve(candidates.size());
  for (const auto& c : candidates) {
    const double offset = static_cast<double>(c.class_id) * kClassOffset;
    shifted.emplace_back(c.rect.x + offset, c.rect.y + offset, c.rect.width, c.rect.height);
    scores.push_back(c.score);
  }

  std::vector<int> keep;
  cv::dnn::NMSBoxes(shifted, scores, thresholds.confidence, thresholds.iou, keep);

  for (int idx : keep) {
    const Candidate& c = candidates[static_cast<std::size_t>(idx)];
    result.add(static_cast<float>(c.rect.x), static_cast<float>(c.rect.y),
               static_cast<float>(c.rect.x + c.rect.width),
               static_cast<float>(c.rect.y + c.rect.height), c.score, c.class_id);
  }
  return result;
}

}  // namespace

std::expected<InferenceResult, nc::PipelineFailure>
decode_model_output(std::span<const float> data, std::span<const std::int64_t> shape,
                    const DetectorThresholds& thresholds) {
  if (shape.size() != 3u || shape[0] != 1 || shape[1] <= 0 || shape[2] <= 0) {
    return std::unexpected(fault("unsupported output rank; expected [1, A, N] or [1, N, A]"));
  }
  if (data.size() != static_cast<std::size_t>(shape[1] * shape[2])) {
    return std::unexpected(fault("output buffer does not match its shape"));
  }

  const float* values = data.data();
  std::vector<Candidate> candidates;
  if (shape[2] == kEndToEndAttributes) {
    candidates = read_end_to_end(values, shape[1], /*row_major=*/true, thresholds.confidence);
  } else if (shape[1] == kEndToEndAttributes) {
    candidates = read_end_to_end(values, shape[2], /*row_major=*/false, thresholds.confidence);
  } else if (shape[1] > kBoxAttributes && shape[1] < shape[2]) {
    candidates = read_raw_head(values, shape[2], shape[1], /*channel_major=*/true,
                               thresholds.confidence);
  } else if (shape[2] > kBoxAttributes) {
    candidates = read_raw_head(values, shape[1], shape[2], /*channel_major=*/false,
                               thresholds.confidence);
  } else {
    return std::unexpected(fault("unsupported output layout"));
  }
  return suppress(candidates, thresholds);
}

}  // namespace neurolens::vision

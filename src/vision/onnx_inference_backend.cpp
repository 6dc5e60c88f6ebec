#include <s2p/vision/onnx_inference_backend.hpp>
#include <s2p/core/error.hpp>
#include <s2p/core/image.hpp>
#include <s2p/core/logger.hpp>
#include <onnxruntime_cxx_api.h>
#include <array>
#include <cstdint>
#include <expected>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace s2p::vision {

namespace {

constexpr std::int64_t kNumChannels = 3;

Ort::MemoryInfo CpuMemoryInfo() {
  return Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault);
}

/// Copy HWC (height, width, channels) float buffer to NCHW (batch, channels, height, width).
void HwcToNchw(const float* hwc, std::uint32_t h, std::uint32_t w, float* nchw) {
  const std::size_t hw = static_cast<std::size_t>(h) * w;
  for (std::size_t i = 0; i < hw; ++i) {
    nchw[0 * hw + i] = hwc[i * kNumChannels + 0];
    nchw[1 * hw + i] = hwc[i * kNumChannels + 1];
    nchw[2 * hw + i] = hwc[i * kNumChannels + 2];
  }
}

}  // namespace

struct OnnxInferenceBackend::Impl {
  Ort::Env env{ORT_LOGGING_LEVEL_WARNING, "s2p"};
  Ort::SessionOptions session_options;
  Ort::Session session{nullptr};

  std::string input_name;
  std::string output_name;

  std::uint32_t input_height{0};
  std::uint32_t input_width{0};
  bool input_is_nchw{true};

  YoloDecodeOptions decode_options;
  std::vector<std::string> class_names;

  std::vector<float> nchw_buffer;  // scratch for HWC -> NCHW

  Impl() {
    session_options.SetIntraOpNumThreads(1);
    session_options.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_EXTENDED);
  }
};

OnnxInferenceBackend::OnnxInferenceBackend(const std::string& model_path,
                                           YoloDecodeOptions decode_options,
                                           std::uint32_t fallback_width,
                                           std::uint32_t fallback_height)
    : impl_(std::make_unique<Impl>()) {
  impl_->decode_options = decode_options;
  impl_->session = Ort::Session(impl_->env, model_path.c_str(), impl_->session_options);

  Ort::AllocatorWithDefaultOptions allocator;
  if (impl_->session.GetInputCount() == 0) {
    throw std::runtime_error("OnnxInferenceBackend: model has no inputs");
  }
  impl_->input_name = impl_->session.GetInputNameAllocated(0, allocator).get();

  const std::vector<int64_t> dims =
      impl_->session.GetInputTypeInfo(0).GetTensorTypeAndShapeInfo().GetShape();
  if (dims.size() != 4u) {
    throw std::runtime_error("OnnxInferenceBackend: expected 4D input");
  }
  // NCHW: [1, C, H, W] or NHWC: [1, H, W, C]; -1 marks a dynamic axis.
  auto dim_or = [](int64_t d, std::uint32_t fallback) {
    return d > 0 ? static_cast<std::uint32_t>(d) : fallback;
  };
  if (dims[1] == kNumChannels) {
    impl_->input_is_nchw = true;
    impl_->input_height = dim_or(dims[2], fallback_height);
    impl_->input_width = dim_or(dims[3], fallback_width);
  } else if (dims[3] == kNumChannels) {
    impl_->input_is_nchw = false;
    impl_->input_height = dim_or(dims[1], fallback_height);
    impl_->input_width = dim_or(dims[2], fallback_width);
  } else {
    throw std::runtime_error("OnnxInferenceBackend: expected input shape [1,3,H,W] or [1,H,W,3]");
  }

  if (impl_->session.GetOutputCount() != 1u) {
    throw std::runtime_error("OnnxInferenceBackend: expected a single YOLO-style output");
  }
  impl_->output_name = impl_->session.GetOutputNameAllocated(0, allocator).get();

  Ort::ModelMetadata metadata = impl_->session.GetModelMetadata();
  auto names = metadata.LookupCustomMetadataMapAllocated("names", allocator);
  if (names) {
    impl_->class_names = parse_names_metadata(names.get());
  }

  s2p::core::logger()->info("onnx model {} loaded: input {}x{} ({}), {} class names",
                            model_path, impl_->input_width, impl_->input_height,
                            impl_->input_is_nchw ? "NCHW" : "NHWC",
                            impl_->class_names.size());
}

OnnxInferenceBackend::~OnnxInferenceBackend() = default;

std::uint32_t OnnxInferenceBackend::input_width() const noexcept { return impl_->input_width; }
std::uint32_t OnnxInferenceBackend::input_height() const noexcept { return impl_->input_height; }

std::vector<std::string> OnnxInferenceBackend::class_names() const { return impl_->class_names; }

std::expected<void, s2p::core::ServiceError>
OnnxInferenceBackend::validate_input(const s2p::core::Image& input) const {
  if (input.empty() || input.format() != s2p::core::PixelFormat::Float32Planar) {
    return std::unexpected(s2p::core::ServiceError::InvalidImage);
  }
  if (input.width() != impl_->input_width || input.height() != impl_->input_height) {
    return std::unexpected(s2p::core::ServiceError::InvalidImage);
  }
  if (!input.is_consistent()) {
    return std::unexpected(s2p::core::ServiceError::InvalidImage);
  }
  return {};
}

std::expected<InferenceResult, s2p::core::ServiceError>
OnnxInferenceBackend::infer(const s2p::core::Image& input) {
  auto valid = validate_input(input);
  if (!valid) {
    return std::unexpected(valid.error());
  }

  const std::uint32_t h = input.height();
  const std::uint32_t w = input.width();
  const float* src = reinterpret_cast<const float*>(input.data().data());
  const std::size_t num_floats = static_cast<std::size_t>(kNumChannels) * h * w;

  Ort::MemoryInfo mem_info = CpuMemoryInfo();
  Ort::Value input_tensor{nullptr};
  if (impl_->input_is_nchw) {
    impl_->nchw_buffer.resize(num_floats);
    HwcToNchw(src, h, w, impl_->nchw_buffer.data());
    const std::array<int64_t, 4> shape{1, kNumChannels, static_cast<int64_t>(h),
                                       static_cast<int64_t>(w)};
    input_tensor = Ort::Value::CreateTensor<float>(
        mem_info, impl_->nchw_buffer.data(), num_floats, shape.data(), shape.size());
  } else {
    const std::array<int64_t, 4> shape{1, static_cast<int64_t>(h), static_cast<int64_t>(w),
                                       kNumChannels};
    input_tensor = Ort::Value::CreateTensor<float>(
        mem_info, const_cast<float*>(src), num_floats, shape.data(), shape.size());
  }

  const char* input_names_c[] = {impl_->input_name.c_str()};
  const char* output_names_c[] = {impl_->output_name.c_str()};
  Ort::RunOptions run_options;

  std::vector<Ort::Value> outputs;
  try {
    outputs = impl_->session.Run(run_options, input_names_c, &input_tensor, 1,
                                 output_names_c, 1);
  } catch (const Ort::Exception& e) {
    s2p::core::logger()->warn("onnx run failed: {}", e.what());
    return std::unexpected(s2p::core::ServiceError::InferenceFailed);
  }
  if (outputs.size() != 1u) {
    return std::unexpected(s2p::core::ServiceError::InferenceFailed);
  }

  const std::vector<int64_t> out_shape = outputs[0].GetTensorTypeAndShapeInfo().GetShape();
  return decode_yolo_output(outputs[0].GetTensorData<float>(), out_shape, impl_->decode_options);
}

std::expected<void, s2p::core::ServiceError> OnnxInferenceBackend::warmup() {
  const std::size_t num_bytes = s2p::core::Image::min_bytes(
      impl_->input_width, impl_->input_height, s2p::core::PixelFormat::Float32Planar);
  std::vector<std::byte> buffer(num_bytes, std::byte{0});
  s2p::core::Image image(impl_->input_width, impl_->input_height,
                         s2p::core::PixelFormat::Float32Planar, std::move(buffer));
  auto result = infer(image);
  if (!result) {
    return std::unexpected(result.error());
  }
  return {};
}

}  // namespace s2p::vision

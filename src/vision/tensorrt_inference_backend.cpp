#include <s2p/vision/tensorrt_inference_backend.hpp>

#ifdef S2P_HAS_TENSORRT

#include <s2p/core/error.hpp>
#include <s2p/core/image.hpp>
#include <s2p/core/logger.hpp>
#include <NvInfer.h>
#include <NvInferRuntime.h>
#include <cuda_runtime.h>
#include <cstdint>
#include <expected>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace s2p::vision {

namespace {

constexpr int kNumChannels = 3;

void HwcToNchw(const float* hwc, std::uint32_t h, std::uint32_t w, float* nchw) {
  const std::size_t hw = static_cast<std::size_t>(h) * w;
  for (std::size_t i = 0; i < hw; ++i) {
    nchw[0 * hw + i] = hwc[i * kNumChannels + 0];
    nchw[1 * hw + i] = hwc[i * kNumChannels + 1];
    nchw[2 * hw + i] = hwc[i * kNumChannels + 2];
  }
}

s2p::core::ServiceError classify(cudaError_t err) {
  switch (err) {
    case cudaErrorIllegalAddress:
    case cudaErrorLaunchFailure:
    case cudaErrorNoDevice:
    case cudaErrorDevicesUnavailable:
    case cudaErrorECCUncorrectable:
      return s2p::core::ServiceError::DeviceLost;
    default:
      return s2p::core::ServiceError::InferenceFailed;
  }
}

/// Forwards TensorRT messages to the process logger.
class TrtLogger : public nvinfer1::ILogger {
 public:
  void log(Severity severity, const char* msg) noexcept override {
    switch (severity) {
      case Severity::kINTERNAL_ERROR:
      case Severity::kERROR:
        s2p::core::logger()->error("tensorrt: {}", msg);
        break;
      case Severity::kWARNING:
        s2p::core::logger()->warn("tensorrt: {}", msg);
        break;
      default:
        s2p::core::logger()->debug("tensorrt: {}", msg);
        break;
    }
  }
};

}  // namespace

struct TensorRTInferenceBackend::Impl {
  TrtLogger trt_logger;
  std::unique_ptr<nvinfer1::IRuntime> runtime;
  std::unique_ptr<nvinfer1::ICudaEngine> engine;
  std::unique_ptr<nvinfer1::IExecutionContext> context;

  std::uint32_t input_height{0};
  std::uint32_t input_width{0};
  std::size_t input_num_floats{0};

  int input_binding{-1};
  int output_binding{-1};
  std::vector<std::int64_t> output_shape;
  std::size_t output_num_floats{0};

  std::vector<float> nchw_buffer;
  std::vector<float> host_output;
  std::vector<void*> device_buffers;

  YoloDecodeOptions decode_options;
};

TensorRTInferenceBackend::TensorRTInferenceBackend(const std::string& engine_path,
                                                   YoloDecodeOptions decode_options)
    : impl_(std::make_unique<Impl>()) {
  impl_->decode_options = decode_options;

  std::ifstream f(engine_path, std::ios::binary | std::ios::ate);
  if (!f) {
    throw std::runtime_error("TensorRTInferenceBackend: cannot open engine file: " + engine_path);
  }
  const std::streamsize size = f.tellg();
  f.seekg(0);
  std::vector<char> blob(static_cast<std::size_t>(size));
  if (!f.read(blob.data(), size)) {
    throw std::runtime_error("TensorRTInferenceBackend: failed to read engine file");
  }

  impl_->runtime.reset(nvinfer1::createInferRuntime(impl_->trt_logger));
  if (!impl_->runtime) {
    throw std::runtime_error("TensorRTInferenceBackend: createInferRuntime failed");
  }
  impl_->engine.reset(impl_->runtime->deserializeCudaEngine(blob.data(), blob.size()));
  if (!impl_->engine) {
    throw std::runtime_error("TensorRTInferenceBackend: deserializeCudaEngine failed");
  }
  impl_->context.reset(impl_->engine->createExecutionContext());
  if (!impl_->context) {
    throw std::runtime_error("TensorRTInferenceBackend: createExecutionContext failed");
  }

  const int num_bindings = impl_->engine->getNbBindings();
  if (num_bindings != 2) {
    throw std::runtime_error("TensorRTInferenceBackend: expected one input and one output binding");
  }
  impl_->input_binding = impl_->engine->bindingIsInput(0) ? 0 : 1;
  impl_->output_binding = 1 - impl_->input_binding;

  const nvinfer1::Dims in = impl_->engine->getBindingDimensions(impl_->input_binding);
  if (in.nbDims != 4 || in.d[1] != kNumChannels) {
    throw std::runtime_error("TensorRTInferenceBackend: expected NCHW input with 3 channels");
  }
  impl_->input_height = static_cast<std::uint32_t>(in.d[2]);
  impl_->input_width = static_cast<std::uint32_t>(in.d[3]);
  impl_->input_num_floats = static_cast<std::size_t>(kNumChannels) * in.d[2] * in.d[3];

  const nvinfer1::Dims out = impl_->engine->getBindingDimensions(impl_->output_binding);
  impl_->output_num_floats = 1;
  for (int j = 0; j < out.nbDims; ++j) {
    impl_->output_shape.push_back(out.d[j]);
    impl_->output_num_floats *= static_cast<std::size_t>(out.d[j] > 0 ? out.d[j] : 1);
  }

  impl_->nchw_buffer.resize(impl_->input_num_floats);
  impl_->host_output.resize(impl_->output_num_floats);
  impl_->device_buffers.assign(2, nullptr);
  const std::size_t bytes[2] = {
      (impl_->input_binding == 0 ? impl_->input_num_floats : impl_->output_num_floats) * sizeof(float),
      (impl_->input_binding == 1 ? impl_->input_num_floats : impl_->output_num_floats) * sizeof(float),
  };
  for (int i = 0; i < 2; ++i) {
    if (cudaMalloc(&impl_->device_buffers[static_cast<std::size_t>(i)], bytes[i]) != cudaSuccess) {
      throw std::runtime_error("TensorRTInferenceBackend: cudaMalloc failed for binding " +
                               std::to_string(i));
    }
  }

  s2p::core::logger()->info("tensorrt engine {} loaded: input {}x{}", engine_path,
                            impl_->input_width, impl_->input_height);
}

TensorRTInferenceBackend::~TensorRTInferenceBackend() {
  if (!impl_) return;
  for (void* ptr : impl_->device_buffers) {
    if (ptr) cudaFree(ptr);
  }
}

std::uint32_t TensorRTInferenceBackend::input_width() const noexcept { return impl_->input_width; }
std::uint32_t TensorRTInferenceBackend::input_height() const noexcept { return impl_->input_height; }

std::expected<void, s2p::core::ServiceError>
TensorRTInferenceBackend::validate_input(const s2p::core::Image& input) const {
  if (input.empty() || input.format() != s2p::core::PixelFormat::Float32Planar) {
    return std::unexpected(s2p::core::ServiceError::InvalidImage);
  }
  if (input.width() != impl_->input_width || input.height() != impl_->input_height ||
      !input.is_consistent()) {
    return std::unexpected(s2p::core::ServiceError::InvalidImage);
  }
  return {};
}

std::expected<InferenceResult, s2p::core::ServiceError>
TensorRTInferenceBackend::infer(const s2p::core::Image& input) {
  auto valid = validate_input(input);
  if (!valid) {
    return std::unexpected(valid.error());
  }

  const float* src = reinterpret_cast<const float*>(input.data().data());
  HwcToNchw(src, input.height(), input.width(), impl_->nchw_buffer.data());

  void* d_in = impl_->device_buffers[static_cast<std::size_t>(impl_->input_binding)];
  void* d_out = impl_->device_buffers[static_cast<std::size_t>(impl_->output_binding)];

  cudaError_t err = cudaMemcpy(d_in, impl_->nchw_buffer.data(),
                               impl_->input_num_floats * sizeof(float), cudaMemcpyHostToDevice);
  if (err != cudaSuccess) {
    s2p::core::logger()->warn("cudaMemcpy to device failed: {}", cudaGetErrorString(err));
    return std::unexpected(classify(err));
  }

  if (!impl_->context->executeV2(impl_->device_buffers.data())) {
    return std::unexpected(s2p::core::ServiceError::InferenceFailed);
  }

  err = cudaMemcpy(impl_->host_output.data(), d_out,
                   impl_->output_num_floats * sizeof(float), cudaMemcpyDeviceToHost);
  if (err != cudaSuccess) {
    s2p::core::logger()->warn("cudaMemcpy to host failed: {}", cudaGetErrorString(err));
    return std::unexpected(classify(err));
  }

  return decode_yolo_output(impl_->host_output.data(), impl_->output_shape, impl_->decode_options);
}

std::expected<void, s2p::core::ServiceError> TensorRTInferenceBackend::warmup() {
  std::vector<std::byte> buffer(impl_->input_num_floats * sizeof(float), std::byte{0});
  s2p::core::Image image(impl_->input_width, impl_->input_height,
                         s2p::core::PixelFormat::Float32Planar, std::move(buffer));
  auto result = infer(image);
  if (!result) {
    return std::unexpected(result.error());
  }
  return {};
}

}  // namespace s2p::vision

#endif  // S2P_HAS_TENSORRT

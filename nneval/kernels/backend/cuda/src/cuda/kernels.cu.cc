#include "launchers.h"

#include <algorithm>
#include <cstdint>

//==============================================================================
// CUDA Kernel Definitions (Internal to this .cu.cc file)
//==============================================================================

namespace nneval::kernels::detail {

// -------- Strided Copy Kernel --------

/**
 * @brief Copies elements between two arbitrary strided layouts.
 *
 * Each thread handles one linear index `k` at a time (grid-stride loop):
 * 1. Decode: `k` is turned into a coordinate by successive division by the
 *    dense (row-major) strides. The dense strides only describe the logical
 *    shape, independent of how either buffer is laid out.
 * 2. Offsets: the coordinate is dotted with the input and output strides.
 *    A zero input stride reads the same element for every coordinate along
 *    that axis, which is how broadcasting is expressed.
 * 3. Copy: one element is moved from input to output.
 * Offsets are accumulated in 64 bit since strides times coordinates can exceed
 * the range of `int` even when every individual value fits.
 */
template <typename T>
__global__ void strided_copy_kernel(StridedCopyArgs args,
                                    const T *__restrict__ in,
                                    T *__restrict__ out) {
  const int64_t grid_stride = static_cast<int64_t>(blockDim.x) * gridDim.x;
  for (int64_t k = static_cast<int64_t>(blockIdx.x) * blockDim.x + threadIdx.x;
       k < args.size; k += grid_stride) {
    int64_t remaining = k;
    int64_t in_offset = 0;
    int64_t out_offset = 0;

#pragma unroll
    for (int i = 0; i < NNEVAL_MAX_RANK; ++i) {
      if (i < args.rank) {
        const int64_t coord = remaining / args.dense_strides[i];
        remaining -= coord * args.dense_strides[i];
        in_offset += coord * args.input_strides[i];
        out_offset += coord * args.output_strides[i];
      }
    }

    out[out_offset] = in[in_offset];
  }
}

// -------- Gather Kernels --------

/**
 * @brief Flat gather, one output element per thread.
 */
__global__ void gather_kernel(int count, const int *__restrict__ indices,
                              const float *__restrict__ in,
                              float *__restrict__ out) {
  const int64_t i = static_cast<int64_t>(blockIdx.x) * blockDim.x + threadIdx.x;
  if (i < count) {
    out[i] = in[indices[i]];
  }
}

// Number of indices handled by one block of the axis-1 gather.
constexpr int GATHER_TILE_DIM = 64;
// Number of batch rows a block processes concurrently.
constexpr int GATHER_BLOCK_ROWS = 4;

/**
 * @brief Gathers along axis 1 of a strided `(batch, input_size)` input.
 *
 * Tiling: blockIdx.x selects a tile of `GATHER_TILE_DIM` consecutive indices,
 * threadIdx.x one index inside that tile. The first row of threads converts
 * the tile's indices into element offsets once and stages them in shared
 * memory; the block then sweeps the batch rows (`threadIdx.y`, grid-stride
 * over `blockIdx.y`) reusing the staged offsets. Consecutive threads write
 * consecutive output elements, so the stores are coalesced.
 *
 * The last tile is usually partial: threads whose index lies past
 * `index_count` still take part in the barrier but never load or store.
 */
template <typename I>
__global__ void gather_2d_axis1_kernel(int batch_size, int batch_stride,
                                       int elem_stride, int index_count,
                                       const float *__restrict__ in,
                                       const I *__restrict__ indices,
                                       float *__restrict__ out) {
  __shared__ int64_t s_offsets[GATHER_TILE_DIM];

  const int64_t q =
      static_cast<int64_t>(blockIdx.x) * GATHER_TILE_DIM + threadIdx.x;
  const bool active = q < index_count;

  if (threadIdx.y == 0 && active) {
    s_offsets[threadIdx.x] =
        static_cast<int64_t>(indices[q]) * static_cast<int64_t>(elem_stride);
  }
  __syncthreads();

  if (!active) {
    return;
  }

  const int64_t offset = s_offsets[threadIdx.x];
  const int64_t row_stride = static_cast<int64_t>(gridDim.y) * blockDim.y;
  for (int64_t n = static_cast<int64_t>(blockIdx.y) * blockDim.y + threadIdx.y;
       n < batch_size; n += row_stride) {
    out[n * index_count + q] = in[n * batch_stride + offset];
  }
}

// -------- Quantization Kernels --------

/**
 * @brief Clamps each value to `[low, high]` and maps it onto `0..255`.
 *
 * `fmaxf` returns its non-NaN operand, so NaN inputs clamp to `low`.
 */
__global__ void quantize_kernel(int length, const float *__restrict__ in,
                                uint8_t *__restrict__ out, float low,
                                float high, float scale, bool half_to_even) {
  const int64_t grid_stride = static_cast<int64_t>(blockDim.x) * gridDim.x;
  for (int64_t i = static_cast<int64_t>(blockIdx.x) * blockDim.x + threadIdx.x;
       i < length; i += grid_stride) {
    const float clamped = fminf(fmaxf(in[i], low), high);
    const float scaled = (clamped - low) * scale;
    const float rounded = half_to_even ? rintf(scaled) : roundf(scaled);
    out[i] = static_cast<uint8_t>(fminf(fmaxf(rounded, 0.0f), 255.0f));
  }
}

/**
 * @brief Maps each byte back onto `[low, high]`.
 */
__global__ void unquantize_kernel(int length, const uint8_t *__restrict__ in,
                                  float *__restrict__ out, float low,
                                  float step) {
  const int64_t grid_stride = static_cast<int64_t>(blockDim.x) * gridDim.x;
  for (int64_t i = static_cast<int64_t>(blockIdx.x) * blockDim.x + threadIdx.x;
       i < length; i += grid_stride) {
    out[i] = low + static_cast<float>(in[i]) * step;
  }
}

// -------- Utility Kernels --------

/**
 * @brief Applies `data[i] = data[i] * scale + bias`.
 */
__global__ void scale_kernel(float *data, float scale, float bias, size_t n) {
  size_t idx = static_cast<size_t>(blockIdx.x) * blockDim.x + threadIdx.x;
  if (idx < n) {
    data[idx] = data[idx] * scale + bias;
  }
}

//==============================================================================
// Kernel Launchers (declared in launchers.h)
//==============================================================================

constexpr int THREADS_PER_BLOCK = 256;
// Grid-stride kernels never need more blocks than this to saturate a device.
constexpr int64_t MAX_GRID_BLOCKS = 65535;

namespace {

int grid_stride_blocks(int64_t n) {
  int64_t blocks = (n + THREADS_PER_BLOCK - 1) / THREADS_PER_BLOCK;
  return static_cast<int>(std::min(blocks, MAX_GRID_BLOCKS));
}

} // namespace

template <typename T>
cudaError_t launch_strided_copy_kernel(cudaStream_t stream,
                                       const StridedCopyArgs &args,
                                       const T *in, T *out) {
  if (args.size == 0)
    return cudaSuccess;
  const int blocks = grid_stride_blocks(args.size);
  strided_copy_kernel<T><<<blocks, THREADS_PER_BLOCK, 0, stream>>>(args, in,
                                                                   out);
  return cudaGetLastError();
}

template cudaError_t launch_strided_copy_kernel<float>(cudaStream_t,
                                                       const StridedCopyArgs &,
                                                       const float *, float *);
template cudaError_t
launch_strided_copy_kernel<int32_t>(cudaStream_t, const StridedCopyArgs &,
                                    const int32_t *, int32_t *);
template cudaError_t
launch_strided_copy_kernel<uint8_t>(cudaStream_t, const StridedCopyArgs &,
                                    const uint8_t *, uint8_t *);

cudaError_t launch_gather_kernel(cudaStream_t stream, int count,
                                 const int *indices, const float *in,
                                 float *out) {
  if (count == 0)
    return cudaSuccess;
  const int64_t blocks =
      (static_cast<int64_t>(count) + THREADS_PER_BLOCK - 1) / THREADS_PER_BLOCK;
  gather_kernel<<<static_cast<unsigned int>(blocks), THREADS_PER_BLOCK, 0,
                  stream>>>(count, indices, in, out);
  return cudaGetLastError();
}

template <typename I>
cudaError_t launch_gather_2d_axis1_kernel(cudaStream_t stream, int batch_size,
                                          int batch_stride, int elem_stride,
                                          int index_count, const float *in,
                                          const I *indices, float *out) {
  if (batch_size == 0 || index_count == 0)
    return cudaSuccess;

  // One block column per tile of indices, batch rows spread over grid.y.
  dim3 threads(GATHER_TILE_DIM, GATHER_BLOCK_ROWS);
  const int64_t row_blocks =
      (static_cast<int64_t>(batch_size) + GATHER_BLOCK_ROWS - 1) /
      GATHER_BLOCK_ROWS;
  const int64_t tile_blocks =
      (static_cast<int64_t>(index_count) + GATHER_TILE_DIM - 1) /
      GATHER_TILE_DIM;
  dim3 blocks(static_cast<unsigned int>(tile_blocks),
              static_cast<unsigned int>(std::min(row_blocks, MAX_GRID_BLOCKS)));
  gather_2d_axis1_kernel<I><<<blocks, threads, 0, stream>>>(
      batch_size, batch_stride, elem_stride, index_count, in, indices, out);
  return cudaGetLastError();
}

template cudaError_t launch_gather_2d_axis1_kernel<float>(
    cudaStream_t, int, int, int, int, const float *, const float *, float *);
template cudaError_t launch_gather_2d_axis1_kernel<int>(cudaStream_t, int, int,
                                                        int, int, const float *,
                                                        const int *, float *);

cudaError_t launch_quantize_kernel(cudaStream_t stream, int length,
                                   const float *in, uint8_t *out, float low,
                                   float high, float scale,
                                   bool half_to_even) {
  if (length == 0)
    return cudaSuccess;
  const int blocks = grid_stride_blocks(length);
  quantize_kernel<<<blocks, THREADS_PER_BLOCK, 0, stream>>>(
      length, in, out, low, high, scale, half_to_even);
  return cudaGetLastError();
}

cudaError_t launch_unquantize_kernel(cudaStream_t stream, int length,
                                     const uint8_t *in, float *out, float low,
                                     float step) {
  if (length == 0)
    return cudaSuccess;
  const int blocks = grid_stride_blocks(length);
  unquantize_kernel<<<blocks, THREADS_PER_BLOCK, 0, stream>>>(length, in, out,
                                                              low, step);
  return cudaGetLastError();
}

cudaError_t launch_scale_kernel(cudaStream_t stream, float *data, float scale,
                                float bias, size_t n) {
  if (n == 0)
    return cudaSuccess;
  const size_t blocks = (n + THREADS_PER_BLOCK - 1) / THREADS_PER_BLOCK;
  scale_kernel<<<blocks, THREADS_PER_BLOCK, 0, stream>>>(data, scale, bias, n);
  return cudaGetLastError();
}

} // namespace nneval::kernels::detail

#include "tunesmith/SimdDispatch.h"

#include <atomic>

#include <juce_core/juce_core.h>

#if defined(__x86_64__) || defined(_M_X64)
#define TUNESMITH_SIMD_X86 1
#include <immintrin.h>
#elif defined(__aarch64__) || defined(_M_ARM64)
#define TUNESMITH_SIMD_NEON 1
#include <arm_neon.h>
#endif

#if defined(TUNESMITH_SIMD_X86) && (defined(__GNUC__) || defined(__clang__))
#define TUNESMITH_TARGET_AVX2 __attribute__((target("avx2")))
#else
#define TUNESMITH_TARGET_AVX2
#endif

namespace tunesmith::simd {

namespace {

constexpr int kNoOverride = -1;
std::atomic<int> levelOverride{kNoOverride};

SimdLevel detectLevel() noexcept
{
#if defined(TUNESMITH_SIMD_X86)
    if (juce::SystemStats::hasAVX2()) {
        return SimdLevel::kAvx2;
    }
    if (juce::SystemStats::hasSSE41()) {
        return SimdLevel::kSse;
    }
#elif defined(TUNESMITH_SIMD_NEON)
    if (juce::SystemStats::hasNeon()) {
        return SimdLevel::kNeon;
    }
#endif
    return SimdLevel::kScalar;
}

// --- scalar kernels ---

void multiplyScalar(float* dst, const float* src, const std::size_t count) noexcept
{
    for (std::size_t i = 0; i < count; ++i) {
        dst[i] *= src[i];
    }
}

void scaleScalar(float* dst, const float gain, const std::size_t count) noexcept
{
    for (std::size_t i = 0; i < count; ++i) {
        dst[i] *= gain;
    }
}

void multiplyAddScalar(float* dst, const float* src, const float gain,
                       const std::size_t count) noexcept
{
    for (std::size_t i = 0; i < count; ++i) {
        dst[i] += src[i] * gain;
    }
}

#if defined(TUNESMITH_SIMD_X86)

// --- 4-wide SSE kernels ---

void multiplySse(float* dst, const float* src, const std::size_t count) noexcept
{
    std::size_t i = 0;
    for (; i + 4 <= count; i += 4) {
        _mm_storeu_ps(dst + i, _mm_mul_ps(_mm_loadu_ps(dst + i), _mm_loadu_ps(src + i)));
    }
    multiplyScalar(dst + i, src + i, count - i);
}

void scaleSse(float* dst, const float gain, const std::size_t count) noexcept
{
    const __m128 g = _mm_set1_ps(gain);
    std::size_t i = 0;
    for (; i + 4 <= count; i += 4) {
        _mm_storeu_ps(dst + i, _mm_mul_ps(_mm_loadu_ps(dst + i), g));
    }
    scaleScalar(dst + i, gain, count - i);
}

void multiplyAddSse(float* dst, const float* src, const float gain,
                    const std::size_t count) noexcept
{
    const __m128 g = _mm_set1_ps(gain);
    std::size_t i = 0;
    for (; i + 4 <= count; i += 4) {
        const __m128 prod = _mm_mul_ps(_mm_loadu_ps(src + i), g);
        _mm_storeu_ps(dst + i, _mm_add_ps(_mm_loadu_ps(dst + i), prod));
    }
    multiplyAddScalar(dst + i, src + i, gain, count - i);
}

// --- 8-wide AVX2 kernels ---

TUNESMITH_TARGET_AVX2 void multiplyAvx2(float* dst, const float* src,
                                        const std::size_t count) noexcept
{
    std::size_t i = 0;
    for (; i + 8 <= count; i += 8) {
        _mm256_storeu_ps(dst + i,
                         _mm256_mul_ps(_mm256_loadu_ps(dst + i), _mm256_loadu_ps(src + i)));
    }
    multiplyScalar(dst + i, src + i, count - i);
}

TUNESMITH_TARGET_AVX2 void scaleAvx2(float* dst, const float gain,
                                     const std::size_t count) noexcept
{
    const __m256 g = _mm256_set1_ps(gain);
    std::size_t i = 0;
    for (; i + 8 <= count; i += 8) {
        _mm256_storeu_ps(dst + i, _mm256_mul_ps(_mm256_loadu_ps(dst + i), g));
    }
    scaleScalar(dst + i, gain, count - i);
}

TUNESMITH_TARGET_AVX2 void multiplyAddAvx2(float* dst, const float* src, const float gain,
                                           const std::size_t count) noexcept
{
    const __m256 g = _mm256_set1_ps(gain);
    std::size_t i = 0;
    for (; i + 8 <= count; i += 8) {
        // Separate multiply and add (no FMA) so results match the
        // narrower kernels bit for bit.
        const __m256 prod = _mm256_mul_ps(_mm256_loadu_ps(src + i), g);
        _mm256_storeu_ps(dst + i, _mm256_add_ps(_mm256_loadu_ps(dst + i), prod));
    }
    multiplyAddScalar(dst + i, src + i, gain, count - i);
}

#endif  // TUNESMITH_SIMD_X86

#if defined(TUNESMITH_SIMD_NEON)

// --- 4-wide NEON kernels ---

void multiplyNeon(float* dst, const float* src, const std::size_t count) noexcept
{
    std::size_t i = 0;
    for (; i + 4 <= count; i += 4) {
        vst1q_f32(dst + i, vmulq_f32(vld1q_f32(dst + i), vld1q_f32(src + i)));
    }
    multiplyScalar(dst + i, src + i, count - i);
}

void scaleNeon(float* dst, const float gain, const std::size_t count) noexcept
{
    const float32x4_t g = vdupq_n_f32(gain);
    std::size_t i = 0;
    for (; i + 4 <= count; i += 4) {
        vst1q_f32(dst + i, vmulq_f32(vld1q_f32(dst + i), g));
    }
    scaleScalar(dst + i, gain, count - i);
}

void multiplyAddNeon(float* dst, const float* src, const float gain,
                     const std::size_t count) noexcept
{
    const float32x4_t g = vdupq_n_f32(gain);
    std::size_t i = 0;
    for (; i + 4 <= count; i += 4) {
        const float32x4_t prod = vmulq_f32(vld1q_f32(src + i), g);
        vst1q_f32(dst + i, vaddq_f32(vld1q_f32(dst + i), prod));
    }
    multiplyAddScalar(dst + i, src + i, gain, count - i);
}

#endif  // TUNESMITH_SIMD_NEON

}  // namespace

SimdLevel detectedLevel() noexcept
{
    static const SimdLevel level = detectLevel();
    return level;
}

SimdLevel activeLevel() noexcept
{
    const int forced = levelOverride.load(std::memory_order_relaxed);
    if (forced == kNoOverride) {
        return detectedLevel();
    }
    const auto level = static_cast<SimdLevel>(forced);
    if (level == SimdLevel::kScalar || level == detectedLevel()) {
        return level;
    }
    // SSE is a subset of AVX2 on every x86 CPU that reports AVX2.
    if (level == SimdLevel::kSse && detectedLevel() == SimdLevel::kAvx2) {
        return level;
    }
    return detectedLevel();
}

void setLevelOverride(const std::optional<SimdLevel> level) noexcept
{
    levelOverride.store(level ? static_cast<int>(*level) : kNoOverride,
                        std::memory_order_relaxed);
}

int laneWidth(const SimdLevel level) noexcept
{
    switch (level) {
        case SimdLevel::kAvx2:
            return 8;
        case SimdLevel::kSse:
        case SimdLevel::kNeon:
            return 4;
        case SimdLevel::kScalar:
            break;
    }
    return 1;
}

const char* levelName(const SimdLevel level) noexcept
{
    switch (level) {
        case SimdLevel::kAvx2:
            return "avx2";
        case SimdLevel::kSse:
            return "sse";
        case SimdLevel::kNeon:
            return "neon";
        case SimdLevel::kScalar:
            break;
    }
    return "scalar";
}

void multiply(float* dst, const float* src, const std::size_t count) noexcept
{
    switch (activeLevel()) {
#if defined(TUNESMITH_SIMD_X86)
        case SimdLevel::kAvx2:
            multiplyAvx2(dst, src, count);
            return;
        case SimdLevel::kSse:
            multiplySse(dst, src, count);
            return;
#endif
#if defined(TUNESMITH_SIMD_NEON)
        case SimdLevel::kNeon:
            multiplyNeon(dst, src, count);
            return;
#endif
        default:
            break;
    }
    multiplyScalar(dst, src, count);
}

void scale(float* dst, const float gain, const std::size_t count) noexcept
{
    switch (activeLevel()) {
#if defined(TUNESMITH_SIMD_X86)
        case SimdLevel::kAvx2:
            scaleAvx2(dst, gain, count);
            return;
        case SimdLevel::kSse:
            scaleSse(dst, gain, count);
            return;
#endif
#if defined(TUNESMITH_SIMD_NEON)
        case SimdLevel::kNeon:
            scaleNeon(dst, gain, count);
            return;
#endif
        default:
            break;
    }
    scaleScalar(dst, gain, count);
}

void multiplyAdd(float* dst, const float* src, const float gain, const std::size_t count) noexcept
{
    switch (activeLevel()) {
#if defined(TUNESMITH_SIMD_X86)
        case SimdLevel::kAvx2:
            multiplyAddAvx2(dst, src, gain, count);
            return;
        case SimdLevel::kSse:
            multiplyAddSse(dst, src, gain, count);
            return;
#endif
#if defined(TUNESMITH_SIMD_NEON)
        case SimdLevel::kNeon:
            multiplyAddNeon(dst, src, gain, count);
            return;
#endif
        default:
            break;
    }
    multiplyAddScalar(dst, src, gain, count);
}

}  // namespace tunesmith::simd

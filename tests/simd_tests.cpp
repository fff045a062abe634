#undef NDEBUG
#include <cassert>
#include <cmath>
#include <cstddef>
#include <cstring>
#include <iostream>
#include <vector>

#include "tunesmith/SimdDispatch.h"

using tunesmith::SimdLevel;

namespace simd = tunesmith::simd;

namespace {

std::vector<float> ramp(const std::size_t count, const float scale)
{
    std::vector<float> out(count);
    for (std::size_t i = 0; i < count; ++i) {
        out[i] = scale * std::sin(0.37F * static_cast<float>(i)) + 0.01F * static_cast<float>(i % 7);
    }
    return out;
}

bool near(const float a, const float b)
{
    return std::abs(a - b) <= 1e-6F * (1.0F + std::abs(a));
}

void testLevels()
{
    assert(simd::laneWidth(SimdLevel::kScalar) == 1);
    assert(simd::laneWidth(SimdLevel::kSse) == 4);
    assert(simd::laneWidth(SimdLevel::kNeon) == 4);
    assert(simd::laneWidth(SimdLevel::kAvx2) == 8);
    assert(std::strcmp(simd::levelName(SimdLevel::kAvx2), "avx2") == 0);
    assert(std::strcmp(simd::levelName(SimdLevel::kScalar), "scalar") == 0);

    const SimdLevel detected = simd::detectedLevel();
    assert(simd::detectedLevel() == detected);
    assert(simd::activeLevel() == detected);

    simd::setLevelOverride(SimdLevel::kScalar);
    assert(simd::activeLevel() == SimdLevel::kScalar);

    // Forcing a level is honoured only when the CPU has it.
    simd::setLevelOverride(SimdLevel::kAvx2);
    assert(simd::activeLevel() == detected);
    simd::setLevelOverride(SimdLevel::kSse);
    if (detected == SimdLevel::kAvx2 || detected == SimdLevel::kSse) {
        assert(simd::activeLevel() == SimdLevel::kSse);
    } else {
        assert(simd::activeLevel() == detected);
    }

    simd::setLevelOverride(std::nullopt);
    assert(simd::activeLevel() == detected);
}

void testKernelsAgreeAcrossLevels()
{
    // Odd length and an unaligned start exercise the remainder loops.
    const std::size_t count = 1031;
    const std::vector<float> source = ramp(count + 1, 0.75F);
    const std::vector<float> base = ramp(count + 1, -0.5F);

    const SimdLevel levels[] = {SimdLevel::kScalar, SimdLevel::kSse, SimdLevel::kNeon,
                                SimdLevel::kAvx2};
    std::vector<float> expectedMultiply(base);
    std::vector<float> expectedScale(base);
    std::vector<float> expectedMultiplyAdd(base);
    for (std::size_t i = 1; i <= count; ++i) {
        expectedMultiply[i] = base[i] * source[i];
        expectedScale[i] = base[i] * 0.3F;
        expectedMultiplyAdd[i] = base[i] + source[i] * 0.6F;
    }

    for (const SimdLevel level : levels) {
        simd::setLevelOverride(level);

        std::vector<float> product(base);
        simd::multiply(product.data() + 1, source.data() + 1, count);
        assert(product == expectedMultiply);

        std::vector<float> scaled(base);
        simd::scale(scaled.data() + 1, 0.3F, count);
        assert(scaled == expectedScale);

        std::vector<float> summed(base);
        simd::multiplyAdd(summed.data() + 1, source.data() + 1, 0.6F, count);
        assert(summed[0] == base[0]);
        for (std::size_t i = 1; i <= count; ++i) {
            assert(near(summed[i], expectedMultiplyAdd[i]));
        }

        // Empty ranges are fine.
        simd::multiply(product.data(), source.data(), 0);
        simd::scale(scaled.data(), 2.0F, 0);
        simd::multiplyAdd(summed.data(), source.data(), 2.0F, 0);
    }
    simd::setLevelOverride(std::nullopt);
}

void testProcess()
{
    const std::vector<float> input = ramp(1027, 1.5F);
    std::vector<float> expected(input);
    for (float& value : expected) {
        value = std::tanh(value) * 0.5F;
    }

    for (const SimdLevel level : {SimdLevel::kScalar, SimdLevel::kSse, SimdLevel::kAvx2}) {
        simd::setLevelOverride(level);
        std::vector<float> buffer(input);
        simd::process(buffer.data(), buffer.size(), [](const float x) { return std::tanh(x) * 0.5F; });
        assert(buffer == expected);

        int calls = 0;
        std::vector<float> counted(13, 1.0F);
        simd::process(counted.data(), counted.size(), [&calls](const float x) {
            ++calls;
            return x + 1.0F;
        });
        assert(calls == 13);
        for (const float value : counted) {
            assert(value == 2.0F);
        }
    }
    simd::setLevelOverride(std::nullopt);
}

}  // namespace

int main()
{
    testLevels();
    testKernelsAgreeAcrossLevels();
    testProcess();

    std::cout << "simd_tests: OK" << std::endl;
    return 0;
}

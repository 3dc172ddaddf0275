#ifndef DP_ACCESS_RUNTIME_EIGEN_UTILITIES_HPP
#define DP_ACCESS_RUNTIME_EIGEN_UTILITIES_HPP

#include <cstdint>
#include <memory>
#include <mutex>
#include <random>

#include <Eigen/Dense>

// source of randomness shared by mechanisms and samplers
class RandomSource {
public:
    virtual ~RandomSource() = default;

    // uniform on [0, 1)
    virtual double sampleUniform() = 0;

    double sampleUniform(double low, double high);
    double sampleLaplace(double mu = 0, double scale = 1);
    double sampleGaussian(double mu = 0, double stddev = 1);
    bool sampleBernoulli(double probability);
    // uniform on {0, ..., count - 1}
    Eigen::Index sampleIndex(Eigen::Index count);
};

// cryptographically secure uniforms from OpenSSL
class OpenSslRandomSource : public RandomSource {
public:
    using RandomSource::sampleUniform;
    double sampleUniform() override;
};

// reproducible uniforms for tests and experiments, never for releases
class SeededRandomSource : public RandomSource {
    std::mt19937_64 _engine;
    std::mutex _engine_mutex;
public:
    explicit SeededRandomSource(uint64_t seed);
    using RandomSource::sampleUniform;
    double sampleUniform() override;
};

// process-wide source, seeded when DP_ACCESS_SEED is set, OpenSSL otherwise
std::shared_ptr<RandomSource> defaultRandomSource();
std::shared_ptr<RandomSource> resolveRandomSource(const std::shared_ptr<RandomSource>& random);

#endif //DP_ACCESS_RUNTIME_EIGEN_UTILITIES_HPP

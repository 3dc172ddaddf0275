
#include <openssl/rand.h>
#include <openssl/err.h>
#include <cmath>
#include <cstdlib>
#include <cstring>
#include <stdexcept>
#include <string>
#include <utility>
#include <dp_access/logging.hpp>
#include "../include/dp_access_runtime_eigen/utilities.hpp"

namespace {
const double twoPi = 2 * std::acos(-1.);
// 2^-53, one unit in the last place of a double in [0, 1)
const double mantissaStep = 1. / 9007199254740992.;
}

double RandomSource::sampleUniform(double low, double high) {
    if (high < low) std::swap(low, high);
    return low + (high - low) * this->sampleUniform();
}

// inverse cdf of the laplace distribution
double RandomSource::sampleLaplace(double mu, double scale) {
    double uniformSample = this->sampleUniform();
    while (uniformSample == 0)
        uniformSample = this->sampleUniform();

    double centered = uniformSample - .5;
    double sign = centered < 0 ? -1. : 1.;
    return mu - scale * sign * std::log(1 - 2 * std::abs(centered));
}

// box-muller
double RandomSource::sampleGaussian(double mu, double stddev) {
    double first = 1 - this->sampleUniform();
    double second = this->sampleUniform();
    return mu + stddev * std::sqrt(-2 * std::log(first)) * std::cos(twoPi * second);
}

bool RandomSource::sampleBernoulli(double probability) {
    return this->sampleUniform() < probability;
}

Eigen::Index RandomSource::sampleIndex(Eigen::Index count) {
    if (count <= 0)
        throw std::invalid_argument("cannot sample an index from an empty range");
    auto index = static_cast<Eigen::Index>(this->sampleUniform() * static_cast<double>(count));
    return index < count ? index : count - 1;
}

double OpenSslRandomSource::sampleUniform() {
    unsigned char buffer[sizeof(uint64_t)];

    int rc = RAND_bytes(buffer, sizeof(buffer));
    if (rc != 1) {
        unsigned long err = ERR_get_error();
        throw std::runtime_error("OpenSSL failed with error code: " + std::to_string(err));
    }

    uint64_t bits;
    memcpy(&bits, buffer, sizeof(buffer));

    // top 53 bits fill the mantissa of a double in [0, 1)
    return static_cast<double>(bits >> 11) * mantissaStep;
}

SeededRandomSource::SeededRandomSource(uint64_t seed) : _engine{seed} {}

double SeededRandomSource::sampleUniform() {
    std::lock_guard<std::mutex> lock(this->_engine_mutex);
    return static_cast<double>(this->_engine() >> 11) * mantissaStep;
}

std::shared_ptr<RandomSource> defaultRandomSource() {
    static std::shared_ptr<RandomSource> source = []() -> std::shared_ptr<RandomSource> {
        const char* seed = std::getenv("DP_ACCESS_SEED");
        if (seed && *seed) {
            logMessage(logWarning, "DP_ACCESS_SEED is set, releases use a reproducible generator seeded with %s", seed);
            return std::make_shared<SeededRandomSource>(std::strtoull(seed, nullptr, 10));
        }
        return std::make_shared<OpenSslRandomSource>();
    }();
    return source;
}

std::shared_ptr<RandomSource> resolveRandomSource(const std::shared_ptr<RandomSource>& random) {
    return random ? random : defaultRandomSource();
}

// Shared helpers for drape unit tests
#pragma once

#include <drape/vector/embedding_math.h>

#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <vector>
#include <unistd.h>

namespace drape::tests {

inline std::filesystem::path make_temp_dir(const std::string& prefix = "drape_test_") {
    auto base = std::filesystem::temp_directory_path();
    for (int i = 0; i < 1000; ++i) {
        auto p = base / (prefix + std::to_string(::getpid()) + "_" + std::to_string(i));
        if (std::filesystem::create_directories(p))
            return p;
    }
    return base;
}

inline std::filesystem::path write_file(const std::filesystem::path& p, const std::string& data) {
    std::filesystem::create_directories(p.parent_path());
    std::ofstream ofs(p, std::ios::binary);
    ofs << data;
    return p;
}

// Unit vector in the x/y plane at `degrees`, padded with zeros to `dim`
inline vector::Embedding planar(double degrees, size_t dim = 4) {
    constexpr double kPi = 3.14159265358979323846;
    vector::Embedding v(dim, 0.0f);
    v[0] = static_cast<float>(std::cos(degrees * kPi / 180.0));
    v[1] = static_cast<float>(std::sin(degrees * kPi / 180.0));
    return v;
}

// Basis vector e_axis of length `dim`
inline vector::Embedding axis(size_t axis, size_t dim = 4) {
    vector::Embedding v(dim, 0.0f);
    v[axis] = 1.0f;
    return v;
}

// Unit vector whose cosine similarity to axis(0) is `similarity`
inline vector::Embedding withSimilarity(double similarity, size_t dim = 4) {
    vector::Embedding v(dim, 0.0f);
    v[0] = static_cast<float>(similarity);
    v[1] = static_cast<float>(std::sqrt(1.0 - similarity * similarity));
    return v;
}

// Sets an environment variable for the lifetime of the guard
class ScopedEnv {
public:
    ScopedEnv(const char* name, const char* value) : name_(name) {
        if (const char* prev = std::getenv(name)) {
            previous_ = prev;
        }
        if (value) {
            ::setenv(name, value, 1);
        } else {
            ::unsetenv(name);
        }
    }

    ~ScopedEnv() {
        if (previous_) {
            ::setenv(name_.c_str(), previous_->c_str(), 1);
        } else {
            ::unsetenv(name_.c_str());
        }
    }

    ScopedEnv(const ScopedEnv&) = delete;
    ScopedEnv& operator=(const ScopedEnv&) = delete;

private:
    std::string name_;
    std::optional<std::string> previous_;
};

} // namespace drape::tests

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <random>
#include <string>

// Fills @p bytes bytes of @p dest with random values, throws on error
void fill_randomly(void* dest, size_t bytes);

class RandomDevice {
public:
    using result_type = uint64_t;

    static constexpr result_type min() noexcept { return std::numeric_limits<result_type>::min(); }

    static constexpr result_type max() noexcept { return std::numeric_limits<result_type>::max(); }

private:
    std::array<result_type, 256 / sizeof(result_type)> buff_{};
    size_t pos_ = buff_.size();

    void fill_buff() {
        fill_randomly(buff_.data(), buff_.size() * sizeof(result_type));
        pos_ = 0;
    }

public:
    RandomDevice() { fill_buff(); }

    RandomDevice(const RandomDevice&) = delete;
    RandomDevice(RandomDevice&&) noexcept = default;
    RandomDevice& operator=(const RandomDevice&) = delete;
    RandomDevice& operator=(RandomDevice&&) noexcept = default;

    ~RandomDevice() = default;

    result_type operator()() {
        if (pos_ == buff_.size()) {
            fill_buff();
        }
        return buff_[pos_++];
    }
};

inline RandomDevice& get_random_generator() {
    static thread_local RandomDevice random_generator;
    return random_generator;
}

// Get random from [a, b]
template <class T>
T get_random(T a, T b) {
    return std::uniform_int_distribution<T>(a, b)(get_random_generator());
}

// Returns @p len random characters from [0-9a-f]
std::string random_hex_string(size_t len);

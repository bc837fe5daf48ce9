#include <array>
#include <cstddef>
#include <cstdint>
#include <iostream>
#include <string>

#include "buffer_sizes_config.hpp"

// Fixed capacity storage sized by build environment settings.
//
//     BUFFER_SIZES_MAX_THING_LEN=128 BUFFER_SIZES_BLOCK_LOG2=4 cmake --build .
//
// rebuilds with a different capacity and block layout; an invalid value
// stops the build.

namespace cfg = buffer_sizes::config;

struct thing {
    std::array<char, cfg::buffer_sizes_max_thing_len> name{};
    std::size_t length = 0;

    bool assign(const std::string& s) {
        if (s.size()>name.size()) return false;
        length = s.copy(name.data(), name.size());
        return true;
    }
};

constexpr std::uint64_t max_len = std::uint64_t(1)<<cfg::buffer_sizes_max_len_log2;

// Storage is blocked only if a block size was configured.
constexpr std::size_t block_size() {
    if constexpr (cfg::buffer_sizes_block_log2.has_value()) {
        return std::size_t(1)<<*cfg::buffer_sizes_block_log2;
    }
    else {
        return 1;
    }
}

int main(int argc, char** argv) {
    thing t;

    std::cout << "thing capacity:  " << t.name.size() << "\n";
    std::cout << "maximum length:  " << max_len << "\n";
    std::cout << "block size:      " << block_size()
              << (cfg::buffer_sizes_block_log2? "": " (unblocked)") << "\n";

    for (int i = 1; i<argc; ++i) {
        std::string arg = argv[i];
        if (t.assign(arg)) {
            std::cout << "stored \"" << std::string(t.name.data(), t.length) << "\"\n";
        }
        else {
            std::cout << "\"" << arg << "\" exceeds capacity of " << t.name.size() << "\n";
        }
    }
    return 0;
}

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

namespace chunkvault {

struct Progress {
    std::string phase;
    std::string name;
    std::size_t chunks_done = 0;
    std::size_t chunks_total = 0;
    std::uint64_t bytes_done = 0;
    std::uint64_t bytes_total = 0;

    double Fraction() const {
        return chunks_total == 0 ? 1.0 : static_cast<double>(chunks_done) / static_cast<double>(chunks_total);
    }
};

// Invoked from worker threads, never concurrently.
using ProgressFn = std::function<void(const Progress&)>;

}  // namespace chunkvault

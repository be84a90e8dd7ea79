// Fuzz target for the line diff: splits the input into two texts, diffs
// them and checks that applying the hunks to the first reproduces the second.

#include <topbase-cpp/diff.hpp>

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <string_view>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto input = std::string_view{reinterpret_cast<const char*>(data), size};
    const auto split = input.find('\0');
    const auto before = input.substr(0, split);
    const auto after = split == std::string_view::npos ? std::string_view{}
                                                       : input.substr(split + 1);

    const auto hunks = topbase_cpp::diff_lines(topbase_cpp::split_lines(before),
                                               topbase_cpp::split_lines(after));
    const auto applied = topbase_cpp::apply_hunks(before, hunks);
    if (!applied || *applied != after) std::abort();
    return 0;
}

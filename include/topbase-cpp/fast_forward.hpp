/// @file fast_forward.hpp
/// @brief Detecting reconciliations that are a pure pointer move.

#pragma once

#include <topbase-cpp/series.hpp>
#include <topbase-cpp/types.hpp>

#include <optional>

namespace topbase_cpp {

/// The tip a branch at `target_tip` can be moved to without creating
/// any commit, or nullopt if the series has to be replayed.
///
/// Requires the series to be the literal history on top of
/// `target_tip`: its first commit has `target_tip` as single parent,
/// each later commit has the previous one as single parent, it ends at
/// the walked tip, and no merge was skipped on the way.
auto try_fast_forward(const CommitSeries& series, const CommitId& target_tip)
    -> std::optional<CommitId>;

}  // namespace topbase_cpp

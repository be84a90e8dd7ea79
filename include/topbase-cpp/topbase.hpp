/// @file topbase.hpp
/// @brief Umbrella header for the topbase-cpp library.
///
/// Include this single header for access to all public types:
/// Repository, MemoryRepository, DryRunRepository, Commit, Tree,
/// TreeDiff, Fingerprint, ForkPoint, CommitSeries, Options, Result,
/// Logger and Error.

#pragma once

#include <topbase-cpp/commit.hpp>
#include <topbase-cpp/diff.hpp>
#include <topbase-cpp/dry_run_repository.hpp>
#include <topbase-cpp/error.hpp>
#include <topbase-cpp/fast_forward.hpp>
#include <topbase-cpp/fingerprint.hpp>
#include <topbase-cpp/fork_point.hpp>
#include <topbase-cpp/log.hpp>
#include <topbase-cpp/memory_repository.hpp>
#include <topbase-cpp/reconcile.hpp>
#include <topbase-cpp/replay.hpp>
#include <topbase-cpp/repository.hpp>
#include <topbase-cpp/series.hpp>
#include <topbase-cpp/types.hpp>

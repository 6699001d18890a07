#pragma once

/**
 * fcl - File classifier
 *
 * Sorts, renames, moves, deduplicates and cleans files, recording every
 * change in a journal so it can be undone later.
 */

#include <fcl/types.hpp>
#include <fcl/result.hpp>
#include <fcl/config_loader.hpp>
#include <fcl/categorizer.hpp>
#include <fcl/content_hasher.hpp>
#include <fcl/safe_mover.hpp>
#include <fcl/file_walker.hpp>
#include <fcl/report.hpp>
#include <fcl/journal/action_journal.hpp>
#include <fcl/journal/undo_engine.hpp>
#include <fcl/file_manager.hpp>

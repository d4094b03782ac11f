#pragma once

#include <pubflow/app/publish_runner.hpp>

#ifdef PUBFLOW_HAS_TBB

namespace pubflow::app {

/// Validates checked units in parallel using TBB.
///
/// Same report as validate_all(): issues are listed in unit order regardless of
/// which TBB task produced them. Only validate() is called from TBB tasks, which
/// leaves unit state alone; plugins shared by several units must tolerate
/// concurrent run_validate() calls.
[[nodiscard]] ValidationReport validate_all_tbb(const WorkUnitList& units);

}  // namespace pubflow::app

#endif  // PUBFLOW_HAS_TBB

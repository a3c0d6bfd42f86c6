#pragma once

#include "curvetrack/command.hpp"
#include <vector>

namespace curvetrack {

// Rebuild the document by re-executing stored revisions in order, batches as
// batches. Journaling is switched off meanwhile so nothing is written twice.
// Throws std::invalid_argument for an entry that cannot be decoded; entries
// before it stay applied.
void restore_from_revisions(CommandStack& stack, const std::vector<RevisionRecord>& records);

} // namespace curvetrack

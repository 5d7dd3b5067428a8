/** \file result_formatter.h
\brief Text rendering of a DifficultyResult.

One line per difficulty, consumed by the plotting script:

Difficulty: <d>, Average Nonce Count: <n>, Avg Time: <t> s, Aggregate Hash Rate: <r> (solutions/s)

Labels and field order are part of the output contract.  Levels without a
solved trial print NaN in place of the three statistics.
*/
#pragma once
#include <string>
#include "stats_aggregator.h"

namespace powcurve
{
    /** \brief Format one result line, without the trailing newline. */
    std::string format_result(const DifficultyResult &result);
}

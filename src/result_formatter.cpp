// result_formatter.cpp
#include <cmath>
#include <iomanip>
#include <sstream>
#include "result_formatter.h"

namespace
{
    void write_value(std::ostringstream &out, double value, int precision)
    {
        if (std::isnan(value))
        {
            out << "NaN";
            return;
        }
        out << std::fixed << std::setprecision(precision) << value;
    }
}

namespace powcurve
{
    std::string format_result(const DifficultyResult &result)
    {
        std::ostringstream out;
        out << "Difficulty: " << result.difficulty << ", Average Nonce Count: ";
        write_value(out, result.mean_nonce_count, 2);
        out << ", Avg Time: ";
        write_value(out, result.mean_time, 3);
        out << " s, Aggregate Hash Rate: ";
        write_value(out, result.aggregate_hash_rate, 2);
        out << " (solutions/s)";
        return out.str();
    }
}

/** \file system_info.h
\brief Label of the machine a benchmark runs on.

Best-effort detection; never throws.
*/
#pragma once
#include <istream>
#include <string>

namespace powcurve
{
    // "model name" of the first processor in /proc/cpuinfo, else "<machine> / <sysname>"
    std::string detect_cpu_label();

    // First "model name" value of a cpuinfo listing, empty if there is none
    std::string parse_cpu_model(std::istream &cpuinfo);
}

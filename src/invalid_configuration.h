#pragma once
#include <stdexcept>

namespace powcurve
{
    /** \brief Fatal configuration error, raised before the run starts. */
    class InvalidConfiguration : public std::invalid_argument
    {
    public:
        using std::invalid_argument::invalid_argument;
    };
}

/** \brief Measure proof-of-work search cost against difficulty.

This file is the entry to the benchmark.  Result lines go to stdout (or the
--output file), diagnostics to stderr.
Syntax: pow_benchmark [options] [difficulty | start:end:step]...

Exit codes: 0 all levels measured, 1 invalid configuration or fatal error,
2 at least one level had no solved trial or too many capped trials.
*/
#include <fstream>
#include <iostream>
#include <memory>
#include "benchmark_config.h"
#include "benchmark_driver.h"
#include "pow_core.h"

int main(int argc, char *argv[])
{
    try
    {
        powcurve::BenchmarkConfig config = powcurve::parse_args(argc, argv);
        if (config.show_help)
        {
            std::cout << powcurve::usage(argv[0]);
            return 0;
        }

        std::unique_ptr<powcurve::PowFunction> pow = powcurve::make_pow_function(config.pow_name);
        powcurve::validate_config(config, *pow);

        std::ofstream file;
        if (!config.output_path.empty())
        {
            file.open(config.output_path, std::ios::out | std::ios::trunc);
            if (!file)
            {
                std::cerr << "[!] Error: cannot open " << config.output_path << "\n";
                return 1;
            }
        }
        std::ostream &out = config.output_path.empty() ? std::cout : file;

        powcurve::RunContext context = powcurve::make_run_context(config, *pow);
        powcurve::BenchmarkReport report = powcurve::run_benchmark(*pow, config, context, out);

        if (!out.flush())
        {
            std::cerr << "[!] Error: writing results failed\n";
            return 1;
        }
        return report.clean() ? 0 : 2;
    }
    catch (const powcurve::InvalidConfiguration &e)
    {
        std::cerr << "[!] Invalid configuration: " << e.what() << "\n"
                  << powcurve::usage(argc > 0 ? argv[0] : "pow_benchmark");
        return 1;
    }
    catch (const std::exception &e)
    {
        std::cerr << "[!] Error: " << e.what() << "\n";
        return 1;
    }
}

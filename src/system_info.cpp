// system_info.cpp
#include <fstream>
#include <sys/utsname.h>
#include "system_info.h"

namespace
{
    std::string trim(const std::string &text)
    {
        const char *space = " \t\r\n";
        size_t begin = text.find_first_not_of(space);
        if (begin == std::string::npos)
            return "";
        size_t end = text.find_last_not_of(space);
        return text.substr(begin, end - begin + 1);
    }

    std::string uname_label()
    {
        struct utsname info{};
        if (uname(&info) != 0)
            return "Unknown CPU";
        return std::string(info.machine) + " / " + info.sysname;
    }
}

namespace powcurve
{
    std::string parse_cpu_model(std::istream &cpuinfo)
    {
        std::string line;
        while (std::getline(cpuinfo, line))
        {
            if (trim(line).rfind("model name", 0) != 0)
                continue;
            size_t colon = line.find(':');
            if (colon == std::string::npos)
                continue;
            std::string model = trim(line.substr(colon + 1));
            if (!model.empty())
                return model;
        }
        return "";
    }

    std::string detect_cpu_label()
    {
        std::ifstream cpuinfo("/proc/cpuinfo");
        if (cpuinfo)
        {
            std::string model = parse_cpu_model(cpuinfo);
            if (!model.empty())
                return model;
        }
        return uname_label();
    }
}

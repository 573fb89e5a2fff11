#include "RoutingBackend.hpp"

#include <sstream>

namespace Routing
{
    std::string Describe(const Route &r)
    {
        std::ostringstream os;
        if (r.type == RouteType::Local)
        {
            os << "local ";
        }
        os << NetConfig::to_string(r.dst) << " dev " << r.dev << " table " << r.table;
        return os.str();
    }

    std::string Describe(const Rule &r)
    {
        std::ostringstream os;
        os << "pref " << r.pref << " fwmark 0x" << std::hex << r.fwmark
           << std::dec << " lookup " << r.table;
        return os.str();
    }
}

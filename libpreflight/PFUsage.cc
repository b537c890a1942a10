#include <preflight/PFUsage.hh>

PFUsage::PFUsage(std::string const& msg) :
    std::runtime_error(msg)
{
}

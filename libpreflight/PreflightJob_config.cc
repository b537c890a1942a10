#include <preflight/PreflightJob.hh>

#include <preflight/PFUsage.hh>

#include <cmath>
#include <cstdlib>

namespace
{
    // Parse a decimal number the whole of which is used.
    bool
    parse_number(std::string const& text, double& result)
    {
        if (text.empty()) {
            return false;
        }
        char* end = nullptr;
        double value = strtod(text.c_str(), &end);
        if (*end != '\0' || !std::isfinite(value)) {
            return false;
        }
        result = value;
        return true;
    }
} // namespace

void
PreflightJob::Config::checkConfiguration()
{
    o.checkConfiguration();
}

PreflightJob::Config*
PreflightJob::Config::inputFile(std::string const& filename)
{
    if (o.m->infilename.empty()) {
        o.m->infilename = filename;
    } else {
        usage("input file has already been given");
    }
    return this;
}

PreflightJob::Config*
PreflightJob::Config::password(std::string const& parameter)
{
    o.m->password = parameter;
    return this;
}

PreflightJob::Config*
PreflightJob::Config::json()
{
    o.m->json = true;
    return this;
}

PreflightJob::Config*
PreflightJob::Config::noContent()
{
    o.m->no_content = true;
    return this;
}

PreflightJob::Config*
PreflightJob::Config::bleedThreshold(std::string const& parameter)
{
    double value = 0.0;
    if (!(parse_number(parameter, value) && value >= 0.0)) {
        usage("--bleed-threshold must be a non-negative number of points");
    }
    o.m->bleed_threshold = value;
    return this;
}

PreflightJob::Config*
PreflightJob::Config::previewScale(std::string const& parameter)
{
    double value = 0.0;
    if (!(parse_number(parameter, value) && value > 0.0)) {
        usage("--preview-scale must be a positive number");
    }
    o.m->preview_scale = value;
    return this;
}

PreflightJob::Config*
PreflightJob::Config::verbose()
{
    o.m->verbose = true;
    return this;
}

PreflightJob::Config*
PreflightJob::Config::quiet()
{
    o.m->quiet = true;
    return this;
}

PreflightJob::Config*
PreflightJob::Config::warningExit0()
{
    o.m->warning_exit_0 = true;
    return this;
}

PreflightJob::Config*
PreflightJob::Config::checkOnly()
{
    o.m->check_only = true;
    return this;
}

#include <preflight/PFUsage.hh>
#include <preflight/PreflightJob.hh>

#include <qpdf/QUtil.hh>

#include <cstdlib>
#include <iostream>

static char const* whoami = nullptr;

static void
usageExit(std::string const& msg)
{
    std::cerr << std::endl
              << whoami << ": " << msg << std::endl
              << std::endl
              << "For help:" << std::endl
              << "  " << whoami << " --help" << std::endl
              << std::endl;
    exit(PreflightJob::EXIT_ERROR);
}

int
realmain(int argc, char* argv[])
{
    whoami = QUtil::getWhoami(argv[0]);

    PreflightJob j;
    try {
        j.initializeFromArgv(argv);
        j.run();
    } catch (PFUsage& e) {
        usageExit(e.what());
    } catch (std::exception& e) {
        std::cerr << whoami << ": " << e.what() << std::endl;
        return PreflightJob::EXIT_ERROR;
    }
    return j.getExitCode();
}

int
main(int argc, char* argv[])
{
    return realmain(argc, argv);
}

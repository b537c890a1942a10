#include <preflight/PreflightJob.hh>

#include <preflight/DLL.h>

#include <qpdf/QPDFLogger.hh>

#include <cstdlib>
#include <cstring>
#include <map>

namespace
{
    struct OptionHelp
    {
        char const* option;
        char const* help;
    };

    OptionHelp const option_help[] = {
        {"--password=password", "password for an encrypted file"},
        {"--json", "write the report as JSON"},
        {"--no-content", "skip colour, image and preview analysis"},
        {"--bleed-threshold=points", "smallest acceptable bleed (default 8.5)"},
        {"--preview-scale=scale", "preview pixels per point (default 1)"},
        {"--verbose", "show progress and per-page geometry"},
        {"--quiet", "don't show warnings about damaged files"},
        {"--warning-exit-0", "exit with status 0 when there are only warnings"},
        {"--check", "only set the exit status; don't write a report"},
        {"--help", "show this help"},
        {"--version", "show the program version"},
    };

    typedef std::shared_ptr<PreflightJob::Config> config_t;
    typedef std::map<std::string, void (*)(config_t, std::string const&)> param_table_t;
    typedef std::map<std::string, void (*)(config_t)> bare_table_t;

    param_table_t const param_options = {
        {"password", [](config_t c, std::string const& p) { c->password(p); }},
        {"bleed-threshold", [](config_t c, std::string const& p) { c->bleedThreshold(p); }},
        {"preview-scale", [](config_t c, std::string const& p) { c->previewScale(p); }},
    };

    bare_table_t const bare_options = {
        {"json", [](config_t c) { c->json(); }},
        {"no-content", [](config_t c) { c->noContent(); }},
        {"verbose", [](config_t c) { c->verbose(); }},
        {"quiet", [](config_t c) { c->quiet(); }},
        {"warning-exit-0", [](config_t c) { c->warningExit0(); }},
        {"check", [](config_t c) { c->checkOnly(); }},
    };
} // namespace

std::string
PreflightJob::getHelp(std::string const& progname)
{
    std::string result = "Usage: " + progname + " [options] file.pdf\n\nOptions:\n";
    for (auto const& oh: option_help) {
        std::string option = oh.option;
        result += "  " + option + std::string(option.size() < 28 ? 28 - option.size() : 1, ' ') +
            oh.help + "\n";
    }
    result += "\nExit status is 0 if the file is ready for print, 2 if it has errors\n"
              "or can't be analysed, and 3 if it has warnings only.\n";
    return result;
}

void
PreflightJob::initializeFromArgv(char const* const argv[])
{
    if (!argv[0]) {
        usage("no arguments given");
    }
    std::string progname = argv[0];
    if (auto slash = progname.find_last_of("/\\"); slash != std::string::npos) {
        progname = progname.substr(slash + 1);
    }
    setMessagePrefix(progname);
    auto c = config();
    bool options_done = false;
    for (int i = 1; argv[i]; ++i) {
        char const* arg = argv[i];
        if (options_done || !(strncmp(arg, "--", 2) == 0 && arg[2])) {
            if (strcmp(arg, "--") == 0 && !options_done) {
                options_done = true;
                continue;
            }
            c->inputFile(arg);
            continue;
        }
        std::string option = arg + 2;
        std::string parameter;
        bool has_parameter = false;
        if (auto eq = option.find('='); eq != std::string::npos) {
            parameter = option.substr(eq + 1);
            option = option.substr(0, eq);
            has_parameter = true;
        }
        if (option == "help" || option == "version") {
            if (has_parameter) {
                usage("--" + option + " does not take a parameter");
            }
            QPDFLogger::defaultLogger()->info(
                option == "help" ? getHelp(progname)
                                 : progname + " version " + PREFLIGHT_VERSION + "\n");
            exit(0);
        }
        if (auto it = param_options.find(option); it != param_options.end()) {
            if (!has_parameter) {
                if (!argv[i + 1]) {
                    usage("--" + option + " must be given as --" + option + "=parameter");
                }
                parameter = argv[++i];
            }
            it->second(c, parameter);
        } else if (auto bit = bare_options.find(option); bit != bare_options.end()) {
            if (has_parameter) {
                usage("--" + option + " does not take a parameter");
            }
            bit->second(c);
        } else {
            usage("unrecognized argument " + std::string(arg));
        }
    }
    c->checkConfiguration();
}

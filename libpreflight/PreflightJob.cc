#include <preflight/PreflightJob.hh>

#include <preflight/BoxGeometry.hh>
#include <preflight/FileIntake.hh>
#include <preflight/PFEventLoop.hh>
#include <preflight/PFExc.hh>
#include <preflight/PFUsage.hh>
#include <preflight/Preflight.hh>

PreflightJob::Members::Members() :
    log(QPDFLogger::defaultLogger()),
    bleed_threshold(BoxGeometry::default_bleed_threshold)
{
}

PreflightJob::PreflightJob() :
    m(new Members())
{
}

void
PreflightJob::usage(std::string const& msg)
{
    throw PFUsage(msg);
}

std::shared_ptr<PreflightJob::Config>
PreflightJob::config()
{
    return std::shared_ptr<Config>(new Config(*this));
}

std::shared_ptr<QPDFLogger>
PreflightJob::getLogger()
{
    return m->log;
}

void
PreflightJob::setLogger(std::shared_ptr<QPDFLogger> l)
{
    m->log = l ? l : QPDFLogger::defaultLogger();
}

std::string const&
PreflightJob::getMessagePrefix() const
{
    return m->message_prefix;
}

void
PreflightJob::setMessagePrefix(std::string const& message_prefix)
{
    m->message_prefix = message_prefix;
}

void
PreflightJob::checkConfiguration()
{
    if (m->infilename.empty()) {
        usage("an input file name is required");
    }
    if (m->verbose && m->quiet) {
        usage("--verbose and --quiet may not be given together");
    }
    if (m->check_only && m->json) {
        usage("--json may not be used with --check");
    }
}

PreflightReport const*
PreflightJob::getReport() const
{
    return m->report ? &*m->report : nullptr;
}

void
PreflightJob::run()
{
    checkConfiguration();
    m->report.reset();

    auto log = m->log;
    if (!m->check_only) {
        // Moves info to standard error if it was on standard output.
        log->saveToStandardOutput(true);
    }
    if (!m->verbose) {
        log->setInfo(log->discard());
    }
    if (m->quiet) {
        log->setWarn(log->discard());
    }

    std::string data = FileIntake::readFile(m->infilename);
    std::string message;
    if (!FileIntake::validate(m->infilename, data, "", message)) {
        throw PFExc(pf_e_unsupported, m->infilename, "", message);
    }

    Preflight::Options options;
    options.bleed_threshold = m->bleed_threshold;
    options.preview_scale = m->preview_scale;
    options.skip_content = m->no_content;

    PFEventLoop loop;
    Preflight preflight(loop, options, nullptr, log);
    auto handle = preflight.analyse(data, m->infilename, m->password);
    if (m->verbose) {
        auto prefix = m->message_prefix;
        handle.registerProgressReporter(
            std::make_shared<Preflight::FunctionProgressReporter>([log, prefix](int p) {
                log->info(prefix + ": " + std::to_string(p) + "%\n");
            }));
    }
    while (!handle.isSettled() && loop.runOne()) {
        // keep going
    }
    if (handle.getState() == Preflight::st_failed) {
        throw handle.getError();
    }
    if (handle.getState() != Preflight::st_done) {
        throw PFExc(pf_e_internal, m->infilename, "", "analysis did not finish");
    }
    m->report = handle.getReport();

    if (m->verbose && handle.getPreview()) {
        auto const& preview = *handle.getPreview();
        log->info(
            m->message_prefix + ": preview of page 1 is " + std::to_string(preview.width) +
            " x " + std::to_string(preview.height) + " pixels\n");
    }
    if (!m->check_only) {
        writeReport(*m->report);
    }
}

void
PreflightJob::writeReport(PreflightReport const& report)
{
    auto p = m->log->getSave();
    if (m->json) {
        report.getJSON().write(p.get(), 0);
        *p << "\n";
    } else {
        report.writeText(p.get(), m->verbose);
    }
}

int
PreflightJob::getExitCode() const
{
    if (!m->report) {
        return EXIT_ERROR;
    }
    if (m->report->countIssues(pf_sev_error) > 0) {
        return EXIT_ERROR;
    }
    if (m->report->countIssues(pf_sev_warning) > 0 && !m->warning_exit_0) {
        return EXIT_WARNING;
    }
    return 0;
}

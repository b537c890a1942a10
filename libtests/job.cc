#include <preflight/assert_test.h>

#include "test_pdf.hh"

#include <preflight/PFExc.hh>
#include <preflight/PFUsage.hh>
#include <preflight/PreflightJob.hh>

#include <qpdf/Pl_OStream.hh>
#include <qpdf/QPDFLogger.hh>

#include <cstdio>
#include <fstream>
#include <functional>
#include <iostream>
#include <sstream>

static void
write_file(char const* filename, std::string const& data)
{
    std::ofstream f(filename, std::ios::binary);
    f << data;
}

// A page with good geometry and RGB content: one warning
static std::string
rgb_pdf()
{
    TestPDF pdf;
    int content = pdf.addStream("", "0 1 0 rg 0 0 5 5 re f");
    int page = pdf.add(
        "<< /Type /Page /MediaBox [0 0 200 100] /TrimBox [9 9 191 91] /BleedBox [0 0 200 100] "
        "/Contents " +
        TestPDF::ref(content) + " >>");
    return finish_pdf(pdf, {page});
}

struct Output
{
    std::ostringstream report;
    std::ostringstream out;
    std::ostringstream err;
};

static std::shared_ptr<QPDFLogger>
make_logger(Output& output)
{
    auto log = QPDFLogger::create();
    log->setOutputStreams(&output.out, &output.err);
    log->setSave(std::make_shared<Pl_OStream>("report", output.report), false);
    return log;
}

static int
run_job(std::function<void(PreflightJob::Config*)> configure, Output& output)
{
    PreflightJob job;
    job.setLogger(make_logger(output));
    configure(job.config().get());
    job.run();
    assert(job.getReport());
    return job.getExitCode();
}

static void
expect_usage(std::function<void(PreflightJob&)> fn, std::string const& message)
{
    PreflightJob job;
    bool threw = false;
    try {
        fn(job);
    } catch (PFUsage& e) {
        std::cout << "usage: " << e.what() << std::endl;
        assert(std::string(e.what()) == message);
        threw = true;
    }
    assert(threw);
}

static void
test_reports()
{
    write_file("job-rgb.pdf", rgb_pdf());
    {
        Output o;
        assert(run_job([](auto c) { c->inputFile("job-rgb.pdf"); }, o) ==
               PreflightJob::EXIT_WARNING);
        std::cout << o.report.str();
        assert(o.report.str().starts_with("file: job-rgb.pdf ("));
        assert(
            o.report.str().ends_with("result: ready for print (0 errors, 1 warnings, 0 infos)\n"));
        // Progress is only shown with --verbose.
        assert(o.out.str().empty());
    }
    {
        Output o;
        assert(run_job([](auto c) { c->inputFile("job-rgb.pdf")->warningExit0(); }, o) == 0);
    }
    {
        Output o;
        assert(run_job([](auto c) { c->inputFile("job-rgb.pdf")->noContent(); }, o) == 0);
        assert(o.report.str().find("issues:") == std::string::npos);
    }
    {
        Output o;
        run_job([](auto c) { c->inputFile("job-rgb.pdf")->json(); }, o);
        assert(o.report.str().starts_with("{"));
        assert(o.report.str().find("\"ready\": true") != std::string::npos);
        assert(o.report.str().find("\"degraded\": false") != std::string::npos);

        // Identical input gives an identical report.
        Output again;
        run_job([](auto c) { c->inputFile("job-rgb.pdf")->json(); }, again);
        assert(again.report.str() == o.report.str());
    }
    {
        Output o;
        assert(
            run_job([](auto c) { c->inputFile("job-rgb.pdf")->checkOnly(); }, o) ==
            PreflightJob::EXIT_WARNING);
        assert(o.report.str().empty());
    }
    {
        // Verbose progress goes to the info pipeline; the page summary
        // goes with the report.
        Output o;
        run_job([](auto c) { c->inputFile("job-rgb.pdf")->verbose()->previewScale("0.5"); }, o);
        assert(o.report.str().find("page 1: 200") != std::string::npos);
        assert(o.report.str().find(", trim 182") != std::string::npos);
        assert(o.out.str().find("preflight: job-rgb.pdf: done\n") != std::string::npos);
        assert(o.out.str().find("pdfpreflight: 100%\n") != std::string::npos);
        assert(o.out.str().find("preview of page 1 is 100 x 50 pixels") != std::string::npos);
    }
    remove("job-rgb.pdf");

    write_file("job-empty.pdf", make_pages_pdf({}));
    {
        Output o;
        assert(run_job([](auto c) { c->inputFile("job-empty.pdf"); }, o) == PreflightJob::EXIT_ERROR);
        assert(o.report.str().find("not ready for print") != std::string::npos);
    }
    remove("job-empty.pdf");
}

static void
test_errors()
{
    write_file("job-text.txt", rgb_pdf());
    write_file("job-damaged.pdf", "%PDF-1.4\nnothing to see here\n");

    auto expect_exc = [](char const* filename, pf_error_code_e code) {
        PreflightJob job;
        Output o;
        job.setLogger(make_logger(o));
        job.config()->inputFile(filename);
        bool threw = false;
        try {
            job.run();
        } catch (PFExc& e) {
            std::cout << e.what() << std::endl;
            assert(e.getErrorCode() == code);
            threw = true;
        }
        assert(threw);
        assert(job.getReport() == nullptr);
        assert(job.getExitCode() == PreflightJob::EXIT_ERROR);
        assert(o.report.str().empty());
    };
    expect_exc("job-text.txt", pf_e_unsupported);
    expect_exc("job-damaged.pdf", pf_e_damaged_pdf);
    expect_exc("job-missing.pdf", pf_e_system);
    remove("job-text.txt");
    remove("job-damaged.pdf");
}

static void
test_configuration()
{
    expect_usage(
        [](PreflightJob& j) { j.config()->bleedThreshold("-1"); },
        "--bleed-threshold must be a non-negative number of points");
    expect_usage(
        [](PreflightJob& j) { j.config()->bleedThreshold("8.5mm"); },
        "--bleed-threshold must be a non-negative number of points");
    expect_usage(
        [](PreflightJob& j) { j.config()->previewScale("0"); },
        "--preview-scale must be a positive number");
    expect_usage(
        [](PreflightJob& j) { j.config()->inputFile("a.pdf")->inputFile("b.pdf"); },
        "input file has already been given");
    expect_usage([](PreflightJob& j) { j.checkConfiguration(); }, "an input file name is required");
    expect_usage(
        [](PreflightJob& j) { j.config()->inputFile("a.pdf")->verbose()->quiet(); j.run(); },
        "--verbose and --quiet may not be given together");
    expect_usage(
        [](PreflightJob& j) { j.config()->inputFile("a.pdf")->json()->checkOnly(); j.run(); },
        "--json may not be used with --check");
}

static void
test_argv()
{
    PreflightJob job;
    char const* argv[] = {
        "/usr/bin/pdfpreflight", "--json", "--bleed-threshold=3", "--no-content", "in.pdf", nullptr};
    job.initializeFromArgv(argv);
    assert(job.getMessagePrefix() == "pdfpreflight");

    {
        // A parameter may also be the next argument.
        PreflightJob j;
        char const* args[] = {"pdfpreflight", "--password", "secret", "in.pdf", nullptr};
        j.initializeFromArgv(args);
    }
    {
        // Everything after -- is a file name.
        PreflightJob j;
        char const* args[] = {"pdfpreflight", "--", "--odd.pdf", nullptr};
        j.initializeFromArgv(args);
    }
    expect_usage(
        [](PreflightJob& j) {
            char const* args[] = {"pdfpreflight", "--colour", "in.pdf", nullptr};
            j.initializeFromArgv(args);
        },
        "unrecognized argument --colour");
    expect_usage(
        [](PreflightJob& j) {
            char const* args[] = {"pdfpreflight", "--json=yes", "in.pdf", nullptr};
            j.initializeFromArgv(args);
        },
        "--json does not take a parameter");
    expect_usage(
        [](PreflightJob& j) {
            char const* args[] = {"pdfpreflight", "in.pdf", "--password", nullptr};
            j.initializeFromArgv(args);
        },
        "--password must be given as --password=parameter");
    {
        auto help = PreflightJob::getHelp("pdfpreflight");
        assert(help.starts_with("Usage: pdfpreflight [options] file.pdf\n"));
        assert(help.find("  --warning-exit-0") != std::string::npos);
    }

    expect_usage(
        [](PreflightJob& j) {
            char const* args[] = {"pdfpreflight", "--json", "--check", "in.pdf", nullptr};
            j.initializeFromArgv(args);
        },
        "--json may not be used with --check");
}

int
main()
{
    test_reports();
    test_errors();
    test_configuration();
    test_argv();
    std::cout << "job tests passed" << std::endl;
    return 0;
}

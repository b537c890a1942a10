#include <preflight/assert_test.h>

#include "test_pdf.hh"

#include <preflight/PFExc.hh>
#include <preflight/Preflight.hh>

#include <qpdf/Pl_String.hh>
#include <qpdf/QPDFLogger.hh>

#include <iostream>
#include <optional>
#include <stdexcept>
#include <utility>

static std::string log_text;

static std::shared_ptr<QPDFLogger>
make_logger()
{
    auto log = QPDFLogger::create();
    auto p = std::make_shared<Pl_String>("log", nullptr, log_text);
    log->setInfo(p);
    log->setWarn(p);
    log->setError(p);
    return log;
}

static std::string
rgb_pdf(int npages)
{
    TestPDF pdf;
    int content = pdf.addStream("", "1 0 0 rg 0 0 10 10 re f");
    std::vector<int> pages;
    for (int i = 0; i < npages; ++i) {
        pages.push_back(pdf.add(
            "<< /Type /Page /MediaBox [0 0 200 100] /TrimBox [9 9 191 91] "
            "/BleedBox [0 0 200 100] /Contents " +
            TestPDF::ref(content) + " >>"));
    }
    return finish_pdf(pdf, pages);
}

// A provider whose sessions paint RGB on pages before fail_page and
// fail to produce operators from fail_page on
class BrokenProvider: public PFContentProvider
{
  public:
    BrokenProvider(int fail_page = 1) :
        fail_page(fail_page)
    {
    }

    class BrokenSession: public Session
    {
      public:
        BrokenSession(bool& released, int fail_page) :
            released(released),
            fail_page(fail_page)
        {
        }
        ~BrokenSession() override = default;
        std::vector<Operation>
        getOperatorList(int page) override
        {
            if (page >= fail_page) {
                if (fail_page == 1) {
                    throw PFExc(pf_e_content, "no decoder for this content");
                }
                throw PFExc(pf_e_content, "page " + std::to_string(page) + " broken");
            }
            Operation op;
            op.opcode = op_set_fill_rgb;
            op.op = "rg";
            return {op};
        }
        Bitmap
        render(int, double) override
        {
            return {};
        }
        void
        release() override
        {
            released = true;
        }
        bool
        isReleased() const override
        {
            return released;
        }

      private:
        bool& released;
        int fail_page;
    };

    ~BrokenProvider() override = default;
    std::unique_ptr<Session>
    openSession(std::shared_ptr<QPDF>) override
    {
        ++sessions;
        return std::make_unique<BrokenSession>(released, fail_page);
    }

    int fail_page;
    int sessions{0};
    bool released{false};
};

// Every kind of finding on three pages: a font that isn't embedded,
// transparency, RGB and CMYK colour, images, and short bleed
static std::string
mixed_pdf()
{
    TestPDF pdf("1.6");
    int image = pdf.addStream(
        "/Type /XObject /Subtype /Image /Width 1 /Height 1 /ColorSpace /DeviceRGB "
        "/BitsPerComponent 8",
        "abc");
    int c1 = pdf.addStream("", "BT /F1 12 Tf (Hi) Tj ET 1 0 0 rg 0 0 5 5 re f /Im0 Do");
    int c2 = pdf.addStream("", "/GS0 gs 0 0 0 1 k 0 0 5 5 re f 0.2 0.3 0.4 RG");
    int c3 = pdf.addStream("", "0.5 g BI /W 1 /H 1 /CS /G /BPC 8 ID x EI");
    std::string resources = "/Resources << /Font << /F1 << /Type /Font /Subtype /TrueType "
                            "/BaseFont /ABCDEF+Garamond >> >> /XObject << /Im0 " +
        TestPDF::ref(image) + " >> /ExtGState << /GS0 << /ca 0.5 >> >> >>";
    int p1 = pdf.add(
        "<< /Type /Page /MediaBox [0 0 612 792] /TrimBox [9 9 603 783] /BleedBox [0 0 612 792] "
        "/Contents " +
        TestPDF::ref(c1) + " " + resources + " >>");
    int p2 = pdf.add(
        "<< /Type /Page /MediaBox [0 0 612 792] /TrimBox [4 4 608 788] /BleedBox [0 0 612 792] "
        "/Group << /S /Transparency >> /Contents " +
        TestPDF::ref(c2) + " " + resources + " >>");
    int p3 = pdf.add(
        "<< /Type /Page /MediaBox [0 0 595.28 841.89] /Contents " + TestPDF::ref(c3) + " >>");
    return finish_pdf(pdf, {p1, p2, p3});
}

static void
test_event_loop()
{
    PFEventLoop loop;
    std::string order;
    assert(!loop.runOne());
    loop.post([&]() {
        order += "a";
        loop.post([&]() { order += "c"; });
    });
    loop.post([&]() { order += "b"; });
    assert(loop.pending() == 2);
    assert(loop.runOne());
    assert(order == "a");
    assert(loop.run() == 2);
    assert(order == "abc");
    assert(loop.pending() == 0);

    bool threw = false;
    try {
        loop.post(nullptr);
    } catch (std::logic_error&) {
        threw = true;
    }
    assert(threw);

    // A throwing task is removed before it runs.
    loop.post([]() { throw std::runtime_error("task failed"); });
    threw = false;
    try {
        loop.runOne();
    } catch (std::runtime_error&) {
        threw = true;
    }
    assert(threw);
    assert(loop.pending() == 0);
}

static void
test_success()
{
    PFEventLoop loop;
    Preflight::Options options;
    options.preview_scale = 0.5;
    Preflight pf(loop, options, nullptr, make_logger());
    assert(pf.getState() == Preflight::st_idle);
    assert(pf.getReport() == nullptr);

    auto handle = pf.analyse(rgb_pdf(2), "good.pdf");
    assert(handle.getState() == Preflight::st_analysing_structural);
    assert(!handle.isSettled());
    std::vector<int> progress;
    handle.registerProgressReporter(std::make_shared<Preflight::FunctionProgressReporter>(
        [&progress](int p) { progress.push_back(p); }));
    int settled = 0;
    handle.onSettled([&settled](Preflight::Handle const& h) {
        ++settled;
        assert(h.getState() == Preflight::st_done);
    });

    loop.run();
    assert(settled == 1);
    assert(handle.getState() == Preflight::st_done);
    assert(handle.isSettled());
    assert(!handle.isCancelled());
    assert(handle.getProgress() == 100);
    assert(!progress.empty() && progress.back() == 100);
    for (size_t i = 1; i < progress.size(); ++i) {
        assert(progress.at(i) > progress.at(i - 1));
    }

    auto const& report = handle.getReport();
    assert(pf.getReport() == &report);
    assert(report.getFileName() == "good.pdf");
    assert(report.getPageCount() == 2);
    assert(!report.isDegraded());
    assert(report.passes());
    // An RGB warning for each page and nothing else
    assert(report.getIssues().size() == 2);
    for (auto const& issue: report.getIssues()) {
        assert(issue.getCategory() == pf_cat_colour);
    }
    assert(handle.getPreview());
    assert(handle.getPreview()->width == 100);
    assert(handle.getPreview()->height == 50);

    bool threw = false;
    try {
        handle.getError();
    } catch (std::logic_error&) {
        threw = true;
    }
    assert(threw);

    assert(log_text.find("good.pdf: analysing structure") != std::string::npos);
    assert(log_text.find("good.pdf: analysing content") != std::string::npos);
    assert(log_text.find("good.pdf: done") != std::string::npos);
}

static void
test_supersede()
{
    PFEventLoop loop;
    Preflight pf(loop, Preflight::Options(), nullptr, make_logger());
    auto a = pf.analyse(rgb_pdf(3), "a.pdf");
    bool a_settled = false;
    a.onSettled([&a_settled](Preflight::Handle const&) { a_settled = true; });
    // Let A get part way through its pages.
    loop.runOne();
    loop.runOne();
    auto b = pf.analyse(rgb_pdf(1), "b.pdf");
    assert(a.isCancelled());
    assert(a.isSettled());
    loop.run();

    assert(!a_settled);
    bool threw = false;
    try {
        a.getReport();
    } catch (std::logic_error&) {
        threw = true;
    }
    assert(threw);
    assert(!a.getPreview());

    assert(b.getState() == Preflight::st_done);
    assert(b.getReport().getFileName() == "b.pdf");
    assert(b.getReport().getPageCount() == 1);
    assert(pf.getReport() == &b.getReport());

    // B queued before A ever runs
    auto c = pf.analyse(rgb_pdf(1), "c.pdf");
    auto d = pf.analyse(rgb_pdf(2), "d.pdf");
    loop.run();
    assert(c.isCancelled());
    assert(c.getState() == Preflight::st_analysing_structural);
    assert(d.getReport().getPageCount() == 2);

    // Cancelling a finished run does nothing.
    d.cancel();
    assert(!d.isCancelled());
    assert(pf.getState() == Preflight::st_done);
}

static void
test_degraded()
{
    PFEventLoop loop;
    auto provider = std::make_shared<BrokenProvider>();
    Preflight pf(loop, Preflight::Options(), provider, make_logger());
    auto handle = pf.analyse(rgb_pdf(2), "broken.pdf");
    loop.run();
    assert(handle.getState() == Preflight::st_done);
    assert(provider->sessions == 1);
    assert(provider->released);
    assert(!handle.getPreview());
    auto const& report = handle.getReport();
    assert(report.isDegraded());
    assert(report.passes());
    assert(report.getIssues().size() == 1);
    auto const& issue = report.getIssues().at(0);
    assert(issue.getSeverity() == pf_sev_warning);
    assert(issue.getCategory() == pf_cat_document);
    assert(
        issue.getMessage() ==
        "Previews and image analysis unavailable: no decoder for this content");
}

static void
test_skip_content()
{
    PFEventLoop loop;
    Preflight::Options options;
    options.skip_content = true;
    auto provider = std::make_shared<BrokenProvider>();
    Preflight pf(loop, options, provider, make_logger());
    auto handle = pf.analyse(rgb_pdf(1), "skip.pdf");
    loop.run();
    assert(handle.getState() == Preflight::st_done);
    assert(provider->sessions == 0);
    assert(handle.getReport().getIssues().empty());
    assert(!handle.getReport().isDegraded());
}

static void
test_failure()
{
    PFEventLoop loop;
    Preflight pf(loop, Preflight::Options(), nullptr, make_logger());
    auto handle = pf.analyse("this is not a PDF", "bad.pdf");
    int settled = 0;
    handle.onSettled([&settled](Preflight::Handle const&) { ++settled; });
    loop.run();
    assert(settled == 1);
    assert(handle.getState() == Preflight::st_failed);
    assert(pf.getState() == Preflight::st_failed);
    assert(handle.getProgress() == 100);
    assert(handle.getError().getErrorCode() == pf_e_damaged_pdf);
    assert(handle.getError().getFilename() == "bad.pdf");
    assert(pf.getReport() == nullptr);
    std::cout << handle.getError().what() << std::endl;

    // No pages is a report with an error, not a failure.
    TestPDF pdf;
    handle = pf.analyse(finish_pdf(pdf, {}), "empty.pdf");
    loop.run();
    assert(handle.getState() == Preflight::st_done);
    assert(!handle.getReport().passes());
}

static void
test_partial_content_discarded()
{
    // Page 1's content is scanned before page 2's fails. The degraded
    // report has no colour findings at all.
    PFEventLoop loop;
    auto provider = std::make_shared<BrokenProvider>(2);
    Preflight pf(loop, Preflight::Options(), provider, make_logger());
    auto handle = pf.analyse(rgb_pdf(2), "partial.pdf");
    loop.run();
    assert(handle.getState() == Preflight::st_done);
    assert(provider->released);
    assert(!handle.getPreview());
    auto const& report = handle.getReport();
    for (auto const& issue: report.getIssues()) {
        std::cout << issue.unparse() << std::endl;
    }
    assert(report.isDegraded());
    assert(report.getIssues().size() == 1);
    assert(report.countIssues(pf_sev_warning) == 1);
    assert(report.getIssues().at(0).getCategory() == pf_cat_document);
    assert(
        report.getIssues().at(0).getMessage() ==
        "Previews and image analysis unavailable: page 2 broken");
}

static void
test_deterministic()
{
    auto analyse = [](std::string const& data) {
        PFEventLoop loop;
        Preflight pf(loop, Preflight::Options(), nullptr, make_logger());
        auto handle = pf.analyse(data, "mixed.pdf");
        loop.run();
        assert(handle.getState() == Preflight::st_done);
        auto const& report = handle.getReport();
        std::string text;
        Pl_String p("text", nullptr, text);
        report.writeText(&p, true);
        p.finish();
        return std::make_pair(report.getJSON().unparse(), text);
    };
    auto data = mixed_pdf();
    auto first = analyse(data);
    auto second = analyse(data);
    std::cout << first.second;
    assert(first == second);

    // Make sure the document exercised every category.
    for (auto category: {"\"fonts\"", "\"transparency\"", "\"colour\"", "\"images\"",
                         "\"geometry\""}) {
        assert(first.first.find(std::string("\"category\": ") + category) != std::string::npos);
    }
    assert(first.second.find("Garamond (TrueType), not embedded") != std::string::npos);
}

static void
test_destroyed_with_tasks_queued()
{
    PFEventLoop loop;
    int settled = 0;
    std::optional<Preflight::Handle> handle;
    {
        Preflight pf(loop, Preflight::Options(), nullptr, make_logger());
        handle = pf.analyse(rgb_pdf(2), "gone.pdf");
        handle->onSettled([&settled](Preflight::Handle const&) { ++settled; });
        loop.runOne();
        assert(loop.pending() > 0);
    }
    // The tasks left behind run without touching the destroyed object.
    loop.run();
    assert(loop.pending() == 0);
    assert(settled == 0);
    assert(handle->isCancelled());
    assert(handle->isSettled());
}

int
main()
{
    test_event_loop();
    test_success();
    test_supersede();
    test_degraded();
    test_partial_content_discarded();
    test_skip_content();
    test_failure();
    test_deterministic();
    test_destroyed_with_tasks_queued();
    std::cout << "orchestrator tests passed" << std::endl;
    return 0;
}

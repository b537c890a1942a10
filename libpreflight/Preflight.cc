#include <preflight/Preflight.hh>

#include <preflight/BoxGeometry.hh>
#include <preflight/ColourImageScanner.hh>
#include <preflight/DocumentLoader.hh>
#include <preflight/FontInventory.hh>
#include <preflight/PFDocumentContentProvider.hh>
#include <preflight/ReportAggregator.hh>
#include <preflight/TransparencyDetector.hh>

#include <qpdf/QPDFPageDocumentHelper.hh>

#include <stdexcept>

class Preflight::Run
{
  public:
    Run(unsigned long long id, std::string const& file_name, size_t file_size) :
        id(id),
        file_name(file_name),
        aggregator(file_name, file_size)
    {
    }

    void
    releaseSession()
    {
        if (session) {
            session->release();
            session = nullptr;
        }
    }

    unsigned long long id;
    std::string file_name;
    std::string data;
    std::string password;
    state_e state{st_idle};
    bool cancelled{false};
    int progress{0};
    size_t steps_done{0};
    size_t steps_total{1};

    std::shared_ptr<QPDF> qpdf;
    std::vector<QPDFPageObjectHelper> pages;
    std::vector<PageInfo> page_info;
    PDFVersion version;
    std::unique_ptr<FontInventory> fonts;
    ReportAggregator aggregator;
    std::unique_ptr<PFContentProvider::Session> session;
    // Colour and image issues, held until the content pass completes
    std::vector<PreflightIssue> content_issues;

    std::optional<PreflightReport> report;
    std::optional<PFExc> error;
    std::optional<PFContentProvider::Bitmap> preview;
    std::function<void(Handle const&)> settled_fn;
    std::shared_ptr<ProgressReporter> progress_reporter;
};

Preflight::ProgressReporter::~ProgressReporter() // NOLINT (modernize-use-equals-default)
{
    // Must be explicit and not inline so the vtable lands in the library.
}

Preflight::FunctionProgressReporter::FunctionProgressReporter(std::function<void(int)> handler) :
    handler(handler)
{
}

Preflight::FunctionProgressReporter::~FunctionProgressReporter() // NOLINT
{
    // Must be explicit and not inline so the vtable lands in the library.
}

void
Preflight::FunctionProgressReporter::reportProgress(int progress)
{
    handler(progress);
}

Preflight::Handle::Handle(std::shared_ptr<Run> run) :
    run(run)
{
}

Preflight::state_e
Preflight::Handle::getState() const
{
    return run->state;
}

int
Preflight::Handle::getProgress() const
{
    return run->progress;
}

bool
Preflight::Handle::isSettled() const
{
    return run->cancelled || run->state == st_done || run->state == st_failed;
}

bool
Preflight::Handle::isCancelled() const
{
    return run->cancelled;
}

void
Preflight::Handle::cancel()
{
    if (run->state == st_done || run->state == st_failed) {
        return;
    }
    run->cancelled = true;
    run->releaseSession();
}

PreflightReport const&
Preflight::Handle::getReport() const
{
    if (!run->report) {
        throw std::logic_error("Preflight::Handle::getReport called before the run was done");
    }
    return *run->report;
}

PFExc const&
Preflight::Handle::getError() const
{
    if (!run->error) {
        throw std::logic_error("Preflight::Handle::getError called on a run that did not fail");
    }
    return *run->error;
}

std::optional<PFContentProvider::Bitmap> const&
Preflight::Handle::getPreview() const
{
    return run->preview;
}

void
Preflight::Handle::onSettled(std::function<void(Handle const&)> fn)
{
    run->settled_fn = fn;
}

void
Preflight::Handle::registerProgressReporter(std::shared_ptr<ProgressReporter> pr)
{
    run->progress_reporter = pr;
}

Preflight::Preflight(
    PFEventLoop& loop,
    Options const& options,
    std::shared_ptr<PFContentProvider> provider,
    std::shared_ptr<QPDFLogger> logger) :
    loop(loop),
    options(options),
    provider(provider ? provider : std::make_shared<PFDocumentContentProvider>()),
    log(logger ? logger : QPDFLogger::defaultLogger()),
    alive(std::make_shared<bool>(true))
{
}

Preflight::~Preflight()
{
    cancel();
}

char const*
Preflight::stateName(state_e state)
{
    switch (state) {
    case st_idle:
        return "idle";
    case st_analysing_structural:
        return "analysing structure";
    case st_analysing_content:
        return "analysing content";
    case st_done:
        return "done";
    case st_failed:
        return "failed";
    }
    return "unknown";
}

Preflight::Handle
Preflight::analyse(std::string const& data, std::string const& file_name, std::string const& password)
{
    cancel();
    auto run = std::make_shared<Run>(next_run_id++, file_name, data.size());
    run->data = data;
    run->password = password;
    current = run;
    setState(run, st_analysing_structural);
    post([this, run]() { startStructural(run); });
    return {run};
}

void
Preflight::post(std::function<void()> task)
{
    std::weak_ptr<bool> token = alive;
    loop.post([token, task]() {
        if (!token.expired()) {
            task();
        }
    });
}

void
Preflight::cancel()
{
    if (current && !Handle(current).isSettled()) {
        log->info("preflight: " + current->file_name + ": analysis cancelled\n");
        Handle(current).cancel();
    }
}

Preflight::state_e
Preflight::getState() const
{
    return current ? current->state : st_idle;
}

PreflightReport const*
Preflight::getReport() const
{
    if (current && current->report) {
        return &*current->report;
    }
    return nullptr;
}

void
Preflight::setState(std::shared_ptr<Run> run, state_e state)
{
    run->state = state;
    log->info("preflight: " + run->file_name + ": " + stateName(state) + "\n");
}

void
Preflight::updateProgress(std::shared_ptr<Run> run)
{
    ++run->steps_done;
    int progress = static_cast<int>(100 * run->steps_done / run->steps_total);
    if (progress > 99) {
        // 100 is reserved for a settled run.
        progress = 99;
    }
    if (progress != run->progress) {
        run->progress = progress;
        if (run->progress_reporter) {
            run->progress_reporter->reportProgress(progress);
        }
    }
}

void
Preflight::startStructural(std::shared_ptr<Run> run)
{
    if (run->cancelled) {
        return;
    }
    try {
        std::string data;
        data.swap(run->data);
        run->qpdf = DocumentLoader::load(data, run->file_name, run->password, log);
        run->version = DocumentLoader::getVersion(*run->qpdf);
        run->pages = QPDFPageDocumentHelper(*run->qpdf).getAllPages();
        run->fonts = std::make_unique<FontInventory>();
    } catch (std::exception& e) {
        fail(run, PFExc::fromException(e, run->file_name, pf_e_analysis));
        return;
    }

    // load, each page twice, and the preview
    run->steps_total = 2 + 2 * run->pages.size();
    updateProgress(run);
    for (size_t i = 0; i < run->pages.size(); ++i) {
        post([this, run, i]() { structuralPage(run, i); });
    }
    post([this, run]() { finishStructural(run); });
}

void
Preflight::structuralPage(std::shared_ptr<Run> run, size_t index)
{
    if (run->cancelled || run->state != st_analysing_structural) {
        return;
    }
    int page_number = static_cast<int>(index + 1);
    try {
        auto page = run->pages.at(index);
        auto info = BoxGeometry::resolvePage(page, page_number);
        run->page_info.push_back(info);
        std::vector<PreflightIssue> issues;
        BoxGeometry::checkPage(
            info, run->page_info.front(), options.bleed_threshold, options.size_tolerance, issues);
        run->fonts->addPage(page_number, page.getAttribute("/Resources", false), issues);
        TransparencyDetector::checkPage(page, page_number, run->version, issues);
        run->aggregator.addPage(info);
        run->aggregator.addPageIssues(issues);
    } catch (PFExc& e) {
        fail(run, e);
        return;
    } catch (std::exception& e) {
        fail(
            run,
            PFExc(pf_e_analysis, run->file_name, "page " + std::to_string(page_number), e.what()));
        return;
    }
    updateProgress(run);
}

void
Preflight::finishStructural(std::shared_ptr<Run> run)
{
    if (run->cancelled || run->state != st_analysing_structural) {
        return;
    }
    auto& qpdf = *run->qpdf;
    run->aggregator.setFonts(run->fonts->getFonts());
    run->aggregator.setDocumentInfo(run->version, qpdf.isEncrypted(), qpdf.numWarnings());
    if (options.skip_content || run->pages.empty()) {
        finish(run);
        return;
    }

    setState(run, st_analysing_content);
    contentStep(run, [this, run]() { run->session = provider->openSession(run->qpdf); });
    if (run->state != st_analysing_content) {
        return;
    }
    for (size_t i = 0; i < run->pages.size(); ++i) {
        post([this, run, i]() { contentPage(run, i); });
    }
    post([this, run]() { renderPreview(run); });
}

void
Preflight::contentPage(std::shared_ptr<Run> run, size_t index)
{
    if (run->cancelled || run->state != st_analysing_content) {
        return;
    }
    contentStep(run, [run, index]() {
        int page_number = static_cast<int>(index + 1);
        auto scan = ColourImageScanner::scan(run->session->getOperatorList(page_number));
        std::vector<PreflightIssue> colour_issues;
        std::vector<PreflightIssue> image_issues;
        ColourImageScanner::report(scan, page_number, colour_issues, image_issues);
        run->content_issues.insert(
            run->content_issues.end(), colour_issues.begin(), colour_issues.end());
        run->content_issues.insert(
            run->content_issues.end(), image_issues.begin(), image_issues.end());
    });
    if (run->state == st_analysing_content) {
        updateProgress(run);
    }
}

void
Preflight::renderPreview(std::shared_ptr<Run> run)
{
    if (run->cancelled || run->state != st_analysing_content) {
        return;
    }
    contentStep(run, [this, run]() {
        int page = options.preview_page;
        if (page >= 1 && static_cast<size_t>(page) <= run->pages.size()) {
            run->preview = run->session->render(page, options.preview_scale);
        }
    });
    if (run->state == st_analysing_content) {
        run->aggregator.addPageIssues(run->content_issues);
        run->content_issues.clear();
        finish(run);
    }
}

void
Preflight::contentStep(std::shared_ptr<Run> run, std::function<void()> fn)
{
    try {
        fn();
    } catch (std::exception& e) {
        // The content pass is optional. Keep the structural report.
        std::string reason = e.what();
        if (auto pe = dynamic_cast<PFExc*>(&e)) {
            reason = pe->getMessageDetail();
        }
        log->warn("preflight: " + run->file_name + ": content analysis unavailable: " + reason + "\n");
        // Findings from pages scanned before the failure are partial.
        run->content_issues.clear();
        run->preview.reset();
        run->aggregator.setContentUnavailable(reason);
        finish(run);
    }
}

void
Preflight::fail(std::shared_ptr<Run> run, PFExc const& e)
{
    auto code = e.getErrorCode();
    if (code == pf_e_damaged_pdf || code == pf_e_password || code == pf_e_analysis) {
        run->error = e;
    } else {
        run->error = PFExc(pf_e_analysis, e.getFilename(), e.getWhere(), e.getMessageDetail());
    }
    run->releaseSession();
    run->fonts = nullptr;
    run->pages.clear();
    run->qpdf = nullptr;
    log->error("preflight: " + std::string(run->error->what()) + "\n");
    run->progress = 100;
    if (run->progress_reporter) {
        run->progress_reporter->reportProgress(100);
    }
    setState(run, st_failed);
    if (run->settled_fn) {
        run->settled_fn(Handle(run));
    }
}

void
Preflight::finish(std::shared_ptr<Run> run)
{
    run->releaseSession();
    run->report = run->aggregator.assemble();
    run->fonts = nullptr;
    run->pages.clear();
    run->qpdf = nullptr;
    run->progress = 100;
    if (run->progress_reporter) {
        run->progress_reporter->reportProgress(100);
    }
    setState(run, st_done);
    if (run->settled_fn) {
        run->settled_fn(Handle(run));
    }
}

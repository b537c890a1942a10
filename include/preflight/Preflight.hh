/* Copyright (c) 2024-2026 The preflight authors
 *
 * This file is part of preflight.
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *   http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#ifndef PREFLIGHT_HH
#define PREFLIGHT_HH

#include <preflight/DLL.h>
#include <preflight/PFContentProvider.hh>
#include <preflight/PFEventLoop.hh>
#include <preflight/PFExc.hh>
#include <preflight/PreflightReport.hh>

#include <qpdf/QPDFLogger.hh>

#include <functional>
#include <memory>
#include <optional>
#include <string>

// Runs the analysis of one PDF at a time on a PFEventLoop. The
// structural pass reads the document, its page geometry, fonts and
// transparency. The content pass then decodes each page's operators
// to find colour spaces and images, and renders a preview. If the
// structural pass fails, the run fails with a PFExc. If the content
// pass fails, the report is still produced with a warning saying that
// content analysis was not possible.
//
// Work is split into tasks at page boundaries, so a caller that runs
// the loop can cancel a run, or start a new one, between any two
// pages. Starting a new analysis cancels the previous one; a cancelled
// run never touches the report or the preview. Tasks still queued when
// the Preflight is destroyed do nothing.
//
// Colour and image findings are only reported if the content pass
// completes. A report whose content pass failed has none of them.
class Preflight
{
  public:
    struct Options
    {
        // Bleed smaller than this, in points, is a warning.
        double bleed_threshold{8.5};
        // Pages whose size differs from page 1 by more than this, in
        // points, get a warning.
        double size_tolerance{1.0};
        // Pixels per point of the preview
        double preview_scale{1.0};
        // 1-based page to render as the preview
        int preview_page{1};
        // Only do the structural pass.
        bool skip_content{false};
    };

    enum state_e {
        st_idle,
        st_analysing_structural,
        st_analysing_content,
        st_done,
        st_failed,
    };

    class ProgressReporter
    {
      public:
        PREFLIGHT_DLL
        virtual ~ProgressReporter();

        // Called with a value from 0 to 100 as the run proceeds
        virtual void reportProgress(int) = 0;
    };

    // Adapts a function to a ProgressReporter.
    class FunctionProgressReporter: public ProgressReporter
    {
      public:
        PREFLIGHT_DLL
        FunctionProgressReporter(std::function<void(int)>);
        PREFLIGHT_DLL
        ~FunctionProgressReporter() override;
        PREFLIGHT_DLL
        void reportProgress(int) override;

      private:
        std::function<void(int)> handler;
    };

    class Run;

    // Refers to one call to analyse. Copies refer to the same run.
    class Handle
    {
        friend class Preflight;

      public:
        PREFLIGHT_DLL
        state_e getState() const;
        // Progress from 0 to 100
        PREFLIGHT_DLL
        int getProgress() const;
        // Done, failed or cancelled
        PREFLIGHT_DLL
        bool isSettled() const;
        PREFLIGHT_DLL
        bool isCancelled() const;
        // Stop the run. Tasks still queued do nothing when they run.
        PREFLIGHT_DLL
        void cancel();

        // The report of a run that is done. Throws std::logic_error
        // otherwise.
        PREFLIGHT_DLL
        PreflightReport const& getReport() const;
        // The error of a failed run. Throws std::logic_error
        // otherwise.
        PREFLIGHT_DLL
        PFExc const& getError() const;
        // The rendered preview, if the content pass produced one
        PREFLIGHT_DLL
        std::optional<PFContentProvider::Bitmap> const& getPreview() const;

        // Called once when the run is done or has failed. Not called
        // for cancelled runs.
        PREFLIGHT_DLL
        void onSettled(std::function<void(Handle const&)>);
        PREFLIGHT_DLL
        void registerProgressReporter(std::shared_ptr<ProgressReporter>);

      private:
        Handle(std::shared_ptr<Run> run);

        std::shared_ptr<Run> run;
    };

    // If provider is null, a PFDocumentContentProvider is used. If
    // logger is null, the default logger is used.
    PREFLIGHT_DLL
    Preflight(
        PFEventLoop& loop,
        Options const& options,
        std::shared_ptr<PFContentProvider> provider = nullptr,
        std::shared_ptr<QPDFLogger> logger = nullptr);
    // Cancels the current run.
    PREFLIGHT_DLL
    ~Preflight();
    Preflight(Preflight const&) = delete;
    Preflight& operator=(Preflight const&) = delete;

    // Queue the analysis of a PDF held in memory. Any run still in
    // progress is cancelled. password is tried if the file is
    // encrypted and the empty password doesn't open it.
    PREFLIGHT_DLL
    Handle analyse(
        std::string const& data, std::string const& file_name, std::string const& password = "");

    // Cancel the current run, if any.
    PREFLIGHT_DLL
    void cancel();

    // State of the most recent run, or st_idle before the first
    PREFLIGHT_DLL
    state_e getState() const;

    // The report of the most recent run, if it is done
    PREFLIGHT_DLL
    PreflightReport const* getReport() const;

    PREFLIGHT_DLL
    static char const* stateName(state_e);

  private:
    void post(std::function<void()> task);
    void startStructural(std::shared_ptr<Run> run);
    void structuralPage(std::shared_ptr<Run> run, size_t index);
    void finishStructural(std::shared_ptr<Run> run);
    void contentPage(std::shared_ptr<Run> run, size_t index);
    void renderPreview(std::shared_ptr<Run> run);
    void contentStep(std::shared_ptr<Run> run, std::function<void()> fn);
    void fail(std::shared_ptr<Run> run, PFExc const& e);
    void finish(std::shared_ptr<Run> run);
    void setState(std::shared_ptr<Run> run, state_e state);
    void updateProgress(std::shared_ptr<Run> run);

    PFEventLoop& loop;
    Options options;
    std::shared_ptr<PFContentProvider> provider;
    std::shared_ptr<QPDFLogger> log;
    std::shared_ptr<Run> current;
    unsigned long long next_run_id{1};
    // Expires with this object. Queued tasks hold a weak reference.
    std::shared_ptr<bool> alive;
};

#endif // PREFLIGHT_HH

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

#ifndef PREFLIGHTJOB_HH
#define PREFLIGHTJOB_HH

#include <preflight/Constants.h>
#include <preflight/DLL.h>
#include <preflight/PreflightReport.hh>

#include <qpdf/QPDFLogger.hh>

#include <memory>
#include <optional>
#include <string>

// Everything the pdfpreflight command does, usable from code. Set it
// up from argv or with the fluent Config interface, call run(), then
// getExitCode(). Errors that prevent a report from being produced are
// thrown from run() as PFExc. Usage errors are thrown as PFUsage.
class PreflightJob
{
  public:
    // Exit codes -- returned by getExitCode() after calling run()
    static int constexpr EXIT_ERROR = pf_exit_error;
    static int constexpr EXIT_WARNING = pf_exit_warning;

    PREFLIGHT_DLL
    PreflightJob();

    // argv must be null-terminated. Throws PFUsage for bad arguments.
    // --help and --version print their output and exit.
    PREFLIGHT_DLL
    void initializeFromArgv(char const* const argv[]);

    // By default the job uses qpdf's default logger. The report is
    // written to the logger's save pipeline, which is standard output
    // unless it has been set. Progress goes to the info pipeline when
    // verbose and is discarded otherwise.
    PREFLIGHT_DLL
    std::shared_ptr<QPDFLogger> getLogger();
    PREFLIGHT_DLL
    void setLogger(std::shared_ptr<QPDFLogger>);

    // Throws PFUsage if the options contradict each other or no input
    // file was given. Called by initializeFromArgv and run.
    PREFLIGHT_DLL
    void checkConfiguration();

    class Config
    {
        friend class PreflightJob;

      public:
        // Proxy to PreflightJob::checkConfiguration()
        PREFLIGHT_DLL
        void checkConfiguration();

        PREFLIGHT_DLL
        Config* inputFile(std::string const& filename);
        PREFLIGHT_DLL
        Config* password(std::string const& parameter);
        PREFLIGHT_DLL
        Config* json();
        PREFLIGHT_DLL
        Config* noContent();
        PREFLIGHT_DLL
        Config* bleedThreshold(std::string const& parameter);
        PREFLIGHT_DLL
        Config* previewScale(std::string const& parameter);
        PREFLIGHT_DLL
        Config* verbose();
        PREFLIGHT_DLL
        Config* quiet();
        PREFLIGHT_DLL
        Config* warningExit0();
        PREFLIGHT_DLL
        Config* checkOnly();

      private:
        Config() = delete;
        Config(Config const&) = delete;
        Config(PreflightJob& job) :
            o(job)
        {
        }
        PreflightJob& o;
    };
    friend class Config;

    // Return a top-level configuration item.
    PREFLIGHT_DLL
    std::shared_ptr<Config> config();

    // Analyse the input file and write the report.
    PREFLIGHT_DLL
    void run();

    // The report of the last run, if run() completed.
    PREFLIGHT_DLL
    PreflightReport const* getReport() const;

    // 0 if the document is ready for print, EXIT_ERROR if the report
    // has errors, EXIT_WARNING if it only has warnings (0 with
    // --warning-exit-0).
    PREFLIGHT_DLL
    int getExitCode() const;

    // Usage message header for this program
    PREFLIGHT_DLL
    std::string const& getMessagePrefix() const;
    PREFLIGHT_DLL
    void setMessagePrefix(std::string const&);

    // Text shown by --help
    PREFLIGHT_DLL
    static std::string getHelp(std::string const& progname);

  private:
    [[noreturn]] static void usage(std::string const& msg);
    void writeReport(PreflightReport const& report);

    class Members
    {
        friend class PreflightJob;

      public:
        PREFLIGHT_DLL
        ~Members() = default;

      private:
        Members();
        Members(Members const&) = delete;

        std::shared_ptr<QPDFLogger> log;
        std::string message_prefix{"pdfpreflight"};
        std::string infilename;
        std::string password;
        bool json{false};
        bool no_content{false};
        double bleed_threshold;
        double preview_scale{1.0};
        bool verbose{false};
        bool quiet{false};
        bool warning_exit_0{false};
        bool check_only{false};
        std::optional<PreflightReport> report;
    };
    std::shared_ptr<Members> m;
};

#endif // PREFLIGHTJOB_HH

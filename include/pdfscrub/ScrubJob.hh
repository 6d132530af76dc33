// Copyright (c) 2024 the pdfscrub authors
//
// This file is part of pdfscrub.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//   http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#ifndef PDFSCRUB_SCRUBJOB_HH
#define PDFSCRUB_SCRUBJOB_HH

#include <pdfscrub/Constants.h>
#include <pdfscrub/ConvergenceDriver.hh>
#include <pdfscrub/DLL.h>
#include <pdfscrub/Diagnostics.hh>

#include <qpdf/QPDF.hh>
#include <qpdf/QPDFLogger.hh>

#include <memory>
#include <string>

namespace pdfscrub
{
    // ScrubJob is the file-level interface. It opens a PDF file, checks it for JavaScript or
    // removes JavaScript from it, and writes the sanitized result. Document problems are reported
    // in the returned result objects instead of being thrown. The containsJavaScript and
    // removeJavaScript methods collapse those results to a single bool for callers that only
    // want a yes or no answer.
    //
    // A single ScrubJob can't be used from multiple threads, but separate ScrubJob objects can
    // be used on separate threads if each has its own logger.
    class ScrubJob
    {
      public:
        // Exit codes used by the pdfscrub CLI
        static int constexpr EXIT_ERROR = pdfscrub_exit_error;
        static int constexpr EXIT_CANNOT_CHECK = pdfscrub_exit_cannot_check;
        static int constexpr EXIT_WARNING = pdfscrub_exit_warning;

        struct CheckResult
        {
            bool found{false};
            pdfscrub_error_code_e error{pdfscrub_e_success};
            // Explanation of the error, empty on success.
            std::string cause;
            // Where JavaScript was found, empty if nothing was found.
            std::string location;

            // Whether the file could actually be inspected. When this is false, found is also
            // false, but that does not mean the file is clean.
            bool
            checked() const
            {
                return error == pdfscrub_e_success;
            }
        };

        struct RemoveResult
        {
            // True if the output file was written.
            bool success{false};
            pdfscrub_error_code_e error{pdfscrub_e_success};
            std::string cause;
            ConvergenceDriver::Result result;
        };

        PDFSCRUB_DLL
        ScrubJob();

        // SETUP FUNCTIONS

        // Name used as a prefix for log messages. Defaults to "pdfscrub".
        PDFSCRUB_DLL
        void setMessagePrefix(std::string const&);
        PDFSCRUB_DLL
        std::string getMessagePrefix() const;

        // By default, messages go to QPDFLogger::defaultLogger(). The logger is also passed to
        // every QPDF object this job creates, so qpdf's own warnings go to the same place.
        PDFSCRUB_DLL
        std::shared_ptr<QPDFLogger> getLogger();
        PDFSCRUB_DLL
        void setLogger(std::shared_ptr<QPDFLogger>);

        // In verbose mode, each traversal step and removal is logged to the info pipeline.
        PDFSCRUB_DLL
        void setVerbose(bool);
        PDFSCRUB_DLL
        bool isVerbose() const;

        // Maximum number of sanitization passes. Defaults to ConvergenceDriver::DEFAULT_MAX_PASSES.
        PDFSCRUB_DLL
        void setMaxPasses(int);
        PDFSCRUB_DLL
        int getMaxPasses() const;

        // OPERATIONS

        // Open a PDF file. Throws ScrubExc:
        //  * pdfscrub_e_input_not_found if the file doesn't exist or can't be read
        //  * pdfscrub_e_password if the file is encrypted and needs a password
        //  * pdfscrub_e_structure for any other failure to open the file
        PDFSCRUB_DLL
        std::unique_ptr<QPDF> createQPDF(std::string const& filename);

        // Write pdf to filename. Throws ScrubExc with pdfscrub_e_output on failure.
        PDFSCRUB_DLL
        void writeQPDF(QPDF& pdf, std::string const& filename);

        // Check a file for JavaScript. Never throws for problems with the file.
        PDFSCRUB_DLL
        CheckResult check(std::string const& filename);

        // Same as check(filename).found. A file that couldn't be checked reports false. The
        // reason is logged as an error.
        PDFSCRUB_DLL
        bool containsJavaScript(std::string const& filename);

        // Remove JavaScript from infile and write the result to outfile. The output is written
        // whenever sanitization completes, even if nothing was removed. If infile and outfile are
        // the same file, or the pass limit is invalid, pdfscrub_e_invocation is reported before
        // infile is opened. Never throws for problems with either file.
        PDFSCRUB_DLL
        RemoveResult remove(std::string const& infile, std::string const& outfile);

        // Same as remove(infile, outfile).success.
        PDFSCRUB_DLL
        bool removeJavaScript(std::string const& infile, std::string const& outfile);

      private:
        Diagnostics diagnostics() const;
        void checkInvocation(std::string const& infile, std::string const& outfile) const;

        class Members
        {
            friend class ScrubJob;

          public:
            PDFSCRUB_DLL
            ~Members() = default;

          private:
            Members();
            Members(Members const&) = delete;

            std::shared_ptr<QPDFLogger> log;
            std::string message_prefix{"pdfscrub"};
            bool verbose{false};
            int max_passes{ConvergenceDriver::DEFAULT_MAX_PASSES};
        };
        std::shared_ptr<Members> m;
    };
} // namespace pdfscrub

#endif // PDFSCRUB_SCRUBJOB_HH

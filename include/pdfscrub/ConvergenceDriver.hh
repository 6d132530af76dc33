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

#ifndef PDFSCRUB_CONVERGENCEDRIVER_HH
#define PDFSCRUB_CONVERGENCEDRIVER_HH

#include <pdfscrub/DLL.h>
#include <pdfscrub/Diagnostics.hh>
#include <pdfscrub/Sanitizer.hh>

#include <qpdf/QPDF.hh>
#include <qpdf/QPDFDocumentHelper.hh>

namespace pdfscrub
{
    // Runs Sanitizer passes over a whole document until a pass makes no changes. A single pass
    // may not be enough. Removing one action can, for example, empty an /AA dictionary, and the
    // root walk and the page walk may reach shared annotations along different paths. Repeating
    // passes reaches a stable state instead.
    //
    // Each pass uses a fresh visited set, sanitizes from the document root, and then sanitizes
    // every element of every page's /Annots array individually. Nothing is written here. The
    // caller decides what to do with the modified QPDF.
    class ConvergenceDriver: public QPDFDocumentHelper
    {
      public:
        static int constexpr DEFAULT_MAX_PASSES = 10;

        struct Result
        {
            // True if any pass modified the document. Also forced to true if the pass limit was
            // reached, since the document probably still changed on the last pass.
            bool changed{false};
            bool reached_limit{false};
            int passes{0};
            Sanitizer::Stats stats;
        };

        PDFSCRUB_DLL
        ConvergenceDriver(QPDF&, Diagnostics const& = Diagnostics());
        PDFSCRUB_DLL
        ~ConvergenceDriver() override = default;

        // Sanitize until a pass changes nothing or max_passes passes have run. Reaching the limit
        // is reported in the result and logged as a warning. It is not an error. Throws ScrubExc
        // with pdfscrub_e_invocation if max_passes is less than 1.
        PDFSCRUB_DLL
        Result sanitizeDocument(int max_passes = DEFAULT_MAX_PASSES);

      private:
        bool runPass(Sanitizer&, int pass);

        Diagnostics diag;
    };
} // namespace pdfscrub

#endif // PDFSCRUB_CONVERGENCEDRIVER_HH

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

#ifndef PDFSCRUB_DETECTOR_HH
#define PDFSCRUB_DETECTOR_HH

#include <pdfscrub/DLL.h>
#include <pdfscrub/Diagnostics.hh>

#include <qpdf/QPDF.hh>
#include <qpdf/QPDFDocumentHelper.hh>
#include <qpdf/QPDFObjGen.hh>
#include <qpdf/QPDFObjectHandle.hh>

#include <string>

namespace pdfscrub
{
    // Read-only search for JavaScript actions reachable from a document's root. The document is
    // never modified. Exceptions from the underlying QPDF object (damaged objects and the like)
    // and ScrubExc with pdfscrub_e_structure for handles belonging to a destroyed QPDF are
    // propagated to the caller. ScrubJob::check is where they are turned into a result.
    class Detector: public QPDFDocumentHelper
    {
      public:
        struct Detection
        {
            bool found{false};
            // Where the first JavaScript action was seen, e.g. "document /OpenAction" or
            // "annotation 2 on page 1 additional action /Bl". Empty if nothing was found.
            std::string location;
        };

        PDFSCRUB_DLL
        Detector(QPDF&, Diagnostics const& = Diagnostics());
        PDFSCRUB_DLL
        ~Detector() override = default;

        // Search the whole document and stop at the first hit. A generic walk of everything
        // reachable from the root runs first. The well-known places are then checked explicitly:
        // the root's /OpenAction, the presence of /Names /JavaScript, each page's open and close
        // actions, and each annotation's /A and /AA actions.
        PDFSCRUB_DLL
        Detection detect();

        PDFSCRUB_DLL
        bool containsJavaScript();

        // Generic walk of everything reachable from node. Indirect objects already in visited are
        // not entered again. On a hit, location is set and true is returned.
        PDFSCRUB_DLL
        bool scan(QPDFObjectHandle node, QPDFObjGen::set& visited, std::string& location);

      private:
        bool checkDocumentActions(std::string& location);
        bool checkPages(std::string& location);

        Diagnostics diag;
    };
} // namespace pdfscrub

#endif // PDFSCRUB_DETECTOR_HH

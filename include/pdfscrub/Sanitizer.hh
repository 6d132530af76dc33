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

#ifndef PDFSCRUB_SANITIZER_HH
#define PDFSCRUB_SANITIZER_HH

#include <pdfscrub/DLL.h>
#include <pdfscrub/Diagnostics.hh>

#include <qpdf/QPDFObjGen.hh>
#include <qpdf/QPDFObjectHandle.hh>

#include <string>

namespace pdfscrub
{
    // The Sanitizer performs a single in-place pass that strips JavaScript actions from everything
    // reachable from a starting node. See ConvergenceDriver for repeating passes until the
    // document is stable.
    //
    // Rules applied to each dictionary (and to each stream's dictionary):
    //
    //  * /A or /OpenAction whose value is a JavaScript action is removed.
    //
    //  * /AA whose value is a dictionary has each JavaScript trigger removed. If that leaves /AA
    //    empty, /AA itself is removed.
    //
    //  * /Names whose value is a dictionary loses its /JavaScript entry, whatever it contains.
    //    The rest of /Names is still walked.
    //
    //  * Everything else is walked.
    //
    // Arrays lose every element that is a JavaScript action, and the relative order of the
    // remaining elements is unchanged. Deletions are collected while a dictionary or array is
    // scanned and applied once its scan is finished. Array elements are erased from the highest
    // index down.
    class Sanitizer
    {
      public:
        struct Stats
        {
            int keys_removed{0};
            int array_items_removed{0};
            int aa_dictionaries_removed{0};
            int name_trees_removed{0};

            PDFSCRUB_DLL
            Stats& operator+=(Stats const&);
            PDFSCRUB_DLL
            int total() const;
        };

        PDFSCRUB_DLL
        explicit Sanitizer(Diagnostics const& = Diagnostics());

        // Remove JavaScript actions reachable from node. Indirect objects whose QPDFObjGen is
        // already in visited are skipped, and every indirect object entered is added to it. Pass
        // the same set for every call belonging to one pass. Returns true if anything was
        // modified.
        PDFSCRUB_DLL
        bool sanitizePass(QPDFObjectHandle node, QPDFObjGen::set& visited);

        // Counts of removals since construction or the last call to resetStats.
        PDFSCRUB_DLL
        Stats const& getStats() const;
        PDFSCRUB_DLL
        void resetStats();

      private:
        bool sanitizeDictionary(
            QPDFObjectHandle dict, std::string const& owner, QPDFObjGen::set& visited);
        bool sanitizeAdditionalActions(
            QPDFObjectHandle aa,
            std::string const& owner,
            QPDFObjGen::set& visited,
            bool& emptied);
        bool sanitizeArray(
            QPDFObjectHandle array, std::string const& owner, QPDFObjGen::set& visited);

        Diagnostics diag;
        Stats stats;
    };
} // namespace pdfscrub

#endif // PDFSCRUB_SANITIZER_HH

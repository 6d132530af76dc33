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

#ifndef PDFSCRUB_DIAGNOSTICS_HH
#define PDFSCRUB_DIAGNOSTICS_HH

#include <pdfscrub/DLL.h>

#include <qpdf/Pipeline.hh>
#include <qpdf/QPDFLogger.hh>

#include <functional>
#include <memory>
#include <string>

namespace pdfscrub
{
    // A Diagnostics object is the logging context handed to the detector, the sanitizer, and the
    // convergence driver. It bundles a QPDFLogger with a verbose flag and a message prefix. All
    // three are fixed at construction, so verbosity can't change in the middle of a traversal.
    // Copies share the same logger.
    //
    // Messages are written as "prefix: message\n". info() goes to the logger's info pipeline,
    // warn() to its warning pipeline, and error() to its error pipeline. See QPDFLogger.hh for how
    // to redirect them.
    class Diagnostics
    {
      public:
        // A null logger means QPDFLogger::defaultLogger().
        PDFSCRUB_DLL
        Diagnostics(
            std::shared_ptr<QPDFLogger> log = nullptr,
            bool verbose = false,
            std::string const& message_prefix = "pdfscrub");

        PDFSCRUB_DLL
        std::shared_ptr<QPDFLogger> getLogger() const;
        PDFSCRUB_DLL
        bool isVerbose() const;
        PDFSCRUB_DLL
        std::string const& getMessagePrefix() const;

        // If in verbose mode, call the given function, passing in the info pipeline and the
        // message prefix.
        PDFSCRUB_DLL
        void doIfVerbose(std::function<void(Pipeline&, std::string const& prefix)> fn) const;

        PDFSCRUB_DLL
        void info(std::string const& message) const;
        PDFSCRUB_DLL
        void warn(std::string const& message) const;
        PDFSCRUB_DLL
        void error(std::string const& message) const;

      private:
        std::shared_ptr<QPDFLogger> log;
        bool verbose;
        std::string message_prefix;
    };
} // namespace pdfscrub

#endif // PDFSCRUB_DIAGNOSTICS_HH

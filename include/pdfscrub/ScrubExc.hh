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

#ifndef PDFSCRUB_SCRUBEXC_HH
#define PDFSCRUB_SCRUBEXC_HH

#include <pdfscrub/Constants.h>
#include <pdfscrub/DLL.h>

#include <stdexcept>
#include <string>

namespace pdfscrub
{
    class PDFSCRUB_DLL_CLASS ScrubExc: public std::runtime_error
    {
      public:
        PDFSCRUB_DLL
        ScrubExc(
            pdfscrub_error_code_e error_code,
            std::string const& filename,
            std::string const& message);
        PDFSCRUB_DLL
        ~ScrubExc() noexcept override = default;

        // To get a complete error string, call what(), provided by std::exception. The accessors
        // below return the original values used to create the exception. Only the error code and
        // message are guaranteed to have non-empty values.

        PDFSCRUB_DLL
        pdfscrub_error_code_e getErrorCode() const;
        PDFSCRUB_DLL
        std::string const& getFilename() const;
        PDFSCRUB_DLL
        std::string const& getMessageDetail() const;

        // Return a short, human-readable name for an error code, such as "password protected".
        PDFSCRUB_DLL
        static char const* describe(pdfscrub_error_code_e);

      private:
        static std::string createWhat(std::string const& filename, std::string const& message);

        pdfscrub_error_code_e error_code;
        std::string filename;
        std::string message;
    };
} // namespace pdfscrub

#endif // PDFSCRUB_SCRUBEXC_HH

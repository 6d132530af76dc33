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

#ifndef PDFSCRUB_ACTIONCLASSIFIER_HH
#define PDFSCRUB_ACTIONCLASSIFIER_HH

#include <pdfscrub/DLL.h>

#include <qpdf/QPDFObjectHandle.hh>

#include <string>
#include <vector>

// Classification of action objects. An action is a dictionary whose /S entry names the action
// type. Only the /JavaScript action type is of interest here. Everything in this namespace is
// read-only and has no side effects.

namespace pdfscrub::ActionClassifier
{
    // Return true if node is a dictionary whose /S is the name /JavaScript, or if node is an array
    // (a chained-action list) with at least one such member. Nested arrays are searched as well,
    // and an indirect array that contains itself is only searched once. Every other kind of
    // object, including null and uninitialized handles and streams, is not an action.
    PDFSCRUB_DLL
    bool isJavaScriptAction(QPDFObjectHandle node);

    // Dictionary keys whose values may be actions: /A, /AA, and /OpenAction.
    PDFSCRUB_DLL
    std::vector<std::string> const& actionKeys();

    // Trigger keys of a page's /AA dictionary: /O (page open) and /C (page close).
    PDFSCRUB_DLL
    std::vector<std::string> const& pageTriggerKeys();

    // Trigger keys of an annotation's /AA dictionary: /E, /X, /D, /U, /Fo, /Bl, /PO, /PC, /PV,
    // and /PI.
    PDFSCRUB_DLL
    std::vector<std::string> const& annotationTriggerKeys();
} // namespace pdfscrub::ActionClassifier

#endif // PDFSCRUB_ACTIONCLASSIFIER_HH

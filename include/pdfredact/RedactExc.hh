// Copyright (c) 2026 The pdfredact Authors
//
// This file is part of pdfredact.
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

#ifndef PDFREDACT_REDACTEXC_HH
#define PDFREDACT_REDACTEXC_HH

#include <pdfredact/Constants.h>
#include <pdfredact/DLL.h>

#include <qpdf/JSON.hh>

#include <stdexcept>
#include <string>

namespace pdfredact
{
    // All categorized failures of the pipeline are reported with this
    // exception. The error code selects the category and remediation
    // hint shown to users. The message is a short statement of what
    // went wrong; the diagnostic, if any, is the lower-level message
    // (usually from libqpdf) that caused it. Neither may contain
    // matched document text.
    class PDFREDACT_DLL_CLASS RedactExc: public std::runtime_error
    {
      public:
        PDFREDACT_DLL
        RedactExc(
            pdfredact_error_code_e error_code,
            std::string const& message,
            std::string const& diagnostic = "");
        PDFREDACT_DLL
        ~RedactExc() noexcept override = default;

        PDFREDACT_DLL
        pdfredact_error_code_e getErrorCode() const;
        PDFREDACT_DLL
        std::string const& getMessageDetail() const;
        PDFREDACT_DLL
        std::string const& getDiagnostic() const;

        // Short title for the error category, e.g. "Invalid PDF File"
        PDFREDACT_DLL
        std::string getCategory() const;

        // What the user can do about it
        PDFREDACT_DLL
        std::string getHint() const;

        // {"error": category, "message": hint, "technicalDetails": what()}.
        // technicalDetails is omitted when include_details is false.
        PDFREDACT_DLL
        JSON getJSON(bool include_details) const;

      private:
        static std::string
        createWhat(std::string const& message, std::string const& diagnostic);

        pdfredact_error_code_e error_code;
        std::string message;
        std::string diagnostic;
    };
} // namespace pdfredact

#endif // PDFREDACT_REDACTEXC_HH

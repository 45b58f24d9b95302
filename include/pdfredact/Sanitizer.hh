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

#ifndef PDFREDACT_SANITIZER_HH
#define PDFREDACT_SANITIZER_HH

#include <pdfredact/Config.hh>
#include <pdfredact/DLL.h>
#include <pdfredact/DocumentLoader.hh>
#include <pdfredact/Redactor.hh>
#include <pdfredact/Statistics.hh>
#include <pdfredact/Types.hh>

#include <qpdf/JSON.hh>

#include <memory>
#include <string>
#include <vector>

namespace pdfredact
{
    // The whole pipeline: input checks, extraction, redaction,
    // validation, and reporting. Each call is independent; a Sanitizer
    // may be reused for any number of documents.
    class Sanitizer
    {
      public:
        struct Analysis
        {
            std::vector<PageRedactionSet> pages;
            Statistics statistics;

            bool
            found() const
            {
                return !pages.empty();
            }

            // {"found", "statistics", "details": [{"page", "items":
            // [{"type", "text" or "textLength", "coordinates"}]}]}.
            // Coordinates are rounded to integers.
            PDFREDACT_DLL
            JSON getJSON(bool include_text) const;
        };

        struct Outcome
        {
            // False if nothing was found, in which case output is
            // empty and the input was not rewritten.
            bool redacted{false};
            std::string output;
            int page_count{0};
            Statistics statistics;
            Redactor::Details details;
            // Milliseconds
            long long processing_time{0};

            PDFREDACT_DLL
            JSON getJSON() const;
        };

        PDFREDACT_DLL
        Sanitizer(
            Config const& config = Config::fromEnvironment(),
            std::shared_ptr<DocumentLoader> loader = DocumentLoader::instance());

        PDFREDACT_DLL
        Config const& getConfig() const;

        // Reject empty, oversized, malformed, and password-protected
        // input. Returns the protection state of acceptable input.
        PDFREDACT_DLL
        pdfredact_protection_e checkInput(std::string const& data) const;

        PDFREDACT_DLL
        Analysis analyze(std::string const& data) const;
        PDFREDACT_DLL
        Outcome redact(std::string const& data) const;
        PDFREDACT_DLL
        std::string extractAllText(std::string const& data) const;

      private:
        Config config;
        std::shared_ptr<DocumentLoader> loader;
    };
} // namespace pdfredact

#endif // PDFREDACT_SANITIZER_HH

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

#ifndef PDFREDACT_EXTRACTOR_HH
#define PDFREDACT_EXTRACTOR_HH

#include <pdfredact/DLL.h>
#include <pdfredact/DocumentLoader.hh>
#include <pdfredact/Types.hh>

#include <qpdf/QPDFPageObjectHelper.hh>

#include <memory>
#include <string>
#include <vector>

namespace pdfredact
{
    // Recovers positioned text from page content streams and tags the
    // runs that contain email addresses or phone numbers.
    //
    // Text runs are found by following the content stream: one run is
    // produced per text-showing operator (Tj, TJ, ', "), including
    // those in form XObjects. A run's text is decoded through the
    // font's /ToUnicode CMap where present and otherwise through the
    // font's encoding. Text drawn as images or paths is not seen.
    class Extractor
    {
      public:
        PDFREDACT_DLL
        Extractor(std::shared_ptr<DocumentLoader> loader = DocumentLoader::instance());

        // One PageRedactionSet for each page with at least one match,
        // in page order. Any failure to read the document, including
        // a required password, throws an extraction error.
        PDFREDACT_DLL
        std::vector<PageRedactionSet> extractMatches(std::string const& data) const;
        PDFREDACT_DLL
        std::vector<PageRedactionSet> extractMatches(Document const& doc) const;

        // Every run's text, page by page, each page introduced by a
        // "--- Page N ---" line and runs separated by single spaces.
        // Throws an extraction error like extractMatches.
        PDFREDACT_DLL
        std::string extractAllText(std::string const& data) const;

        // Runs on the page in its default user space
        PDFREDACT_DLL
        static std::vector<TextRun> findTextRuns(QPDFPageObjectHelper page);

        // Append a PIIMatch for each email and then each phone number
        // in run.text. All share the run's box, converted to top-left
        // coordinates using page_height.
        PDFREDACT_DLL
        static void collectMatches(
            TextRun const& run, int page_number, double page_height, std::vector<PIIMatch>& out);

      private:
        std::shared_ptr<DocumentLoader> loader;
    };
} // namespace pdfredact

#endif // PDFREDACT_EXTRACTOR_HH

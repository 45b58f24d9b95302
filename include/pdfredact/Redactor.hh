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

#ifndef PDFREDACT_REDACTOR_HH
#define PDFREDACT_REDACTOR_HH

#include <pdfredact/DLL.h>
#include <pdfredact/DocumentLoader.hh>
#include <pdfredact/Types.hh>

#include <qpdf/QPDF.hh>
#include <qpdf/QPDFPageObjectHelper.hh>

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace pdfredact
{
    // Applies redactions to a document and re-serializes it.
    //
    // For every page with matches, the matched strings are first
    // removed, where possible, from the operands of text-showing
    // operators. Failure to do that is logged and otherwise ignored.
    // Then the page's existing content is wrapped in q/Q and an opaque
    // light gray rectangle is drawn over each match's box, padded by
    // overlay_padding on every side. The wrapping adds a q for every
    // unmatched Q in the content and a Q for every q it leaves open,
    // so the rectangles are drawn in the page's initial graphics
    // state. Content that can't be read gets a single q/Q pair.
    //
    // A document that is encrypted but opens without a password is
    // redacted in a fresh, unencrypted document holding copies of its
    // pages. The result is written with the first write strategy that
    // succeeds (object streams disabled, writer defaults, object
    // streams generated), and, unless skipped, restricted with
    // advisory permissions.
    class Redactor
    {
      public:
        struct Options
        {
            bool skip_permission_lock{false};
            // Write a reproducible /ID. Has no effect on locked output.
            bool deterministic_id{false};
            // Where the permission lock keeps its temporary files;
            // empty means TMPDIR or /tmp.
            std::string temp_dir;
        };

        // What happened during redact
        struct Details
        {
            int page_count{0};
            size_t strip_count{0};
            bool copied_from_protected{false};
            bool locked{false};
        };

        static constexpr double overlay_padding = 2.0;
        // #D3D3D3
        static constexpr double overlay_gray = 211.0 / 255.0;

        PDFREDACT_DLL
        Redactor(std::shared_ptr<DocumentLoader> loader = DocumentLoader::instance());

        // Throws a protection error if the document needs a password
        // and a redaction error for anything else that prevents
        // producing output, including a set whose page number is not
        // in the document.
        PDFREDACT_DLL
        std::string redact(
            std::string const& data,
            std::vector<PageRedactionSet> const& sets,
            Options const& options,
            Details* details = nullptr) const;

        // Content stream fragment that paints the rectangles for set
        // on a page of the given height
        PDFREDACT_DLL
        static std::string overlayContent(PageRedactionSet const& set, double page_height);

      private:
        // Number of q placed before a page's content and Q placed after
        struct Wrapping
        {
            int saves{1};
            int restores{1};
        };

        Document openWorkingCopy(std::string const& data, Details& details) const;
        size_t stripText(
            QPDF&,
            QPDFPageObjectHelper& page,
            PageRedactionSet const& set,
            Wrapping& wrapping) const;
        void addOverlay(
            QPDF&,
            QPDFPageObjectHelper& page,
            PageRedactionSet const& set,
            Wrapping const& wrapping) const;

        std::shared_ptr<DocumentLoader> loader;
    };
} // namespace pdfredact

#endif // PDFREDACT_REDACTOR_HH

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

#ifndef PDFREDACT_TYPES_HH
#define PDFREDACT_TYPES_HH

#include <pdfredact/Constants.h>
#include <pdfredact/DLL.h>

#include <string>
#include <vector>

namespace pdfredact
{
    // A run of text shown by a single text-showing operator. x and y
    // are the origin of the run in the page's default user space
    // (origin at the bottom left, y increasing upward). width is the
    // distance the text origin moved while the run was shown, and
    // height is the effective font size. Rotated, skewed, or
    // non-uniformly scaled text is not compensated for; such runs get
    // a box aligned with the page axes at their origin.
    struct TextRun
    {
        std::string text;
        double x{0.0};
        double y{0.0};
        double width{0.0};
        double height{0.0};
    };

    // A matched email address or phone number. Coordinates are
    // relative to the top left corner of the page with y increasing
    // downward; y is the top of the run's box. All matches found in
    // the same run share that run's box.
    struct PIIMatch
    {
        std::string text;
        pdfredact_pii_type_e type{pdfredact_pii_email};
        int page_number{0};
        double x{0.0};
        double y{0.0};
        double width{0.0};
        double height{0.0};
    };

    // All matches on one page. Pages without matches never get a
    // PageRedactionSet, so items is never empty. page_number is the
    // 1-based page number in the original document.
    struct PageRedactionSet
    {
        int page_number{0};
        std::vector<PIIMatch> items;
        double page_height{0.0};
        double page_width{0.0};
    };

    // "email" or "phone"
    PDFREDACT_DLL
    char const* pii_type_name(pdfredact_pii_type_e);
} // namespace pdfredact

#endif // PDFREDACT_TYPES_HH

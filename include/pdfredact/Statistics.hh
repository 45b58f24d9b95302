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

#ifndef PDFREDACT_STATISTICS_HH
#define PDFREDACT_STATISTICS_HH

#include <pdfredact/DLL.h>
#include <pdfredact/Types.hh>

#include <qpdf/JSON.hh>

#include <vector>

namespace pdfredact
{
    // Match counts derived from a list of PageRedactionSet. Always
    // recompute with fromPages rather than adjusting counts by hand;
    // total_redactions is emails + phones, and pages_affected is the
    // number of sets since each set covers exactly one page.
    struct Statistics
    {
        int total_redactions{0};
        int emails{0};
        int phones{0};
        int pages_affected{0};

        PDFREDACT_DLL
        static Statistics fromPages(std::vector<PageRedactionSet> const&);

        // {"totalRedactions": n, "emails": n, "phones": n, "pagesAffected": n}
        PDFREDACT_DLL
        JSON getJSON() const;
    };
} // namespace pdfredact

#endif // PDFREDACT_STATISTICS_HH

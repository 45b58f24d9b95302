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

#ifndef PDFREDACT_VALIDATOR_HH
#define PDFREDACT_VALIDATOR_HH

#include <pdfredact/DLL.h>
#include <pdfredact/DocumentLoader.hh>

#include <cstddef>
#include <memory>
#include <string>

namespace pdfredact
{
    // Structural checks on a document before it is handed back. The
    // document must be at least min_output_size bytes, load (with the
    // empty user password, so permission-locked output is accepted),
    // have at least one page, and have no page whose MediaBox has zero
    // width or height. A page count different from the original is
    // logged as a warning but is not an error.
    class Validator
    {
      public:
        static constexpr size_t min_output_size = 200;

        PDFREDACT_DLL
        Validator(std::shared_ptr<DocumentLoader> loader = DocumentLoader::instance());

        // Returns the output's page count; throws a validation error if
        // any check fails.
        PDFREDACT_DLL
        int validate(std::string const& output, int original_page_count) const;

      private:
        std::shared_ptr<DocumentLoader> loader;
    };
} // namespace pdfredact

#endif // PDFREDACT_VALIDATOR_HH

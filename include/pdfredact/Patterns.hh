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

#ifndef PDFREDACT_PATTERNS_HH
#define PDFREDACT_PATTERNS_HH

#include <pdfredact/Constants.h>
#include <pdfredact/DLL.h>

#include <regex>
#include <string>
#include <vector>

namespace pdfredact
{
    // Pattern engine for email addresses and phone numbers. All
    // methods are pure functions of their argument. The regular
    // expressions are compiled once, on first use, and are never
    // modified afterward, so they may be used from any thread.
    //
    // Phone numbers are found by several overlapping rules. A single
    // number may match more than one rule, possibly as different
    // substrings. findPhones evaluates the rules in order and keeps
    // each distinct matched substring the first time it is seen.
    // Differently formatted substrings are never merged even if they
    // denote the same number. findEmails uses a single rule and reports
    // every occurrence, including repeats.
    class Patterns
    {
      public:
        class MatchRule
        {
          public:
            PDFREDACT_DLL
            MatchRule(pdfredact_pii_type_e type, char const* name, char const* expression);

            pdfredact_pii_type_e
            getType() const
            {
                return type;
            }
            char const*
            getName() const
            {
                return name;
            }

            // True if the rule matches anywhere in text
            PDFREDACT_DLL
            bool search(std::string const& text) const;

            // All non-overlapping matches, left to right
            PDFREDACT_DLL
            std::vector<std::string> findAll(std::string const& text) const;

          private:
            pdfredact_pii_type_e type;
            char const* name;
            std::regex expression;
        };

        struct Classification
        {
            bool is_email{false};
            bool is_phone{false};
        };

        PDFREDACT_DLL
        static Classification classify(std::string const& text);
        PDFREDACT_DLL
        static bool isEmail(std::string const& text);
        PDFREDACT_DLL
        static bool isPhone(std::string const& text);
        PDFREDACT_DLL
        static bool containsPII(std::string const& text);

        PDFREDACT_DLL
        static std::vector<std::string> findEmails(std::string const& text);
        PDFREDACT_DLL
        static std::vector<std::string> findPhones(std::string const& text);

        // The rule sets, in evaluation order
        PDFREDACT_DLL
        static std::vector<MatchRule> const& emailRules();
        PDFREDACT_DLL
        static std::vector<MatchRule> const& phoneRules();

        // Apply rules in order, keeping each matched substring only
        // the first time it is seen.
        PDFREDACT_DLL
        static std::vector<std::string>
        findFirstSeen(std::vector<MatchRule> const& rules, std::string const& text);

        // True if any rule matches
        PDFREDACT_DLL
        static bool searchAny(std::vector<MatchRule> const& rules, std::string const& text);
    };
} // namespace pdfredact

#endif // PDFREDACT_PATTERNS_HH

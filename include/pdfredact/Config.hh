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

#ifndef PDFREDACT_CONFIG_HH
#define PDFREDACT_CONFIG_HH

#include <pdfredact/DLL.h>

#include <cstddef>
#include <string>

namespace pdfredact
{
    // Settings for a Sanitizer. Values are layered: the defaults
    // below, then the environment (applyEnvironment), then a JSON
    // document (applyJSON), then whatever the caller sets directly.
    // Invalid values throw std::runtime_error naming the setting.
    //
    // Environment variables:
    //   PDFREDACT_MAX_FILE_SIZE_MB   input size limit in megabytes
    //   PDFREDACT_HARDENED           "1"/"true" omits technical details
    //   PDFREDACT_TMPDIR             directory for temporary files
    //
    // JSON keys: maxFileSizeMB, skipPermissionLock, includeText,
    // hardened, verbose, tempDir, deterministicId.
    class Config
    {
      public:
        static constexpr size_t default_max_file_size_mb = 10;

        // Defaults with the environment applied
        PDFREDACT_DLL
        static Config fromEnvironment();

        PDFREDACT_DLL
        void applyEnvironment();
        PDFREDACT_DLL
        void applyJSON(std::string const& json);
        PDFREDACT_DLL
        void applyJSONFile(std::string const& filename);

        PDFREDACT_DLL
        void setMaxFileSizeMB(std::string const& value);

        // temp_dir if set, else TMPDIR, else /tmp
        PDFREDACT_DLL
        std::string tempDirectory() const;

        size_t max_file_size{default_max_file_size_mb * 1024 * 1024};
        bool skip_permission_lock{false};
        // Report matched text in analyses; when false only its length
        bool include_text{true};
        // Omit lower-level diagnostics from error reports
        bool hardened{false};
        bool verbose{false};
        bool deterministic_id{false};
        std::string temp_dir;
    };
} // namespace pdfredact

#endif // PDFREDACT_CONFIG_HH

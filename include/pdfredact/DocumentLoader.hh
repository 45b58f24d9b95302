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

#ifndef PDFREDACT_DOCUMENTLOADER_HH
#define PDFREDACT_DOCUMENTLOADER_HH

#include <pdfredact/Constants.h>
#include <pdfredact/DLL.h>

#include <qpdf/QPDF.hh>
#include <qpdf/QPDFLogger.hh>
#include <qpdf/QPDFPageObjectHelper.hh>

#include <memory>
#include <string>
#include <vector>

namespace pdfredact
{
    // A parsed document together with everything that must outlive
    // it. libqpdf reads lazily from the memory buffer it was given,
    // and pages copied from another QPDF keep reading stream data from
    // that QPDF until the copy is written, so the input bytes and the
    // source document are owned here and released only after the
    // QPDF object is destroyed. Documents are cheap to copy; copies
    // share the same QPDF.
    class Document
    {
      public:
        PDFREDACT_DLL
        Document(
            std::shared_ptr<std::string const> data,
            std::shared_ptr<QPDF> qpdf,
            std::shared_ptr<QPDF> source = nullptr);

        PDFREDACT_DLL
        QPDF& getQPDF() const;
        // The bytes the document was loaded from. For a working copy,
        // these are the bytes of the source document.
        PDFREDACT_DLL
        std::string const& getData() const;
        PDFREDACT_DLL
        bool isEncrypted() const;
        // True if pages were copied out of another document
        PDFREDACT_DLL
        bool isCopy() const;
        PDFREDACT_DLL
        std::vector<QPDFPageObjectHelper> getAllPages() const;
        PDFREDACT_DLL
        int getPageCount() const;

        // Width and height of the page's MediaBox; both are 0 if the
        // box is missing or malformed.
        PDFREDACT_DLL
        static void getPageSize(QPDFPageObjectHelper page, double& width, double& height);

      private:
        friend class DocumentLoader;

        class Members
        {
            friend class Document;
            friend class DocumentLoader;

          public:
            PDFREDACT_DLL
            ~Members() = default;

          private:
            Members(
                std::shared_ptr<std::string const> data,
                std::shared_ptr<QPDF> qpdf,
                std::shared_ptr<QPDF> source);
            Members(Members const&) = delete;

            // Destroyed in reverse order: qpdf, then source, then data
            std::shared_ptr<std::string const> data;
            std::shared_ptr<QPDF> source;
            std::shared_ptr<QPDF> qpdf;
        };

        std::shared_ptr<Members> m;
    };

    // The single entry point through which documents are opened. A
    // process-wide instance is created on first use of instance() and
    // is not modified after start-up; pipeline components receive a
    // loader at construction so that tests may substitute their own
    // with create(). The loader also carries the QPDFLogger through
    // which all pipeline components report.
    class DocumentLoader
    {
      public:
        PDFREDACT_DLL
        static std::shared_ptr<DocumentLoader> instance();
        PDFREDACT_DLL
        static std::shared_ptr<DocumentLoader>
        create(std::shared_ptr<QPDFLogger> logger = nullptr);

        // Set up the logger and verbosity before the loader is shared.
        PDFREDACT_DLL
        void setLogger(std::shared_ptr<QPDFLogger>);
        PDFREDACT_DLL
        std::shared_ptr<QPDFLogger> getLogger() const;
        PDFREDACT_DLL
        void setVerbose(bool);
        PDFREDACT_DLL
        bool isVerbose() const;

        // Prefix message with "pdfredact: " and write it to the
        // logger. info messages are dropped unless verbose.
        PDFREDACT_DLL
        void info(std::string const& message) const;
        PDFREDACT_DLL
        void warn(std::string const& message) const;

        // Parse data. A document that requires a password throws a
        // protection error. A document that is encrypted but opens
        // with the empty user password is returned if
        // tolerate_protection is true and throws a protection error
        // otherwise. Any other failure throws a format error. Parsing
        // is lazy, so later access to the document may still throw
        // libqpdf exceptions.
        PDFREDACT_DLL
        Document load(
            std::string const& data,
            std::string const& description,
            bool tolerate_protection) const;

        // Pre-flight check of untrusted input: the header is checked
        // and the page tree is read. Returns the protection state;
        // throws input or format errors, or a protection error if a
        // password is required.
        PDFREDACT_DLL
        pdfredact_protection_e sniff(std::string const& data) const;

        // An unencrypted document containing every page of doc. doc
        // is kept alive by the result.
        PDFREDACT_DLL
        Document copyPages(Document const& doc) const;

      private:
        DocumentLoader(std::shared_ptr<QPDFLogger> logger);
        DocumentLoader(DocumentLoader const&) = delete;
        DocumentLoader& operator=(DocumentLoader const&) = delete;

        std::shared_ptr<QPDF> newQPDF() const;
        void reportWarnings(QPDF&, std::string const& description) const;

        std::shared_ptr<QPDFLogger> logger;
        bool verbose{false};
    };
} // namespace pdfredact

#endif // PDFREDACT_DOCUMENTLOADER_HH

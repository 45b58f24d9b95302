#ifndef SAVESTRATEGY_HH
#define SAVESTRATEGY_HH

#include <pdfredact/StepResult.hh>

#include <qpdf/QPDF.hh>
#include <qpdf/QPDFWriter.hh>

#include <memory>
#include <string>
#include <vector>

namespace pdfredact
{
    class DocumentLoader;

    // One way of serializing a document. Strategies are tried in
    // order until one succeeds.
    class SaveStrategy
    {
      public:
        virtual ~SaveStrategy() = default;
        virtual char const* getName() const = 0;

        // Write qpdf to output. Failures are returned, not thrown.
        StepResult attempt(QPDF& qpdf, bool deterministic_id, std::string& output) const;

        // Object streams disabled, then writer defaults, then object
        // streams generated
        static std::vector<std::shared_ptr<SaveStrategy>> const& defaultLadder();

        // Result of the first strategy that succeeds. If all fail,
        // throws a redaction error carrying the last failure.
        static std::string saveWithFirst(
            std::vector<std::shared_ptr<SaveStrategy>> const& ladder,
            QPDF& qpdf,
            bool deterministic_id,
            DocumentLoader const& loader);

      protected:
        virtual void configure(QPDFWriter&) const = 0;
    };
} // namespace pdfredact

#endif // SAVESTRATEGY_HH

#ifndef STEPRESULT_HH
#define STEPRESULT_HH

#include <string>

namespace pdfredact
{
    class DocumentLoader;

    // Outcome of a step whose failure does not abort the pipeline
    struct StepResult
    {
        static StepResult success(std::string const& step, std::string const& detail = "");
        static StepResult failure(std::string const& step, std::string const& reason);

        // Successes go to the info channel and failures to the warning
        // channel of the loader's logger.
        void report(DocumentLoader const&) const;

        std::string step;
        bool ok{false};
        std::string detail;
    };
} // namespace pdfredact

#endif // STEPRESULT_HH

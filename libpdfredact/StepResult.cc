#include <pdfredact/StepResult.hh>

#include <pdfredact/DocumentLoader.hh>

using namespace pdfredact;

StepResult
StepResult::success(std::string const& step, std::string const& detail)
{
    return {step, true, detail};
}

StepResult
StepResult::failure(std::string const& step, std::string const& reason)
{
    return {step, false, reason};
}

void
StepResult::report(DocumentLoader const& loader) const
{
    if (this->ok) {
        loader.info(this->step + (this->detail.empty() ? "" : ": " + this->detail));
    } else {
        loader.warn(this->step + " failed: " + this->detail);
    }
}

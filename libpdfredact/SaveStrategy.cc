#include <pdfredact/SaveStrategy.hh>

#include <pdfredact/DocumentLoader.hh>
#include <pdfredact/RedactExc.hh>

#include <qpdf/Buffer.hh>

#include <stdexcept>

using namespace pdfredact;

namespace
{
    class DisableObjectStreams: public SaveStrategy
    {
      public:
        char const*
        getName() const override
        {
            return "save without object streams";
        }

      protected:
        void
        configure(QPDFWriter& w) const override
        {
            w.setObjectStreamMode(qpdf_o_disable);
        }
    };

    class WriterDefaults: public SaveStrategy
    {
      public:
        char const*
        getName() const override
        {
            return "save with default settings";
        }

      protected:
        void
        configure(QPDFWriter&) const override
        {
        }
    };

    class GenerateObjectStreams: public SaveStrategy
    {
      public:
        char const*
        getName() const override
        {
            return "save with generated object streams";
        }

      protected:
        void
        configure(QPDFWriter& w) const override
        {
            w.setObjectStreamMode(qpdf_o_generate);
        }
    };
} // namespace

StepResult
SaveStrategy::attempt(QPDF& qpdf, bool deterministic_id, std::string& output) const
{
    try {
        QPDFWriter w(qpdf);
        w.setOutputMemory();
        w.setDeterministicID(deterministic_id);
        configure(w);
        w.write();
        auto buf = w.getBufferSharedPointer();
        output.assign(reinterpret_cast<char const*>(buf->getBuffer()), buf->getSize());
        return StepResult::success(getName(), std::to_string(output.length()) + " bytes");
    } catch (std::exception& e) {
        output.clear();
        return StepResult::failure(getName(), e.what());
    }
}

std::vector<std::shared_ptr<SaveStrategy>> const&
SaveStrategy::defaultLadder()
{
    static std::vector<std::shared_ptr<SaveStrategy>> ladder{
        std::make_shared<DisableObjectStreams>(),
        std::make_shared<WriterDefaults>(),
        std::make_shared<GenerateObjectStreams>()};
    return ladder;
}

std::string
SaveStrategy::saveWithFirst(
    std::vector<std::shared_ptr<SaveStrategy>> const& ladder,
    QPDF& qpdf,
    bool deterministic_id,
    DocumentLoader const& loader)
{
    std::string last_failure = "no save strategies";
    for (auto const& strategy: ladder) {
        std::string output;
        auto result = strategy->attempt(qpdf, deterministic_id, output);
        result.report(loader);
        if (result.ok) {
            return output;
        }
        last_failure = result.detail;
    }
    throw RedactExc(pdfredact_e_redaction, "failed to save redacted PDF", last_failure);
}

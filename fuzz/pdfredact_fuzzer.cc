#include <pdfredact/Config.hh>
#include <pdfredact/DocumentLoader.hh>
#include <pdfredact/RedactExc.hh>
#include <pdfredact/Sanitizer.hh>

#include <qpdf/QPDFLogger.hh>

#include <chrono>
#include <iostream>
#include <string>

class FuzzHelper
{
  public:
    FuzzHelper(unsigned char const* data, size_t size);
    void run();

  private:
    void testAnalyze();
    void testRedact();
    void doChecks();

    void
    info(std::string const& msg) const
    {
        const std::chrono::duration<double> elapsed{std::chrono::steady_clock::now() - start};
        std::cerr << elapsed.count() << " info - " << msg << '\n';
    }

    std::string input;
    pdfredact::Sanitizer sanitizer;
    const std::chrono::time_point<std::chrono::steady_clock> start;
};

static pdfredact::Sanitizer
make_sanitizer()
{
    auto logger = QPDFLogger::create();
    logger->setInfo(logger->discard());
    logger->setWarn(logger->discard());
    pdfredact::Config config;
    // The permission lock goes through temporary files, which only
    // slows fuzzing down.
    config.skip_permission_lock = true;
    config.deterministic_id = true;
    return pdfredact::Sanitizer(config, pdfredact::DocumentLoader::create(logger));
}

FuzzHelper::FuzzHelper(unsigned char const* data, size_t size) :
    input(reinterpret_cast<char const*>(data), size),
    sanitizer(make_sanitizer()),
    start(std::chrono::steady_clock::now())
{
}

void
FuzzHelper::testAnalyze()
{
    auto analysis = this->sanitizer.analyze(this->input);
    analysis.getJSON(true).unparse();
    info("analyze done");
    this->sanitizer.extractAllText(this->input);
    info("extractAllText done");
}

void
FuzzHelper::testRedact()
{
    auto outcome = this->sanitizer.redact(this->input);
    outcome.getJSON().unparse();
    info("redact done");
    if (outcome.redacted) {
        // Redacted output must be readable again
        this->sanitizer.analyze(outcome.output);
        info("reanalyze done");
    }
}

void
FuzzHelper::doChecks()
{
    std::cerr << "\ninfo: starting testAnalyze\n";
    try {
        testAnalyze();
    } catch (pdfredact::RedactExc const& e) {
        std::cerr << "RedactExc: " << e.getCategory() << ": " << e.what() << '\n';
    }
    std::cerr << "\ninfo: starting testRedact\n";
    testRedact();
}

void
FuzzHelper::run()
{
    // Anything thrown at the sanitizer must come back as a result or
    // as a RedactExc. Any other exception, a crash, or a memory error
    // (when built with sanitizers) causes abnormal exit.
    try {
        doChecks();
    } catch (pdfredact::RedactExc const& e) {
        std::cerr << "RedactExc: " << e.getCategory() << ": " << e.what() << '\n';
    }
}

extern "C" int
LLVMFuzzerTestOneInput(unsigned char const* data, size_t size)
{
    FuzzHelper f(data, size);
    f.run();
    return 0;
}

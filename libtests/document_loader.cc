#include <pdfredact/assert_test.h>

#include <pdfredact/DocumentLoader.hh>
#include <pdfredact/RedactExc.hh>

#include "test_documents.hh"

#include <qpdf/Pl_String.hh>
#include <qpdf/QPDFLogger.hh>

#include <iostream>

using namespace pdfredact;
using namespace test_documents;

static void
expect_sniff_error(
    DocumentLoader const& loader, std::string const& data, pdfredact_error_code_e code)
{
    try {
        loader.sniff(data);
        assert(false);
    } catch (RedactExc& e) {
        assert(e.getErrorCode() == code);
    }
}

static void
test_instance()
{
    auto a = DocumentLoader::instance();
    auto b = DocumentLoader::instance();
    assert(a && (a == b));
    assert(a->getLogger() == QPDFLogger::defaultLogger());
    assert(DocumentLoader::create() != a);
}

static void
test_logging()
{
    std::string info;
    std::string warn;
    auto logger = QPDFLogger::create();
    logger->setInfo(std::make_shared<Pl_String>("info", nullptr, info));
    logger->setWarn(std::make_shared<Pl_String>("warn", nullptr, warn));
    auto loader = DocumentLoader::create(logger);
    assert(!loader->isVerbose());
    loader->info("quiet");
    loader->warn("careful");
    assert(info.empty());
    assert(warn == "pdfredact: careful\n");
    loader->setVerbose(true);
    loader->info("progress");
    assert(info == "pdfredact: progress\n");

    // A null logger means the default logger
    loader->setLogger(nullptr);
    assert(loader->getLogger() == QPDFLogger::defaultLogger());
}

static void
test_sniff()
{
    auto loader = DocumentLoader::create();
    expect_sniff_error(*loader, "", pdfredact_e_input);
    expect_sniff_error(*loader, "%PDF", pdfredact_e_format);
    expect_sniff_error(*loader, "GIF89a and more", pdfredact_e_format);
    expect_sniff_error(*loader, "%PDF-1.7\nthis is not really a PDF file", pdfredact_e_format);

    auto content = std::vector<std::string>{show_text(50, 700, 12, "text")};
    assert(loader->sniff(make_pdf(content)) == pdfredact_p_none);
    assert(loader->sniff(make_encrypted_pdf(content, "", "owner")) == pdfredact_p_recoverable);
    expect_sniff_error(
        *loader, make_encrypted_pdf(content, "user", "owner"), pdfredact_e_protection);
}

static void
test_load()
{
    auto loader = DocumentLoader::create();
    auto data = make_pdf({"", ""}, 300, 400);
    auto doc = loader->load(data, "test", false);
    assert(!doc.isEncrypted());
    assert(!doc.isCopy());
    assert(doc.getPageCount() == 2);
    assert(doc.getData() == data);
    double width = 0;
    double height = 0;
    Document::getPageSize(doc.getAllPages().at(1), width, height);
    assert((width == 300) && (height == 400));

    auto encrypted = make_encrypted_pdf({""}, "", "owner");
    try {
        loader->load(encrypted, "test", false);
        assert(false);
    } catch (RedactExc& e) {
        assert(e.getErrorCode() == pdfredact_e_protection);
    }
    doc = loader->load(encrypted, "test", true);
    assert(doc.isEncrypted());

    auto copy = loader->copyPages(doc);
    assert(copy.isCopy());
    assert(!copy.isEncrypted());
    assert(copy.getPageCount() == 1);
    assert(copy.getData() == encrypted);
}

int
main()
{
    test_instance();
    test_logging();
    test_sniff();
    test_load();
    std::cout << "document loader tests passed" << std::endl;
    return 0;
}

#include <pdfredact/assert_test.h>

#include <pdfredact/DocumentLoader.hh>
#include <pdfredact/RedactExc.hh>
#include <pdfredact/Validator.hh>

#include "test_documents.hh"

#include <qpdf/Pl_String.hh>
#include <qpdf/QPDFLogger.hh>

#include <iostream>

using namespace pdfredact;
using namespace test_documents;

static void
expect_invalid(Validator const& v, std::string const& output, int pages)
{
    try {
        v.validate(output, pages);
        assert(false);
    } catch (RedactExc& e) {
        assert(e.getErrorCode() == pdfredact_e_validation);
        assert(e.getCategory() == "Output Validation Failed");
    }
}

int
main()
{
    std::string log;
    auto logger = QPDFLogger::create();
    auto pl = std::make_shared<Pl_String>("log", nullptr, log);
    logger->setInfo(pl);
    logger->setWarn(pl);
    auto loader = DocumentLoader::create(logger);
    Validator v(loader);

    expect_invalid(v, "", 1);
    expect_invalid(v, "%PDF-1.4\n%%EOF\n", 1);
    expect_invalid(v, "%PDF-1.4\n" + std::string(Validator::min_output_size, 'x'), 1);
    // No pages
    expect_invalid(v, make_pdf({}), 0);
    // Degenerate page size
    expect_invalid(v, make_pdf({""}, 0, 792), 1);
    expect_invalid(v, make_pdf({"", ""}, 612, 0), 2);

    auto data = make_pdf({"", ""});
    assert(v.validate(data, 2) == 2);
    assert(log.empty());

    // A page count that differs is reported but accepted
    assert(v.validate(data, 3) == 2);
    assert(log.find("page count changed from 3 to 2") != std::string::npos);

    // Encrypted output that opens without a password is accepted
    assert(v.validate(make_encrypted_pdf({""}, "", "owner"), 1) == 1);

    std::cout << "validator tests passed" << std::endl;
    return 0;
}

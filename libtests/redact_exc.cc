#include <pdfredact/assert_test.h>

#include <pdfredact/RedactExc.hh>

#include "test_documents.hh"

#include <iostream>

using namespace pdfredact;
using namespace test_documents;

static void
check_category(pdfredact_error_code_e code, std::string const& category)
{
    RedactExc e(code, "message");
    if (e.getCategory() != category) {
        std::cout << "got " << e.getCategory() << ", wanted " << category << std::endl;
    }
    assert(e.getCategory() == category);
    assert(!e.getHint().empty());
}

int
main()
{
    check_category(pdfredact_e_input, "No PDF File");
    check_category(pdfredact_e_size, "File Too Large");
    check_category(pdfredact_e_format, "Invalid PDF File");
    check_category(pdfredact_e_protection, "PDF is Password Protected");
    check_category(pdfredact_e_extraction, "Cannot Read PDF");
    check_category(pdfredact_e_redaction, "Processing Error");
    check_category(pdfredact_e_validation, "Output Validation Failed");

    RedactExc e(pdfredact_e_format, "unable to parse PDF", "xref not found");
    assert(e.getErrorCode() == pdfredact_e_format);
    assert(e.getMessageDetail() == "unable to parse PDF");
    assert(e.getDiagnostic() == "xref not found");
    assert(std::string(e.what()) == "unable to parse PDF: xref not found");
    assert(std::string(RedactExc(pdfredact_e_input, "empty").what()) == "empty");

    auto j = JSON::parse(e.getJSON(true).unparse());
    assert(json_string(j, "error") == "Invalid PDF File");
    assert(json_string(j, "message") == e.getHint());
    assert(json_string(j, "technicalDetails") == "unable to parse PDF: xref not found");

    j = JSON::parse(e.getJSON(false).unparse());
    assert(json_string(j, "error") == "Invalid PDF File");
    assert(!json_has(j, "technicalDetails"));

    // Catchable as std::runtime_error
    try {
        throw RedactExc(pdfredact_e_validation, "bad output");
    } catch (std::runtime_error& re) {
        assert(std::string(re.what()) == "bad output");
    }

    std::cout << "exception tests passed" << std::endl;
    return 0;
}

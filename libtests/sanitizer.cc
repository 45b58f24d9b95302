#include <pdfredact/assert_test.h>

#include <pdfredact/Config.hh>
#include <pdfredact/DocumentLoader.hh>
#include <pdfredact/RedactExc.hh>
#include <pdfredact/Sanitizer.hh>

#include "test_documents.hh"

#include <qpdf/Pl_String.hh>
#include <qpdf/QPDFLogger.hh>

#include <iostream>

using namespace pdfredact;
using namespace test_documents;

static std::string log_text;

static Sanitizer
make_sanitizer(size_t max_file_size = 10 * 1024 * 1024)
{
    auto logger = QPDFLogger::create();
    auto pl = std::make_shared<Pl_String>("log", nullptr, log_text);
    logger->setInfo(pl);
    logger->setWarn(pl);
    auto loader = DocumentLoader::create(logger);
    loader->setVerbose(true);
    Config config;
    config.skip_permission_lock = true;
    config.deterministic_id = true;
    config.max_file_size = max_file_size;
    return Sanitizer(config, loader);
}

static void
expect_error(
    Sanitizer const& s, std::string const& data, pdfredact_error_code_e code, char const* category)
{
    try {
        s.redact(data);
        assert(false);
    } catch (RedactExc& e) {
        assert(e.getErrorCode() == code);
        assert(e.getCategory() == category);
    }
}

static void
test_input_checks()
{
    auto s = make_sanitizer(1024);
    expect_error(s, "", pdfredact_e_input, "No PDF File");
    expect_error(s, std::string(2048, '%'), pdfredact_e_size, "File Too Large");
    expect_error(s, "%PDF", pdfredact_e_format, "Invalid PDF File");
    expect_error(s, "hello world, not a pdf", pdfredact_e_format, "Invalid PDF File");

    s = make_sanitizer();
    auto content = std::vector<std::string>{show_text(50, 700, 12, "a@b.co")};
    expect_error(
        s,
        make_encrypted_pdf(content, "secret", "owner"),
        pdfredact_e_protection,
        "PDF is Password Protected");
    assert(s.checkInput(make_pdf(content)) == pdfredact_p_none);
    assert(s.checkInput(make_encrypted_pdf(content, "", "owner")) == pdfredact_p_recoverable);
}

static void
test_clean()
{
    auto s = make_sanitizer();
    auto outcome = s.redact(make_pdf({show_text(50, 700, 12, "Nothing personal")}));
    assert(!outcome.redacted);
    assert(outcome.output.empty());
    assert(outcome.statistics.total_redactions == 0);

    auto j = JSON::parse(outcome.getJSON().unparse());
    assert(json_string(j, "message") == "No personal information found in the document");
    auto r = json_member(j, "redactions");
    assert(json_int(r, "totalRedactions") == 0);
    assert(json_int(r, "emails") == 0);
    assert(json_int(r, "phones") == 0);
    assert(json_int(r, "pagesAffected") == 0);
    assert(json_int(j, "processingTime") >= 0);
    assert(!json_has(j, "success"));
}

static void
test_redact()
{
    log_text.clear();
    auto s = make_sanitizer();
    auto data = make_pdf(
        {show_text(50, 700, 12, "Mail john@example.com"),
         show_text(50, 700, 12, "Phone 555-123-4567"),
         ""});
    auto outcome = s.redact(data);
    assert(outcome.redacted);
    assert(outcome.page_count == 3);
    assert(outcome.details.page_count == 3);
    assert(outcome.statistics.emails == 1);
    assert(outcome.statistics.phones == 1);
    assert(outcome.statistics.pages_affected == 2);

    auto j = JSON::parse(outcome.getJSON().unparse());
    assert(json_bool(j, "success"));
    assert(json_string(j, "message") == "Successfully redacted 2 item(s)");
    assert(json_int(j, "pageCount") == 3);
    assert(json_int(json_member(j, "statistics"), "totalRedactions") == 2);

    // Nothing left to find
    assert(!s.analyze(outcome.output).found());
    // Progress is logged without the matched text
    assert(log_text.find("redacting 1 email(s) and 1 phone number(s)") != std::string::npos);
    assert(log_text.find("john@example.com") == std::string::npos);
    assert(log_text.find("555-123-4567") == std::string::npos);
}

static void
test_analyze()
{
    auto s = make_sanitizer();
    auto data = make_pdf({"", show_text(50, 700, 12, "Contact: john@example.com")});
    auto analysis = s.analyze(data);
    assert(analysis.found());
    assert(analysis.statistics.total_redactions == 1);

    auto j = JSON::parse(analysis.getJSON(true).unparse());
    assert(json_bool(j, "found"));
    auto details = json_items(json_member(j, "details"));
    assert(details.size() == 1);
    assert(json_int(details.at(0), "page") == 2);
    auto items = json_items(json_member(details.at(0), "items"));
    assert(items.size() == 1);
    assert(json_string(items.at(0), "type") == "email");
    assert(json_string(items.at(0), "text") == "john@example.com");
    auto coords = json_member(items.at(0), "coordinates");
    assert(json_int(coords, "x") == 50);
    assert(json_int(coords, "y") == 80);
    assert(json_int(coords, "width") == 180);
    assert(json_int(coords, "height") == 12);

    j = JSON::parse(analysis.getJSON(false).unparse());
    items = json_items(json_member(json_items(json_member(j, "details")).at(0), "items"));
    assert(!json_has(items.at(0), "text"));
    assert(json_int(items.at(0), "textLength") == 16);

    j = JSON::parse(s.analyze(make_pdf({""})).getJSON(true).unparse());
    assert(!json_bool(j, "found"));
    assert(json_items(json_member(j, "details")).empty());
}

static void
test_text()
{
    auto s = make_sanitizer();
    auto text = s.extractAllText(make_pdf({show_text(50, 700, 12, "Hello")}));
    assert(text == "--- Page 1 ---\nHello\n");
}

int
main()
{
    test_input_checks();
    test_clean();
    test_redact();
    test_analyze();
    test_text();
    std::cout << "sanitizer tests passed" << std::endl;
    return 0;
}

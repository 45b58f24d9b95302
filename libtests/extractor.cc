#include <pdfredact/assert_test.h>

#include <pdfredact/DocumentLoader.hh>
#include <pdfredact/Extractor.hh>
#include <pdfredact/RedactExc.hh>

#include "test_documents.hh"

#include <cmath>
#include <iostream>

using namespace pdfredact;
using namespace test_documents;

static bool
near(double a, double b)
{
    return std::fabs(a - b) < 0.001;
}

static std::vector<TextRun>
runs_on_first_page(std::string const& data)
{
    auto loader = DocumentLoader::create();
    auto doc = loader->load(data, "test", false);
    return Extractor::findTextRuns(doc.getAllPages().at(0));
}

static void
test_coordinates()
{
    auto data = make_pdf({show_text(50, 700, 12, "Contact: john@example.com")});
    auto pages = Extractor(DocumentLoader::create()).extractMatches(data);
    assert(pages.size() == 1);
    auto const& set = pages.at(0);
    assert(set.page_number == 1);
    assert(near(set.page_width, 612));
    assert(near(set.page_height, 792));
    assert(set.items.size() == 1);
    auto const& m = set.items.at(0);
    assert(m.text == "john@example.com");
    assert(m.type == pdfredact_pii_email);
    assert(m.page_number == 1);
    assert(near(m.x, 50));
    // Top of the box, measured from the top of the page
    assert(near(m.y, 80));
    assert(near(m.height, 12));
    // 25 Courier characters at 12 points
    assert(near(m.width, 25 * 0.6 * 12));
}

static void
test_ordering()
{
    // Emails come before phones; both share the run's box
    auto data = make_pdf({show_text(72, 600, 10, "555-123-4567 or jane@example.org")});
    auto pages = Extractor(DocumentLoader::create()).extractMatches(data);
    assert(pages.size() == 1);
    auto const& items = pages.at(0).items;
    assert(items.size() == 2);
    assert(items.at(0).type == pdfredact_pii_email);
    assert(items.at(0).text == "jane@example.org");
    assert(items.at(1).type == pdfredact_pii_phone);
    assert(items.at(1).text == "555-123-4567");
    assert(items.at(0).x == items.at(1).x);
    assert(items.at(0).y == items.at(1).y);
    assert(items.at(0).width == items.at(1).width);
}

static void
test_pages()
{
    auto data = make_pdf(
        {show_text(50, 700, 12, "Nothing to see"),
         show_text(50, 700, 12, "Call +44 20 1234 5678") + show_text(50, 650, 12, "a@b.co"),
         ""});
    auto pages = Extractor(DocumentLoader::create()).extractMatches(data);
    // Pages without matches are left out
    assert(pages.size() == 1);
    assert(pages.at(0).page_number == 2);
    int emails = 0;
    int phones = 0;
    for (auto const& item: pages.at(0).items) {
        assert(item.page_number == 2);
        if (item.type == pdfredact_pii_email) {
            ++emails;
        } else {
            ++phones;
        }
    }
    assert(emails == 1);
    assert(phones >= 1);

    auto clean = make_pdf({show_text(50, 700, 12, "X"), ""});
    assert(Extractor(DocumentLoader::create()).extractMatches(clean).empty());
    clean = make_pdf(
        {show_text(50, 700, 12, "This is a test document with no personal information.")});
    assert(Extractor(DocumentLoader::create()).extractMatches(clean).empty());

    // One item on each page
    data = make_pdf(
        {show_text(50, 700, 12, "Email: someone@example.net"),
         show_text(50, 700, 12, "Phone: 647-852-1083")});
    pages = Extractor(DocumentLoader::create()).extractMatches(data);
    assert(pages.size() == 2);
    assert((pages.at(0).page_number == 1) && (pages.at(0).items.size() == 1));
    assert(pages.at(0).items.at(0).type == pdfredact_pii_email);
    assert((pages.at(1).page_number == 2) && (pages.at(1).items.size() == 1));
    assert(pages.at(1).items.at(0).type == pdfredact_pii_phone);
}

static void
test_text_state()
{
    // TJ adjustments move the origin but add no text
    auto runs = runs_on_first_page(make_pdf({"BT /F1 10 Tf 0 0 Td [(ab) -1000 (cd)] TJ ET"}));
    assert(runs.size() == 1);
    assert(runs.at(0).text == "abcd");
    assert(near(runs.at(0).width, (4 * 6) + 10));

    // Tm and T* with leading
    runs = runs_on_first_page(
        make_pdf({"BT /F1 10 Tf 14 TL 1 0 0 1 100 500 Tm (one) Tj T* (two) Tj ET"}));
    assert(runs.size() == 2);
    assert(near(runs.at(0).x, 100) && near(runs.at(0).y, 500));
    assert(near(runs.at(1).x, 100) && near(runs.at(1).y, 486));

    // cm scales both the position and the height
    runs = runs_on_first_page(make_pdf({"q 2 0 0 2 0 0 cm BT /F1 10 Tf 10 20 Td (x) Tj ET Q"}));
    assert(runs.size() == 1);
    assert(near(runs.at(0).x, 20) && near(runs.at(0).y, 40));
    assert(near(runs.at(0).height, 20));
    assert(near(runs.at(0).width, 12));

    // Text shown before any font is selected still yields a run
    runs = runs_on_first_page(make_pdf({"BT 0 0 Td (abc) Tj ET"}));
    assert(runs.size() == 1);
    assert(runs.at(0).text == "abc");
}

static void
test_forms()
{
    auto data = make_form_pdf(
        "q 1 0 0 1 100 50 cm /Fm1 Do Q", show_text(10, 20, 10, "a@b.co"), "2 0 0 2 0 0");
    auto runs = runs_on_first_page(data);
    assert(runs.size() == 1);
    assert(near(runs.at(0).x, 120));
    assert(near(runs.at(0).y, 90));
    assert(near(runs.at(0).height, 20));
    assert(near(runs.at(0).width, 6 * 0.6 * 10 * 2));

    auto pages = Extractor(DocumentLoader::create()).extractMatches(data);
    assert(pages.size() == 1);
    assert(pages.at(0).items.at(0).text == "a@b.co");
    assert(near(pages.at(0).items.at(0).y, 792 - 90 - 20));

    // A form that invokes itself is only entered once
    data = make_form_pdf(
        "/Fm1 Do", show_text(0, 0, 10, "loop") + "/Fm1 Do\n", "1 0 0 1 0 0", true);
    runs = runs_on_first_page(data);
    assert(runs.size() == 1);
    assert(runs.at(0).text == "loop");
}

static void
test_all_text()
{
    auto data = make_pdf({show_text(50, 700, 12, "Hello") + show_text(50, 680, 12, "world"), ""});
    auto text = Extractor(DocumentLoader::create()).extractAllText(data);
    assert(text == "--- Page 1 ---\nHello world\n--- Page 2 ---\n\n");
}

static void
test_errors()
{
    try {
        Extractor(DocumentLoader::create()).extractMatches(std::string("%PDF-1.4 garbage"));
        assert(false);
    } catch (RedactExc& e) {
        assert(e.getErrorCode() == pdfredact_e_extraction);
    }
    try {
        Extractor(nullptr);
        assert(false);
    } catch (std::logic_error&) {
    }
}

int
main()
{
    test_coordinates();
    test_ordering();
    test_pages();
    test_text_state();
    test_forms();
    test_all_text();
    test_errors();
    std::cout << "extractor tests passed" << std::endl;
    return 0;
}

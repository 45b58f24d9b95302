#include <pdfredact/assert_test.h>

#include <pdfredact/Statistics.hh>

#include "test_documents.hh"

#include <iostream>

using namespace pdfredact;
using namespace test_documents;

static PIIMatch
match(pdfredact_pii_type_e type, int page)
{
    PIIMatch m;
    m.type = type;
    m.page_number = page;
    return m;
}

int
main()
{
    auto empty = Statistics::fromPages({});
    assert(empty.total_redactions == 0);
    assert(empty.pages_affected == 0);
    auto j = empty.getJSON();
    assert(json_int(j, "totalRedactions") == 0);
    assert(json_int(j, "emails") == 0);
    assert(json_int(j, "phones") == 0);
    assert(json_int(j, "pagesAffected") == 0);

    std::vector<PageRedactionSet> pages(2);
    pages.at(0).page_number = 1;
    pages.at(0).items.push_back(match(pdfredact_pii_email, 1));
    pages.at(0).items.push_back(match(pdfredact_pii_phone, 1));
    pages.at(0).items.push_back(match(pdfredact_pii_phone, 1));
    pages.at(1).page_number = 3;
    pages.at(1).items.push_back(match(pdfredact_pii_email, 3));

    auto s = Statistics::fromPages(pages);
    assert(s.emails == 2);
    assert(s.phones == 2);
    assert(s.total_redactions == s.emails + s.phones);
    assert(s.pages_affected == 2);
    j = JSON::parse(s.getJSON().unparse());
    assert(json_int(j, "totalRedactions") == 4);
    assert(json_int(j, "emails") == 2);
    assert(json_int(j, "phones") == 2);
    assert(json_int(j, "pagesAffected") == 2);

    std::vector<PageRedactionSet> one(1);
    one.at(0).page_number = 1;
    one.at(0).items = {
        match(pdfredact_pii_email, 1),
        match(pdfredact_pii_phone, 1),
        match(pdfredact_pii_phone, 1)};
    s = Statistics::fromPages(one);
    assert(s.total_redactions == 3);
    assert(s.emails == 1);
    assert(s.phones == 2);
    assert(s.pages_affected == 1);

    assert(std::string(pii_type_name(pdfredact_pii_email)) == "email");
    assert(std::string(pii_type_name(pdfredact_pii_phone)) == "phone");

    std::cout << "statistics tests passed" << std::endl;
    return 0;
}

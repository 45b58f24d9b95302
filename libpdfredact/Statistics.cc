#include <pdfredact/Statistics.hh>

using namespace pdfredact;

Statistics
Statistics::fromPages(std::vector<PageRedactionSet> const& pages)
{
    Statistics result;
    for (auto const& page: pages) {
        for (auto const& item: page.items) {
            ++result.total_redactions;
            if (item.type == pdfredact_pii_email) {
                ++result.emails;
            } else {
                ++result.phones;
            }
        }
    }
    result.pages_affected = static_cast<int>(pages.size());
    return result;
}

JSON
Statistics::getJSON() const
{
    auto j = JSON::makeDictionary();
    j.addDictionaryMember("totalRedactions", JSON::makeInt(this->total_redactions));
    j.addDictionaryMember("emails", JSON::makeInt(this->emails));
    j.addDictionaryMember("phones", JSON::makeInt(this->phones));
    j.addDictionaryMember("pagesAffected", JSON::makeInt(this->pages_affected));
    return j;
}

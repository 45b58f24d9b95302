#include <pdfredact/Extractor.hh>

#include <pdfredact/Patterns.hh>
#include <pdfredact/RedactExc.hh>
#include <pdfredact/TextRunFinder.hh>

#include <qpdf/QUtil.hh>

#include <stdexcept>

using namespace pdfredact;

static std::string
trim(std::string const& text)
{
    size_t first = 0;
    size_t last = text.length();
    while ((first < last) && QUtil::is_space(text.at(first))) {
        ++first;
    }
    while ((last > first) && QUtil::is_space(text.at(last - 1))) {
        --last;
    }
    return text.substr(first, last - first);
}

Extractor::Extractor(std::shared_ptr<DocumentLoader> loader) :
    loader(loader)
{
    if (!this->loader) {
        throw std::logic_error("Extractor created without a DocumentLoader");
    }
}

std::vector<TextRun>
Extractor::findTextRuns(QPDFPageObjectHelper page)
{
    return TextRunFinder::findRuns(page);
}

void
Extractor::collectMatches(
    TextRun const& run, int page_number, double page_height, std::vector<PIIMatch>& out)
{
    auto text = trim(run.text);
    if (text.empty() || !Patterns::containsPII(text)) {
        return;
    }
    PIIMatch box;
    box.page_number = page_number;
    box.x = run.x;
    box.y = (page_height - run.y) - run.height;
    box.width = run.width;
    box.height = run.height;

    for (auto const& email: Patterns::findEmails(text)) {
        box.text = email;
        box.type = pdfredact_pii_email;
        out.push_back(box);
    }
    for (auto const& phone: Patterns::findPhones(text)) {
        box.text = phone;
        box.type = pdfredact_pii_phone;
        out.push_back(box);
    }
}

std::vector<PageRedactionSet>
Extractor::extractMatches(std::string const& data) const
{
    try {
        return extractMatches(this->loader->load(data, "input file", true));
    } catch (RedactExc& e) {
        if (e.getErrorCode() == pdfredact_e_extraction) {
            throw;
        }
        throw RedactExc(pdfredact_e_extraction, "failed to extract text from PDF", e.what());
    }
}

std::vector<PageRedactionSet>
Extractor::extractMatches(Document const& doc) const
{
    std::vector<PageRedactionSet> result;
    size_t total = 0;
    try {
        int pageno = 0;
        for (auto& page: doc.getAllPages()) {
            ++pageno;
            PageRedactionSet set;
            set.page_number = pageno;
            Document::getPageSize(page, set.page_width, set.page_height);
            for (auto const& run: findTextRuns(page)) {
                collectMatches(run, pageno, set.page_height, set.items);
            }
            if (!set.items.empty()) {
                total += set.items.size();
                result.push_back(std::move(set));
            }
        }
    } catch (std::exception& e) {
        throw RedactExc(pdfredact_e_extraction, "failed to extract text from PDF", e.what());
    }
    this->loader->info(
        "found " + std::to_string(total) + " match(es) on " + std::to_string(result.size()) +
        " page(s)");
    return result;
}

std::string
Extractor::extractAllText(std::string const& data) const
{
    std::string result;
    try {
        auto doc = this->loader->load(data, "input file", true);
        int pageno = 0;
        for (auto& page: doc.getAllPages()) {
            result += "--- Page " + std::to_string(++pageno) + " ---\n";
            bool first = true;
            for (auto const& run: findTextRuns(page)) {
                if (run.text.empty()) {
                    continue;
                }
                if (!first) {
                    result += " ";
                }
                result += run.text;
                first = false;
            }
            result += "\n";
        }
    } catch (std::exception& e) {
        throw RedactExc(pdfredact_e_extraction, "failed to extract text from PDF", e.what());
    }
    return result;
}

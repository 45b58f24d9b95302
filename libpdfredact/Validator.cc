#include <pdfredact/Validator.hh>

#include <pdfredact/RedactExc.hh>

#include <stdexcept>

using namespace pdfredact;

Validator::Validator(std::shared_ptr<DocumentLoader> loader) :
    loader(loader)
{
    if (!this->loader) {
        throw std::logic_error("Validator created without a DocumentLoader");
    }
}

int
Validator::validate(std::string const& output, int original_page_count) const
{
    if (output.length() < min_output_size) {
        throw RedactExc(
            pdfredact_e_validation,
            "output is too small to be a valid PDF (" + std::to_string(output.length()) +
                " bytes)");
    }
    int page_count = 0;
    try {
        auto doc = this->loader->load(output, "redacted output", true);
        auto pages = doc.getAllPages();
        page_count = static_cast<int>(pages.size());
        if (page_count == 0) {
            throw RedactExc(pdfredact_e_validation, "output has no pages");
        }
        if (page_count != original_page_count) {
            this->loader->warn(
                "page count changed from " + std::to_string(original_page_count) + " to " +
                std::to_string(page_count));
        }
        int pageno = 0;
        for (auto& page: pages) {
            ++pageno;
            double width = 0.0;
            double height = 0.0;
            Document::getPageSize(page, width, height);
            if ((width <= 0.0) || (height <= 0.0)) {
                throw RedactExc(
                    pdfredact_e_validation,
                    "page " + std::to_string(pageno) + " has zero width or height");
            }
        }
    } catch (RedactExc& e) {
        if (e.getErrorCode() == pdfredact_e_validation) {
            throw;
        }
        throw RedactExc(pdfredact_e_validation, "output could not be reloaded", e.what());
    } catch (std::exception& e) {
        throw RedactExc(pdfredact_e_validation, "output could not be reloaded", e.what());
    }
    this->loader->info("output validated: " + std::to_string(page_count) + " page(s)");
    return page_count;
}

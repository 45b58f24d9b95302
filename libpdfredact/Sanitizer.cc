#include <pdfredact/Sanitizer.hh>

#include <pdfredact/Extractor.hh>
#include <pdfredact/RedactExc.hh>
#include <pdfredact/Validator.hh>

#include <chrono>
#include <cmath>
#include <stdexcept>

using namespace pdfredact;

static long long
rounded(double d)
{
    return std::llround(d);
}

static long long
elapsed_ms(std::chrono::steady_clock::time_point start)
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now() - start)
        .count();
}

JSON
Sanitizer::Analysis::getJSON(bool include_text) const
{
    auto j = JSON::makeDictionary();
    j.addDictionaryMember("found", JSON::makeBool(found()));
    j.addDictionaryMember("statistics", this->statistics.getJSON());
    auto j_details = j.addDictionaryMember("details", JSON::makeArray());
    for (auto const& page: this->pages) {
        auto j_page = j_details.addArrayElement(JSON::makeDictionary());
        j_page.addDictionaryMember("page", JSON::makeInt(page.page_number));
        auto j_items = j_page.addDictionaryMember("items", JSON::makeArray());
        for (auto const& item: page.items) {
            auto j_item = j_items.addArrayElement(JSON::makeDictionary());
            j_item.addDictionaryMember("type", JSON::makeString(pii_type_name(item.type)));
            if (include_text) {
                j_item.addDictionaryMember("text", JSON::makeString(item.text));
            } else {
                j_item.addDictionaryMember(
                    "textLength", JSON::makeInt(static_cast<long long>(item.text.length())));
            }
            auto j_coords = j_item.addDictionaryMember("coordinates", JSON::makeDictionary());
            j_coords.addDictionaryMember("x", JSON::makeInt(rounded(item.x)));
            j_coords.addDictionaryMember("y", JSON::makeInt(rounded(item.y)));
            j_coords.addDictionaryMember("width", JSON::makeInt(rounded(item.width)));
            j_coords.addDictionaryMember("height", JSON::makeInt(rounded(item.height)));
        }
    }
    return j;
}

JSON
Sanitizer::Outcome::getJSON() const
{
    auto j = JSON::makeDictionary();
    if (!this->redacted) {
        j.addDictionaryMember(
            "message", JSON::makeString("No personal information found in the document"));
        j.addDictionaryMember("redactions", Statistics().getJSON());
        j.addDictionaryMember("processingTime", JSON::makeInt(this->processing_time));
        return j;
    }
    j.addDictionaryMember("success", JSON::makeBool(true));
    j.addDictionaryMember(
        "message",
        JSON::makeString(
            "Successfully redacted " + std::to_string(this->statistics.total_redactions) +
            " item(s)"));
    j.addDictionaryMember("pageCount", JSON::makeInt(this->page_count));
    j.addDictionaryMember("statistics", this->statistics.getJSON());
    j.addDictionaryMember("processingTime", JSON::makeInt(this->processing_time));
    return j;
}

Sanitizer::Sanitizer(Config const& config, std::shared_ptr<DocumentLoader> loader) :
    config(config),
    loader(loader)
{
    if (!this->loader) {
        throw std::logic_error("Sanitizer created without a DocumentLoader");
    }
}

Config const&
Sanitizer::getConfig() const
{
    return this->config;
}

pdfredact_protection_e
Sanitizer::checkInput(std::string const& data) const
{
    if (data.empty()) {
        throw RedactExc(pdfredact_e_input, "no PDF data provided");
    }
    if (data.length() > this->config.max_file_size) {
        throw RedactExc(
            pdfredact_e_size,
            "input is " + std::to_string(data.length()) + " bytes; the limit is " +
                std::to_string(this->config.max_file_size) + " bytes");
    }
    auto state = this->loader->sniff(data);
    if (state == pdfredact_p_recoverable) {
        this->loader->info("input is encrypted but opens without a password");
    }
    return state;
}

Sanitizer::Analysis
Sanitizer::analyze(std::string const& data) const
{
    checkInput(data);
    Analysis result;
    result.pages = Extractor(this->loader).extractMatches(data);
    result.statistics = Statistics::fromPages(result.pages);
    return result;
}

Sanitizer::Outcome
Sanitizer::redact(std::string const& data) const
{
    auto start = std::chrono::steady_clock::now();
    checkInput(data);

    Outcome result;
    auto pages = Extractor(this->loader).extractMatches(data);
    if (pages.empty()) {
        this->loader->info("no personal information found; input left unchanged");
        result.processing_time = elapsed_ms(start);
        return result;
    }
    result.statistics = Statistics::fromPages(pages);
    this->loader->info(
        "redacting " + std::to_string(result.statistics.emails) + " email(s) and " +
        std::to_string(result.statistics.phones) + " phone number(s)");

    Redactor::Options options;
    options.skip_permission_lock = this->config.skip_permission_lock;
    options.deterministic_id = this->config.deterministic_id;
    options.temp_dir = this->config.tempDirectory();
    result.output = Redactor(this->loader).redact(data, pages, options, &result.details);
    result.page_count =
        Validator(this->loader).validate(result.output, result.details.page_count);
    result.redacted = true;
    result.processing_time = elapsed_ms(start);
    return result;
}

std::string
Sanitizer::extractAllText(std::string const& data) const
{
    checkInput(data);
    return Extractor(this->loader).extractAllText(data);
}

#include <pdfredact/Redactor.hh>

#include <pdfredact/Config.hh>
#include <pdfredact/PermissionLock.hh>
#include <pdfredact/RedactExc.hh>
#include <pdfredact/SaveStrategy.hh>
#include <pdfredact/StepResult.hh>
#include <pdfredact/TextStripper.hh>
#include <pdfredact/Validator.hh>

#include <qpdf/Pl_String.hh>
#include <qpdf/QPDFObjectHandle.hh>
#include <qpdf/QUtil.hh>

#include <stdexcept>

using namespace pdfredact;

static std::string
num(double d)
{
    return QUtil::double_to_string(d, 2);
}

Redactor::Redactor(std::shared_ptr<DocumentLoader> loader) :
    loader(loader)
{
    if (!this->loader) {
        throw std::logic_error("Redactor created without a DocumentLoader");
    }
}

std::string
Redactor::overlayContent(PageRedactionSet const& set, double page_height)
{
    std::string result = "q\n" + QUtil::double_to_string(overlay_gray, 5) + " g\n";
    for (auto const& m: set.items) {
        double x = m.x - overlay_padding;
        double y = page_height - m.y - m.height - overlay_padding;
        double w = m.width + (2 * overlay_padding);
        double h = m.height + (2 * overlay_padding);
        result += num(x) + " " + num(y) + " " + num(w) + " " + num(h) + " re f\n";
    }
    result += "Q\n";
    return result;
}

Document
Redactor::openWorkingCopy(std::string const& data, Details& details) const
{
    Document doc = [this, &data]() {
        try {
            return this->loader->load(data, "input file", true);
        } catch (RedactExc& e) {
            if (e.getErrorCode() == pdfredact_e_protection) {
                throw;
            }
            throw RedactExc(pdfredact_e_redaction, "unable to open PDF for redaction", e.what());
        }
    }();
    if (!doc.isEncrypted()) {
        return doc;
    }
    this->loader->warn("input is encrypted; redacting a copy of its pages");
    try {
        auto copy = this->loader->copyPages(doc);
        details.copied_from_protected = true;
        return copy;
    } catch (std::exception& e) {
        throw RedactExc(pdfredact_e_protection, "password-protected, cannot process", e.what());
    }
}

size_t
Redactor::stripText(
    QPDF& qpdf, QPDFPageObjectHelper& page, PageRedactionSet const& set, Wrapping& wrapping) const
{
    std::string step = "remove matched text on page " + std::to_string(set.page_number);
    std::vector<std::string> targets;
    for (auto const& m: set.items) {
        targets.push_back(m.text);
    }
    TextStripper stripper(targets);
    StepResult result;
    try {
        std::string content;
        Pl_String pl("stripped content", nullptr, content);
        page.filterContents(&stripper, &pl);
        if (stripper.getStripCount() > 0) {
            page.getObjectHandle().replaceKey("/Contents", qpdf.newStream(content));
        }
        wrapping.saves = 1 + stripper.getUnmatchedRestores();
        wrapping.restores = 1 + stripper.getOpenSaves();
        result = StepResult::success(
            step, std::to_string(stripper.getStripCount()) + " occurrence(s) removed");
    } catch (std::exception& e) {
        result = StepResult::failure(step, e.what());
    }
    result.report(*this->loader);
    return result.ok ? stripper.getStripCount() : 0;
}

void
Redactor::addOverlay(
    QPDF& qpdf,
    QPDFPageObjectHelper& page,
    PageRedactionSet const& set,
    Wrapping const& wrapping) const
{
    double width = 0.0;
    double height = 0.0;
    Document::getPageSize(page, width, height);
    std::string saves;
    for (int i = 0; i < wrapping.saves; ++i) {
        saves += "q\n";
    }
    std::string restores = "\n";
    for (int i = 0; i < wrapping.restores; ++i) {
        restores += "Q\n";
    }
    page.addPageContents(qpdf.newStream(saves), true);
    page.addPageContents(qpdf.newStream(restores + overlayContent(set, height)), false);
}

std::string
Redactor::redact(
    std::string const& data,
    std::vector<PageRedactionSet> const& sets,
    Options const& options,
    Details* details) const
{
    Details d;
    Document doc = openWorkingCopy(data, d);
    QPDF& qpdf = doc.getQPDF();
    try {
        auto pages = doc.getAllPages();
        d.page_count = static_cast<int>(pages.size());
        if (pages.empty()) {
            throw RedactExc(pdfredact_e_redaction, "document has no pages");
        }
        for (auto const& set: sets) {
            if ((set.page_number < 1) || (set.page_number > d.page_count)) {
                throw RedactExc(
                    pdfredact_e_redaction,
                    "redaction refers to page " + std::to_string(set.page_number) +
                        ", which is not in the document");
            }
            auto& page = pages.at(static_cast<size_t>(set.page_number - 1));
            Wrapping wrapping;
            d.strip_count += stripText(qpdf, page, set, wrapping);
            addOverlay(qpdf, page, set, wrapping);
        }
    } catch (RedactExc&) {
        throw;
    } catch (std::exception& e) {
        throw RedactExc(pdfredact_e_redaction, "unable to apply redactions", e.what());
    }

    auto output = SaveStrategy::saveWithFirst(
        SaveStrategy::defaultLadder(), qpdf, options.deterministic_id, *this->loader);
    if (output.length() < Validator::min_output_size) {
        throw RedactExc(
            pdfredact_e_redaction,
            "redacted PDF is too small (" + std::to_string(output.length()) + " bytes)");
    }

    if (!options.skip_permission_lock) {
        Config defaults;
        if (!options.temp_dir.empty()) {
            defaults.temp_dir = options.temp_dir;
        }
        auto result = PermissionLock(this->loader, defaults.tempDirectory()).apply(output);
        result.report(*this->loader);
        d.locked = result.ok;
    }

    if (details) {
        *details = d;
    }
    return output;
}

#include <pdfredact/assert_test.h>

#include <pdfredact/DocumentLoader.hh>
#include <pdfredact/Extractor.hh>
#include <pdfredact/RedactExc.hh>
#include <pdfredact/Redactor.hh>
#include <pdfredact/SaveStrategy.hh>
#include <pdfredact/TextStripper.hh>

#include "test_documents.hh"

#include <qpdf/Pl_String.hh>
#include <qpdf/QPDF.hh>
#include <qpdf/QPDFLogger.hh>

#include <qpdf/QUtil.hh>

#include <iostream>
#include <stdexcept>

using namespace pdfredact;
using namespace test_documents;

static std::shared_ptr<DocumentLoader>
quiet_loader(std::string& log)
{
    auto logger = QPDFLogger::create();
    auto pl = std::make_shared<Pl_String>("log", nullptr, log);
    logger->setInfo(pl);
    logger->setWarn(pl);
    return DocumentLoader::create(logger);
}

static std::string
page_content(QPDFPageObjectHelper page)
{
    std::string content;
    Pl_String pl("content", nullptr, content);
    page.pipeContents(&pl);
    return content;
}

namespace
{
    class FailingSave: public SaveStrategy
    {
      public:
        FailingSave(std::string const& reason) :
            reason(reason)
        {
        }

        char const*
        getName() const override
        {
            return "failing save";
        }

      protected:
        void
        configure(QPDFWriter&) const override
        {
            throw std::runtime_error(this->reason);
        }

      private:
        std::string reason;
    };
} // namespace

static PageRedactionSet
one_box(double x, double y, double width, double height)
{
    PageRedactionSet set;
    set.page_number = 1;
    set.page_width = 612;
    set.page_height = 792;
    PIIMatch m;
    m.type = pdfredact_pii_email;
    m.text = "jane@example.org";
    m.page_number = 1;
    m.x = x;
    m.y = y;
    m.width = width;
    m.height = height;
    set.items.push_back(m);
    return set;
}

static Redactor::Options
unlocked()
{
    Redactor::Options options;
    options.skip_permission_lock = true;
    options.deterministic_id = true;
    return options;
}

static void
test_overlay_content()
{
    PageRedactionSet set;
    set.page_number = 1;
    PIIMatch m;
    m.x = 50;
    m.y = 80;
    m.width = 180;
    m.height = 12;
    set.items.push_back(m);
    m.x = 10.5;
    m.y = 0;
    m.width = 20;
    m.height = 10;
    set.items.push_back(m);
    assert(
        Redactor::overlayContent(set, 792) ==
        "q\n0.82745 g\n48 698 184 16 re f\n8.5 780 24 14 re f\nQ\n");
}

static void
test_strip()
{
    auto data = make_pdf({"BT /F1 12 Tf 0 0 Td (a@b.co here) Tj [(x a@b.co)] TJ ET\n"
                          "/Fm1 Do (a@b.co) pop\n"});
    auto doc = DocumentLoader::create()->load(data, "test", false);
    auto page = doc.getAllPages().at(0);
    TextStripper stripper({"a@b.co", ""});
    std::string out;
    Pl_String pl("stripped", nullptr, out);
    page.filterContents(&stripper, &pl);
    assert(stripper.getStripCount() == 2);
    assert(out.find("( here) Tj") != std::string::npos);
    assert(out.find("[(x )] TJ") != std::string::npos);
    // Strings that are not shown as text are left alone
    assert(out.find("(a@b.co) pop") != std::string::npos);
    assert(stripper.getUnmatchedRestores() == 0);
    assert(stripper.getOpenSaves() == 0);
}

static int
unmatched_restores(std::string const& content, int& open_saves)
{
    auto doc = DocumentLoader::create()->load(make_pdf({content}), "test", false);
    TextStripper stripper(std::vector<std::string>{});
    std::string out;
    Pl_String pl("stripped", nullptr, out);
    doc.getAllPages().at(0).filterContents(&stripper, &pl);
    open_saves = stripper.getOpenSaves();
    return stripper.getUnmatchedRestores();
}

static void
test_nesting()
{
    int open = 0;
    assert(unmatched_restores("q 1 0 0 1 5 5 cm Q q Q", open) == 0);
    assert(open == 0);
    assert(unmatched_restores("q 2 0 0 2 0 0 cm q", open) == 0);
    assert(open == 2);
    assert(unmatched_restores("Q Q q", open) == 2);
    assert(open == 1);
    assert(unmatched_restores("q Q Q", open) == 1);
    assert(open == 0);
    // Only operators count
    assert(unmatched_restores("BT /F1 12 Tf (Q) Tj ET /Q pop", open) == 0);
    assert(open == 0);
}

static void
test_unbalanced_content()
{
    std::string log;
    auto loader = quiet_loader(log);

    // Two saves left open: the overlay must follow two extra restores
    auto data = make_pdf({"q 2 0 0 2 0 0 cm q\n" + show_text(25, 350, 6, "jane@example.org")});
    auto sets = Extractor(loader).extractMatches(data);
    assert(sets.size() == 1);
    auto output = Redactor(loader).redact(data, sets, unlocked());
    auto content = page_content(loader->load(output, "output", false).getAllPages().at(0));
    assert(content.find("q\nq 2 0 0 2 0 0 cm q") == 0);
    assert(content.find("\nQ\nQ\nQ\nq\n0.82745 g") != std::string::npos);
    // The overlay covers the text where it appears on the page
    assert(content.find("48 698 119.2 16 re f") != std::string::npos);

    // An unmatched restore: an extra save goes before the content
    data = make_pdf({"Q\n" + show_text(50, 700, 12, "jane@example.org")});
    sets = Extractor(loader).extractMatches(data);
    assert(sets.size() == 1);
    output = Redactor(loader).redact(data, sets, unlocked());
    content = page_content(loader->load(output, "output", false).getAllPages().at(0));
    assert(content.find("q\nq\nQ\n") == 0);
    assert(content.find("ET\n\nQ\nq\n0.82745 g") != std::string::npos);
}

static void
test_redact()
{
    std::string log;
    auto loader = quiet_loader(log);
    auto data = make_pdf(
        {show_text(50, 700, 12, "Contact: john@example.com"), show_text(50, 700, 12, "Clean")});
    auto sets = Extractor(loader).extractMatches(data);
    assert(sets.size() == 1);

    Redactor::Details details;
    auto output = Redactor(loader).redact(data, sets, unlocked(), &details);
    assert(details.page_count == 2);
    assert(details.strip_count == 1);
    assert(!details.copied_from_protected);
    assert(!details.locked);

    auto doc = loader->load(output, "output", false);
    assert(doc.getPageCount() == 2);
    auto pages = doc.getAllPages();
    auto content = page_content(pages.at(0));
    assert(content.find("john@example.com") == std::string::npos);
    assert(content.find("0.82745 g") != std::string::npos);
    assert(content.find("48 698 184 16 re f") != std::string::npos);
    // The original content is wrapped so its graphics state can't
    // leak into the overlay.
    assert(content.find("q\n") == 0);
    assert(page_content(pages.at(1)).find("re f") == std::string::npos);

    assert(Extractor(loader).extractMatches(output).empty());
    auto text = Extractor(loader).extractAllText(output);
    assert(text.find("Contact:") != std::string::npos);
    assert(text.find("Clean") != std::string::npos);

    // Deterministic output
    assert(Redactor(loader).redact(data, sets, unlocked()) == output);
}

static void
test_lock()
{
    std::string log;
    auto loader = quiet_loader(log);
    auto data = make_pdf({show_text(50, 700, 12, "Call 555-123-4567")});
    auto sets = Extractor(loader).extractMatches(data);
    Redactor::Details details;
    auto output = Redactor(loader).redact(data, sets, Redactor::Options(), &details);
    assert(details.locked);

    QPDF q;
    q.processMemoryFile("locked", output.data(), output.size());
    assert(q.isEncrypted());
    assert(!q.allowPrintLowRes());
    assert(!q.allowPrintHighRes());
    assert(!q.allowModifyOther());
    assert(!q.allowExtractAll());
    assert(q.allowAccessibility());
    assert(q.getAllPages().size() == 1);
}

static void
test_protected()
{
    std::string log;
    auto loader = quiet_loader(log);
    auto contents = std::vector<std::string>{show_text(50, 700, 12, "jane@example.org")};

    // Opens with the empty user password: the pages are copied
    auto data = make_encrypted_pdf(contents, "", "owner");
    auto sets = Extractor(loader).extractMatches(data);
    assert(sets.size() == 1);
    Redactor::Details details;
    auto output = Redactor(loader).redact(data, sets, unlocked(), &details);
    assert(details.copied_from_protected);
    auto doc = loader->load(output, "output", false);
    assert(!doc.isEncrypted());
    assert(doc.getPageCount() == 1);
    assert(log.find("redacting a copy of its pages") != std::string::npos);
    // Matched text never reaches the log
    assert(log.find("jane@example.org") == std::string::npos);

    data = make_encrypted_pdf(contents, "secret", "owner");
    try {
        Redactor(loader).redact(data, sets, unlocked());
        assert(false);
    } catch (RedactExc& e) {
        assert(e.getErrorCode() == pdfredact_e_protection);
    }
}

static void
test_errors()
{
    auto loader = DocumentLoader::create();
    auto data = make_pdf({show_text(50, 700, 12, "jane@example.org")});
    auto sets = Extractor(loader).extractMatches(data);
    sets.at(0).page_number = 5;
    try {
        Redactor(loader).redact(data, sets, unlocked());
        assert(false);
    } catch (RedactExc& e) {
        assert(e.getErrorCode() == pdfredact_e_redaction);
    }
    try {
        Redactor(loader).redact("not a pdf at all", {}, unlocked());
        assert(false);
    } catch (RedactExc& e) {
        assert(e.getErrorCode() == pdfredact_e_redaction);
    }
}

static void
test_save_ladder()
{
    std::string log;
    auto loader = quiet_loader(log);
    auto doc = loader->load(make_pdf({show_text(50, 700, 12, "Clean")}), "test", false);
    auto const& defaults = SaveStrategy::defaultLadder();
    assert(defaults.size() == 3);

    // The first strategy fails, so the second one's output is used
    std::vector<std::shared_ptr<SaveStrategy>> ladder{
        std::make_shared<FailingSave>("first reason"), defaults.at(1)};
    auto output = SaveStrategy::saveWithFirst(ladder, doc.getQPDF(), true, *loader);
    assert(output.find("%PDF-") == 0);
    assert(loader->load(output, "output", false).getPageCount() == 1);
    assert(log.find("failing save failed: first reason") != std::string::npos);
    assert(log.find("save with default settings: ") != std::string::npos);

    // Nothing after the first success is attempted
    log.clear();
    ladder = {defaults.at(0), std::make_shared<FailingSave>("never")};
    SaveStrategy::saveWithFirst(ladder, doc.getQPDF(), true, *loader);
    assert(log.find("failing save") == std::string::npos);

    // All fail: the last failure is attached to the error
    ladder = {
        std::make_shared<FailingSave>("first reason"),
        std::make_shared<FailingSave>("second reason")};
    try {
        SaveStrategy::saveWithFirst(ladder, doc.getQPDF(), true, *loader);
        assert(false);
    } catch (RedactExc& e) {
        assert(e.getErrorCode() == pdfredact_e_redaction);
        assert(e.getDiagnostic() == "second reason");
    }
    try {
        SaveStrategy::saveWithFirst({}, doc.getQPDF(), true, *loader);
        assert(false);
    } catch (RedactExc& e) {
        assert(e.getErrorCode() == pdfredact_e_redaction);
        assert(e.getDiagnostic() == "no save strategies");
    }
}

static void
test_strip_failure()
{
    // The content stream can't be decoded, so text removal fails. The
    // overlay is still added and the redaction succeeds.
    std::string log;
    auto loader = quiet_loader(log);
    auto data = make_undecodable_pdf("BT /F1 12 Tf 50 700 Td (jane@example.org) Tj ET");
    Redactor::Details details;
    auto output =
        Redactor(loader).redact(data, {one_box(50, 80, 115.2, 12)}, unlocked(), &details);
    assert(details.page_count == 1);
    assert(details.strip_count == 0);
    assert(log.find("remove matched text on page 1 failed: ") != std::string::npos);
    assert(log.find("jane@example.org") == std::string::npos);

    auto doc = loader->load(output, "output", false);
    auto contents = doc.getAllPages().at(0).getObjectHandle().getKey("/Contents");
    assert(contents.isArray());
    assert(contents.getArrayNItems() == 3);
    auto first = contents.getArrayItem(0).getStreamData();
    assert(std::string(reinterpret_cast<char const*>(first->getBuffer()), first->getSize()) ==
           "q\n");
    auto last = contents.getArrayItem(2).getStreamData();
    std::string overlay(reinterpret_cast<char const*>(last->getBuffer()), last->getSize());
    assert(overlay.find("0.82745 g") != std::string::npos);
    assert(overlay.find("48 698 119.2 16 re f") != std::string::npos);
}

static void
test_lock_failure()
{
    // The lock can't create its temporary files. The unlocked output is
    // returned instead.
    std::string log;
    auto loader = quiet_loader(log);
    auto data = make_pdf({show_text(50, 700, 12, "Call 555-123-4567")});
    auto sets = Extractor(loader).extractMatches(data);
    std::string missing = "no-such-directory/nested";
    assert(!QUtil::file_can_be_opened(missing.c_str()));

    Redactor::Options options;
    options.temp_dir = missing;
    Redactor::Details details;
    auto output = Redactor(loader).redact(data, sets, options, &details);
    assert(!details.locked);
    assert(log.find("permission lock failed: ") != std::string::npos);
    assert(log.find("555-123-4567") == std::string::npos);

    auto doc = loader->load(output, "output", false);
    assert(!doc.isEncrypted());
    assert(doc.getPageCount() == 1);
    assert(Extractor(loader).extractMatches(output).empty());
    // Nothing was left behind
    assert(!QUtil::file_can_be_opened(missing.c_str()));
}

int
main()
{
    test_overlay_content();
    test_strip();
    test_nesting();
    test_unbalanced_content();
    test_redact();
    test_lock();
    test_save_ladder();
    test_strip_failure();
    test_lock_failure();
    test_protected();
    test_errors();
    std::cout << "redactor tests passed" << std::endl;
    return 0;
}

#include <pdfredact/DocumentLoader.hh>

#include <pdfredact/RedactExc.hh>

#include <qpdf/QPDFExc.hh>
#include <qpdf/QPDFPageDocumentHelper.hh>

#include <cmath>
#include <mutex>
#include <stdexcept>

using namespace pdfredact;

Document::Members::Members(
    std::shared_ptr<std::string const> data,
    std::shared_ptr<QPDF> qpdf,
    std::shared_ptr<QPDF> source) :
    data(data),
    source(source),
    qpdf(qpdf)
{
}

Document::Document(
    std::shared_ptr<std::string const> data,
    std::shared_ptr<QPDF> qpdf,
    std::shared_ptr<QPDF> source) :
    m(new Members(data, qpdf, source))
{
    if (!(data && qpdf)) {
        throw std::logic_error("Document created without data or QPDF");
    }
}

QPDF&
Document::getQPDF() const
{
    return *m->qpdf;
}

std::string const&
Document::getData() const
{
    return *m->data;
}

bool
Document::isEncrypted() const
{
    return m->qpdf->isEncrypted();
}

bool
Document::isCopy() const
{
    return m->source != nullptr;
}

std::vector<QPDFPageObjectHelper>
Document::getAllPages() const
{
    return QPDFPageDocumentHelper(*m->qpdf).getAllPages();
}

int
Document::getPageCount() const
{
    return static_cast<int>(m->qpdf->getAllPages().size());
}

void
Document::getPageSize(QPDFPageObjectHelper page, double& width, double& height)
{
    auto box = page.getMediaBox().getArrayAsRectangle();
    width = std::fabs(box.urx - box.llx);
    height = std::fabs(box.ury - box.lly);
}

DocumentLoader::DocumentLoader(std::shared_ptr<QPDFLogger> logger) :
    logger(logger ? logger : QPDFLogger::defaultLogger())
{
}

std::shared_ptr<DocumentLoader>
DocumentLoader::instance()
{
    static std::once_flag once;
    static std::shared_ptr<DocumentLoader> loader;
    std::call_once(once, []() { loader = create(); });
    return loader;
}

std::shared_ptr<DocumentLoader>
DocumentLoader::create(std::shared_ptr<QPDFLogger> logger)
{
    return std::shared_ptr<DocumentLoader>(new DocumentLoader(logger));
}

void
DocumentLoader::setLogger(std::shared_ptr<QPDFLogger> l)
{
    this->logger = l ? l : QPDFLogger::defaultLogger();
}

std::shared_ptr<QPDFLogger>
DocumentLoader::getLogger() const
{
    return this->logger;
}

void
DocumentLoader::setVerbose(bool val)
{
    this->verbose = val;
}

bool
DocumentLoader::isVerbose() const
{
    return this->verbose;
}

void
DocumentLoader::info(std::string const& message) const
{
    if (this->verbose) {
        this->logger->info("pdfredact: " + message + "\n");
    }
}

void
DocumentLoader::warn(std::string const& message) const
{
    this->logger->warn("pdfredact: " + message + "\n");
}

std::shared_ptr<QPDF>
DocumentLoader::newQPDF() const
{
    auto qpdf = QPDF::create();
    qpdf->setLogger(this->logger);
    // libqpdf's warnings may quote document content; they are
    // collected and only counted.
    qpdf->setSuppressWarnings(true);
    return qpdf;
}

void
DocumentLoader::reportWarnings(QPDF& qpdf, std::string const& description) const
{
    auto n = qpdf.getWarnings().size();
    if (n > 0) {
        info(description + ": " + std::to_string(n) + " warning(s) while reading file");
    }
}

Document
DocumentLoader::load(
    std::string const& data, std::string const& description, bool tolerate_protection) const
{
    auto bytes = std::make_shared<std::string const>(data);
    auto qpdf = newQPDF();
    try {
        qpdf->processMemoryFile(description.c_str(), bytes->data(), bytes->size());
    } catch (QPDFExc& e) {
        if (e.getErrorCode() == qpdf_e_password) {
            throw RedactExc(
                pdfredact_e_protection, "password-protected, cannot process", e.getMessageDetail());
        }
        throw RedactExc(pdfredact_e_format, "unable to parse PDF", e.getMessageDetail());
    } catch (std::exception& e) {
        throw RedactExc(pdfredact_e_format, "unable to parse PDF", e.what());
    }
    if (qpdf->isEncrypted() && !tolerate_protection) {
        throw RedactExc(pdfredact_e_protection, "document is encrypted");
    }
    reportWarnings(*qpdf, description);
    return {bytes, qpdf};
}

pdfredact_protection_e
DocumentLoader::sniff(std::string const& data) const
{
    if (data.empty()) {
        throw RedactExc(pdfredact_e_input, "no PDF data provided");
    }
    if (data.size() < 5) {
        throw RedactExc(pdfredact_e_format, "file too small to be a valid PDF");
    }
    if (data.compare(0, 4, "%PDF") != 0) {
        throw RedactExc(pdfredact_e_format, "not a valid PDF file (missing PDF header)");
    }
    Document doc = load(data, "input file", true);
    try {
        doc.getPageCount();
    } catch (QPDFExc& e) {
        if (e.getErrorCode() == qpdf_e_password) {
            throw RedactExc(
                pdfredact_e_protection, "password-protected, cannot process", e.getMessageDetail());
        }
        throw RedactExc(pdfredact_e_format, "invalid or corrupted PDF file", e.getMessageDetail());
    } catch (std::exception& e) {
        throw RedactExc(pdfredact_e_format, "invalid or corrupted PDF file", e.what());
    }
    reportWarnings(doc.getQPDF(), "input file");
    return doc.isEncrypted() ? pdfredact_p_recoverable : pdfredact_p_none;
}

Document
DocumentLoader::copyPages(Document const& doc) const
{
    auto copy = newQPDF();
    copy->emptyPDF();
    QPDFPageDocumentHelper dh(*copy);
    for (auto& page: doc.getAllPages()) {
        dh.addPage(page, false);
    }
    return {doc.m->data, copy, doc.m->qpdf};
}

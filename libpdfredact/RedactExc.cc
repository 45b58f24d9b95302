#include <pdfredact/RedactExc.hh>

using namespace pdfredact;

RedactExc::RedactExc(
    pdfredact_error_code_e error_code,
    std::string const& message,
    std::string const& diagnostic) :
    std::runtime_error(createWhat(message, diagnostic)),
    error_code(error_code),
    message(message),
    diagnostic(diagnostic)
{
}

std::string
RedactExc::createWhat(std::string const& message, std::string const& diagnostic)
{
    std::string result = message;
    if (!diagnostic.empty()) {
        result += ": " + diagnostic;
    }
    return result;
}

pdfredact_error_code_e
RedactExc::getErrorCode() const
{
    return this->error_code;
}

std::string const&
RedactExc::getMessageDetail() const
{
    return this->message;
}

std::string const&
RedactExc::getDiagnostic() const
{
    return this->diagnostic;
}

std::string
RedactExc::getCategory() const
{
    switch (this->error_code) {
    case pdfredact_e_input:
        return "No PDF File";
    case pdfredact_e_size:
        return "File Too Large";
    case pdfredact_e_format:
        return "Invalid PDF File";
    case pdfredact_e_protection:
        return "PDF is Password Protected";
    case pdfredact_e_extraction:
        return "Cannot Read PDF";
    case pdfredact_e_validation:
        return "Output Validation Failed";
    case pdfredact_e_redaction:
    case pdfredact_e_success:
        break;
    }
    return "Processing Error";
}

std::string
RedactExc::getHint() const
{
    switch (this->error_code) {
    case pdfredact_e_input:
        return "Please provide a PDF file.";
    case pdfredact_e_size:
        return "The file exceeds the maximum allowed size. Please provide a smaller PDF file.";
    case pdfredact_e_format:
        return "The file appears to be corrupted or is not a valid PDF. "
               "Please try a different file.";
    case pdfredact_e_protection:
        return "This PDF is encrypted or password-protected and cannot be processed. "
               "Please remove the password protection using your PDF viewer "
               "(File > Properties > Security) or use a PDF unlocking tool, "
               "then try again.";
    case pdfredact_e_extraction:
        return "Unable to extract text from this PDF. It may be image-based (scanned) "
               "or use an unsupported format.";
    case pdfredact_e_validation:
        return "The redacted document did not pass structural verification and was "
               "not returned. Please try again or contact support if the issue persists.";
    case pdfredact_e_redaction:
    case pdfredact_e_success:
        break;
    }
    return "An error occurred while processing your PDF. Please try again or "
           "contact support if the issue persists.";
}

JSON
RedactExc::getJSON(bool include_details) const
{
    auto j = JSON::makeDictionary();
    j.addDictionaryMember("error", JSON::makeString(getCategory()));
    j.addDictionaryMember("message", JSON::makeString(getHint()));
    if (include_details) {
        j.addDictionaryMember("technicalDetails", JSON::makeString(what()));
    }
    return j;
}

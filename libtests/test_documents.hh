#ifndef TEST_DOCUMENTS_HH
#define TEST_DOCUMENTS_HH

// Small PDF files built in memory for the test programs. Every page
// has /F1 in its resources: Courier with WinAnsiEncoding and a width
// of 600 for every character from space through tilde, so a run of n
// characters at size s is n * 0.6 * s wide.

#include <qpdf/JSON.hh>

#include <string>
#include <vector>

namespace test_documents
{
    // "BT /F1 size Tf x y Td (text) Tj ET". text must not contain
    // unbalanced parentheses or backslashes.
    std::string show_text(double x, double y, double size, std::string const& text);

    // One page per entry of contents
    std::string
    make_pdf(std::vector<std::string> const& contents, double width = 612, double height = 792);

    // As make_pdf, encrypted with AES-256 and all permissions allowed
    std::string make_encrypted_pdf(
        std::vector<std::string> const& contents,
        char const* user_password,
        char const* owner_password);

    // A single page whose content stream is content labeled as
    // /FlateDecode without being compressed, so it cannot be decoded
    std::string make_undecodable_pdf(std::string const& content);

    // A single page whose content is page_content. The page's
    // resources name one form XObject, /Fm1, with form_content as its
    // content and form_matrix (six numbers) as its /Matrix. If
    // self_reference is true, the form's own resources list it as
    // /Fm1 again.
    std::string make_form_pdf(
        std::string const& page_content,
        std::string const& form_content,
        std::string const& form_matrix,
        bool self_reference = false);

    // Member key of the JSON dictionary j; null if j has no such key
    JSON json_member(JSON const& j, std::string const& key);
    long long json_int(JSON const& j, std::string const& key);
    std::string json_string(JSON const& j, std::string const& key);
    bool json_bool(JSON const& j, std::string const& key);
    bool json_has(JSON const& j, std::string const& key);
    std::vector<JSON> json_items(JSON const& array);
} // namespace test_documents

#endif // TEST_DOCUMENTS_HH

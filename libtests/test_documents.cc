#include "test_documents.hh"

#include <qpdf/Buffer.hh>
#include <qpdf/QPDF.hh>
#include <qpdf/QPDFObjectHandle.hh>
#include <qpdf/QPDFPageDocumentHelper.hh>
#include <qpdf/QPDFWriter.hh>
#include <qpdf/QUtil.hh>

#include <stdexcept>

static std::string
num(double d)
{
    return QUtil::double_to_string(d, 2);
}

static QPDFObjectHandle
courier(QPDF& pdf)
{
    auto font = pdf.makeIndirectObject(
        // line-break
        "<<"
        " /Type /Font"
        " /Subtype /Type1"
        " /BaseFont /Courier"
        " /Encoding /WinAnsiEncoding"
        " /FirstChar 32"
        " /LastChar 126"
        ">>"_qpdf);
    auto widths = QPDFObjectHandle::newArray();
    for (int i = 32; i <= 126; ++i) {
        widths.appendItem(QPDFObjectHandle::newInteger(600));
    }
    font.replaceKey("/Widths", widths);
    return font;
}

static QPDFObjectHandle
new_page(QPDF& pdf, QPDFObjectHandle resources, std::string const& content, double w, double h)
{
    auto page = pdf.makeIndirectObject("<< /Type /Page >>"_qpdf);
    page.replaceKey("/MediaBox", QPDFObjectHandle::newFromRectangle({0, 0, w, h}));
    page.replaceKey("/Contents", pdf.newStream(content));
    page.replaceKey("/Resources", resources);
    return page;
}

static QPDFObjectHandle
font_resources(QPDFObjectHandle font)
{
    auto rfont = QPDFObjectHandle::newDictionary();
    rfont.replaceKey("/F1", font);
    auto resources = QPDFObjectHandle::newDictionary();
    resources.replaceKey("/Font", rfont);
    return resources;
}

static std::string
write(
    QPDF& pdf,
    char const* user_password = nullptr,
    char const* owner_password = nullptr,
    bool decode = true)
{
    QPDFWriter w(pdf);
    w.setOutputMemory();
    if (!decode) {
        w.setDecodeLevel(qpdf_dl_none);
    }
    if (user_password) {
        w.setR6EncryptionParameters(
            user_password,
            owner_password,
            true,
            true,
            true,
            true,
            true,
            true,
            qpdf_r3p_full,
            true);
    } else {
        w.setStaticID(true);
    }
    w.write();
    auto buf = w.getBufferSharedPointer();
    return std::string(reinterpret_cast<char const*>(buf->getBuffer()), buf->getSize());
}

static void
add_pages(QPDF& pdf, std::vector<std::string> const& contents, double width, double height)
{
    QPDFPageDocumentHelper dh(pdf);
    auto font = courier(pdf);
    for (auto const& content: contents) {
        dh.addPage(new_page(pdf, font_resources(font), content, width, height), false);
    }
}

std::string
test_documents::show_text(double x, double y, double size, std::string const& text)
{
    return (
        "BT /F1 " + num(size) + " Tf " + num(x) + " " + num(y) + " Td (" + text + ") Tj ET\n");
}

std::string
test_documents::make_pdf(std::vector<std::string> const& contents, double width, double height)
{
    QPDF pdf;
    pdf.emptyPDF();
    add_pages(pdf, contents, width, height);
    return write(pdf);
}

std::string
test_documents::make_encrypted_pdf(
    std::vector<std::string> const& contents,
    char const* user_password,
    char const* owner_password)
{
    QPDF pdf;
    pdf.emptyPDF();
    add_pages(pdf, contents, 612, 792);
    return write(pdf, user_password, owner_password);
}

std::string
test_documents::make_undecodable_pdf(std::string const& content)
{
    QPDF pdf;
    pdf.emptyPDF();
    add_pages(pdf, {""}, 612, 792);
    auto page = QPDFPageDocumentHelper(pdf).getAllPages().at(0);
    page.getObjectHandle().getKey("/Contents").replaceStreamData(
        content, "/FlateDecode"_qpdf, QPDFObjectHandle::newNull());
    // Copy the stream as is rather than trying to decode it
    return write(pdf, nullptr, nullptr, false);
}

std::string
test_documents::make_form_pdf(
    std::string const& page_content,
    std::string const& form_content,
    std::string const& form_matrix,
    bool self_reference)
{
    QPDF pdf;
    pdf.emptyPDF();
    auto font = courier(pdf);

    auto form = pdf.newStream(form_content);
    auto dict = form.getDict();
    dict.replaceKey("/Type", QPDFObjectHandle::newName("/XObject"));
    dict.replaceKey("/Subtype", QPDFObjectHandle::newName("/Form"));
    dict.replaceKey("/BBox", "[0 0 612 792]"_qpdf);
    dict.replaceKey("/Matrix", QPDFObjectHandle::parse("[" + form_matrix + "]"));
    auto form_resources = font_resources(font);
    if (self_reference) {
        auto xobject = QPDFObjectHandle::newDictionary();
        xobject.replaceKey("/Fm1", form);
        form_resources.replaceKey("/XObject", xobject);
    }
    dict.replaceKey("/Resources", form_resources);

    auto xobject = QPDFObjectHandle::newDictionary();
    xobject.replaceKey("/Fm1", form);
    auto resources = font_resources(font);
    resources.replaceKey("/XObject", xobject);
    QPDFPageDocumentHelper(pdf).addPage(new_page(pdf, resources, page_content, 612, 792), false);
    return write(pdf);
}

JSON
test_documents::json_member(JSON const& j, std::string const& key)
{
    JSON result = JSON::makeNull();
    j.forEachDictItem([&result, &key](std::string const& k, JSON value) {
        if (k == key) {
            result = value;
        }
    });
    return result;
}

bool
test_documents::json_has(JSON const& j, std::string const& key)
{
    bool found = false;
    j.forEachDictItem([&found, &key](std::string const& k, JSON) {
        if (k == key) {
            found = true;
        }
    });
    return found;
}

long long
test_documents::json_int(JSON const& j, std::string const& key)
{
    std::string value;
    if (!json_member(j, key).getNumber(value)) {
        throw std::logic_error(key + " is not a number");
    }
    return QUtil::string_to_ll(value.c_str());
}

std::string
test_documents::json_string(JSON const& j, std::string const& key)
{
    std::string value;
    if (!json_member(j, key).getString(value)) {
        throw std::logic_error(key + " is not a string");
    }
    return value;
}

bool
test_documents::json_bool(JSON const& j, std::string const& key)
{
    bool value = false;
    if (!json_member(j, key).getBool(value)) {
        throw std::logic_error(key + " is not a boolean");
    }
    return value;
}

std::vector<JSON>
test_documents::json_items(JSON const& array)
{
    std::vector<JSON> result;
    if (!array.forEachArrayItem([&result](JSON value) { result.push_back(value); })) {
        throw std::logic_error("not an array");
    }
    return result;
}

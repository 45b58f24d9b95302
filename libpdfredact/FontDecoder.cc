#include <pdfredact/FontDecoder.hh>

#include <qpdf/BufferInputSource.hh>
#include <qpdf/QPDFTokenizer.hh>
#include <qpdf/QUtil.hh>

#include <algorithm>
#include <memory>
#include <stdexcept>

using namespace pdfredact;

// Ranges in malformed CMaps and width arrays can be arbitrarily
// large.
static unsigned long const max_range = 0xffff;

static unsigned long
code_value(std::string const& bytes)
{
    unsigned long code = 0;
    size_t start = (bytes.length() > 4) ? bytes.length() - 4 : 0;
    for (size_t i = start; i < bytes.length(); ++i) {
        code = (code << 8) | static_cast<unsigned char>(bytes.at(i));
    }
    return code;
}

static std::string
dest_to_utf8(std::string const& dest)
{
    if (dest.length() == 1) {
        return QUtil::toUTF8(static_cast<unsigned char>(dest.at(0)));
    }
    return QUtil::utf16_to_utf8(dest);
}

static void
increment_dest(std::string& dest)
{
    for (size_t i = dest.length(); i > 0; --i) {
        auto& ch = dest.at(i - 1);
        ch = static_cast<char>(static_cast<unsigned char>(ch) + 1);
        if (ch != 0) {
            break;
        }
    }
}

FontDecoder::ToUnicode
FontDecoder::ToUnicode::parse(std::string const& cmap)
{
    ToUnicode result;
    auto input = std::shared_ptr<InputSource>(new BufferInputSource("ToUnicode CMap", cmap));
    QPDFTokenizer tokenizer;
    tokenizer.allowEOF();

    enum { st_top, st_codespace, st_bfchar, st_bfrange } state = st_top;
    std::vector<std::string> strings;
    std::vector<std::string> array;
    bool in_array = false;

    while (true) {
        auto token = tokenizer.readToken(input, "ToUnicode CMap", true);
        auto type = token.getType();
        if (type == QPDFTokenizer::tt_eof) {
            break;
        } else if (type == QPDFTokenizer::tt_word) {
            auto const& word = token.getValue();
            strings.clear();
            in_array = false;
            if (word == "begincodespacerange") {
                state = st_codespace;
            } else if (word == "beginbfchar") {
                state = st_bfchar;
            } else if (word == "beginbfrange") {
                state = st_bfrange;
            } else if (word.substr(0, 3) == "end") {
                state = st_top;
            }
        } else if (type == QPDFTokenizer::tt_string) {
            if (in_array) {
                array.push_back(token.getValue());
                continue;
            }
            strings.push_back(token.getValue());
            if ((state == st_codespace) && (strings.size() == 2)) {
                auto const& low = strings.at(0);
                if ((low.length() > 0) && (low.length() <= 4)) {
                    result.code_spaces.push_back(
                        {low.length(), code_value(low), code_value(strings.at(1))});
                }
                strings.clear();
            } else if ((state == st_bfchar) && (strings.size() == 2)) {
                result.mappings[code_value(strings.at(0))] = dest_to_utf8(strings.at(1));
                strings.clear();
            } else if ((state == st_bfrange) && (strings.size() == 3)) {
                result.addRange(strings.at(0), strings.at(1), strings.at(2));
                strings.clear();
            } else if (state == st_top) {
                strings.clear();
            }
        } else if (type == QPDFTokenizer::tt_array_open) {
            if ((state == st_bfrange) && (strings.size() == 2)) {
                in_array = true;
                array.clear();
            }
        } else if (type == QPDFTokenizer::tt_array_close) {
            if (in_array) {
                unsigned long low = code_value(strings.at(0));
                unsigned long high = code_value(strings.at(1));
                for (size_t i = 0; (i < array.size()) && (low + i <= high); ++i) {
                    result.mappings[low + i] = dest_to_utf8(array.at(i));
                }
                in_array = false;
                strings.clear();
            }
        }
    }
    return result;
}

void
FontDecoder::ToUnicode::addRange(
    std::string const& low, std::string const& high, std::string const& dest)
{
    unsigned long first = code_value(low);
    unsigned long last = code_value(high);
    if ((last < first) || (last - first > max_range)) {
        return;
    }
    std::string d = dest;
    for (unsigned long code = first; code <= last; ++code) {
        this->mappings[code] = dest_to_utf8(d);
        increment_dest(d);
    }
}

size_t
FontDecoder::ToUnicode::codeLength(std::string const& data, size_t offset) const
{
    for (auto const& cs: this->code_spaces) {
        if (offset + cs.nbytes > data.length()) {
            continue;
        }
        unsigned long code = code_value(data.substr(offset, cs.nbytes));
        if ((code >= cs.low) && (code <= cs.high)) {
            return cs.nbytes;
        }
    }
    return 0;
}

bool
FontDecoder::ToUnicode::lookup(unsigned long code, std::string& utf8) const
{
    auto iter = this->mappings.find(code);
    if (iter == this->mappings.end()) {
        return false;
    }
    utf8 = iter->second;
    return true;
}

FontDecoder::FontDecoder() = default;

FontDecoder::FontDecoder(QPDFObjectHandle font)
{
    if (!font.isDictionary()) {
        return;
    }
    auto subtype = font.getKey("/Subtype");
    this->composite = subtype.isNameAndEquals("/Type0");

    auto tu = font.getKey("/ToUnicode");
    if (tu.isStream()) {
        try {
            auto buf = tu.getStreamData(qpdf_dl_generalized);
            this->to_unicode = ToUnicode::parse(
                std::string(reinterpret_cast<char const*>(buf->getBuffer()), buf->getSize()));
        } catch (std::runtime_error&) {
            // Unreadable CMap; text falls back to the encoding
            this->to_unicode = ToUnicode();
        }
    }

    if (this->composite) {
        auto descendants = font.getKey("/DescendantFonts");
        if (descendants.isArray() && (descendants.getArrayNItems() > 0)) {
            loadCompositeWidths(descendants.getArrayItem(0));
        } else {
            this->missing_width = 1000.0;
        }
        return;
    }

    auto encoding = font.getKey("/Encoding");
    if (encoding.isDictionary()) {
        encoding = encoding.getKey("/BaseEncoding");
    }
    if (encoding.isNameAndEquals("/WinAnsiEncoding")) {
        this->encoding = e_win_ansi;
    } else if (encoding.isNameAndEquals("/MacRomanEncoding")) {
        this->encoding = e_mac_roman;
    }
    if (subtype.isNameAndEquals("/Type3")) {
        auto fm = font.getKey("/FontMatrix");
        double scale = 0.0;
        if (fm.isArray() && (fm.getArrayNItems() == 6) &&
            fm.getArrayItem(0).getValueAsNumber(scale)) {
            this->width_scale = scale;
        }
    }
    loadSimpleWidths(font);
}

void
FontDecoder::loadSimpleWidths(QPDFObjectHandle font)
{
    auto first_char = font.getKey("/FirstChar");
    auto w = font.getKey("/Widths");
    if (first_char.isInteger() && w.isArray()) {
        long long first = first_char.getIntValue();
        int n = w.getArrayNItems();
        for (int i = 0; i < n; ++i) {
            double width = 0.0;
            if ((first + i >= 0) && w.getArrayItem(i).getValueAsNumber(width)) {
                this->widths[static_cast<unsigned long>(first + i)] = width;
            }
        }
    }
    auto descriptor = font.getKey("/FontDescriptor");
    if (descriptor.isDictionary()) {
        double width = 0.0;
        if (descriptor.getKey("/MissingWidth").getValueAsNumber(width)) {
            this->missing_width = width;
        }
    }
}

void
FontDecoder::loadCompositeWidths(QPDFObjectHandle descendant)
{
    this->missing_width = 1000.0;
    if (!descendant.isDictionary()) {
        return;
    }
    double width = 0.0;
    if (descendant.getKey("/DW").getValueAsNumber(width)) {
        this->missing_width = width;
    }
    auto w = descendant.getKey("/W");
    if (!w.isArray()) {
        return;
    }
    // Entries are either "c [w1 w2 ...]" or "c_first c_last w".
    auto items = w.getArrayAsVector();
    size_t i = 0;
    while ((i + 1 < items.size()) && items.at(i).isInteger()) {
        long long first = items.at(i).getIntValue();
        if (first < 0) {
            break;
        }
        auto code = static_cast<unsigned long>(first);
        if (items.at(i + 1).isArray()) {
            auto ws = items.at(i + 1).getArrayAsVector();
            for (size_t j = 0; (j < ws.size()) && (j <= max_range); ++j) {
                if (ws.at(j).getValueAsNumber(width)) {
                    this->widths[code + j] = width;
                }
            }
            i += 2;
        } else if ((i + 2 < items.size()) && items.at(i + 1).isInteger()) {
            long long last = items.at(i + 1).getIntValue();
            if ((last < first) || (last - first > static_cast<long long>(max_range)) ||
                !items.at(i + 2).getValueAsNumber(width)) {
                break;
            }
            for (auto c = code; c <= static_cast<unsigned long>(last); ++c) {
                this->widths[c] = width;
            }
            i += 3;
        } else {
            break;
        }
    }
}

double
FontDecoder::glyphWidth(unsigned long code) const
{
    auto iter = this->widths.find(code);
    return (iter == this->widths.end()) ? this->missing_width : iter->second;
}

std::string
FontDecoder::fallbackText(unsigned long code) const
{
    std::string ch(1, static_cast<char>(code & 0xff));
    switch (this->encoding) {
    case e_win_ansi:
        return QUtil::win_ansi_to_utf8(ch);
    case e_mac_roman:
        return QUtil::mac_roman_to_utf8(ch);
    case e_pdf_doc:
        break;
    }
    return QUtil::pdf_doc_to_utf8(ch);
}

std::vector<FontDecoder::Glyph>
FontDecoder::decode(std::string const& bytes) const
{
    std::vector<Glyph> result;
    size_t i = 0;
    while (i < bytes.length()) {
        size_t n = 1;
        if (this->composite) {
            n = this->to_unicode.codeLength(bytes, i);
            if (n == 0) {
                n = 2;
            }
        }
        n = std::min(n, bytes.length() - i);
        unsigned long code = code_value(bytes.substr(i, n));
        Glyph glyph;
        if (!this->to_unicode.lookup(code, glyph.text) && !this->composite) {
            glyph.text = fallbackText(code);
        }
        glyph.width = glyphWidth(code) * this->width_scale;
        glyph.is_space = ((n == 1) && (code == 32));
        result.push_back(glyph);
        i += n;
    }
    return result;
}

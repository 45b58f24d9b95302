#include <pdfredact/assert_test.h>

#include <pdfredact/FontDecoder.hh>

#include <qpdf/QPDF.hh>
#include <qpdf/QPDFObjectHandle.hh>

#include <cmath>
#include <iostream>

using namespace pdfredact;

static std::string const cmap = "/CIDInit /ProcSet findresource begin\n"
                                "12 dict begin\n"
                                "begincmap\n"
                                "1 begincodespacerange\n"
                                "<0000> <FFFF>\n"
                                "endcodespacerange\n"
                                "2 beginbfchar\n"
                                "<0003> <0020>\n"
                                "<0024> <0041>\n"
                                "endbfchar\n"
                                "2 beginbfrange\n"
                                "<0010> <0012> <0061>\n"
                                "<0020> <0021> [<0078> <0079>]\n"
                                "endbfrange\n"
                                "endcmap\n"
                                "CMapName currentdict /CMap defineresource pop\n"
                                "end\n"
                                "end\n";

static bool
near(double a, double b)
{
    return std::fabs(a - b) < 1e-9;
}

static std::string
text_of(std::vector<FontDecoder::Glyph> const& glyphs)
{
    std::string result;
    for (auto const& g: glyphs) {
        result += g.text;
    }
    return result;
}

static void
test_to_unicode()
{
    auto tu = FontDecoder::ToUnicode::parse(cmap);
    assert(tu.size() == 7);
    std::string utf8;
    assert(tu.lookup(0x24, utf8) && (utf8 == "A"));
    assert(tu.lookup(0x03, utf8) && (utf8 == " "));
    assert(tu.lookup(0x11, utf8) && (utf8 == "b"));
    assert(tu.lookup(0x12, utf8) && (utf8 == "c"));
    assert(tu.lookup(0x21, utf8) && (utf8 == "y"));
    assert(!tu.lookup(0x13, utf8));
    assert(tu.codeLength(std::string("\x00\x24", 2), 0) == 2);
    // Not enough bytes left for a two-byte code
    assert(tu.codeLength(std::string("\x00", 1), 0) == 0);

    // Garbage yields an empty map rather than an exception
    assert(FontDecoder::ToUnicode::parse("beginbfchar <00> endbfrange ]").empty());
    // Oversized ranges are ignored
    auto big =
        FontDecoder::ToUnicode::parse("beginbfrange <00000000> <7FFFFFFF> <0041> endbfrange");
    assert(big.empty());
}

static void
test_simple(QPDF& pdf)
{
    FontDecoder none;
    assert(!none.isComposite());
    auto glyphs = none.decode("abc");
    assert(glyphs.size() == 3);
    assert(text_of(glyphs) == "abc");
    assert(near(glyphs.at(0).width, FontDecoder::default_width / 1000.0));

    auto courier = QPDFObjectHandle::parse(
        "<< /Type /Font /Subtype /Type1 /BaseFont /Courier"
        " /Encoding /WinAnsiEncoding /FirstChar 32 /Widths [600 600 600] >>");
    FontDecoder wa(courier);
    glyphs = wa.decode(std::string("! \x80z"));
    assert(glyphs.size() == 4);
    assert(glyphs.at(0).text == "!");
    assert(near(glyphs.at(0).width, 0.6));
    assert(!glyphs.at(0).is_space);
    assert(glyphs.at(1).is_space);
    assert(glyphs.at(2).text == "\xe2\x82\xac");
    // Outside of /Widths
    assert(near(glyphs.at(3).width, 0.5));

    auto missing = QPDFObjectHandle::parse(
        "<< /Type /Font /Subtype /TrueType /FirstChar 65 /Widths [700]"
        " /FontDescriptor << /MissingWidth 300 >> >>");
    glyphs = FontDecoder(missing).decode("AB");
    assert(near(glyphs.at(0).width, 0.7));
    assert(near(glyphs.at(1).width, 0.3));

    auto type3 = QPDFObjectHandle::parse(
        "<< /Type /Font /Subtype /Type3 /FontMatrix [0.01 0 0 0.01 0 0]"
        " /FirstChar 65 /Widths [50] >>");
    glyphs = FontDecoder(type3).decode("A");
    assert(near(glyphs.at(0).width, 0.5));

    // A simple font with a ToUnicode map prefers the map
    auto tu = pdf.newStream("beginbfchar <41> <0058> endbfchar");
    auto mapped = QPDFObjectHandle::parse("<< /Type /Font /Subtype /Type1 >>");
    mapped.replaceKey("/ToUnicode", tu);
    assert(text_of(FontDecoder(mapped).decode("AB")) == "XB");
}

static void
test_composite(QPDF& pdf)
{
    auto font = QPDFObjectHandle::parse(
        "<< /Type /Font /Subtype /Type0 /Encoding /Identity-H"
        " /DescendantFonts [<< /Type /Font /Subtype /CIDFontType2"
        " /W [36 [500] 3 3 250] >>] >>");
    font.replaceKey("/ToUnicode", pdf.newStream(cmap));
    FontDecoder decoder(font);
    assert(decoder.isComposite());
    auto glyphs = decoder.decode(std::string("\x00\x24\x00\x03\x00\x10\x00\x50", 8));
    assert(glyphs.size() == 4);
    assert(text_of(glyphs) == "A a");
    assert(near(glyphs.at(0).width, 0.5));
    assert(near(glyphs.at(1).width, 0.25));
    // Only single-byte code 32 is a word space
    assert(!glyphs.at(1).is_space);
    // /DW defaults to 1000
    assert(near(glyphs.at(3).width, 1.0));
    assert(glyphs.at(3).text.empty());

    // No descendant fonts and no ToUnicode: two-byte codes, no text
    FontDecoder bare(QPDFObjectHandle::parse("<< /Type /Font /Subtype /Type0 >>"));
    glyphs = bare.decode(std::string("\x00\x41\x00", 3));
    assert(glyphs.size() == 2);
    assert(near(glyphs.at(0).width, 1.0));
    assert(text_of(glyphs).empty());
}

int
main()
{
    QPDF pdf;
    pdf.emptyPDF();
    test_to_unicode();
    test_simple(pdf);
    test_composite(pdf);
    std::cout << "font decoder tests passed" << std::endl;
    return 0;
}

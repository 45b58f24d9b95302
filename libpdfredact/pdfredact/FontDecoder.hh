#ifndef FONTDECODER_HH
#define FONTDECODER_HH

#include <qpdf/QPDFObjectHandle.hh>

#include <map>
#include <string>
#include <vector>

namespace pdfredact
{
    // Turns the bytes of a string operand of a text-showing operator
    // into glyphs with Unicode text and horizontal advance. Text comes
    // from the font's /ToUnicode CMap when there is one. Simple fonts
    // without a mapping fall back to their base encoding, and
    // unmapped codes of composite fonts produce no text. Widths are in
    // text space units per unit of font size.
    class FontDecoder
    {
      public:
        struct Glyph
        {
            std::string text;
            double width{0.0};
            // Single-byte code 32, to which word spacing applies
            bool is_space{false};
        };

        // A ToUnicode CMap reduced to what is needed for decoding
        class ToUnicode
        {
          public:
            struct CodeSpace
            {
                size_t nbytes;
                unsigned long low;
                unsigned long high;
            };

            static ToUnicode parse(std::string const& cmap);

            // Number of bytes in the code at the start of data, or 0 if
            // no code space range matches.
            size_t codeLength(std::string const& data, size_t offset) const;
            bool lookup(unsigned long code, std::string& utf8) const;
            bool
            empty() const
            {
                return mappings.empty();
            }
            size_t
            size() const
            {
                return mappings.size();
            }

          private:
            void addRange(
                std::string const& low,
                std::string const& high,
                std::string const& dest);

            std::vector<CodeSpace> code_spaces;
            std::map<unsigned long, std::string> mappings;
        };

        // Used when a font resource is missing: one byte per code,
        // PDFDocEncoding, default widths.
        FontDecoder();
        explicit FontDecoder(QPDFObjectHandle font);

        std::vector<Glyph> decode(std::string const& bytes) const;

        bool
        isComposite() const
        {
            return composite;
        }

        static constexpr double default_width = 500.0;

      private:
        enum encoding_e { e_pdf_doc, e_win_ansi, e_mac_roman };

        void loadSimpleWidths(QPDFObjectHandle font);
        void loadCompositeWidths(QPDFObjectHandle descendant);
        double glyphWidth(unsigned long code) const;
        std::string fallbackText(unsigned long code) const;

        bool composite{false};
        encoding_e encoding{e_pdf_doc};
        ToUnicode to_unicode;
        std::map<unsigned long, double> widths;
        double missing_width{default_width};
        // Glyph space to text space
        double width_scale{0.001};
    };
} // namespace pdfredact

#endif // FONTDECODER_HH

#ifndef TEXTSTRIPPER_HH
#define TEXTSTRIPPER_HH

#include <qpdf/QPDFObjectHandle.hh>

#include <deque>
#include <string>
#include <vector>

namespace pdfredact
{
    // Removes every occurrence of each target from the string operands
    // of Tj, TJ, ', and ". Strings are compared byte for byte, so
    // only text drawn with fonts whose codes coincide with the
    // target's bytes is affected. All other tokens pass through
    // unchanged. Nesting of q and Q is recorded along the way.
    class TextStripper: public QPDFObjectHandle::TokenFilter
    {
      public:
        TextStripper(std::vector<std::string> const& targets);
        ~TextStripper() override = default;
        void handleToken(QPDFTokenizer::Token const&) override;
        void handleEOF() override;

        // Number of occurrences removed so far
        size_t getStripCount() const;

        // Q operators seen with no q of their own in the content so far
        int getUnmatchedRestores() const;
        // q operators the content leaves open, counting from after the
        // saves needed for the unmatched restores
        int getOpenSaves() const;

      private:
        static bool isShowText(QPDFTokenizer::Token const&);
        void flush(bool strip_strings);
        std::string strip(std::string value);

        std::vector<std::string> targets;
        // Tokens since the last operator
        std::deque<QPDFTokenizer::Token> pending;
        size_t strip_count;
        int depth;
        int min_depth;
    };
} // namespace pdfredact

#endif // TEXTSTRIPPER_HH

#include <pdfredact/TextStripper.hh>

using namespace pdfredact;

TextStripper::TextStripper(std::vector<std::string> const& targets) :
    strip_count(0),
    depth(0),
    min_depth(0)
{
    for (auto const& t: targets) {
        if (!t.empty()) {
            this->targets.push_back(t);
        }
    }
}

size_t
TextStripper::getStripCount() const
{
    return this->strip_count;
}

int
TextStripper::getUnmatchedRestores() const
{
    return -this->min_depth;
}

int
TextStripper::getOpenSaves() const
{
    return this->depth - this->min_depth;
}

bool
TextStripper::isShowText(QPDFTokenizer::Token const& token)
{
    return (
        token.isWord("Tj") || token.isWord("TJ") || token.isWord("'") || token.isWord("\""));
}

std::string
TextStripper::strip(std::string value)
{
    for (auto const& target: this->targets) {
        size_t pos = 0;
        while ((pos = value.find(target, pos)) != std::string::npos) {
            value.erase(pos, target.length());
            ++this->strip_count;
        }
    }
    return value;
}

void
TextStripper::flush(bool strip_strings)
{
    for (auto const& token: this->pending) {
        if (strip_strings && (token.getType() == QPDFTokenizer::tt_string)) {
            auto before = this->strip_count;
            auto value = strip(token.getValue());
            if (this->strip_count != before) {
                writeToken(QPDFTokenizer::Token(QPDFTokenizer::tt_string, value));
                continue;
            }
        }
        writeToken(token);
    }
    this->pending.clear();
}

void
TextStripper::handleToken(QPDFTokenizer::Token const& token)
{
    // Operands are held until their operator is seen. Only then is it
    // known whether string operands are text to be shown.
    if (token.getType() == QPDFTokenizer::tt_word) {
        if (token.isWord("q")) {
            ++this->depth;
        } else if (token.isWord("Q")) {
            --this->depth;
            if (this->depth < this->min_depth) {
                this->min_depth = this->depth;
            }
        }
        flush(isShowText(token));
        writeToken(token);
    } else {
        this->pending.push_back(token);
    }
}

void
TextStripper::handleEOF()
{
    flush(false);
}

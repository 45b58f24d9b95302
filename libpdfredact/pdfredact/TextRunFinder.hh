#ifndef TEXTRUNFINDER_HH
#define TEXTRUNFINDER_HH

#include <pdfredact/FontDecoder.hh>
#include <pdfredact/Types.hh>

#include <qpdf/QPDFMatrix.hh>
#include <qpdf/QPDFObjGen.hh>
#include <qpdf/QPDFObjectHandle.hh>
#include <qpdf/QPDFPageObjectHelper.hh>

#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace pdfredact
{
    // Follows the graphics and text state through a content stream and
    // records a TextRun for every text-showing operator. Form XObjects
    // are followed with their /Matrix applied.
    class TextRunFinder: public QPDFObjectHandle::ParserCallbacks
    {
      public:
        static size_t const max_form_depth = 10;

        // Graphics state parameters that matter for text placement
        struct State
        {
            QPDFMatrix ctm;
            std::shared_ptr<FontDecoder> font;
            double font_size{0.0};
            double char_spacing{0.0};
            double word_spacing{0.0};
            double horizontal_scale{1.0};
            double leading{0.0};
            double rise{0.0};
        };

        // All runs on the page in content stream order
        static std::vector<TextRun> findRuns(QPDFPageObjectHelper page);

        // Six numeric operands, as given to cm or Tm or found in a
        // form's /Matrix. Returns false, leaving m alone, if there are
        // not exactly six numbers.
        static bool
        matrixFromOperands(std::vector<QPDFObjectHandle> const& operands, QPDFMatrix& m);

        // Length of the unit vertical vector after transformation by m
        static double verticalScale(QPDFMatrix const& m);

        TextRunFinder(
            QPDFObjectHandle resources,
            State const& state,
            std::vector<TextRun>& runs,
            std::set<QPDFObjGen>& active_forms,
            size_t depth);
        ~TextRunFinder() override = default;

        void handleObject(QPDFObjectHandle, size_t offset, size_t length) override;
        void handleEOF() override;

      private:
        void handleOperator(std::string const& op);
        bool numericOperand(size_t index, double& value);
        void moveLine(double tx, double ty);
        void nextLine();
        void showText(std::vector<QPDFObjectHandle> items);
        void selectFont(std::string const& name);
        void invokeXObject(std::string const& name);
        QPDFMatrix renderingMatrix() const;

        QPDFObjectHandle resources;
        std::vector<TextRun>& runs;
        std::set<QPDFObjGen>& active_forms;
        size_t depth;

        State state;
        std::vector<State> state_stack;
        QPDFMatrix tm;
        QPDFMatrix tlm;
        std::vector<QPDFObjectHandle> operands;
        std::map<std::string, std::shared_ptr<FontDecoder>> fonts;
    };
} // namespace pdfredact

#endif // TEXTRUNFINDER_HH

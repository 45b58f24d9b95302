#include <pdfredact/TextRunFinder.hh>

#include <cmath>

using namespace pdfredact;

TextRunFinder::TextRunFinder(
    QPDFObjectHandle resources,
    State const& state,
    std::vector<TextRun>& runs,
    std::set<QPDFObjGen>& active_forms,
    size_t depth) :
    resources(resources),
    runs(runs),
    active_forms(active_forms),
    depth(depth),
    state(state)
{
}

std::vector<TextRun>
TextRunFinder::findRuns(QPDFPageObjectHelper page)
{
    std::vector<TextRun> runs;
    std::set<QPDFObjGen> active_forms;
    TextRunFinder finder(page.getAttribute("/Resources", false), State(), runs, active_forms, 0);
    page.parseContents(&finder);
    return runs;
}

bool
TextRunFinder::matrixFromOperands(std::vector<QPDFObjectHandle> const& operands, QPDFMatrix& m)
{
    if (operands.size() != 6) {
        return false;
    }
    double v[6];
    for (size_t i = 0; i < 6; ++i) {
        QPDFObjectHandle oh = operands.at(i);
        if (!oh.getValueAsNumber(v[i])) {
            return false;
        }
    }
    m = QPDFMatrix(v[0], v[1], v[2], v[3], v[4], v[5]);
    return true;
}

double
TextRunFinder::verticalScale(QPDFMatrix const& m)
{
    return std::hypot(m.c, m.d);
}

void
TextRunFinder::handleObject(QPDFObjectHandle obj, size_t, size_t)
{
    if (!obj.isOperator()) {
        this->operands.push_back(obj);
        return;
    }
    handleOperator(obj.getOperatorValue());
    this->operands.clear();
}

void
TextRunFinder::handleEOF()
{
}

bool
TextRunFinder::numericOperand(size_t index, double& value)
{
    return (index < this->operands.size()) && this->operands.at(index).getValueAsNumber(value);
}

QPDFMatrix
TextRunFinder::renderingMatrix() const
{
    QPDFMatrix trm = this->state.ctm;
    trm.concat(this->tm);
    trm.concat(QPDFMatrix(
        this->state.font_size * this->state.horizontal_scale,
        0,
        0,
        this->state.font_size,
        0,
        this->state.rise));
    return trm;
}

void
TextRunFinder::moveLine(double tx, double ty)
{
    this->tlm.translate(tx, ty);
    this->tm = this->tlm;
}

void
TextRunFinder::nextLine()
{
    moveLine(0, -this->state.leading);
}

void
TextRunFinder::handleOperator(std::string const& op)
{
    double v1 = 0.0;
    double v2 = 0.0;
    if (op == "q") {
        this->state_stack.push_back(this->state);
    } else if (op == "Q") {
        if (!this->state_stack.empty()) {
            this->state = this->state_stack.back();
            this->state_stack.pop_back();
        }
    } else if (op == "cm") {
        QPDFMatrix m;
        if (matrixFromOperands(this->operands, m)) {
            this->state.ctm.concat(m);
        }
    } else if (op == "BT") {
        this->tm = QPDFMatrix();
        this->tlm = QPDFMatrix();
    } else if (op == "Tf") {
        if ((this->operands.size() == 2) && this->operands.at(0).isName() &&
            numericOperand(1, v1)) {
            selectFont(this->operands.at(0).getName());
            this->state.font_size = v1;
        }
    } else if (op == "Tc") {
        if (numericOperand(0, v1)) {
            this->state.char_spacing = v1;
        }
    } else if (op == "Tw") {
        if (numericOperand(0, v1)) {
            this->state.word_spacing = v1;
        }
    } else if (op == "Tz") {
        if (numericOperand(0, v1)) {
            this->state.horizontal_scale = v1 / 100.0;
        }
    } else if (op == "TL") {
        if (numericOperand(0, v1)) {
            this->state.leading = v1;
        }
    } else if (op == "Ts") {
        if (numericOperand(0, v1)) {
            this->state.rise = v1;
        }
    } else if (op == "Td") {
        if (numericOperand(0, v1) && numericOperand(1, v2)) {
            moveLine(v1, v2);
        }
    } else if (op == "TD") {
        if (numericOperand(0, v1) && numericOperand(1, v2)) {
            this->state.leading = -v2;
            moveLine(v1, v2);
        }
    } else if (op == "Tm") {
        QPDFMatrix m;
        if (matrixFromOperands(this->operands, m)) {
            this->tm = m;
            this->tlm = m;
        }
    } else if (op == "T*") {
        nextLine();
    } else if (op == "Tj") {
        if ((this->operands.size() == 1) && this->operands.at(0).isString()) {
            showText(this->operands);
        }
    } else if (op == "'") {
        if ((this->operands.size() == 1) && this->operands.at(0).isString()) {
            nextLine();
            showText(this->operands);
        }
    } else if (op == "\"") {
        if ((this->operands.size() == 3) && numericOperand(0, v1) && numericOperand(1, v2) &&
            this->operands.at(2).isString()) {
            this->state.word_spacing = v1;
            this->state.char_spacing = v2;
            nextLine();
            showText({this->operands.at(2)});
        }
    } else if (op == "TJ") {
        if ((this->operands.size() == 1) && this->operands.at(0).isArray()) {
            showText(this->operands.at(0).getArrayAsVector());
        }
    } else if (op == "Do") {
        if ((this->operands.size() == 1) && this->operands.at(0).isName()) {
            invokeXObject(this->operands.at(0).getName());
        }
    }
}

void
TextRunFinder::selectFont(std::string const& name)
{
    auto iter = this->fonts.find(name);
    if (iter != this->fonts.end()) {
        this->state.font = iter->second;
        return;
    }
    QPDFObjectHandle font;
    if (this->resources.isDictionary()) {
        auto font_dict = this->resources.getKey("/Font");
        if (font_dict.isDictionary()) {
            font = font_dict.getKey(name);
        }
    }
    auto decoder = std::make_shared<FontDecoder>(font);
    this->fonts[name] = decoder;
    this->state.font = decoder;
}

void
TextRunFinder::showText(std::vector<QPDFObjectHandle> items)
{
    if (!this->state.font) {
        this->state.font = std::make_shared<FontDecoder>();
    }
    auto const& s = this->state;
    QPDFMatrix start = renderingMatrix();
    TextRun run;
    for (auto& item: items) {
        double adjustment = 0.0;
        if (item.isString()) {
            for (auto const& glyph: s.font->decode(item.getStringValue())) {
                double tx = ((glyph.width * s.font_size) + s.char_spacing +
                             (glyph.is_space ? s.word_spacing : 0.0)) *
                    s.horizontal_scale;
                this->tm.translate(tx, 0);
                run.text += glyph.text;
            }
        } else if (item.getValueAsNumber(adjustment)) {
            this->tm.translate(-adjustment / 1000.0 * s.font_size * s.horizontal_scale, 0);
        }
    }
    QPDFMatrix end = renderingMatrix();
    run.x = start.e;
    run.y = start.f;
    run.width = std::hypot(end.e - start.e, end.f - start.f);
    run.height = verticalScale(start);
    this->runs.push_back(run);
}

void
TextRunFinder::invokeXObject(std::string const& name)
{
    if (!this->resources.isDictionary()) {
        return;
    }
    auto xobjects = this->resources.getKey("/XObject");
    if (!xobjects.isDictionary()) {
        return;
    }
    auto xobj = xobjects.getKey(name);
    if (!xobj.isFormXObject()) {
        return;
    }
    auto og = xobj.getObjGen();
    if ((this->depth + 1 > max_form_depth) || this->active_forms.count(og)) {
        return;
    }

    State form_state = this->state;
    auto dict = xobj.getDict();
    auto matrix = dict.getKey("/Matrix");
    if (matrix.isArray() && (matrix.getArrayNItems() == 6)) {
        QPDFMatrix m;
        if (matrixFromOperands(matrix.getArrayAsVector(), m)) {
            form_state.ctm.concat(m);
        }
    }
    auto form_resources = dict.getKey("/Resources");
    if (!form_resources.isDictionary()) {
        form_resources = this->resources;
    }

    this->active_forms.insert(og);
    TextRunFinder child(
        form_resources, form_state, this->runs, this->active_forms, this->depth + 1);
    xobj.parseAsContents(&child);
    this->active_forms.erase(og);
}

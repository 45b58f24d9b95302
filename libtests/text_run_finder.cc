#include <pdfredact/assert_test.h>

#include <pdfredact/TextRunFinder.hh>

#include <qpdf/QPDFMatrix.hh>
#include <qpdf/QPDFObjectHandle.hh>

#include <iostream>

using namespace pdfredact;

static std::vector<QPDFObjectHandle>
operands(std::string const& array)
{
    return QPDFObjectHandle::parse(array).getArrayAsVector();
}

static void
check(QPDFMatrix const& m, std::string const& exp)
{
    std::string u = m.unparse();
    if (u != exp) {
        std::cout << "got " << u << ", wanted " << exp << std::endl;
    }
    assert(u == exp);
}

static void
test_matrix_from_operands()
{
    QPDFMatrix m;
    assert(TextRunFinder::matrixFromOperands(operands("[1 0 0 1 72 144.5]"), m));
    check(m, "1 0 0 1 72 144.5");
    assert(m == QPDFMatrix(1, 0, 0, 1, 72, 144.5));

    assert(TextRunFinder::matrixFromOperands(operands("[2 0 0 2 0 0]"), m));
    check(m, "2 0 0 2 0 0");

    // Failed conversions leave the matrix alone
    assert(!TextRunFinder::matrixFromOperands(operands("[1 0 0 1 72]"), m));
    assert(!TextRunFinder::matrixFromOperands(operands("[1 0 0 1 72 144.5 3]"), m));
    assert(!TextRunFinder::matrixFromOperands(operands("[1 0 0 1 72 /Name]"), m));
    assert(!TextRunFinder::matrixFromOperands(operands("[1 0 0 1 72 (7)]"), m));
    assert(!TextRunFinder::matrixFromOperands({}, m));
    check(m, "2 0 0 2 0 0");
}

static void
test_vertical_scale()
{
    assert(TextRunFinder::verticalScale(QPDFMatrix()) == 1.0);

    // Rendering matrix for 12 point text at (50, 700). The argument
    // of concat is applied to points first.
    QPDFMatrix trm;
    trm.concat(QPDFMatrix(1, 0, 0, 1, 50, 700));
    trm.concat(QPDFMatrix(12, 0, 0, 12, 0, 0));
    check(trm, "12 0 0 12 50 700");
    assert(TextRunFinder::verticalScale(trm) == 12.0);

    // Horizontal scaling and translation don't change the height
    QPDFMatrix wide(24, 0, 0, 12, 300, 10);
    assert(TextRunFinder::verticalScale(wide) == 12.0);

    // Rotated 90 degrees: height is still the font size
    QPDFMatrix rotated(0, 1, -1, 0, 0, 0);
    rotated.concat(QPDFMatrix(10, 0, 0, 10, 0, 0));
    check(rotated, "0 10 -10 0 0 0");
    assert(TextRunFinder::verticalScale(rotated) == 10.0);

    // A 3-4-5 shear
    assert(TextRunFinder::verticalScale(QPDFMatrix(1, 0, 3, 4, 0, 0)) == 5.0);
}

int
main()
{
    test_matrix_from_operands();
    test_vertical_scale();
    std::cout << "text run finder tests passed" << std::endl;
    return 0;
}

#include <pdfredact/assert_test.h>

#include <pdfredact/Config.hh>
#include <pdfredact/TempFile.hh>

#include <qpdf/Pl_String.hh>
#include <qpdf/QPDFLogger.hh>
#include <qpdf/QUtil.hh>

#include <iostream>
#include <stdexcept>

using namespace pdfredact;

int
main()
{
    std::string log;
    auto logger = QPDFLogger::create();
    logger->setWarn(std::make_shared<Pl_String>("warn", nullptr, log));
    std::string dir = Config().tempDirectory();

    std::string path;
    {
        TempFile t1(dir, logger);
        TempFile t2(dir, logger);
        path = t1.getPath();
        assert(t1.getPath() != t2.getPath());
        assert(path.find(dir + "/pdfredact-") == 0);
        // Nothing is created until written
        assert(!QUtil::file_can_be_opened(path.c_str()));
        std::string data("%PDF-1.7\n\0binary\xff", 17);
        t1.write(data);
        assert(QUtil::file_can_be_opened(path.c_str()));
        assert(t1.read() == data);
    }
    // Removed when it goes out of scope
    assert(!QUtil::file_can_be_opened(path.c_str()));
    assert(log.empty());

    try {
        TempFile bad("/nonexistent/pdfredact/dir", logger);
        bad.write("data");
        assert(false);
    } catch (std::runtime_error& e) {
        std::cout << "write error: " << e.what() << std::endl;
    }

    std::cout << "temp file tests passed" << std::endl;
    return 0;
}

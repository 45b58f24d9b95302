#include <pdfredact/TempFile.hh>

#include <qpdf/QUtil.hh>

#include <cstdio>
#include <stdexcept>

using namespace pdfredact;

TempFile::TempFile(std::string const& directory, std::shared_ptr<QPDFLogger> logger) :
    path((directory.empty() ? std::string(".") : directory) + "/" + uniqueName()),
    logger(logger ? logger : QPDFLogger::defaultLogger())
{
}

TempFile::~TempFile()
{
    try {
        if (QUtil::file_can_be_opened(this->path.c_str())) {
            QUtil::remove_file(this->path.c_str());
        }
    } catch (std::exception& e) {
        this->logger->warn(
            "pdfredact: unable to remove temporary file: " + std::string(e.what()) + "\n");
    }
}

std::string
TempFile::uniqueName()
{
    unsigned char random[8];
    QUtil::initializeWithRandomBytes(random, sizeof(random));
    return (
        "pdfredact-" + std::to_string(QUtil::get_current_time()) + "-" +
        QUtil::hex_encode(std::string(reinterpret_cast<char*>(random), sizeof(random))) + ".pdf");
}

std::string const&
TempFile::getPath() const
{
    return this->path;
}

void
TempFile::write(std::string const& data) const
{
    QUtil::FileCloser fc(QUtil::safe_fopen(this->path.c_str(), "wb"));
    if (fwrite(data.data(), 1, data.length(), fc.f) != data.length()) {
        QUtil::throw_system_error("write " + this->path);
    }
}

std::string
TempFile::read() const
{
    std::shared_ptr<char> buf;
    size_t size = 0;
    QUtil::read_file_into_memory(this->path.c_str(), buf, size);
    return std::string(buf.get(), size);
}

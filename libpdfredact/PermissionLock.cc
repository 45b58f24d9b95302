#include <pdfredact/PermissionLock.hh>

#include <pdfredact/DocumentLoader.hh>
#include <pdfredact/TempFile.hh>

#include <qpdf/QPDFJob.hh>
#include <qpdf/QUtil.hh>

#include <stdexcept>

using namespace pdfredact;

PermissionLock::PermissionLock(
    std::shared_ptr<DocumentLoader> loader, std::string const& temp_dir) :
    loader(loader),
    temp_dir(temp_dir)
{
}

std::string
PermissionLock::randomOwnerPassword()
{
    unsigned char random[32];
    QUtil::initializeWithRandomBytes(random, sizeof(random));
    return QUtil::hex_encode(std::string(reinterpret_cast<char*>(random), sizeof(random)));
}

StepResult
PermissionLock::apply(std::string& data) const
{
    static std::string const step = "permission lock";
    try {
        TempFile in(this->temp_dir, this->loader->getLogger());
        TempFile out(this->temp_dir, this->loader->getLogger());
        in.write(data);

        QPDFJob j;
        j.setLogger(this->loader->getLogger());
        j.setMessagePrefix("pdfredact");
        j.config()
            ->inputFile(in.getPath())
            ->outputFile(out.getPath())
            ->encrypt(256, "", randomOwnerPassword())
            ->print("none")
            ->modify("none")
            ->extract("n")
            ->accessibility("y")
            ->endEncrypt()
            ->checkConfiguration();
        j.run();
        if (j.getExitCode() == QPDFJob::EXIT_ERROR) {
            return StepResult::failure(step, "encryption did not complete");
        }
        data = out.read();
        return StepResult::success(step, "applied");
    } catch (std::exception& e) {
        return StepResult::failure(step, e.what());
    }
}

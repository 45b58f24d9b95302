#ifndef TEMPFILE_HH
#define TEMPFILE_HH

#include <qpdf/QPDFLogger.hh>

#include <memory>
#include <string>

namespace pdfredact
{
    // A uniquely named file in a temporary directory, removed when the
    // TempFile is destroyed. The file itself is created by write() or
    // by whoever is given getPath().
    class TempFile
    {
      public:
        TempFile(std::string const& directory, std::shared_ptr<QPDFLogger> logger = nullptr);
        // Failure to remove the file is logged, never thrown.
        ~TempFile();
        TempFile(TempFile const&) = delete;
        TempFile& operator=(TempFile const&) = delete;

        std::string const& getPath() const;
        void write(std::string const& data) const;
        std::string read() const;

      private:
        static std::string uniqueName();

        std::string path;
        std::shared_ptr<QPDFLogger> logger;
    };
} // namespace pdfredact

#endif // TEMPFILE_HH

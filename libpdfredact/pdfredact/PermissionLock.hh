#ifndef PERMISSIONLOCK_HH
#define PERMISSIONLOCK_HH

#include <pdfredact/StepResult.hh>

#include <memory>
#include <string>

namespace pdfredact
{
    class DocumentLoader;

    // Encrypts a document with AES-256, an empty user password, and a
    // random owner password, allowing only accessibility extraction.
    // The restrictions are advisory; any reader can open the result.
    // Work is done by QPDFJob through temporary files.
    class PermissionLock
    {
      public:
        PermissionLock(std::shared_ptr<DocumentLoader> loader, std::string const& temp_dir);

        // On success data is replaced by the locked document; on
        // failure it is left alone.
        StepResult apply(std::string& data) const;

        // 32 random bytes, hex encoded
        static std::string randomOwnerPassword();

      private:
        std::shared_ptr<DocumentLoader> loader;
        std::string temp_dir;
    };
} // namespace pdfredact

#endif // PERMISSIONLOCK_HH

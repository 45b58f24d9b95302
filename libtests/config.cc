#include <pdfredact/assert_test.h>

#include <pdfredact/Config.hh>

#include <qpdf/QUtil.hh>

#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <stdexcept>

using namespace pdfredact;

static void
set_env(char const* name, char const* value)
{
#ifdef _WIN32
    _putenv_s(name, value);
#else
    setenv(name, value, 1);
#endif
}

static void
clear_env()
{
    for (auto name: {"PDFREDACT_MAX_FILE_SIZE_MB", "PDFREDACT_HARDENED", "PDFREDACT_TMPDIR"}) {
#ifdef _WIN32
        _putenv_s(name, "");
#else
        unsetenv(name);
#endif
    }
}

static bool
json_fails(std::string const& json)
{
    Config c;
    try {
        c.applyJSON(json);
    } catch (std::runtime_error& e) {
        std::cout << "config error: " << e.what() << std::endl;
        return true;
    }
    return false;
}

static void
test_defaults()
{
    clear_env();
    Config c = Config::fromEnvironment();
    assert(c.max_file_size == 10 * 1024 * 1024);
    assert(!c.skip_permission_lock);
    assert(c.include_text);
    assert(!c.hardened);
    assert(!c.verbose);
    assert(!c.deterministic_id);
    c.temp_dir = "/somewhere";
    assert(c.tempDirectory() == "/somewhere");
    c.temp_dir.clear();
    assert(!c.tempDirectory().empty());
}

static void
test_environment()
{
    clear_env();
    set_env("PDFREDACT_MAX_FILE_SIZE_MB", "5");
    set_env("PDFREDACT_HARDENED", "true");
    set_env("PDFREDACT_TMPDIR", "/var/tmp");
    Config c = Config::fromEnvironment();
    assert(c.max_file_size == 5 * 1024 * 1024);
    assert(c.hardened);
    assert(c.tempDirectory() == "/var/tmp");

    set_env("PDFREDACT_HARDENED", "0");
    c.applyEnvironment();
    assert(!c.hardened);

    for (auto bad: {"0", "-3", "lots"}) {
        set_env("PDFREDACT_MAX_FILE_SIZE_MB", bad);
        try {
            Config::fromEnvironment();
            assert(false);
        } catch (std::runtime_error& e) {
            std::cout << "environment error: " << e.what() << std::endl;
        }
    }
    set_env("PDFREDACT_MAX_FILE_SIZE_MB", "5");
    set_env("PDFREDACT_HARDENED", "sometimes");
    try {
        Config::fromEnvironment();
        assert(false);
    } catch (std::runtime_error& e) {
        std::cout << "environment error: " << e.what() << std::endl;
    }
    clear_env();
}

static void
test_json()
{
    Config c;
    c.applyJSON(R"({"maxFileSizeMB": 3, "includeText": false, "tempDir": "/data/tmp",
                    "skipPermissionLock": true, "hardened": true, "verbose": true,
                    "deterministicId": true})");
    assert(c.max_file_size == 3 * 1024 * 1024);
    assert(!c.include_text);
    assert(c.temp_dir == "/data/tmp");
    assert(c.skip_permission_lock);
    assert(c.hardened);
    assert(c.verbose);
    assert(c.deterministic_id);

    // Keys not present keep their values
    c.applyJSON(R"({"verbose": false})");
    assert(!c.verbose);
    assert(c.hardened);

    assert(json_fails("[]"));
    assert(json_fails("{"));
    assert(json_fails(R"({"colour": "blue"})"));
    assert(json_fails(R"({"verbose": "yes"})"));
    assert(json_fails(R"({"maxFileSizeMB": "3"})"));
    assert(json_fails(R"({"maxFileSizeMB": 2.5})"));
    assert(json_fails(R"({"tempDir": 7})"));

    try {
        c.applyJSONFile("/nonexistent/pdfredact.json");
        assert(false);
    } catch (std::runtime_error&) {
    }
}

static void
test_json_file()
{
    std::string filename = "config-test.json";
    {
        QUtil::FileCloser fc(QUtil::safe_fopen(filename.c_str(), "wb"));
        fputs(R"({"maxFileSizeMB": 1, "skipPermissionLock": true})", fc.f);
    }
    Config c;
    c.applyJSONFile(filename);
    assert(c.max_file_size == 1024 * 1024);
    assert(c.skip_permission_lock);
    QUtil::remove_file(filename.c_str());
}

int
main()
{
    test_defaults();
    test_environment();
    test_json();
    test_json_file();
    std::cout << "config tests passed" << std::endl;
    return 0;
}

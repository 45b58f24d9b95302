#include <pdfredact/Config.hh>
#include <pdfredact/DocumentLoader.hh>
#include <pdfredact/RedactExc.hh>
#include <pdfredact/Sanitizer.hh>

#include <qpdf/QPDFLogger.hh>
#include <qpdf/QUtil.hh>

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

static char const* whoami = nullptr;

namespace
{
    class UsageError: public std::runtime_error
    {
      public:
        UsageError(std::string const& msg) :
            std::runtime_error(msg)
        {
        }
    };

    struct Options
    {
        char const* infile{nullptr};
        char const* outfile{nullptr};
        char const* config_file{nullptr};
        char const* max_size_mb{nullptr};
        bool analyze{false};
        bool show_text{false};
        bool text_length_only{false};
        bool no_lock{false};
        bool copy_if_clean{false};
        bool deterministic_id{false};
        bool json{false};
        bool hardened{false};
        bool verbose{false};
    };
} // namespace

static void
usage()
{
    std::cout << "Usage: " << whoami << " [options] infile [outfile]" << std::endl
              << std::endl
              << "Find email addresses and phone numbers in infile and write a copy" << std::endl
              << "to outfile with them painted over and removed from the page text." << std::endl
              << std::endl
              << "Options:" << std::endl
              << "  --analyze            print what would be redacted instead of redacting"
              << std::endl
              << "  --show-text          print all text found in infile, page by page" << std::endl
              << "  --text-length-only   with --analyze, report lengths instead of text"
              << std::endl
              << "  --no-lock            do not restrict permissions on the output" << std::endl
              << "  --copy-if-clean      write infile unchanged if nothing is found" << std::endl
              << "  --deterministic-id   write a reproducible /ID (with --no-lock)" << std::endl
              << "  --max-size-mb=n      refuse input larger than n megabytes" << std::endl
              << "  --config=file        read settings from a JSON file" << std::endl
              << "  --json               write reports and errors as JSON" << std::endl
              << "  --hardened           omit technical details from errors" << std::endl
              << "  --verbose            report progress" << std::endl
              << "  --version            show version and exit" << std::endl
              << "  --help               show this help and exit" << std::endl
              << std::endl
              << "Settings are taken from the environment (PDFREDACT_MAX_FILE_SIZE_MB," << std::endl
              << "PDFREDACT_HARDENED, PDFREDACT_TMPDIR), then the configuration file," << std::endl
              << "then the command line." << std::endl;
}

static void
usageExit(std::string const& msg)
{
    std::cerr << std::endl
              << whoami << ": " << msg << std::endl
              << std::endl
              << "For help:" << std::endl
              << "  " << whoami << " --help" << std::endl
              << std::endl;
    exit(pdfredact_exit_error);
}

static bool
option_value(char const* arg, char const* name, char const*& value)
{
    size_t len = strlen(name);
    if ((strncmp(arg, name, len) == 0) && (arg[len] == '=')) {
        value = arg + len + 1;
        return true;
    }
    return false;
}

static void
parse_args(int argc, char* argv[], Options& o)
{
    for (int i = 1; i < argc; ++i) {
        char const* arg = argv[i];
        if ((arg[0] == '-') && (arg[1] == '-') && arg[2]) {
            if (strcmp(arg, "--help") == 0) {
                usage();
                exit(pdfredact_exit_success);
            } else if (strcmp(arg, "--version") == 0) {
                std::cout << whoami << " version " << PDFREDACT_VERSION << std::endl;
                exit(pdfredact_exit_success);
            } else if (strcmp(arg, "--analyze") == 0) {
                o.analyze = true;
            } else if (strcmp(arg, "--show-text") == 0) {
                o.show_text = true;
            } else if (strcmp(arg, "--text-length-only") == 0) {
                o.text_length_only = true;
            } else if (strcmp(arg, "--no-lock") == 0) {
                o.no_lock = true;
            } else if (strcmp(arg, "--copy-if-clean") == 0) {
                o.copy_if_clean = true;
            } else if (strcmp(arg, "--deterministic-id") == 0) {
                o.deterministic_id = true;
            } else if (strcmp(arg, "--json") == 0) {
                o.json = true;
            } else if (strcmp(arg, "--hardened") == 0) {
                o.hardened = true;
            } else if (strcmp(arg, "--verbose") == 0) {
                o.verbose = true;
            } else if (option_value(arg, "--max-size-mb", o.max_size_mb)) {
                // handled
            } else if (option_value(arg, "--config", o.config_file)) {
                // handled
            } else {
                throw UsageError(std::string("unknown option ") + arg);
            }
        } else if (o.infile == nullptr) {
            o.infile = arg;
        } else if (o.outfile == nullptr) {
            o.outfile = arg;
        } else {
            throw UsageError("too many file names given");
        }
    }
    if (o.infile == nullptr) {
        throw UsageError("an input file must be given");
    }
    if (o.analyze && o.show_text) {
        throw UsageError("--analyze and --show-text may not be given together");
    }
    if (o.analyze || o.show_text) {
        if (o.outfile) {
            throw UsageError("no output file is written with --analyze or --show-text");
        }
    } else if (o.outfile == nullptr) {
        throw UsageError("an output file must be given");
    }
    if (o.text_length_only && !o.analyze) {
        throw UsageError("--text-length-only requires --analyze");
    }
}

static pdfredact::Config
make_config(Options const& o)
{
    pdfredact::Config config;
    try {
        config = pdfredact::Config::fromEnvironment();
        if (o.config_file) {
            config.applyJSONFile(o.config_file);
        }
        if (o.max_size_mb) {
            config.setMaxFileSizeMB(o.max_size_mb);
        }
    } catch (std::runtime_error& e) {
        throw UsageError(e.what());
    }
    if (o.no_lock) {
        config.skip_permission_lock = true;
    }
    if (o.deterministic_id) {
        config.deterministic_id = true;
    }
    if (o.text_length_only) {
        config.include_text = false;
    }
    if (o.hardened) {
        config.hardened = true;
    }
    if (o.verbose) {
        config.verbose = true;
    }
    return config;
}

static std::string
read_file(char const* filename)
{
    std::shared_ptr<char> buf;
    size_t size = 0;
    QUtil::read_file_into_memory(filename, buf, size);
    return std::string(buf.get(), size);
}

static void
write_file(char const* filename, std::string const& data)
{
    QUtil::FileCloser fc(QUtil::safe_fopen(filename, "wb"));
    if (fwrite(data.data(), 1, data.length(), fc.f) != data.length()) {
        QUtil::throw_system_error(std::string("write ") + filename);
    }
}

static void
report_error(
    pdfredact::RedactExc const& e, Options const& o, pdfredact::Config const& config)
{
    if (o.json) {
        std::cout << e.getJSON(!config.hardened).unparse() << std::endl;
        return;
    }
    std::string msg = std::string(whoami) + ": " + e.getCategory() + ": " + e.getHint() + "\n";
    if (!config.hardened) {
        msg += std::string(whoami) + ": " + e.what() + "\n";
    }
    QPDFLogger::defaultLogger()->error(msg);
}

static void
run(Options const& o, pdfredact::Config const& config)
{
    auto loader = pdfredact::DocumentLoader::instance();
    loader->setVerbose(config.verbose);
    if (o.json && config.verbose) {
        auto logger = loader->getLogger();
        logger->setInfo(logger->standardError());
    }
    pdfredact::Sanitizer sanitizer(config, loader);

    std::string data;
    try {
        data = read_file(o.infile);
    } catch (std::runtime_error& e) {
        throw pdfredact::RedactExc(pdfredact_e_input, "unable to read input file", e.what());
    }

    if (o.show_text) {
        std::cout << sanitizer.extractAllText(data);
        return;
    }
    if (o.analyze) {
        auto analysis = sanitizer.analyze(data);
        if (o.json) {
            std::cout << analysis.getJSON(config.include_text).unparse() << std::endl;
            return;
        }
        auto const& s = analysis.statistics;
        std::cout << o.infile << ": " << s.total_redactions << " item(s): " << s.emails
                  << " email(s), " << s.phones << " phone number(s) on " << s.pages_affected
                  << " page(s)" << std::endl;
        for (auto const& page: analysis.pages) {
            for (auto const& item: page.items) {
                std::cout << "  page " << page.page_number << ": "
                          << pdfredact::pii_type_name(item.type) << ": "
                          << (config.include_text
                                  ? item.text
                                  : (std::to_string(item.text.length()) + " characters"))
                          << std::endl;
            }
        }
        return;
    }

    auto outcome = sanitizer.redact(data);
    if (outcome.redacted) {
        try {
            write_file(o.outfile, outcome.output);
        } catch (std::runtime_error& e) {
            throw pdfredact::RedactExc(
                pdfredact_e_redaction, "unable to write output file", e.what());
        }
    } else if (o.copy_if_clean) {
        write_file(o.outfile, data);
    }

    if (o.json) {
        std::cout << outcome.getJSON().unparse() << std::endl;
    } else if (outcome.redacted) {
        auto const& s = outcome.statistics;
        std::cout << o.outfile << ": redacted " << s.total_redactions << " item(s) ("
                  << s.emails << " email(s), " << s.phones << " phone number(s)) on "
                  << s.pages_affected << " of " << outcome.page_count << " page(s)"
                  << std::endl;
    } else {
        std::cout << o.infile << ": no personal information found"
                  << (o.copy_if_clean ? "; copied unchanged" : "; nothing written")
                  << std::endl;
    }
}

int
realmain(int argc, char* argv[])
{
    whoami = QUtil::getWhoami(argv[0]);
    QUtil::setLineBuf(stdout);

    Options o;
    pdfredact::Config config;
    try {
        parse_args(argc, argv, o);
        config = make_config(o);
    } catch (UsageError& e) {
        usageExit(e.what());
    }

    try {
        run(o, config);
    } catch (pdfredact::RedactExc& e) {
        report_error(e, o, config);
        return pdfredact_exit_error;
    } catch (std::exception& e) {
        report_error(
            pdfredact::RedactExc(pdfredact_e_redaction, "unexpected failure", e.what()),
            o,
            config);
        return pdfredact_exit_error;
    }
    return pdfredact_exit_success;
}

#ifdef WINDOWS_WMAIN

extern "C" int
wmain(int argc, wchar_t* argv[])
{
    return QUtil::call_main_from_wmain(argc, argv, realmain);
}

#else

int
main(int argc, char* argv[])
{
    return realmain(argc, argv);
}

#endif

#include <pdfredact/Config.hh>

#include <qpdf/JSON.hh>
#include <qpdf/QUtil.hh>

#include <memory>
#include <stdexcept>

using namespace pdfredact;

static bool
parse_flag(std::string const& name, std::string const& value)
{
    if (value.empty() || (value == "0") || (value == "false") || (value == "no")) {
        return false;
    }
    if ((value == "1") || (value == "true") || (value == "yes")) {
        return true;
    }
    throw std::runtime_error("invalid value for " + name + ": expected true or false");
}

Config
Config::fromEnvironment()
{
    Config c;
    c.applyEnvironment();
    return c;
}

void
Config::setMaxFileSizeMB(std::string const& value)
{
    bool digits = !value.empty();
    for (auto ch: value) {
        digits = digits && QUtil::is_digit(ch);
    }
    if (!digits) {
        throw std::runtime_error("invalid maximum file size: " + value);
    }
    unsigned int mb = 0;
    try {
        mb = QUtil::string_to_uint(value.c_str());
    } catch (std::runtime_error&) {
        throw std::runtime_error("invalid maximum file size: " + value);
    }
    if (mb == 0) {
        throw std::runtime_error("maximum file size must be at least 1 MB");
    }
    this->max_file_size = static_cast<size_t>(mb) * 1024 * 1024;
}

void
Config::applyEnvironment()
{
    std::string value;
    if (QUtil::get_env("PDFREDACT_MAX_FILE_SIZE_MB", &value) && !value.empty()) {
        setMaxFileSizeMB(value);
    }
    if (QUtil::get_env("PDFREDACT_HARDENED", &value)) {
        this->hardened = parse_flag("PDFREDACT_HARDENED", value);
    }
    if (QUtil::get_env("PDFREDACT_TMPDIR", &value) && !value.empty()) {
        this->temp_dir = value;
    }
}

void
Config::applyJSON(std::string const& json)
{
    JSON j = JSON::parse(json);
    if (!j.isDictionary()) {
        throw std::runtime_error("configuration must be a JSON object");
    }
    auto get_bool = [](std::string const& key, JSON const& v) {
        bool result = false;
        if (!v.getBool(result)) {
            throw std::runtime_error("configuration key " + key + " must be a boolean");
        }
        return result;
    };
    j.forEachDictItem([this, &get_bool](std::string const& key, JSON value) {
        std::string s;
        if (key == "maxFileSizeMB") {
            if (!value.getNumber(s)) {
                throw std::runtime_error("configuration key " + key + " must be a number");
            }
            setMaxFileSizeMB(s);
        } else if (key == "tempDir") {
            if (!value.getString(s)) {
                throw std::runtime_error("configuration key " + key + " must be a string");
            }
            this->temp_dir = s;
        } else if (key == "skipPermissionLock") {
            this->skip_permission_lock = get_bool(key, value);
        } else if (key == "includeText") {
            this->include_text = get_bool(key, value);
        } else if (key == "hardened") {
            this->hardened = get_bool(key, value);
        } else if (key == "verbose") {
            this->verbose = get_bool(key, value);
        } else if (key == "deterministicId") {
            this->deterministic_id = get_bool(key, value);
        } else {
            throw std::runtime_error("unknown configuration key " + key);
        }
    });
}

void
Config::applyJSONFile(std::string const& filename)
{
    std::shared_ptr<char> buf;
    size_t size = 0;
    QUtil::read_file_into_memory(filename.c_str(), buf, size);
    applyJSON(std::string(buf.get(), size));
}

std::string
Config::tempDirectory() const
{
    if (!this->temp_dir.empty()) {
        return this->temp_dir;
    }
    std::string value;
    if (QUtil::get_env("TMPDIR", &value) && !value.empty()) {
        return value;
    }
    return "/tmp";
}

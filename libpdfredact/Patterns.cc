#include <pdfredact/Patterns.hh>

#include <pdfredact/Types.hh>

#include <set>

using namespace pdfredact;

char const*
pdfredact::pii_type_name(pdfredact_pii_type_e type)
{
    return (type == pdfredact_pii_phone) ? "phone" : "email";
}

Patterns::MatchRule::MatchRule(
    pdfredact_pii_type_e type, char const* name, char const* expression) :
    type(type),
    name(name),
    expression(expression, std::regex::ECMAScript | std::regex::optimize)
{
}

bool
Patterns::MatchRule::search(std::string const& text) const
{
    return std::regex_search(text, this->expression);
}

std::vector<std::string>
Patterns::MatchRule::findAll(std::string const& text) const
{
    std::vector<std::string> result;
    std::sregex_iterator end;
    for (std::sregex_iterator m(text.begin(), text.end(), this->expression); m != end; ++m) {
        result.push_back(m->str(0));
    }
    return result;
}

std::vector<Patterns::MatchRule> const&
Patterns::emailRules()
{
    // The | in the last character class is literal and matches the
    // way the expression has always been written.
    static std::vector<MatchRule> const rules{
        {pdfredact_pii_email,
         "email",
         R"(\b[A-Za-z0-9._%+-]+@[A-Za-z0-9.-]+\.[A-Z|a-z]{2,}\b)"},
    };
    return rules;
}

std::vector<Patterns::MatchRule> const&
Patterns::phoneRules()
{
    static std::vector<MatchRule> const rules{
        // +1-555-123-4567, +44 20 1234 5678
        {pdfredact_pii_phone,
         "international",
         R"(\+\d{1,3}[\s.-]?\(?\d{1,4}\)?[\s.-]?\d{1,4}[\s.-]?\d{1,4}[\s.-]?\d{0,4})"},
        // (555) 123-4567, (02) 1234 5678
        {pdfredact_pii_phone, "parenthesized", R"(\(?\d{2,4}\)?[\s.-]?\d{3,4}[\s.-]?\d{3,4})"},
        // 555-123-4567, 555.123.4567
        {pdfredact_pii_phone, "separated", R"(\d{3}[\s.-]\d{3}[\s.-]\d{4})"},
        // 00 44 20 1234 5678
        {pdfredact_pii_phone,
         "00-prefixed",
         R"(\b00\s?\d{1,3}[\s.-]?\d{1,4}[\s.-]?\d{1,4}[\s.-]?\d{1,4}\b)"},
        // 5551234567
        {pdfredact_pii_phone, "compact", R"(\b\d{10,15}\b)"},
    };
    return rules;
}

std::vector<std::string>
Patterns::findFirstSeen(std::vector<MatchRule> const& rules, std::string const& text)
{
    std::vector<std::string> result;
    std::set<std::string> seen;
    for (auto const& rule: rules) {
        for (auto const& match: rule.findAll(text)) {
            if (seen.insert(match).second) {
                result.push_back(match);
            }
        }
    }
    return result;
}

bool
Patterns::searchAny(std::vector<MatchRule> const& rules, std::string const& text)
{
    for (auto const& rule: rules) {
        if (rule.search(text)) {
            return true;
        }
    }
    return false;
}

Patterns::Classification
Patterns::classify(std::string const& text)
{
    Classification result;
    result.is_email = isEmail(text);
    result.is_phone = isPhone(text);
    return result;
}

bool
Patterns::isEmail(std::string const& text)
{
    return searchAny(emailRules(), text);
}

bool
Patterns::isPhone(std::string const& text)
{
    return searchAny(phoneRules(), text);
}

bool
Patterns::containsPII(std::string const& text)
{
    return isEmail(text) || isPhone(text);
}

std::vector<std::string>
Patterns::findEmails(std::string const& text)
{
    // Unlike phone numbers, repeated addresses are all reported.
    return emailRules().front().findAll(text);
}

std::vector<std::string>
Patterns::findPhones(std::string const& text)
{
    return findFirstSeen(phoneRules(), text);
}

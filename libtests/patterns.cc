#include <pdfredact/assert_test.h>

#include <pdfredact/Patterns.hh>

#include <iostream>
#include <set>

using namespace pdfredact;

static void
test_classify()
{
    auto c = Patterns::classify("john@example.com");
    assert(c.is_email);
    assert(!c.is_phone);
    c = Patterns::classify("Call 555-123-4567");
    assert(!c.is_email);
    assert(c.is_phone);
    c = Patterns::classify("not an email");
    assert(!(c.is_email || c.is_phone));

    // Pure: same answer every time
    for (int i = 0; i < 3; ++i) {
        auto again = Patterns::classify("jane@example.org or +44 20 1234 5678");
        assert(again.is_email && again.is_phone);
    }

    assert(!Patterns::containsPII("X"));
    assert(!Patterns::containsPII(""));
    // Too few digits for any phone rule
    assert(!Patterns::containsPII("Call 12345"));
    assert(Patterns::containsPII("Tel 5551234567"));
    assert(Patterns::containsPII("00 44 20 1234 5678"));
}

static void
test_emails()
{
    auto emails = Patterns::findEmails("Contact: jane.doe@company.org.");
    assert(emails.size() == 1);
    assert(emails.at(0) == "jane.doe@company.org");

    // Repeated addresses are all reported
    emails = Patterns::findEmails("a@b.co and a@b.co");
    assert(emails.size() == 2);
    assert(emails.at(0) == "a@b.co");
    assert(emails.at(1) == "a@b.co");

    assert(Patterns::findEmails("user@localhost").empty());
    assert(Patterns::findEmails("nothing here").empty());
}

static void
test_phones()
{
    auto phones = Patterns::findPhones("Call 555-123-4567");
    assert(phones.size() == 1);
    assert(phones.at(0) == "555-123-4567");

    // The international rule sees the whole number. Later rules see a
    // shorter literal, which is kept since it is different text.
    phones = Patterns::findPhones("+1 555 123 4567");
    assert(phones.size() == 2);
    assert(phones.at(0) == "+1 555 123 4567");
    assert(phones.at(1) == "555 123 4567");

    // No literal is reported twice even when it occurs twice
    phones = Patterns::findPhones("555-123-4567 or 555-123-4567");
    std::set<std::string> seen(phones.begin(), phones.end());
    assert(seen.size() == phones.size());
    assert(phones.at(0) == "555-123-4567");

    assert(Patterns::findPhones("no digits").empty());
}

static void
test_documented_examples()
{
    auto emails = Patterns::findEmails("Contact me at john@example.com or jane@test.org");
    assert(emails == std::vector<std::string>({"john@example.com", "jane@test.org"}));

    std::string line = "647-852-1083 | Caitoria131@gmail.com";
    assert(Patterns::findEmails(line) == std::vector<std::string>({"Caitoria131@gmail.com"}));
    auto phones = Patterns::findPhones(line);
    bool found = false;
    for (auto const& p: phones) {
        found = found || (p.find("647-852-1083") != std::string::npos);
    }
    assert(found);

    assert(!Patterns::isPhone("123"));
    assert(Patterns::isPhone("+44 20 1234 5678"));
}

static void
test_rules()
{
    auto const& phone_rules = Patterns::phoneRules();
    assert(phone_rules.size() == 5);
    assert(std::string(phone_rules.at(0).getName()) == "international");
    for (auto const& rule: phone_rules) {
        assert(rule.getType() == pdfredact_pii_phone);
    }
    assert(Patterns::emailRules().size() == 1);
    assert(Patterns::emailRules().front().getType() == pdfredact_pii_email);

    // Order of the rule list decides the order of results
    std::vector<Patterns::MatchRule> rules{
        {pdfredact_pii_phone, "b", "b+"},
        {pdfredact_pii_phone, "a", "a+"},
    };
    auto found = Patterns::findFirstSeen(rules, "aa bb aa");
    assert(found.size() == 2);
    assert(found.at(0) == "bb");
    assert(found.at(1) == "aa");
    assert(Patterns::searchAny(rules, "xxbxx"));
    assert(!Patterns::searchAny(rules, "xxx"));
}

int
main()
{
    test_classify();
    test_emails();
    test_phones();
    test_documented_examples();
    test_rules();
    std::cout << "patterns tests passed" << std::endl;
    return 0;
}

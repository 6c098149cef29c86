#include "../framework/SimpleTest.hpp"
#include "model/Text.hpp"
#include <vector>

using namespace maestro::model;

TEST_CASE(test_ascii_text_is_its_own_ascii) {
    Text t("Hello World");
    ASSERT_EQ(t.ascii(), "Hello World");
    ASSERT_TRUE(t.ascii_kind() == Text::AsciiKind::Same);
    ASSERT_FALSE(t.has_overridden_ascii());
    ASSERT_FALSE(t.has_distinct_file_safe());
}

TEST_CASE(test_accents_are_transliterated) {
    Text t("Björk Gudmundsdóttir");
    ASSERT_EQ(t.value(), "Björk Gudmundsdóttir");
    ASSERT_EQ(t.ascii(), "Bjork Gudmundsdottir");
    ASSERT_TRUE(t.ascii_kind() == Text::AsciiKind::Derived);
}

TEST_CASE(test_compatibility_forms_decompose) {
    // U+FB01 LATIN SMALL LIGATURE FI
    Text t("\xEF\xAC\x81nal");
    ASSERT_EQ(t.ascii(), "final");
}

TEST_CASE(test_special_punctuation_is_substituted) {
    ASSERT_EQ(Text("Don’t").ascii(), "Don't");
    ASSERT_EQ(Text("‘quoted’").ascii(), "'quoted'");
    ASSERT_EQ(Text("“Hi”").ascii(), "\"Hi\"");
    ASSERT_EQ(Text("¡Hola!").ascii(), "!Hola!");
}

TEST_CASE(test_untransliterable_characters_are_dropped) {
    Text t("日本 Tour");
    ASSERT_EQ(t.ascii(), " Tour");
    ASSERT_TRUE(t.ascii_kind() == Text::AsciiKind::Derived);
}

TEST_CASE(test_invalid_utf8_never_fails) {
    Text t(std::string("ab\xFF\xFE" "cd"));
    ASSERT_EQ(t.ascii(), "abcd");
}

TEST_CASE(test_override_takes_precedence) {
    Text t("Sigur Rós", std::string("Sigur Ros (override)"));
    ASSERT_EQ(t.value(), "Sigur Rós");
    ASSERT_EQ(t.ascii(), "Sigur Ros (override)");
    ASSERT_TRUE(t.has_overridden_ascii());
}

TEST_CASE(test_override_on_ascii_value_is_still_an_override) {
    Text t("Prince", std::string("The Artist"));
    ASSERT_EQ(t.ascii(), "The Artist");
    ASSERT_TRUE(t.has_overridden_ascii());
}

TEST_CASE(test_non_ascii_override_is_derived) {
    Text t("Motörhead", std::string("Motörhead!"));
    ASSERT_EQ(t.ascii(), "Motorhead!");
    ASSERT_TRUE(t.has_overridden_ascii());
}

TEST_CASE(test_file_safe_only_stored_when_needed) {
    Text safe("Plain Title");
    ASSERT_FALSE(safe.has_distinct_file_safe());
    ASSERT_EQ(safe.file_safe(), "Plain Title");

    Text unsafe("AC/DC");
    ASSERT_TRUE(unsafe.has_distinct_file_safe());
    ASSERT_EQ(unsafe.file_safe(), "AC-DC");
}

TEST_CASE(test_file_safe_derives_from_ascii) {
    Text t("Qu’est-ce que c’est?");
    ASSERT_EQ(t.file_safe(), "Qu'est-ce que c'est");

    Text quoted("“Hi”");
    ASSERT_EQ(quoted.file_safe(), "'Hi'");
}

TEST_CASE(test_file_safe_mapping) {
    ASSERT_EQ(make_file_safe("a<b>c"), "a[b]c");
    ASSERT_EQ(make_file_safe("Title: Subtitle"), "Title - Subtitle");
    ASSERT_EQ(make_file_safe("12:30"), "12-30");
    ASSERT_EQ(make_file_safe("end:"), "end-");
    ASSERT_EQ(make_file_safe("say \"hi\""), "say 'hi'");
    ASSERT_EQ(make_file_safe("a/b|c~d"), "a-b-c-d");
    ASSERT_EQ(make_file_safe("a\\b*c"), "a_b_c");
    ASSERT_EQ(make_file_safe("Why?"), "Why");
    ASSERT_EQ(make_file_safe("nothing to do"), "nothing to do");
}

TEST_CASE(test_is_file_safe) {
    ASSERT_TRUE(is_file_safe("Hello, World! (Live) [2001]"));
    for (char c : std::string("<>:\"/\\|?*~")) {
        ASSERT_FALSE(is_file_safe(std::string("x") + c));
    }
}

TEST_CASE(test_sortable_moves_leading_article) {
    ASSERT_EQ(Text("The Beatles").sortable_file_safe(), "Beatles, The");
    ASSERT_EQ(Text("a tribe called quest").sortable_file_safe(), "tribe called quest, a");
    ASSERT_EQ(Text("An Album").sortable_file_safe(), "Album, An");
    ASSERT_EQ(Text("THE WALL").sortable_file_safe(), "WALL, THE");
}

TEST_CASE(test_sortable_leaves_other_titles) {
    ASSERT_EQ(Text("Theory of Everything").sortable_file_safe(), "Theory of Everything");
    ASSERT_EQ(Text("The").sortable_file_safe(), "The");
    ASSERT_EQ(Text("Anthem").sortable_file_safe(), "Anthem");
}

TEST_CASE(test_sortable_uses_file_safe_form) {
    ASSERT_EQ(Text("The Who?").sortable_file_safe(), "Who, The");
}

TEST_CASE(test_split_article_consumes_one_space) {
    auto split = split_article("The  Spaced");
    ASSERT_TRUE(split.has_value());
    ASSERT_EQ(split->first, "The");
    ASSERT_EQ(split->second, " Spaced");
    ASSERT_FALSE(split_article("Thesis").has_value());
}

TEST_CASE(test_empty_text_is_identity) {
    std::vector<Text> samples = {
        Text("plain"),
        Text("Björk"),
        Text("AC/DC"),
        Text("Sigur Rós", std::string("Sigur Ros")),
        Text(""),
    };
    for (const auto& t : samples) {
        ASSERT_EQ(Text() + t, t);
        ASSERT_EQ(t + Text(), t);
    }
}

TEST_CASE(test_concatenation_is_associative) {
    std::vector<Text> samples = {
        Text("a"), Text("Ä:"), Text(" b?"), Text("c", std::string("C")), Text(),
    };
    for (const auto& a : samples) {
        for (const auto& b : samples) {
            for (const auto& c : samples) {
                ASSERT_EQ((a + b) + c, a + (b + c));
            }
        }
    }
}

TEST_CASE(test_concatenation_overloads_agree) {
    Text a("Café ");
    Text b("Tacvba/Live", std::string("Tacuba Live"));
    Text expected = a + b;
    ASSERT_EQ(Text(a) + b, expected);
    ASSERT_EQ(a + Text(b), expected);
    ASSERT_EQ(Text(a) + Text(b), expected);

    Text appended = a;
    appended += b;
    ASSERT_EQ(appended, expected);
}

TEST_CASE(test_concatenation_combines_forms) {
    Text a("Café");
    Text b(" Tacvba");
    Text sum = a + b;
    ASSERT_EQ(sum.value(), "Café Tacvba");
    ASSERT_EQ(sum.ascii(), "Cafe Tacvba");
    ASSERT_TRUE(sum.ascii_kind() == Text::AsciiKind::Derived);
}

TEST_CASE(test_plain_concatenation_stays_plain) {
    Text sum = Text("abc") + Text("def");
    ASSERT_TRUE(sum.ascii_kind() == Text::AsciiKind::Same);
    ASSERT_EQ(sum, Text("abcdef"));
}

TEST_CASE(test_override_propagates_through_concatenation) {
    Text sum = Text("x") + Text("ÿ", std::string("Y")) + Text("z");
    ASSERT_TRUE(sum.has_overridden_ascii());
    ASSERT_EQ(sum.ascii(), "xYz");
}

TEST_CASE(test_file_safe_concatenates) {
    Text sum = Text("a:b") + Text("c");
    ASSERT_EQ(sum.value(), "a:bc");
    ASSERT_EQ(sum.file_safe(), "a-bc");

    Text none = Text("ab") + Text("cd");
    ASSERT_FALSE(none.has_distinct_file_safe());
}

TEST_CASE(test_self_append) {
    Text t("Ö/");
    t += t;
    ASSERT_EQ(t.value(), "Ö/Ö/");
    ASSERT_EQ(t.ascii(), "O/O/");
    ASSERT_EQ(t.file_safe(), "O-O-");
}

TEST_CASE(test_comma_separated) {
    std::vector<Text> none;
    ASSERT_EQ(comma_separated(none), Text());

    std::vector<Text> one = {Text("Solo", std::string("SOLO"))};
    ASSERT_EQ(comma_separated(one), one.front());

    std::vector<Text> many = {Text("Simon"), Text("Garfunkel"), Text("Björk")};
    Text joined = comma_separated(many);
    ASSERT_EQ(joined.value(), "Simon, Garfunkel, Björk");
    ASSERT_EQ(joined.ascii(), "Simon, Garfunkel, Bjork");
}

int main() {
    return maestro::test::TestRunner::instance().run_all();
}

// ==============================================================================
// test_specifier_gtest.cpp - Тесты валидаторов спецификаторов (GoogleTest)
// ==============================================================================

#include "qrpolicy/specifier.hpp"

#include <gtest/gtest.h>
#include <string>
#include <string_view>
#include <vector>

namespace qrpolicy::test {

// ==============================================================================
// Service
// ==============================================================================

TEST(SpecifierTest, Service_Wildcard) {
    auto parsed = parse_service("*");

    ASSERT_TRUE(parsed);
    EXPECT_TRUE(parsed.value->wildcard);
    EXPECT_EQ(to_string(*parsed.value), "*");
}

TEST(SpecifierTest, Service_ComponentAndName) {
    auto parsed = parse_service("qubes.Filecopy");

    ASSERT_TRUE(parsed);
    EXPECT_FALSE(parsed.value->wildcard);
    EXPECT_EQ(parsed.value->name, "qubes.Filecopy");
}

TEST(SpecifierTest, Service_MultipleSegments) {
    EXPECT_TRUE(parse_service("admin.vm.device.pci.Attach"));
    EXPECT_TRUE(parse_service("my-org.Do_Thing"));
}

TEST(SpecifierTest, Service_RejectsMalformedNames) {
    for (const char* bad : {"Filecopy", "qubes.", ".Filecopy", "qubes..Filecopy", "qubes.File copy",
                            "qubes/Filecopy", ""}) {
        auto parsed = parse_service(bad);
        ASSERT_FALSE(parsed) << bad;
        EXPECT_EQ(parsed.error->code, Code::InvalidServiceName) << bad;
    }
}

// ==============================================================================
// Argument
// ==============================================================================

TEST(SpecifierTest, Argument_Kinds) {
    auto empty = parse_argument("+");
    auto any = parse_argument("*");
    auto specific = parse_argument("+firefox");

    ASSERT_TRUE(empty);
    ASSERT_TRUE(any);
    ASSERT_TRUE(specific);
    EXPECT_EQ(empty.value->kind, ArgumentKind::Empty);
    EXPECT_EQ(any.value->kind, ArgumentKind::Any);
    EXPECT_EQ(specific.value->kind, ArgumentKind::Specific);
}

TEST(SpecifierTest, Argument_StoredWithoutPlus) {
    auto parsed = parse_argument("+firefox");

    ASSERT_TRUE(parsed);
    EXPECT_EQ(parsed.value->text, "firefox");
    EXPECT_EQ(to_string(*parsed.value), "+firefox");
}

TEST(SpecifierTest, Argument_RejectsMissingPlus) {
    for (const char* bad : {"firefox", "", "++ x", "+a/b"}) {
        auto parsed = parse_argument(bad);
        ASSERT_FALSE(parsed) << bad;
        EXPECT_EQ(parsed.error->code, Code::InvalidArgumentSyntax) << bad;
    }
}

// ==============================================================================
// QubeSpecifier
// ==============================================================================

TEST(SpecifierTest, Qube_AllKeywords) {
    struct Case {
        const char* token;
        QubeKind kind;
        const char* value;
    };
    const std::vector<Case> cases = {
        {"work", QubeKind::Literal, "work"},
        {"@adminvm", QubeKind::AdminVM, ""},
        {"@anyvm", QubeKind::AnyVM, ""},
        {"@default", QubeKind::Default, ""},
        {"@dispvm", QubeKind::DispVM, ""},
        {"@dispvm:fedora-dvm", QubeKind::DispVMNamed, "fedora-dvm"},
        {"@dispvm:@tag:disposable", QubeKind::DispVMByTag, "disposable"},
        {"@tag:work", QubeKind::Tag, "work"},
        {"@type:AppVM", QubeKind::Type, "AppVM"},
    };

    for (const auto& c : cases) {
        auto parsed = parse_qube(c.token, Position::Destination);
        ASSERT_TRUE(parsed) << c.token;
        EXPECT_EQ(parsed.value->kind, c.kind) << c.token;
        EXPECT_EQ(parsed.value->value, c.value) << c.token;
        EXPECT_EQ(to_string(*parsed.value), c.token);
    }
}

TEST(SpecifierTest, Qube_DispVMIllegalAsSource) {
    auto parsed = parse_qube("@dispvm", Position::Source);

    ASSERT_FALSE(parsed);
    EXPECT_EQ(parsed.error->code, Code::DispVMIllegalAsSource);
}

TEST(SpecifierTest, Qube_DefaultIllegalAsSource) {
    auto parsed = parse_qube("@default", Position::Source);

    ASSERT_FALSE(parsed);
    EXPECT_EQ(parsed.error->code, Code::DefaultIllegalAsSource);
}

TEST(SpecifierTest, Qube_DefaultLegalAsDestinationAndParameter) {
    EXPECT_TRUE(parse_qube("@default", Position::Destination));
    EXPECT_TRUE(parse_qube("@default", Position::Parameter));
}

TEST(SpecifierTest, Qube_IllegalAsParameter) {
    struct Case {
        const char* token;
        Code code;
    };
    for (const auto& c : std::vector<Case>{{"@tag:work", Code::TagIllegalAsParameter},
                                           {"@type:AppVM", Code::TypeIllegalAsParameter},
                                           {"@dispvm:@tag:t", Code::DispVMByTagIllegalAsParameter},
                                           {"@anyvm", Code::AnyVMIllegalAsParameter}}) {
        auto parsed = parse_qube(c.token, Position::Parameter);
        ASSERT_FALSE(parsed) << c.token;
        EXPECT_EQ(parsed.error->code, c.code) << c.token;
    }
}

TEST(SpecifierTest, Qube_LegalityTable) {
    EXPECT_TRUE(is_legal(QubeKind::Tag, Position::Source));
    EXPECT_TRUE(is_legal(QubeKind::Type, Position::Source));
    EXPECT_TRUE(is_legal(QubeKind::AnyVM, Position::Source));
    EXPECT_TRUE(is_legal(QubeKind::DispVMNamed, Position::Parameter));
    EXPECT_TRUE(is_legal(QubeKind::DispVM, Position::Parameter));
    EXPECT_FALSE(is_legal(QubeKind::DispVM, Position::Source));
}

TEST(SpecifierTest, Qube_UnknownKeyword) {
    auto parsed = parse_qube("@something", Position::Destination);

    ASSERT_FALSE(parsed);
    EXPECT_EQ(parsed.error->code, Code::UnknownSpecifier);
}

TEST(SpecifierTest, Qube_InvalidNames) {
    for (const char* bad : {"1work", "wo rk", "work!", "@tag:", "@type:", "@dispvm:", "-vm"}) {
        auto parsed = parse_qube(bad, Position::Destination);
        ASSERT_FALSE(parsed) << bad;
        EXPECT_EQ(parsed.error->code, Code::InvalidQubeName) << bad;
    }
}

// ==============================================================================
// Action
// ==============================================================================

TEST(SpecifierTest, Action_AllowWithTarget) {
    auto parsed = parse_action({"allow", "target=vault"});

    ASSERT_TRUE(parsed.action.has_value());
    EXPECT_TRUE(parsed.errors.empty());
    EXPECT_EQ(parsed.action->kind, ActionKind::Allow);
    ASSERT_TRUE(parsed.action->target.has_value());
    EXPECT_EQ(*parsed.action->target, QubeSpecifier::literal("vault"));
}

TEST(SpecifierTest, Action_AskWithDefaultTarget) {
    auto parsed = parse_action({"ask", "default_target=@dispvm"});

    ASSERT_TRUE(parsed.errors.empty());
    EXPECT_EQ(parsed.action->kind, ActionKind::Ask);
    EXPECT_EQ(parsed.action->target->kind, QubeKind::DispVM);
}

TEST(SpecifierTest, Action_IsCaseSensitive) {
    auto parsed = parse_action({"Allow"});

    ASSERT_EQ(parsed.errors.size(), 1u);
    EXPECT_EQ(parsed.errors[0].error.code, Code::UnknownAction);
}

TEST(SpecifierTest, Action_DenyWithParameters) {
    auto parsed = parse_action({"deny", "param=1"});

    ASSERT_EQ(parsed.errors.size(), 1u);
    EXPECT_EQ(parsed.errors[0].index, 1u);
    EXPECT_EQ(parsed.errors[0].error.code, Code::UnexpectedParametersForDeny);
}

TEST(SpecifierTest, Action_TargetNotApplicable) {
    auto allow = parse_action({"allow", "default_target=vault"});
    auto ask = parse_action({"ask", "target=vault"});

    ASSERT_EQ(allow.errors.size(), 1u);
    EXPECT_EQ(allow.errors[0].error.code, Code::ParameterNotApplicable);
    ASSERT_EQ(ask.errors.size(), 1u);
    EXPECT_EQ(ask.errors[0].error.code, Code::ParameterNotApplicable);
}

TEST(SpecifierTest, Action_DuplicateParameter) {
    auto parsed = parse_action({"allow", "user=root", "user=user"});

    ASSERT_EQ(parsed.errors.size(), 1u);
    EXPECT_EQ(parsed.errors[0].index, 2u);
    EXPECT_EQ(parsed.errors[0].error.code, Code::DuplicateParameter);
}

TEST(SpecifierTest, Action_MalformedParameters) {
    auto parsed = parse_action({"allow", "user", "=root", "user="});

    ASSERT_EQ(parsed.errors.size(), 3u);
    for (const auto& e : parsed.errors) {
        EXPECT_EQ(e.error.code, Code::MalformedParameter);
    }
}

TEST(SpecifierTest, Action_ControlCharactersInParameter) {
    auto parsed = parse_action({"allow", "user=root\ngarbage", "notify\t=yes", "autostart=no\x7f"});

    ASSERT_EQ(parsed.errors.size(), 3u);
    for (const auto& e : parsed.errors) {
        EXPECT_EQ(e.error.code, Code::MalformedParameter);
    }
    EXPECT_EQ(parsed.errors[0].index, 1u);
    EXPECT_FALSE(parsed);
}

TEST(SpecifierTest, Action_YesNoParameters) {
    auto good = parse_action({"allow", "notify=yes", "autostart=no"});
    auto bad = parse_action({"allow", "notify=maybe"});

    EXPECT_TRUE(good.errors.empty());
    ASSERT_EQ(bad.errors.size(), 1u);
    EXPECT_EQ(bad.errors[0].error.code, Code::InvalidParameterValue);
}

TEST(SpecifierTest, Action_OpaqueParametersKeepOrder) {
    auto parsed = parse_action({"allow", "zeta=1", "alpha=2", "target=vault"});

    ASSERT_TRUE(parsed.errors.empty());
    ASSERT_EQ(parsed.action->params.size(), 2u);
    EXPECT_EQ(parsed.action->params[0].key, "zeta");
    EXPECT_EQ(parsed.action->params[1].key, "alpha");
    EXPECT_EQ(parsed.action->param("alpha").value_or(""), "2");
    EXPECT_FALSE(parsed.action->param("missing").has_value());
}

TEST(SpecifierTest, Action_CanonicalForm) {
    auto parsed = parse_action({"allow", "user=root", "target=vault"});

    ASSERT_TRUE(parsed.action.has_value());
    EXPECT_EQ(to_string(*parsed.action), "allow target=vault user=root");
}

TEST(SpecifierTest, Action_EqualityIgnoresParameterOrder) {
    auto a = parse_action({"allow", "user=root", "notify=yes"});
    auto b = parse_action({"allow", "notify=yes", "user=root"});
    auto c = parse_action({"allow", "notify=no", "user=root"});

    EXPECT_EQ(*a.action, *b.action);
    EXPECT_NE(*a.action, *c.action);
}

}  // namespace qrpolicy::test

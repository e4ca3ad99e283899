/*
 * Copyright 2010, OpenLDAP Foundation, All Rights Reserved.
 * COPYING RESTRICTIONS APPLY, see COPYRIGHT file
 */

#include <gtest/gtest.h>
#include <ldap.h>

#include <string>

#include "LDAPAttrSyntax.h"
#include "LDAPCoreSchema.h"
#include "LDAPMatchRule.h"
#include "LDAPMatchRuleImpl.h"
#include "LDAPSchemaException.h"
#include "StringList.h"

using namespace std;

static const LDAPMatchRuleImpl* coreRule(const char* oid){
    const LDAPMatchRuleImpl* impl = LDAPCoreSchema::getMatchRuleImpl(oid);
    EXPECT_TRUE(impl != 0) << oid;
    return impl;
}

TEST(MatchRuleImplTest, CaseIgnore){
    const LDAPMatchRuleImpl* eq = coreRule("2.5.13.2");
    ASSERT_TRUE(eq != 0);
    EXPECT_EQ(LDAPMatchRuleImpl::EQUALITY, eq->getKind());
    EXPECT_EQ("hello world", eq->normalizeValue("  Hello   World "));
    EXPECT_TRUE(eq->valuesMatch("  Hello   World ", "hello world"));
    EXPECT_FALSE(eq->valuesMatch("hello", "hello world"));

    const LDAPMatchRuleImpl* ord = coreRule("2.5.13.3");
    ASSERT_TRUE(ord != 0);
    EXPECT_EQ(LDAPMatchRuleImpl::ORDERING, ord->getKind());
    EXPECT_LT(ord->compareValues("apple", "Banana"), 0);
    EXPECT_GT(ord->compareValues("cherry", "BANANA"), 0);
    EXPECT_EQ(0, ord->compareValues("Same", "sAME"));
}

TEST(MatchRuleImplTest, CaseExact){
    const LDAPMatchRuleImpl* eq = coreRule("2.5.13.5");
    ASSERT_TRUE(eq != 0);
    EXPECT_TRUE(eq->valuesMatch(" Hello  World", "Hello World"));
    EXPECT_FALSE(eq->valuesMatch("Hello World", "hello world"));
}

TEST(MatchRuleImplTest, Integer){
    const LDAPMatchRuleImpl* eq = coreRule("2.5.13.14");
    const LDAPMatchRuleImpl* ord = coreRule("2.5.13.15");
    ASSERT_TRUE(eq != 0 && ord != 0);

    EXPECT_EQ("7", eq->normalizeValue("007"));
    EXPECT_EQ("-42", eq->normalizeValue(" -0042 "));
    EXPECT_EQ("0", eq->normalizeValue("-0"));
    EXPECT_TRUE(eq->valuesMatch("+15", "15"));
    EXPECT_LT(ord->compareValues("9", "10"), 0);
    EXPECT_LT(ord->compareValues("-5", "3"), 0);
    EXPECT_LT(ord->compareValues("-10", "-9"), 0);
    EXPECT_GT(ord->compareValues("100", "099"), 0);
}

TEST(MatchRuleImplTest, NumericStringAndBoolean){
    const LDAPMatchRuleImpl* numeric = coreRule("2.5.13.8");
    const LDAPMatchRuleImpl* boolean = coreRule("2.5.13.13");
    ASSERT_TRUE(numeric != 0 && boolean != 0);

    EXPECT_TRUE(numeric->valuesMatch("1 234 5", "12345"));
    EXPECT_FALSE(numeric->valuesMatch("12345", "1234"));
    EXPECT_TRUE(boolean->valuesMatch("true", "TRUE"));
    EXPECT_FALSE(boolean->valuesMatch("TRUE", "FALSE"));
}

TEST(MatchRuleImplTest, Approximate){
    const LDAPMatchRuleImpl* approx = coreRule("1.3.6.1.4.1.26027.1.4.1");
    ASSERT_TRUE(approx != 0);
    EXPECT_EQ(LDAPMatchRuleImpl::APPROXIMATE, approx->getKind());
    EXPECT_TRUE(approx->valuesMatch("Smith", "Smyth"));
    EXPECT_TRUE(approx->valuesMatch("Jon Smith", "john smyth"));
    EXPECT_FALSE(approx->valuesMatch("Smith", "Jones"));
}

TEST(MatchRuleImplTest, Substrings){
    const LDAPMatchRuleImpl* sub = coreRule("2.5.13.4");
    ASSERT_TRUE(sub != 0);
    EXPECT_EQ(LDAPMatchRuleImpl::SUBSTRING, sub->getKind());

    StringList any;
    any.add("N S");
    EXPECT_TRUE(sub->substringMatches("John Smith", "jo", any, "TH"));
    EXPECT_TRUE(sub->substringMatches("John Smith", "", StringList(), "smith"));
    EXPECT_TRUE(sub->substringMatches("John Smith", "john", StringList(), ""));
    EXPECT_FALSE(sub->substringMatches("John Smith", "smi", StringList(), ""));
    EXPECT_FALSE(sub->substringMatches("John Smith", "", any, "john"));

    // initial and final must not overlap
    EXPECT_FALSE(sub->substringMatches("abc", "ab", StringList(), "bc"));

    const LDAPMatchRuleImpl* exact = coreRule("2.5.13.7");
    ASSERT_TRUE(exact != 0);
    EXPECT_FALSE(exact->substringMatches("John Smith", "jo", StringList(), ""));
}

TEST(MatchRuleImplTest, DefaultIsOctetString){
    const LDAPMatchRuleImpl* def =
            LDAPMatchRuleImpl::getDefault(LDAPMatchRuleImpl::ORDERING);
    EXPECT_EQ(LDAPMatchRuleImpl::ORDERING, def->getKind());
    EXPECT_EQ(" A b ", def->normalizeValue(" A b "));
    EXPECT_FALSE(def->valuesMatch("a", "A"));
    EXPECT_LT(def->compareValues("A", "a"), 0);
    EXPECT_TRUE(LDAPCoreSchema::getMatchRuleImpl("1.2.3.4") == 0);
}

TEST(MatchRuleTest, ParsedCoreRuleGetsItsImplementation){
    LDAPMatchRule mr("( 2.5.13.2 NAME 'caseIgnoreMatch' "
            "SYNTAX 1.3.6.1.4.1.1466.115.121.1.15 )");
    EXPECT_EQ("2.5.13.2", mr.getOid());
    EXPECT_EQ("caseIgnoreMatch", mr.getNameOrOid());
    EXPECT_TRUE(mr.hasNameOrOid("CASEIGNOREMATCH"));
    EXPECT_TRUE(mr.hasNameOrOid("2.5.13.2"));
    EXPECT_EQ(LDAPCoreSchema::getMatchRuleImpl("2.5.13.2"), mr.getImpl());
    EXPECT_TRUE(mr.valuesMatch("ABC", "abc"));
}

TEST(MatchRuleTest, UnknownRulesCompareOctets){
    LDAPMatchRule eq("( 1.2.3.1 NAME 'localMatch' "
            "SYNTAX 1.3.6.1.4.1.1466.115.121.1.15 )");
    EXPECT_EQ(LDAPMatchRuleImpl::EQUALITY, eq.getKind());
    EXPECT_FALSE(eq.valuesMatch("ABC", "abc"));
    EXPECT_TRUE(eq.valuesMatch("abc", "abc"));

    LDAPMatchRule sub("( 1.2.3.2 NAME 'localSubstringsMatch' "
            "SYNTAX " LDAPSCHEMA_SUBSTRING_ASSERTION_SYNTAX " )");
    EXPECT_EQ(LDAPMatchRuleImpl::SUBSTRING, sub.getKind());

    LDAPMatchRule given("( 1.2.3.3 NAME 'givenMatch' "
            "SYNTAX 1.3.6.1.4.1.1466.115.121.1.15 )", LDAPSCHEMA_PARSE_FLAG,
            LDAPCoreSchema::getMatchRuleImpl("2.5.13.2"));
    EXPECT_TRUE(given.valuesMatch("ABC", "abc"));
}

TEST(MatchRuleTest, CanonicalDefinition){
    StringList names;
    names.add("m");
    LDAPMatchRule mr("1.2.3.4", names, "some rule", true,
            "1.3.6.1.4.1.1466.115.121.1.15");
    EXPECT_EQ("( 1.2.3.4 NAME 'm' DESC 'some rule' OBSOLETE "
            "SYNTAX 1.3.6.1.4.1.1466.115.121.1.15 )", mr.toString());

    LDAPMatchRule unnamed("1.2.3.5", StringList(), "", false, "1.2.3.6");
    EXPECT_EQ("( 1.2.3.5 SYNTAX 1.2.3.6 )", unnamed.toString());
    EXPECT_EQ("1.2.3.5", unnamed.getNameOrOid());
}

TEST(MatchRuleTest, RequiresOidAndSyntax){
    try{
        LDAPMatchRule mr("1.2.3.4", StringList(), "", false, "");
        FAIL() << "rule without syntax accepted";
    }catch(const LDAPSchemaException& e){
        EXPECT_EQ(LDAPSchemaException::MALFORMED_DEFINITION, e.getKind());
        EXPECT_EQ(LDAP_INVALID_SYNTAX, e.getResultCode());
    }
    EXPECT_THROW(LDAPMatchRule("", StringList(), "", false, "1.2.3.6"),
            LDAPSchemaException);
    EXPECT_THROW(LDAPMatchRule("( 1.2.3.4 NAME "), LDAPSchemaException);
}

TEST(MatchRuleTest, SyntaxIsNotReadableBeforeResolution){
    LDAPMatchRule mr("1.2.3.4", StringList(), "", false, "1.2.3.6");
    EXPECT_FALSE(mr.isResolved());
    EXPECT_THROW(mr.getSyntax(), LDAPSchemaException);
}

TEST(AttrSyntaxTest, ParsedCoreSyntaxHasDefaultRules){
    LDAPAttrSyntax syn("( " LDAPSCHEMA_DIRECTORY_STRING_SYNTAX
            " DESC 'Directory String' )");
    EXPECT_EQ(LDAPSCHEMA_DIRECTORY_STRING_SYNTAX, syn.getOid());
    EXPECT_EQ("Directory String", syn.getDescription());
    EXPECT_EQ("2.5.13.2",
            syn.getDefaultMatchingRuleOid(LDAPMatchRuleImpl::EQUALITY));
    EXPECT_EQ("2.5.13.3",
            syn.getDefaultMatchingRuleOid(LDAPMatchRuleImpl::ORDERING));
    EXPECT_EQ("2.5.13.4",
            syn.getDefaultMatchingRuleOid(LDAPMatchRuleImpl::SUBSTRING));

    LDAPAttrSyntax local("( 1.2.3.7 DESC 'Local' X-ORIGIN 'test' )");
    EXPECT_EQ("", local.getDefaultMatchingRuleOid(LDAPMatchRuleImpl::EQUALITY));
    ASSERT_TRUE(local.getExtraProperty("X-ORIGIN") != 0);
}

TEST(AttrSyntaxTest, CanonicalDefinition){
    LDAPAttrSyntax syn("1.2.3.8", "Local", "2.5.13.2");
    EXPECT_EQ("( 1.2.3.8 DESC 'Local' )", syn.toString());
    EXPECT_EQ("2.5.13.2",
            syn.getDefaultMatchingRuleOid(LDAPMatchRuleImpl::EQUALITY));

    LDAPAttrSyntax bare("1.2.3.9", "");
    EXPECT_EQ("( 1.2.3.9 )", bare.toString());
    EXPECT_THROW(LDAPAttrSyntax("", "no oid"), LDAPSchemaException);
}

TEST(AttrSyntaxTest, RulesAreNotReadableBeforeResolution){
    LDAPAttrSyntax syn("1.2.3.8", "Local", "2.5.13.2");
    EXPECT_FALSE(syn.isResolved());
    try{
        syn.getEqualityMatchingRule();
        FAIL() << "unresolved syntax returned a rule";
    }catch(const LDAPSchemaException& e){
        EXPECT_EQ(LDAPSchemaException::ILLEGAL_STATE, e.getKind());
        EXPECT_EQ(LDAP_OTHER, e.getResultCode());
    }
}

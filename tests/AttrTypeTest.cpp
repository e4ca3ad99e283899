/*
 * Copyright 2010, OpenLDAP Foundation, All Rights Reserved.
 * COPYING RESTRICTIONS APPLY, see COPYRIGHT file
 */

#include <gtest/gtest.h>

#include <list>
#include <map>
#include <string>

#include "LDAPAttrSyntax.h"
#include "LDAPAttrType.h"
#include "LDAPMatchRule.h"
#include "LDAPSchemaException.h"
#include "LDAPSchemaResolver.h"
#include "StringList.h"

using namespace std;

#define DIRECTORY_STRING "1.3.6.1.4.1.1466.115.121.1.15"

static LDAPAttrType makeType(const string& oid, const string& name,
        const string& sup, const string& syntax,
        LDAPAttrType::Usage usage=LDAPAttrType::USER_APPLICATIONS){
    StringList names;
    if(!name.empty()){
        names.add(name);
    }
    return LDAPAttrType(oid, names, "", false, sup, "", "", "", "", syntax,
            false, false, usage != LDAPAttrType::USER_APPLICATIONS, usage);
}

static LDAPSchemaException::ErrorKind constructionFailure(
        const string& definition){
    try{
        LDAPAttrType at(definition);
    }catch(const LDAPSchemaException& e){
        return e.getKind();
    }
    return LDAPSchemaException::ILLEGAL_STATE;
}

static size_t occurrences(const string& s, const string& part){
    size_t count = 0;
    for(string::size_type pos = s.find(part); pos != string::npos;
            pos = s.find(part, pos + part.size())){
        count++;
    }
    return count;
}

// hands out the definitions registered with it, throws for all others
class MapResolver : public LDAPSchemaResolver{
    public :
        void add(const LDAPAttrType& at){
            m_types[at.getNameOrOid()] = &at;
        }
        void add(const LDAPAttrSyntax& syn){
            m_syntaxes[syn.getOid()] = &syn;
        }
        void add(const LDAPMatchRule& mr){
            m_rules[mr.getNameOrOid()] = &mr;
        }

        const LDAPAttrType* getAttributeType(const string& nameOrOid){
            return find(m_types, nameOrOid);
        }
        const LDAPAttrSyntax* getSyntax(const string& nameOrOid){
            return find(m_syntaxes, nameOrOid);
        }
        const LDAPMatchRule* getMatchingRule(const string& nameOrOid){
            return find(m_rules, nameOrOid);
        }

    private :
        template <class T>
        static const T* find(const map<string, const T*>& defs,
                const string& nameOrOid){
            typename map<string, const T*>::const_iterator i =
                    defs.find(nameOrOid);
            if(i == defs.end()){
                throw LDAPSchemaException(
                        LDAPSchemaException::UNRESOLVED_REFERENCE,
                        nameOrOid, "not registered");
            }
            return i->second;
        }

        map<string, const LDAPAttrType*> m_types;
        map<string, const LDAPAttrSyntax*> m_syntaxes;
        map<string, const LDAPMatchRule*> m_rules;
};

class AttrTypeValidateTest : public ::testing::Test{
    protected :
        AttrTypeValidateTest() :
                syntax("1.2.3.70", "Local"),
                rule("1.2.3.71", StringList(), "", false, "1.2.3.70"){
        }

        void SetUp(){
            resolver.add(syntax);
            resolver.add(rule);
            list<LDAPSchemaException> warnings;
            syntax.validate(resolver, warnings);
            rule.validate(resolver);
        }

        static LDAPAttrType withEquality(const string& oid, const string& sup,
                bool collective, LDAPAttrType::Usage usage){
            StringList names;
            names.add("type" + oid.substr(oid.rfind('.') + 1));
            return LDAPAttrType(oid, names, "", false, sup, "1.2.3.71", "", "",
                    "", sup.empty() ? "1.2.3.70" : "", false, collective,
                    usage != LDAPAttrType::USER_APPLICATIONS, usage);
        }

        LDAPAttrSyntax syntax;
        LDAPMatchRule rule;
        MapResolver resolver;
};

TEST(AttrTypeTest, IdentityIsTheOid){
    StringList names;
    names.add("other");
    LDAPAttrType a = makeType("1.2.3.1", "first", "", DIRECTORY_STRING);
    LDAPAttrType b("1.2.3.1", names, "differs", true, "name", "", "", "",
            "", "", false, false, false, LDAPAttrType::USER_APPLICATIONS);
    LDAPAttrType c = makeType("1.2.3.2", "first", "", DIRECTORY_STRING);

    EXPECT_TRUE(a == b);
    EXPECT_FALSE(a != b);
    EXPECT_EQ(a.hashCode(), b.hashCode());
    EXPECT_TRUE(a != c);
    EXPECT_FALSE(a == c);
}

TEST(AttrTypeTest, NameOrOid){
    StringList names;
    names.add("cn");
    names.add("commonName");
    LDAPAttrType named("2.5.4.3", names, "", false, "name", "", "", "", "",
            "", false, false, false, LDAPAttrType::USER_APPLICATIONS);
    LDAPAttrType unnamed = makeType("1.2.3.4", "", "", DIRECTORY_STRING);

    EXPECT_EQ("cn", named.getNameOrOid());
    EXPECT_EQ("1.2.3.4", unnamed.getNameOrOid());
    EXPECT_TRUE(named.hasNameOrOid(named.getNameOrOid()));
    EXPECT_TRUE(unnamed.hasNameOrOid(unnamed.getNameOrOid()));

    EXPECT_TRUE(named.hasName("COMMONNAME"));
    EXPECT_TRUE(named.hasNameOrOid("CN"));
    EXPECT_TRUE(named.hasNameOrOid("2.5.4.3"));
    EXPECT_FALSE(named.hasName("2.5.4.3"));
    EXPECT_FALSE(named.hasNameOrOid("sn"));
    EXPECT_FALSE(unnamed.hasName("1.2.3.4"));
}

TEST(AttrTypeTest, ObjectClassIsRecognizedByOid){
    EXPECT_TRUE(makeType("2.5.4.0", "objectClass", "",
            "1.3.6.1.4.1.1466.115.121.1.38").isObjectClass());
    EXPECT_TRUE(makeType("2.5.4.0", "", "",
            "1.3.6.1.4.1.1466.115.121.1.38").isObjectClass());
    EXPECT_FALSE(makeType("1.2.3.5", "objectClass", "",
            "1.3.6.1.4.1.1466.115.121.1.38").isObjectClass());
}

TEST(AttrTypeTest, RejectsIncompleteDefinitions){
    EXPECT_EQ(LDAPSchemaException::MALFORMED_DEFINITION,
            constructionFailure("( 1.2.3.6 NAME 'nothing' )"));
    EXPECT_EQ(LDAPSchemaException::MALFORMED_DEFINITION,
            constructionFailure("( 1.2.3.7 NAME 'unterminated'"));
    EXPECT_EQ(LDAPSchemaException::MALFORMED_DEFINITION,
            constructionFailure("not a definition"));
    EXPECT_THROW(makeType("", "noOid", "", DIRECTORY_STRING),
            LDAPSchemaException);
    EXPECT_THROW(makeType("1.2.3.8", "noSyntax", "", ""),
            LDAPSchemaException);
}

TEST(AttrTypeTest, RejectsDuplicateNames){
    EXPECT_EQ(LDAPSchemaException::MALFORMED_DEFINITION,
            constructionFailure("( 1.2.3.5 NAME ( 'cn' 'CN' ) SUP name )"));

    StringList names;
    names.add("twin");
    names.add("other");
    names.add("Twin");
    try{
        LDAPAttrType at("1.2.3.5", names, "", false, "name", "", "", "", "",
                "", false, false, false, LDAPAttrType::USER_APPLICATIONS);
        FAIL() << "duplicate name accepted";
    }catch(const LDAPSchemaException& e){
        EXPECT_EQ(LDAPSchemaException::MALFORMED_DEFINITION, e.getKind());
        EXPECT_EQ("1.2.3.5", e.getDefinition());
    }

    LDAPAttrType distinct("( 1.2.3.5 NAME ( 'cn' 'commonName' ) SUP name )");
    EXPECT_EQ(2u, distinct.getNames().size());
}

TEST(AttrTypeTest, ApproximateRuleFromFieldsAndExtension){
    LDAPExtraProperties extra;
    StringList approx;
    approx.add("1.2.3.99");
    StringList origin;
    origin.add("test");
    extra.push_back(make_pair(string("X-APPROX-MATCHING-RULE"), approx));
    extra.push_back(make_pair(string("X-ORIGIN"), origin));

    StringList names;
    names.add("approx");
    LDAPAttrType both("1.2.3.80", names, "", false, "", "", "", "",
            "1.2.3.98", DIRECTORY_STRING, false, false, false,
            LDAPAttrType::USER_APPLICATIONS, extra);
    EXPECT_EQ("1.2.3.98", both.getApproximateMatchingRuleOid());
    EXPECT_TRUE(both.getExtraProperty("X-APPROX-MATCHING-RULE") == 0);
    ASSERT_TRUE(both.getExtraProperty("X-ORIGIN") != 0);
    EXPECT_EQ(1u, occurrences(both.toString(), "X-APPROX-MATCHING-RULE"));
    EXPECT_EQ(1u, occurrences(both.toString(), "'1.2.3.98'"));
    EXPECT_EQ(0u, occurrences(both.toString(), "1.2.3.99"));

    LDAPAttrType extensionOnly("1.2.3.81", names, "", false, "", "", "", "",
            "", DIRECTORY_STRING, false, false, false,
            LDAPAttrType::USER_APPLICATIONS, extra);
    EXPECT_EQ("1.2.3.99", extensionOnly.getApproximateMatchingRuleOid());
    EXPECT_TRUE(extensionOnly.getExtraProperty("X-APPROX-MATCHING-RULE") == 0);
    EXPECT_EQ(1u, occurrences(extensionOnly.toString(),
            "X-APPROX-MATCHING-RULE '1.2.3.99'"));
    EXPECT_EQ(1u, occurrences(extensionOnly.toString(), "X-ORIGIN"));

    // rebuilding from the fields gives the same definition
    LDAPAttrType rebuilt(extensionOnly.canonicalDefinition());
    EXPECT_EQ(extensionOnly.canonicalDefinition(),
            rebuilt.canonicalDefinition());
}

TEST(AttrTypeTest, ParsesAllFields){
    LDAPAttrType at("( 1.2.3.9 NAME ( 'one' 'two' ) DESC 'some text' "
            "OBSOLETE SUP name EQUALITY caseExactMatch "
            "ORDERING caseExactOrderingMatch "
            "SUBSTR caseExactSubstringsMatch "
            "SYNTAX " DIRECTORY_STRING " SINGLE-VALUE "
            "X-APPROX-MATCHING-RULE '1.3.6.1.4.1.26027.1.4.1' "
            "X-ORIGIN 'test' )");

    EXPECT_EQ("1.2.3.9", at.getOid());
    EXPECT_EQ(2u, at.getNames().size());
    EXPECT_EQ("one", at.getNameOrOid());
    EXPECT_EQ("some text", at.getDescription());
    EXPECT_TRUE(at.isObsolete());
    EXPECT_EQ("name", at.getSuperiorTypeOid());
    EXPECT_EQ("caseExactMatch", at.getEqualityMatchingRuleOid());
    EXPECT_EQ("caseExactOrderingMatch", at.getOrderingMatchingRuleOid());
    EXPECT_EQ("caseExactSubstringsMatch", at.getSubstringMatchingRuleOid());
    EXPECT_EQ("1.3.6.1.4.1.26027.1.4.1", at.getApproximateMatchingRuleOid());
    EXPECT_EQ(DIRECTORY_STRING, at.getSyntaxOid());
    EXPECT_TRUE(at.isSingle());
    EXPECT_FALSE(at.isCollective());
    EXPECT_FALSE(at.isNoUserModification());
    EXPECT_FALSE(at.isOperational());
    EXPECT_EQ(LDAPAttrType::USER_APPLICATIONS, at.getUsage());

    // the approximate rule is a field, not an extra property
    EXPECT_TRUE(at.getExtraProperty(LDAPSCHEMA_APPROX_RULE_PROPERTY) == 0);
    const StringList* origin = at.getExtraProperty("x-origin");
    ASSERT_TRUE(origin != 0);
    EXPECT_EQ("test", origin->front());
}

TEST(AttrTypeTest, ParsedDefinitionIsKeptVerbatim){
    string definition = "( 1.2.3.10   NAME 'spaced'  SUP name )";
    LDAPAttrType at(definition);
    EXPECT_EQ(definition, at.toString());
    EXPECT_EQ("( 1.2.3.10 NAME 'spaced' SUP name USAGE userApplications )",
            at.canonicalDefinition());
}

TEST(AttrTypeTest, CanonicalDefinitionRoundTrip){
    const char* definitions[] = {
        "( 1.2.3.11 NAME 'single' SYNTAX " DIRECTORY_STRING
            " USAGE userApplications )",
        "( 1.2.3.12 NAME ( 'first' 'second' 'third' ) SUP name"
            " USAGE userApplications )",
        "( 1.2.3.13 SYNTAX " DIRECTORY_STRING " USAGE userApplications )",
        "( 1.2.3.14 NAME 'described' DESC 'a description' OBSOLETE"
            " SUP name EQUALITY caseExactMatch"
            " ORDERING caseExactOrderingMatch"
            " SUBSTR caseExactSubstringsMatch SYNTAX " DIRECTORY_STRING
            " SINGLE-VALUE USAGE userApplications )",
        "( 1.2.3.15 NAME 'shared' SUP name COLLECTIVE"
            " USAGE userApplications )",
        "( 1.2.3.16 NAME 'stamp' SYNTAX 1.3.6.1.4.1.1466.115.121.1.24"
            " NO-USER-MODIFICATION USAGE directoryOperation )",
        "( 1.2.3.17 NAME 'distributed' SYNTAX " DIRECTORY_STRING
            " USAGE distributedOperation )",
        "( 1.2.3.18 NAME 'local' SYNTAX " DIRECTORY_STRING
            " USAGE dSAOperation )",
        "( 1.2.3.19 NAME 'sounds' SYNTAX " DIRECTORY_STRING
            " USAGE userApplications"
            " X-APPROX-MATCHING-RULE '1.3.6.1.4.1.26027.1.4.1' )",
        "( 1.2.3.20 NAME 'origin' SYNTAX " DIRECTORY_STRING
            " USAGE userApplications X-ORIGIN 'RFC 4519' )",
        "( 1.2.3.21 NAME 'origins' SYNTAX " DIRECTORY_STRING
            " USAGE userApplications X-ORIGIN ( 'one' 'two' ) )",
        0
    };

    for(const char** d = definitions; *d != 0; d++){
        SCOPED_TRACE(*d);
        LDAPAttrType parsed(*d);
        EXPECT_EQ(*d, parsed.toString());
        EXPECT_EQ(*d, parsed.canonicalDefinition());

        LDAPAttrType rebuilt(parsed.getOid(), parsed.getNames(),
                parsed.getDescription(), parsed.isObsolete(),
                parsed.getSuperiorTypeOid(),
                parsed.getEqualityMatchingRuleOid(),
                parsed.getOrderingMatchingRuleOid(),
                parsed.getSubstringMatchingRuleOid(),
                parsed.getApproximateMatchingRuleOid(),
                parsed.getSyntaxOid(), parsed.isSingle(),
                parsed.isCollective(), parsed.isNoUserModification(),
                parsed.getUsage(), parsed.getExtraProperties());
        EXPECT_EQ(*d, rebuilt.toString());
    }
}

TEST(AttrTypeTest, CanonicalOrdering){
    LDAPAttrType objectClass = makeType("2.5.4.0", "objectClass", "",
            "1.3.6.1.4.1.1466.115.121.1.38");
    LDAPAttrType alpha = makeType("1.2.3.30", "alpha", "", DIRECTORY_STRING);
    LDAPAttrType beta = makeType("1.2.3.31", "Beta", "", DIRECTORY_STRING);
    LDAPAttrType operational = makeType("1.2.3.32", "aaa", "",
            DIRECTORY_STRING, LDAPAttrType::DSA_OPERATION);
    LDAPAttrType unnamed = makeType("9.9.9", "", "", DIRECTORY_STRING);

    EXPECT_EQ(0, objectClass.compareTo(objectClass));
    EXPECT_EQ(-1, objectClass.compareTo(alpha));
    EXPECT_EQ(-1, objectClass.compareTo(operational));
    EXPECT_EQ(1, operational.compareTo(objectClass));

    // user attributes come before operational ones, whatever the name
    EXPECT_EQ(-1, beta.compareTo(operational));
    EXPECT_EQ(1, operational.compareTo(beta));

    EXPECT_EQ(-1, alpha.compareTo(beta));
    EXPECT_EQ(1, beta.compareTo(alpha));
    EXPECT_EQ(0, alpha.compareTo(alpha));
    EXPECT_EQ(-1, unnamed.compareTo(alpha));

    EXPECT_TRUE(objectClass < alpha);
    EXPECT_TRUE(alpha < beta);
    EXPECT_FALSE(beta < alpha);
}

TEST(AttrTypeTest, ResolvedStateIsNotReadableBeforeResolution){
    LDAPAttrType at = makeType("1.2.3.40", "unresolved", "name", "");
    EXPECT_FALSE(at.isResolved());
    EXPECT_EQ("name", at.getSuperiorTypeOid());

    try{
        at.getSyntax();
        FAIL() << "getSyntax() returned on an unresolved type";
    }catch(const LDAPSchemaException& e){
        EXPECT_EQ(LDAPSchemaException::ILLEGAL_STATE, e.getKind());
        EXPECT_EQ("unresolved", e.getDefinition());
    }
    EXPECT_THROW(at.getSuperiorType(), LDAPSchemaException);
    EXPECT_THROW(at.getEqualityMatchingRule(), LDAPSchemaException);
    EXPECT_THROW(at.getApproximateMatchingRule(), LDAPSchemaException);
    EXPECT_THROW(at.isSubTypeOf(at), LDAPSchemaException);
}

TEST(AttrTypeTest, UsageNames){
    EXPECT_STREQ("userApplications",
            LDAPAttrType::usageToString(LDAPAttrType::USER_APPLICATIONS));
    EXPECT_STREQ("directoryOperation",
            LDAPAttrType::usageToString(LDAPAttrType::DIRECTORY_OPERATION));
    EXPECT_STREQ("distributedOperation",
            LDAPAttrType::usageToString(LDAPAttrType::DISTRIBUTED_OPERATION));
    EXPECT_STREQ("dSAOperation",
            LDAPAttrType::usageToString(LDAPAttrType::DSA_OPERATION));
}

TEST_F(AttrTypeValidateTest, ResolvesThroughResolver){
    LDAPAttrType superior = withEquality("1.2.3.72", "", false,
            LDAPAttrType::USER_APPLICATIONS);
    superior.validate(resolver);
    ASSERT_TRUE(superior.isResolved());
    EXPECT_EQ(&syntax, superior.getSyntax());
    EXPECT_EQ(&rule, superior.getEqualityMatchingRule());
    EXPECT_TRUE(superior.getOrderingMatchingRule() == 0);

    resolver.add(superior);
    StringList names;
    names.add("subType");
    LDAPAttrType sub("1.2.3.73", names, "", false, "type72", "", "", "",
            "", "", false, false, false, LDAPAttrType::USER_APPLICATIONS);
    sub.validate(resolver);
    ASSERT_TRUE(sub.isResolved());
    EXPECT_EQ(&superior, sub.getSuperiorType());
    EXPECT_EQ(&syntax, sub.getSyntax());
    EXPECT_EQ(&rule, sub.getEqualityMatchingRule());
}

TEST_F(AttrTypeValidateTest, SuperiorUsageMismatchLeavesTypeUnresolved){
    LDAPAttrType superior = withEquality("1.2.3.74", "", false,
            LDAPAttrType::DIRECTORY_OPERATION);
    resolver.add(superior);
    LDAPAttrType sub = withEquality("1.2.3.75", "type74", false,
            LDAPAttrType::USER_APPLICATIONS);

    try{
        sub.validate(resolver);
        FAIL() << "usage mismatch accepted";
    }catch(const LDAPSchemaException& e){
        EXPECT_EQ(LDAPSchemaException::INVALID_SUPERIOR_RELATIONSHIP,
                e.getKind());
        EXPECT_EQ("type75", e.getDefinition());
    }
    EXPECT_FALSE(sub.isResolved());
    try{
        sub.getEqualityMatchingRule();
        FAIL() << "rule of an unresolved type returned";
    }catch(const LDAPSchemaException& e){
        EXPECT_EQ(LDAPSchemaException::ILLEGAL_STATE, e.getKind());
    }
    EXPECT_THROW(sub.getSuperiorType(), LDAPSchemaException);
}

TEST_F(AttrTypeValidateTest, CollectiveOperationalLeavesTypeUnresolved){
    LDAPAttrType at = withEquality("1.2.3.76", "", true,
            LDAPAttrType::DIRECTORY_OPERATION);

    try{
        at.validate(resolver);
        FAIL() << "collective operational type accepted";
    }catch(const LDAPSchemaException& e){
        EXPECT_EQ(LDAPSchemaException::INVALID_USAGE_COMBINATION,
                e.getKind());
    }
    // the rules were looked up before the check, none of them is kept
    EXPECT_FALSE(at.isResolved());
    try{
        at.getEqualityMatchingRule();
        FAIL() << "rule of an unresolved type returned";
    }catch(const LDAPSchemaException& e){
        EXPECT_EQ(LDAPSchemaException::ILLEGAL_STATE, e.getKind());
    }
    EXPECT_THROW(at.getSyntax(), LDAPSchemaException);
}

TEST_F(AttrTypeValidateTest, UnknownReferencesAreUnresolved){
    StringList names;
    names.add("lost");
    LDAPAttrType unknownRule("1.2.3.77", names, "", false, "", "1.2.3.99",
            "", "", "", "1.2.3.70", false, false, false,
            LDAPAttrType::USER_APPLICATIONS);
    try{
        unknownRule.validate(resolver);
        FAIL() << "unknown matching rule accepted";
    }catch(const LDAPSchemaException& e){
        EXPECT_EQ(LDAPSchemaException::UNRESOLVED_REFERENCE, e.getKind());
        EXPECT_EQ("lost", e.getDefinition());
    }
    EXPECT_FALSE(unknownRule.isResolved());

    LDAPAttrType unknownSuperior = withEquality("1.2.3.78", "missing", false,
            LDAPAttrType::USER_APPLICATIONS);
    EXPECT_THROW(unknownSuperior.validate(resolver), LDAPSchemaException);
    EXPECT_FALSE(unknownSuperior.isResolved());
}

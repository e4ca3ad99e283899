/*
 * Copyright 2010, OpenLDAP Foundation, All Rights Reserved.
 * COPYING RESTRICTIONS APPLY, see COPYRIGHT file
 */

#include <vector>

#include "debug.h"
#include "LDAPCoreSchema.h"
#include "LDAPSchemaBuilder.h"

using namespace std;

#define APPROX_MATCH_OID "1.3.6.1.4.1.26027.1.4.1"

struct syntax_def {
    const char *sd_desc;
    const char *sd_rules[LDAPMatchRuleImpl::LASTKIND];
};

struct mrule_def {
    const char *md_oid;
    const char *md_desc;
    LDAPMatchRuleImpl::Kind md_kind;
    LDAPNormalizeFunc md_normalize;
    LDAPCompareFunc md_compare;
};

/* default rules in the order EQUALITY, ORDERING, SUBSTR, APPROX */
static const syntax_def syntax_defs[] = {
    {"( 1.3.6.1.4.1.1466.115.121.1.7 DESC 'Boolean' )",
        {"2.5.13.13", 0, 0, 0}},
    {"( 1.3.6.1.4.1.1466.115.121.1.12 DESC 'DN' )",
        {"2.5.13.1", 0, 0, 0}},
    {"( 1.3.6.1.4.1.1466.115.121.1.15 DESC 'Directory String' )",
        {"2.5.13.2", "2.5.13.3", "2.5.13.4", APPROX_MATCH_OID}},
    {"( 1.3.6.1.4.1.1466.115.121.1.24 DESC 'Generalized Time' )",
        {"2.5.13.27", "2.5.13.28", 0, 0}},
    {"( 1.3.6.1.4.1.1466.115.121.1.26 DESC 'IA5 String' )",
        {"1.3.6.1.4.1.1466.109.114.2", 0, "1.3.6.1.4.1.1466.109.114.3",
            APPROX_MATCH_OID}},
    {"( 1.3.6.1.4.1.1466.115.121.1.27 DESC 'INTEGER' )",
        {"2.5.13.14", "2.5.13.15", 0, 0}},
    {"( 1.3.6.1.4.1.1466.115.121.1.36 DESC 'Numeric String' )",
        {"2.5.13.8", "2.5.13.9", "2.5.13.10", 0}},
    {"( 1.3.6.1.4.1.1466.115.121.1.38 DESC 'OID' )",
        {"2.5.13.0", 0, 0, 0}},
    {"( 1.3.6.1.4.1.1466.115.121.1.40 DESC 'Octet String' )",
        {"2.5.13.17", "2.5.13.18", 0, 0}},
    {"( 1.3.6.1.4.1.1466.115.121.1.44 DESC 'Printable String' )",
        {"2.5.13.2", "2.5.13.3", "2.5.13.4", APPROX_MATCH_OID}},
    {"( 1.3.6.1.4.1.1466.115.121.1.58 DESC 'Substring Assertion' )",
        {0, 0, 0, 0}},
    {0, {0, 0, 0, 0}}
};

static const mrule_def mrule_defs[] = {
    {"2.5.13.0", "( 2.5.13.0 NAME 'objectIdentifierMatch' "
        "SYNTAX 1.3.6.1.4.1.1466.115.121.1.38 )",
        LDAPMatchRuleImpl::EQUALITY, case_ignore_normalize,
        octet_string_compare},
    {"2.5.13.1", "( 2.5.13.1 NAME 'distinguishedNameMatch' "
        "SYNTAX 1.3.6.1.4.1.1466.115.121.1.12 )",
        LDAPMatchRuleImpl::EQUALITY, case_ignore_normalize,
        octet_string_compare},
    {"2.5.13.2", "( 2.5.13.2 NAME 'caseIgnoreMatch' "
        "SYNTAX 1.3.6.1.4.1.1466.115.121.1.15 )",
        LDAPMatchRuleImpl::EQUALITY, case_ignore_normalize,
        octet_string_compare},
    {"2.5.13.3", "( 2.5.13.3 NAME 'caseIgnoreOrderingMatch' "
        "SYNTAX 1.3.6.1.4.1.1466.115.121.1.15 )",
        LDAPMatchRuleImpl::ORDERING, case_ignore_normalize,
        octet_string_compare},
    {"2.5.13.4", "( 2.5.13.4 NAME 'caseIgnoreSubstringsMatch' "
        "SYNTAX 1.3.6.1.4.1.1466.115.121.1.58 )",
        LDAPMatchRuleImpl::SUBSTRING, case_ignore_normalize,
        octet_string_compare},
    {"2.5.13.5", "( 2.5.13.5 NAME 'caseExactMatch' "
        "SYNTAX 1.3.6.1.4.1.1466.115.121.1.15 )",
        LDAPMatchRuleImpl::EQUALITY, case_exact_normalize,
        octet_string_compare},
    {"2.5.13.6", "( 2.5.13.6 NAME 'caseExactOrderingMatch' "
        "SYNTAX 1.3.6.1.4.1.1466.115.121.1.15 )",
        LDAPMatchRuleImpl::ORDERING, case_exact_normalize,
        octet_string_compare},
    {"2.5.13.7", "( 2.5.13.7 NAME 'caseExactSubstringsMatch' "
        "SYNTAX 1.3.6.1.4.1.1466.115.121.1.58 )",
        LDAPMatchRuleImpl::SUBSTRING, case_exact_normalize,
        octet_string_compare},
    {"2.5.13.8", "( 2.5.13.8 NAME 'numericStringMatch' "
        "SYNTAX 1.3.6.1.4.1.1466.115.121.1.36 )",
        LDAPMatchRuleImpl::EQUALITY, numeric_string_normalize,
        octet_string_compare},
    {"2.5.13.9", "( 2.5.13.9 NAME 'numericStringOrderingMatch' "
        "SYNTAX 1.3.6.1.4.1.1466.115.121.1.36 )",
        LDAPMatchRuleImpl::ORDERING, numeric_string_normalize,
        octet_string_compare},
    {"2.5.13.10", "( 2.5.13.10 NAME 'numericStringSubstringsMatch' "
        "SYNTAX 1.3.6.1.4.1.1466.115.121.1.58 )",
        LDAPMatchRuleImpl::SUBSTRING, numeric_string_normalize,
        octet_string_compare},
    {"2.5.13.13", "( 2.5.13.13 NAME 'booleanMatch' "
        "SYNTAX 1.3.6.1.4.1.1466.115.121.1.7 )",
        LDAPMatchRuleImpl::EQUALITY, boolean_normalize,
        octet_string_compare},
    {"2.5.13.14", "( 2.5.13.14 NAME 'integerMatch' "
        "SYNTAX 1.3.6.1.4.1.1466.115.121.1.27 )",
        LDAPMatchRuleImpl::EQUALITY, integer_normalize, integer_compare},
    {"2.5.13.15", "( 2.5.13.15 NAME 'integerOrderingMatch' "
        "SYNTAX 1.3.6.1.4.1.1466.115.121.1.27 )",
        LDAPMatchRuleImpl::ORDERING, integer_normalize, integer_compare},
    {"2.5.13.17", "( 2.5.13.17 NAME 'octetStringMatch' "
        "SYNTAX 1.3.6.1.4.1.1466.115.121.1.40 )",
        LDAPMatchRuleImpl::EQUALITY, octet_string_normalize,
        octet_string_compare},
    {"2.5.13.18", "( 2.5.13.18 NAME 'octetStringOrderingMatch' "
        "SYNTAX 1.3.6.1.4.1.1466.115.121.1.40 )",
        LDAPMatchRuleImpl::ORDERING, octet_string_normalize,
        octet_string_compare},
    {"2.5.13.27", "( 2.5.13.27 NAME 'generalizedTimeMatch' "
        "SYNTAX 1.3.6.1.4.1.1466.115.121.1.24 )",
        LDAPMatchRuleImpl::EQUALITY, octet_string_normalize,
        octet_string_compare},
    {"2.5.13.28", "( 2.5.13.28 NAME 'generalizedTimeOrderingMatch' "
        "SYNTAX 1.3.6.1.4.1.1466.115.121.1.24 )",
        LDAPMatchRuleImpl::ORDERING, octet_string_normalize,
        octet_string_compare},
    {"1.3.6.1.4.1.1466.109.114.1", "( 1.3.6.1.4.1.1466.109.114.1 "
        "NAME 'caseExactIA5Match' SYNTAX 1.3.6.1.4.1.1466.115.121.1.26 )",
        LDAPMatchRuleImpl::EQUALITY, case_exact_normalize,
        octet_string_compare},
    {"1.3.6.1.4.1.1466.109.114.2", "( 1.3.6.1.4.1.1466.109.114.2 "
        "NAME 'caseIgnoreIA5Match' SYNTAX 1.3.6.1.4.1.1466.115.121.1.26 )",
        LDAPMatchRuleImpl::EQUALITY, case_ignore_normalize,
        octet_string_compare},
    {"1.3.6.1.4.1.1466.109.114.3", "( 1.3.6.1.4.1.1466.109.114.3 "
        "NAME 'caseIgnoreIA5SubstringsMatch' "
        "SYNTAX 1.3.6.1.4.1.1466.115.121.1.58 )",
        LDAPMatchRuleImpl::SUBSTRING, case_ignore_normalize,
        octet_string_compare},
    {APPROX_MATCH_OID, "( " APPROX_MATCH_OID " "
        "NAME 'ds-mr-double-metaphone-approx' "
        "SYNTAX 1.3.6.1.4.1.1466.115.121.1.15 )",
        LDAPMatchRuleImpl::APPROXIMATE, approx_normalize,
        octet_string_compare},
    {0, 0, LDAPMatchRuleImpl::EQUALITY, 0, 0}
};

static const char *attrtype_defs[] = {
    "( 2.5.4.0 NAME 'objectClass' EQUALITY objectIdentifierMatch "
        "SYNTAX 1.3.6.1.4.1.1466.115.121.1.38 )",
    "( 2.5.4.1 NAME 'aliasedObjectName' EQUALITY distinguishedNameMatch "
        "SYNTAX 1.3.6.1.4.1.1466.115.121.1.12 SINGLE-VALUE )",
    "( 2.5.4.41 NAME 'name' EQUALITY caseIgnoreMatch "
        "SUBSTR caseIgnoreSubstringsMatch "
        "SYNTAX 1.3.6.1.4.1.1466.115.121.1.15 )",
    "( 2.5.4.3 NAME ( 'cn' 'commonName' ) SUP name )",
    "( 2.5.4.4 NAME ( 'sn' 'surname' ) SUP name )",
    "( 2.5.4.13 NAME 'description' EQUALITY caseIgnoreMatch "
        "SUBSTR caseIgnoreSubstringsMatch "
        "SYNTAX 1.3.6.1.4.1.1466.115.121.1.15 )",
    "( 2.5.18.1 NAME 'createTimestamp' EQUALITY generalizedTimeMatch "
        "ORDERING generalizedTimeOrderingMatch "
        "SYNTAX 1.3.6.1.4.1.1466.115.121.1.24 "
        "SINGLE-VALUE NO-USER-MODIFICATION USAGE directoryOperation )",
    "( 2.5.18.2 NAME 'modifyTimestamp' EQUALITY generalizedTimeMatch "
        "ORDERING generalizedTimeOrderingMatch "
        "SYNTAX 1.3.6.1.4.1.1466.115.121.1.24 "
        "SINGLE-VALUE NO-USER-MODIFICATION USAGE directoryOperation )",
    "( 2.5.18.3 NAME 'creatorsName' EQUALITY distinguishedNameMatch "
        "SYNTAX 1.3.6.1.4.1.1466.115.121.1.12 "
        "SINGLE-VALUE NO-USER-MODIFICATION USAGE directoryOperation )",
    "( 2.5.18.4 NAME 'modifiersName' EQUALITY distinguishedNameMatch "
        "SYNTAX 1.3.6.1.4.1.1466.115.121.1.12 "
        "SINGLE-VALUE NO-USER-MODIFICATION USAGE directoryOperation )",
    "( 2.5.18.10 NAME 'subschemaSubentry' "
        "EQUALITY distinguishedNameMatch "
        "SYNTAX 1.3.6.1.4.1.1466.115.121.1.12 "
        "SINGLE-VALUE NO-USER-MODIFICATION USAGE directoryOperation )",
    0
};

static vector<LDAPBasicMatchRuleImpl> buildCoreImpls(){
    vector<LDAPBasicMatchRuleImpl> impls;
    for(const mrule_def *d = mrule_defs; d->md_oid != 0; d++){
        impls.push_back(LDAPBasicMatchRuleImpl(d->md_kind,
                d->md_normalize, d->md_compare));
    }
    return impls;
}

// index aligned with mrule_defs
static const vector<LDAPBasicMatchRuleImpl>& coreImpls(){
    static const vector<LDAPBasicMatchRuleImpl> impls = buildCoreImpls();
    return impls;
}

void LDAPCoreSchema::addCoreSchema(LDAPSchemaBuilder& builder){
    LDAPSCHEMA_DEBUG(LDAPSCHEMA_DEBUG_TRACE,
            "LDAPCoreSchema::addCoreSchema()" << endl);
    for(const syntax_def *s = syntax_defs; s->sd_desc != 0; s++){
        builder.addSyntax(s->sd_desc);
    }
    for(const mrule_def *m = mrule_defs; m->md_oid != 0; m++){
        builder.addMatchingRule(m->md_desc);
    }
    for(const char **a = attrtype_defs; *a != 0; a++){
        builder.addAttributeType(*a);
    }
}

const char* LDAPCoreSchema::getDefaultMatchingRule(const string& syntaxOid,
        LDAPMatchRuleImpl::Kind kind){
    if(kind < LDAPMatchRuleImpl::EQUALITY || kind >= LDAPMatchRuleImpl::LASTKIND){
        return 0;
    }
    // definitions all start with "( " followed by the OID and a blank
    string prefix = "( " + syntaxOid + " ";
    for(const syntax_def *s = syntax_defs; s->sd_desc != 0; s++){
        if(string(s->sd_desc).compare(0, prefix.size(), prefix) == 0){
            return s->sd_rules[kind];
        }
    }
    return 0;
}

const LDAPMatchRuleImpl* LDAPCoreSchema::getMatchRuleImpl(
        const string& ruleOid){
    const vector<LDAPBasicMatchRuleImpl>& impls = coreImpls();
    int j = 0;
    for(const mrule_def *m = mrule_defs; m->md_oid != 0; m++, j++){
        if(ruleOid == m->md_oid){
            return &impls[j];
        }
    }
    return 0;
}

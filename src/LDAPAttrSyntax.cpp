/*
 * Copyright 2010, OpenLDAP Foundation, All Rights Reserved.
 * COPYING RESTRICTIONS APPLY, see COPYRIGHT file
 */

#include "debug.h"
#include "LDAPAttrSyntax.h"
#include "LDAPCoreSchema.h"
#include "LDAPMatchRule.h"
#include "LDAPSchemaResolver.h"

using namespace std;

LDAPAttrSyntax::LDAPAttrSyntax(const string& oid, const string& desc,
        const string& equalityRule, const string& orderingRule,
        const string& substringRule, const string& approximateRule,
        const LDAPExtraProperties& extra, const string& definition) :
        LDAPSchemaElement(desc, extra), m_oid(oid), m_resolved(false){
    LDAPSCHEMA_DEBUG(LDAPSCHEMA_DEBUG_CONSTRUCT,
            "LDAPAttrSyntax::LDAPAttrSyntax( )" << endl);
    m_ruleOids[LDAPMatchRuleImpl::EQUALITY] = equalityRule;
    m_ruleOids[LDAPMatchRuleImpl::ORDERING] = orderingRule;
    m_ruleOids[LDAPMatchRuleImpl::SUBSTRING] = substringRule;
    m_ruleOids[LDAPMatchRuleImpl::APPROXIMATE] = approximateRule;
    init(definition);
}

LDAPAttrSyntax::LDAPAttrSyntax(const string& syn_item, int flags) :
        LDAPSchemaElement(string(), LDAPExtraProperties()),
        m_resolved(false){
    LDAPSCHEMA_DEBUG(LDAPSCHEMA_DEBUG_CONSTRUCT,
            "LDAPAttrSyntax::LDAPAttrSyntax( )" << endl);
    LDAPSCHEMA_DEBUG(LDAPSCHEMA_DEBUG_CONSTRUCT | LDAPSCHEMA_DEBUG_PARAMETER,
            "   definition:" << syn_item << endl);

    int ret;
    const char *errp;
    LDAPSyntax *s = ldap_str2syntax(syn_item.c_str(), &ret, &errp, flags);
    if(s == 0){
        throw LDAPSchemaException(LDAPSchemaException::MALFORMED_DEFINITION,
                syn_item, fromCString(ldap_scherr2str(ret)) + " near: " +
                fromCString(errp));
    }
    m_oid = fromCString(s->syn_oid);
    m_desc = fromCString(s->syn_desc);
    m_extraProperties = fromExtensions(s->syn_extensions);
    ldap_syntax_free(s);

    for(int k = 0; k < LDAPMatchRuleImpl::LASTKIND; k++){
        const char* rule = LDAPCoreSchema::getDefaultMatchingRule(m_oid,
                (LDAPMatchRuleImpl::Kind) k);
        m_ruleOids[k] = fromCString(rule);
    }
    init(syn_item);
}

LDAPAttrSyntax::~LDAPAttrSyntax(){
    LDAPSCHEMA_DEBUG(LDAPSCHEMA_DEBUG_DESTROY,
            "LDAPAttrSyntax::~LDAPAttrSyntax()" << endl);
}

void LDAPAttrSyntax::init(const string& definition){
    if(m_oid.empty()){
        throw LDAPSchemaException(LDAPSchemaException::MALFORMED_DEFINITION,
                definition, "syntax without OID");
    }
    for(int k = 0; k < LDAPMatchRuleImpl::LASTKIND; k++){
        m_rules[k] = 0;
    }
    if(definition.empty()){
        m_definition = buildDefinition();
    }else{
        m_definition = definition;
    }
}

const string& LDAPAttrSyntax::getOid() const{
    return m_oid;
}

const string& LDAPAttrSyntax::getDefaultMatchingRuleOid(
        LDAPMatchRuleImpl::Kind kind) const{
    return m_ruleOids[kind];
}

const LDAPMatchRule* LDAPAttrSyntax::getDefaultMatchingRule(
        LDAPMatchRuleImpl::Kind kind) const{
    if(!m_resolved){
        throw LDAPSchemaException(LDAPSchemaException::ILLEGAL_STATE,
                m_oid, "syntax is not resolved");
    }
    return m_rules[kind];
}

const LDAPMatchRule* LDAPAttrSyntax::getEqualityMatchingRule() const{
    return getDefaultMatchingRule(LDAPMatchRuleImpl::EQUALITY);
}

const LDAPMatchRule* LDAPAttrSyntax::getOrderingMatchingRule() const{
    return getDefaultMatchingRule(LDAPMatchRuleImpl::ORDERING);
}

const LDAPMatchRule* LDAPAttrSyntax::getSubstringMatchingRule() const{
    return getDefaultMatchingRule(LDAPMatchRuleImpl::SUBSTRING);
}

const LDAPMatchRule* LDAPAttrSyntax::getApproximateMatchingRule() const{
    return getDefaultMatchingRule(LDAPMatchRuleImpl::APPROXIMATE);
}

bool LDAPAttrSyntax::isResolved() const{
    return m_resolved;
}

const string& LDAPAttrSyntax::toString() const{
    return m_definition;
}

void LDAPAttrSyntax::validate(LDAPSchemaResolver& schema,
        list<LDAPSchemaException>& warnings){
    LDAPSCHEMA_DEBUG(LDAPSCHEMA_DEBUG_TRACE,
            "LDAPAttrSyntax::validate() " << m_oid << endl);
    for(int k = 0; k < LDAPMatchRuleImpl::LASTKIND; k++){
        m_rules[k] = 0;
        if(m_ruleOids[k].empty()){
            continue;
        }
        try{
            m_rules[k] = schema.getMatchingRule(m_ruleOids[k]);
        }catch(const LDAPSchemaException&){
            warnings.push_back(LDAPSchemaException(
                    LDAPSchemaException::UNRESOLVED_REFERENCE, m_oid,
                    string("default ") +
                    LDAPMatchRuleImpl::kindToString(
                        (LDAPMatchRuleImpl::Kind) k) +
                    " matching rule " + m_ruleOids[k] +
                    " of syntax is unknown and will be ignored"));
        }
    }
    m_resolved = true;
}

bool LDAPAttrSyntax::operator==(const LDAPAttrSyntax& syn) const{
    return m_oid == syn.m_oid;
}

bool LDAPAttrSyntax::operator!=(const LDAPAttrSyntax& syn) const{
    return m_oid != syn.m_oid;
}

void LDAPAttrSyntax::toStringContent(string& buffer) const{
    buffer.append(m_oid);

    if(!m_desc.empty()){
        buffer.append(" DESC '");
        buffer.append(m_desc);
        buffer.append("'");
    }
}

/*
 * Copyright 2010, OpenLDAP Foundation, All Rights Reserved.
 * COPYING RESTRICTIONS APPLY, see COPYRIGHT file
 */

#include "debug.h"
#include "LDAPMatchRule.h"
#include "LDAPAttrSyntax.h"
#include "LDAPCoreSchema.h"
#include "LDAPSchemaException.h"
#include "LDAPSchemaResolver.h"

using namespace std;

LDAPMatchRule::LDAPMatchRule(const string& oid, const StringList& names,
        const string& desc, bool obsolete, const string& syntax,
        const LDAPExtraProperties& extra, const LDAPMatchRuleImpl* impl,
        const string& definition) :
        LDAPSchemaElement(desc, extra), m_oid(oid), m_names(names),
        m_obsolete(obsolete), m_syntaxOid(syntax), m_impl(impl),
        m_syntax(0), m_resolved(false){
    LDAPSCHEMA_DEBUG(LDAPSCHEMA_DEBUG_CONSTRUCT,
            "LDAPMatchRule::LDAPMatchRule( )" << endl);
    init(definition);
}

LDAPMatchRule::LDAPMatchRule(const string& mr_item, int flags,
        const LDAPMatchRuleImpl* impl) :
        LDAPSchemaElement(string(), LDAPExtraProperties()),
        m_obsolete(false), m_impl(impl), m_syntax(0), m_resolved(false){
    LDAPSCHEMA_DEBUG(LDAPSCHEMA_DEBUG_CONSTRUCT,
            "LDAPMatchRule::LDAPMatchRule( )" << endl);
    LDAPSCHEMA_DEBUG(LDAPSCHEMA_DEBUG_CONSTRUCT | LDAPSCHEMA_DEBUG_PARAMETER,
            "   definition:" << mr_item << endl);

    int ret;
    const char *errp;
    LDAPMatchingRule *m = ldap_str2matchingrule(mr_item.c_str(), &ret,
            &errp, flags);
    if(m == 0){
        throw LDAPSchemaException(LDAPSchemaException::MALFORMED_DEFINITION,
                mr_item, fromCString(ldap_scherr2str(ret)) + " near: " +
                fromCString(errp));
    }
    m_oid = fromCString(m->mr_oid);
    m_names = StringList(m->mr_names);
    m_desc = fromCString(m->mr_desc);
    m_obsolete = (m->mr_obsolete == LDAP_SCHEMA_YES);
    m_syntaxOid = fromCString(m->mr_syntax_oid);
    m_extraProperties = fromExtensions(m->mr_extensions);
    ldap_matchingrule_free(m);

    init(mr_item);
}

LDAPMatchRule::~LDAPMatchRule(){
    LDAPSCHEMA_DEBUG(LDAPSCHEMA_DEBUG_DESTROY,
            "LDAPMatchRule::~LDAPMatchRule()" << endl);
}

void LDAPMatchRule::init(const string& definition){
    if(m_oid.empty()){
        throw LDAPSchemaException(LDAPSchemaException::MALFORMED_DEFINITION,
                definition, "matching rule without OID");
    }
    if(m_syntaxOid.empty()){
        throw LDAPSchemaException(LDAPSchemaException::MALFORMED_DEFINITION,
                getNameOrOid(), "matching rule without SYNTAX");
    }
    if(m_impl == 0){
        m_impl = LDAPCoreSchema::getMatchRuleImpl(m_oid);
    }
    if(m_impl == 0){
        if(m_syntaxOid == LDAPSCHEMA_SUBSTRING_ASSERTION_SYNTAX){
            m_impl = LDAPMatchRuleImpl::getDefault(
                    LDAPMatchRuleImpl::SUBSTRING);
        }else{
            m_impl = LDAPMatchRuleImpl::getDefault(
                    LDAPMatchRuleImpl::EQUALITY);
        }
    }
    if(definition.empty()){
        m_definition = buildDefinition();
    }else{
        m_definition = definition;
    }
}

const string& LDAPMatchRule::getOid() const{
    return m_oid;
}

const StringList& LDAPMatchRule::getNames() const{
    return m_names;
}

const string& LDAPMatchRule::getNameOrOid() const{
    if(m_names.empty()){
        return m_oid;
    }
    return m_names.front();
}

bool LDAPMatchRule::hasName(const string& name) const{
    StringList::const_iterator i;
    for(i = m_names.begin(); i != m_names.end(); i++){
        if(equalsIgnoreCase(*i, name)){
            return true;
        }
    }
    return false;
}

bool LDAPMatchRule::hasNameOrOid(const string& value) const{
    return hasName(value) || m_oid == value;
}

bool LDAPMatchRule::isObsolete() const{
    return m_obsolete;
}

const string& LDAPMatchRule::getSyntaxOid() const{
    return m_syntaxOid;
}

const LDAPAttrSyntax* LDAPMatchRule::getSyntax() const{
    if(!m_resolved){
        throw LDAPSchemaException(LDAPSchemaException::ILLEGAL_STATE,
                getNameOrOid(), "matching rule is not resolved");
    }
    return m_syntax;
}

bool LDAPMatchRule::isResolved() const{
    return m_resolved;
}

LDAPMatchRuleImpl::Kind LDAPMatchRule::getKind() const{
    return m_impl->getKind();
}

const LDAPMatchRuleImpl* LDAPMatchRule::getImpl() const{
    return m_impl;
}

string LDAPMatchRule::normalizeValue(const string& value) const{
    return m_impl->normalizeValue(value);
}

int LDAPMatchRule::compareValues(const string& v1, const string& v2) const{
    return m_impl->compareValues(v1, v2);
}

bool LDAPMatchRule::valuesMatch(const string& v1, const string& v2) const{
    return m_impl->valuesMatch(v1, v2);
}

bool LDAPMatchRule::substringMatches(const string& value,
        const string& subInitial, const StringList& subAny,
        const string& subFinal) const{
    return m_impl->substringMatches(value, subInitial, subAny, subFinal);
}

const string& LDAPMatchRule::toString() const{
    return m_definition;
}

void LDAPMatchRule::validate(LDAPSchemaResolver& schema){
    LDAPSCHEMA_DEBUG(LDAPSCHEMA_DEBUG_TRACE,
            "LDAPMatchRule::validate() " << getNameOrOid() << endl);
    const LDAPAttrSyntax* syntax;
    try{
        syntax = schema.getSyntax(m_syntaxOid);
    }catch(const LDAPSchemaException&){
        throw LDAPSchemaException(LDAPSchemaException::UNRESOLVED_REFERENCE,
                getNameOrOid(), "matching rule refers to unknown syntax " +
                m_syntaxOid);
    }
    m_syntax = syntax;
    m_resolved = true;
}

bool LDAPMatchRule::operator==(const LDAPMatchRule& mr) const{
    return m_oid == mr.m_oid;
}

bool LDAPMatchRule::operator!=(const LDAPMatchRule& mr) const{
    return m_oid != mr.m_oid;
}

void LDAPMatchRule::toStringContent(string& buffer) const{
    buffer.append(m_oid);
    appendNames(buffer, m_names);

    if(!m_desc.empty()){
        buffer.append(" DESC '");
        buffer.append(m_desc);
        buffer.append("'");
    }

    if(m_obsolete){
        buffer.append(" OBSOLETE");
    }

    buffer.append(" SYNTAX ");
    buffer.append(m_syntaxOid);
}

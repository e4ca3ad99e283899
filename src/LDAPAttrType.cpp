/*
 * Copyright 2003, OpenLDAP Foundation, All Rights Reserved.
 * COPYING RESTRICTIONS APPLY, see COPYRIGHT file
 */

#include <functional>

#include "debug.h"
#include "LDAPAttrType.h"
#include "LDAPAttrSyntax.h"
#include "LDAPMatchRule.h"
#include "LDAPSchemaException.h"
#include "LDAPSchemaResolver.h"

using namespace std;

LDAPAttrType::LDAPAttrType(const string& oid, const StringList& names,
        const string& desc, bool obsolete, const string& superiorType,
        const string& equalityRule, const string& orderingRule,
        const string& substringRule, const string& approximateRule,
        const string& syntax, bool singleValue, bool collective,
        bool noUserModification, Usage usage,
        const LDAPExtraProperties& extra, const string& definition) :
        LDAPSchemaElement(desc, extra), m_names(names), m_oid(oid),
        m_obsolete(obsolete), m_supOid(superiorType), m_syntaxOid(syntax),
        m_single(singleValue), m_collective(collective),
        m_noUserMod(noUserModification), m_usage(usage){
    LDAPSCHEMA_DEBUG(LDAPSCHEMA_DEBUG_CONSTRUCT,
            "LDAPAttrType::LDAPAttrType( )" << endl);
    m_ruleOids[LDAPMatchRuleImpl::EQUALITY] = equalityRule;
    m_ruleOids[LDAPMatchRuleImpl::ORDERING] = orderingRule;
    m_ruleOids[LDAPMatchRuleImpl::SUBSTRING] = substringRule;
    m_ruleOids[LDAPMatchRuleImpl::APPROXIMATE] = approximateRule;
    init(definition);
}

LDAPAttrType::LDAPAttrType(const string& at_item, int flags) :
        LDAPSchemaElement(string(), LDAPExtraProperties()){
    LDAPSCHEMA_DEBUG(LDAPSCHEMA_DEBUG_CONSTRUCT,
            "LDAPAttrType::LDAPAttrType( )" << endl);
    LDAPSCHEMA_DEBUG(LDAPSCHEMA_DEBUG_CONSTRUCT | LDAPSCHEMA_DEBUG_PARAMETER,
            "   definition:" << at_item << endl);

    LDAPAttributeType *a;
    int ret;
    const char *errp;
    a = ldap_str2attributetype(at_item.c_str(), &ret, &errp, flags);

    if (a == 0) {
        throw LDAPSchemaException(LDAPSchemaException::MALFORMED_DEFINITION,
                at_item, fromCString(ldap_scherr2str(ret)) + " near: " +
                fromCString(errp));
    }
    m_oid = fromCString(a->at_oid);
    m_names = StringList(a->at_names);
    m_desc = fromCString(a->at_desc);
    m_obsolete = (a->at_obsolete == LDAP_SCHEMA_YES);
    m_supOid = fromCString(a->at_sup_oid);
    m_ruleOids[LDAPMatchRuleImpl::EQUALITY] = fromCString(a->at_equality_oid);
    m_ruleOids[LDAPMatchRuleImpl::ORDERING] = fromCString(a->at_ordering_oid);
    m_ruleOids[LDAPMatchRuleImpl::SUBSTRING] = fromCString(a->at_substr_oid);
    m_syntaxOid = fromCString(a->at_syntax_oid);
    m_single = (a->at_single_value == LDAP_SCHEMA_YES);
    m_collective = (a->at_collective == LDAP_SCHEMA_YES);
    m_noUserMod = (a->at_no_user_mod == LDAP_SCHEMA_YES);
    m_usage = (Usage) a->at_usage;

    m_extraProperties = fromExtensions(a->at_extensions);
    ldap_attributetype_free(a);

    init(at_item);
}

LDAPAttrType::~LDAPAttrType() {
    LDAPSCHEMA_DEBUG(LDAPSCHEMA_DEBUG_DESTROY,
            "LDAPAttrType::~LDAPAttrType()" << endl);
}

void LDAPAttrType::init(const string& definition) {
    if (m_oid.empty()) {
        throw LDAPSchemaException(LDAPSchemaException::MALFORMED_DEFINITION,
                definition, "attribute type without OID");
    }
    StringList::const_iterator i;
    for (i = m_names.begin(); i != m_names.end(); i++) {
        StringList::const_iterator j = i;
        for (j++; j != m_names.end(); j++) {
            if (equalsIgnoreCase(*i, *j)) {
                throw LDAPSchemaException(
                        LDAPSchemaException::MALFORMED_DEFINITION,
                        m_oid, "duplicate name " + *j);
            }
        }
    }
    if (m_usage < USER_APPLICATIONS || m_usage > DSA_OPERATION) {
        throw LDAPSchemaException(LDAPSchemaException::MALFORMED_DEFINITION,
                getNameOrOid(), "attribute type with unknown usage");
    }
    if (m_supOid.empty() && m_syntaxOid.empty()) {
        throw LDAPSchemaException(LDAPSchemaException::MALFORMED_DEFINITION,
                getNameOrOid(),
                "attribute type needs a superior type and/or a syntax");
    }

    // the approximate rule travels as an extension, the slot wins
    LDAPExtraProperties::iterator e = m_extraProperties.begin();
    while (e != m_extraProperties.end()) {
        if (equalsIgnoreCase(e->first, LDAPSCHEMA_APPROX_RULE_PROPERTY)) {
            if (m_ruleOids[LDAPMatchRuleImpl::APPROXIMATE].empty() &&
                    !e->second.empty()) {
                m_ruleOids[LDAPMatchRuleImpl::APPROXIMATE] = e->second.front();
            }
            e = m_extraProperties.erase(e);
        } else {
            e++;
        }
    }

    m_superior = 0;
    m_syntax = 0;
    for (int k = 0; k < LDAPMatchRuleImpl::LASTKIND; k++) {
        m_rules[k] = 0;
    }
    m_resolved = false;

    if (definition.empty()) {
        m_definition = buildDefinition();
    } else {
        m_definition = definition;
    }
    m_isObjectClass = (m_oid == LDAPSCHEMA_OBJECTCLASS_OID);
    m_normalizedName = toLowerCase(getNameOrOid());
}

const string& LDAPAttrType::getOid () const {
    return m_oid;
}

const StringList& LDAPAttrType::getNames () const {
    return m_names;
}

const string& LDAPAttrType::getNameOrOid () const {

    if (m_names.empty())
	return m_oid;
    else
	return m_names.front();
}

bool LDAPAttrType::hasName (const string& name) const {
    StringList::const_iterator i;
    for (i = m_names.begin(); i != m_names.end(); i++) {
        if (equalsIgnoreCase(*i, name)) {
            return true;
        }
    }
    return false;
}

bool LDAPAttrType::hasNameOrOid (const string& value) const {
    return hasName(value) || m_oid == value;
}

bool LDAPAttrType::isObsolete () const {
    return m_obsolete;
}

bool LDAPAttrType::isSingle () const {
    return m_single;
}

bool LDAPAttrType::isCollective () const {
    return m_collective;
}

bool LDAPAttrType::isNoUserModification () const {
    return m_noUserMod;
}

bool LDAPAttrType::isObjectClass () const {
    return m_isObjectClass;
}

bool LDAPAttrType::isOperational () const {
    return m_usage != USER_APPLICATIONS;
}

LDAPAttrType::Usage LDAPAttrType::getUsage () const {
    return m_usage;
}

const string& LDAPAttrType::getSuperiorTypeOid () const {
    return m_supOid;
}

const string& LDAPAttrType::getSyntaxOid () const {
    return m_syntaxOid;
}

const string& LDAPAttrType::getMatchingRuleOid (
        LDAPMatchRuleImpl::Kind kind) const {
    return m_ruleOids[kind];
}

const string& LDAPAttrType::getEqualityMatchingRuleOid () const {
    return m_ruleOids[LDAPMatchRuleImpl::EQUALITY];
}

const string& LDAPAttrType::getOrderingMatchingRuleOid () const {
    return m_ruleOids[LDAPMatchRuleImpl::ORDERING];
}

const string& LDAPAttrType::getSubstringMatchingRuleOid () const {
    return m_ruleOids[LDAPMatchRuleImpl::SUBSTRING];
}

const string& LDAPAttrType::getApproximateMatchingRuleOid () const {
    return m_ruleOids[LDAPMatchRuleImpl::APPROXIMATE];
}

void LDAPAttrType::checkResolved () const {
    if (!m_resolved) {
        throw LDAPSchemaException(LDAPSchemaException::ILLEGAL_STATE,
                getNameOrOid(), "attribute type is not resolved");
    }
}

const LDAPAttrType* LDAPAttrType::getSuperiorType () const {
    checkResolved();
    return m_superior;
}

const LDAPAttrSyntax* LDAPAttrType::getSyntax () const {
    checkResolved();
    return m_syntax;
}

const LDAPMatchRule* LDAPAttrType::getMatchingRule (
        LDAPMatchRuleImpl::Kind kind) const {
    checkResolved();
    return m_rules[kind];
}

const LDAPMatchRule* LDAPAttrType::getEqualityMatchingRule () const {
    return getMatchingRule(LDAPMatchRuleImpl::EQUALITY);
}

const LDAPMatchRule* LDAPAttrType::getOrderingMatchingRule () const {
    return getMatchingRule(LDAPMatchRuleImpl::ORDERING);
}

const LDAPMatchRule* LDAPAttrType::getSubstringMatchingRule () const {
    return getMatchingRule(LDAPMatchRuleImpl::SUBSTRING);
}

const LDAPMatchRule* LDAPAttrType::getApproximateMatchingRule () const {
    return getMatchingRule(LDAPMatchRuleImpl::APPROXIMATE);
}

bool LDAPAttrType::isResolved () const {
    return m_resolved;
}

bool LDAPAttrType::isSubTypeOf (const LDAPAttrType& type) const {
    checkResolved();
    const LDAPAttrType* tmp = this;
    do {
        if (*tmp == type) {
            return true;
        }
        tmp = tmp->m_superior;
    } while (tmp != 0);
    return false;
}

int LDAPAttrType::compareTo (const LDAPAttrType& type) const {
    if (m_isObjectClass) {
        return type.m_isObjectClass ? 0 : -1;
    } else if (type.m_isObjectClass) {
        return 1;
    }

    bool operational = isOperational();
    if (operational != type.isOperational()) {
        return operational ? 1 : -1;
    }
    int rc = m_normalizedName.compare(type.m_normalizedName);
    return rc < 0 ? -1 : (rc > 0 ? 1 : 0);
}

const string& LDAPAttrType::toString () const {
    return m_definition;
}

string LDAPAttrType::canonicalDefinition () const {
    return buildDefinition();
}

size_t LDAPAttrType::hashCode () const {
    return std::hash<string>()(m_oid);
}

const LDAPMatchRule* LDAPAttrType::lookupRule (LDAPSchemaResolver& schema,
        const string& oid) const {
    try {
        return schema.getMatchingRule(oid);
    } catch (const LDAPSchemaException&) {
        throw LDAPSchemaException(LDAPSchemaException::UNRESOLVED_REFERENCE,
                getNameOrOid(), "unknown matching rule " + oid);
    }
}

void LDAPAttrType::validate (LDAPSchemaResolver& schema) {
    LDAPSCHEMA_DEBUG(LDAPSCHEMA_DEBUG_TRACE,
            "LDAPAttrType::validate() " << getNameOrOid() << endl);

    const LDAPAttrType* superior = 0;
    const LDAPAttrSyntax* syntax = 0;
    const LDAPMatchRule* rules[LDAPMatchRuleImpl::LASTKIND];

    if (!m_supOid.empty()) {
        try {
            superior = schema.getAttributeType(m_supOid);
        } catch (const LDAPSchemaException& e) {
            LDAPSchemaException::ErrorKind kind =
                    e.getKind() == LDAPSchemaException::CYCLIC_REFERENCE ?
                    LDAPSchemaException::CYCLIC_REFERENCE :
                    LDAPSchemaException::UNRESOLVED_REFERENCE;
            throw LDAPSchemaException(kind, getNameOrOid(),
                    "superior type " + m_supOid + ": " + e.getErrorMsg());
        }

        // a subtype keeps the usage and the collective flag of its
        // superior type
        if (superior->getUsage() != m_usage) {
            throw LDAPSchemaException(
                    LDAPSchemaException::INVALID_SUPERIOR_RELATIONSHIP,
                    getNameOrOid(), string("invalid superior usage: ") +
                    usageToString(m_usage) + " differs from usage " +
                    usageToString(superior->getUsage()) +
                    " of superior type " + superior->getNameOrOid());
        }
        if (superior->isCollective() != m_collective) {
            throw LDAPSchemaException(
                    LDAPSchemaException::INVALID_SUPERIOR_RELATIONSHIP,
                    getNameOrOid(), string("collective mismatch: ") +
                    (m_collective ? "became collective" :
                        "became non-collective") +
                    " although superior type " + superior->getNameOrOid() +
                    (m_collective ? " is not collective" : " is collective"));
        }
    }

    if (!m_syntaxOid.empty()) {
        try {
            syntax = schema.getSyntax(m_syntaxOid);
        } catch (const LDAPSchemaException&) {
            throw LDAPSchemaException(
                    LDAPSchemaException::UNRESOLVED_REFERENCE,
                    getNameOrOid(), "unknown syntax " + m_syntaxOid);
        }
    } else if (superior != 0) {
        syntax = superior->m_syntax;
    }

    // declared rule, else the superior's, else the syntax default
    for (int k = 0; k < LDAPMatchRuleImpl::LASTKIND; k++) {
        if (!m_ruleOids[k].empty()) {
            rules[k] = lookupRule(schema, m_ruleOids[k]);
        } else if (superior != 0 && superior->m_rules[k] != 0) {
            rules[k] = superior->m_rules[k];
        } else if (syntax != 0) {
            rules[k] = syntax->getDefaultMatchingRule(
                    (LDAPMatchRuleImpl::Kind) k);
        } else {
            rules[k] = 0;
        }
    }

    if (m_collective && m_usage != USER_APPLICATIONS) {
        throw LDAPSchemaException(
                LDAPSchemaException::INVALID_USAGE_COMBINATION,
                getNameOrOid(),
                "collective attribute must not be operational");
    }
    if (m_noUserMod && m_usage == USER_APPLICATIONS) {
        throw LDAPSchemaException(
                LDAPSchemaException::INVALID_USAGE_COMBINATION,
                getNameOrOid(),
                "no-user-modification attribute must be operational");
    }

    m_superior = superior;
    m_syntax = syntax;
    for (int k = 0; k < LDAPMatchRuleImpl::LASTKIND; k++) {
        m_rules[k] = rules[k];
    }
    m_resolved = true;
}

bool LDAPAttrType::operator== (const LDAPAttrType& at) const {
    return m_oid == at.m_oid;
}

bool LDAPAttrType::operator!= (const LDAPAttrType& at) const {
    return m_oid != at.m_oid;
}

bool LDAPAttrType::operator< (const LDAPAttrType& at) const {
    return compareTo(at) < 0;
}

const char* LDAPAttrType::usageToString (Usage usage) {
    switch (usage) {
        case DIRECTORY_OPERATION :
            return "directoryOperation";
        case DISTRIBUTED_OPERATION :
            return "distributedOperation";
        case DSA_OPERATION :
            return "dSAOperation";
        default :
            return "userApplications";
    }
}

void LDAPAttrType::toStringContent (string& buffer) const {
    buffer.append(m_oid);
    appendNames(buffer, m_names);

    if (!m_desc.empty()) {
        buffer.append(" DESC '");
        buffer.append(m_desc);
        buffer.append("'");
    }
    if (m_obsolete) {
        buffer.append(" OBSOLETE");
    }
    if (!m_supOid.empty()) {
        buffer.append(" SUP ");
        buffer.append(m_supOid);
    }
    if (!m_ruleOids[LDAPMatchRuleImpl::EQUALITY].empty()) {
        buffer.append(" EQUALITY ");
        buffer.append(m_ruleOids[LDAPMatchRuleImpl::EQUALITY]);
    }
    if (!m_ruleOids[LDAPMatchRuleImpl::ORDERING].empty()) {
        buffer.append(" ORDERING ");
        buffer.append(m_ruleOids[LDAPMatchRuleImpl::ORDERING]);
    }
    if (!m_ruleOids[LDAPMatchRuleImpl::SUBSTRING].empty()) {
        buffer.append(" SUBSTR ");
        buffer.append(m_ruleOids[LDAPMatchRuleImpl::SUBSTRING]);
    }
    if (!m_syntaxOid.empty()) {
        buffer.append(" SYNTAX ");
        buffer.append(m_syntaxOid);
    }
    if (m_single) {
        buffer.append(" SINGLE-VALUE");
    }
    if (m_collective) {
        buffer.append(" COLLECTIVE");
    }
    if (m_noUserMod) {
        buffer.append(" NO-USER-MODIFICATION");
    }
    buffer.append(" USAGE ");
    buffer.append(usageToString(m_usage));

    if (!m_ruleOids[LDAPMatchRuleImpl::APPROXIMATE].empty()) {
        buffer.append(" " LDAPSCHEMA_APPROX_RULE_PROPERTY " '");
        buffer.append(m_ruleOids[LDAPMatchRuleImpl::APPROXIMATE]);
        buffer.append("'");
    }
}

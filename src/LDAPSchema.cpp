/*
 * Copyright 2003, OpenLDAP Foundation, All Rights Reserved.
 * COPYING RESTRICTIONS APPLY, see COPYRIGHT file
 */

#include "debug.h"
#include "StringList.h"
#include "LDAPSchema.h"

using namespace std;

static bool attrTypeLess(const LDAPAttrType* a1, const LDAPAttrType* a2){
    return a1->compareTo(*a2) < 0;
}

LDAPSchema::LDAPSchema(){
    LDAPSCHEMA_DEBUG(LDAPSCHEMA_DEBUG_CONSTRUCT,
            "LDAPSchema::LDAPSchema( )" << endl);
}

LDAPSchema::~LDAPSchema() {
    LDAPSCHEMA_DEBUG(LDAPSCHEMA_DEBUG_DESTROY,"LDAPSchema::~LDAPSchema()" << endl);
}

void LDAPSchema::addName(NameIndex& index, const string& name,
        const string& oid) {
    string key = LDAPSchemaElement::toLowerCase(name);
    NameIndex::const_iterator i = index.find(key);
    if (i != index.end() && i->second != oid) {
        m_warnings.push_back(LDAPSchemaException(
                LDAPSchemaException::MALFORMED_DEFINITION, oid,
                "name " + name + " is already used by " + i->second));
        return;
    }
    index[key] = oid;
}

// an existing entry is kept, conflicts were reported by addName()
void LDAPSchema::indexName(NameIndex& index, const string& name,
        const string& oid) {
    index.insert(make_pair(LDAPSchemaElement::toLowerCase(name), oid));
}

/**
 * Rebuilds the name index from the remaining matching rules, so a name
 * claimed by a rejected rule goes to the next rule with that name
 */
void LDAPSchema::reindexMatchingRules() {
    m_matchRuleNames.clear();
    MatchRuleMap::const_iterator i;
    for (i = m_matchRules.begin(); i != m_matchRules.end(); i++) {
        indexName(m_matchRuleNames, i->first, i->first);
        StringList::const_iterator j;
        for (j = i->second.getNames().begin();
                j != i->second.getNames().end(); j++) {
            indexName(m_matchRuleNames, *j, i->first);
        }
    }
}

void LDAPSchema::reindexAttributeTypes() {
    m_attrTypeNames.clear();
    AttrTypeMap::const_iterator i;
    for (i = m_attrTypes.begin(); i != m_attrTypes.end(); i++) {
        indexName(m_attrTypeNames, i->first, i->first);
        StringList::const_iterator j;
        for (j = i->second.getNames().begin();
                j != i->second.getNames().end(); j++) {
            indexName(m_attrTypeNames, *j, i->first);
        }
    }
}

const string* LDAPSchema::findOid(const NameIndex& index,
        const string& nameOrOid) {
    NameIndex::const_iterator i =
            index.find(LDAPSchemaElement::toLowerCase(nameOrOid));
    if (i == index.end()) {
        return 0;
    }
    return &(i->second);
}

void LDAPSchema::addSyntax(const LDAPAttrSyntax& syn) {
    m_syntaxes.insert(make_pair(syn.getOid(), syn));
    addName(m_syntaxNames, syn.getOid(), syn.getOid());
}

void LDAPSchema::addMatchingRule(const LDAPMatchRule& mr) {
    m_matchRules.insert(make_pair(mr.getOid(), mr));
    addName(m_matchRuleNames, mr.getOid(), mr.getOid());
    // there could be more names for one object...
    StringList::const_iterator j;
    for (j = mr.getNames().begin(); j != mr.getNames().end(); j++) {
        addName(m_matchRuleNames, *j, mr.getOid());
    }
}

void LDAPSchema::addAttributeType(const LDAPAttrType& at) {
    m_attrTypes.insert(make_pair(at.getOid(), at));
    addName(m_attrTypeNames, at.getOid(), at.getOid());
    StringList::const_iterator j;
    for (j = at.getNames().begin(); j != at.getNames().end(); j++) {
        addName(m_attrTypeNames, *j, at.getOid());
    }
}

const LDAPAttrType* LDAPSchema::getAttributeType(const string& nameOrOid) const {
    const string* oid = findOid(m_attrTypeNames, nameOrOid);
    if (oid == 0) {
        return 0;
    }
    AttrTypeMap::const_iterator i = m_attrTypes.find(*oid);
    return i == m_attrTypes.end() ? 0 : &(i->second);
}

bool LDAPSchema::hasAttributeType(const string& nameOrOid) const {
    return getAttributeType(nameOrOid) != 0;
}

const LDAPMatchRule* LDAPSchema::getMatchingRule(const string& nameOrOid) const {
    const string* oid = findOid(m_matchRuleNames, nameOrOid);
    if (oid == 0) {
        return 0;
    }
    MatchRuleMap::const_iterator i = m_matchRules.find(*oid);
    return i == m_matchRules.end() ? 0 : &(i->second);
}

bool LDAPSchema::hasMatchingRule(const string& nameOrOid) const {
    return getMatchingRule(nameOrOid) != 0;
}

const LDAPAttrSyntax* LDAPSchema::getSyntax(const string& nameOrOid) const {
    const string* oid = findOid(m_syntaxNames, nameOrOid);
    if (oid == 0) {
        return 0;
    }
    SyntaxMap::const_iterator i = m_syntaxes.find(*oid);
    return i == m_syntaxes.end() ? 0 : &(i->second);
}

bool LDAPSchema::hasSyntax(const string& nameOrOid) const {
    return getSyntax(nameOrOid) != 0;
}

LDAPSchema::AttrTypeList LDAPSchema::getAttributeTypes() const {
    AttrTypeList ret;
    AttrTypeMap::const_iterator i;
    for (i = m_attrTypes.begin(); i != m_attrTypes.end(); i++) {
        ret.push_back(&(i->second));
    }
    ret.sort(attrTypeLess);
    return ret;
}

LDAPSchema::MatchRuleList LDAPSchema::getMatchingRules() const {
    MatchRuleList ret;
    MatchRuleMap::const_iterator i;
    for (i = m_matchRules.begin(); i != m_matchRules.end(); i++) {
        ret.push_back(&(i->second));
    }
    return ret;
}

LDAPSchema::SyntaxList LDAPSchema::getSyntaxes() const {
    SyntaxList ret;
    SyntaxMap::const_iterator i;
    for (i = m_syntaxes.begin(); i != m_syntaxes.end(); i++) {
        ret.push_back(&(i->second));
    }
    return ret;
}

const list<LDAPSchemaException>& LDAPSchema::getWarnings() const {
    return m_warnings;
}

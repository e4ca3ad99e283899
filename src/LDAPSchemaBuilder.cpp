/*
 * Copyright 2010, OpenLDAP Foundation, All Rights Reserved.
 * COPYING RESTRICTIONS APPLY, see COPYRIGHT file
 */

#include <istream>
#include <memory>

#include "debug.h"
#include "LDAPCoreSchema.h"
#include "LDAPSchema.h"
#include "LDAPSchemaBuilder.h"
#include "LDAPSchemaResolver.h"
#include "LdifReader.h"

using namespace std;

/**
 * Resolves the definitions of a schema under construction. Attribute
 * types are resolved on first use, a superior type before its subtypes;
 * the state kept per OID turns a loop of superior types into an error.
 */
class LDAPSchemaResolution : public LDAPSchemaResolver{
    public :
        LDAPSchemaResolution(LDAPSchema& schema,
                list<LDAPSchemaException>& failures);

        void resolveSchema();

        const LDAPAttrType* getAttributeType(const string& nameOrOid);
        const LDAPAttrSyntax* getSyntax(const string& nameOrOid);
        const LDAPMatchRule* getMatchingRule(const string& nameOrOid);

    private :
        enum State {
            UNRESOLVED=0,
            RESOLVING,
            RESOLVED,
            FAILED
        };

        void resolveAttributeType(LDAPAttrType& at);
        LDAPAttrType* resolveOtherClaimant(const string& name,
                const string& failedOid);
        void fail(const string& oid, const LDAPSchemaException& e);

        LDAPSchema& m_schema;
        list<LDAPSchemaException>& m_failures;
        map<string, State> m_states;
        map<string, LDAPSchemaException::ErrorKind> m_failureKinds;
};

LDAPSchemaResolution::LDAPSchemaResolution(LDAPSchema& schema,
        list<LDAPSchemaException>& failures) :
        m_schema(schema), m_failures(failures){
}

void LDAPSchemaResolution::fail(const string& oid,
        const LDAPSchemaException& e){
    LDAPSCHEMA_DEBUG(LDAPSCHEMA_DEBUG_TRACE,
            "   definition " << oid << " rejected: " << e << endl);
    m_states[oid] = FAILED;
    m_failureKinds.insert(make_pair(oid, e.getKind()));
    m_failures.push_back(e);
}

void LDAPSchemaResolution::resolveSchema(){
    LDAPSCHEMA_DEBUG(LDAPSCHEMA_DEBUG_TRACE,
            "LDAPSchemaResolution::resolveSchema()" << endl);

    // matching rules only refer to syntaxes
    list<string> failed;
    LDAPSchema::MatchRuleMap::iterator m;
    for(m = m_schema.m_matchRules.begin(); m != m_schema.m_matchRules.end();
            m++){
        try{
            m->second.validate(*this);
        }catch(const LDAPSchemaException& e){
            fail(m->first, e);
            failed.push_back(m->first);
        }
    }
    list<string>::const_iterator f;
    for(f = failed.begin(); f != failed.end(); f++){
        m_schema.m_matchRules.erase(*f);
    }
    if(!failed.empty()){
        m_schema.reindexMatchingRules();
    }

    // syntaxes only lose a default rule that is unknown
    LDAPSchema::SyntaxMap::iterator s;
    for(s = m_schema.m_syntaxes.begin(); s != m_schema.m_syntaxes.end(); s++){
        s->second.validate(*this, m_schema.m_warnings);
    }

    LDAPSchema::AttrTypeMap::iterator a;
    for(a = m_schema.m_attrTypes.begin(); a != m_schema.m_attrTypes.end();
            a++){
        if(m_states[a->first] == UNRESOLVED){
            resolveAttributeType(a->second);
        }
    }

    // failed types are left out of the schema
    bool removed = false;
    map<string, State>::const_iterator i;
    for(i = m_states.begin(); i != m_states.end(); i++){
        if(i->second == FAILED){
            m_schema.m_attrTypes.erase(i->first);
            removed = true;
        }
    }
    if(removed){
        m_schema.reindexAttributeTypes();
    }
}

void LDAPSchemaResolution::resolveAttributeType(LDAPAttrType& at){
    m_states[at.getOid()] = RESOLVING;
    try{
        at.validate(*this);
    }catch(const LDAPSchemaException& e){
        fail(at.getOid(), e);
        return;
    }
    m_states[at.getOid()] = RESOLVED;
}

/**
 * Looks for a valid attribute type with the given name after the type
 * the name index points to has failed. Returns 0 if there is none.
 */
LDAPAttrType* LDAPSchemaResolution::resolveOtherClaimant(const string& name,
        const string& failedOid){
    LDAPSchema::AttrTypeMap::iterator i;
    for(i = m_schema.m_attrTypes.begin(); i != m_schema.m_attrTypes.end();
            i++){
        if(i->first == failedOid || !i->second.hasName(name)){
            continue;
        }
        if(m_states[i->first] == UNRESOLVED){
            resolveAttributeType(i->second);
        }
        if(m_states[i->first] == RESOLVED){
            LDAPSCHEMA_DEBUG(LDAPSCHEMA_DEBUG_TRACE, "   name " << name
                    << " now refers to " << i->first << endl);
            return &(i->second);
        }
    }
    return 0;
}

const LDAPAttrType* LDAPSchemaResolution::getAttributeType(
        const string& nameOrOid){
    const string* oid = LDAPSchema::findOid(m_schema.m_attrTypeNames,
            nameOrOid);
    LDAPSchema::AttrTypeMap::iterator i;
    if(oid == 0 || (i = m_schema.m_attrTypes.find(*oid)) ==
            m_schema.m_attrTypes.end()){
        throw LDAPSchemaException(LDAPSchemaException::UNRESOLVED_REFERENCE,
                nameOrOid, "unknown attribute type");
    }
    LDAPAttrType& at = i->second;

    switch(m_states[at.getOid()]){
        case RESOLVING :
            throw LDAPSchemaException(LDAPSchemaException::CYCLIC_REFERENCE,
                    at.getNameOrOid(),
                    "chain of superior types loops back to " +
                    at.getNameOrOid());
        case UNRESOLVED :
            resolveAttributeType(at);
            break;
        default :
            break;
    }

    if(m_states[at.getOid()] == FAILED){
        LDAPAttrType* other = resolveOtherClaimant(nameOrOid, at.getOid());
        if(other != 0){
            return other;
        }
        if(m_failureKinds[at.getOid()] ==
                LDAPSchemaException::CYCLIC_REFERENCE){
            throw LDAPSchemaException(LDAPSchemaException::CYCLIC_REFERENCE,
                    at.getNameOrOid(), "chain of superior types of " +
                    at.getNameOrOid() + " contains a loop");
        }
        throw LDAPSchemaException(LDAPSchemaException::UNRESOLVED_REFERENCE,
                at.getNameOrOid(), "attribute type " + at.getNameOrOid() +
                " is invalid");
    }
    return &at;
}

const LDAPAttrSyntax* LDAPSchemaResolution::getSyntax(
        const string& nameOrOid){
    const LDAPAttrSyntax* syn = m_schema.getSyntax(nameOrOid);
    if(syn == 0){
        throw LDAPSchemaException(LDAPSchemaException::UNRESOLVED_REFERENCE,
                nameOrOid, "unknown syntax");
    }
    return syn;
}

const LDAPMatchRule* LDAPSchemaResolution::getMatchingRule(
        const string& nameOrOid){
    const LDAPMatchRule* mr = m_schema.getMatchingRule(nameOrOid);
    if(mr == 0){
        throw LDAPSchemaException(LDAPSchemaException::UNRESOLVED_REFERENCE,
                nameOrOid, "unknown matching rule");
    }
    return mr;
}


LDAPSchemaBuilder::LDAPSchemaBuilder(const LDAPSchemaOptions& options) :
        m_options(options){
    LDAPSCHEMA_DEBUG(LDAPSCHEMA_DEBUG_CONSTRUCT,
            "LDAPSchemaBuilder::LDAPSchemaBuilder( )" << endl);
}

LDAPSchemaBuilder::~LDAPSchemaBuilder(){
    LDAPSCHEMA_DEBUG(LDAPSCHEMA_DEBUG_DESTROY,
            "LDAPSchemaBuilder::~LDAPSchemaBuilder()" << endl);
}

const LDAPSchemaOptions& LDAPSchemaBuilder::getOptions() const{
    return m_options;
}

template <class T>
void LDAPSchemaBuilder::addDefinition(map<string, T>& defs, const T& def,
        const string& oid){
    typename map<string, T>::iterator i = defs.find(oid);
    if(i != defs.end()){
        if(!m_options.getAllowOverwrite()){
            throw LDAPSchemaException(
                    LDAPSchemaException::MALFORMED_DEFINITION, oid,
                    "OID is already registered");
        }
        LDAPSCHEMA_DEBUG(LDAPSCHEMA_DEBUG_TRACE,
                "   replacing definition " << oid << endl);
        defs.erase(i);
    }
    defs.insert(make_pair(oid, def));
}

void LDAPSchemaBuilder::addSyntax(const string& definition){
    addSyntax(LDAPAttrSyntax(definition, m_options.getParseFlags()));
}

void LDAPSchemaBuilder::addSyntax(const LDAPAttrSyntax& syn){
    LDAPSCHEMA_DEBUG(LDAPSCHEMA_DEBUG_TRACE,
            "LDAPSchemaBuilder::addSyntax() " << syn.getOid() << endl);
    addDefinition(m_syntaxes, syn, syn.getOid());
}

void LDAPSchemaBuilder::addMatchingRule(const string& definition,
        const LDAPMatchRuleImpl* impl){
    addMatchingRule(LDAPMatchRule(definition, m_options.getParseFlags(),
            impl));
}

void LDAPSchemaBuilder::addMatchingRule(const LDAPMatchRule& mr){
    LDAPSCHEMA_DEBUG(LDAPSCHEMA_DEBUG_TRACE,
            "LDAPSchemaBuilder::addMatchingRule() " << mr.getOid() << endl);
    addDefinition(m_matchRules, mr, mr.getOid());
}

void LDAPSchemaBuilder::addAttributeType(const string& definition){
    addAttributeType(LDAPAttrType(definition, m_options.getParseFlags()));
}

void LDAPSchemaBuilder::addAttributeType(const LDAPAttrType& at){
    LDAPSCHEMA_DEBUG(LDAPSCHEMA_DEBUG_TRACE,
            "LDAPSchemaBuilder::addAttributeType() " << at.getOid() << endl);
    addDefinition(m_attrTypes, at, at.getOid());
}

void LDAPSchemaBuilder::addCoreSchema(){
    LDAPCoreSchema::addCoreSchema(*this);
}

int LDAPSchemaBuilder::addSchemaFromLdif(istream& input){
    LDAPSCHEMA_DEBUG(LDAPSCHEMA_DEBUG_TRACE,
            "LDAPSchemaBuilder::addSchemaFromLdif()" << endl);
    LdifReader reader(input);
    int added = 0;

    while(reader.readNextRecord() != LdifReader::NONE){
        const LdifRecord& record = reader.getRecord();
        bool modify = reader.getRecordType() == LdifReader::MODIFY;
        // values of a modify record count only inside add or replace blocks
        bool adding = !modify;
        LdifRecord::const_iterator i;
        for(i = record.begin(); i != record.end(); i++){
            // attribute options like ";x-origin" do not matter here
            string type = LDAPSchemaElement::toLowerCase(
                    i->first.substr(0, i->first.find(';')));
            if(modify){
                if(type == "add" || type == "replace"){
                    adding = true;
                    continue;
                }
                if(type == "delete" || type == "-"){
                    adding = false;
                    continue;
                }
            }
            if(!adding){
                LDAPSCHEMA_DEBUG(LDAPSCHEMA_DEBUG_TRACE,
                        "   ignoring " << i->first << endl);
                continue;
            }
            try{
                if(type == "attributetypes"){
                    addAttributeType(i->second);
                }else if(type == "matchingrules"){
                    addMatchingRule(i->second);
                }else if(type == "ldapsyntaxes"){
                    addSyntax(i->second);
                }else{
                    continue;
                }
                added++;
            }catch(const LDAPSchemaException& e){
                LDAPSCHEMA_DEBUG(LDAPSCHEMA_DEBUG_TRACE,
                        "   skipping " << i->first << ": " << e << endl);
                m_warnings.push_back(e);
            }
        }
    }
    return added;
}

const list<LDAPSchemaException>& LDAPSchemaBuilder::getWarnings() const{
    return m_warnings;
}

LDAPSchema* LDAPSchemaBuilder::build() const{
    LDAPSCHEMA_DEBUG(LDAPSCHEMA_DEBUG_TRACE,
            "LDAPSchemaBuilder::build()" << endl);
    unique_ptr<LDAPSchema> schema(new LDAPSchema());
    list<LDAPSchemaException> failures(m_warnings);

    map<string, LDAPAttrSyntax>::const_iterator s;
    for(s = m_syntaxes.begin(); s != m_syntaxes.end(); s++){
        schema->addSyntax(s->second);
    }
    map<string, LDAPMatchRule>::const_iterator m;
    for(m = m_matchRules.begin(); m != m_matchRules.end(); m++){
        schema->addMatchingRule(m->second);
    }
    map<string, LDAPAttrType>::const_iterator a;
    for(a = m_attrTypes.begin(); a != m_attrTypes.end(); a++){
        schema->addAttributeType(a->second);
    }

    LDAPSchemaResolution resolution(*schema, failures);
    resolution.resolveSchema();

    if(!failures.empty() && m_options.isStrict()){
        LDAPSCHEMA_DEBUG(LDAPSCHEMA_DEBUG_TRACE, "   " << failures.size()
                << " definitions failed, rejecting schema" << endl);
        throw failures.front();
    }
    schema->m_warnings.splice(schema->m_warnings.begin(), failures);
    return schema.release();
}

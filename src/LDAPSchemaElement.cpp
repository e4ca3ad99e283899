/*
 * Copyright 2010, OpenLDAP Foundation, All Rights Reserved.
 * COPYING RESTRICTIONS APPLY, see COPYRIGHT file
 */

#include <ctype.h>
#include <strings.h>

#include "debug.h"
#include "LDAPSchemaElement.h"

using namespace std;

LDAPSchemaElement::LDAPSchemaElement(const string& desc,
        const LDAPExtraProperties& extra) :
        m_desc(desc), m_extraProperties(extra){
}

LDAPSchemaElement::~LDAPSchemaElement(){
}

const string& LDAPSchemaElement::getDescription() const{
    return m_desc;
}

const LDAPExtraProperties& LDAPSchemaElement::getExtraProperties() const{
    return m_extraProperties;
}

const StringList* LDAPSchemaElement::getExtraProperty(
        const string& name) const{
    LDAPExtraProperties::const_iterator i;
    for(i = m_extraProperties.begin(); i != m_extraProperties.end(); i++){
        if(equalsIgnoreCase(i->first, name)){
            return &(i->second);
        }
    }
    return 0;
}

string LDAPSchemaElement::toLowerCase(const string& s){
    string ret(s);
    for(string::size_type i = 0; i < ret.size(); i++){
        ret[i] = tolower((unsigned char) ret[i]);
    }
    return ret;
}

bool LDAPSchemaElement::equalsIgnoreCase(const string& s1,
        const string& s2){
    return s1.size() == s2.size() &&
            strcasecmp(s1.c_str(), s2.c_str()) == 0;
}

string LDAPSchemaElement::buildDefinition() const{
    string buffer("( ");
    toStringContent(buffer);

    LDAPExtraProperties::const_iterator i;
    for(i = m_extraProperties.begin(); i != m_extraProperties.end(); i++){
        const StringList& values = i->second;
        buffer.append(" ");
        buffer.append(i->first);
        if(values.size() == 1){
            buffer.append(" '");
            buffer.append(values.front());
            buffer.append("'");
        }else{
            buffer.append(" (");
            StringList::const_iterator j;
            for(j = values.begin(); j != values.end(); j++){
                buffer.append(" '");
                buffer.append(*j);
                buffer.append("'");
            }
            buffer.append(" )");
        }
    }
    buffer.append(" )");
    return buffer;
}

void LDAPSchemaElement::appendNames(string& buffer, const StringList& names){
    if(names.empty()){
        return;
    }
    StringList::const_iterator i = names.begin();
    const string& firstName = *i;
    i++;
    if(i != names.end()){
        buffer.append(" NAME ( '");
        buffer.append(firstName);
        for(; i != names.end(); i++){
            buffer.append("' '");
            buffer.append(*i);
        }
        buffer.append("' )");
    }else{
        buffer.append(" NAME '");
        buffer.append(firstName);
        buffer.append("'");
    }
}

LDAPExtraProperties LDAPSchemaElement::fromExtensions(
        LDAPSchemaExtensionItem** ext){
    LDAPExtraProperties ret;
    if(ext == 0){
        return ret;
    }
    for(LDAPSchemaExtensionItem** i = ext; *i != 0; i++){
        LDAPSCHEMA_DEBUG(LDAPSCHEMA_DEBUG_PARAMETER,
                "   extension: " << (*i)->lsei_name << endl);
        ret.push_back(make_pair(string((*i)->lsei_name),
                StringList((*i)->lsei_values)));
    }
    return ret;
}

string LDAPSchemaElement::fromCString(const char* s){
    if(s == 0){
        return string();
    }
    return string(s);
}

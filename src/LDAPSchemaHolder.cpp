/*
 * Copyright 2010, OpenLDAP Foundation, All Rights Reserved.
 * COPYING RESTRICTIONS APPLY, see COPYRIGHT file
 */

#include "debug.h"
#include "LDAPSchema.h"
#include "LDAPSchemaHolder.h"

using namespace std;

LDAPSchemaHolder::LDAPSchemaHolder(){
    LDAPSCHEMA_DEBUG(LDAPSCHEMA_DEBUG_CONSTRUCT,
            "LDAPSchemaHolder::LDAPSchemaHolder( )" << endl);
}

LDAPSchemaHolder::LDAPSchemaHolder(LDAPSchema* schema) : m_schema(schema){
    LDAPSCHEMA_DEBUG(LDAPSCHEMA_DEBUG_CONSTRUCT,
            "LDAPSchemaHolder::LDAPSchemaHolder( )" << endl);
}

LDAPSchemaHolder::~LDAPSchemaHolder(){
    LDAPSCHEMA_DEBUG(LDAPSCHEMA_DEBUG_DESTROY,
            "LDAPSchemaHolder::~LDAPSchemaHolder()" << endl);
}

shared_ptr<const LDAPSchema> LDAPSchemaHolder::getSchema() const{
    lock_guard<mutex> lock(m_mutex);
    return m_schema;
}

void LDAPSchemaHolder::setSchema(LDAPSchema* schema){
    LDAPSCHEMA_DEBUG(LDAPSCHEMA_DEBUG_TRACE,
            "LDAPSchemaHolder::setSchema()" << endl);
    shared_ptr<const LDAPSchema> next(schema);
    shared_ptr<const LDAPSchema> previous;
    {
        lock_guard<mutex> lock(m_mutex);
        previous = m_schema;
        m_schema = next;
    }
    // the old schema may be deleted here, outside of the lock
}

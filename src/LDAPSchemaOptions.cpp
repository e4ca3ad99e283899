/*
 * Copyright 2000, OpenLDAP Foundation, All Rights Reserved.
 * COPYING RESTRICTIONS APPLY, see COPYRIGHT file
 */

#include "debug.h"
#include "LDAPSchemaOptions.h"

using namespace std;

int ldapschema_debug_level = LDAPSCHEMA_DEBUG_NONE;

LDAPSchemaOptions::LDAPSchemaOptions(){
	m_parseFlags=LDAPSCHEMA_PARSE_FLAG;
	m_strict=false;
	m_allowOverwrite=false;
}

LDAPSchemaOptions::LDAPSchemaOptions(const LDAPSchemaOptions& o){
    m_parseFlags=o.m_parseFlags;
    m_strict=o.m_strict;
    m_allowOverwrite=o.m_allowOverwrite;
}

LDAPSchemaOptions::~LDAPSchemaOptions(){
    LDAPSCHEMA_DEBUG(LDAPSCHEMA_DEBUG_DESTROY,
            "LDAPSchemaOptions::~LDAPSchemaOptions()" << endl);
}

void LDAPSchemaOptions::setParseFlags(int flags){
	m_parseFlags=flags;
}

void LDAPSchemaOptions::setStrict(bool strict){
	m_strict=strict;
}

void LDAPSchemaOptions::setAllowOverwrite(bool overwrite){
	m_allowOverwrite=overwrite;
}

int LDAPSchemaOptions::getParseFlags() const {
	return m_parseFlags;
}

bool LDAPSchemaOptions::isStrict() const {
	return m_strict;
}

bool LDAPSchemaOptions::getAllowOverwrite() const {
	return m_allowOverwrite;
}

void LDAPSchemaOptions::setDebugLevel(int level){
    ldapschema_debug_level = level;
}

int LDAPSchemaOptions::getDebugLevel(){
    return ldapschema_debug_level;
}

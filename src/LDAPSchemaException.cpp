/*
 * Copyright 2000, OpenLDAP Foundation, All Rights Reserved.
 * COPYING RESTRICTIONS APPLY, see COPYRIGHT file
 */



#include <ldap.h>
#include "LDAPSchemaException.h"

using namespace std;

static int kindToResultCode(LDAPSchemaException::ErrorKind kind){
    switch(kind){
        case LDAPSchemaException::MALFORMED_DEFINITION :
            return LDAP_INVALID_SYNTAX;
        case LDAPSchemaException::UNRESOLVED_REFERENCE :
            return LDAP_UNDEFINED_TYPE;
        case LDAPSchemaException::INVALID_SUPERIOR_RELATIONSHIP :
        case LDAPSchemaException::INVALID_USAGE_COMBINATION :
            return LDAP_CONSTRAINT_VIOLATION;
        case LDAPSchemaException::CYCLIC_REFERENCE :
            return LDAP_LOOP_DETECT;
        default :
            return LDAP_OTHER;
    }
}

LDAPSchemaException::LDAPSchemaException(ErrorKind kind,
        const string& definition, const string& err_string){
    m_kind=kind;
	m_res_code=kindToResultCode(kind);
    const char *res_cstring = ldap_err2string(m_res_code);
    if ( res_cstring ) {
        m_res_string = string(res_cstring);
    } else {
        m_res_string = "";
    }
    m_definition=definition;
    m_err_string=err_string;
}

LDAPSchemaException::~LDAPSchemaException(){
}

LDAPSchemaException::ErrorKind LDAPSchemaException::getKind() const{
    return m_kind;
}

int LDAPSchemaException::getResultCode() const{
	return m_res_code;
}

const string& LDAPSchemaException::getResultMsg() const{
	return m_res_string;
}

const string& LDAPSchemaException::getDefinition() const{
    return m_definition;
}

const string& LDAPSchemaException::getErrorMsg() const{
    return m_err_string;
}

const char* LDAPSchemaException::kindToString(ErrorKind kind){
    switch(kind){
        case MALFORMED_DEFINITION :
            return "MalformedDefinition";
        case UNRESOLVED_REFERENCE :
            return "UnresolvedReference";
        case INVALID_SUPERIOR_RELATIONSHIP :
            return "InvalidSuperiorRelationship";
        case INVALID_USAGE_COMBINATION :
            return "InvalidUsageCombination";
        case CYCLIC_REFERENCE :
            return "CyclicReference";
        default :
            return "IllegalState";
    }
}

ostream& operator << (ostream& s, const LDAPSchemaException& e){
	s << "Error " << e.m_res_code << " (" << LDAPSchemaException::kindToString(e.m_kind)
            << "): " << e.m_res_string;
    if (!e.m_definition.empty()) {
        s << endl << "definition: " << e.m_definition;
    }
	if (!e.m_err_string.empty()) {
		s << endl <<  "additional info: " << e.m_err_string ;
	}
	return s;
}

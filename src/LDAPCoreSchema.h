/*
 * Copyright 2010, OpenLDAP Foundation, All Rights Reserved.
 * COPYING RESTRICTIONS APPLY, see COPYRIGHT file
 */

#ifndef LDAP_CORE_SCHEMA_H
#define LDAP_CORE_SCHEMA_H

#include <string>

#include "LDAPMatchRuleImpl.h"

#define LDAPSCHEMA_DIRECTORY_STRING_SYNTAX    "1.3.6.1.4.1.1466.115.121.1.15"
#define LDAPSCHEMA_SUBSTRING_ASSERTION_SYNTAX "1.3.6.1.4.1.1466.115.121.1.58"

class LDAPSchemaBuilder;

/**
 * The syntaxes, matching rules and attribute types every directory
 * server knows (RFC 4512, 4517 and 4519)
 */
class LDAPCoreSchema{
    public :
        /**
         * Adds all core definitions to builder
         */
        static void addCoreSchema(LDAPSchemaBuilder& builder);

        /**
         * @return The OID of the default rule of the given kind for a
         *      core syntax, 0 if there is none or the syntax is unknown
         */
        static const char* getDefaultMatchingRule(const std::string& syntaxOid,
                LDAPMatchRuleImpl::Kind kind);

        /**
         * @return The implementation of a core matching rule, 0 if the
         *      OID is not one of them
         */
        static const LDAPMatchRuleImpl* getMatchRuleImpl(
                const std::string& ruleOid);
};

#endif // LDAP_CORE_SCHEMA_H

/*
 * Copyright 2010, OpenLDAP Foundation, All Rights Reserved.
 * COPYING RESTRICTIONS APPLY, see COPYRIGHT file
 */

#ifndef LDAP_SCHEMA_RESOLVER_H
#define LDAP_SCHEMA_RESOLVER_H

#include <string>

class LDAPAttrType;
class LDAPAttrSyntax;
class LDAPMatchRule;

/**
 * The view of the registry that a definition gets while it resolves its
 * references. LDAPSchemaBuilder hands one to every validate() call.
 *
 * Every method throws a LDAPSchemaException naming the referenced
 * definition if it can not be resolved; 0 is never returned.
 */
class LDAPSchemaResolver{
    public :
        virtual ~LDAPSchemaResolver(){}

        /**
         * @return The attribute type with the given name or OID, resolved
         *      before it is returned
         */
        virtual const LDAPAttrType* getAttributeType(
                const std::string& nameOrOid) = 0;

        virtual const LDAPAttrSyntax* getSyntax(
                const std::string& nameOrOid) = 0;

        virtual const LDAPMatchRule* getMatchingRule(
                const std::string& nameOrOid) = 0;
};

#endif // LDAP_SCHEMA_RESOLVER_H

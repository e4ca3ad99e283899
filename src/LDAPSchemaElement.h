/*
 * Copyright 2010, OpenLDAP Foundation, All Rights Reserved.
 * COPYING RESTRICTIONS APPLY, see COPYRIGHT file
 */

#ifndef LDAP_SCHEMA_ELEMENT_H
#define LDAP_SCHEMA_ELEMENT_H

#include <ldap_schema.h>
#include <list>
#include <string>
#include <utility>

#include "StringList.h"

//! Extension properties ("X-...") of a definition in declaration order
typedef std::list< std::pair<std::string, StringList> > LDAPExtraProperties;

/**
 * Common part of every schema definition (syntax, matching rule and
 * attribute type): the description, the extension properties and the
 * helpers for the RFC 4512 string representation.
 */
class LDAPSchemaElement{
    public :
        virtual ~LDAPSchemaElement();

        /**
         * @return The description, an empty string if there is none
         */
        const std::string& getDescription() const;

        /**
         * @return All extension properties in declaration order
         */
        const LDAPExtraProperties& getExtraProperties() const;

        /**
         * @return The values of the extension property with the given
         *      name (case-insensitive), 0 if it is not present
         */
        const StringList* getExtraProperty(const std::string& name) const;

        /**
         * Lower-cases the ASCII letters of a name or OID
         */
        static std::string toLowerCase(const std::string& s);

        static bool equalsIgnoreCase(const std::string& s1,
                const std::string& s2);

    protected :
        LDAPSchemaElement(const std::string& desc,
                const LDAPExtraProperties& extra);

        /**
         * Renders "( " + content + extension properties + " )"
         */
        std::string buildDefinition() const;

        /**
         * Appends the element specific part of the definition, starting
         * with the OID
         */
        virtual void toStringContent(std::string& buffer) const = 0;

        /**
         * Appends " NAME 'n'" or " NAME ( 'n1' 'n2' )"
         */
        static void appendNames(std::string& buffer, const StringList& names);

        /**
         * Copies the extensions returned by the libldap parser
         */
        static LDAPExtraProperties fromExtensions(
                LDAPSchemaExtensionItem** ext);

        static std::string fromCString(const char* s);

        std::string m_desc;
        LDAPExtraProperties m_extraProperties;
};

#endif // LDAP_SCHEMA_ELEMENT_H

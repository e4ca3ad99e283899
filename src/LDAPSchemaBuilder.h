/*
 * Copyright 2010, OpenLDAP Foundation, All Rights Reserved.
 * COPYING RESTRICTIONS APPLY, see COPYRIGHT file
 */

#ifndef LDAP_SCHEMA_BUILDER_H
#define LDAP_SCHEMA_BUILDER_H

#include <iosfwd>
#include <list>
#include <map>
#include <string>

#include "LDAPAttrSyntax.h"
#include "LDAPAttrType.h"
#include "LDAPMatchRule.h"
#include "LDAPSchemaException.h"
#include "LDAPSchemaOptions.h"

class LDAPSchema;

/**
 * Collects unresolved schema definitions and turns them into a
 * LDAPSchema. Definitions may be added in any order, references between
 * them are only looked at by build().
 */
class LDAPSchemaBuilder{
    public :
        /**
         * Constructs an empty builder
         */
        LDAPSchemaBuilder(const LDAPSchemaOptions& options=LDAPSchemaOptions());

        /**
         * Destructor
         */
        virtual ~LDAPSchemaBuilder();

        const LDAPSchemaOptions& getOptions() const;

        /**
         * Add one definition, given as RFC 4512 string or as object.
         * @throws LDAPSchemaException if the definition can not be
         *      parsed or its OID is already used and the options do not
         *      allow to overwrite it
         */
        void addSyntax(const std::string& definition);
        void addSyntax(const LDAPAttrSyntax& syn);
        void addMatchingRule(const std::string& definition,
                const LDAPMatchRuleImpl* impl=0);
        void addMatchingRule(const LDAPMatchRule& mr);
        void addAttributeType(const std::string& definition);
        void addAttributeType(const LDAPAttrType& at);

        /**
         * Adds the core syntaxes, matching rules and attribute types
         */
        void addCoreSchema();

        /**
         * Adds the values of the ldapSyntaxes, matchingRules and
         * attributeTypes attributes of every record in a LDIF stream.
         * Values that can not be parsed are recorded in getWarnings(),
         * the other values are added nevertheless.
         * @return The number of definitions added
         * @throws LDAPSchemaException if the stream is not valid LDIF
         */
        int addSchemaFromLdif(std::istream& input);

        /**
         * @return The definitions that could not be added while reading
         *      LDIF
         */
        const std::list<LDAPSchemaException>& getWarnings() const;

        /**
         * Resolves all definitions and creates a schema from them. The
         * builder is not changed and can be used for further builds.
         *
         * Definitions that fail to resolve are left out and reported in
         * LDAPSchema::getWarnings(), unless the options are strict.
         *
         * @return A new schema, the caller has to delete it
         * @throws LDAPSchemaException the first failure, if the options
         *      are strict and a definition failed
         */
        LDAPSchema* build() const;

    private :
        template <class T>
        void addDefinition(std::map<std::string, T>& defs, const T& def,
                const std::string& oid);

        LDAPSchemaOptions m_options;
        std::map<std::string, LDAPAttrSyntax> m_syntaxes;
        std::map<std::string, LDAPMatchRule> m_matchRules;
        std::map<std::string, LDAPAttrType> m_attrTypes;
        std::list<LDAPSchemaException> m_warnings;
};

#endif // LDAP_SCHEMA_BUILDER_H

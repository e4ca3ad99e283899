/*
 * Copyright 2010, OpenLDAP Foundation, All Rights Reserved.
 * COPYING RESTRICTIONS APPLY, see COPYRIGHT file
 */

#ifndef LDAP_MATCH_RULE_H
#define LDAP_MATCH_RULE_H

#include <string>

#include "LDAPSchemaElement.h"
#include "LDAPSchemaOptions.h"
#include "LDAPMatchRuleImpl.h"
#include "StringList.h"

class LDAPAttrSyntax;
class LDAPSchemaResolver;

/**
 * Represents a Matching Rule (from LDAP schema): the comparison
 * semantics that attribute types use for their values
 */
class LDAPMatchRule : public LDAPSchemaElement{
    public :
        /**
         * Constructs a rule from its fields.
         * @param impl The comparison semantics, 0 selects the built-in
         *      implementation for the OID or the default for the syntax
         * @param definition The definition string to return from
         *      toString(), built from the fields if empty
         * @throws LDAPSchemaException if oid or syntax is empty
         */
        LDAPMatchRule(const std::string& oid, const StringList& names,
                const std::string& desc, bool obsolete,
                const std::string& syntax,
                const LDAPExtraProperties& extra=LDAPExtraProperties(),
                const LDAPMatchRuleImpl* impl=0,
                const std::string& definition=std::string());

        /**
         * Constructs new object and fills the data structure by parsing
         * the argument.
         * @param mr_item description of a matching rule in the form:
         * "( 2.5.13.2 NAME 'caseIgnoreMatch'
         *    SYNTAX 1.3.6.1.4.1.1466.115.121.1.15 )"
         * @throws LDAPSchemaException if it can not be parsed
         */
        LDAPMatchRule(const std::string& mr_item,
                int flags=LDAPSCHEMA_PARSE_FLAG,
                const LDAPMatchRuleImpl* impl=0);

        virtual ~LDAPMatchRule();

        const std::string& getOid() const;
        const StringList& getNames() const;

        /**
         * @return The first name, or the OID if there is no name
         */
        const std::string& getNameOrOid() const;
        bool hasName(const std::string& name) const;
        bool hasNameOrOid(const std::string& value) const;
        bool isObsolete() const;
        const std::string& getSyntaxOid() const;

        /**
         * @return The syntax the rule operates on
         * @throws LDAPSchemaException if the rule is not resolved
         */
        const LDAPAttrSyntax* getSyntax() const;
        bool isResolved() const;

        LDAPMatchRuleImpl::Kind getKind() const;
        const LDAPMatchRuleImpl* getImpl() const;

        std::string normalizeValue(const std::string& value) const;
        int compareValues(const std::string& v1, const std::string& v2) const;
        bool valuesMatch(const std::string& v1, const std::string& v2) const;
        bool substringMatches(const std::string& value,
                const std::string& subInitial, const StringList& subAny,
                const std::string& subFinal) const;

        /**
         * @return The definition string in the form of RFC 4512
         */
        const std::string& toString() const;

        /**
         * Resolves the syntax of the rule.
         * @throws LDAPSchemaException if the syntax is not registered
         */
        void validate(LDAPSchemaResolver& schema);

        bool operator==(const LDAPMatchRule& mr) const;
        bool operator!=(const LDAPMatchRule& mr) const;

    protected :
        void toStringContent(std::string& buffer) const;

    private :
        void init(const std::string& definition);

        std::string m_oid;
        StringList m_names;
        bool m_obsolete;
        std::string m_syntaxOid;
        const LDAPMatchRuleImpl* m_impl;
        std::string m_definition;

        const LDAPAttrSyntax* m_syntax;
        bool m_resolved;
};

#endif // LDAP_MATCH_RULE_H

/*
 * Copyright 2010, OpenLDAP Foundation, All Rights Reserved.
 * COPYING RESTRICTIONS APPLY, see COPYRIGHT file
 */

#ifndef LDAP_ATTR_SYNTAX_H
#define LDAP_ATTR_SYNTAX_H

#include <list>
#include <string>

#include "LDAPSchemaElement.h"
#include "LDAPSchemaException.h"
#include "LDAPSchemaOptions.h"
#include "LDAPMatchRuleImpl.h"

class LDAPMatchRule;
class LDAPSchemaResolver;

/**
 * Represents an Attribute Syntax (from LDAP schema): the format of the
 * values of an attribute and the matching rules used for it by default
 */
class LDAPAttrSyntax : public LDAPSchemaElement{
    public :
        /**
         * Constructs a syntax from its fields. Empty rule OIDs mean that
         * the syntax has no default for that kind of matching.
         * @throws LDAPSchemaException if oid is empty
         */
        LDAPAttrSyntax(const std::string& oid, const std::string& desc,
                const std::string& equalityRule=std::string(),
                const std::string& orderingRule=std::string(),
                const std::string& substringRule=std::string(),
                const std::string& approximateRule=std::string(),
                const LDAPExtraProperties& extra=LDAPExtraProperties(),
                const std::string& definition=std::string());

        /**
         * Constructs new object and fills the data structure by parsing
         * the argument. The default matching rules of well-known syntaxes
         * are taken from the core schema.
         * @param syn_item description of a syntax in the form:
         * "( 1.3.6.1.4.1.1466.115.121.1.15 DESC 'Directory String' )"
         * @throws LDAPSchemaException if it can not be parsed
         */
        LDAPAttrSyntax(const std::string& syn_item,
                int flags=LDAPSCHEMA_PARSE_FLAG);

        virtual ~LDAPAttrSyntax();

        const std::string& getOid() const;

        /**
         * @return The OID of the default rule of the given kind, an empty
         *      string if there is none
         */
        const std::string& getDefaultMatchingRuleOid(
                LDAPMatchRuleImpl::Kind kind) const;

        /**
         * @return The default rule of the given kind, 0 if there is none
         * @throws LDAPSchemaException if the syntax is not resolved
         */
        const LDAPMatchRule* getDefaultMatchingRule(
                LDAPMatchRuleImpl::Kind kind) const;
        const LDAPMatchRule* getEqualityMatchingRule() const;
        const LDAPMatchRule* getOrderingMatchingRule() const;
        const LDAPMatchRule* getSubstringMatchingRule() const;
        const LDAPMatchRule* getApproximateMatchingRule() const;
        bool isResolved() const;

        const std::string& toString() const;

        /**
         * Resolves the default matching rules. A rule that is not
         * registered is dropped and reported in warnings.
         */
        void validate(LDAPSchemaResolver& schema,
                std::list<LDAPSchemaException>& warnings);

        bool operator==(const LDAPAttrSyntax& syn) const;
        bool operator!=(const LDAPAttrSyntax& syn) const;

    protected :
        void toStringContent(std::string& buffer) const;

    private :
        void init(const std::string& definition);

        std::string m_oid;
        std::string m_ruleOids[LDAPMatchRuleImpl::LASTKIND];
        std::string m_definition;

        const LDAPMatchRule* m_rules[LDAPMatchRuleImpl::LASTKIND];
        bool m_resolved;
};

#endif // LDAP_ATTR_SYNTAX_H

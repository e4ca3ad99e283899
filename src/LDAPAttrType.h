/*
 * Copyright 2003, OpenLDAP Foundation, All Rights Reserved.
 * COPYING RESTRICTIONS APPLY, see COPYRIGHT file
 */

#ifndef LDAP_ATTRTYPE_H
#define LDAP_ATTRTYPE_H

#include <ldap_schema.h>
#include <string>

#include "LDAPSchemaElement.h"
#include "LDAPSchemaOptions.h"
#include "LDAPMatchRuleImpl.h"
#include "StringList.h"

//! extension that carries the approximate matching rule
#define LDAPSCHEMA_APPROX_RULE_PROPERTY "X-APPROX-MATCHING-RULE"

//! OID of the objectClass attribute type
#define LDAPSCHEMA_OBJECTCLASS_OID "2.5.4.0"

class LDAPAttrSyntax;
class LDAPMatchRule;
class LDAPSchemaResolver;

/**
 * Represents the Attribute Type (from LDAP schema)
 *
 * An attribute type is created unresolved: it only knows the OIDs or
 * names of its superior type, syntax and matching rules. validate()
 * resolves them against a registry; only then the resolved accessors may
 * be used. Two attribute types are equal if they have the same OID.
 */
class LDAPAttrType : public LDAPSchemaElement{
    public :
        enum Usage {
            USER_APPLICATIONS=LDAP_SCHEMA_USER_APPLICATIONS,
            DIRECTORY_OPERATION=LDAP_SCHEMA_DIRECTORY_OPERATION,
            DISTRIBUTED_OPERATION=LDAP_SCHEMA_DISTRIBUTED_OPERATION,
            DSA_OPERATION=LDAP_SCHEMA_DSA_OPERATION
        };

        /**
         * Constructs an attribute type from its fields. Empty strings
         * denote absent references.
         * @param definition The definition string to return from
         *      toString(), built from the fields if empty
         * @throws LDAPSchemaException if oid is empty, or neither a
         *      superior type nor a syntax is given
         */
        LDAPAttrType(const std::string& oid, const StringList& names,
                const std::string& desc, bool obsolete,
                const std::string& superiorType,
                const std::string& equalityRule,
                const std::string& orderingRule,
                const std::string& substringRule,
                const std::string& approximateRule,
                const std::string& syntax, bool singleValue,
                bool collective, bool noUserModification, Usage usage,
                const LDAPExtraProperties& extra=LDAPExtraProperties(),
                const std::string& definition=std::string());

        /**
	 * Constructs new object and fills the data structure by parsing the
	 * argument. The string is kept as the definition of the object.
	 * @param at_item description of attribute type is string returned
	 *  by the search command. It is in the form:
	 * "( SuSE.YaST.Attr:19 NAME ( 'skelDir' ) DESC ''
	 *    EQUALITY caseExactIA5Match SYNTAX 1.3.6.1.4.1.1466.115.121.1.26 )"
	 * @throws LDAPSchemaException if it can not be parsed
         */
        LDAPAttrType(const std::string& at_item,
                int flags=LDAPSCHEMA_PARSE_FLAG);

        /**
         * Destructor
         */
        virtual ~LDAPAttrType();

	/**
	 * Returns attribute oid
	 */
	const std::string& getOid() const;

	/**
	 * Returns all attribute names
	 */
	const StringList& getNames() const;

	/**
	 * Returns the first name, or the OID if there are no names
	 */
	const std::string& getNameOrOid() const;

	/**
	 * Returns true if one of the names matches (case-insensitive)
	 */
	bool hasName(const std::string& name) const;

	/**
	 * Returns true if one of the names or the OID matches
	 */
	bool hasNameOrOid(const std::string& value) const;

	bool isObsolete() const;

	/**
	 * Returns true if attribute type allows only single value
	 */
	bool isSingle() const;
	bool isCollective() const;
	bool isNoUserModification() const;

	/**
	 * Returns true if this is the objectClass attribute type (2.5.4.0)
	 */
	bool isObjectClass() const;

	/**
	 * Returns true for all usages except userApplications
	 */
	bool isOperational() const;

	Usage getUsage() const;

	/**
	 * Declared references, empty if not declared
	 */
	const std::string& getSuperiorTypeOid() const;
	const std::string& getSyntaxOid() const;
	const std::string& getMatchingRuleOid(LDAPMatchRuleImpl::Kind kind) const;
	const std::string& getEqualityMatchingRuleOid() const;
	const std::string& getOrderingMatchingRuleOid() const;
	const std::string& getSubstringMatchingRuleOid() const;
	const std::string& getApproximateMatchingRuleOid() const;

	/**
	 * Resolved references. They throw a LDAPSchemaException if the
	 * attribute type is not resolved. Rules and superior type are 0 if
	 * there is none.
	 */
	const LDAPAttrType* getSuperiorType() const;
	const LDAPAttrSyntax* getSyntax() const;
	const LDAPMatchRule* getMatchingRule(LDAPMatchRuleImpl::Kind kind) const;
	const LDAPMatchRule* getEqualityMatchingRule() const;
	const LDAPMatchRule* getOrderingMatchingRule() const;
	const LDAPMatchRule* getSubstringMatchingRule() const;
	const LDAPMatchRule* getApproximateMatchingRule() const;
	bool isResolved() const;

	/**
	 * Returns true if type is this attribute type or one of its
	 * (transitive) superior types
	 */
	bool isSubTypeOf(const LDAPAttrType& type) const;

	/**
	 * Compares by the sort-order of schema listings: objectClass
	 * first, then user attributes before operational ones, then the
	 * lower-cased name or OID.
	 * @return A negative integer, zero, or a positive integer
	 */
	int compareTo(const LDAPAttrType& type) const;

	/**
	 * Returns the definition given at construction, or the one built
	 * from the fields
	 */
	const std::string& toString() const;

	/**
	 * Returns the definition built from the fields, in the form
	 * "( OID NAME ... DESC ... SUP ... USAGE ... )"
	 */
	std::string canonicalDefinition() const;

	size_t hashCode() const;

	/**
	 * Resolves the superior type, syntax and matching rules. Nothing is
	 * changed if an exception is thrown.
	 * @throws LDAPSchemaException if a reference can not be resolved or
	 *      the result violates the constraints of RFC 4512
	 */
	void validate(LDAPSchemaResolver& schema);

	bool operator==(const LDAPAttrType& at) const;
	bool operator!=(const LDAPAttrType& at) const;
	bool operator<(const LDAPAttrType& at) const;

	static const char* usageToString(Usage usage);

    protected :
	void toStringContent(std::string& buffer) const;

    private :
	void init(const std::string& definition);
	void checkResolved() const;
	const LDAPMatchRule* lookupRule(LDAPSchemaResolver& schema,
		const std::string& oid) const;

	StringList m_names;
	std::string m_oid;
	bool m_obsolete;
	std::string m_supOid;
	std::string m_ruleOids[LDAPMatchRuleImpl::LASTKIND];
	std::string m_syntaxOid;
	bool m_single;
	bool m_collective;
	bool m_noUserMod;
	Usage m_usage;
	std::string m_definition;
	bool m_isObjectClass;
	std::string m_normalizedName;

	const LDAPAttrType* m_superior;
	const LDAPAttrSyntax* m_syntax;
	const LDAPMatchRule* m_rules[LDAPMatchRuleImpl::LASTKIND];
	bool m_resolved;
};

#endif // LDAP_ATTRTYPE_H

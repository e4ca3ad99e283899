/*
 * Copyright 2003, OpenLDAP Foundation, All Rights Reserved.
 * COPYING RESTRICTIONS APPLY, see COPYRIGHT file
 */

#ifndef LDAP_SCHEMA_H
#define LDAP_SCHEMA_H

#include <list>
#include <map>
#include <string>

#include "LDAPAttrSyntax.h"
#include "LDAPAttrType.h"
#include "LDAPMatchRule.h"
#include "LDAPSchemaException.h"

/**
 * Represents the LDAP schema
 *
 * Objects are created by LDAPSchemaBuilder::build() and contain only
 * resolved definitions. After that nothing changes anymore, so a schema
 * may be read from many threads at the same time.
 */
class LDAPSchema{
    private :
	typedef std::map<std::string, LDAPAttrSyntax> SyntaxMap;
	typedef std::map<std::string, LDAPMatchRule> MatchRuleMap;
	typedef std::map<std::string, LDAPAttrType> AttrTypeMap;

	/**
	 * index of lower-cased names and OIDs, value is the OID
	 */
	typedef std::map<std::string, std::string> NameIndex;

	SyntaxMap m_syntaxes;
	NameIndex m_syntaxNames;

	MatchRuleMap m_matchRules;
	NameIndex m_matchRuleNames;

	/**
	 * map of attribute types: index is OID, value is LDAPAttrType object
	 */
	AttrTypeMap m_attrTypes;
	NameIndex m_attrTypeNames;

	std::list<LDAPSchemaException> m_warnings;

        LDAPSchema();
	LDAPSchema(const LDAPSchema&);
	LDAPSchema& operator=(const LDAPSchema&);

	void addSyntax(const LDAPAttrSyntax& syn);
	void addMatchingRule(const LDAPMatchRule& mr);
	void addAttributeType(const LDAPAttrType& at);
	void addName(NameIndex& index, const std::string& name,
		const std::string& oid);
	static void indexName(NameIndex& index, const std::string& name,
		const std::string& oid);
	void reindexMatchingRules();
	void reindexAttributeTypes();
	static const std::string* findOid(const NameIndex& index,
		const std::string& nameOrOid);

	friend class LDAPSchemaBuilder;
	friend class LDAPSchemaResolution;

    public :
	typedef std::list<const LDAPAttrType*> AttrTypeList;
	typedef std::list<const LDAPMatchRule*> MatchRuleList;
	typedef std::list<const LDAPAttrSyntax*> SyntaxList;

        /**
         * Destructor
         */
        virtual ~LDAPSchema();

	/**
	 * Returns attribute type object with given name or OID, 0 if
	 * there is none
	 */
	const LDAPAttrType* getAttributeType(const std::string& nameOrOid) const;
	bool hasAttributeType(const std::string& nameOrOid) const;

	const LDAPMatchRule* getMatchingRule(const std::string& nameOrOid) const;
	bool hasMatchingRule(const std::string& nameOrOid) const;

	const LDAPAttrSyntax* getSyntax(const std::string& nameOrOid) const;
	bool hasSyntax(const std::string& nameOrOid) const;

	/**
	 * Returns all attribute types, objectClass first, then the user
	 * attributes and then the operational ones, each sorted by name
	 */
	AttrTypeList getAttributeTypes() const;

	/**
	 * Returns all matching rules sorted by OID
	 */
	MatchRuleList getMatchingRules() const;

	/**
	 * Returns all syntaxes sorted by OID
	 */
	SyntaxList getSyntaxes() const;

	/**
	 * Returns the problems found while the schema was loaded and
	 * built. Definitions reported here are not part of the schema,
	 * except for syntaxes with an unknown default matching rule.
	 */
	const std::list<LDAPSchemaException>& getWarnings() const;
};

#endif // LDAP_SCHEMA_H
